//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_RFC_PARAMETER_RULE_HPP
#define MIME_RFC_PARAMETER_RULE_HPP

#include <mime/detail/config.hpp>
#include <mime/rfc/quoted_token_view.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <boost/url/grammar/range_rule.hpp>

namespace mime {

/** An HTTP header parameter, as it appeared in the input

    @par BNF
    @code
    parameter   = token [ OWS "=" OWS [ token / quoted-string ] ]
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7231#section-3.1.1.1"
        >3.1.1.1.  Media Type (rfc7231)</a>
*/
struct parameter_view
{
    /** The name
    */
    core::string_view name;

    /** The value, empty if there is none
    */
    quoted_token_view value;

    /** true if an equals sign followed the name
    */
    bool has_value = false;
};

//------------------------------------------------

namespace implementation_defined {
struct parameter_rule_t
{
    using value_type = parameter_view;

    MIME_DECL
    auto
    parse(
        char const*&,
        char const*) const noexcept ->
            system::result<value_type>;
};

struct parameters_rule_t
{
    using value_type = grammar::range<parameter_view>;

    MIME_DECL
    auto
    parse(
        char const*&,
        char const*) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching parameter

    The name may stand alone, and the value
    after the equals sign may be empty.

    @par Value Type
    @code
    using value_type = parameter_view;
    @endcode

    @par Example
    @code
    auto rv = grammar::parse( "charset = utf-8", parameter_rule );
    @endcode

    @par BNF
    @code
    parameter   = token [ OWS "=" OWS [ token / quoted-string ] ]
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7231#section-3.1.1.1"
        >3.1.1.1.  Media Type (rfc7231)</a>

    @see
        @ref parameter_view.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::parameter_rule_t parameter_rule{};

//------------------------------------------------

/** Rule matching parameters

    Matching stops before the first semicolon
    which is not followed by a valid parameter.
    This rule never fails.

    @par Value Type
    @code
    using value_type = grammar::range< parameter_view >;
    @endcode

    @par BNF
    @code
    parameters  = *( ";" OWS parameter OWS )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7231#section-3.1.1.1"
        >3.1.1.1.  Media Type (rfc7231)</a>

    @see
        @ref parameter_view,
        @ref parameter_rule.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::parameters_rule_t parameters_rule{};

} // mime

#endif
