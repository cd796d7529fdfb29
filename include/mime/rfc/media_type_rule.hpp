//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_RFC_MEDIA_TYPE_RULE_HPP
#define MIME_RFC_MEDIA_TYPE_RULE_HPP

#include <mime/detail/config.hpp>
#include <mime/rfc/parameter_rule.hpp>
#include <boost/url/grammar/range_rule.hpp>

namespace mime {

/** A media-type, as it appeared in the input
*/
struct media_type_view
{
    /** The type
    */
    core::string_view type;

    /** The subtype
    */
    core::string_view subtype;

    /** Parameters
    */
    grammar::range<
        parameter_view> params;
};

//------------------------------------------------

namespace implementation_defined {
struct media_type_rule_t
{
    using value_type = media_type_view;

    MIME_DECL
    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching media-type

    Whitespace is allowed around the slash and
    the parameter delimiters, and trailing
    whitespace is consumed. A single semicolon
    may follow the last parameter. Matching
    stops before a comma, which belongs to the
    enclosing list; any other character left
    over after a semicolon fails with
    @ref error::bad_quoted_string when it holds
    a malformed quoted-string value, or with
    @ref error::bad_parameter otherwise.

    @par BNF
    @code
    media-type  = type OWS "/" OWS subtype OWS parameters [ ";" OWS ]
    parameters  = *( ";" OWS parameter OWS )
    parameter   = token [ OWS "=" OWS [ token / quoted-string ] ]
    subtype     = token
    type        = token
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7231#section-3.1.1.1"
        >3.1.1.1.  Media Type (rfc7231)</a>

    @see
        @ref media_type_view,
        @ref parameters_rule.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::media_type_rule_t media_type_rule{};

} // mime

#endif
