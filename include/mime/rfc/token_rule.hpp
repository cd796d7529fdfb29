//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_RFC_TOKEN_RULE_HPP
#define MIME_RFC_TOKEN_RULE_HPP

#include <mime/detail/config.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/grammar/token_rule.hpp>

namespace mime {

namespace implementation_defined {
struct tchars_t : grammar::lut_chars
{
    constexpr
    tchars_t() noexcept
        : grammar::lut_chars(
            "!#$%&'*+-.^_`|~"
            "0123456789"
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
            "abcdefghijklmnopqrstuvwxyz")
    {
    }
};
} // implementation_defined

/** The set of token characters

    @par BNF
    @code
    tchar       = "!" / "#" / "$" / "%" / "&" / "'" / "*"
                / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
                / DIGIT / ALPHA
                ; any VCHAR, except delimiters
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7230#section-3.2.6"
        >3.2.6.  Field Value Components (rfc7230)</a>
*/
BOOST_INLINE_CONSTEXPR implementation_defined::tchars_t tchars{};

/** Rule matching a token

    The value is the matched characters.
    At least one character is required.

    @par Value Type
    @code
    using value_type = core::string_view;
    @endcode

    @par Example
    @code
    auto rv = grammar::parse( "text", token_rule );
    @endcode

    @par BNF
    @code
    token       = 1*tchar
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7230#section-3.2.6"
        >3.2.6.  Field Value Components (rfc7230)</a>

    @see
        @ref tchars.
*/
BOOST_INLINE_CONSTEXPR auto token_rule = grammar::token_rule(tchars);

} // mime

#endif
