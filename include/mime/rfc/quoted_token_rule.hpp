//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_RFC_QUOTED_TOKEN_RULE_HPP
#define MIME_RFC_QUOTED_TOKEN_RULE_HPP

#include <mime/detail/config.hpp>
#include <mime/rfc/quoted_token_view.hpp>
#include <boost/system/result.hpp>

namespace mime {

namespace implementation_defined {
struct quoted_token_rule_t
{
    using value_type = quoted_token_view;

    MIME_DECL
    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching a token or quoted-string

    A quoted-string which is not terminated, or
    which contains a character not allowed by the
    grammar, fails with @ref error::bad_quoted_string.
    Octets above 0x7F are allowed only inside quotes.

    @par Value Type
    @code
    using value_type = quoted_token_view;
    @endcode

    @par Example
    @code
    auto rv = grammar::parse( "\"utf-8\"", quoted_token_rule );
    // rv->is_quoted() == true
    @endcode

    @par BNF
    @code
    value           = token / quoted-string

    quoted-string   = DQUOTE *( qdtext / quoted-pair ) DQUOTE
    qdtext          = HTAB / SP / %x21 / %x23-5B / %x5D-7E / obs-text
    quoted-pair     = "\" ( HTAB / SP / VCHAR / obs-text )
    obs-text        = %x80-FF
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7230#section-3.2.6"
        >3.2.6.  Field Value Components (rfc7230)</a>

    @see
        @ref quoted_token_view,
        @ref token_rule.
*/
BOOST_INLINE_CONSTEXPR implementation_defined::quoted_token_rule_t quoted_token_rule{};

} // mime

#endif
