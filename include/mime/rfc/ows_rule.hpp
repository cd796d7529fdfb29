//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_RFC_OWS_RULE_HPP
#define MIME_RFC_OWS_RULE_HPP

#include <mime/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>

namespace mime {

namespace implementation_defined {
struct ows_rule_t
{
    using value_type = core::string_view;

    MIME_DECL
    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching optional whitespace

    This rule never fails. The value is the
    whitespace which was consumed, which may
    be empty. A CRLF is consumed only when it
    is followed by SP or HTAB.

    @par Value Type
    @code
    using value_type = core::string_view;
    @endcode

    @par BNF
    @code
    OWS         = *( SP / HTAB / obs-fold )
    obs-fold    = CRLF 1*( SP / HTAB )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7230#section-3.2.3"
        >3.2.3.  Whitespace (rfc7230)</a>
    @li <a href="https://www.rfc-editor.org/rfc/rfc7230#section-3.2.4"
        >3.2.4.  Field Parsing (rfc7230)</a>
*/
BOOST_INLINE_CONSTEXPR implementation_defined::ows_rule_t ows_rule{};

} // mime

#endif
