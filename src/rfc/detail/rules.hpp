//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_SRC_RFC_DETAIL_RULES_HPP
#define MIME_SRC_RFC_DETAIL_RULES_HPP

#include <mime/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>

namespace mime {
namespace detail {

// qdtext = HTAB / SP / %x21 / %x23-5B / %x5D-7E / obs-text
struct qdtext_t
{
    constexpr
    bool
    operator()(char c) const noexcept
    {
        return
            c == '\t' ||
            c == ' ' ||
            c == '!' ||
            (c >= '#' && c <= '[') ||
            (c >= ']' && c <= '~') ||
            static_cast<unsigned char>(c) > 0x7f;
    }
};

constexpr qdtext_t qdtext{};

// the character following a backslash
// in a quoted-pair
struct qpchar_t
{
    constexpr
    bool
    operator()(char c) const noexcept
    {
        return
            c == '\t' ||
            (c >= ' ' && c <= '~') ||
            static_cast<unsigned char>(c) > 0x7f;
    }
};

constexpr qpchar_t qpchar{};

//------------------------------------------------

/*  Matches one element of a comma-separated list.

    The value is every character up to, but not
    including, the next comma which is outside
    of a quoted-string, or the end of input. An
    unterminated quoted-string extends to the end.
    This rule never fails, and the value may be
    empty.

    list-element = *( quoted-string / <any CHAR except ","> )
*/
struct list_element_rule_t
{
    using value_type = core::string_view;

    MIME_DECL
    system::result<value_type>
    parse(
        char const*& it,
        char const* end) const noexcept;
};

constexpr list_element_rule_t list_element_rule{};

} // detail
} // mime

#endif
