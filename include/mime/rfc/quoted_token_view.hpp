//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_RFC_QUOTED_TOKEN_VIEW_HPP
#define MIME_RFC_QUOTED_TOKEN_VIEW_HPP

#include <mime/detail/config.hpp>
#include <boost/url/grammar/string_view_base.hpp>
#include <cstddef>

namespace mime {

namespace implementation_defined {
struct quoted_token_rule_t;
} // implementation_defined

/** A token or quoted-string, as it appeared in the input

    The viewed characters are the literal text,
    including the surrounding double quotes and
    any backslash escapes when the value is a
    quoted-string.
*/
class quoted_token_view final
    : public grammar::string_view_base
{
    std::size_t n_ = 0;
    bool quoted_ = false;

    friend struct implementation_defined::quoted_token_rule_t;

    quoted_token_view(
        core::string_view s,
        std::size_t n,
        bool quoted) noexcept
        : string_view_base(s)
        , n_(n)
        , quoted_(quoted)
    {
    }

public:
    //--------------------------------------------
    //
    // Special Members
    //
    //--------------------------------------------

    /** Constructor

        Default-constructed objects are empty.
    */
    quoted_token_view() = default;

    /** Constructor
    */
    quoted_token_view(
        quoted_token_view const&) noexcept = default;

    /** Assignment
    */
    quoted_token_view& operator=(
        quoted_token_view const&) noexcept = default;

    //--------------------------------------------

    /** Return true if the value is a quoted-string
    */
    bool
    is_quoted() const noexcept
    {
        return quoted_;
    }

    /** Return the number of characters after removing quotes and escapes
    */
    std::size_t
    unescaped_size() const noexcept
    {
        return n_;
    }
};

} // mime

#endif
