//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/error.hpp>

namespace mime {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "mime";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::success: return "success";
    case error::empty_value: return "empty value";
    case error::bad_type: return "bad type";
    case error::bad_parameter: return "bad parameter";
    case error::bad_quoted_string: return "bad quoted-string";
    case error::trailing_characters: return "trailing characters";
    case error::bad_quality: return "bad quality";
    case error::empty_list: return "empty list";
    case error::too_large: return "too large";
    case error::too_many_params: return "too many parameters";
    case error::too_many_elements: return "too many elements";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "mime";
}

std::string
condition_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(ev))
    {
    case condition::format_error: return "format error";
    case condition::limit_exceeded: return "limit exceeded";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int ev) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    switch(static_cast<condition>(ev))
    {
    case condition::format_error:
        switch(static_cast<error>(ec.value()))
        {
        case error::empty_value:
        case error::bad_type:
        case error::bad_parameter:
        case error::bad_quoted_string:
        case error::trailing_characters:
        case error::bad_quality:
        case error::empty_list:
            return true;
        default:
            return false;
        }

    case condition::limit_exceeded:
        switch(static_cast<error>(ec.value()))
        {
        case error::too_large:
        case error::too_many_params:
        case error::too_many_elements:
            return true;
        default:
            return false;
        }

    default:
        return false;
    }
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail
} // mime
