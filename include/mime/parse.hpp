//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_PARSE_HPP
#define MIME_PARSE_HPP

#include <mime/detail/config.hpp>
#include <mime/error.hpp>
#include <mime/media_type.hpp>
#include <mime/parser_config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <vector>

namespace mime {

/** Parse a single media type

    The entire string must hold exactly one
    media type. Leading and trailing whitespace,
    including obsolete line folding, is allowed,
    as is a trailing semicolon. A comma is never
    allowed; use @ref parse_media_type_list for
    list-valued headers.

    This function never throws on malformed input.

    @par Example
    @code
    auto rv = try_parse_media_type( "text/plain; charset=utf-8" );
    if( rv )
        assert( rv->charset() == core::string_view( "utf-8" ) );
    @endcode

    @return The media type, or an error whose
    condition is @ref condition::format_error or
    @ref condition::limit_exceeded.

    @param s The header value.

    @param cfg The limits to apply.
*/
MIME_DECL
system::result<media_type>
try_parse_media_type(
    core::string_view s,
    parser_config const& cfg = {});

/** Parse a single media type

    This is the same as @ref try_parse_media_type,
    except that failure is reported by throwing.

    @par Example
    @code
    media_type mt = parse_media_type( "\r\n text/plain  " );
    @endcode

    @throws system::system_error The string is not
    exactly one valid media type.
*/
MIME_DECL
media_type
parse_media_type(
    core::string_view s,
    parser_config const& cfg = {});

//------------------------------------------------

namespace detail {

// Parse every element of one comma-separated
// string and append them to v
MIME_DECL
system::error_code
append_media_types(
    std::vector<media_type>& v,
    core::string_view s,
    parser_config const& cfg);

template<class T, class = void>
struct is_string_range : std::false_type
{
};

template<class T>
struct is_string_range<T, typename std::enable_if<
    std::is_convertible<decltype(*std::begin(
        std::declval<T const&>())),
            core::string_view>::value>::type>
    : std::true_type
{
};

template<class StringRange>
system::result<std::vector<media_type>>
parse_list_impl(
    StringRange const& r,
    parser_config const& cfg)
{
    std::vector<media_type> v;
    for(auto const& s : r)
    {
        auto ec = append_media_types(v, s, cfg);
        if(ec.failed())
            return ec;
    }
    return v;
}

} // detail

/** Parse a list of media types

    Each string in the range is split at commas
    which are outside of quoted-strings, and
    every element is parsed as by
    @ref try_parse_media_type. Empty elements are
    skipped. The result holds the elements in the
    order they appear.

    If any element is invalid the whole list is
    rejected; there is no partial result. A list
    with no elements at all is also reported
    as @ref error::empty_list.

    This function never throws on malformed input.

    @par Example
    @code
    std::vector< std::string > accept = {
        "text/html,application/xhtml+xml,",
        "application/xml;q=0.9,*/*;q=0.8" };
    auto rv = try_parse_media_type_list( accept );
    // rv->size() == 4
    @endcode

    @param r A range of strings, each convertible
    to `core::string_view`.

    @param cfg The limits to apply.
*/
template<
    class StringRange,
    class = typename std::enable_if<
        detail::is_string_range<StringRange>::value>::type>
system::result<std::vector<media_type>>
try_parse_media_type_list(
    StringRange const& r,
    parser_config const& cfg = {})
{
    auto rv = detail::parse_list_impl(r, cfg);
    if( rv &&
        rv->empty())
        return MIME_ERR(error::empty_list);
    return rv;
}

/** Parse a list of media types

    This is the same as @ref try_parse_media_type_list,
    except that failure is reported by throwing, and
    a list with no elements returns an empty vector.

    @throws system::system_error An element is invalid.
*/
template<
    class StringRange,
    class = typename std::enable_if<
        detail::is_string_range<StringRange>::value>::type>
std::vector<media_type>
parse_media_type_list(
    StringRange const& r,
    parser_config const& cfg = {})
{
    return detail::parse_list_impl(r, cfg).value();
}

/** Parse a list of media types

    @copydetails try_parse_media_type_list
*/
inline
system::result<std::vector<media_type>>
try_parse_media_type_list(
    std::initializer_list<core::string_view> init,
    parser_config const& cfg = {})
{
    return try_parse_media_type_list<
        std::initializer_list<core::string_view>>(init, cfg);
}

/** Parse a list of media types

    @copydetails parse_media_type_list
*/
inline
std::vector<media_type>
parse_media_type_list(
    std::initializer_list<core::string_view> init,
    parser_config const& cfg = {})
{
    return parse_media_type_list<
        std::initializer_list<core::string_view>>(init, cfg);
}

/** Parse a list of media types from one string
*/
inline
system::result<std::vector<media_type>>
try_parse_media_type_list(
    core::string_view s,
    parser_config const& cfg = {})
{
    core::string_view const a[] = { s };
    return try_parse_media_type_list(a, cfg);
}

/** Parse a list of media types from one string
*/
inline
std::vector<media_type>
parse_media_type_list(
    core::string_view s,
    parser_config const& cfg = {})
{
    core::string_view const a[] = { s };
    return parse_media_type_list(a, cfg);
}

} // mime

#endif
