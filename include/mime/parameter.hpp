//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_PARAMETER_HPP
#define MIME_PARAMETER_HPP

#include <mime/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace mime {

class parameter_list;

/** A media type parameter

    A parameter is a name, optionally followed
    by a value. The name is a token and compares
    case-insensitively. The value is either a
    token or a quoted-string, stored with its
    quotes and escapes, or empty.

    A parameter becomes read-only when the
    @ref parameter_list which owns it does.

    @par BNF
    @code
    parameter   = token [ "=" [ token / quoted-string ] ]
    @endcode

    @see
        @ref parameter_list.
*/
class parameter
{
    std::string name_;
    std::string value_;
    bool has_value_ = false;
    bool read_only_ = false;

    friend class parameter_list;

public:
    /** Constructor

        Constructs a parameter without a value.

        @par Example
        @code
        parameter p( "custom" );
        assert( p.to_string() == "custom" );
        @endcode

        @throws std::invalid_argument `name` is empty.
        @throws system::system_error `name` is not a token.
    */
    MIME_DECL
    explicit
    parameter(core::string_view name);

    /** Constructor

        @par Example
        @code
        parameter p( "custom", "\"custom value\"" );
        @endcode

        @throws std::invalid_argument `name` is empty.
        @throws system::system_error `name` is not a token,
        or `value` is not empty, a token, or a quoted-string.
    */
    MIME_DECL
    parameter(
        core::string_view name,
        core::string_view value);

    /** Constructor

        The new parameter has the same
        read-only state as `other`.
    */
    parameter(parameter const& other) = default;

    /** Constructor

        A read-only `other` is copied
        and left unchanged.
    */
    MIME_DECL
    parameter(parameter&& other);

    /** Assignment

        The read-only state of this
        parameter does not change.

        @throws std::logic_error This parameter is read-only.
    */
    MIME_DECL
    parameter&
    operator=(parameter const& other);

    /** Assignment

        A read-only `other` is copied
        and left unchanged.

        @throws std::logic_error This parameter is read-only.
    */
    MIME_DECL
    parameter&
    operator=(parameter&& other);

    /** Return the name
    */
    core::string_view
    name() const noexcept
    {
        return name_;
    }

    /** Return true if the parameter has a value
    */
    bool
    has_value() const noexcept
    {
        return has_value_;
    }

    /** Return the value

        Quoted values are returned with their
        quotes. When there is no value, the
        returned string is empty.
    */
    core::string_view
    value() const noexcept
    {
        return value_;
    }

    /** Set the value

        @throws std::logic_error The parameter is read-only.
        @throws system::system_error `value` is not empty,
        a token, or a quoted-string.
    */
    MIME_DECL
    void
    set_value(core::string_view value);

    /** Remove the value

        @throws std::logic_error The parameter is read-only.
    */
    MIME_DECL
    void
    remove_value();

    /** Return true if the parameter is read-only
    */
    bool
    is_read_only() const noexcept
    {
        return read_only_;
    }

    /** Return the serialized parameter

        @par Example
        @code
        assert( parameter( "a", "b" ).to_string() == "a=b" );
        @endcode
    */
    MIME_DECL
    std::string
    to_string() const;
};

/** Return true if two parameters are equal

    Names and values compare case-insensitively.
    A missing value equals an empty value.
*/
MIME_DECL
bool
operator==(
    parameter const& p0,
    parameter const& p1) noexcept;

/** Return true if two parameters are not equal
*/
inline
bool
operator!=(
    parameter const& p0,
    parameter const& p1) noexcept
{
    return !(p0 == p1);
}

/** Return a hash of the parameter

    Equal parameters have equal hashes.
*/
MIME_DECL
std::size_t
hash_value(
    parameter const& p) noexcept;

/** Format the parameter to an output stream
*/
MIME_DECL
std::ostream&
operator<<(
    std::ostream& os,
    parameter const& p);

} // mime

#endif
