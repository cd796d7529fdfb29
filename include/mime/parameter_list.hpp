//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_PARAMETER_LIST_HPP
#define MIME_PARAMETER_LIST_HPP

#include <mime/detail/config.hpp>
#include <mime/parameter.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <vector>

namespace mime {

/** An ordered list of media type parameters

    Parameters are kept in insertion order, which
    is the order used for serialization. Names are
    not required to be unique; lookups by name
    return the first parameter whose name matches
    case-insensitively.

    Once the list is made read-only, it and every
    parameter it contains can no longer be
    modified, and any attempt throws
    `std::logic_error`.

    @see
        @ref parameter,
        @ref media_type.
*/
class parameter_list
{
    std::vector<parameter> v_;
    bool read_only_ = false;

public:
    using value_type = parameter;
    using reference = parameter&;
    using const_reference = parameter const&;
    using size_type = std::size_t;
    using iterator = std::vector<parameter>::iterator;
    using const_iterator = std::vector<parameter>::const_iterator;

    /** Constructor

        Default-constructed lists are empty
        and modifiable.
    */
    parameter_list() = default;

    /** Constructor

        The new list and its parameters have
        the same read-only state as `other`.
    */
    parameter_list(parameter_list const& other) = default;

    /** Constructor

        A read-only `other` is copied
        and left unchanged.
    */
    MIME_DECL
    parameter_list(parameter_list&& other);

    /** Assignment

        The read-only state of this list does
        not change, and the assigned parameters
        are modifiable.

        @throws std::logic_error The list is read-only.
    */
    MIME_DECL
    parameter_list&
    operator=(parameter_list const& other);

    /** Assignment

        A read-only `other` is copied
        and left unchanged.

        @throws std::logic_error The list is read-only.
    */
    MIME_DECL
    parameter_list&
    operator=(parameter_list&& other);

    /** Return an iterator to the beginning

        Parameters reached through the iterator
        throw when modified if the list is read-only.
    */
    iterator
    begin() noexcept
    {
        return v_.begin();
    }

    /** Return an iterator to the end
    */
    iterator
    end() noexcept
    {
        return v_.end();
    }

    /// @copydoc begin
    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    /// @copydoc end
    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    /** Return the number of parameters
    */
    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    /** Return true if there are no parameters
    */
    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    /** Return true if the list is read-only
    */
    bool
    is_read_only() const noexcept
    {
        return read_only_;
    }

    /** Make the list and its parameters read-only

        Calling this more than once has no effect.
    */
    MIME_DECL
    void
    make_read_only() noexcept;

    /** Return the first parameter with a matching name

        @return An iterator to the parameter, or
        `end()` if there is none.
    */
    MIME_DECL
    iterator
    find(core::string_view name) noexcept;

    /// @copydoc find
    MIME_DECL
    const_iterator
    find(core::string_view name) const noexcept;

    /** Append a parameter

        @return A reference to the appended parameter.

        @throws std::logic_error The list is read-only.
    */
    MIME_DECL
    parameter&
    add(parameter p);

    /** Remove the first parameter with the same name

        Only the name of `p` is compared, case-insensitively.
        Nothing happens if there is no such parameter.

        @return true if a parameter was removed.

        @throws std::logic_error The list is read-only.
    */
    MIME_DECL
    bool
    remove(parameter const& p);

    /** Remove the first parameter with a matching name

        @return true if a parameter was removed.

        @throws std::logic_error The list is read-only.
    */
    MIME_DECL
    bool
    remove(core::string_view name);

    /** Remove all parameters

        @throws std::logic_error The list is read-only.
    */
    MIME_DECL
    void
    clear();
};

/** Return true if two lists hold the same parameters

    Lists compare as sets: the order of the
    parameters does not matter, while duplicates
    must appear the same number of times.
*/
MIME_DECL
bool
operator==(
    parameter_list const& l0,
    parameter_list const& l1);

/** Return true if two lists do not hold the same parameters
*/
inline
bool
operator!=(
    parameter_list const& l0,
    parameter_list const& l1)
{
    return !(l0 == l1);
}

/** Return a hash of the list

    The hash does not depend on the order
    of the parameters.
*/
MIME_DECL
std::size_t
hash_value(
    parameter_list const& l) noexcept;

} // mime

#endif
