//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_MEDIA_TYPE_HPP
#define MIME_MEDIA_TYPE_HPP

#include <mime/detail/config.hpp>
#include <mime/parameter.hpp>
#include <mime/parameter_list.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

namespace mime {

struct media_type_view;

namespace detail {
class media_type_builder;
} // detail

/** A media type header value

    This holds the value of a Content-Type or
    a single element of an Accept header: a type,
    a subtype, and an ordered list of parameters.
    The type and subtype are tokens which compare
    case-insensitively, and either may be the
    wildcard "*".

    A value made with @ref copy_as_read_only
    cannot be modified; every modifying function
    throws `std::logic_error`, and the same holds
    for its parameters.

    @par Example
    @code
    media_type mt( "text/plain" );
    mt.set_charset( "utf-8" );
    mt.set_quality( 0.8 );
    assert( mt.to_string() == "text/plain; charset=utf-8; q=0.8" );
    @endcode

    @par BNF
    @code
    media-type  = type "/" subtype *( OWS ";" OWS parameter )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7231#section-3.1.1.1"
        >3.1.1.1.  Media Type (rfc7231)</a>
    @li <a href="https://www.rfc-editor.org/rfc/rfc7231#section-5.3.2"
        >5.3.2.  Accept (rfc7231)</a>

    @see
        @ref parse_media_type,
        @ref parse_media_type_list.
*/
class media_type
{
    std::string type_;
    std::string subtype_;
    parameter_list params_;
    bool read_only_ = false;

    friend class detail::media_type_builder;

    media_type() = default;

public:
    /** Constructor

        The string must be exactly a type, a
        slash, and a subtype, with no whitespace
        and no parameters.

        @par Example
        @code
        media_type mt( "application/json" );
        @endcode

        @throws std::invalid_argument `mt` is empty.
        @throws system::system_error `mt` is not
        of the form `type "/" subtype`.
    */
    MIME_DECL
    explicit
    media_type(core::string_view mt);

    /** Constructor

        Constructs the media type and sets
        the quality parameter.

        @par Example
        @code
        media_type mt( "application/xml", 0.9 );
        assert( mt.to_string() == "application/xml; q=0.9" );
        @endcode

        @throws std::invalid_argument `mt` is empty.
        @throws std::out_of_range `quality` is not within [0, 1].
        @throws system::system_error `mt` is not
        of the form `type "/" subtype`.
    */
    MIME_DECL
    media_type(
        core::string_view mt,
        double quality);

    /** Constructor

        The new value is a deep copy and has
        the same read-only state as `other`.
    */
    media_type(media_type const& other) = default;

    /** Constructor

        A read-only `other` is copied
        and left unchanged.
    */
    MIME_DECL
    media_type(media_type&& other);

    /** Assignment

        Assignment replaces the whole value,
        including its read-only state.

        @throws std::logic_error This value is read-only.
    */
    MIME_DECL
    media_type&
    operator=(media_type const& other);

    /** Assignment

        A read-only `other` is copied
        and left unchanged.

        @throws std::logic_error This value is read-only.
    */
    MIME_DECL
    media_type&
    operator=(media_type&& other);

    //--------------------------------------------

    /** Return the type
    */
    core::string_view
    type() const noexcept
    {
        return type_;
    }

    /** Return the subtype
    */
    core::string_view
    subtype() const noexcept
    {
        return subtype_;
    }

    /** Return the type and subtype joined by a slash
    */
    MIME_DECL
    std::string
    mime_type() const;

    /** Set the type

        @throws std::logic_error The value is read-only.
        @throws system::system_error `type` is not a token.
    */
    MIME_DECL
    void
    set_type(core::string_view type);

    /** Set the subtype

        @throws std::logic_error The value is read-only.
        @throws system::system_error `subtype` is not a token.
    */
    MIME_DECL
    void
    set_subtype(core::string_view subtype);

    /** Set the type and subtype

        The string is checked the same way
        as by the constructor.

        @throws std::logic_error The value is read-only.
        @throws std::invalid_argument `mt` is empty.
        @throws system::system_error `mt` is not
        of the form `type "/" subtype`.
    */
    MIME_DECL
    void
    set_mime_type(core::string_view mt);

    //--------------------------------------------

    /** Return the parameters
    */
    parameter_list&
    params() noexcept
    {
        return params_;
    }

    /// @copydoc params
    parameter_list const&
    params() const noexcept
    {
        return params_;
    }

    /** Return the charset parameter value

        @return The value of the first parameter
        named "charset", or an empty optional.
    */
    MIME_DECL
    boost::optional<core::string_view>
    charset() const noexcept;

    /** Set the charset parameter

        An existing charset parameter keeps its
        position and name; otherwise one is appended.
        An empty string removes the parameter, as
        @ref remove_charset does.

        @throws std::logic_error The value is read-only.
        @throws system::system_error `charset` is not
        a token or quoted-string.
    */
    MIME_DECL
    void
    set_charset(core::string_view charset);

    /** Remove the charset parameter

        Nothing happens if there is none.

        @throws std::logic_error The value is read-only.
    */
    MIME_DECL
    void
    remove_charset();

    /** Return the quality

        The value of the "q" parameter is converted
        each time it is read. Parsing does not check
        it, so a malformed number is reported here.

        @return The quality, or an empty optional
        if there is no "q" parameter.

        @throws system::system_error The "q" parameter
        is not a decimal number (@ref error::bad_quality).
    */
    MIME_DECL
    boost::optional<double>
    quality() const;

    /** Set the quality

        The value is rounded to three decimal places
        and written with between one and three
        fractional digits, for example "0.8" or "0.125".

        @throws std::logic_error The value is read-only.
        @throws std::out_of_range `q` is not within [0, 1].
    */
    MIME_DECL
    void
    set_quality(double q);

    /** Remove the quality parameter

        Nothing happens if there is none.

        @throws std::logic_error The value is read-only.
    */
    MIME_DECL
    void
    remove_quality();

    //--------------------------------------------

    /** Return true if the value is read-only
    */
    bool
    is_read_only() const noexcept
    {
        return read_only_;
    }

    /** Return a modifiable deep copy

        The copy is never read-only.
    */
    MIME_DECL
    media_type
    copy() const;

    /** Return a read-only deep copy

        The copy and all of its parameters
        are read-only.
    */
    MIME_DECL
    media_type
    copy_as_read_only() const;

    /** Return true if this value is acceptable under a pattern

        This is the test used in content negotiation
        to decide whether an offered media type satisfies
        an element of an Accept header:

        @li The pattern type is "*", or equals this type.
        @li The pattern subtype is "*", or equals this subtype.
        @li Every parameter of the pattern other than "q"
            appears in this value with an equal value.

        All comparisons are case-insensitive. A wildcard
        in this value does not match a specific type in
        the pattern, so the relation is not symmetric.

        @par Example
        @code
        media_type mt( "text/plain" );
        assert( mt.is_subset_of( media_type( "text/*" ) ) );
        assert( ! media_type( "text/*" ).is_subset_of( mt ) );
        @endcode

        @param pattern The acceptable media range.
    */
    MIME_DECL
    bool
    is_subset_of(
        media_type const& pattern) const noexcept;

    /** Return the serialized value

        Each parameter is preceded by "; ".

        @par Example
        @code
        assert( parse_media_type( "TEXT/plain;charset = utf-8" ).to_string() ==
            "TEXT/plain; charset=utf-8" );
        @endcode
    */
    MIME_DECL
    std::string
    to_string() const;
};

//------------------------------------------------

/** Return true if two media types are equal

    Types and subtypes compare case-insensitively,
    and the parameters compare as sets.
*/
MIME_DECL
bool
operator==(
    media_type const& m0,
    media_type const& m1);

/** Return true if two media types are not equal
*/
inline
bool
operator!=(
    media_type const& m0,
    media_type const& m1)
{
    return !(m0 == m1);
}

/** Return a hash of the media type

    Equal media types have equal hashes.
*/
MIME_DECL
std::size_t
hash_value(
    media_type const& mt) noexcept;

/** Format the media type to an output stream
*/
MIME_DECL
std::ostream&
operator<<(
    std::ostream& os,
    media_type const& mt);

//------------------------------------------------

namespace detail {

// Used by the parser, which has already
// checked the grammar
class media_type_builder
{
public:
    MIME_DECL
    static
    media_type
    build(media_type_view const& v);
};

} // detail

} // mime

namespace std {
template<>
struct hash<::mime::media_type>
{
    std::size_t
    operator()(
        ::mime::media_type const& mt) const noexcept
    {
        return ::mime::hash_value(mt);
    }
};
} // std

#endif
