//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_ERROR_HPP
#define MIME_ERROR_HPP

#include <mime/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace mime {

/** Error codes returned by media type parsing
*/
enum class error
{
    /// The operation completed successfully
    success = 0,

    /// The input was empty or contained only whitespace
    empty_value,

    /// The type, slash, or subtype is missing or malformed
    bad_type,

    /// A parameter is malformed
    bad_parameter,

    /// A quoted-string is unterminated or contains an illegal character
    bad_quoted_string,

    /// Characters remain after a complete value
    trailing_characters,

    /// The quality parameter is not a decimal number
    bad_quality,

    /// A list produced no values
    empty_list,

    /// The input exceeds parser_config::max_size
    too_large,

    /// A value has more than parser_config::max_params parameters
    too_many_params,

    /// A list has more than parser_config::max_elements values
    too_many_elements
};

//------------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /** The input does not follow the media-type grammar
    */
    format_error,

    /** A parser_config limit was exceeded
    */
    limit_exceeded
};

} // mime

#include <mime/impl/error.hpp>

#endif
