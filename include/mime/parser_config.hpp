//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_PARSER_CONFIG_HPP
#define MIME_PARSER_CONFIG_HPP

#include <mime/detail/config.hpp>
#include <cstddef>

namespace mime {

/** Limits applied when parsing header values.

    Values constructed or modified directly are
    not subject to these limits.

    @par Example
    @code
    parser_config cfg;
    cfg.max_params = 4;
    auto rv = try_parse_media_type(
        "text/plain; a=1; b=2; c=3; d=4; e=5", cfg );
    // rv.error() == error::too_many_params
    @endcode

    @see
        @ref parse_media_type,
        @ref parse_media_type_list.
*/
struct parser_config
{
    /** Largest raw header string accepted, in bytes.

        Exceeding this produces @ref error::too_large.
    */
    std::size_t max_size = 8192;

    /** Largest number of parameters on one value.

        Exceeding this produces @ref error::too_many_params.
    */
    std::size_t max_params = 32;

    /** Largest number of values produced by a list parse.

        Exceeding this produces @ref error::too_many_elements.
    */
    std::size_t max_elements = 256;
};

} // mime

#endif
