//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_DETAIL_EXCEPT_HPP
#define MIME_DETAIL_EXCEPT_HPP

#include <mime/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace mime {
namespace detail {

// Thrown when a read-only value is modified
BOOST_NORETURN MIME_DECL void throw_logic_error(
    boost::source_location const& = BOOST_CURRENT_LOCATION);

BOOST_NORETURN MIME_DECL void throw_invalid_argument(
    boost::source_location const& = BOOST_CURRENT_LOCATION);

BOOST_NORETURN MIME_DECL void throw_out_of_range(
    boost::source_location const& = BOOST_CURRENT_LOCATION);

BOOST_NORETURN MIME_DECL void throw_system_error(
    system::error_code const& ec,
    boost::source_location const& = BOOST_CURRENT_LOCATION);

} // detail
} // mime

#endif
