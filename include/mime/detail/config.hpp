//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MIME_DETAIL_CONFIG_HPP
#define MIME_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <boost/assert/source_location.hpp>
#include <stdint.h>

namespace boost {
namespace core {}
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace mime {

namespace core = ::boost::core;
namespace system = ::boost::system;
namespace grammar = ::boost::urls::grammar;

//------------------------------------------------

# if (defined(MIME_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(MIME_STATIC_LINK)
#  if defined(MIME_SOURCE)
#   define MIME_DECL        BOOST_SYMBOL_EXPORT
#   define MIME_BUILD_DLL
#  else
#   define MIME_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  MIME_DECL
#  define MIME_DECL
# endif

#if defined(__MINGW32__)
    #define MIME_SYMBOL_VISIBLE MIME_DECL
#else
    #define MIME_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef MIME_NO_SOURCE_LOCATION
# define MIME_ERR(ev) (::boost::system::error_code(ev))
# define MIME_RETURN_EC(ev) return (ev)
#else
# define MIME_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define MIME_RETURN_EC(ev)                                  \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // mime

#endif
