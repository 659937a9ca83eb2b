//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_DETAIL_CONFIG_HPP
#define WAYPOINT_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <boost/assert/source_location.hpp>

//------------------------------------------------

# if (defined(WAYPOINT_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(WAYPOINT_STATIC_LINK)
#  if defined(WAYPOINT_SOURCE)
#   define WAYPOINT_DECL        BOOST_SYMBOL_EXPORT
#   define WAYPOINT_BUILD_DLL
#  else
#   define WAYPOINT_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  WAYPOINT_DECL
#  define WAYPOINT_DECL
# endif

#if defined(__MINGW32__)
    #define WAYPOINT_SYMBOL_VISIBLE WAYPOINT_DECL
#else
    #define WAYPOINT_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// lift the Boost libraries we use into our namespace
namespace boost {
namespace core {}
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace waypoint {
namespace core = ::boost::core;
namespace system = ::boost::system;
namespace urls = ::boost::urls;
namespace grammar = ::boost::urls::grammar;
using ::boost::source_location;
} // waypoint

#endif
