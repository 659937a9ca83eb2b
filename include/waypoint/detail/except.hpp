//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_DETAIL_EXCEPT_HPP
#define WAYPOINT_DETAIL_EXCEPT_HPP

#include <waypoint/detail/config.hpp>
#include <string_view>

namespace waypoint {
namespace detail {

WAYPOINT_DECL void BOOST_NORETURN throw_invalid_argument(
    std::string_view s,
    source_location const& loc = BOOST_CURRENT_LOCATION);

WAYPOINT_DECL void BOOST_NORETURN throw_logic_error(
    std::string_view s,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // waypoint

#endif
