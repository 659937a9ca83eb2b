//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_ROUTER_HPP
#define WAYPOINT_ROUTER_HPP

#include <waypoint/detail/config.hpp>
#include <waypoint/basic_router.hpp>
#include <waypoint/route_params.hpp>
#include <functional>
#include <map>
#include <string>

namespace waypoint {

/** The default request context
*/
class route_params : public route_params_base
{
public:
    /** Data shared between the handlers of a request
    */
    std::map<std::string, std::string, std::less<>> state;
};

/** A router using the default request context
*/
using router = basic_router<route_params>;

} // waypoint

#endif
