//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_HPP
#define WAYPOINT_HPP

#include <waypoint/basic_router.hpp>
#include <waypoint/compose.hpp>
#include <waypoint/encode_url.hpp>
#include <waypoint/error.hpp>
#include <waypoint/layer.hpp>
#include <waypoint/logger.hpp>
#include <waypoint/method.hpp>
#include <waypoint/path_pattern.hpp>
#include <waypoint/route_options.hpp>
#include <waypoint/route_params.hpp>
#include <waypoint/router.hpp>
#include <waypoint/router_types.hpp>

#endif
