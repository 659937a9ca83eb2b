//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_ROUTE_PARAMS_HPP
#define WAYPOINT_ROUTE_PARAMS_HPP

#include <waypoint/detail/config.hpp>
#include <waypoint/detail/router_base.hpp>
#include <waypoint/path_pattern.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace waypoint {

class layer;

/** Base class for the request context passed to handlers

    The host fills in the request fields before
    dispatching. The router writes the routing fields
    as the request travels through matching layers,
    and handlers write the response fields.

    Objects of this type are not copyable.
*/
class route_params_base
{
public:
    route_params_base() = default;
    route_params_base(route_params_base const&) = delete;
    route_params_base& operator=(route_params_base const&) = delete;

    //--------------------------------------------
    //
    // Request
    //
    //--------------------------------------------

    /// The request method, e.g. "GET"
    std::string method;

    /// The request path, without the query
    std::string path;

    /** A path to route instead of @ref path

        When not empty, this takes precedence over
        both the request path and the router's own
        routing path.
    */
    std::string route_path;

    //--------------------------------------------
    //
    // Routing
    //
    //--------------------------------------------

    /// Decoded parameters of the current layer
    param_map params;

    /// Raw captures of the current layer
    capture_list captures;

    /// The router which last dispatched this request
    std::optional<detail::router_base> router;

    /// The name of the layer being run, or empty
    std::string router_name;

    /// The path template of the layer being run
    std::string router_path;

    /// The path template of the matched route
    std::string matched_route;

    /// The name of the matched route, or empty
    std::string matched_route_name;

    /// Every layer whose path matched, in order
    std::vector<std::shared_ptr<layer>> matched;

    //--------------------------------------------
    //
    // Response
    //
    //--------------------------------------------

    /// The response status, or zero if not set
    unsigned status = 0;

    /// The response header fields, in insertion order
    std::vector<std::pair<
        std::string, std::string>> headers;

    /// The response body
    std::string body;

    /** Set a response header field

        Any existing field with the same case-insensitive
        name is replaced.
    */
    WAYPOINT_DECL
    void
    set_header(
        std::string_view name,
        std::string_view value);

    /** Return the value of a response header field

        @return The value, or an empty string if the
        field is not present.
    */
    WAYPOINT_DECL
    std::string_view
    header(std::string_view name) const noexcept;

    /** Return true if a response header field is present
    */
    WAYPOINT_DECL
    bool
    has_header(std::string_view name) const noexcept;
};

} // waypoint

#endif
