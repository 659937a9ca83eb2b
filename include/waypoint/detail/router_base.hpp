//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_DETAIL_ROUTER_BASE_HPP
#define WAYPOINT_DETAIL_ROUTER_BASE_HPP

#include <waypoint/detail/config.hpp>
#include <waypoint/layer.hpp>
#include <waypoint/path_pattern.hpp>
#include <waypoint/route_options.hpp>
#include <waypoint/router_types.hpp>
#include <boost/system/result.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint {

class route_params_base;

/** The layers matching a path and method
*/
struct match_result
{
    /// Every layer whose path matches
    std::vector<std::shared_ptr<layer>> path;

    /// Matching layers which are middleware or answer the method
    std::vector<std::shared_ptr<layer>> path_and_method;

    /// True if a layer with methods matched the method
    bool route = false;
};

namespace detail {

/** The type-independent part of a router

    Objects of this type are lightweight, shared
    references to the router's contents.
*/
class WAYPOINT_DECL router_base
{
    struct impl;

    std::shared_ptr<impl> impl_;

public:
    /** Return the layers matching a path and method

        This function has no side effects.
    */
    match_result
    match(
        std::string_view path,
        std::string_view method) const;

    /** Run the matching layers for a request

        When no layer with methods matches, `next` is
        called directly.
    */
    route_result
    dispatch(
        route_params_base& p,
        next_fn next = {}) const;

    /** Return the first layer with the given name

        @return The layer, or `nullptr` if there is none.
    */
    std::shared_ptr<layer>
    route(std::string_view name) const;

    /** Generate a URL for a named route

        @return The URL, or @ref error::route_not_found.
    */
    system::result<std::string>
    url(
        std::string_view name,
        param_map const& params = {},
        url_options const& opt = {}) const;

    /** Generate a URL for a named route from positional values

        @return The URL, or @ref error::route_not_found.
    */
    template<class Args>
        requires positional_args<Args>
    system::result<std::string>
    url(
        std::string_view name,
        Args const& args,
        url_options const& opt = {}) const
    {
        std::vector<std::string> v;
        for(auto const& s : args)
            v.emplace_back(std::string_view(s));
        return url_args(name, v, opt);
    }

    /** Generate a path for a named route from a flat list

        Each `:key` in the route's path is replaced with
        the first value given for `key`. Every other pair
        is appended to the query string, so repeating a
        key produces one query parameter per value.

        @par Example
        @code
        r.get( route_name( "edit_post" ), "/posts/:id/edit", h );
        assert( r.path_for( "edit_post",
            { { "id", "1" }, { "name", "foo" }, { "page", "2" } } ) ==
            "/posts/1/edit?name=foo&page=2" );
        @endcode

        @return The path, or an empty string if no
        route has the name.

        @throw std::logic_error The route is a regular
        expression.
    */
    std::string
    path_for(
        std::string_view name,
        query_list const& values = {}) const;

    /** Return the layers in registration order
    */
    std::vector<std::shared_ptr<layer>> const&
    layers() const noexcept;

    /** Return the methods the router implements
    */
    std::vector<std::string> const&
    methods() const noexcept;

    /** Return the prefix applied to every route
    */
    std::string const&
    prefix() const noexcept;

    /** Return the middleware result for allowed methods

        This runs `next`, then inspects the response
        and the layers matched during dispatch.
    */
    route_result
    allowed(
        route_params_base& p,
        next_fn next,
        allowed_methods_options const& opt) const;

protected:
    explicit
    router_base(router_options const& opt);

    std::vector<std::shared_ptr<layer>>
    add_layers(
        route_path const& path,
        std::vector<std::string> const& methods,
        std::vector<handler_ptr> const& stack,
        route_options const& opt);

    void
    absorb(
        route_path::alternative const* path,
        router_base child);

    void
    set_prefix(std::string_view prefix);

    void
    param_impl(
        std::string_view name,
        param_handler_ptr ph);

    void
    redirect_impl(
        std::string_view source,
        std::string_view destination,
        unsigned status);

private:
    system::result<std::string>
    url_args(
        std::string_view name,
        std::vector<std::string> const& args,
        url_options const& opt) const;

    std::shared_ptr<layer>
    add_layer(
        route_path::alternative const& path,
        std::vector<std::string> const& methods,
        std::vector<handler_ptr> const& stack,
        route_options const& opt);
};

} // detail
} // waypoint

#endif
