//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_ROUTE_OPTIONS_HPP
#define WAYPOINT_ROUTE_OPTIONS_HPP

#include <waypoint/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <boost/regex.hpp>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace waypoint {

namespace detail {
class router_base;
} // detail

/** An ordered list of key and value pairs

    A key may appear more than once.
*/
using query_list = std::vector<
    std::pair<std::string, std::string>>;

/** Options for generating a URL from a route
*/
struct url_options
{
    /** A query string to append

        The string may begin with `?`. Percent-escapes
        already present are kept.
    */
    std::string query;

    /** Query parameters to append

        Keys and values are percent-encoded. When this
        is not empty, @ref query is ignored.
    */
    query_list query_params;
};

/** Options used to construct a layer
*/
struct layer_options
{
    /// The name of the route, or empty
    std::string name;

    /// When `true`, literal text is matched case-sensitively
    bool sensitive = false;

    /// When `true`, a trailing slash is significant
    bool strict = false;

    /// When `false`, the pattern matches a path prefix
    bool end = true;

    /// When `true`, captured values are not stored
    bool ignore_captures = false;
};

/** Options for a single route registration

    Options left unset are taken from the router.
*/
struct route_options
{
    /// The name of the route, or empty
    std::string name;

    /// A prefix applied before the router's prefix
    std::string prefix;

    std::optional<bool> sensitive;

    std::optional<bool> strict;

    /// When `false`, the pattern matches a path prefix
    bool end = true;

    /// When `true`, captured values are not stored
    bool ignore_captures = false;
};

//------------------------------------------------

/** Options for constructing a router
*/
class router_options
{
public:
    /** Constructor.

        Routers constructed with default options have no
        prefix, are case-insensitive and not strict, and
        implement every method in @ref standard_methods.
    */
    router_options() = default;

    /** Set the prefix prepended to every route.

        @par Example
        @code
        router r( router_options()
            .prefix( "/things/:thing_id" ) );
        @endcode

        @param value The prefix to use.

        @return A reference to `*this` for chaining.
    */
    router_options&
    prefix(std::string_view value)
    {
        prefix_ = value;
        return *this;
    }

    /** Set whether pattern matching is case-sensitive.

        @param value `true` to perform case-sensitive path matching.

        @return A reference to `*this` for chaining.
    */
    router_options&
    case_sensitive(bool value) noexcept
    {
        case_sensitive_ = value;
        return *this;
    }

    /** Set whether pattern matching is strict.

        When strict mode is enabled, trailing slashes in paths
        are significant. For example, the pattern `"/api"` will
        not match `"/api/"`.

        @param value `true` to enable strict path matching.

        @return A reference to `*this` for chaining.
    */
    router_options&
    strict(bool value) noexcept
    {
        strict_ = value;
        return *this;
    }

    /** Set the methods the router implements.

        Requests using other methods receive a 501 status
        from the allowed-methods middleware.

        @param value The method tokens.

        @return A reference to `*this` for chaining.
    */
    router_options&
    methods(std::vector<std::string> value)
    {
        methods_ = std::move(value);
        return *this;
    }

    /** Set the path which the router always matches against.

        When set, this path is used for matching instead of
        the request path, unless the request carries its own
        routing path.

        @param value The path to use.

        @return A reference to `*this` for chaining.
    */
    router_options&
    router_path(std::string_view value)
    {
        router_path_ = value;
        return *this;
    }

private:
    friend class detail::router_base;

    std::string prefix_;
    std::string router_path_;
    std::optional<std::vector<std::string>> methods_;
    bool case_sensitive_ = false;
    bool strict_ = false;
};

//------------------------------------------------

/** Options for the allowed-methods middleware
*/
class allowed_methods_options
{
public:
    /// A function which returns the error to report
    using factory = std::function<system::error_code()>;

    allowed_methods_options() = default;

    /** Set whether violations are reported as errors.

        When `true`, the middleware returns a failing
        result instead of setting the response status
        and the `Allow` header.

        @return A reference to `*this` for chaining.
    */
    allowed_methods_options&
    throw_error(bool value) noexcept
    {
        throw_ = value;
        return *this;
    }

    /** Set the error reported for an unimplemented method.

        The default is @ref error::not_implemented.

        @return A reference to `*this` for chaining.
    */
    allowed_methods_options&
    not_implemented(factory f)
    {
        not_implemented_ = std::move(f);
        return *this;
    }

    /** Set the error reported for a disallowed method.

        The default is @ref error::method_not_allowed.

        @return A reference to `*this` for chaining.
    */
    allowed_methods_options&
    method_not_allowed(factory f)
    {
        method_not_allowed_ = std::move(f);
        return *this;
    }

private:
    friend class detail::router_base;

    factory not_implemented_;
    factory method_not_allowed_;
    bool throw_ = false;
};

//------------------------------------------------

/** The name of a route
*/
struct route_name
{
    explicit
    route_name(std::string_view s)
        : value(s)
    {
    }

    std::string value;
};

/** One or more path patterns

    A route path is a path template, a regular expression,
    or a list of path templates. Registering a route path
    with several alternatives registers one layer for each.

    @par Example
    @code
    r.get( "/users/:id", show_user );
    r.get( { "/a", "/b" }, handler );
    r.get( boost::regex( "^/article/(\\d+)$" ), handler );
    @endcode
*/
class route_path
{
public:
    struct alternative
    {
        /// The template, or the display text of a regex
        std::string text;

        std::optional<boost::regex> re;
    };

    route_path(char const* s)
        : v_{ alternative{ s, {} } }
    {
    }

    route_path(std::string_view s)
        : v_{ alternative{ std::string(s), {} } }
    {
    }

    route_path(std::string const& s)
        : v_{ alternative{ s, {} } }
    {
    }

    /** Constructor

        @param re The expression to match.

        @param text The text shown for the route in
        diagnostics and introspection.
    */
    route_path(
        boost::regex re,
        std::string_view text = "<regex>")
        : v_{ alternative{
            std::string(text), std::move(re) } }
    {
    }

    route_path(alternative a)
        : v_{ std::move(a) }
    {
    }

    route_path(std::initializer_list<std::string_view> il)
    {
        v_.reserve(il.size());
        for(auto s : il)
            v_.push_back({ std::string(s), {} });
    }

    route_path(std::vector<std::string> const& v)
    {
        v_.reserve(v.size());
        for(auto const& s : v)
            v_.push_back({ s, {} });
    }

    std::vector<alternative> const&
    alternatives() const noexcept
    {
        return v_;
    }

private:
    std::vector<alternative> v_;
};

} // waypoint

#endif
