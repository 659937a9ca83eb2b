//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_BASIC_ROUTER_HPP
#define WAYPOINT_BASIC_ROUTER_HPP

#include <waypoint/detail/config.hpp>
#include <waypoint/detail/router_base.hpp>
#include <waypoint/layer.hpp>
#include <waypoint/method.hpp>
#include <waypoint/route_options.hpp>
#include <waypoint/route_params.hpp>
#include <waypoint/router_types.hpp>
#include <concepts>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace waypoint {

/** A container for HTTP route handlers

    `basic_router` objects store and dispatch route handlers based on the
    HTTP method and path of an incoming request. Routes are added with a
    path pattern, method, and an associated handler, and the router is then
    used to dispatch the appropriate handler.

    Patterns used to create route definitions have percent-decoding applied
    when handlers are invoked.

    @par Example
    @code
    router r;
    r.get( "/hello",
        []( route_params& p )
        {
            p.status = 200;
            p.body = "Hello, world!";
        } );

    auto app = compose< route_params >(
        r.routes(), r.allowed_methods() );
    @endcode

    Router objects are lightweight, shared references to their contents.
    Copies of a router obtained through construction or assignment do
    not create new instances; they all refer to the same underlying data.

    @par Handlers

    Handlers have one of these equivalent signatures:
    @code
    route_result handler( P& p, next_fn next );
    route_result handler( P& p );
    @endcode

    A handler which accepts `next` may call it once to run the handlers
    that follow, and may do more work after it returns. A handler which
    does not call `next` ends the chain. Handlers may return `void` when
    they never fail.

    When a handler returns a failing error code, the code propagates
    outward through each handler that returned the result of `next`,
    and is returned by the dispatcher.

    @par Mounting

    Passing the dispatcher returned by @ref routes to @ref use copies
    the layers of the mounted router into this one, with the mount path
    and this router's prefix applied to the copies. Routes added to the
    mounted router afterwards are not seen by this router.

    @par Thread Safety

    Member functions marked `const` such as @ref dispatch may be called
    concurrently on routers that refer to the same data. Modification
    of routers through calls to non-`const` member functions is not
    thread-safe and must not be performed concurrently with any other
    member function.

    @par Constraints

    `P` must be publicly derived from @ref route_params_base.

    @tparam P The type of the parameters object passed to handlers.
*/
template<class P>
class basic_router : public detail::router_base
{
    static_assert(std::derived_from<P, route_params_base>);

public:
    class dispatcher;

private:
    template<class T>
    static inline constexpr bool is_dispatcher =
        std::is_same_v<std::decay_t<T>, dispatcher>;

    template<class H>
    static handler_ptr make_one(H&& h)
    {
        return make_handler<P>(std::forward<H>(h));
    }

    template<class... HN>
    static std::vector<handler_ptr> make_handlers(HN&&... hn)
    {
        std::vector<handler_ptr> v;
        v.reserve(sizeof...(HN));
        (v.push_back(make_one(std::forward<HN>(hn))), ...);
        return v;
    }

    template<class... HN>
    basic_router&
    add_verb(
        std::vector<std::string> methods,
        std::string_view name,
        route_path const& path,
        HN&&... hn)
    {
        static_assert(sizeof...(HN) > 0,
            "at least one handler is required");
        static_assert((route_handler<HN, P> && ...),
            "invalid handler signature");
        route_options opt;
        opt.name = name;
        add_layers(path, methods,
            make_handlers(std::forward<HN>(hn)...), opt);
        return *this;
    }

    static std::vector<std::string> all_methods()
    {
        auto const v = standard_methods();
        return std::vector<std::string>(v.begin(), v.end());
    }

    template<class H>
    void use_one(
        route_path::alternative const* path,
        H&& h)
    {
        if constexpr(is_dispatcher<H>)
        {
            absorb(path, h.router());
        }
        else
        {
            route_options opt;
            opt.end = false;
            opt.ignore_captures = (path == nullptr);
            if(path)
                add_layers(*path, {}, { make_one(h) }, opt);
            else
                add_layers("(.*)", {}, { make_one(h) }, opt);
        }
    }

public:
    /** The type of params used in handlers.
    */
    using params_type = P;

    /** Constructor.

        Creates an empty router with the specified configuration.

        @param options The configuration options to use.
    */
    explicit
    basic_router(
        router_options const& options = {})
        : router_base(options)
    {
    }

    using router_base::prefix;

    /** Add middleware handlers.

        Each handler is registered as its own layer which matches
        every path, and is entered for every method. Passing the
        result of @ref routes mounts another router instead.

        @par Example
        @code
        r.use( []( route_params& p, next_fn next )
        {
            p.set_header( "X-Powered-By", "waypoint" );
            return next();
        } );
        @endcode

        @par Constraints

        @p h1 must not be convertible to @ref route_path.

        @param h1 The first handler to add.

        @param hn Additional handlers to add, invoked after @p h1 in
        registration order.
    */
    template<class H1, class... HN>
        requires (! std::is_convertible_v<H1, route_path>)
    basic_router&
    use(H1&& h1, HN&&... hn)
    {
        static_assert(((route_handler<H1, P> || is_dispatcher<H1>) && ... &&
            (route_handler<HN, P> || is_dispatcher<HN>)),
            "invalid handler signature");
        use_one(nullptr, std::forward<H1>(h1));
        (use_one(nullptr, std::forward<HN>(hn)), ...);
        return *this;
    }

    /** Add middleware handlers for a path prefix.

        The prefix match is not strict: middleware attached to `"/api"`
        will also match `"/api/users"`. Captured parameters of the path
        are available to the handlers. When the path has several
        alternatives, the handlers are added for each.

        @param path The path to match.

        @param h1 The first handler to add.

        @param hn Additional handlers to add.
    */
    template<class H1, class... HN>
    basic_router&
    use(
        route_path const& path,
        H1 const& h1, HN const&... hn)
    {
        static_assert(((route_handler<H1, P> || is_dispatcher<H1>) && ... &&
            (route_handler<HN, P> || is_dispatcher<HN>)),
            "invalid handler signature");
        for(auto const& alt : path.alternatives())
        {
            use_one(&alt, h1);
            (use_one(&alt, hn), ...);
        }
        return *this;
    }

    /** Add handlers for a set of methods.

        This is the general form of registration which the verb
        functions are built on.

        @return The layers created, one per path alternative.

        @throw std::invalid_argument A handler is null.
    */
    template<class H1, class... HN>
    std::vector<std::shared_ptr<layer>>
    add_route(
        route_path const& path,
        std::vector<std::string> const& methods,
        route_options const& opt,
        H1&& h1, HN&&... hn)
    {
        static_assert((route_handler<H1, P> && ... &&
            route_handler<HN, P>),
            "invalid handler signature");
        return add_layers(path, methods, make_handlers(
            std::forward<H1>(h1), std::forward<HN>(hn)...), opt);
    }

    /** Add handlers for a method and path.

        @param verb The method, which may be an extension
        method such as `"PURGE"`.
    */
    template<class... HN>
    basic_router&
    add(std::string_view verb,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ std::string(verb) }, {},
            path, std::forward<HN>(hn)...);
    }

    /** Add named handlers for a method and path.
    */
    template<class... HN>
    basic_router&
    add(std::string_view verb, route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ std::string(verb) }, name.value,
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    add(method verb,
        route_path const& path, HN&&... hn)
    {
        return add(to_string(verb), path,
            std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    add(method verb, route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add(to_string(verb), name, path,
            std::forward<HN>(hn)...);
    }

    /** Add handlers for every standard method.
    */
    template<class... HN>
    basic_router&
    all(route_path const& path, HN&&... hn)
    {
        return add_verb(all_methods(), {},
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    all(route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb(all_methods(), name.value,
            path, std::forward<HN>(hn)...);
    }

    /** Add handlers for GET requests.

        The route also answers HEAD requests.

        @par Example
        @code
        r.get( route_name( "user" ), "/users/:id",
            []( route_params& p )
            {
                p.body = p.params["id"];
            } );
        @endcode
    */
    template<class... HN>
    basic_router&
    get(route_path const& path, HN&&... hn)
    {
        return add_verb({ "GET" }, {},
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    get(route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ "GET" }, name.value,
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    post(route_path const& path, HN&&... hn)
    {
        return add_verb({ "POST" }, {},
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    post(route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ "POST" }, name.value,
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    put(route_path const& path, HN&&... hn)
    {
        return add_verb({ "PUT" }, {},
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    put(route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ "PUT" }, name.value,
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    patch(route_path const& path, HN&&... hn)
    {
        return add_verb({ "PATCH" }, {},
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    patch(route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ "PATCH" }, name.value,
            path, std::forward<HN>(hn)...);
    }

    /** Add handlers for DELETE requests.
    */
    template<class... HN>
    basic_router&
    del(route_path const& path, HN&&... hn)
    {
        return add_verb({ "DELETE" }, {},
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    del(route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ "DELETE" }, name.value,
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    head(route_path const& path, HN&&... hn)
    {
        return add_verb({ "HEAD" }, {},
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    head(route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ "HEAD" }, name.value,
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    options(route_path const& path, HN&&... hn)
    {
        return add_verb({ "OPTIONS" }, {},
            path, std::forward<HN>(hn)...);
    }

    template<class... HN>
    basic_router&
    options(route_name const& name,
        route_path const& path, HN&&... hn)
    {
        return add_verb({ "OPTIONS" }, name.value,
            path, std::forward<HN>(hn)...);
    }

    /** Set the prefix of the router.

        One trailing slash is removed from the prefix. Every
        existing layer is updated, and layers added later
        receive the prefix as well.

        @par Example
        @code
        r.prefix( "/things/:thing_id" );
        @endcode

        @return A reference to `*this`.
    */
    basic_router&
    prefix(std::string_view p)
    {
        set_prefix(p);
        return *this;
    }

    /** Add a validator for a named parameter.

        The validator runs before the handlers of every layer
        whose template declares the parameter, including layers
        added later. Adding a validator for a name which already
        has one replaces it for layers added later.

        @par Example
        @code
        r.param( "user",
            []( std::string_view id, route_params& p, next_fn next )
                -> route_result
            {
                if( id != "3" )
                {
                    p.status = 404;
                    return {};
                }
                return next();
            } );
        @endcode

        @throw std::invalid_argument The validator is null.
    */
    template<class F>
    basic_router&
    param(std::string_view name, F&& f)
    {
        static_assert(param_validator<F, P>,
            "invalid param validator signature");
        param_impl(name,
            make_param_handler<P>(std::forward<F>(f)));
        return *this;
    }

    /** Redirect one path or named route to another.

        A name not starting with `/`, and not containing `://`,
        is resolved with @ref url.

        @param source The path or route name to redirect.

        @param destination The path, URL or route name to redirect to.

        @param status The response status.

        @throw std::invalid_argument A route name is not found.
    */
    basic_router&
    redirect(
        std::string_view source,
        std::string_view destination,
        unsigned status = 301)
    {
        redirect_impl(source, destination, status);
        return *this;
    }

    /** Return a handler which dispatches requests to this router.
    */
    dispatcher
    routes() const
    {
        return dispatcher(*this);
    }

    /** Return a handler which dispatches requests to this router.

        This is the same as @ref routes.
    */
    dispatcher
    middleware() const
    {
        return routes();
    }

    /** Return a handler which responds to disallowed methods.

        The handler runs the rest of the chain first. When no
        handler set a status other than 404, it responds with
        501 for methods the router does not implement, answers
        `OPTIONS` with 200, and responds with 405 for methods
        which no matched route answers. The `Allow` header lists
        the methods of the matched layers.

        @par Example
        @code
        auto app = compose< route_params >(
            r.routes(),
            r.allowed_methods() );
        @endcode
    */
    auto
    allowed_methods(
        allowed_methods_options opt = {}) const
    {
        return
            [r = *this, opt = std::move(opt)](
                P& p, next_fn next)
            {
                return r.allowed(p, next, opt);
            };
    }
};

//------------------------------------------------

/** A handler which dispatches to a router
*/
template<class P>
class basic_router<P>::dispatcher
{
public:
    route_result
    operator()(P& p, next_fn next = {}) const
    {
        return r_.dispatch(p, next);
    }

    basic_router const&
    router() const noexcept
    {
        return r_;
    }

private:
    friend class basic_router;

    explicit
    dispatcher(basic_router const& r)
        : r_(r)
    {
    }

    basic_router r_;
};

} // waypoint

#endif
