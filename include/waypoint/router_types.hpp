//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_ROUTER_TYPES_HPP
#define WAYPOINT_ROUTER_TYPES_HPP

#include <waypoint/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <concepts>
#include <functional>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

namespace waypoint {

class route_params_base;

/** The result type returned by a route handler.

    A default-constructed value indicates success. A
    failing error code propagates outward through every
    handler in the chain which returns the result of
    calling `next`, and is finally returned to the caller
    of the dispatcher.
*/
using route_result = system::error_code;

//------------------------------------------------

/** A reference to the remainder of a handler chain.

    Objects of this type are passed to handlers, which
    call them to run the handlers that follow. The
    reference does not own the callable it refers to,
    and must not be used after the handler returns.

    Calling a default-constructed object does nothing
    and returns a successful result.

    @par Example
    @code
    r.use( []( route_params& p, next_fn next )
    {
        auto rv = next();
        p.set_header( "X-Response-Time", "0ms" );
        return rv;
    } );
    @endcode
*/
class next_fn
{
public:
    /** Constructor
    */
    next_fn() = default;

    /** Constructor

        @param f The callable to refer to. It must
        outlive the constructed object.
    */
    template<class F>
        requires (
            ! std::same_as<std::remove_cvref_t<F>, next_fn> &&
            std::is_invocable_r_v<route_result, F const&>)
    next_fn(F const& f) noexcept
        : obj_(std::addressof(f))
        , fn_(&call<F>)
    {
    }

    /** Run the rest of the chain
    */
    route_result
    operator()() const
    {
        if(! fn_)
            return {};
        return fn_(obj_);
    }

    /** Return true if this refers to a callable
    */
    explicit
    operator bool() const noexcept
    {
        return fn_ != nullptr;
    }

private:
    template<class F>
    static
    route_result
    call(void const* p)
    {
        return std::invoke(*static_cast<F const*>(p));
    }

    void const* obj_ = nullptr;
    route_result(*fn_)(void const*) = nullptr;
};

//------------------------------------------------

/** A type-erased route handler
*/
struct WAYPOINT_SYMBOL_VISIBLE handler
{
    virtual ~handler() = default;

    virtual
    route_result
    invoke(
        route_params_base& p,
        next_fn next) const = 0;
};

using handler_ptr = std::shared_ptr<handler const>;

/** A type-erased parameter validator

    The validator receives the value of the
    parameter it was registered for.
*/
struct WAYPOINT_SYMBOL_VISIBLE param_handler
{
    virtual ~param_handler() = default;

    virtual
    route_result
    invoke(
        std::string_view value,
        route_params_base& p,
        next_fn next) const = 0;
};

using param_handler_ptr = std::shared_ptr<param_handler const>;

//------------------------------------------------

namespace detail {

template<class F, class... Args>
concept returns_route_result =
    std::is_invocable_v<F, Args...> && (
        std::is_void_v<std::invoke_result_t<F, Args...>> ||
        std::is_convertible_v<
            std::invoke_result_t<F, Args...>, route_result>);

template<class F, class... Args>
route_result
invoke_handler(F const& f, Args&&... args)
{
    if constexpr(std::is_void_v<
        std::invoke_result_t<F const&, Args...>>)
    {
        std::invoke(f, std::forward<Args>(args)...);
        return {};
    }
    else
    {
        return std::invoke(f, std::forward<Args>(args)...);
    }
}

// true if h is a function pointer or function
// object which holds no target
template<class D>
bool
is_null_handler(D const& h) noexcept
{
    if constexpr(
        std::is_pointer_v<D> ||
        std::is_member_pointer_v<D>)
        return h == nullptr;
    else if constexpr(
        std::is_class_v<D> &&
        std::is_constructible_v<bool, D const&> &&
        ! std::is_convertible_v<D const&, bool>)
        return ! static_cast<bool>(h);
    else
        return false;
}

} // detail

/** Concept for route handlers

    A route handler is a callable with one of these
    equivalent signatures:
    @code
    route_result handler( P& p, next_fn next );
    route_result handler( P& p );
    @endcode
    Handlers may also return `void`, which is the
    same as returning a successful result.
*/
template<class H, class P>
concept route_handler =
    detail::returns_route_result<
        std::decay_t<H> const&, P&, next_fn> ||
    detail::returns_route_result<
        std::decay_t<H> const&, P&>;

/** Concept for parameter validators

    A parameter validator is a callable with this
    equivalent signature:
    @code
    route_result validator( std::string_view value, P& p, next_fn next );
    @endcode
*/
template<class F, class P>
concept param_validator =
    detail::returns_route_result<
        std::decay_t<F> const&, std::string_view, P&, next_fn>;

//------------------------------------------------

/** Return a type-erased handler

    @return The handler, or `nullptr` if `h` is a
    null function pointer or an empty function object.
*/
template<class P, class H>
    requires route_handler<H, P>
handler_ptr
make_handler(H&& h)
{
    using D = std::decay_t<H>;

    struct impl : handler
    {
        D h;

        explicit impl(D h_)
            : h(std::move(h_))
        {
        }

        route_result
        invoke(
            route_params_base& rp,
            next_fn next) const override
        {
            auto& p = static_cast<P&>(rp);
            if constexpr(detail::returns_route_result<
                D const&, P&, next_fn>)
                return detail::invoke_handler(h, p, next);
            else
                return detail::invoke_handler(h, p);
        }
    };

    if(detail::is_null_handler(h))
        return nullptr;
    return std::make_shared<impl>(D(std::forward<H>(h)));
}

/** Return a type-erased parameter validator

    @return The validator, or `nullptr` if `f` is a
    null function pointer or an empty function object.
*/
template<class P, class F>
    requires param_validator<F, P>
param_handler_ptr
make_param_handler(F&& f)
{
    using D = std::decay_t<F>;

    struct impl : param_handler
    {
        D f;

        explicit impl(D f_)
            : f(std::move(f_))
        {
        }

        route_result
        invoke(
            std::string_view value,
            route_params_base& rp,
            next_fn next) const override
        {
            return detail::invoke_handler(
                f, value, static_cast<P&>(rp), next);
        }
    };

    if(detail::is_null_handler(f))
        return nullptr;
    return std::make_shared<impl>(D(std::forward<F>(f)));
}

} // waypoint

#endif
