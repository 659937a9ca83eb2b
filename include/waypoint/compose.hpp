//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_COMPOSE_HPP
#define WAYPOINT_COMPOSE_HPP

#include <waypoint/detail/config.hpp>
#include <waypoint/router_types.hpp>
#include <waypoint/detail/except.hpp>
#include <span>
#include <utility>
#include <vector>

namespace waypoint {

/** Run a chain of handlers

    The first handler is invoked with a @ref next_fn
    which runs the second, and so on. When the last
    handler calls `next`, the function `next` passed
    here is called.

    @return The result of the first handler.

    @throw std::logic_error A handler called `next`
    more than once.
*/
WAYPOINT_DECL
route_result
run_chain(
    std::span<handler const* const> chain,
    route_params_base& p,
    next_fn next = {});

//------------------------------------------------

/** A sequence of handlers invoked as one
*/
template<class P>
class composed
{
public:
    explicit
    composed(std::vector<handler_ptr> v)
        : v_(std::move(v))
    {
    }

    route_result
    operator()(P& p, next_fn next = {}) const
    {
        std::vector<handler const*> chain;
        chain.reserve(v_.size());
        for(auto const& h : v_)
            chain.push_back(h.get());
        return run_chain(chain, p, next);
    }

private:
    std::vector<handler_ptr> v_;
};

/** Return a function object which runs handlers in order

    @par Example
    @code
    auto app = compose< route_params >(
        r.routes(), r.allowed_methods() );
    route_params p;
    p.method = "GET";
    p.path = "/users/42";
    auto rv = app( p );
    @endcode

    @throw std::invalid_argument A handler is null.
*/
template<class P, class... HN>
    requires (route_handler<HN, P> && ...)
composed<P>
compose(HN&&... hn)
{
    std::vector<handler_ptr> v;
    v.reserve(sizeof...(HN));
    (v.push_back(make_handler<P>(std::forward<HN>(hn))), ...);
    for(auto const& h : v)
        if(! h)
            detail::throw_invalid_argument(
                "middleware must be invocable");
    return composed<P>(std::move(v));
}

} // waypoint

#endif
