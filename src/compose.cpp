//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/compose.hpp>
#include <cstddef>

namespace waypoint {

namespace {

struct chain_state
{
    std::span<handler const* const> chain;
    route_params_base& p;
    next_fn outer;

    // the last position entered
    std::ptrdiff_t index = -1;

    route_result
    step(std::size_t i)
    {
        if(static_cast<std::ptrdiff_t>(i) <= index)
            detail::throw_logic_error(
                "next() called multiple times");
        index = static_cast<std::ptrdiff_t>(i);
        if(i == chain.size())
            return outer();
        auto const next =
            [this, i]
            {
                return step(i + 1);
            };
        return chain[i]->invoke(p, next_fn(next));
    }
};

} // (anon)

route_result
run_chain(
    std::span<handler const* const> chain,
    route_params_base& p,
    next_fn next)
{
    chain_state st{ chain, p, next };
    return st.step(0);
}

} // waypoint
