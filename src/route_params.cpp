//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/route_params.hpp>
#include <waypoint/layer.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace waypoint {

void
route_params_base::
set_header(
    std::string_view name,
    std::string_view value)
{
    for(auto& f : headers)
    {
        if(grammar::ci_is_equal(f.first, name))
        {
            f.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string_view
route_params_base::
header(std::string_view name) const noexcept
{
    for(auto const& f : headers)
        if(grammar::ci_is_equal(f.first, name))
            return f.second;
    return {};
}

bool
route_params_base::
has_header(std::string_view name) const noexcept
{
    for(auto const& f : headers)
        if(grammar::ci_is_equal(f.first, name))
            return true;
    return false;
}

} // waypoint
