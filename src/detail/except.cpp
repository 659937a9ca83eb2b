//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/detail/except.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>
#include <string>

namespace waypoint {
namespace detail {

void
throw_invalid_argument(
    std::string_view s,
    source_location const& loc)
{
    boost::throw_exception(
        std::invalid_argument(std::string(s)), loc);
}

void
throw_logic_error(
    std::string_view s,
    source_location const& loc)
{
    boost::throw_exception(
        std::logic_error(std::string(s)), loc);
}

} // detail
} // waypoint
