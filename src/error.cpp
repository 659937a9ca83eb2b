//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/error.hpp>

namespace waypoint {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "waypoint";
}

std::string
error_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
error_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(code))
    {
    case error::route_not_found:    return "no route found for name";
    case error::method_not_allowed: return "Method Not Allowed";
    case error::not_implemented:    return "Not Implemented";
    default:
        return "?";
    }
}

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
#else
error_cat_type error_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

unsigned
to_status(
    system::error_code const& ec) noexcept
{
    if(ec.category() != detail::error_cat)
        return 500;
    switch(static_cast<error>(ec.value()))
    {
    case error::route_not_found:    return 404;
    case error::method_not_allowed: return 405;
    case error::not_implemented:    return 501;
    default:
        return 500;
    }
}

} // waypoint
