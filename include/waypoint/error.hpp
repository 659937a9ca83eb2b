//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_ERROR_HPP
#define WAYPOINT_ERROR_HPP

#include <waypoint/detail/config.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <string>
#include <type_traits>

namespace waypoint {

/** Error codes returned by the router

    These values are produced as failing `system::error_code`
    objects, either from lookup functions returning
    `system::result`, or as the @ref route_result of a
    middleware chain.
*/
enum class error
{
    /** No route with the requested name exists.

        Returned by @ref detail::router_base::url when the
        name does not match any registered layer.
    */
    route_not_found = 1,

    /** The request method is not allowed for the path.

        Produced by the allowed-methods middleware when
        errors are configured to be raised. The equivalent
        HTTP status is 405.
    */
    method_not_allowed,

    /** The request method is not implemented by the router.

        Produced by the allowed-methods middleware when
        errors are configured to be raised. The equivalent
        HTTP status is 501.
    */
    not_implemented
};

} // waypoint

namespace boost {
namespace system {
template<>
struct is_error_code_enum<
    ::waypoint::error>
{
    static bool const value = true;
};
} // system
} // boost

namespace waypoint {

namespace detail {
struct WAYPOINT_SYMBOL_VISIBLE error_cat_type
    : system::error_category
{
    WAYPOINT_DECL const char* name() const noexcept override;
    WAYPOINT_DECL std::string message(int) const override;
    WAYPOINT_DECL char const* message(
        int, char*, std::size_t) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0xa7f40e2c91b35d68)
    {
    }
};
WAYPOINT_DECL extern error_cat_type error_cat;
} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(error ev) noexcept
{
    return system::error_code{static_cast<
        std::underlying_type<error>::type>(ev),
        detail::error_cat};
}

/** Return the HTTP status associated with an error

    @return The status code, or 500 if `ec` is not
    one of the policy errors of this library.
*/
WAYPOINT_DECL
unsigned
to_status(
    system::error_code const& ec) noexcept;

} // waypoint

#endif
