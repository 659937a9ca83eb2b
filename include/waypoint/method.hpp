//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_METHOD_HPP
#define WAYPOINT_METHOD_HPP

#include <waypoint/detail/config.hpp>
#include <span>
#include <string>
#include <string_view>

namespace waypoint {

/** HTTP request methods

    The enumerators cover the complete standard method
    list in alphabetical order of their tokens. Methods
    outside this list are still routable by string.
*/
enum class method : unsigned char
{
    unknown = 0,
    acl,
    bind,
    checkout,
    connect,
    copy,
    delete_,
    get,
    head,
    link,
    lock,
    msearch,
    merge,
    mkactivity,
    mkcalendar,
    mkcol,
    move,
    notify,
    options,
    patch,
    post,
    propfind,
    proppatch,
    purge,
    put,
    rebind,
    report,
    search,
    source,
    subscribe,
    trace,
    unbind,
    unlink,
    unlock,
    unsubscribe
};

/** Return the token for a method

    @return The uppercase method token, or an
    empty string for @ref method::unknown.
*/
WAYPOINT_DECL
std::string_view
to_string(method m) noexcept;

/** Convert a token to a method

    The comparison is exact; tokens are expected
    to be uppercase.

    @return The method, or @ref method::unknown.
*/
WAYPOINT_DECL
method
string_to_method(std::string_view s) noexcept;

/** Return the complete standard method list

    The tokens are uppercase, in alphabetical order.
*/
WAYPOINT_DECL
std::span<std::string_view const>
standard_methods() noexcept;

/** Return a method token in uppercase
*/
WAYPOINT_DECL
std::string
to_upper_method(std::string_view s);

} // waypoint

#endif
