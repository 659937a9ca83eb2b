//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/method.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace waypoint {

namespace {

// indexed by method, minus one
constexpr std::string_view method_tokens[] = {
    "ACL",
    "BIND",
    "CHECKOUT",
    "CONNECT",
    "COPY",
    "DELETE",
    "GET",
    "HEAD",
    "LINK",
    "LOCK",
    "M-SEARCH",
    "MERGE",
    "MKACTIVITY",
    "MKCALENDAR",
    "MKCOL",
    "MOVE",
    "NOTIFY",
    "OPTIONS",
    "PATCH",
    "POST",
    "PROPFIND",
    "PROPPATCH",
    "PURGE",
    "PUT",
    "REBIND",
    "REPORT",
    "SEARCH",
    "SOURCE",
    "SUBSCRIBE",
    "TRACE",
    "UNBIND",
    "UNLINK",
    "UNLOCK",
    "UNSUBSCRIBE"
};

constexpr std::size_t method_count =
    sizeof(method_tokens) / sizeof(method_tokens[0]);

static_assert(method_count ==
    static_cast<std::size_t>(method::unsubscribe));

} // (anon)

std::string_view
to_string(method m) noexcept
{
    auto const i = static_cast<std::size_t>(m);
    if(i == 0 || i > method_count)
        return {};
    return method_tokens[i - 1];
}

method
string_to_method(std::string_view s) noexcept
{
    // tokens are sorted, so a binary search works
    std::size_t lo = 0;
    std::size_t hi = method_count;
    while(lo < hi)
    {
        auto const mid = lo + (hi - lo) / 2;
        auto const c = s.compare(method_tokens[mid]);
        if(c == 0)
            return static_cast<method>(mid + 1);
        if(c < 0)
            hi = mid;
        else
            lo = mid + 1;
    }
    return method::unknown;
}

std::span<std::string_view const>
standard_methods() noexcept
{
    return { method_tokens, method_count };
}

std::string
to_upper_method(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for(char c : s)
        result.push_back(grammar::to_upper(c));
    return result;
}

} // waypoint
