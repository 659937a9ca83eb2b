//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_SRC_DETAIL_PCT_DECODE_HPP
#define WAYPOINT_SRC_DETAIL_PCT_DECODE_HPP

#include <waypoint/detail/config.hpp>
#include <boost/url/pct_string_view.hpp>
#include <string>
#include <string_view>

namespace waypoint {
namespace detail {

// return true if s is well-formed UTF-8
bool
is_valid_utf8(std::string_view s) noexcept;

// decode all percent escapes
std::string
pct_decode(
    urls::pct_string_view s);

// decode all percent escapes, or return the input
// unchanged if it has a malformed escape or the
// decoded bytes are not valid UTF-8
std::string
pct_decode_lenient(
    std::string_view s);

} // detail
} // waypoint

#endif
