//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/pct_decode.hpp"
#include <boost/url/grammar/hexdig_chars.hpp>

namespace waypoint {
namespace detail {

bool
is_valid_utf8(std::string_view s) noexcept
{
    auto it = reinterpret_cast<
        unsigned char const*>(s.data());
    auto const end = it + s.size();
    while(it != end)
    {
        unsigned char const c = *it++;
        if(c < 0x80)
            continue;

        // lead byte, and the range of the first
        // continuation byte which excludes overlong
        // forms, surrogates and values past U+10FFFF
        std::size_t n;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if(c >= 0xC2 && c <= 0xDF)
            n = 1;
        else if(c >= 0xE0 && c <= 0xEF)
        {
            n = 2;
            if(c == 0xE0)
                lo = 0xA0;
            else if(c == 0xED)
                hi = 0x9F;
        }
        else if(c >= 0xF0 && c <= 0xF4)
        {
            n = 3;
            if(c == 0xF0)
                lo = 0x90;
            else if(c == 0xF4)
                hi = 0x8F;
        }
        else
            return false;

        if(static_cast<std::size_t>(end - it) < n)
            return false;
        if(*it < lo || *it > hi)
            return false;
        ++it;
        while(--n)
        {
            if((*it & 0xC0) != 0x80)
                return false;
            ++it;
        }
    }
    return true;
}

std::string
pct_decode(
    urls::pct_string_view s)
{
    std::string result;
    core::string_view sv(s);
    result.reserve(s.size());
    auto it = sv.data();
    auto const end = it + sv.size();
    for(;;)
    {
        if(it == end)
            break;
        if(*it != '%')
        {
            result.push_back(*it++);
            continue;
        }
        ++it;
        // pct_string_view can never have invalid pct-encodings
        auto d0 = urls::grammar::hexdig_value(*it++);
        auto d1 = urls::grammar::hexdig_value(*it++);
        result.push_back(static_cast<char>(d0 * 16 + d1));
    }
    return result;
}

std::string
pct_decode_lenient(
    std::string_view s)
{
    auto rv = urls::make_pct_string_view(
        core::string_view(s.data(), s.size()));
    if(rv.has_error())
        return std::string(s);
    auto result = pct_decode(*rv);
    if(! is_valid_utf8(result))
        return std::string(s);
    return result;
}

} // detail
} // waypoint
