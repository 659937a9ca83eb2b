//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/logger.hpp>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace waypoint {

namespace {

void
write(std::string_view s)
{
    static std::mutex m;
    std::lock_guard<std::mutex> lock(m);
    std::cerr << s << std::endl;
}

} // (anon)

section::
section() noexcept = default;

section::
section(
    std::string_view name,
    int level)
    : impl_(std::make_shared<impl>())
{
    impl_->name = name;
    impl_->level = level;
}

void
section::
set_threshold(int level) noexcept
{
    if(impl_)
        impl_->level = level;
}

std::string_view
section::
name() const noexcept
{
    if(! impl_)
        return {};
    return impl_->name;
}

void
section::
format_impl(
    std::string_view fs,
    char const* data,
    std::size_t* plen,
    std::size_t n) const
{
    std::string s = impl_->name;
    s.push_back(' ');
    char const* p = fs.data();
    char const* end = fs.data() + fs.size();
    auto p0 = p;
    while(p != end)
    {
        if(*p++ != '{')
            continue;
        if(p == end)
            break;
        if(*p++ != '}')
            continue;
        s.append(p0, p - p0 - 2);
        if(n)
        {
            s.append(data, *plen);
            data += *plen++;
            --n;
        }
        p0 = p;
    }
    s.append(p0, p - p0);
    waypoint::write(s);
}

//------------------------------------------------

struct log_sections::impl
{
    struct hash
    {
        std::size_t
        operator()(std::string_view const& s) const noexcept
        {
        #if SIZE_MAX == 4294967295U
            std::size_t hash = 2166136261; // FNV offset basis
            for (unsigned char c : s)
                hash ^= c, hash *= 16777619;   // FNV prime
        #else
            std::size_t hash = 1469598103934665603; // FNV offset basis
            for (unsigned char c : s)
                hash ^= c, hash *= 1099511628211;   // FNV prime
        #endif
            return hash;
        }
    };

    std::mutex m;
    std::vector<std::string> enabled;
    std::unordered_map<std::string_view, section, hash> map;

    bool
    is_enabled(std::string_view name) const noexcept
    {
        for(auto const& e : enabled)
            if(e == "*" || e == name)
                return true;
        return false;
    }
};

log_sections::
~log_sections()
{
    delete impl_;
}

log_sections::
log_sections(std::string_view enabled)
    : impl_(new impl)
{
    while(! enabled.empty())
    {
        auto const pos = enabled.find(',');
        auto item = enabled.substr(0, pos);
        while(! item.empty() && item.front() == ' ')
            item.remove_prefix(1);
        while(! item.empty() && item.back() == ' ')
            item.remove_suffix(1);
        if(! item.empty())
            impl_->enabled.emplace_back(item);
        if(pos == std::string_view::npos)
            break;
        enabled.remove_prefix(pos + 1);
    }
}

section
log_sections::
get(std::string_view name)
{
    std::lock_guard<std::mutex> lock(impl_->m);
    auto it = impl_->map.find(name);
    if(it != impl_->map.end())
        return it->second;
    auto v = section(name,
        impl_->is_enabled(name) ? 0 : section::off);
    impl_->map.emplace(std::string_view(v.impl_->name), v);
    return v;
}

log_sections&
log_sections::
global()
{
    static log_sections ls([]() -> std::string_view
    {
        auto const s = std::getenv("WAYPOINT_DEBUG");
        if(! s)
            return {};
        return s;
    }());
    return ls;
}

} // waypoint
