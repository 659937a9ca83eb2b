//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/path_pattern.hpp>
#include <waypoint/encode_url.hpp>
#include <waypoint/detail/except.hpp>
#include "src/detail/path_rule.hpp"

/*

template          regex (non-strict, end)
-----------------------------------------------------------------
/users/:id        ^\/users\/((?:[^\/]+?))(?:\/(?=$))?$
/users/:id?       ^\/users(?:\/((?:[^\/]+?)))?(?:\/(?=$))?$
/files/*          ^\/files\/((?:.*))(?:\/(?=$))?$
/:a.:b            ^\/((?:[^\/]+?))\.((?:[^\.]+?))(?:\/(?=$))?$
(.*)              ^((?:.*))(?:\/(?=$))?$

*/

namespace waypoint {

namespace {

// ECMAScript rules for every pattern, including
// expressions supplied by the caller
boost::match_flag_type const search_flags =
    boost::match_single_line |
    boost::match_not_dot_newline;

std::string
escape_string(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for(char c : s)
    {
        switch(c)
        {
        case '.': case '+': case '*': case '?':
        case '=': case '^': case '!': case ':':
        case '$': case '{': case '}': case '(':
        case ')': case '[': case ']': case '|':
        case '/': case '\\':
            result.push_back('\\');
            break;
        default:
            break;
        }
        result.push_back(c);
    }
    return result;
}

std::string
escape_group(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for(char c : s)
    {
        switch(c)
        {
        case '=': case '!': case ':':
        case '$': case '/': case '(':
        case ')':
            result.push_back('\\');
            break;
        default:
            break;
        }
        result.push_back(c);
    }
    return result;
}

std::string
tokens_to_regex(
    std::vector<path_token> const& tokens,
    pattern_options const& opt)
{
    std::string route;
    for(auto const& t : tokens)
    {
        if(! t.key)
        {
            route += escape_string(t.text);
            continue;
        }
        auto const& k = *t.key;
        auto const prefix = escape_string(k.prefix);
        auto capture = "(?:" + k.pattern + ")";
        if(k.repeat)
            capture += "(?:" + prefix + capture + ")*";
        if(k.optional)
        {
            if(! k.partial)
                capture = "(?:" + prefix + "(" + capture + "))?";
            else
                capture = prefix + "(" + capture + ")?";
        }
        else
        {
            capture = prefix + "(" + capture + ")";
        }
        route += capture;
    }

    constexpr std::string_view delimiter = "\\/";
    bool const ends_with_delimiter =
        route.ends_with(delimiter);

    // a trailing slash is optional unless strict
    if(! opt.strict)
    {
        if(ends_with_delimiter)
            route.resize(route.size() - delimiter.size());
        route += "(?:\\/(?=$))?";
    }

    if(opt.end)
        route += '$';
    else if(! (opt.strict && ends_with_delimiter))
        route += "(?=\\/|$)";

    return "^" + route;
}

} // (anon)

std::vector<path_token>
parse_path(std::string_view s)
{
    std::vector<path_token> tokens;
    std::string path;
    std::size_t key = 0;
    auto it = s.data();
    auto const end = it + s.size();
    while(it != end)
    {
        if(*it == '\\' && end - it >= 2)
        {
            path.push_back(it[1]);
            it += 2;
            continue;
        }

        auto const it0 = it;
        auto rv = grammar::parse(
            it, end, detail::param_rule);
        if(! rv)
        {
            path.push_back(*it++);
            continue;
        }

        if(! path.empty())
        {
            tokens.push_back({ std::move(path), {} });
            path.clear();
        }

        auto const& v = *rv;
        path_key k;
        if(v.name.empty())
            k.name = std::to_string(key++);
        else
            k.name = v.name;
        k.prefix = v.prefix;
        k.delimiter = v.prefix.empty() ? "/" : k.prefix;
        k.optional = v.modifier == '?' || v.modifier == '*';
        k.repeat = v.modifier == '+' || v.modifier == '*';
        k.partial = ! v.prefix.empty() &&
            it != end && *it != v.prefix.front();
        k.asterisk = v.asterisk;
        if(! v.group.empty())
            k.pattern = escape_group(v.group);
        else if(v.asterisk)
            k.pattern = ".*";
        else
            k.pattern = "[^" + escape_string(k.delimiter) + "]+?";
        tokens.push_back({ std::string(it0, it), std::move(k) });
    }
    if(! path.empty())
        tokens.push_back({ std::move(path), {} });
    return tokens;
}

//------------------------------------------------

path_pattern::
path_pattern(
    std::string_view s,
    pattern_options const& opt)
{
    auto tokens = parse_path(s);
    source_ = tokens_to_regex(tokens, opt);
    for(auto& t : tokens)
        if(t.key)
            keys_.push_back(std::move(*t.key));

    // ^ and $ anchor the whole path, and . stops at a newline
    auto flags =
        boost::regex::ECMAScript |
        boost::regex::no_mod_m |
        boost::regex::no_mod_s;
    if(! opt.sensitive)
        flags |= boost::regex::icase;
    try
    {
        re_.assign(source_, flags);
    }
    catch(boost::regex_error const& e)
    {
        detail::throw_invalid_argument(
            "invalid path pattern \"" +
            std::string(s) + "\": " + e.what());
    }
}

path_pattern::
path_pattern(boost::regex re)
    : re_(std::move(re))
{
    auto const n = re_.mark_count();
    keys_.resize(n);
    for(std::size_t i = 0; i < n; ++i)
        keys_[i].name = std::to_string(i);
}

bool
path_pattern::
match(std::string_view path) const
{
    return boost::regex_search(
        path.begin(), path.end(), re_, search_flags);
}

capture_list
path_pattern::
capture(std::string_view path) const
{
    boost::match_results<
        std::string_view::const_iterator> m;
    capture_list result;
    if(! boost::regex_search(
            path.begin(), path.end(), m, re_, search_flags))
        return result;
    result.reserve(m.size() - 1);
    for(std::size_t i = 1; i < m.size(); ++i)
    {
        if(m[i].matched)
            result.emplace_back(m[i].str());
        else
            result.emplace_back();
    }
    return result;
}

//------------------------------------------------

std::string
render_path(
    std::vector<path_token> const& tokens,
    param_map const& values)
{
    std::string path;
    for(auto const& t : tokens)
    {
        if(! t.key)
        {
            path += t.text;
            continue;
        }
        auto const& k = *t.key;
        auto it = values.find(k.name);
        if(it == values.end())
        {
            if(k.optional)
            {
                if(k.partial)
                    path += k.prefix;
                continue;
            }
            // leave the placeholder
            path += t.text;
            continue;
        }
        path += k.prefix;
        if(k.asterisk)
            path += encode_wildcard(it->second);
        else
            path += encode_uri_component(it->second);
    }
    return path;
}

} // waypoint
