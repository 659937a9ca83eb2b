//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_SRC_DETAIL_PATH_RULE_HPP
#define WAYPOINT_SRC_DETAIL_PATH_RULE_HPP

#include <waypoint/detail/config.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/system/result.hpp>
#include <string_view>

namespace waypoint {
namespace detail {

/*
param        = [ prefix ] ( named / group ) [ modifier ]
             / [ prefix ] "*"
prefix       = "/" / "."
named        = ":" 1*word-char [ group ]
group        = "(" 1*( "\" CHAR / group-char ) ")"
group-char   = any char except "\" "(" ")"
modifier     = "?" / "*" / "+"
word-char    = ALPHA / DIGIT / "_"
*/

//------------------------------------------------

struct word_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch == '_');
    }
};

static_assert(grammar::is_charset<word_char>::value);

// yields the group contents without parentheses
constexpr struct
{
    using value_type = std::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end || *it != '(')
            return grammar::error::mismatch;
        auto const it0 = it++;
        auto const first = it;
        while(it != end)
        {
            if(*it == '\\')
            {
                if(end - it < 2)
                    break;
                it += 2;
                continue;
            }
            if(*it == '(' || *it == ')')
                break;
            ++it;
        }
        if( it == first ||
            it == end ||
            *it != ')')
        {
            it = it0;
            return grammar::error::mismatch;
        }
        return std::string_view(first, it++ - first);
    }
} group_rule{};

constexpr struct
{
    using value_type = std::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end || *it != ':')
            return grammar::error::mismatch;
        auto const it0 = it++;
        auto const first = it;
        it = grammar::find_if_not(
            it, end, word_char{});
        if(it == first)
        {
            it = it0;
            return grammar::error::mismatch;
        }
        return std::string_view(first, it - first);
    }
} param_name_rule{};

//------------------------------------------------

/** A parameter in a path template
*/
struct param_spec
{
    std::string_view prefix;
    std::string_view name;      // empty when unnamed
    std::string_view group;     // empty for the default pattern
    char modifier = 0;
    bool asterisk = false;
};

constexpr struct
{
    using value_type = param_spec;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end)
            return grammar::error::mismatch;
        auto const it0 = it;
        value_type v;
        if(*it == '/' || *it == '.')
            v.prefix = std::string_view(it++, 1);
        if(it == end)
        {
            it = it0;
            return grammar::error::mismatch;
        }
        if(*it == '*')
        {
            ++it;
            v.asterisk = true;
            return v;
        }
        if(*it == ':')
        {
            auto rv = grammar::parse(
                it, end, param_name_rule);
            if(! rv)
            {
                it = it0;
                return grammar::error::mismatch;
            }
            v.name = *rv;

            // the group is optional here
            auto rv2 = grammar::parse(
                it, end, group_rule);
            if(rv2)
                v.group = *rv2;
        }
        else
        {
            auto rv = grammar::parse(
                it, end, group_rule);
            if(! rv)
            {
                it = it0;
                return grammar::error::mismatch;
            }
            v.group = *rv;
        }
        if( it != end && (
            *it == '?' || *it == '*' || *it == '+'))
            v.modifier = *it++;
        return v;
    }
} param_rule{};

} // detail
} // waypoint

#endif
