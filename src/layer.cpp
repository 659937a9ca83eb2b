//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/layer.hpp>
#include <waypoint/encode_url.hpp>
#include <waypoint/logger.hpp>
#include <waypoint/method.hpp>
#include <waypoint/route_params.hpp>
#include <waypoint/detail/except.hpp>
#include "src/detail/pct_decode.hpp"
#include <boost/url/pct_string_view.hpp>
#include <boost/url/url.hpp>
#include <algorithm>

namespace waypoint {

namespace {

section&
layer_log()
{
    static section sect =
        log_sections::global().get("waypoint.layer");
    return sect;
}

pattern_options
to_pattern_options(layer_options const& opt) noexcept
{
    pattern_options po;
    po.sensitive = opt.sensitive;
    po.strict = opt.strict;
    po.end = opt.end;
    return po;
}

std::string
join(
    std::vector<std::string> const& v,
    std::string_view sep)
{
    std::string s;
    for(auto const& e : v)
    {
        if(! s.empty())
            s += sep;
        s += e;
    }
    return s;
}

// runs a validator with the value of its parameter
struct param_middleware : handler
{
    std::string name;
    param_handler_ptr ph;

    param_middleware(
        std::string_view name_,
        param_handler_ptr ph_)
        : name(name_)
        , ph(std::move(ph_))
    {
    }

    route_result
    invoke(
        route_params_base& p,
        next_fn next) const override
    {
        std::string_view value;
        auto it = p.params.find(name);
        if(it != p.params.end())
            value = it->second;
        return ph->invoke(value, p, next);
    }
};

// removes every "(.*)" from a template
std::string
strip_wildcards(std::string_view s)
{
    constexpr std::string_view wild = "(.*)";
    std::string result;
    result.reserve(s.size());
    for(;;)
    {
        auto const n = s.find(wild);
        if(n == std::string_view::npos)
            break;
        result.append(s.data(), n);
        s.remove_prefix(n + wild.size());
    }
    result.append(s.data(), s.size());
    return result;
}

bool
is_named(path_key const& k) noexcept
{
    return ! k.name.empty() &&
        ! (k.name.front() >= '0' && k.name.front() <= '9');
}

void
append_query(
    std::string& s,
    url_options const& opt)
{
    urls::url u;
    if(! opt.query_params.empty())
    {
        std::string q;
        for(auto const& [k, v] : opt.query_params)
        {
            if(! q.empty())
                q.push_back('&');
            q += encode_query_component(k);
            q.push_back('=');
            q += encode_query_component(v);
        }
        u.set_encoded_query(
            urls::make_pct_string_view(q).value());
    }
    else if(! opt.query.empty())
    {
        std::string_view q = opt.query;
        if(q.front() == '?')
            q.remove_prefix(1);
        if(q.empty())
            return;
        auto rv = urls::make_pct_string_view(q);
        if(rv)
            u.set_encoded_query(*rv);
        else
            u.set_query(q);
    }
    else
    {
        return;
    }
    auto const q = u.encoded_query();
    s.push_back('?');
    s.append(q.data(), q.size());
}

std::string
render_url(
    std::string_view path,
    param_map const& params,
    url_options const& opt)
{
    auto s = render_path(
        parse_path(strip_wildcards(path)), params);
    append_query(s, opt);
    return s;
}

} // (anon)

//------------------------------------------------

layer::
layer(
    std::string_view path,
    std::vector<std::string> const& methods,
    std::vector<handler_ptr> const& stack,
    layer_options const& opt)
    : path_(path)
    , opt_(opt)
    , pattern_(path_, to_pattern_options(opt_))
{
    init(methods, stack);
}

layer::
layer(
    boost::regex re,
    std::string_view text,
    std::vector<std::string> const& methods,
    std::vector<handler_ptr> const& stack,
    layer_options const& opt)
    : path_(text)
    , opt_(opt)
    , pattern_(std::move(re))
    , is_regex_(true)
{
    init(methods, stack);
}

void
layer::
init(
    std::vector<std::string> const& methods,
    std::vector<handler_ptr> const& stack)
{
    for(auto const& m : methods)
    {
        auto u = to_upper_method(m);
        if(std::find(methods_.begin(),
            methods_.end(), u) != methods_.end())
            continue;
        methods_.push_back(u);
        if( u == "GET" &&
            std::find(methods_.begin(), methods_.end(),
                "HEAD") == methods_.end())
            methods_.insert(methods_.begin(), "HEAD");
    }

    stack_.reserve(stack.size());
    for(auto const& h : stack)
    {
        if(! h)
            detail::throw_invalid_argument(
                join(methods_, ",") + " `" +
                (opt_.name.empty() ? path_ : opt_.name) +
                "`: middleware must be invocable");
        stack_.push_back({ h, {}, nullptr });
    }

    WAYPOINT_LOG_DBG(layer_log())(
        "defined route {} {}", join(methods_, ","), path_);
}

bool
layer::
match(std::string_view path) const
{
    return pattern_.match(path);
}

capture_list
layer::
captures(std::string_view path) const
{
    if(opt_.ignore_captures)
        return {};
    return pattern_.capture(path);
}

param_map&
layer::
params(
    std::string_view,
    capture_list const& captures,
    param_map& existing) const
{
    auto const& keys = pattern_.keys();
    auto const n = std::min(keys.size(), captures.size());
    for(std::size_t i = 0; i < n; ++i)
    {
        if(! captures[i])
            continue;
        existing[keys[i].name] =
            detail::pct_decode_lenient(*captures[i]);
    }
    return existing;
}

std::string
layer::
url(
    param_map const& params,
    url_options const& opt) const
{
    if(is_regex_)
        detail::throw_logic_error(
            "cannot generate a URL for a regular expression route");
    return render_url(path_, params, opt);
}

std::string
layer::
url_args(
    std::vector<std::string> const& args,
    url_options const& opt) const
{
    if(is_regex_)
        detail::throw_logic_error(
            "cannot generate a URL for a regular expression route");
    param_map m;
    std::size_t i = 0;
    for(auto const& t : parse_path(strip_wildcards(path_)))
    {
        if(i == args.size())
            break;
        if(t.key && is_named(*t.key))
            m[t.key->name] = args[i++];
    }
    return render_url(path_, m, opt);
}

layer&
layer::
param(
    std::string_view name,
    param_handler_ptr ph)
{
    auto const& keys = pattern_.keys();
    auto const index_of =
        [&keys](std::string_view s) -> std::ptrdiff_t
        {
            for(std::size_t i = 0; i < keys.size(); ++i)
                if(keys[i].name == s)
                    return static_cast<std::ptrdiff_t>(i);
            return -1;
        };

    auto const x = index_of(name);
    if(x < 0)
        return *this;

    for(auto const& e : stack_)
        if(e.ph == ph && e.param == name)
            return *this;

    // validators stay in front of the other
    // handlers, ordered by their key position
    auto it = stack_.begin();
    for(; it != stack_.end(); ++it)
        if( it->param.empty() ||
            index_of(it->param) > x)
            break;
    stack_.insert(it, entry{
        std::make_shared<param_middleware>(name, ph),
        std::string(name), ph });
    return *this;
}

layer&
layer::
set_prefix(std::string_view prefix)
{
    if(path_.empty() || is_regex_)
        return *this;
    auto const old = path_;
    path_.insert(0, prefix);
    pattern_ = path_pattern(path_, to_pattern_options(opt_));
    WAYPOINT_LOG_DBG(layer_log())(
        "prefix {} -> {}", old, path_);
    return *this;
}

//------------------------------------------------

std::string
url(
    std::string_view path,
    param_map const& params,
    url_options const& opt)
{
    return render_url(path, params, opt);
}

} // waypoint
