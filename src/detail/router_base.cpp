//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/detail/router_base.hpp>
#include <waypoint/compose.hpp>
#include <waypoint/encode_url.hpp>
#include <waypoint/error.hpp>
#include <waypoint/layer.hpp>
#include <waypoint/logger.hpp>
#include <waypoint/method.hpp>
#include <waypoint/route_params.hpp>
#include <waypoint/detail/except.hpp>
#include <algorithm>
#include <utility>

namespace waypoint {
namespace detail {

namespace {

section&
router_log()
{
    static section sect =
        log_sections::global().get("waypoint.router");
    return sect;
}

bool
contains(
    std::vector<std::string> const& v,
    std::string_view s) noexcept
{
    return std::find(v.begin(), v.end(), s) != v.end();
}

std::string
join(std::vector<std::string> const& v)
{
    std::string s;
    for(auto const& e : v)
    {
        if(! s.empty())
            s += ", ";
        s += e;
    }
    return s;
}

// enters a layer before its handlers run
struct enter_layer : handler
{
    layer const& l;
    std::string_view path;

    enter_layer(
        layer const& l_,
        std::string_view path_) noexcept
        : l(l_)
        , path(path_)
    {
    }

    route_result
    invoke(
        route_params_base& p,
        next_fn next) const override
    {
        p.captures = l.captures(path);
        l.params(path, p.captures, p.params);
        p.router_name = l.name();
        p.router_path = l.path();
        if(! l.methods().empty())
        {
            p.matched_route = l.path();
            p.matched_route_name = l.name();
        }
        return next();
    }
};

struct redirect_handler : handler
{
    std::string location;
    unsigned status;

    redirect_handler(
        std::string_view location_,
        unsigned status_)
        : location(encode_url(location_))
        , status(status_)
    {
    }

    route_result
    invoke(
        route_params_base& p,
        next_fn) const override
    {
        p.set_header("Location", location);
        p.status = status;
        return {};
    }
};

bool
is_key_start(char c) noexcept
{
    return (c >= 'a' && c <= 'z') ||
        (c >= 'A' && c <= 'Z') || c == '_';
}

bool
is_key_char(char c) noexcept
{
    return is_key_start(c) || (c >= '0' && c <= '9');
}

} // (anon)

//------------------------------------------------

struct router_base::impl
{
    std::string prefix;
    std::string router_path;
    std::vector<std::string> methods;
    bool case_sensitive = false;
    bool strict = false;

    std::vector<std::shared_ptr<layer>> layers;

    // in declaration order, one per name
    std::vector<std::pair<
        std::string, param_handler_ptr>> params;
};

router_base::
router_base(router_options const& opt)
    : impl_(std::make_shared<impl>())
{
    impl_->prefix = opt.prefix_;
    impl_->router_path = opt.router_path_;
    impl_->case_sensitive = opt.case_sensitive_;
    impl_->strict = opt.strict_;
    if(opt.methods_)
    {
        for(auto const& m : *opt.methods_)
            impl_->methods.push_back(to_upper_method(m));
    }
    else
    {
        impl_->methods = {
            "HEAD", "OPTIONS", "GET", "PUT",
            "PATCH", "POST", "DELETE" };
    }
}

match_result
router_base::
match(
    std::string_view path,
    std::string_view method) const
{
    auto const m = to_upper_method(method);
    match_result rv;
    for(auto const& l : impl_->layers)
    {
        WAYPOINT_LOG_TRC(router_log())(
            "test {} {}", l->path(), path);
        if(! l->match(path))
            continue;
        rv.path.push_back(l);
        if( l->methods().empty() ||
            contains(l->methods(), m))
        {
            rv.path_and_method.push_back(l);
            if(! l->methods().empty())
                rv.route = true;
        }
    }
    return rv;
}

route_result
router_base::
dispatch(
    route_params_base& p,
    next_fn next) const
{
    std::string const path =
        ! p.route_path.empty() ? p.route_path :
        ! impl_->router_path.empty() ? impl_->router_path :
        p.path;

    auto const m = match(path, p.method);
    WAYPOINT_LOG_DBG(router_log())(
        "{} {}, matched {}, route {}",
        p.method, path, m.path.size(), m.route);

    p.matched.insert(p.matched.end(),
        m.path.begin(), m.path.end());
    p.router = *this;

    if(! m.route)
        return next();

    // preset to the most specific route layer
    for(auto it = m.path_and_method.rbegin();
        it != m.path_and_method.rend(); ++it)
    {
        auto const& l = **it;
        if(! l.methods().empty())
        {
            p.matched_route = l.path();
            p.matched_route_name = l.name();
            break;
        }
    }

    std::vector<enter_layer> enter;
    enter.reserve(m.path_and_method.size());
    std::vector<handler const*> chain;
    for(auto const& l : m.path_and_method)
    {
        enter.emplace_back(*l, path);
        chain.push_back(&enter.back());
        for(auto const& e : l->stack())
            chain.push_back(e.h.get());
    }
    return run_chain(chain, p, next);
}

std::shared_ptr<layer>
router_base::
route(std::string_view name) const
{
    for(auto const& l : impl_->layers)
        if(! l->name().empty() && l->name() == name)
            return l;
    return nullptr;
}

system::result<std::string>
router_base::
url(
    std::string_view name,
    param_map const& params,
    url_options const& opt) const
{
    auto l = route(name);
    if(! l)
    {
        WAYPOINT_LOG_DBG(router_log())(
            "no route found for name {}", name);
        return error::route_not_found;
    }
    return l->url(params, opt);
}

system::result<std::string>
router_base::
url_args(
    std::string_view name,
    std::vector<std::string> const& args,
    url_options const& opt) const
{
    auto l = route(name);
    if(! l)
    {
        WAYPOINT_LOG_DBG(router_log())(
            "no route found for name {}", name);
        return error::route_not_found;
    }
    return l->url(args, opt);
}

std::string
router_base::
path_for(
    std::string_view name,
    query_list const& values) const
{
    auto l = route(name);
    if(! l)
    {
        WAYPOINT_LOG_DBG(router_log())(
            "no route found for name {}", name);
        return {};
    }
    if(l->is_regex())
        detail::throw_logic_error(
            "cannot generate a URL for a regular expression route");

    auto const find =
        [&values](std::string_view key)
        {
            return std::find_if(
                values.begin(), values.end(),
                [key](auto const& v)
                {
                    return v.first == key;
                });
        };

    // replace each :key which has a value
    std::string path;
    std::vector<std::string_view> used;
    std::string_view s = l->path();
    while(! s.empty())
    {
        auto const n = s.find(':');
        if(n == std::string_view::npos)
            break;
        path.append(s.data(), n);
        s.remove_prefix(n + 1);
        std::size_t len = 0;
        if(! s.empty() && is_key_start(s.front()))
        {
            len = 1;
            while(len < s.size() && is_key_char(s[len]))
                ++len;
        }
        auto const key = s.substr(0, len);
        auto const it = len ? find(key) : values.end();
        if(it == values.end())
        {
            path.push_back(':');
            path.append(key.data(), key.size());
        }
        else
        {
            path += encode_uri_component(it->second);
            used.push_back(key);
        }
        s.remove_prefix(len);
    }
    path.append(s.data(), s.size());

    std::string query;
    for(auto const& [k, v] : values)
    {
        if(std::find(used.begin(), used.end(), k) != used.end())
            continue;
        if(! query.empty())
            query.push_back('&');
        query += encode_uri_component(k);
        query.push_back('=');
        query += encode_uri_component(v);
    }
    if(! query.empty())
    {
        if(path.find('?') == std::string::npos)
            path.push_back('?');
        else
            path.push_back('&');
        path += query;
    }
    return path;
}

std::vector<std::shared_ptr<layer>> const&
router_base::
layers() const noexcept
{
    return impl_->layers;
}

std::vector<std::string> const&
router_base::
methods() const noexcept
{
    return impl_->methods;
}

std::string const&
router_base::
prefix() const noexcept
{
    return impl_->prefix;
}

route_result
router_base::
allowed(
    route_params_base& p,
    next_fn next,
    allowed_methods_options const& opt) const
{
    auto rv = next();
    if(rv.failed())
        return rv;
    if(p.status != 0 && p.status != 404)
        return rv;

    std::vector<std::string> allowed;
    for(auto const& l : p.matched)
        for(auto const& m : l->methods())
            if(! contains(allowed, m))
                allowed.push_back(m);

    auto const method = to_upper_method(p.method);
    if(! contains(impl_->methods, method))
    {
        if(opt.throw_)
        {
            if(opt.not_implemented_)
                return opt.not_implemented_();
            return error::not_implemented;
        }
        p.status = 501;
        p.set_header("Allow", join(allowed));
        return rv;
    }

    if(allowed.empty())
        return rv;

    if(method == "OPTIONS")
    {
        p.status = 200;
        p.body.clear();
        p.set_header("Allow", join(allowed));
        return rv;
    }

    if(! contains(allowed, method))
    {
        if(opt.throw_)
        {
            if(opt.method_not_allowed_)
                return opt.method_not_allowed_();
            return error::method_not_allowed;
        }
        p.status = 405;
        p.set_header("Allow", join(allowed));
    }
    return rv;
}

//------------------------------------------------

std::vector<std::shared_ptr<layer>>
router_base::
add_layers(
    route_path const& path,
    std::vector<std::string> const& methods,
    std::vector<handler_ptr> const& stack,
    route_options const& opt)
{
    std::vector<std::shared_ptr<layer>> v;
    v.reserve(path.alternatives().size());
    for(auto const& alt : path.alternatives())
        v.push_back(add_layer(alt, methods, stack, opt));
    return v;
}

std::shared_ptr<layer>
router_base::
add_layer(
    route_path::alternative const& path,
    std::vector<std::string> const& methods,
    std::vector<handler_ptr> const& stack,
    route_options const& opt)
{
    layer_options lo;
    lo.name = opt.name;
    lo.sensitive = opt.sensitive.value_or(impl_->case_sensitive);
    lo.strict = opt.strict.value_or(impl_->strict);
    lo.end = opt.end;
    lo.ignore_captures = opt.ignore_captures;

    std::shared_ptr<layer> l;
    if(path.re)
        l = std::make_shared<layer>(
            *path.re, path.text, methods, stack, lo);
    else
        l = std::make_shared<layer>(
            path.text, methods, stack, lo);

    if(! opt.prefix.empty())
        l->set_prefix(opt.prefix);
    if(! impl_->prefix.empty())
        l->set_prefix(impl_->prefix);
    for(auto const& [name, ph] : impl_->params)
        l->param(name, ph);

    impl_->layers.push_back(l);
    return l;
}

void
router_base::
absorb(
    route_path::alternative const* path,
    router_base child)
{
    // copy the list, the child may be this router
    auto const layers = child.impl_->layers;
    for(auto const& cl : layers)
    {
        auto l = std::make_shared<layer>(*cl);
        if(path && ! path->re)
            l->set_prefix(path->text);
        if(! impl_->prefix.empty())
            l->set_prefix(impl_->prefix);
        for(auto const& [name, ph] : impl_->params)
            l->param(name, ph);
        impl_->layers.push_back(std::move(l));
    }

    if(child.impl_ == impl_)
        return;
    for(auto const& [name, ph] : impl_->params)
        child.param_impl(name, ph);

    WAYPOINT_LOG_DBG(router_log())(
        "mounted {} layers at {}", layers.size(),
        path ? std::string_view(path->text) : "/");
}

void
router_base::
set_prefix(std::string_view prefix)
{
    if(prefix.ends_with('/'))
        prefix.remove_suffix(1);
    impl_->prefix = prefix;
    for(auto const& l : impl_->layers)
        l->set_prefix(prefix);
}

void
router_base::
param_impl(
    std::string_view name,
    param_handler_ptr ph)
{
    if(! ph)
        detail::throw_invalid_argument(
            "param validator must be invocable");

    auto it = std::find_if(
        impl_->params.begin(), impl_->params.end(),
        [name](auto const& e)
        {
            return e.first == name;
        });
    if(it != impl_->params.end())
        it->second = ph;
    else
        impl_->params.emplace_back(name, ph);

    for(auto const& l : impl_->layers)
        l->param(name, ph);
}

void
router_base::
redirect_impl(
    std::string_view source,
    std::string_view destination,
    unsigned status)
{
    auto const resolve =
        [this](std::string_view s)
        {
            if( (! s.empty() && s.front() == '/') ||
                s.find("://") != std::string_view::npos)
                return std::string(s);
            auto rv = url(s);
            if(! rv)
                detail::throw_invalid_argument(
                    "no route found for name: " + std::string(s));
            return std::move(*rv);
        };

    auto const src = resolve(source);
    auto const dst = resolve(destination);

    std::vector<std::string> methods(
        standard_methods().begin(),
        standard_methods().end());
    add_layers(src, methods, {
        std::make_shared<redirect_handler>(dst, status) },
        route_options{});

    WAYPOINT_LOG_DBG(router_log())(
        "redirect {} -> {} ({})", src, dst, status);
}

} // detail
} // waypoint
