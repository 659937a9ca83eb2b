//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_LAYER_HPP
#define WAYPOINT_LAYER_HPP

#include <waypoint/detail/config.hpp>
#include <waypoint/path_pattern.hpp>
#include <waypoint/route_options.hpp>
#include <waypoint/router_types.hpp>
#include <boost/regex.hpp>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace waypoint {

namespace detail {

// a range of strings which is not a parameter map
template<class Args>
concept positional_args =
    std::ranges::input_range<Args const> &&
    std::is_convertible_v<
        std::ranges::range_reference_t<Args const>,
        std::string_view> &&
    ! std::is_convertible_v<Args const&, param_map const&>;

} // detail

/** A registered route or middleware

    A layer pairs a compiled path pattern with the
    methods it answers and the handlers it runs.
    Layers with no methods are middleware, and are
    entered for every method when their path matches.

    When `GET` is among the methods, `HEAD` is added
    in front of it.

    @par Example
    @code
    layer l( "/users/:id", { "GET" }, { h } );
    assert( l.methods().size() == 2 );  // HEAD, GET
    auto params = l.params( "/users/42", l.captures( "/users/42" ) );
    assert( params["id"] == "42" );
    @endcode
*/
class layer
{
public:
    /** An element of the handler stack

        Entries created by @ref param carry the name
        of the parameter and the validator.
    */
    struct entry
    {
        handler_ptr h;
        std::string param;
        param_handler_ptr ph;
    };

    /** Constructor

        @throw std::invalid_argument A handler is null,
        or the path is not a valid template.
    */
    WAYPOINT_DECL
    layer(
        std::string_view path,
        std::vector<std::string> const& methods,
        std::vector<handler_ptr> const& stack,
        layer_options const& opt = {});

    /** Constructor

        @param re The expression to match.

        @param text The text reported by @ref path.

        @throw std::invalid_argument A handler is null.
    */
    WAYPOINT_DECL
    layer(
        boost::regex re,
        std::string_view text,
        std::vector<std::string> const& methods,
        std::vector<handler_ptr> const& stack,
        layer_options const& opt = {});

    /** Return the path template, including any prefix
    */
    std::string const&
    path() const noexcept
    {
        return path_;
    }

    /** Return the name of the layer, or the empty string
    */
    std::string const&
    name() const noexcept
    {
        return opt_.name;
    }

    /** Return the upper case methods the layer answers
    */
    std::vector<std::string> const&
    methods() const noexcept
    {
        return methods_;
    }

    std::vector<entry> const&
    stack() const noexcept
    {
        return stack_;
    }

    std::vector<path_key> const&
    keys() const noexcept
    {
        return pattern_.keys();
    }

    layer_options const&
    options() const noexcept
    {
        return opt_;
    }

    bool
    is_regex() const noexcept
    {
        return is_regex_;
    }

    /** Return true if the path matches
    */
    WAYPOINT_DECL
    bool
    match(std::string_view path) const;

    /** Return the captures for a matching path

        The result is empty if the layer ignores captures.
    */
    WAYPOINT_DECL
    capture_list
    captures(std::string_view path) const;

    /** Merge decoded captures into a parameter map

        Each capture which participated in the match is
        percent-decoded and stored under the name of its
        key, replacing any existing value. Values which
        fail to decode are stored as-is.

        @return A reference to `existing`.
    */
    WAYPOINT_DECL
    param_map&
    params(
        std::string_view path,
        capture_list const& captures,
        param_map& existing) const;

    /** Return decoded captures as a new parameter map
    */
    param_map
    params(
        std::string_view path,
        capture_list const& captures) const
    {
        param_map m;
        params(path, captures, m);
        return m;
    }

    /** Generate a URL from the path template

        Wildcard groups `(.*)` are removed from the
        template before substitution.

        @throw std::logic_error The layer matches a
        regular expression.
    */
    WAYPOINT_DECL
    std::string
    url(
        param_map const& params = {},
        url_options const& opt = {}) const;

    /** Generate a URL from positional values

        The values are assigned in order to the named
        parameters of the template.

        @par Example
        @code
        layer l( "/users/:id", { "GET" }, { h } );
        assert( l.url( std::vector< std::string >{ "123" } ) == "/users/123" );
        @endcode

        @throw std::logic_error The layer matches a
        regular expression.
    */
    template<class Args>
        requires detail::positional_args<Args>
    std::string
    url(
        Args const& args,
        url_options const& opt = {}) const
    {
        std::vector<std::string> v;
        for(auto const& s : args)
            v.emplace_back(std::string_view(s));
        return url_args(v, opt);
    }

    /** Add a parameter validator

        Nothing happens when the template has no key
        with this name, or when the validator was already
        added for the name. Validators run before the
        other handlers, in the order their parameters
        appear in the template.

        @return A reference to `*this`.
    */
    WAYPOINT_DECL
    layer&
    param(
        std::string_view name,
        param_handler_ptr ph);

    /** Prepend a prefix to the path template

        The pattern is recompiled. Nothing happens for an
        empty path, or for a layer matching a regular
        expression.

        @return A reference to `*this`.
    */
    WAYPOINT_DECL
    layer&
    set_prefix(std::string_view prefix);

private:
    WAYPOINT_DECL
    std::string
    url_args(
        std::vector<std::string> const& args,
        url_options const& opt) const;

    void init(
        std::vector<std::string> const&,
        std::vector<handler_ptr> const&);

    std::string path_;
    layer_options opt_;
    std::vector<std::string> methods_;
    std::vector<entry> stack_;
    path_pattern pattern_;
    bool is_regex_ = false;
};

//------------------------------------------------

/** Generate a URL from a path template

    This is the same as calling @ref layer::url on a
    layer constructed from the template.

    @par Example
    @code
    assert( url( "/:category/:title",
        { { "category", "programming" },
          { "title", "how to node" } } ) ==
        "/programming/how%20to%20node" );
    @endcode
*/
WAYPOINT_DECL
std::string
url(
    std::string_view path,
    param_map const& params,
    url_options const& opt = {});

} // waypoint

#endif
