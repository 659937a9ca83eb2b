//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_PATH_PATTERN_HPP
#define WAYPOINT_PATH_PATTERN_HPP

#include <waypoint/detail/config.hpp>
#include <boost/regex.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint {

/** A mapping of parameter names to values
*/
using param_map = std::map<
    std::string, std::string, std::less<>>;

/** The captured substrings of a match

    Each element corresponds positionally to a key
    of the pattern. Groups which did not participate
    in the match hold no value.
*/
using capture_list =
    std::vector<std::optional<std::string>>;

/** Options for compiling a path template
*/
struct pattern_options
{
    /// When `true`, literal text is matched case-sensitively
    bool sensitive = false;

    /// When `true`, a trailing slash is significant
    bool strict = false;

    /// When `true`, the pattern must match the entire path
    bool end = true;
};

/** A parameter declared in a path template

    Parameters are introduced with `:name`, or as
    unnamed groups such as `(.*)` which receive
    numeric names in order of appearance.
*/
struct path_key
{
    std::string name;
    std::string prefix;
    std::string delimiter;
    std::string pattern;
    bool optional = false;
    bool repeat = false;
    bool partial = false;
    bool asterisk = false;
};

/** A token of a parsed path template

    A token is either literal text, or a parameter.
    For parameters, @ref text holds the template
    text which declared it, including the prefix.
*/
struct path_token
{
    std::string text;
    std::optional<path_key> key;
};

/** Parse a path template into tokens

    @par Example
    @code
    auto tokens = parse_path( "/users/:id(\\d+)?" );
    assert( tokens.size() == 2 );
    assert( tokens[1].key->name == "id" );
    @endcode

    Parsing never fails; text which does not form a
    parameter is kept as a literal.
*/
WAYPOINT_DECL
std::vector<path_token>
parse_path(std::string_view s);

//------------------------------------------------

/** A compiled path pattern

    Objects of this type match request paths against
    a path template or a regular expression, and extract
    the substrings captured for each parameter.

    Templates follow these rules:

    @li `:name` declares a parameter matching one
        path segment.

    @li `:name(re)` declares a parameter with a
        custom regular expression.

    @li `(re)` declares an unnamed parameter.

    @li A trailing `?` makes the parameter optional,
        `*` makes it optional and repeatable, and `+`
        makes it repeatable.

    @li A standalone `*` matches anything.

    @li A backslash escapes the next character.

    @par Example
    @code
    path_pattern p( "/users/:id" );
    assert( p.match( "/users/42" ) );
    assert( *p.capture( "/users/42" )[0] == "42" );
    @endcode
*/
class path_pattern
{
public:
    /** Constructor

        @throw std::invalid_argument The template is
        malformed, or the resulting expression is invalid.
    */
    WAYPOINT_DECL
    explicit
    path_pattern(
        std::string_view s,
        pattern_options const& opt = {});

    /** Constructor

        The keys of the pattern are numbered after the
        marked sub-expressions of the regular expression.
    */
    WAYPOINT_DECL
    explicit
    path_pattern(boost::regex re);

    /** Return true if the pattern matches the path
    */
    WAYPOINT_DECL
    bool
    match(std::string_view path) const;

    /** Return the captures for a path

        @return The captured substrings, one per key,
        or an empty list if the path does not match.
    */
    WAYPOINT_DECL
    capture_list
    capture(std::string_view path) const;

    /** Return the keys of the pattern
    */
    std::vector<path_key> const&
    keys() const noexcept
    {
        return keys_;
    }

    /** Return the generated regular expression

        This is empty when the pattern was constructed
        from a regular expression.
    */
    std::string const&
    source() const noexcept
    {
        return source_;
    }

private:
    boost::regex re_;
    std::vector<path_key> keys_;
    std::string source_;
};

//------------------------------------------------

/** Render a path template with values

    Each parameter is replaced with its value, after
    applying percent-encoding. A missing optional
    parameter is omitted together with its prefix,
    while a missing required parameter is left as the
    template text which declared it.

    @par Example
    @code
    assert( render_path( parse_path( "/:category/:title" ),
        { { "category", "programming" },
          { "title", "how to node" } } ) ==
        "/programming/how%20to%20node" );
    @endcode
*/
WAYPOINT_DECL
std::string
render_path(
    std::vector<path_token> const& tokens,
    param_map const& values);

} // waypoint

#endif
