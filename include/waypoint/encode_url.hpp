//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_ENCODE_URL_HPP
#define WAYPOINT_ENCODE_URL_HPP

#include <waypoint/detail/config.hpp>
#include <string>
#include <string_view>

namespace waypoint {

/** Percent-encode a URL for safe use in HTTP responses.

    Encodes characters that are not safe in URLs using
    percent-encoding (e.g. space becomes %20). This is
    used for the `Location` header set by redirect routes.

    The following characters are NOT encoded:
    - Unreserved: A-Z a-z 0-9 - _ . ~
    - Reserved (allowed in URLs): ! # $ & ' ( ) * + , / : ; = ? @

    Valid percent-escapes already present are kept.

    @par Example
    @code
    std::string url = encode_url( "/path/to/file with spaces.txt" );
    // url == "/path/to/file%20with%20spaces.txt"
    @endcode

    @param url The URL or URL component to encode.

    @return A new string with unsafe characters percent-encoded.
*/
WAYPOINT_DECL
std::string
encode_url(std::string_view url);

/** Percent-encode a path parameter value.

    Only these characters are left as-is:
    - A-Z a-z 0-9 - _ . ! ~ * ' ( )

    @par Example
    @code
    assert( encode_uri_component( "a/b c" ) == "a%2Fb%20c" );
    @endcode
*/
WAYPOINT_DECL
std::string
encode_uri_component(std::string_view s);

/** Percent-encode a query string key or value.

    This behaves like @ref encode_uri_component,
    except that a space becomes `+`.

    @par Example
    @code
    assert( encode_query_component( "a b&c" ) == "a+b%26c" );
    @endcode
*/
WAYPOINT_DECL
std::string
encode_query_component(std::string_view s);

/** Percent-encode the value of a wildcard parameter.

    This behaves like @ref encode_url, except that `?`
    and `#` are also encoded so that the result stays
    within the path.
*/
WAYPOINT_DECL
std::string
encode_wildcard(std::string_view s);

} // waypoint

#endif
