//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/encode_url.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>

namespace waypoint {

namespace {

// A-Z a-z 0-9 - _ . ! ~ * ' ( )
bool
is_component_safe( char c ) noexcept
{
    if( ( c >= 'A' && c <= 'Z' ) ||
        ( c >= 'a' && c <= 'z' ) ||
        ( c >= '0' && c <= '9' ) )
        return true;

    switch( c )
    {
    case '-':
    case '_':
    case '.':
    case '!':
    case '~':
    case '*':
    case '\'':
    case '(':
    case ')':
        return true;
    default:
        return false;
    }
}

// Check if character needs encoding
// Unreserved + reserved chars that are allowed in URLs
bool
is_safe( char c ) noexcept
{
    if( is_component_safe( c ) )
        return true;

    // Reserved chars allowed in URLs: # $ & + , / : ; = ? @
    switch( c )
    {
    case '#':
    case '$':
    case '&':
    case '+':
    case ',':
    case '/':
    case ':':
    case ';':
    case '=':
    case '?':
    case '@':
        return true;
    default:
        return false;
    }
}

bool
is_wildcard_safe( char c ) noexcept
{
    return c != '?' && c != '#' && is_safe( c );
}

constexpr char hex_chars[] = "0123456789ABCDEF";

void
append_escaped( std::string& result, unsigned char c )
{
    result.push_back( '%' );
    result.push_back( hex_chars[c >> 4] );
    result.push_back( hex_chars[c & 0x0F] );
}

template<class Pred>
std::string
encode_impl( std::string_view s, Pred pred )
{
    std::string result;
    result.reserve( s.size() );

    for( unsigned char c : s )
    {
        if( pred( static_cast<char>( c ) ) )
            result.push_back( static_cast<char>( c ) );
        else
            append_escaped( result, c );
    }

    return result;
}

} // (anon)

std::string
encode_url( std::string_view url )
{
    std::string result;
    result.reserve( url.size() );

    auto it = url.begin();
    auto const end = url.end();
    while( it != end )
    {
        // keep valid escapes
        if( *it == '%' &&
            end - it >= 3 &&
            grammar::hexdig_chars( it[1] ) &&
            grammar::hexdig_chars( it[2] ) )
        {
            result.append( it, it + 3 );
            it += 3;
            continue;
        }
        if( is_safe( *it ) )
            result.push_back( *it );
        else
            append_escaped( result,
                static_cast<unsigned char>( *it ) );
        ++it;
    }

    return result;
}

std::string
encode_uri_component( std::string_view s )
{
    return encode_impl( s, is_component_safe );
}

std::string
encode_query_component( std::string_view s )
{
    std::string result;
    result.reserve( s.size() );
    for( unsigned char c : s )
    {
        if( c == ' ' )
            result.push_back( '+' );
        else if( is_component_safe( static_cast<char>( c ) ) )
            result.push_back( static_cast<char>( c ) );
        else
            append_escaped( result, c );
    }
    return result;
}

std::string
encode_wildcard( std::string_view s )
{
    return encode_impl( s, is_wildcard_safe );
}

} // waypoint
