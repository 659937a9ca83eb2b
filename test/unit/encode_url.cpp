//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <waypoint/encode_url.hpp>

#include "test_suite.hpp"

namespace waypoint {

struct encode_url_test
{
    void
    testEncodeUrl()
    {
        BOOST_TEST_EQ(
            encode_url("/path/to/file with spaces.txt"),
            "/path/to/file%20with%20spaces.txt");
        BOOST_TEST_EQ(
            encode_url("http://example.com/a?b=c#d"),
            "http://example.com/a?b=c#d");
        BOOST_TEST_EQ(encode_url("/a<b>"), "/a%3Cb%3E");

        // existing escapes are kept
        BOOST_TEST_EQ(encode_url("/a%20b"), "/a%20b");
        BOOST_TEST_EQ(encode_url("/100%"), "/100%25");
        BOOST_TEST_EQ(encode_url("/%zz"), "/%25zz");
    }

    void
    testEncodeComponent()
    {
        BOOST_TEST_EQ(encode_uri_component("a/b c"), "a%2Fb%20c");
        BOOST_TEST_EQ(encode_uri_component("(x)!~*'"), "(x)!~*'");
        BOOST_TEST_EQ(encode_uri_component("a=1&b"), "a%3D1%26b");
        BOOST_TEST_EQ(encode_uri_component("\xc3\xa9"), "%C3%A9");
    }

    void
    testEncodeQueryComponent()
    {
        BOOST_TEST_EQ(encode_query_component("a b&c"), "a+b%26c");
        BOOST_TEST_EQ(encode_query_component("/?:@"), "%2F%3F%3A%40");
        BOOST_TEST_EQ(encode_query_component("1+1"), "1%2B1");
    }

    void
    testEncodeWildcard()
    {
        BOOST_TEST_EQ(encode_wildcard("a/b?c#d"), "a/b%3Fc%23d");
        BOOST_TEST_EQ(encode_wildcard("x y/z"), "x%20y/z");
    }

    void
    run()
    {
        testEncodeUrl();
        testEncodeComponent();
        testEncodeQueryComponent();
        testEncodeWildcard();
    }
};

TEST_SUITE(
    encode_url_test,
    "waypoint.encode_url");

} // waypoint
