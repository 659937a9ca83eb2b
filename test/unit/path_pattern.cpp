//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <waypoint/path_pattern.hpp>

#include "test_suite.hpp"

#include <stdexcept>

namespace waypoint {

struct path_pattern_test
{
    static
    pattern_options
    opts(bool sensitive, bool strict, bool end)
    {
        pattern_options opt;
        opt.sensitive = sensitive;
        opt.strict = strict;
        opt.end = end;
        return opt;
    }

    void
    testParse()
    {
        {
            auto const t = parse_path("/users/:id");
            BOOST_TEST_EQ(t.size(), 2u);
            BOOST_TEST(! t[0].key);
            BOOST_TEST_EQ(t[0].text, "/users");
            BOOST_TEST(t[1].key.has_value());
            BOOST_TEST_EQ(t[1].text, "/:id");
            BOOST_TEST_EQ(t[1].key->name, "id");
            BOOST_TEST_EQ(t[1].key->prefix, "/");
            BOOST_TEST_EQ(t[1].key->pattern, "[^\\/]+?");
        }
        {
            auto const t = parse_path("/:a/(.*)/:b(\\d+)?");
            BOOST_TEST_EQ(t.size(), 3u);
            BOOST_TEST_EQ(t[0].key->name, "a");
            BOOST_TEST_EQ(t[1].key->name, "0");
            BOOST_TEST_EQ(t[1].key->pattern, ".*");
            BOOST_TEST_EQ(t[2].key->name, "b");
            BOOST_TEST_EQ(t[2].key->pattern, "\\d+");
            BOOST_TEST(t[2].key->optional);
            BOOST_TEST(! t[2].key->repeat);
        }
        {
            auto const t = parse_path("/files/*");
            BOOST_TEST_EQ(t.size(), 2u);
            BOOST_TEST(t[1].key->asterisk);
            BOOST_TEST_EQ(t[1].key->name, "0");
        }
        {
            // escaped characters are literal
            auto const t = parse_path("/a\\:b");
            BOOST_TEST_EQ(t.size(), 1u);
            BOOST_TEST_EQ(t[0].text, "/a:b");
        }
        {
            // a lone colon is literal
            auto const t = parse_path("/a/:");
            BOOST_TEST_EQ(t.size(), 1u);
            BOOST_TEST_EQ(t[0].text, "/a/:");
        }
    }

    void
    testMatch()
    {
        {
            path_pattern p("/users/:id");
            BOOST_TEST(p.match("/users/42"));
            BOOST_TEST(p.match("/users/42/"));
            BOOST_TEST(p.match("/USERS/42"));
            BOOST_TEST(! p.match("/users"));
            BOOST_TEST(! p.match("/users/42/x"));
            BOOST_TEST_EQ(p.keys().size(), 1u);
            BOOST_TEST_EQ(p.keys()[0].name, "id");
            BOOST_TEST_EQ(p.source(),
                "^\\/users\\/((?:[^\\/]+?))(?:\\/(?=$))?$");
        }
        {
            path_pattern p("/users/:id", opts(true, false, true));
            BOOST_TEST(p.match("/users/42"));
            BOOST_TEST(! p.match("/USERS/42"));
        }
        {
            path_pattern p("/users/", opts(false, true, true));
            BOOST_TEST(p.match("/users/"));
            BOOST_TEST(! p.match("/users"));
        }
        {
            path_pattern p("/api", opts(false, false, false));
            BOOST_TEST(p.match("/api"));
            BOOST_TEST(p.match("/api/"));
            BOOST_TEST(p.match("/api/users"));
            BOOST_TEST(! p.match("/apix"));
        }
        {
            path_pattern p("/article/:id(\\d+)");
            BOOST_TEST(p.match("/article/12"));
            BOOST_TEST(! p.match("/article/ab"));
        }
        {
            path_pattern p("/a\\:b");
            BOOST_TEST(p.match("/a:b"));
            BOOST_TEST(! p.match("/a/b"));
        }
    }

    void
    testCapture()
    {
        {
            path_pattern p("/users/:id");
            auto const c = p.capture("/users/42");
            BOOST_TEST_EQ(c.size(), 1u);
            BOOST_TEST(c[0] && *c[0] == "42");
            BOOST_TEST(p.capture("/nope").empty());
        }
        {
            path_pattern p("/users/:id?");
            BOOST_TEST(p.match("/users"));
            auto c = p.capture("/users");
            BOOST_TEST_EQ(c.size(), 1u);
            BOOST_TEST(! c[0]);
            c = p.capture("/users/5");
            BOOST_TEST(c[0] && *c[0] == "5");
        }
        {
            path_pattern p("/files/(.*)");
            auto const c = p.capture("/files/a/b");
            BOOST_TEST_EQ(p.keys()[0].name, "0");
            BOOST_TEST(c[0] && *c[0] == "a/b");
        }
        {
            path_pattern p("/files/*");
            auto const c = p.capture("/files/x/y.txt");
            BOOST_TEST(c[0] && *c[0] == "x/y.txt");
        }
        {
            path_pattern p("/:a.:b");
            auto const c = p.capture("/file.txt");
            BOOST_TEST_EQ(c.size(), 2u);
            BOOST_TEST(c[0] && *c[0] == "file");
            BOOST_TEST(c[1] && *c[1] == "txt");
        }
        {
            path_pattern p("/:path+");
            auto const c = p.capture("/a/b/c");
            BOOST_TEST(c[0] && *c[0] == "a/b/c");
            BOOST_TEST(! p.match("/"));
        }
        {
            path_pattern p(boost::regex("^/article/(\\d+)/(\\w+)$"));
            BOOST_TEST_EQ(p.keys().size(), 2u);
            BOOST_TEST_EQ(p.keys()[0].name, "0");
            BOOST_TEST_EQ(p.keys()[1].name, "1");
            BOOST_TEST(p.source().empty());
            auto const c = p.capture("/article/7/title");
            BOOST_TEST(c[0] && *c[0] == "7");
            BOOST_TEST(c[1] && *c[1] == "title");
        }
    }

    void
    testInvalid()
    {
        BOOST_TEST_THROWS(
            path_pattern("/:id([)"),
            std::invalid_argument);
    }

    void
    testRender()
    {
        BOOST_TEST_EQ(render_path(
            parse_path("/:category/:title"),
            { { "category", "programming" },
              { "title", "how to node" } }),
            "/programming/how%20to%20node");

        // missing required values keep the placeholder
        BOOST_TEST_EQ(render_path(
            parse_path("/users/:id"), {}),
            "/users/:id");

        // missing optional values are omitted
        BOOST_TEST_EQ(render_path(
            parse_path("/users/:id?"), {}),
            "/users");

        BOOST_TEST_EQ(render_path(
            parse_path("/x/:id"), { { "id", "a/b" } }),
            "/x/a%2Fb");

        BOOST_TEST_EQ(render_path(
            parse_path("/files/*"), { { "0", "a/b c" } }),
            "/files/a/b%20c");
    }

    void
    run()
    {
        testParse();
        testMatch();
        testCapture();
        testInvalid();
        testRender();
    }
};

TEST_SUITE(
    path_pattern_test,
    "waypoint.path_pattern");

} // waypoint
