//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/router.hpp>
#include <waypoint/error.hpp>

#include "test_suite.hpp"

#include <boost/regex.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace waypoint {

struct url_test
{
    using params = route_params;

    static
    void
    ok(params& p)
    {
        p.status = 204;
    }

    void
    testFree()
    {
        BOOST_TEST_EQ(url("/:category", { { "category", "programming" } }),
            "/programming");
        BOOST_TEST_EQ(url("/:category/:title",
            { { "category", "programming" },
              { "title", "how to node" } }),
            "/programming/how%20to%20node");
        BOOST_TEST_EQ(url("/:category/:title",
            { { "category", "a/b" },
              { "title", "x?y#z&w" } }),
            "/a%2Fb/x%3Fy%23z%26w");

        url_options opt;
        opt.query_params = { { "page", "3" }, { "limit", "10" } };
        BOOST_TEST_EQ(url("/books/:category/:id",
            { { "category", "programming" }, { "id", "4" } }, opt),
            "/books/programming/4?page=3&limit=10");
        BOOST_TEST_EQ(url("/category", {}, opt),
            "/category?page=3&limit=10");
    }

    void
    testNamed()
    {
        router r;
        r.get(route_name("books"), "/:category/:title", ok);

        auto rv = r.url("books",
            { { "category", "programming" },
              { "title", "how to node" } });
        BOOST_TEST(rv.has_value());
        if(rv)
            BOOST_TEST_EQ(*rv, "/programming/how%20to%20node");

        rv = r.url("books",
            std::vector<std::string>{ "programming", "how to node" });
        BOOST_TEST(rv.has_value());
        if(rv)
            BOOST_TEST_EQ(*rv, "/programming/how%20to%20node");

        rv = r.url("not-exists",
            { { "category", "programming" } });
        BOOST_TEST(rv.has_error());
        BOOST_TEST(rv.error() == error::route_not_found);

        rv = r.url("not-exists",
            std::vector<std::string>{ "programming" });
        BOOST_TEST(rv.error() == error::route_not_found);
    }

    void
    testQuery()
    {
        router r;
        r.get(route_name("books"), "/books/:category/:id", ok);
        r.get(route_name("category"), "/category", ok);

        url_options qp;
        qp.query_params = { { "page", "3" }, { "limit", "10" } };
        auto rv = r.url("books",
            std::vector<std::string>{ "programming", "4" }, qp);
        BOOST_TEST_EQ(rv.value(), "/books/programming/4?page=3&limit=10");

        rv = r.url("books",
            { { "category", "programming" }, { "id", "4" } }, qp);
        BOOST_TEST_EQ(rv.value(), "/books/programming/4?page=3&limit=10");

        url_options qs;
        qs.query = "page=3&limit=10";
        rv = r.url("books",
            { { "category", "programming" }, { "id", "4" } }, qs);
        BOOST_TEST_EQ(rv.value(), "/books/programming/4?page=3&limit=10");

        rv = r.url("category", {}, qp);
        BOOST_TEST_EQ(rv.value(), "/category?page=3&limit=10");
    }

    void
    testEmbedded()
    {
        {
            router r(router_options().prefix("/books"));
            router embedded(router_options().prefix("/chapters"));
            embedded.get(route_name("chapters"),
                "/:chapterName/:pageNumber", ok);
            r.use(embedded.routes());

            auto rv = r.url("chapters",
                { { "chapterName", "Learning ECMA6" },
                  { "pageNumber", "123" } });
            BOOST_TEST_EQ(rv.value(),
                "/books/chapters/Learning%20ECMA6/123");

            rv = r.url("chapters",
                std::vector<std::string>{ "Learning ECMA6", "123" });
            BOOST_TEST_EQ(rv.value(),
                "/books/chapters/Learning%20ECMA6/123");
        }
        {
            router r(router_options().prefix("/books"));
            router embedded(router_options().prefix("/chapters"));
            router embedded2(router_options().prefix("/:chapterName/pages"));
            embedded2.get(route_name("chapters"), "/:pageNumber", ok);
            embedded.use(embedded2.routes());
            r.use(embedded.routes());

            auto const rv = r.url("chapters",
                { { "chapterName", "Learning ECMA6" },
                  { "pageNumber", "123" } });
            BOOST_TEST_EQ(rv.value(),
                "/books/chapters/Learning%20ECMA6/pages/123");
        }
    }

    void
    testRoute()
    {
        router r;
        r.get(route_name("user"), "/users/:id", ok);
        auto const l = r.route("user");
        BOOST_TEST(l != nullptr);
        if(l)
            BOOST_TEST_EQ(l->url({ { "id", "7" } }), "/users/7");
        BOOST_TEST(r.route("nobody") == nullptr);
        BOOST_TEST(r.route("") == nullptr);
    }

    void
    testPathFor()
    {
        router r;
        r.get(route_name("edit_post"), "/posts/:id/edit", ok);
        r.get(route_name("posts"), "/posts", ok);
        r.get(route_name("article"), boost::regex("^/a/(\\d+)$"), ok);

        BOOST_TEST_EQ(r.path_for("edit_post",
            { { "id", "1" }, { "name", "foo" }, { "page", "2" } }),
            "/posts/1/edit?name=foo&page=2");
        BOOST_TEST_EQ(r.path_for("posts",
            { { "name", "foo&1" }, { "page", "2" } }),
            "/posts?name=foo%261&page=2");

        // repeated keys
        BOOST_TEST_EQ(r.path_for("posts",
            { { "tag", "a" }, { "tag", "b c" } }),
            "/posts?tag=a&tag=b%20c");
        BOOST_TEST_EQ(r.path_for("edit_post",
            { { "id", "1" }, { "id", "2" } }),
            "/posts/1/edit");

        BOOST_TEST_EQ(r.path_for("edit_post",
            { { "id", "a/b" } }), "/posts/a%2Fb/edit");
        BOOST_TEST_EQ(r.path_for("edit_post"), "/posts/:id/edit");
        BOOST_TEST_EQ(r.path_for("posts"), "/posts");
        BOOST_TEST_EQ(r.path_for("nobody",
            { { "id", "1" } }), "");
        BOOST_TEST_THROWS(r.path_for("article"), std::logic_error);

        router api(router_options().prefix("/api"));
        api.get(route_name("user"), "/users/:id/:id2", ok);
        BOOST_TEST_EQ(api.path_for("user",
            { { "id2", "b" }, { "id", "a" } }),
            "/api/users/a/b");
    }

    void
    run()
    {
        testFree();
        testNamed();
        testQuery();
        testEmbedded();
        testRoute();
        testPathFor();
    }
};

TEST_SUITE(
    url_test,
    "waypoint.url");

} // waypoint
