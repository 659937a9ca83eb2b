//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <waypoint/router.hpp>
#include <waypoint/compose.hpp>
#include <waypoint/error.hpp>

#include "test_suite.hpp"

#include <boost/system/errc.hpp>

namespace waypoint {

struct allowed_methods_test
{
    using params = route_params;

    static
    void
    ok(params& p)
    {
        p.status = 200;
    }

    static
    router
    make_router(router_options const& opt = {})
    {
        router r(opt);
        r.get("/users", ok);
        r.put("/users", ok);
        return r;
    }

    static
    route_result
    request(
        composed<params> const& app,
        params& p,
        std::string_view method,
        std::string_view path)
    {
        p.method = method;
        p.path = path;
        return app(p);
    }

    void
    testOptions()
    {
        auto r = make_router();
        auto const app = compose<params>(
            r.routes(), r.allowed_methods());
        params p;
        p.body = "stale";
        auto const rv = request(app, p, "OPTIONS", "/users");
        BOOST_TEST(! rv.failed());
        BOOST_TEST_EQ(p.status, 200u);
        BOOST_TEST(p.body.empty());
        BOOST_TEST_EQ(p.header("Allow"), "HEAD, GET, PUT");
    }

    void
    testMethodNotAllowed()
    {
        auto r = make_router();
        {
            auto const app = compose<params>(
                r.routes(), r.allowed_methods());
            params p;
            auto const rv = request(app, p, "POST", "/users");
            BOOST_TEST(! rv.failed());
            BOOST_TEST_EQ(p.status, 405u);
            BOOST_TEST_EQ(p.header("Allow"), "HEAD, GET, PUT");
            BOOST_TEST_EQ(p.headers.size(), 1u);
        }
        {
            auto const app = compose<params>(
                r.routes(), r.allowed_methods(
                    allowed_methods_options().throw_error(true)));
            params p;
            auto const rv = request(app, p, "POST", "/users");
            BOOST_TEST(rv == error::method_not_allowed);
            BOOST_TEST_EQ(p.status, 0u);
            BOOST_TEST(! p.has_header("Allow"));
        }
        {
            auto const ec = make_error_code(
                boost::system::errc::operation_not_permitted);
            auto const app = compose<params>(
                r.routes(), r.allowed_methods(
                    allowed_methods_options()
                        .throw_error(true)
                        .method_not_allowed(
                            [ec]
                            {
                                return ec;
                            })));
            params p;
            auto const rv = request(app, p, "POST", "/users");
            BOOST_TEST(rv == ec);
            BOOST_TEST(! p.has_header("Allow"));
        }
    }

    void
    testNotImplemented()
    {
        auto r = make_router();
        {
            auto const app = compose<params>(
                r.routes(), r.allowed_methods());
            params p;
            auto const rv = request(app, p, "SEARCH", "/users");
            BOOST_TEST(! rv.failed());
            BOOST_TEST_EQ(p.status, 501u);
            BOOST_TEST_EQ(p.header("Allow"), "HEAD, GET, PUT");
        }
        {
            auto const app = compose<params>(
                r.routes(), r.allowed_methods(
                    allowed_methods_options().throw_error(true)));
            params p;
            auto const rv = request(app, p, "SEARCH", "/users");
            BOOST_TEST(rv == error::not_implemented);
            BOOST_TEST_EQ(p.status, 0u);
            BOOST_TEST(! p.has_header("Allow"));
        }
        {
            auto const ec = make_error_code(
                boost::system::errc::function_not_supported);
            auto const app = compose<params>(
                r.routes(), r.allowed_methods(
                    allowed_methods_options()
                        .throw_error(true)
                        .not_implemented(
                            [ec]
                            {
                                return ec;
                            })));
            params p;
            auto const rv = request(app, p, "SEARCH", "/users");
            BOOST_TEST(rv == ec);
        }
        {
            // the header is set even when nothing matched
            auto const app = compose<params>(
                r.routes(), r.allowed_methods());
            params p;
            request(app, p, "SEARCH", "/nothing");
            BOOST_TEST_EQ(p.status, 501u);
            BOOST_TEST(p.has_header("Allow"));
            BOOST_TEST(p.header("Allow").empty());
        }
    }

    void
    testStatusAlreadySet()
    {
        auto r = make_router();
        {
            auto const app = compose<params>(
                [](params& p, next_fn next)
                {
                    p.status = 200;
                    return next();
                },
                r.routes(), r.allowed_methods());
            params p;
            request(app, p, "POST", "/users");
            BOOST_TEST_EQ(p.status, 200u);
            BOOST_TEST(! p.has_header("Allow"));
        }
        {
            // 404 counts as unset
            auto const app = compose<params>(
                [](params& p, next_fn next)
                {
                    p.status = 404;
                    return next();
                },
                r.routes(), r.allowed_methods());
            params p;
            request(app, p, "POST", "/users");
            BOOST_TEST_EQ(p.status, 405u);
        }
        {
            // a matched route leaving 404 is not turned into 405
            router r2;
            r2.get("/users",
                [](params& p)
                {
                    p.status = 404;
                });
            auto const app = compose<params>(
                r2.routes(), r2.allowed_methods());
            params p;
            request(app, p, "GET", "/users");
            BOOST_TEST_EQ(p.status, 404u);
            BOOST_TEST(! p.has_header("Allow"));
        }
    }

    void
    testNoMatch()
    {
        auto r = make_router();
        auto const app = compose<params>(
            r.routes(), r.allowed_methods());
        params p;
        auto const rv = request(app, p, "GET", "/nothing");
        BOOST_TEST(! rv.failed());
        BOOST_TEST_EQ(p.status, 0u);
        BOOST_TEST(! p.has_header("Allow"));

        params p2;
        request(app, p2, "OPTIONS", "/nothing");
        BOOST_TEST_EQ(p2.status, 0u);
        BOOST_TEST(! p2.has_header("Allow"));
    }

    void
    testCustomMethods()
    {
        auto r = make_router(
            router_options().methods({ "get", "put" }));
        BOOST_TEST_EQ(r.methods().size(), 2u);
        BOOST_TEST_EQ(r.methods()[0], "GET");

        auto const app = compose<params>(
            r.routes(), r.allowed_methods());
        {
            params p;
            request(app, p, "OPTIONS", "/users");
            BOOST_TEST_EQ(p.status, 501u);
        }
        {
            params p;
            request(app, p, "HEAD", "/users");
            BOOST_TEST_EQ(p.status, 200u);
        }

        auto const d = make_router();
        BOOST_TEST_EQ(d.methods().size(), 7u);
    }

    void
    run()
    {
        testOptions();
        testMethodNotAllowed();
        testNotImplemented();
        testStatusAlreadySet();
        testNoMatch();
        testCustomMethods();
    }
};

TEST_SUITE(
    allowed_methods_test,
    "waypoint.allowed_methods");

} // waypoint
