//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <waypoint/method.hpp>

#include "test_suite.hpp"

#include <algorithm>

namespace waypoint {

struct method_test
{
    void
    testToString()
    {
        BOOST_TEST_EQ(to_string(method::get), "GET");
        BOOST_TEST_EQ(to_string(method::delete_), "DELETE");
        BOOST_TEST_EQ(to_string(method::msearch), "M-SEARCH");
        BOOST_TEST_EQ(to_string(method::unsubscribe), "UNSUBSCRIBE");
        BOOST_TEST(to_string(method::unknown).empty());
    }

    void
    testStringToMethod()
    {
        BOOST_TEST(string_to_method("GET") == method::get);
        BOOST_TEST(string_to_method("ACL") == method::acl);
        BOOST_TEST(string_to_method("M-SEARCH") == method::msearch);
        BOOST_TEST(string_to_method("UNSUBSCRIBE") == method::unsubscribe);
        BOOST_TEST(string_to_method("get") == method::unknown);
        BOOST_TEST(string_to_method("") == method::unknown);
        BOOST_TEST(string_to_method("BREW") == method::unknown);

        // every token maps back to itself
        for(auto s : standard_methods())
            BOOST_TEST_EQ(to_string(string_to_method(s)), s);
    }

    void
    testStandardMethods()
    {
        auto const v = standard_methods();
        BOOST_TEST_EQ(v.size(), 34u);
        BOOST_TEST_EQ(v.front(), "ACL");
        BOOST_TEST_EQ(v.back(), "UNSUBSCRIBE");
        BOOST_TEST(std::is_sorted(v.begin(), v.end()));
    }

    void
    testToUpper()
    {
        BOOST_TEST_EQ(to_upper_method("patch"), "PATCH");
        BOOST_TEST_EQ(to_upper_method("m-search"), "M-SEARCH");
        BOOST_TEST_EQ(to_upper_method("GET"), "GET");
    }

    void
    run()
    {
        testToString();
        testStringToMethod();
        testStandardMethods();
        testToUpper();
    }
};

TEST_SUITE(
    method_test,
    "waypoint.method");

} // waypoint
