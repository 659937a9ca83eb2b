//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef WAYPOINT_TEST_SUITE_HPP
#define WAYPOINT_TEST_SUITE_HPP

#include <boost/core/lightweight_test.hpp>
#include <vector>

namespace test_suite {

struct suite
{
    char const* name;
    void(*run)();
};

inline
std::vector<suite>&
suites()
{
    static std::vector<suite> v;
    return v;
}

struct registrar
{
    registrar(char const* name, void(*run)())
    {
        suites().push_back({ name, run });
    }
};

} // test_suite

// Registers a type with a member `void run()`
#define TEST_SUITE(type, name) \
    static ::test_suite::registrar const type##_registrar_( \
        name, []{ type().run(); })

#endif
