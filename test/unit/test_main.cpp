//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "test_suite.hpp"
#include <iostream>

int
main()
{
    for(auto const& s : test_suite::suites())
    {
        std::cout << s.name << std::endl;
        s.run();
    }
    return boost::report_errors();
}
