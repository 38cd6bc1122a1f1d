//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "test_helpers.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <string_view>

namespace {

// "pathway" selects "pathway.router" but not "pathwayx"
bool
selected(
    std::string_view name,
    std::string_view prefix) noexcept
{
    if(name.substr(0, prefix.size()) != prefix)
        return false;
    return prefix.empty() ||
        name.size() == prefix.size() ||
        name[prefix.size()] == '.';
}

} // (anon)

// Usage: pathway_tests [suite-name]
int
main(int argc, char** argv)
{
    spdlog::set_level(spdlog::level::off);

    std::string_view const prefix =
        argc > 1 ? argv[1] : "";
    std::size_t n = 0;
    for(auto const& s : pathway::test::suites())
    {
        if(! selected(s.name, prefix))
            continue;
        std::cout << s.name << std::endl;
        s.run();
        ++n;
    }
    if(n == 0)
    {
        std::cerr << "no suite matches '" << prefix << "'\n";
        return 1;
    }
    return boost::report_errors();
}
