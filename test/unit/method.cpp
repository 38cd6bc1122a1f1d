//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/method.hpp>

#include "test_helpers.hpp"
#include <sstream>

namespace pathway {

struct method_test
{
    void
    check(http_method m, std::string_view s)
    {
        BOOST_TEST(string_to_method(s) == m);
        BOOST_TEST(to_string(m) == s);
    }

    void
    run()
    {
        check(http_method::delete_, "DELETE");
        check(http_method::get,     "GET");
        check(http_method::head,    "HEAD");
        check(http_method::post,    "POST");
        check(http_method::put,     "PUT");
        check(http_method::connect, "CONNECT");
        check(http_method::options, "OPTIONS");
        check(http_method::trace,   "TRACE");
        check(http_method::patch,   "PATCH");

        // case-sensitive
        BOOST_TEST(string_to_method("get") == http_method::unknown);
        BOOST_TEST(string_to_method("Post") == http_method::unknown);
        BOOST_TEST(string_to_method("") == http_method::unknown);
        BOOST_TEST(string_to_method("PURGE") == http_method::unknown);
        BOOST_TEST(to_string(http_method::unknown).empty());

        std::ostringstream os;
        os << http_method::patch;
        BOOST_TEST(os.str() == "PATCH");

        method_map<int> mm;
        mm[http_method::get] = 1;
        mm[http_method::post] = 2;
        BOOST_TEST(mm.at(http_method::get) == 1);
        BOOST_TEST(! mm.count(http_method::put));
    }
};

TEST_SUITE(
    method_test,
    "pathway.method");

} // pathway
