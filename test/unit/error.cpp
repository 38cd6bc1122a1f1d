//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/error.hpp>

#include "test_helpers.hpp"
#include <memory>
#include <string>
#include <boost/system/errc.hpp>
#include <system_error>

namespace pathway {

struct error_test
{
    void
    check(
        char const* name,
        error ev)
    {
        auto const ec = make_error_code(ev);
        BOOST_TEST(std::string(ec.category().name()) == name);
        BOOST_TEST(! ec.message().empty());
        BOOST_TEST(
            std::addressof(ec.category()) ==
            std::addressof(make_error_code(ev).category()));
        BOOST_TEST(ec.category().equivalent(
            static_cast<int>(ev),
                ec.category().default_error_condition(
                    static_cast<int>(ev))));
        BOOST_TEST(ec.category().equivalent(ec,
            static_cast<int>(ev)));
    }

    void
    testCodes()
    {
        char const* const n = "pathway.route";
        check(n, error::template_syntax);
        check(n, error::route_conflict);
        check(n, error::unknown_converter);
        check(n, error::converter_config);
        check(n, error::duplicate_converter);
    }

    void
    testCondition()
    {
        system::error_condition const cond =
            condition::invalid_route;
        BOOST_TEST(std::string(cond.category().name()) ==
            "pathway.condition");

        system::error_code ec;
        ec = error::template_syntax;
        BOOST_TEST(ec == cond);
        ec = error::route_conflict;
        BOOST_TEST(ec == cond);
        ec = error::unknown_converter;
        BOOST_TEST(ec == cond);
        ec = error::converter_config;
        BOOST_TEST(ec == cond);

        // not a routing failure
        ec = error::duplicate_converter;
        BOOST_TEST(ec != cond);

        ec = system::errc::make_error_code(
            system::errc::invalid_argument);
        BOOST_TEST(ec != cond);
    }

    void
    testStd()
    {
        std::error_code ec = error::route_conflict;
        BOOST_TEST(ec.message() ==
            make_error_code(error::route_conflict).message());
    }

    void
    run()
    {
        testCodes();
        testCondition();
        testStd();
    }
};

TEST_SUITE(
    error_test,
    "pathway.error");

} // pathway
