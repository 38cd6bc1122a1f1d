//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/converter.hpp>

#include <pathway/error.hpp>
#include "test_helpers.hpp"

namespace pathway {

struct converter_test
{
    static
    converter_args
    parse(std::string_view s)
    {
        auto rv = parse_converter_args(s);
        BOOST_TEST(rv.has_value());
        if(rv.has_error())
            return {};
        return *rv;
    }

    void
    bad(std::string_view s)
    {
        auto rv = parse_converter_args(s);
        BOOST_TEST(rv.has_error());
        if(rv.has_error())
            BOOST_TEST(rv.error() == error::converter_config);
    }

    void
    testParse()
    {
        BOOST_TEST(parse("").empty());
        BOOST_TEST(parse("  ").empty());

        {
            auto a = parse("2, max=50");
            BOOST_TEST_EQ(a.size(), 2u);
            auto it = a.begin();
            BOOST_TEST(it->name.empty());
            BOOST_TEST_EQ(it->value, "2");
            BOOST_TEST(! it->quoted);
            ++it;
            BOOST_TEST_EQ(it->name, "max");
            BOOST_TEST_EQ(it->value, "50");
        }
        {
            auto a = parse(" min = -1 ,max=+1.5e3 ");
            BOOST_TEST_EQ(a.size(), 2u);
            BOOST_TEST_EQ(a.begin()->name, "min");
            BOOST_TEST_EQ(a.begin()->value, "-1");
            BOOST_TEST_EQ((a.begin() + 1)->value, "+1.5e3");
        }
        {
            auto a = parse("\"%Y-%m-%d\"");
            BOOST_TEST_EQ(a.size(), 1u);
            BOOST_TEST(a.begin()->name.empty());
            BOOST_TEST_EQ(a.begin()->value, "%Y-%m-%d");
            BOOST_TEST(a.begin()->quoted);
        }
        {
            auto a = parse("format_string='%H:%M'");
            BOOST_TEST_EQ(a.size(), 1u);
            BOOST_TEST_EQ(a.begin()->name, "format_string");
            BOOST_TEST_EQ(a.begin()->value, "%H:%M");
            BOOST_TEST(a.begin()->quoted);
        }
        {
            // the other quote is ordinary text
            auto a = parse("'say \"hi\"'");
            BOOST_TEST_EQ(a.begin()->value, "say \"hi\"");
        }

        bad("1,");
        bad(",1");
        bad("1,,2");
        bad("a b");
        bad("max=");
        bad("=1");
        bad("'abc");
        bad("1.5=2");
        bad("x=1=2");
        bad("(1)");
        bad("'a'b");
    }

    void
    testBind()
    {
        {
            auto a = parse("3, max=9");
            auto rv = a.bind({ "num_digits", "min", "max" });
            BOOST_TEST(rv.has_value());
            auto const& v = *rv;
            BOOST_TEST_EQ(v.size(), 3u);
            BOOST_TEST(v[0] && v[0]->value == "3");
            BOOST_TEST(v[1] == nullptr);
            BOOST_TEST(v[2] && v[2]->value == "9");
        }
        {
            auto a = parse("");
            auto rv = a.bind({ "a", "b" });
            BOOST_TEST(rv.has_value());
            BOOST_TEST(! (*rv)[0] && ! (*rv)[1]);
        }

        auto fails = [](std::string_view s)
        {
            auto a = parse(s);
            auto rv = a.bind({ "num_digits", "min", "max" });
            BOOST_TEST(rv.has_error());
            if(rv.has_error())
                BOOST_TEST(rv.error() == error::converter_config);
        };
        fails("1,2,3,4");
        fails("max=1, 2");
        fails("foo=1");
        fails("1, num_digits=2");
        fails("min=1,min=2");
    }

    void
    testValues()
    {
        auto arg = [](std::string v, bool quoted = false)
        {
            converter_arg a;
            a.value = std::move(v);
            a.quoted = quoted;
            return a;
        };

        BOOST_TEST_EQ(to_int(arg("5")).value(), 5);
        BOOST_TEST_EQ(to_int(arg("+5")).value(), 5);
        BOOST_TEST_EQ(to_int(arg("-5")).value(), -5);
        BOOST_TEST(to_int(arg("5x")).has_error());
        BOOST_TEST(to_int(arg("+-5")).has_error());
        BOOST_TEST(to_int(arg("1.5")).has_error());
        BOOST_TEST(to_int(arg("5", true)).has_error());

        BOOST_TEST_EQ(to_double(arg("1e3")).value(), 1000.0);
        BOOST_TEST_EQ(to_double(arg("-0.5")).value(), -0.5);
        BOOST_TEST_EQ(to_double(arg("+2")).value(), 2.0);
        BOOST_TEST(to_double(arg("x")).has_error());

        BOOST_TEST_EQ(to_bool(arg("true")).value(), true);
        BOOST_TEST_EQ(to_bool(arg("True")).value(), true);
        BOOST_TEST_EQ(to_bool(arg("FALSE")).value(), false);
        BOOST_TEST(to_bool(arg("yes")).has_error());
        BOOST_TEST(to_bool(arg("1")).has_error());
        BOOST_TEST(to_bool(arg("true", true)).has_error());
    }

    void
    run()
    {
        testParse();
        testBind();
        testValues();
    }
};

TEST_SUITE(
    converter_test,
    "pathway.converter");

} // pathway
