//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathway/converter_registry.hpp>

#include <pathway/error.hpp>
#include "test_helpers.hpp"
#include <cctype>

namespace pathway {

struct converter_registry_test
{
    // accepts lower-case words, binding them upper-cased
    struct upper_converter : converter
    {
        std::optional<field_value>
        convert(std::string_view s) const override
        {
            std::string v;
            for(char c : s)
            {
                if(c < 'a' || c > 'z')
                    return std::nullopt;
                v.push_back(static_cast<char>(
                    std::toupper(static_cast<unsigned char>(c))));
            }
            if(v.empty())
                return std::nullopt;
            return field_value(std::move(v));
        }
    };

    static
    system::result<std::unique_ptr<converter>>
    make_upper(converter_args const& args)
    {
        if(! args.empty())
            return system::error_code(
                error::converter_config);
        return std::make_unique<upper_converter>();
    }

    void
    testBuiltins()
    {
        converter_registry reg;
        BOOST_TEST(reg.contains("int"));
        BOOST_TEST(reg.contains("float"));
        BOOST_TEST(reg.contains("dt"));
        BOOST_TEST(reg.contains("uuid"));
        BOOST_TEST(reg.contains("path"));
        BOOST_TEST(! reg.contains("upper"));
        BOOST_TEST(! reg.contains("Int"));

        converter_registry empty(false);
        BOOST_TEST(! empty.contains("int"));
        BOOST_TEST(empty.resolve("int", "").error() ==
            error::unknown_converter);
    }

    void
    testAdd()
    {
        converter_registry reg;
        reg.add("upper", &make_upper);
        BOOST_TEST(reg.contains("upper"));

        auto rv = reg.resolve("upper", "");
        BOOST_TEST(rv.has_value());
        if(rv.has_value())
        {
            auto v = (*rv)->convert("abc");
            BOOST_TEST(v.has_value());
            if(v)
                BOOST_TEST(*v == field_value(std::string("ABC")));
            BOOST_TEST(! (*rv)->convert("Abc"));
        }

        // factory rejects arguments
        BOOST_TEST(reg.resolve("upper", "1").error() ==
            error::converter_config);

        // malformed arguments never reach the factory
        BOOST_TEST(reg.resolve("upper", "1,").error() ==
            error::converter_config);

        try
        {
            reg.add("upper", &make_upper);
            BOOST_TEST(false);
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::duplicate_converter);
        }

        // built-ins cannot be replaced
        BOOST_TEST_THROWS(
            reg.add("int", &make_upper),
            system::system_error);

        BOOST_TEST_THROWS(
            reg.add("nothing", converter_factory()),
            std::invalid_argument);

        // names a template could not refer to
        BOOST_TEST_THROWS(
            reg.add("", &make_upper),
            std::invalid_argument);
        BOOST_TEST_THROWS(
            reg.add("my-conv", &make_upper),
            std::invalid_argument);
        BOOST_TEST_THROWS(
            reg.add("up(1)", &make_upper),
            std::invalid_argument);
        BOOST_TEST(! reg.contains("my-conv"));

        reg.add("upper_2", &make_upper);
        BOOST_TEST(reg.contains("upper_2"));
    }

    void
    testFactoryResult()
    {
        converter_registry reg(false);
        reg.add("null",
            [](converter_args const&) ->
                system::result<std::unique_ptr<converter>>
            {
                return std::unique_ptr<converter>();
            });
        reg.add("fails",
            [](converter_args const&) ->
                system::result<std::unique_ptr<converter>>
            {
                return system::error_code(
                    error::unknown_converter);
            });
        BOOST_TEST(reg.resolve("null", "").error() ==
            error::converter_config);
        BOOST_TEST(reg.resolve("fails", "").error() ==
            error::converter_config);
        BOOST_TEST(reg.resolve("missing", "").error() ==
            error::unknown_converter);
    }

    void
    run()
    {
        testBuiltins();
        testAdd();
        testFactoryResult();
    }
};

TEST_SUITE(
    converter_registry_test,
    "pathway.converter_registry");

} // pathway
