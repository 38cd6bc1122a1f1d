//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_SRC_DETAIL_TEMPLATE_RULE_HPP
#define PATHWAY_SRC_DETAIL_TEMPLATE_RULE_HPP

#include <pathway/detail/config.hpp>
#include <pathway/converter.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/digit_chars.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/system/result.hpp>
#include <string_view>

namespace pathway {
namespace detail {

/*
field             = "{" field-name [ ":" conv-name [ conv-config ] ] "}"
conv-config       = "(" *cfg-char ")" / ":" *cfg-char
cfg-char          = %x20-7A / %x7C / %x7E
field-name        = ( ALPHA / "_" / "-" ) *( ALPHA / DIGIT / "_" / "-" )
conv-name         = 1*( ALPHA / DIGIT / "_" )

args              = [ arg *( OWS "," OWS arg ) ] OWS
arg               = [ arg-name OWS "=" OWS ] arg-value
arg-name          = ( ALPHA / "_" ) *( ALPHA / DIGIT / "_" )
arg-value         = quoted-value / bare-value
bare-value        = 1*( ALPHA / DIGIT / "_" / "." / "+" / "-" )
*/

//------------------------------------------------

struct field_name_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch >= '0' && ch <= '9') ||
            ch == '_' || ch == '-';
    }
};

struct ident_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch >= '0' && ch <= '9') ||
            ch == '_';
    }
};

struct bare_value_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            ident_char{}(ch) ||
            ch == '.' || ch == '+' || ch == '-';
    }
};

struct ows_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return ch == ' ' || ch == '\t';
    }
};

inline
void
skip_ows(
    char const*& it,
    char const* end) noexcept
{
    it = grammar::find_if_not(it, end, ows_char{});
}

//------------------------------------------------

constexpr struct
{
    using value_type = std::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end)
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        if(grammar::digit_chars(*it) ||
            ! field_name_char{}(*it))
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        auto it0 = it++;
        it = grammar::find_if_not(
            it, end, field_name_char{});
        return std::string_view(it0, it - it0);
    }
} field_name_rule{};

constexpr struct
{
    using value_type = std::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        auto it0 = it;
        it = grammar::find_if_not(
            it, end, ident_char{});
        if(it == it0)
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        return std::string_view(it0, it - it0);
    }
} converter_name_rule{};

//------------------------------------------------

/** A field reference inside a template segment
*/
struct field_ref
{
    std::string_view name;

    // empty for no converter
    std::string_view converter;

    // text of the converter arguments
    std::string_view config;
};

constexpr struct
{
    using value_type = field_ref;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end || *it != '{')
            PATHWAY_RETURN_EC(
                grammar::error::mismatch);
        ++it;
        value_type v;
        {
            auto rv = grammar::parse(
                it, end, field_name_rule);
            if(rv.has_error())
                return rv.error();
            v.name = rv.value();
        }
        if(it == end)
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        if(*it == '}')
        {
            ++it;
            return v;
        }
        if(*it != ':')
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        ++it;
        {
            auto rv = grammar::parse(
                it, end, converter_name_rule);
            if(rv.has_error())
                return rv.error();
            v.converter = rv.value();
        }
        if(it == end)
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        if(*it == '}')
        {
            ++it;
            return v;
        }
        if(*it != '(' && *it != ':')
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        bool const paren = *it++ == '(';
        auto it0 = it;
        while(it != end && *it != '}')
        {
            if(*it == '{')
                PATHWAY_RETURN_EC(
                    grammar::error::syntax);
            ++it;
        }
        if(it == end)
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        auto it1 = it++;
        if(paren)
        {
            if(it1 == it0 || it1[-1] != ')')
                PATHWAY_RETURN_EC(
                    grammar::error::syntax);
            --it1;
        }
        v.config = std::string_view(it0, it1 - it0);
        return v;
    }
} field_rule{};

//------------------------------------------------

constexpr struct
{
    using value_type = converter_arg;

    static
    auto
    parse_value(
        char const*& it,
        char const* end,
        converter_arg& a) ->
            system::result<void>
    {
        if(it == end)
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        if(*it == '"' || *it == '\'')
        {
            char const q = *it++;
            auto it0 = it;
            while(it != end && *it != q)
            {
                if(static_cast<unsigned char>(*it) < 0x20 ||
                    *it == 0x7f)
                    PATHWAY_RETURN_EC(
                        grammar::error::syntax);
                ++it;
            }
            if(it == end)
                PATHWAY_RETURN_EC(
                    grammar::error::syntax);
            a.value.assign(it0, it);
            a.quoted = true;
            ++it;
            return {};
        }
        auto it0 = it;
        it = grammar::find_if_not(
            it, end, bare_value_char{});
        if(it == it0)
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        a.value.assign(it0, it);
        a.quoted = false;
        return {};
    }

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        value_type a;
        {
            auto rv = parse_value(it, end, a);
            if(rv.has_error())
                return rv.error();
        }
        if(a.quoted)
            return a;

        // keyword?
        auto it0 = it;
        skip_ows(it, end);
        if(it == end || *it != '=')
        {
            it = it0;
            return a;
        }
        ++it;
        if( grammar::digit_chars(a.value.front()) ||
            grammar::find_if_not(
                a.value.data(),
                a.value.data() + a.value.size(),
                ident_char{}) !=
                    a.value.data() + a.value.size())
            PATHWAY_RETURN_EC(
                grammar::error::syntax);
        a.name = std::move(a.value);
        a.value.clear();
        skip_ows(it, end);
        {
            auto rv = parse_value(it, end, a);
            if(rv.has_error())
                return rv.error();
        }
        return a;
    }
} arg_rule{};

} // detail
} // pathway

#endif
