//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/converter.hpp>
#include <pathway/error.hpp>
#include "src/detail/number.hpp"
#include "src/detail/template_rule.hpp"
#include <boost/url/grammar/ci_string.hpp>
#include <charconv>

namespace pathway {

system::result<std::vector<converter_arg const*>>
converter_args::
bind(std::initializer_list<
    std::string_view> params) const
{
    std::vector<converter_arg const*> v(
        params.size(), nullptr);
    std::size_t pos = 0;
    bool keywords = false;
    for(auto const& a : v_)
    {
        if(a.name.empty())
        {
            // positional after keyword
            if(keywords)
                PATHWAY_RETURN_EC(
                    error::converter_config);
            if(pos >= v.size())
                PATHWAY_RETURN_EC(
                    error::converter_config);
            v[pos++] = &a;
            continue;
        }
        keywords = true;
        std::size_t i = 0;
        for(auto p : params)
        {
            if(p == a.name)
                break;
            ++i;
        }
        if(i == v.size())
            PATHWAY_RETURN_EC(
                error::converter_config);
        if(v[i] != nullptr)
            PATHWAY_RETURN_EC(
                error::converter_config);
        v[i] = &a;
    }
    return v;
}

system::result<converter_args>
parse_converter_args(std::string_view s)
{
    std::vector<converter_arg> v;
    auto it = s.data();
    auto const end = it + s.size();
    detail::skip_ows(it, end);
    if(it == end)
        return converter_args();
    for(;;)
    {
        auto rv = grammar::parse(
            it, end, detail::arg_rule);
        if(rv.has_error())
            PATHWAY_RETURN_EC(
                error::converter_config);
        v.push_back(std::move(*rv));
        detail::skip_ows(it, end);
        if(it == end)
            break;
        if(*it != ',')
            PATHWAY_RETURN_EC(
                error::converter_config);
        ++it;
        detail::skip_ows(it, end);
    }
    return converter_args(std::move(v));
}

system::result<std::int64_t>
to_int(converter_arg const& a)
{
    if(a.quoted)
        PATHWAY_RETURN_EC(
            error::converter_config);
    auto const last = a.value.data() + a.value.size();
    auto const first = detail::skip_plus(a.value.data(), last);
    std::int64_t n = 0;
    auto [ptr, ec] = std::from_chars(first, last, n);
    if(ec != std::errc() || ptr != last)
        PATHWAY_RETURN_EC(
            error::converter_config);
    return n;
}

system::result<double>
to_double(converter_arg const& a)
{
    if(a.quoted)
        PATHWAY_RETURN_EC(
            error::converter_config);
    auto const last = a.value.data() + a.value.size();
    auto const first = detail::skip_plus(a.value.data(), last);
    double d = 0;
    auto [ptr, ec] = std::from_chars(first, last, d);
    if(ec != std::errc() || ptr != last)
        PATHWAY_RETURN_EC(
            error::converter_config);
    return d;
}

system::result<bool>
to_bool(converter_arg const& a)
{
    if(a.quoted)
        PATHWAY_RETURN_EC(
            error::converter_config);
    if(grammar::ci_is_equal(a.value, "true"))
        return true;
    if(grammar::ci_is_equal(a.value, "false"))
        return false;
    PATHWAY_RETURN_EC(
        error::converter_config);
}

} // pathway
