//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/route_segment.hpp>
#include <pathway/error.hpp>
#include <pathway/detail/except.hpp>
#include "src/detail/template_rule.hpp"
#include <algorithm>

namespace pathway {

namespace {

bool
is_space(char c) noexcept
{
    return
        c == ' ' || c == '\t' || c == '\n' ||
        c == '\r' || c == '\f' || c == '\v';
}

} // (anon)

//------------------------------------------------

segment_pattern::
segment_pattern(
    std::vector<std::string> literals)
    : lit_(std::move(literals))
{
    if(lit_.empty())
        detail::throw_invalid_argument(
            "segment_pattern needs a literal span");
}

bool
segment_pattern::
match_from(
    std::string_view s,
    std::size_t i,
    std::size_t pos,
    std::string_view* caps) const
{
    // end of the last capture
    auto const tail = s.size() - lit_.back().size();
    if(i + 1 == captures())
    {
        if(tail <= pos)
            return false;
        caps[i] = s.substr(pos, tail - pos);
        return true;
    }

    // capture i ends where the next literal begins,
    // tried from the rightmost position leftwards
    auto const& lit = lit_[i + 1];
    if(tail < lit.size())
        return false;
    auto q = tail - lit.size();
    for(;;)
    {
        q = s.rfind(lit, q);
        if(q == std::string_view::npos || q <= pos)
            return false;
        if(match_from(s, i + 1, q + lit.size(), caps))
        {
            caps[i] = s.substr(pos, q - pos);
            return true;
        }
        --q;
    }
}

bool
segment_pattern::
match(
    std::string_view s,
    std::vector<std::string_view>& caps) const
{
    auto const& prefix = lit_.front();
    auto const& suffix = lit_.back();
    if(s.size() < prefix.size() +
            suffix.size() + captures())
        return false;
    if(s.substr(0, prefix.size()) != prefix)
        return false;
    if(s.substr(s.size() - suffix.size()) != suffix)
        return false;
    caps.resize(captures());
    if(captures() == 0)
        return s.size() == prefix.size();
    return match_from(
        s, 0, prefix.size(), caps.data());
}

//------------------------------------------------

segment_kind
route_segment::
kind() const noexcept
{
    switch(v_.index())
    {
    case 0: return segment_kind::literal;
    case 1: return segment_kind::simple;
    default:
        break;
    }
    return segment_kind::complex;
}

bool
route_segment::
consumes_remaining() const noexcept
{
    auto const* f = std::get_if<simple_field>(&v_);
    return
        f != nullptr &&
        f->conv != nullptr &&
        f->conv->consumes_remaining_segments();
}

bool
route_segment::
conflicts_with(
    route_segment const& other) const
{
    if(raw_ == other.raw_)
        return false;
    auto const k = kind();
    if(k != other.kind())
        return false;
    switch(k)
    {
    case segment_kind::simple:
        return true;
    case segment_kind::complex:
        // literals never contain braces
        return skeleton() == other.skeleton();
    default:
        break;
    }
    return false;
}

std::string
route_segment::
skeleton() const
{
    switch(kind())
    {
    case segment_kind::literal:
        return raw_;
    case segment_kind::simple:
        return "{}";
    default:
        break;
    }
    auto const& p = std::get<complex_field>(v_).pattern;
    std::string s = p.literal(0);
    for(std::size_t i = 1; i <= p.captures(); ++i)
    {
        s.append("{}");
        s.append(p.literal(i));
    }
    return s;
}

//------------------------------------------------

system::result<route_segment>
classify(
    std::string_view raw,
    converter_registry const& reg)
{
    std::vector<std::string> lits;
    std::vector<simple_field> fields;
    std::string lit;
    auto it = raw.data();
    auto const end = it + raw.size();
    while(it != end)
    {
        if(*it == '/' || *it == '}' || is_space(*it))
            PATHWAY_RETURN_EC(
                error::template_syntax);
        if(*it != '{')
        {
            lit.push_back(*it++);
            continue;
        }
        auto rv = grammar::parse(
            it, end, detail::field_rule);
        if(rv.has_error())
            PATHWAY_RETURN_EC(
                error::template_syntax);
        simple_field f;
        f.name = rv->name;
        if(! rv->converter.empty())
        {
            auto c = reg.resolve(
                rv->converter, rv->config);
            if(c.has_error())
                return c.error();
            f.conv = std::move(*c);
        }
        lits.push_back(std::move(lit));
        lit.clear();
        fields.push_back(std::move(f));
    }
    lits.push_back(std::move(lit));

    if(fields.empty())
        return route_segment(
            std::string(raw),
            static_segment{ std::string(raw) });

    if( fields.size() == 1 &&
        lits[0].empty() &&
        lits[1].empty())
        return route_segment(
            std::string(raw),
            std::move(fields[0]));

    // the rest of the path cannot share a segment
    for(auto const& f : fields)
        if(f.conv && f.conv->consumes_remaining_segments())
            PATHWAY_RETURN_EC(
                error::template_syntax);

    return route_segment(
        std::string(raw),
        complex_field{
            segment_pattern(std::move(lits)),
            std::move(fields) });
}

system::result<parsed_template>
parse_template(
    std::string_view s,
    converter_registry const& reg)
{
    if(s.empty() || s.front() != '/')
        PATHWAY_RETURN_EC(
            error::template_syntax);
    if(std::any_of(s.begin(), s.end(), &is_space))
        PATHWAY_RETURN_EC(
            error::template_syntax);
    if(s.find("//") != std::string_view::npos)
        PATHWAY_RETURN_EC(
            error::template_syntax);
    if(s.size() > 1 && s.back() == '/')
        s.remove_suffix(1);

    parsed_template t;
    t.canonical = std::string(s);
    if(s == "/")
    {
        // the root is one empty segment
        t.segments.emplace_back(
            std::string(), static_segment{});
        return t;
    }

    s.remove_prefix(1);
    for(;;)
    {
        auto const n = s.find('/');
        auto rv = classify(s.substr(0, n), reg);
        if(rv.has_error())
            return rv.error();
        t.segments.push_back(std::move(*rv));
        if(n == std::string_view::npos)
            break;
        s.remove_prefix(n + 1);
    }

    std::vector<std::string_view> names;
    for(std::size_t i = 0; i < t.segments.size(); ++i)
    {
        auto const& seg = t.segments[i];
        if( seg.consumes_remaining() &&
            i + 1 != t.segments.size())
            PATHWAY_RETURN_EC(
                error::template_syntax);
        if(auto f = std::get_if<simple_field>(&seg.value()))
        {
            names.push_back(f->name);
            continue;
        }
        if(auto f = std::get_if<complex_field>(&seg.value()))
            for(auto const& e : f->fields)
                names.push_back(e.name);
    }
    std::sort(names.begin(), names.end());
    if(std::adjacent_find(
            names.begin(), names.end()) != names.end())
        PATHWAY_RETURN_EC(
            error::template_syntax);
    return t;
}

} // pathway
