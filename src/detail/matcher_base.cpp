//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/detail/matcher_base.hpp>
#include "src/detail/matcher_impl.hpp"
#include <string_view>
#include <vector>

namespace pathway {
namespace detail {

namespace {

enum class step
{
    no_match,
    found,

    // no other branch can match
    abort
};

struct walker
{
    using entry = matcher_base::impl::entry;

    std::vector<entry> const& entries;
    std::string_view path;
    std::vector<std::string_view> const& segs;
    route_params& params;
    std::vector<std::string_view> caps;
    entry const* found = nullptr;

    // the rest of the path from segment `level`
    std::string_view
    tail(std::uint32_t level) const noexcept
    {
        auto const first = segs[level].data();
        return std::string_view(first,
            path.data() + path.size() - first);
    }

    bool
    bind(
        simple_field const& f,
        std::string_view s)
    {
        if(! f.conv)
        {
            params_access::emplace(
                params, f.name, std::string(s));
            return true;
        }
        auto v = f.conv->convert(s);
        if(! v)
            return false;
        params_access::emplace(
            params, f.name, std::move(*v));
        return true;
    }

    // test the segment of an entry, binding its fields
    bool
    test(entry const& e)
    {
        auto const s = segs[e.level];
        switch(e.seg.value().index())
        {
        case 0:
            return s == std::get<static_segment>(
                e.seg.value()).text;

        case 1:
        {
            auto const& f = std::get<simple_field>(
                e.seg.value());
            return bind(f, s);
        }

        default:
            break;
        }
        auto const& cf = std::get<complex_field>(
            e.seg.value());
        if(! cf.pattern.match(s, caps))
            return false;
        for(std::size_t i = 0; i < cf.fields.size(); ++i)
            if(! bind(cf.fields[i], caps[i]))
                return false;
        return true;
    }

    step
    walk(std::size_t i)
    {
        auto const& e = entries[i];
        auto const mark = params.size();

        if(e.seg.consumes_remaining())
        {
            auto const& f = std::get<simple_field>(
                e.seg.value());
            if(e.payload && bind(f, tail(e.level)))
            {
                found = &e;
                return step::found;
            }
            params_access::truncate(params, mark);
            return e.fast_return ?
                step::abort : step::no_match;
        }

        if(! test(e))
        {
            params_access::truncate(params, mark);
            return step::no_match;
        }

        if(segs.size() == e.level + 1)
        {
            if(e.payload)
            {
                found = &e;
                return step::found;
            }
        }
        else
        {
            auto const r = walk_children(i + 1, e.skip);
            if(r != step::no_match)
                return r;
        }

        params_access::truncate(params, mark);
        return e.fast_return ?
            step::abort : step::no_match;
    }

    // siblings occupy [first, last)
    step
    walk_children(
        std::size_t first,
        std::size_t last)
    {
        while(first < last)
        {
            auto const r = walk(first);
            if(r != step::no_match)
                return r;
            first = entries[first].skip;
        }
        return step::no_match;
    }
};

void
split(
    std::string_view path,
    std::vector<std::string_view>& segs)
{
    for(;;)
    {
        auto const n = path.find('/');
        segs.push_back(path.substr(0, n));
        if(n == std::string_view::npos)
            break;
        path.remove_prefix(n + 1);
    }
}

} // (anon)

//------------------------------------------------

std::size_t
matcher_base::
size() const noexcept
{
    if(! impl_)
        return 0;
    return impl_->routes;
}

std::shared_ptr<route_payload const>
matcher_base::
find_impl(
    std::string_view path,
    route_params& params) const
{
    params_access::clear(params);
    if(! impl_ || impl_->entries.empty())
        return nullptr;

    // leading slashes are not significant
    auto const n = path.find_first_not_of('/');
    if(n == std::string_view::npos)
        path = path.substr(path.size());
    else
        path.remove_prefix(n);

    std::vector<std::string_view> segs;
    segs.reserve(8);
    split(path, segs);

    walker w{ impl_->entries, path, segs, params, {} };
    if(w.walk_children(0, impl_->entries.size()) != step::found)
    {
        params_access::clear(params);
        return nullptr;
    }
    return w.found->payload;
}

std::string
matcher_base::
dump() const
{
    std::string s;
    if(! impl_)
        return s;
    for(auto const& e : impl_->entries)
    {
        s.append(2 * e.level, ' ');
        s.append("path[");
        s.append(std::to_string(e.level));
        if(e.seg.consumes_remaining())
            s.append(":");
        s.append("]");
        if(e.seg.is_variable())
        {
            s.append(" ~ ");
            s.append(e.seg.raw());
        }
        else
        {
            s.append(" == \"");
            s.append(e.seg.raw());
            s.append("\"");
        }
        if(e.payload)
        {
            s.append(" => ");
            s.append(e.payload->uri_template);
        }
        if(e.fast_return)
            s.append(" (fast-return)");
        s.push_back('\n');
    }
    return s;
}

} // detail
} // pathway
