//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_SRC_DETAIL_MATCHER_IMPL_HPP
#define PATHWAY_SRC_DETAIL_MATCHER_IMPL_HPP

#include <pathway/detail/matcher_base.hpp>
#include <pathway/route_segment.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace pathway {
namespace detail {

// grants the matcher write access to route_params
struct params_access
{
    static
    void
    emplace(
        route_params& p,
        std::string_view name,
        field_value v)
    {
        p.emplace(name, std::move(v));
    }

    static
    void
    truncate(
        route_params& p,
        std::size_t n) noexcept
    {
        p.truncate(n);
    }

    static
    void
    clear(route_params& p) noexcept
    {
        p.clear();
    }
};

/*  The compiled program.

    Entries are trie nodes in pre-order, siblings sorted
    by segment kind. The children of entry i start at
    i + 1, and each sibling is found at the skip index
    of the one before it, until entries[i].skip.
*/
struct matcher_base::impl
{
    struct entry
    {
        route_segment seg;
        std::shared_ptr<route_payload const> payload;

        // index one past this subtree
        std::size_t skip = 0;

        // index of the path segment tested
        std::uint32_t level = 0;

        // no sibling can match once this one has
        bool fast_return = true;

        explicit
        entry(route_segment s) noexcept
            : seg(std::move(s))
        {
        }
    };

    std::vector<entry> entries;
    std::size_t routes = 0;
};

} // detail
} // pathway

#endif
