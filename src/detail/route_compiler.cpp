//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/route_compiler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace pathway {
namespace detail {

namespace {

struct compiler
{
    using entry = matcher_base::impl::entry;

    std::vector<entry>& entries;

    // RAII scope tracker sets the entry's skip when scope ends
    struct scope_tracker
    {
        std::vector<entry>& entries_;
        std::size_t idx_;

        scope_tracker(
            std::vector<entry>& e,
            std::size_t idx) noexcept
            : entries_(e)
            , idx_(idx)
        {
        }

        ~scope_tracker()
        {
            entries_[idx_].skip = entries_.size();
        }
    };

    void
    flatten(
        std::vector<std::unique_ptr<trie_node>> const& nodes,
        std::uint32_t level,
        bool fast_return)
    {
        // static first, then complex, then the simple field
        std::vector<trie_node const*> v;
        v.reserve(nodes.size());
        for(auto const& n : nodes)
            v.push_back(n.get());
        std::stable_sort(v.begin(), v.end(),
            [](trie_node const* a, trie_node const* b)
            {
                return a->seg.kind() < b->seg.kind();
            });

        // a field may take a segment a later
        // sibling would also have accepted
        if(fast_return && v.size() > 1)
            fast_return = std::none_of(
                v.begin(), v.end(),
                [](trie_node const* n)
                {
                    return n->seg.is_variable();
                });

        for(auto const* n : v)
        {
            std::size_t const idx = entries.size();
            entries.emplace_back(n->seg);
            auto& e = entries.back();
            e.payload = n->payload;
            e.level = level;
            e.fast_return = fast_return;
            // e.skip set by scope_tracker dtor

            scope_tracker scope(entries, idx);
            flatten(n->children, level + 1, fast_return);
        }
    }
};

} // (anon)

std::shared_ptr<matcher_base::impl const>
compile_trie(route_trie const& trie)
{
    auto p = std::make_shared<matcher_base::impl>();
    compiler c{ p->entries };
    c.flatten(trie.roots(), 0, true);
    p->routes = trie.size();
    SPDLOG_DEBUG("compiled {} routes into {} tests",
        p->routes, p->entries.size());
    return p;
}

} // detail
} // pathway
