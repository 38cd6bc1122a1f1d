//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/route_trie.hpp"
#include <pathway/error.hpp>
#include <pathway/detail/except.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace pathway {
namespace detail {

bool
route_trie::
insert(
    parsed_template&& t,
    std::shared_ptr<route_payload const> p)
{
    auto* nodes = &roots_;
    trie_node* node = nullptr;
    for(auto& seg : t.segments)
    {
        trie_node* next = nullptr;
        for(auto const& child : *nodes)
        {
            if(child->seg.raw() == seg.raw())
            {
                next = child.get();
                break;
            }
        }
        if(! next)
        {
            for(auto const& child : *nodes)
            {
                if(! child->seg.conflicts_with(seg))
                    continue;
                SPDLOG_WARN(
                    "route '{}' conflicts: segment '{}' is ambiguous with '{}'",
                    t.canonical, seg.raw(), child->seg.raw());
                std::string what = "'";
                what.append(t.canonical);
                what.append("': segment '");
                what.append(seg.raw());
                what.append("' is ambiguous with '");
                what.append(child->seg.raw());
                what.push_back('\'');
                throw_system_error(
                    PATHWAY_ERR(error::route_conflict),
                    what);
            }
            nodes->push_back(
                std::make_unique<trie_node>(
                    std::move(seg)));
            next = nodes->back().get();
        }
        node = next;
        nodes = &node->children;
    }

    bool const replaced = node->payload != nullptr;
    node->payload = std::move(p);
    if(! replaced)
        ++size_;
    return replaced;
}

} // detail
} // pathway
