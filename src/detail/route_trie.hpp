//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_SRC_DETAIL_ROUTE_TRIE_HPP
#define PATHWAY_SRC_DETAIL_ROUTE_TRIE_HPP

#include <pathway/detail/config.hpp>
#include <pathway/detail/matcher_base.hpp>
#include <pathway/route_segment.hpp>
#include <memory>
#include <vector>

namespace pathway {
namespace detail {

struct trie_node
{
    route_segment seg;
    std::vector<std::unique_ptr<trie_node>> children;

    // set when a template ends here
    std::shared_ptr<route_payload const> payload;

    explicit
    trie_node(route_segment s) noexcept
        : seg(std::move(s))
    {
    }
};

/** The tree of registered templates, sharing common prefixes.
*/
class route_trie
{
    std::vector<std::unique_ptr<trie_node>> roots_;
    std::size_t size_ = 0;

public:
    std::vector<std::unique_ptr<trie_node>> const&
    roots() const noexcept
    {
        return roots_;
    }

    // number of nodes with a payload
    std::size_t
    size() const noexcept
    {
        return size_;
    }

    /** Add a template to the tree.

        @return `true` if an identical template was
        already present and its payload was replaced.

        @throws system::system_error with
        @ref error::route_conflict if a segment is
        ambiguous with an existing one at the same depth.
    */
    bool
    insert(
        parsed_template&& t,
        std::shared_ptr<route_payload const> p);
};

} // detail
} // pathway

#endif
