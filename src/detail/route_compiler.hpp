//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_SRC_DETAIL_ROUTE_COMPILER_HPP
#define PATHWAY_SRC_DETAIL_ROUTE_COMPILER_HPP

#include "src/detail/matcher_impl.hpp"
#include "src/detail/route_trie.hpp"
#include <memory>

namespace pathway {
namespace detail {

/** Flatten the trie into a matcher program.

    The trie is not modified, and the result shares
    nothing mutable with it.
*/
std::shared_ptr<matcher_base::impl const>
compile_trie(route_trie const& trie);

} // detail
} // pathway

#endif
