//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_SRC_DETAIL_NUMBER_HPP
#define PATHWAY_SRC_DETAIL_NUMBER_HPP

namespace pathway {
namespace detail {

// from_chars does not accept a leading plus sign
inline
char const*
skip_plus(
    char const* first,
    char const* last) noexcept
{
    if( last - first > 1 &&
        first[0] == '+' &&
        first[1] != '-')
        return first + 1;
    return first;
}

} // detail
} // pathway

#endif
