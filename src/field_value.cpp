//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/field_value.hpp>
#include <pathway/detail/except.hpp>

namespace pathway {

field_value const*
route_params::
find(std::string_view name) const noexcept
{
    for(auto const& p : v_)
        if(p.first == name)
            return &p.second;
    return nullptr;
}

field_value const&
route_params::
at(std::string_view name) const
{
    if(auto v = find(name))
        return *v;
    detail::throw_out_of_range();
}

} // pathway
