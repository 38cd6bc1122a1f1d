//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_DETAIL_MATCHER_BASE_HPP
#define PATHWAY_DETAIL_MATCHER_BASE_HPP

#include <pathway/detail/config.hpp>
#include <pathway/field_value.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace pathway {
namespace detail {

class router_base;

// what a route stores, type-erased
struct PATHWAY_SYMBOL_VISIBLE
    route_payload
{
    std::string uri_template;

    virtual ~route_payload() = default;
};

// implementation for all matchers
class PATHWAY_DECL
    matcher_base
{
public:
    struct impl;

    /// Return the number of routes in the program
    std::size_t size() const noexcept;

    /** Return the compiled program as text.

        Each line is one test, indented by depth.
    */
    std::string dump() const;

protected:
    friend class router_base;

    matcher_base() = default;

    explicit
    matcher_base(
        std::shared_ptr<impl const> p) noexcept
        : impl_(std::move(p))
    {
    }

    std::shared_ptr<route_payload const>
    find_impl(
        std::string_view path,
        route_params& params) const;

    std::shared_ptr<impl const> impl_;
};

} // detail
} // pathway

#endif
