//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_DETAIL_ROUTER_BASE_HPP
#define PATHWAY_DETAIL_ROUTER_BASE_HPP

#include <pathway/detail/config.hpp>
#include <pathway/detail/matcher_base.hpp>
#include <pathway/converter.hpp>
#include <pathway/router_options.hpp>
#include <memory>
#include <string_view>

namespace pathway {
namespace detail {

// implementation for all routers
class PATHWAY_DECL
    router_base
{
    struct impl;
    impl* impl_;

protected:
    ~router_base();
    explicit router_base(router_options opt);
    router_base(router_base&&) noexcept;
    router_base& operator=(router_base&&) noexcept;

    void add_impl(std::string_view uri_template,
        std::shared_ptr<route_payload> p);
    void register_converter_impl(
        std::string_view name, converter_factory f);

    // compiles on first use after a change
    matcher_base snapshot() const;

    // always compiles
    matcher_base compile_impl() const;

public:
    /// Return the number of distinct routes
    std::size_t size() const noexcept;

    /** Return the converters available to templates

        @throws std::invalid_argument if the router
        was moved from.
    */
    converter_registry const& converters() const;
};

} // detail
} // pathway

#endif
