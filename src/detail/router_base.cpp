//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/detail/router_base.hpp>
#include <pathway/detail/except.hpp>
#include <pathway/route_segment.hpp>
#include "src/detail/route_compiler.hpp"
#include "src/detail/route_trie.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <mutex>

namespace pathway {
namespace detail {

struct router_base::impl
{
    using program = std::shared_ptr<matcher_base::impl const>;

    router_options opt;
    route_trie trie;

    // guards trie and compilation
    mutable std::mutex m;

    // null after a change, until the next compile
    mutable std::atomic<program> compiled;

    explicit
    impl(router_options&& o)
        : opt(std::move(o))
    {
    }

    // caller holds m
    program
    compile_locked() const
    {
        auto p = compile_trie(trie);
        compiled.store(p);
        return p;
    }
};

router_base::
~router_base()
{
    delete impl_;
}

router_base::
router_base(router_options opt)
    : impl_(new impl(std::move(opt)))
{
}

router_base::
router_base(
    router_base&& other) noexcept
    : impl_(other.impl_)
{
    other.impl_ = nullptr;
}

router_base&
router_base::
operator=(
    router_base&& other) noexcept
{
    delete impl_;
    impl_ = other.impl_;
    other.impl_ = nullptr;
    return *this;
}

void
router_base::
add_impl(
    std::string_view uri_template,
    std::shared_ptr<route_payload> p)
{
    if(! impl_)
        throw_invalid_argument(
            "router was moved from");
    auto rv = parse_template(
        uri_template, impl_->opt.converters);
    if(rv.has_error())
    {
        SPDLOG_WARN("rejected route '{}': {}",
            uri_template, rv.error().message());
        throw_system_error(rv.error(), uri_template);
    }
    p->uri_template = rv->canonical;

    std::lock_guard<std::mutex> lock(impl_->m);
    auto const canonical = rv->canonical;
    bool const replaced = impl_->trie.insert(
        std::move(*rv), std::move(p));
    if(replaced)
        SPDLOG_DEBUG("replaced route '{}'", canonical);
    else
        SPDLOG_DEBUG("added route '{}'", canonical);

    // readers keep the program they loaded
    impl_->compiled.store(nullptr);
    if(impl_->opt.compile_on_add)
        impl_->compile_locked();
}

void
router_base::
register_converter_impl(
    std::string_view name,
    converter_factory f)
{
    if(! impl_)
        throw_invalid_argument(
            "router was moved from");
    std::lock_guard<std::mutex> lock(impl_->m);
    impl_->opt.converters.add(name, std::move(f));
}

matcher_base
router_base::
snapshot() const
{
    if(! impl_)
        return matcher_base();
    auto p = impl_->compiled.load();
    if(p)
        return matcher_base(std::move(p));
    std::lock_guard<std::mutex> lock(impl_->m);
    p = impl_->compiled.load();
    if(! p)
        p = impl_->compile_locked();
    return matcher_base(std::move(p));
}

matcher_base
router_base::
compile_impl() const
{
    if(! impl_)
        return matcher_base();
    std::lock_guard<std::mutex> lock(impl_->m);
    return matcher_base(impl_->compile_locked());
}

std::size_t
router_base::
size() const noexcept
{
    if(! impl_)
        return 0;
    return impl_->trie.size();
}

converter_registry const&
router_base::
converters() const
{
    if(! impl_)
        throw_invalid_argument(
            "router was moved from");
    return impl_->opt.converters;
}

} // detail
} // pathway
