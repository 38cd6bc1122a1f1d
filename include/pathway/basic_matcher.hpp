//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_BASIC_MATCHER_HPP
#define PATHWAY_BASIC_MATCHER_HPP

#include <pathway/detail/config.hpp>
#include <pathway/detail/matcher_base.hpp>
#include <pathway/field_value.hpp>
#include <pathway/method.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace pathway {

template<class, class>
class basic_router;

namespace detail {

template<class Resource, class Responder>
struct basic_route_payload : route_payload
{
    method_map<Responder> methods;
    Resource resource;

    basic_route_payload(
        method_map<Responder> methods_,
        Resource resource_)
        : methods(std::move(methods_))
        , resource(std::move(resource_))
    {
    }
};

} // detail

//------------------------------------------------

/** The result of a successful lookup.

    The match shares ownership of the route it refers
    to, so it remains valid after the router which
    produced it is changed or destroyed.
*/
template<class Resource, class Responder>
class basic_route_match
{
    using payload_type = detail::basic_route_payload<
        Resource, Responder>;

    std::shared_ptr<payload_type const> p_;
    route_params params_;

public:
    basic_route_match(
        std::shared_ptr<payload_type const> p,
        route_params params) noexcept
        : p_(std::move(p))
        , params_(std::move(params))
    {
    }

    /// Return the resource stored with the route
    Resource const&
    resource() const noexcept
    {
        return p_->resource;
    }

    /// Return the method table stored with the route
    method_map<Responder> const&
    methods() const noexcept
    {
        return p_->methods;
    }

    /// Return the fields bound from the path
    route_params const&
    params() const noexcept
    {
        return params_;
    }

    /// Return the canonical template of the route
    std::string_view
    uri_template() const noexcept
    {
        return p_->uri_template;
    }

    /** Return true if both refer to the same route with equal fields
    */
    friend
    bool
    operator==(
        basic_route_match const& a,
        basic_route_match const& b) noexcept
    {
        return a.p_ == b.p_ && a.params_ == b.params_;
    }
};

//------------------------------------------------

/** An immutable, compiled set of routes.

    A matcher is a cheap-to-copy handle. Copies share
    the same program, and @ref find may be called from
    any number of threads at once.
*/
template<class Resource, class Responder>
class basic_matcher : public detail::matcher_base
{
    template<class, class>
    friend class basic_router;

    explicit
    basic_matcher(
        detail::matcher_base&& m) noexcept
        : matcher_base(std::move(m))
    {
    }

public:
    using match_type = basic_route_match<
        Resource, Responder>;

    /** Constructor

        A default-constructed matcher has no routes.
    */
    basic_matcher() = default;

    /** Resolve a request path to a route.

        Leading slashes are ignored, and the rest of the
        path is split on `'/'`. No other normalization
        is performed.

        @return The match, or an empty optional if no
        route matches.
    */
    std::optional<match_type>
    find(std::string_view path) const
    {
        route_params params;
        auto p = find_impl(path, params);
        if(! p)
            return std::nullopt;
        return match_type(
            std::static_pointer_cast<
                detail::basic_route_payload<
                    Resource, Responder> const>(
                        std::move(p)),
            std::move(params));
    }
};

} // pathway

#endif
