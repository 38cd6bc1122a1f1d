//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_BASIC_ROUTER_HPP
#define PATHWAY_BASIC_ROUTER_HPP

#include <pathway/detail/config.hpp>
#include <pathway/detail/router_base.hpp>
#include <pathway/basic_matcher.hpp>
#include <pathway/converter.hpp>
#include <pathway/method.hpp>
#include <pathway/router_options.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace pathway {

/** A router mapping URI templates to resources.

    Each route stores a resource and a table of
    responders keyed by HTTP method. Both are returned
    unchanged when a request path matches the route's
    template.

    @par Template Syntax
    @code
    /books/{id}
    /books/{id:int(min=1)}
    /repos/{org}/{repo}/compare/{usr0}...{usr1}
    /static/{rest:path}
    @endcode

    @par Thread Safety
    Routes are added from one thread. Once routes stop
    changing, @ref find may be called concurrently from
    any number of threads. To change routes while serving,
    build a new router and publish the matcher returned
    by @ref compile.

    @tparam Resource The type of the stored resource.

    @tparam Responder The type of the method table values.
*/
template<class Resource, class Responder>
class basic_router : public detail::router_base
{
public:
    using resource_type = Resource;
    using responder_type = Responder;
    using matcher_type = basic_matcher<Resource, Responder>;
    using match_type = typename matcher_type::match_type;

    /// Constructor
    basic_router()
        : basic_router(router_options{})
    {
    }

    /// Constructor
    explicit
    basic_router(
        router_options opt)
        : router_base(std::move(opt))
    {
    }

    basic_router(basic_router&&) noexcept = default;
    basic_router& operator=(basic_router&&) noexcept = default;

    /** Add a route.

        Adding a template identical to an existing one
        replaces that route's resource and methods.

        @throws system::system_error on an invalid
        template or a conflict with an existing route.
        The code compares equal to
        @ref condition::invalid_route.
    */
    void
    add_route(
        std::string_view uri_template,
        method_map<Responder> methods,
        Resource resource)
    {
        add_impl(uri_template,
            std::make_shared<detail::basic_route_payload<
                Resource, Responder>>(
                    std::move(methods),
                    std::move(resource)));
    }

    /** Resolve a request path to a route.

        The routes are compiled on the first call after
        a change.

        @return The match, or an empty optional.
    */
    std::optional<match_type>
    find(std::string_view path) const
    {
        return matcher_type(snapshot()).find(path);
    }

    /** Compile the routes and return the program.

        The returned matcher is unaffected by later
        changes to the router.
    */
    matcher_type
    compile() const
    {
        return matcher_type(compile_impl());
    }

    /** Make a converter available to later templates.

        @throws system::system_error with
        @ref error::duplicate_converter if the name is
        already registered.
    */
    void
    register_converter(
        std::string_view name,
        converter_factory f)
    {
        register_converter_impl(name, std::move(f));
    }
};

} // pathway

#endif
