//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_ROUTER_OPTIONS_HPP
#define PATHWAY_ROUTER_OPTIONS_HPP

#include <pathway/detail/config.hpp>
#include <pathway/converter_registry.hpp>

namespace pathway {

/** Settings applied when a router is constructed.
*/
struct router_options
{
    /** The converters available to templates.

        Defaults to the built-in converters.
    */
    converter_registry converters;

    /** Recompile after every route is added.

        When `false`, the router compiles on the first
        lookup after a change instead.
    */
    bool compile_on_add = false;
};

} // pathway

#endif
