//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_HPP
#define PATHWAY_HPP

#include <pathway/basic_matcher.hpp>
#include <pathway/basic_router.hpp>
#include <pathway/converter.hpp>
#include <pathway/converter_registry.hpp>
#include <pathway/converters.hpp>
#include <pathway/error.hpp>
#include <pathway/field_value.hpp>
#include <pathway/method.hpp>
#include <pathway/route_segment.hpp>
#include <pathway/router_options.hpp>

#endif
