//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_DETAIL_EXCEPT_HPP
#define PATHWAY_DETAIL_EXCEPT_HPP

#include <pathway/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>
#include <string_view>

namespace pathway {
namespace detail {

BOOST_NORETURN PATHWAY_DECL void throw_invalid_argument(
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_NORETURN PATHWAY_DECL void throw_invalid_argument(
    char const* what,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_NORETURN PATHWAY_DECL void throw_out_of_range(
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_NORETURN PATHWAY_DECL void throw_system_error(
    system::error_code const& ec,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_NORETURN PATHWAY_DECL void throw_system_error(
    system::error_code const& ec,
    std::string_view what,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // pathway

#endif
