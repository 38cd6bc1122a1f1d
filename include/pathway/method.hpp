//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_METHOD_HPP
#define PATHWAY_METHOD_HPP

#include <pathway/detail/config.hpp>
#include <iosfwd>
#include <map>
#include <string_view>

namespace pathway {

/** HTTP request methods used as keys of a method table.
*/
enum class http_method : char
{
    /// Any method not listed below
    unknown = 0,

    delete_,
    get,
    head,
    post,
    put,
    connect,
    options,
    trace,
    patch
};

/** Convert a method string to its enumeration.

    The comparison is case-sensitive, as required by
    rfc9110.

    @return The method, or @ref http_method::unknown if
    the string does not name a known method.
*/
PATHWAY_DECL
http_method
string_to_method(
    std::string_view s) noexcept;

/** Return the method string for a method.

    @return The upper-case method name, or an empty string
    for @ref http_method::unknown.
*/
PATHWAY_DECL
std::string_view
to_string(http_method m) noexcept;

/// Write the method name to a stream
PATHWAY_DECL
std::ostream&
operator<<(
    std::ostream& os,
    http_method m);

/** A table mapping HTTP methods to responders.

    The router stores this table alongside the resource
    of a route and returns it unchanged on a match.
*/
template<class Responder>
using method_map = std::map<http_method, Responder>;

} // pathway

#endif
