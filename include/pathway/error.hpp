//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_ERROR_HPP
#define PATHWAY_ERROR_HPP

#include <pathway/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace pathway {

/** Error codes returned when configuring routes.

    All of these are reported while routes are being registered.
    A lookup which finds nothing is not an error and never
    produces one of these codes.
*/
enum class error
{
    /// Success
    ok = 0,

    /** The URI template is malformed.

        Examples are a template without a leading slash,
        whitespace, an empty segment, an unbalanced brace,
        or a field name which starts with a digit.
    */
    template_syntax,

    /** The template is ambiguous with a registered one.

        Two different simple fields cannot occupy the same
        segment, and two complex segments with the same
        literal skeleton cannot coexist.
    */
    route_conflict,

    /// The template names a converter which is not registered
    unknown_converter,

    /// The converter arguments in the template are invalid
    converter_config,

    /// A converter with the same name is already registered
    duplicate_converter
};

//------------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /** The route could not be registered.

        This matches every code which rejects a call to
        `add_route`.
    */
    invalid_route = 1
};

} // pathway

#include <pathway/impl/error.hpp>

#endif
