//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_CONVERTER_REGISTRY_HPP
#define PATHWAY_CONVERTER_REGISTRY_HPP

#include <pathway/detail/config.hpp>
#include <pathway/converter.hpp>
#include <boost/system/result.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace pathway {

/** A table of named converter factories.

    Each router owns a registry. Templates refer to
    converters by the names in this table, and the
    registry creates a configured converter for every
    field which names one.

    A default-constructed registry contains the built-in
    converters `int`, `float`, `dt`, `uuid` and `path`.

    @par Thread Safety
    The registry may only be modified while no routes
    are being added.
*/
class converter_registry
{
    std::map<std::string,
        converter_factory, std::less<>> m_;

public:
    /** Constructor

        Installs the built-in converters.
    */
    PATHWAY_DECL
    converter_registry();

    /** Constructor

        @param install_builtins If `false`, the registry
        starts out empty.
    */
    PATHWAY_DECL
    explicit
    converter_registry(bool install_builtins);

    /** Add a named converter factory.

        The name may contain only letters, digits and
        underscores.

        @throws std::invalid_argument if the name is not
        valid or the factory is empty.

        @throws system::system_error with
        @ref error::duplicate_converter if the name
        is already registered.
    */
    PATHWAY_DECL
    void
    add(
        std::string_view name,
        converter_factory f);

    /// Return true if a converter is registered under the name
    PATHWAY_DECL
    bool
    contains(std::string_view name) const noexcept;

    /** Create a configured converter.

        @param name The converter name from the template.

        @param config The argument text from the template,
        which may be empty.

        @return The new converter, or an error:
        @ref error::unknown_converter if nothing is
        registered under `name`, or
        @ref error::converter_config if the arguments are
        malformed or rejected by the factory.
    */
    PATHWAY_DECL
    system::result<std::unique_ptr<converter>>
    resolve(
        std::string_view name,
        std::string_view config) const;
};

} // pathway

#endif
