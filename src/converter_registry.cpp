//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/converter_registry.hpp>
#include <pathway/converters.hpp>
#include <pathway/error.hpp>
#include <pathway/detail/except.hpp>
#include "src/detail/template_rule.hpp"
#include <boost/url/grammar/parse.hpp>
#include <spdlog/spdlog.h>

namespace pathway {

converter_registry::
converter_registry()
    : converter_registry(true)
{
}

converter_registry::
converter_registry(bool install_builtins)
{
    if(! install_builtins)
        return;
    m_.emplace("int", &int_converter::make);
    m_.emplace("float", &float_converter::make);
    m_.emplace("dt", &datetime_converter::make);
    m_.emplace("uuid", &uuid_converter::make);
    m_.emplace("path", &path_converter::make);
}

void
converter_registry::
add(
    std::string_view name,
    converter_factory f)
{
    if(! f)
        detail::throw_invalid_argument(
            "empty converter factory");
    // must be spellable in a template
    if(grammar::parse(name,
            detail::converter_name_rule).has_error())
        detail::throw_invalid_argument(
            "invalid converter name");
    auto const rv = m_.emplace(
        std::string(name), std::move(f));
    if(! rv.second)
    {
        SPDLOG_WARN("converter '{}' already registered", name);
        detail::throw_system_error(
            PATHWAY_ERR(error::duplicate_converter),
            name);
    }
    SPDLOG_DEBUG("registered converter '{}'", name);
}

bool
converter_registry::
contains(std::string_view name) const noexcept
{
    return m_.find(name) != m_.end();
}

system::result<std::unique_ptr<converter>>
converter_registry::
resolve(
    std::string_view name,
    std::string_view config) const
{
    auto const it = m_.find(name);
    if(it == m_.end())
        PATHWAY_RETURN_EC(
            error::unknown_converter);
    auto args = parse_converter_args(config);
    if(args.has_error())
        return args.error();
    auto rv = it->second(*args);
    if(rv.has_error() || ! *rv)
        PATHWAY_RETURN_EC(
            error::converter_config);
    return rv;
}

} // pathway
