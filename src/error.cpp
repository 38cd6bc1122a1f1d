//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/error.hpp>

namespace pathway {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "pathway.route";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::ok: return "success";
    case error::template_syntax: return "malformed URI template";
    case error::route_conflict: return "route conflicts with an existing route";
    case error::unknown_converter: return "unknown field converter";
    case error::converter_config: return "invalid field converter arguments";
    case error::duplicate_converter: return "field converter already registered";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "pathway.condition";
}

std::string
condition_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(ev))
    {
    default:
    case condition::invalid_route:
        return "invalid route";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int code) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    switch(static_cast<condition>(code))
    {
    case condition::invalid_route:
        switch(static_cast<error>(ec.value()))
        {
        case error::template_syntax:
        case error::route_conflict:
        case error::unknown_converter:
        case error::converter_config:
            return true;
        default:
            return false;
        }

    default:
        return false;
    }
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail
} // pathway
