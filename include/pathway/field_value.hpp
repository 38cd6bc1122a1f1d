//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_FIELD_VALUE_HPP
#define PATHWAY_FIELD_VALUE_HPP

#include <pathway/detail/config.hpp>
#include <boost/uuid/uuid.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pathway {

namespace detail {
struct params_access;
} // detail

/** A point in time together with the UTC offset it was written in.
*/
struct timestamp
{
    /// The instant, in UTC
    std::chrono::sys_seconds time;

    /// The offset from UTC which appeared in the field
    std::chrono::minutes offset{0};

    friend bool operator==(
        timestamp const&,
        timestamp const&) = default;
};

/** The value bound to a field of a matched route.

    Fields without a converter bind the raw segment text
    as `std::string`. Converters produce one of the other
    alternatives.
*/
using field_value = std::variant<
    std::string,
    std::int64_t,
    double,
    timestamp,
    boost::uuids::uuid>;

//------------------------------------------------

/** The fields bound by a successful match.

    Fields appear in the order they occur in the URI
    template, from left to right.
*/
class route_params
{
public:
    using value_type = std::pair<std::string, field_value>;
    using const_iterator = std::vector<value_type>::const_iterator;

    route_params() = default;

    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    /** Return the value of a field, or `nullptr`.
    */
    PATHWAY_DECL
    field_value const*
    find(std::string_view name) const noexcept;

    /** Return the value of a field.

        @throws std::out_of_range if there is no such field.
    */
    PATHWAY_DECL
    field_value const&
    at(std::string_view name) const;

    bool
    contains(std::string_view name) const noexcept
    {
        return find(name) != nullptr;
    }

    /** Return a pointer to the value if it holds a `T`.
    */
    template<class T>
    T const*
    get_if(std::string_view name) const noexcept
    {
        if(auto v = find(name))
            return std::get_if<T>(v);
        return nullptr;
    }

    friend bool operator==(
        route_params const&,
        route_params const&) = default;

private:
    friend struct detail::params_access;

    void
    emplace(
        std::string_view name,
        field_value v)
    {
        v_.emplace_back(std::string(name), std::move(v));
    }

    void
    truncate(std::size_t n) noexcept
    {
        while(v_.size() > n)
            v_.pop_back();
    }

    void
    clear() noexcept
    {
        v_.clear();
    }

    std::vector<value_type> v_;
};

} // pathway

#endif
