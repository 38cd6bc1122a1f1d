//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_CONVERTERS_HPP
#define PATHWAY_CONVERTERS_HPP

#include <pathway/detail/config.hpp>
#include <pathway/converter.hpp>
#include <boost/system/result.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pathway {

/** Converts a field to an integer.

    Registered under the name `int`.

    @par Arguments
    @code
    int( [num_digits [, min [, max]]] )
    @endcode

    The text may carry a sign and leading zeros, so
    `"007"` converts to `7`. Text containing whitespace,
    or whose length differs from `num_digits` when that
    argument is given, does not convert.
*/
class PATHWAY_DECL
    int_converter : public converter
{
    std::optional<std::size_t> num_digits_;
    std::optional<std::int64_t> min_;
    std::optional<std::int64_t> max_;

public:
    /** Constructor

        @throws system::system_error with
        @ref error::converter_config if `num_digits`
        is less than one.
    */
    explicit
    int_converter(
        std::optional<std::int64_t> num_digits = {},
        std::optional<std::int64_t> min = {},
        std::optional<std::int64_t> max = {});

    std::optional<field_value>
    convert(std::string_view s) const override;

    /// Create an instance from template arguments
    static
    system::result<std::unique_ptr<converter>>
    make(converter_args const& args);
};

//------------------------------------------------

/** Converts a field to a floating point number.

    Registered under the name `float`.

    @par Arguments
    @code
    float( [min [, max [, finite]]] )
    @endcode

    Decimal and scientific notation are accepted, as are
    the spellings of infinity and NaN. When `finite` is
    true, which is the default, those non-finite values
    do not convert.
*/
class PATHWAY_DECL
    float_converter : public converter
{
    std::optional<double> min_;
    std::optional<double> max_;
    bool finite_;

public:
    explicit
    float_converter(
        std::optional<double> min = {},
        std::optional<double> max = {},
        bool finite = true) noexcept;

    std::optional<field_value>
    convert(std::string_view s) const override;

    /// Create an instance from template arguments
    static
    system::result<std::unique_ptr<converter>>
    make(converter_args const& args);
};

//------------------------------------------------

/** Converts a field to a @ref timestamp.

    Registered under the name `dt`.

    @par Arguments
    @code
    dt( [format_string] )
    @endcode

    The format uses the directives of `strptime`, and
    must be quoted in a template, for example
    `{day:dt("%Y-%m-%d")}`. The entire field must be
    consumed by the format. When the format has no `%z`
    the time is taken to be UTC.

    Matching is stricter than `strptime` alone: `%Y`
    takes exactly four digits and `%y` exactly two, no
    blank may precede a number, a blank in the format
    needs at least one blank in the field, and dates
    which do not exist on the calendar are rejected.
*/
class PATHWAY_DECL
    datetime_converter : public converter
{
    std::string format_;

public:
    static constexpr char const* default_format =
        "%Y-%m-%dT%H:%M:%S%z";

    explicit
    datetime_converter(
        std::string format = default_format);

    std::optional<field_value>
    convert(std::string_view s) const override;

    /// Create an instance from template arguments
    static
    system::result<std::unique_ptr<converter>>
    make(converter_args const& args);
};

//------------------------------------------------

/** Converts a field to a `boost::uuids::uuid`.

    Registered under the name `uuid`. Takes no arguments.

    Accepts 32 hexadecimal digits with hyphens in any
    position, optionally enclosed in braces and optionally
    preceded by `urn:uuid:`.
*/
class PATHWAY_DECL
    uuid_converter : public converter
{
public:
    std::optional<field_value>
    convert(std::string_view s) const override;

    /// Create an instance from template arguments
    static
    system::result<std::unique_ptr<converter>>
    make(converter_args const& args);
};

//------------------------------------------------

/** Binds the remainder of the path.

    Registered under the name `path`. Takes no arguments.

    The field receives every remaining segment of the
    request path joined with `'/'`. A field using this
    converter must be the whole of the last segment of
    its template.
*/
class PATHWAY_DECL
    path_converter : public converter
{
public:
    std::optional<field_value>
    convert(std::string_view s) const override;

    bool
    consumes_remaining_segments() const noexcept override
    {
        return true;
    }

    /// Create an instance from template arguments
    static
    system::result<std::unique_ptr<converter>>
    make(converter_args const& args);
};

} // pathway

#endif
