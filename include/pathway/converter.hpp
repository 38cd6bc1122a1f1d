//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_CONVERTER_HPP
#define PATHWAY_CONVERTER_HPP

#include <pathway/detail/config.hpp>
#include <pathway/field_value.hpp>
#include <boost/system/result.hpp>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pathway {

/** Validates and transforms the text of a field.

    A converter is attached to a field with the syntax
    `{name:converter}` or `{name:converter(args)}`. When
    a request path is matched, the text of the field is
    passed to @ref convert and the result becomes the
    value bound to the field.

    Converters are shared by every thread performing
    lookups, so @ref convert must not modify the object.
*/
class PATHWAY_DECL
    converter
{
public:
    virtual ~converter() = default;

    /** Convert the text of a field.

        @return The converted value, or an empty optional
        if the text is not acceptable. An empty result
        makes the field fail to match; it is not an error.
    */
    virtual
    std::optional<field_value>
    convert(std::string_view fragment) const = 0;

    /** Return true if the converter consumes the rest of the path.

        Such a converter receives all remaining segments
        of the request path joined with `'/'`, and may only
        appear as the last segment of a template.
    */
    virtual
    bool
    consumes_remaining_segments() const noexcept
    {
        return false;
    }
};

//------------------------------------------------

/** One argument from the configuration of a converter.
*/
struct converter_arg
{
    /// The keyword, or empty for a positional argument
    std::string name;

    /// The value, without quotes
    std::string value;

    /// True if the value was written as a quoted string
    bool quoted = false;
};

/** The parsed arguments of a converter reference.

    For the field `{id:int(2, max=50)}` the arguments are
    the positional value `2` and the keyword `max` with
    the value `50`.

    @par BNF
    @code
    args     = [ arg *( OWS "," OWS arg ) ] OWS
    arg      = [ name OWS "=" OWS ] value
    value    = quoted / bare
    quoted   = DQUOTE *( %x20-7E except DQUOTE ) DQUOTE
             / "'" *( %x20-7E except "'" ) "'"
    bare     = 1*( ALPHA / DIGIT / "_" / "." / "+" / "-" )
    @endcode
*/
class converter_args
{
    std::vector<converter_arg> v_;

public:
    using const_iterator =
        std::vector<converter_arg>::const_iterator;

    converter_args() = default;

    explicit
    converter_args(
        std::vector<converter_arg> v) noexcept
        : v_(std::move(v))
    {
    }

    bool empty() const noexcept { return v_.empty(); }
    std::size_t size() const noexcept { return v_.size(); }
    const_iterator begin() const noexcept { return v_.begin(); }
    const_iterator end() const noexcept { return v_.end(); }

    /** Match the arguments against a list of parameter names.

        Positional arguments bind to parameters in order,
        keyword arguments bind by name.

        @return A vector with one element per parameter,
        pointing to the bound argument or null if it was
        not given. Fails with @ref error::converter_config
        if there are too many positional arguments, an
        unknown or repeated keyword, or a positional
        argument after a keyword.
    */
    PATHWAY_DECL
    system::result<std::vector<converter_arg const*>>
    bind(std::initializer_list<
        std::string_view> params) const;
};

/** Parse the configuration string of a converter.

    @param s The text between the parentheses of
    `{name:conv(...)}`, or after the second colon of
    `{name:conv:...}`.
*/
PATHWAY_DECL
system::result<converter_args>
parse_converter_args(std::string_view s);

/// Return the argument as an integer
PATHWAY_DECL
system::result<std::int64_t>
to_int(converter_arg const& a);

/// Return the argument as a floating point number
PATHWAY_DECL
system::result<double>
to_double(converter_arg const& a);

/// Return the argument as a boolean
PATHWAY_DECL
system::result<bool>
to_bool(converter_arg const& a);

//------------------------------------------------

/** A function which creates a configured converter.

    The factory receives the parsed arguments from the
    template and returns a new converter, or a failing
    result if the arguments are unacceptable.
*/
using converter_factory = std::function<
    system::result<std::unique_ptr<converter>>(
        converter_args const&)>;

} // pathway

#endif
