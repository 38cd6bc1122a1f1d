//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHWAY_ROUTE_SEGMENT_HPP
#define PATHWAY_ROUTE_SEGMENT_HPP

#include <pathway/detail/config.hpp>
#include <pathway/converter.hpp>
#include <pathway/converter_registry.hpp>
#include <boost/system/result.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pathway {

/** The literal skeleton of a segment with several fields.

    A pattern alternates literal text and captures,
    beginning and ending with literal text which may be
    empty. The pattern for `{org}.{repo}` has the
    literals `""`, `"."` and `""`.

    Every capture matches one or more characters. When
    more than one split is possible, earlier captures
    take as many characters as they can.
*/
class segment_pattern
{
    std::vector<std::string> lit_;

    bool
    match_from(
        std::string_view s,
        std::size_t i,
        std::size_t pos,
        std::string_view* caps) const;

public:
    /// Constructor
    segment_pattern()
        : lit_(1)
    {
    }

    /** Constructor

        @param literals The literal spans, one more than
        the number of captures.
    */
    PATHWAY_DECL
    explicit
    segment_pattern(
        std::vector<std::string> literals);

    /// Return the number of captures
    std::size_t
    captures() const noexcept
    {
        return lit_.size() - 1;
    }

    /// Return the literal span before capture `i`, or the trailing span
    std::string const&
    literal(std::size_t i) const noexcept
    {
        return lit_[i];
    }

    /** Match a path segment against the pattern.

        @param caps Receives one view into `s` per capture
        on success.

        @return `true` if the entire segment matched.
    */
    PATHWAY_DECL
    bool
    match(
        std::string_view s,
        std::vector<std::string_view>& caps) const;
};

//------------------------------------------------

/// A segment matched by exact comparison
struct static_segment
{
    std::string text;
};

/// A field occupying an entire segment
struct simple_field
{
    std::string name;

    // null when the field has no converter
    std::shared_ptr<converter const> conv;
};

/// A segment mixing literal text with one or more fields
struct complex_field
{
    segment_pattern pattern;

    // one per capture, left to right
    std::vector<simple_field> fields;
};

/** The kind of a segment, in the order siblings are tried.
*/
enum class segment_kind : unsigned char
{
    literal = 0,
    complex = 1,
    simple = 2
};

/** One classified segment of a URI template.
*/
class route_segment
{
public:
    using value_type = std::variant<
        static_segment,
        simple_field,
        complex_field>;

    route_segment(
        std::string raw,
        value_type v) noexcept
        : raw_(std::move(raw))
        , v_(std::move(v))
    {
    }

    /// Return the segment text as written in the template
    std::string_view
    raw() const noexcept
    {
        return raw_;
    }

    value_type const&
    value() const noexcept
    {
        return v_;
    }

    PATHWAY_DECL
    segment_kind
    kind() const noexcept;

    /// Return true if the segment binds at least one field
    bool
    is_variable() const noexcept
    {
        return kind() != segment_kind::literal;
    }

    /// Return true if the segment binds the rest of the path
    PATHWAY_DECL
    bool
    consumes_remaining() const noexcept;

    /** Return true if two segments at the same depth are ambiguous.

        Segments are equivalent, and never conflict, when
        their template text is identical. Otherwise two
        whole-segment fields always conflict, and two
        mixed segments conflict when their literal
        skeletons are equal.
    */
    PATHWAY_DECL
    bool
    conflicts_with(
        route_segment const& other) const;

    /** Return the segment text with every field replaced by `{}`.
    */
    PATHWAY_DECL
    std::string
    skeleton() const;

private:
    std::string raw_;
    value_type v_;
};

/** Parse and classify one segment of a URI template.

    Converters named by fields are resolved through the
    registry.

    @return The segment, or an error:
    @ref error::template_syntax for a malformed field,
    @ref error::unknown_converter, or
    @ref error::converter_config.
*/
PATHWAY_DECL
system::result<route_segment>
classify(
    std::string_view raw,
    converter_registry const& reg);

//------------------------------------------------

/** A URI template split into classified segments.
*/
struct parsed_template
{
    /// The template with any trailing slash removed
    std::string canonical;

    std::vector<route_segment> segments;
};

/** Parse a complete URI template.

    The template must begin with `'/'` and contain no
    whitespace and no empty segments. One trailing slash
    is removed. Field names may not repeat, and a field
    which consumes the remaining path must be the whole
    of the last segment.

    @return The parsed template, or an error as for
    @ref classify.
*/
PATHWAY_DECL
system::result<parsed_template>
parse_template(
    std::string_view uri_template,
    converter_registry const& reg);

} // pathway

#endif
