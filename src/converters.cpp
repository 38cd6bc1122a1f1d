//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathway/converters.hpp>
#include <pathway/error.hpp>
#include <pathway/detail/except.hpp>
#include "src/detail/number.hpp"
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/digit_chars.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <boost/uuid/nil_generator.hpp>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <ctime>
#include <time.h>

namespace pathway {

namespace {

bool
is_space(char c) noexcept
{
    return
        c == ' ' || c == '\t' || c == '\n' ||
        c == '\r' || c == '\f' || c == '\v';
}

bool
has_space(std::string_view s) noexcept
{
    return std::any_of(
        s.begin(), s.end(), &is_space);
}

bool
is_digits(
    char const* first,
    char const* last,
    std::ptrdiff_t n) noexcept
{
    return
        last - first == n &&
        grammar::find_if_not(first, last,
            grammar::digit_chars) == last;
}

// strptime skips blanks before numbers, lets a format
// blank match no input, and takes any width for %Y and %y
bool
check_directives(
    char const* s,
    std::string const& format)
{
    auto it = format.data();
    auto const end = it + format.size();
    while(it != end)
    {
        if(is_space(*it))
        {
            if(! is_space(*s))
                return false;
            while(is_space(*s))
                ++s;
            while(it != end && is_space(*it))
                ++it;
            continue;
        }
        if(*it != '%')
        {
            if(*s != *it)
                return false;
            ++s;
            ++it;
            continue;
        }
        std::string d(1, *it++);
        if(it != end && (*it == 'E' || *it == 'O'))
            d.push_back(*it++);
        if(it == end)
            return false;
        char const c = *it++;
        d.push_back(c);
        if(c == '%')
        {
            if(*s != '%')
                return false;
            ++s;
            continue;
        }
        if(c != 'n' && c != 't' && is_space(*s))
            return false;
        std::tm scratch{};
        auto const p = ::strptime(
            s, d.c_str(), &scratch);
        if(p == nullptr)
            return false;
        if(c == 'Y' && ! is_digits(s, p, 4))
            return false;
        if(c == 'y' && ! is_digits(s, p, 2))
            return false;
        s = p;
    }
    return true;
}

// timegm normalizes out of range fields instead
bool
is_valid_time(std::tm const& tm) noexcept
{
    if(tm.tm_sec > 59)
        return false;
    if(tm.tm_year + 1900 < 1)
        return false;
    return std::chrono::year_month_day(
        std::chrono::year(tm.tm_year + 1900),
        std::chrono::month(
            static_cast<unsigned>(tm.tm_mon + 1)),
        std::chrono::day(
            static_cast<unsigned>(tm.tm_mday))).ok();
}

} // (anon)

//------------------------------------------------

int_converter::
int_converter(
    std::optional<std::int64_t> num_digits,
    std::optional<std::int64_t> min,
    std::optional<std::int64_t> max)
    : min_(min)
    , max_(max)
{
    if(num_digits.has_value())
    {
        if(*num_digits < 1)
            detail::throw_system_error(
                PATHWAY_ERR(error::converter_config),
                "num_digits must be at least 1");
        num_digits_ = static_cast<
            std::size_t>(*num_digits);
    }
}

std::optional<field_value>
int_converter::
convert(std::string_view s) const
{
    if( num_digits_.has_value() &&
        s.size() != *num_digits_)
        return std::nullopt;
    if(has_space(s))
        return std::nullopt;
    auto const last = s.data() + s.size();
    auto const first = detail::skip_plus(s.data(), last);
    std::int64_t n = 0;
    auto [ptr, ec] = std::from_chars(first, last, n);
    if(ec != std::errc() || ptr != last)
        return std::nullopt;
    if(min_.has_value() && n < *min_)
        return std::nullopt;
    if(max_.has_value() && n > *max_)
        return std::nullopt;
    return field_value(n);
}

system::result<std::unique_ptr<converter>>
int_converter::
make(converter_args const& args)
{
    auto rv = args.bind({ "num_digits", "min", "max" });
    if(rv.has_error())
        return rv.error();
    std::optional<std::int64_t> v[3];
    for(std::size_t i = 0; i < 3; ++i)
    {
        auto const* a = (*rv)[i];
        if(! a)
            continue;
        auto n = to_int(*a);
        if(n.has_error())
            return n.error();
        v[i] = *n;
    }
    if(v[0].has_value() && *v[0] < 1)
        PATHWAY_RETURN_EC(
            error::converter_config);
    return std::make_unique<int_converter>(
        v[0], v[1], v[2]);
}

//------------------------------------------------

float_converter::
float_converter(
    std::optional<double> min,
    std::optional<double> max,
    bool finite) noexcept
    : min_(min)
    , max_(max)
    , finite_(finite)
{
}

std::optional<field_value>
float_converter::
convert(std::string_view s) const
{
    if(has_space(s))
        return std::nullopt;
    auto const last = s.data() + s.size();
    auto const first = detail::skip_plus(s.data(), last);
    double d = 0;
    auto [ptr, ec] = std::from_chars(first, last, d);
    if(ec != std::errc() || ptr != last)
        return std::nullopt;
    if(finite_ && ! std::isfinite(d))
        return std::nullopt;
    if(min_.has_value() && d < *min_)
        return std::nullopt;
    if(max_.has_value() && d > *max_)
        return std::nullopt;
    return field_value(d);
}

system::result<std::unique_ptr<converter>>
float_converter::
make(converter_args const& args)
{
    auto rv = args.bind({ "min", "max", "finite" });
    if(rv.has_error())
        return rv.error();
    auto const& v = *rv;
    std::optional<double> min;
    std::optional<double> max;
    bool finite = true;
    if(v[0])
    {
        auto d = to_double(*v[0]);
        if(d.has_error())
            return d.error();
        min = *d;
    }
    if(v[1])
    {
        auto d = to_double(*v[1]);
        if(d.has_error())
            return d.error();
        max = *d;
    }
    if(v[2])
    {
        auto b = to_bool(*v[2]);
        if(b.has_error())
            return b.error();
        finite = *b;
    }
    return std::make_unique<float_converter>(
        min, max, finite);
}

//------------------------------------------------

datetime_converter::
datetime_converter(
    std::string format)
    : format_(std::move(format))
{
}

std::optional<field_value>
datetime_converter::
convert(std::string_view s) const
{
    std::string const buf(s);
    if(! check_directives(buf.c_str(), format_))
        return std::nullopt;

    std::tm tm{};
    tm.tm_mday = 1;
    auto p = ::strptime(
        buf.c_str(), format_.c_str(), &tm);
    if(p == nullptr || p != buf.c_str() + buf.size())
        return std::nullopt;
    if(! is_valid_time(tm))
        return std::nullopt;

    auto const gmtoff = tm.tm_gmtoff;
    tm.tm_isdst = 0;
    auto const t = ::timegm(&tm);
    timestamp ts;
    ts.time = std::chrono::sys_seconds(
        std::chrono::seconds(
            static_cast<std::int64_t>(t) - gmtoff));
    ts.offset = std::chrono::minutes(gmtoff / 60);
    return field_value(ts);
}

system::result<std::unique_ptr<converter>>
datetime_converter::
make(converter_args const& args)
{
    auto rv = args.bind({ "format_string" });
    if(rv.has_error())
        return rv.error();
    auto const* a = (*rv)[0];
    if(! a)
        return std::make_unique<
            datetime_converter>();
    if(a->value.empty())
        PATHWAY_RETURN_EC(
            error::converter_config);
    return std::make_unique<
        datetime_converter>(a->value);
}

//------------------------------------------------

std::optional<field_value>
uuid_converter::
convert(std::string_view s) const
{
    constexpr std::string_view urn = "urn:uuid:";
    if(s.substr(0, urn.size()) == urn)
        s.remove_prefix(urn.size());
    if( s.size() >= 2 &&
        s.front() == '{' &&
        s.back() == '}')
        s = s.substr(1, s.size() - 2);

    auto u = boost::uuids::nil_uuid();
    auto out = u.begin();
    int hi = -1;
    for(char c : s)
    {
        if(c == '-')
            continue;
        auto const d = grammar::hexdig_value(c);
        if(d < 0)
            return std::nullopt;
        if(out == u.end())
            return std::nullopt;
        if(hi < 0)
        {
            hi = d;
            continue;
        }
        *out++ = static_cast<std::uint8_t>(
            (hi << 4) | d);
        hi = -1;
    }
    if(out != u.end() || hi >= 0)
        return std::nullopt;
    return field_value(u);
}

system::result<std::unique_ptr<converter>>
uuid_converter::
make(converter_args const& args)
{
    if(! args.empty())
        PATHWAY_RETURN_EC(
            error::converter_config);
    return std::make_unique<uuid_converter>();
}

//------------------------------------------------

std::optional<field_value>
path_converter::
convert(std::string_view s) const
{
    return field_value(std::string(s));
}

system::result<std::unique_ptr<converter>>
path_converter::
make(converter_args const& args)
{
    if(! args.empty())
        PATHWAY_RETURN_EC(
            error::converter_config);
    return std::make_unique<path_converter>();
}

} // pathway
