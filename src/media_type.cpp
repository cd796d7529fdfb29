//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/media_type.hpp>
#include <mime/error.hpp>
#include <mime/detail/except.hpp>
#include <mime/rfc/media_type_rule.hpp>
#include <mime/rfc/token_rule.hpp>

#include <boost/container_hash/hash.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/delim_rule.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/tuple_rule.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <ostream>
#include <tuple>
#include <utility>

namespace mime {

namespace {

constexpr core::string_view charset_name = "charset";
constexpr core::string_view quality_name = "q";

// type "/" subtype, nothing else
std::tuple<core::string_view, core::string_view>
split_mime_type(core::string_view mt)
{
    if(mt.empty())
        detail::throw_invalid_argument();
    auto rv = grammar::parse(mt,
        grammar::tuple_rule(
            token_rule,
            grammar::squelch(
                grammar::delim_rule('/')),
            token_rule));
    if(! rv)
        detail::throw_system_error(
            MIME_ERR(error::bad_type));
    return *rv;
}

void
check_token(core::string_view s)
{
    if(! grammar::parse(s, token_rule))
        detail::throw_system_error(
            MIME_ERR(error::bad_type));
}

// Overwrite the first matching parameter
// in place, or append a new one
void
set_param(
    parameter_list& params,
    core::string_view name,
    core::string_view value)
{
    auto it = params.find(name);
    if(it != params.end())
        it->set_value(value);
    else
        params.add(parameter(name, value));
}

// qvalue text, at most three fractional
// digits and at least one
std::size_t
format_quality(
    double q,
    char* dest) noexcept
{
    // rounds half away from zero
    auto const n = static_cast<unsigned>(
        std::llround(q * 1000));
    auto frac = n % 1000;
    std::size_t i = 0;
    dest[i++] = static_cast<char>('0' + n / 1000);
    dest[i++] = '.';
    dest[i++] = static_cast<char>('0' + frac / 100);
    frac %= 100;
    if(frac != 0)
    {
        dest[i++] = static_cast<char>('0' + frac / 10);
        frac %= 10;
        if(frac != 0)
            dest[i++] = static_cast<char>('0' + frac);
    }
    return i;
}

bool
is_decimal(core::string_view s) noexcept
{
    bool digit = false;
    bool dot = false;
    for(char c : s)
    {
        if(c >= '0' && c <= '9')
        {
            digit = true;
            continue;
        }
        if(c != '.' || dot)
            return false;
        dot = true;
    }
    return digit;
}

} // (anon)

//------------------------------------------------

media_type::
media_type(core::string_view mt)
{
    auto const t = split_mime_type(mt);
    type_.assign(
        std::get<0>(t).data(),
        std::get<0>(t).size());
    subtype_.assign(
        std::get<1>(t).data(),
        std::get<1>(t).size());
}

media_type::
media_type(
    core::string_view mt,
    double quality)
    : media_type(mt)
{
    set_quality(quality);
}

media_type::
media_type(media_type&& other)
    : params_(std::move(other.params_))
    , read_only_(other.read_only_)
{
    if(other.read_only_)
    {
        type_ = other.type_;
        subtype_ = other.subtype_;
        return;
    }
    type_ = std::move(other.type_);
    subtype_ = std::move(other.subtype_);
}

media_type&
media_type::
operator=(media_type const& other)
{
    if(read_only_)
        detail::throw_logic_error();
    if(this == &other)
        return *this;
    type_ = other.type_;
    subtype_ = other.subtype_;
    params_ = other.params_;
    if(other.read_only_)
    {
        params_.make_read_only();
        read_only_ = true;
    }
    return *this;
}

media_type&
media_type::
operator=(media_type&& other)
{
    if(read_only_)
        detail::throw_logic_error();
    if(other.read_only_)
        return *this = other;
    if(this == &other)
        return *this;
    type_ = std::move(other.type_);
    subtype_ = std::move(other.subtype_);
    params_ = std::move(other.params_);
    return *this;
}

std::string
media_type::
mime_type() const
{
    std::string s;
    s.reserve(type_.size() + 1 + subtype_.size());
    s.append(type_);
    s.push_back('/');
    s.append(subtype_);
    return s;
}

void
media_type::
set_type(core::string_view type)
{
    if(read_only_)
        detail::throw_logic_error();
    check_token(type);
    type_.assign(type.data(), type.size());
}

void
media_type::
set_subtype(core::string_view subtype)
{
    if(read_only_)
        detail::throw_logic_error();
    check_token(subtype);
    subtype_.assign(subtype.data(), subtype.size());
}

void
media_type::
set_mime_type(core::string_view mt)
{
    if(read_only_)
        detail::throw_logic_error();
    auto const t = split_mime_type(mt);
    type_.assign(
        std::get<0>(t).data(),
        std::get<0>(t).size());
    subtype_.assign(
        std::get<1>(t).data(),
        std::get<1>(t).size());
}

//------------------------------------------------

boost::optional<core::string_view>
media_type::
charset() const noexcept
{
    auto it = params_.find(charset_name);
    if(it == params_.end())
        return boost::none;
    return it->value();
}

void
media_type::
set_charset(core::string_view charset)
{
    if(read_only_)
        detail::throw_logic_error();
    if(charset.empty())
    {
        params_.remove(charset_name);
        return;
    }
    set_param(params_, charset_name, charset);
}

void
media_type::
remove_charset()
{
    if(read_only_)
        detail::throw_logic_error();
    params_.remove(charset_name);
}

boost::optional<double>
media_type::
quality() const
{
    auto it = params_.find(quality_name);
    if(it == params_.end())
        return boost::none;
    auto const s = it->value();
    if(! is_decimal(s))
        detail::throw_system_error(
            MIME_ERR(error::bad_quality));
    double q = 0;
    auto const rv = std::from_chars(
        s.data(), s.data() + s.size(), q,
        std::chars_format::fixed);
    if( rv.ec != std::errc() ||
        rv.ptr != s.data() + s.size())
        detail::throw_system_error(
            MIME_ERR(error::bad_quality));
    return q;
}

void
media_type::
set_quality(double q)
{
    // also rejects NaN
    if(! (q >= 0.0 && q <= 1.0))
        detail::throw_out_of_range();
    if(read_only_)
        detail::throw_logic_error();
    char buf[8];
    auto const n = format_quality(q, buf);
    set_param(params_, quality_name,
        core::string_view(buf, n));
}

void
media_type::
remove_quality()
{
    if(read_only_)
        detail::throw_logic_error();
    params_.remove(quality_name);
}

//------------------------------------------------

media_type
media_type::
copy() const
{
    media_type mt;
    mt.type_ = type_;
    mt.subtype_ = subtype_;
    for(auto const& p : params_)
        mt.params_.add(p);
    return mt;
}

media_type
media_type::
copy_as_read_only() const
{
    media_type mt = copy();
    mt.params_.make_read_only();
    mt.read_only_ = true;
    return mt;
}

bool
media_type::
is_subset_of(
    media_type const& pattern) const noexcept
{
    if( pattern.type_ != "*" &&
        ! grammar::ci_is_equal(type_, pattern.type_))
        return false;

    if( pattern.subtype_ != "*" &&
        ! grammar::ci_is_equal(subtype_, pattern.subtype_))
        return false;

    for(auto const& p : pattern.params_)
    {
        // the weight is not part of the type
        if(grammar::ci_is_equal(p.name(), quality_name))
            continue;
        auto it = std::find(
            params_.begin(), params_.end(), p);
        if(it == params_.end())
            return false;
    }
    return true;
}

std::string
media_type::
to_string() const
{
    std::string s = mime_type();
    for(auto const& p : params_)
    {
        s.append("; ");
        s.append(p.to_string());
    }
    return s;
}

//------------------------------------------------

bool
operator==(
    media_type const& m0,
    media_type const& m1)
{
    return
        grammar::ci_is_equal(m0.type(), m1.type()) &&
        grammar::ci_is_equal(m0.subtype(), m1.subtype()) &&
        m0.params() == m1.params();
}

std::size_t
hash_value(
    media_type const& mt) noexcept
{
    std::size_t seed = grammar::ci_digest(mt.type());
    boost::hash_combine(
        seed, grammar::ci_digest(mt.subtype()));
    boost::hash_combine(
        seed, hash_value(mt.params()));
    return seed;
}

std::ostream&
operator<<(
    std::ostream& os,
    media_type const& mt)
{
    os << mt.to_string();
    return os;
}

//------------------------------------------------

namespace detail {

media_type
media_type_builder::
build(media_type_view const& v)
{
    media_type mt;
    mt.type_.assign(
        v.type.data(), v.type.size());
    mt.subtype_.assign(
        v.subtype.data(), v.subtype.size());
    for(auto const& p : v.params)
    {
        if(p.has_value)
            mt.params_.add(parameter(
                p.name, p.value));
        else
            mt.params_.add(parameter(
                p.name));
    }
    return mt;
}

} // detail

} // mime
