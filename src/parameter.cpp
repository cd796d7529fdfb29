//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/parameter.hpp>
#include <mime/error.hpp>
#include <mime/detail/except.hpp>
#include <mime/rfc/quoted_token_rule.hpp>
#include <mime/rfc/token_rule.hpp>

#include <boost/container_hash/hash.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/parse.hpp>
#include <ostream>
#include <utility>

namespace mime {

namespace {

void
check_name(core::string_view name)
{
    if(name.empty())
        detail::throw_invalid_argument();
    if(! grammar::parse(name, token_rule))
        detail::throw_system_error(
            MIME_ERR(error::bad_parameter));
}

void
check_value(core::string_view value)
{
    if(value.empty())
        return;
    auto rv = grammar::parse(
        value, quoted_token_rule);
    if(rv)
        return;
    if(rv.error() == error::bad_quoted_string)
        detail::throw_system_error(rv.error());
    detail::throw_system_error(
        MIME_ERR(error::bad_parameter));
}

} // (anon)

parameter::
parameter(core::string_view name)
{
    check_name(name);
    name_.assign(name.data(), name.size());
}

parameter::
parameter(
    core::string_view name,
    core::string_view value)
{
    check_name(name);
    check_value(value);
    name_.assign(name.data(), name.size());
    value_.assign(value.data(), value.size());
    has_value_ = true;
}

parameter::
parameter(parameter&& other)
    : has_value_(other.has_value_)
    , read_only_(other.read_only_)
{
    if(other.read_only_)
    {
        name_ = other.name_;
        value_ = other.value_;
        return;
    }
    name_ = std::move(other.name_);
    value_ = std::move(other.value_);
}

parameter&
parameter::
operator=(parameter const& other)
{
    if(read_only_)
        detail::throw_logic_error();
    if(this == &other)
        return *this;
    name_ = other.name_;
    value_ = other.value_;
    has_value_ = other.has_value_;
    return *this;
}

parameter&
parameter::
operator=(parameter&& other)
{
    if(read_only_)
        detail::throw_logic_error();
    if(other.read_only_)
        return *this = other;
    if(this == &other)
        return *this;
    name_ = std::move(other.name_);
    value_ = std::move(other.value_);
    has_value_ = other.has_value_;
    return *this;
}

void
parameter::
set_value(core::string_view value)
{
    if(read_only_)
        detail::throw_logic_error();
    check_value(value);
    value_.assign(value.data(), value.size());
    has_value_ = true;
}

void
parameter::
remove_value()
{
    if(read_only_)
        detail::throw_logic_error();
    value_.clear();
    has_value_ = false;
}

std::string
parameter::
to_string() const
{
    if(! has_value_)
        return name_;
    std::string s;
    s.reserve(name_.size() + 1 + value_.size());
    s.append(name_);
    s.push_back('=');
    s.append(value_);
    return s;
}

//------------------------------------------------

bool
operator==(
    parameter const& p0,
    parameter const& p1) noexcept
{
    return
        grammar::ci_is_equal(p0.name(), p1.name()) &&
        grammar::ci_is_equal(p0.value(), p1.value());
}

std::size_t
hash_value(
    parameter const& p) noexcept
{
    std::size_t seed = grammar::ci_digest(p.name());
    boost::hash_combine(
        seed, grammar::ci_digest(p.value()));
    return seed;
}

std::ostream&
operator<<(
    std::ostream& os,
    parameter const& p)
{
    os << p.to_string();
    return os;
}

} // mime
