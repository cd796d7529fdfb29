//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/parameter_list.hpp>
#include <mime/detail/except.hpp>

#include <boost/url/grammar/ci_string.hpp>
#include <algorithm>
#include <utility>

namespace mime {

parameter_list::
parameter_list(parameter_list&& other)
    : read_only_(other.read_only_)
{
    if(other.read_only_)
        v_ = other.v_;
    else
        v_ = std::move(other.v_);
}

parameter_list&
parameter_list::
operator=(parameter_list const& other)
{
    if(read_only_)
        detail::throw_logic_error();
    if(this == &other)
        return *this;
    v_ = other.v_;
    for(auto& p : v_)
        p.read_only_ = false;
    return *this;
}

parameter_list&
parameter_list::
operator=(parameter_list&& other)
{
    if(read_only_)
        detail::throw_logic_error();
    if(other.read_only_)
        return *this = other;
    if(this == &other)
        return *this;
    v_ = std::move(other.v_);
    return *this;
}

void
parameter_list::
make_read_only() noexcept
{
    read_only_ = true;
    for(auto& p : v_)
        p.read_only_ = true;
}

auto
parameter_list::
find(core::string_view name) noexcept ->
    iterator
{
    return std::find_if(
        v_.begin(), v_.end(),
        [name](parameter const& p)
        {
            return grammar::ci_is_equal(
                p.name(), name);
        });
}

auto
parameter_list::
find(core::string_view name) const noexcept ->
    const_iterator
{
    return std::find_if(
        v_.begin(), v_.end(),
        [name](parameter const& p)
        {
            return grammar::ci_is_equal(
                p.name(), name);
        });
}

parameter&
parameter_list::
add(parameter p)
{
    if(read_only_)
        detail::throw_logic_error();
    p.read_only_ = false;
    v_.push_back(std::move(p));
    return v_.back();
}

bool
parameter_list::
remove(parameter const& p)
{
    return remove(p.name());
}

bool
parameter_list::
remove(core::string_view name)
{
    if(read_only_)
        detail::throw_logic_error();
    auto it = find(name);
    if(it == v_.end())
        return false;
    v_.erase(it);
    return true;
}

void
parameter_list::
clear()
{
    if(read_only_)
        detail::throw_logic_error();
    v_.clear();
}

//------------------------------------------------

bool
operator==(
    parameter_list const& l0,
    parameter_list const& l1)
{
    if(l0.size() != l1.size())
        return false;
    // each parameter in l1 matches at most once
    std::vector<bool> used(l1.size());
    for(auto const& p : l0)
    {
        std::size_t i = 0;
        for(auto const& q : l1)
        {
            if(! used[i] && p == q)
                break;
            ++i;
        }
        if(i == l1.size())
            return false;
        used[i] = true;
    }
    return true;
}

std::size_t
hash_value(
    parameter_list const& l) noexcept
{
    // order-independent
    std::size_t h = 0;
    for(auto const& p : l)
        h += hash_value(p);
    return h;
}

} // mime
