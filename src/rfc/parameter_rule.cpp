//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/rfc/parameter_rule.hpp>
#include <mime/rfc/ows_rule.hpp>
#include <mime/rfc/quoted_token_rule.hpp>
#include <mime/rfc/token_rule.hpp>

#include <boost/url/grammar/delim_rule.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/tuple_rule.hpp>

namespace mime {
namespace implementation_defined {

auto
parameter_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    auto name = grammar::parse(it, end, token_rule);
    if(! name)
        return name.error();

    auto const it0 = it;
    grammar::parse(it, end, ows_rule).value();
    if( it == end ||
        *it != '=')
    {
        // bare name
        it = it0;
        return value_type{ *name, {}, false };
    }
    ++it;
    grammar::parse(it, end, ows_rule).value();

    // empty value
    if( it == end ||
        (*it != '"' && ! tchars(*it)))
        return value_type{ *name, {}, true };

    auto value = grammar::parse(
        it, end, quoted_token_rule);
    if(! value)
        return value.error();

    return value_type{ *name, *value, true };
}

auto
parameters_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    return grammar::parse(
        it, end, grammar::range_rule(
            grammar::tuple_rule(
                grammar::squelch(grammar::delim_rule(';')),
                grammar::squelch(ows_rule),
                parameter_rule,
                grammar::squelch(ows_rule))));
}

} // implementation_defined
} // mime
