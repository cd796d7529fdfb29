//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/rfc/detail/rules.hpp"
#include <mime/rfc/quoted_token_rule.hpp>

#include <boost/url/grammar/parse.hpp>

namespace mime {
namespace detail {

auto
list_element_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    auto const it0 = it;
    while(it != end)
    {
        if(*it == ',')
            break;
        if(*it != '"')
        {
            ++it;
            continue;
        }
        auto rv = grammar::parse(
            it, end, quoted_token_rule);
        if(! rv)
        {
            // malformed, the rest is one element
            it = end;
        }
    }
    return core::string_view(
        it0, static_cast<
            std::size_t>(it - it0));
}

} // detail
} // mime
