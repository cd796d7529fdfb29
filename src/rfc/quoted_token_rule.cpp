//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/rfc/quoted_token_rule.hpp>
#include <mime/rfc/token_rule.hpp>
#include <mime/error.hpp>
#include "src/rfc/detail/rules.hpp"

#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>

namespace mime {
namespace implementation_defined {

auto
quoted_token_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    if(it == end)
        MIME_RETURN_EC(
            grammar::error::need_more);

    if(*it != '"')
    {
        auto rv = grammar::parse(
            it, end, token_rule);
        if(! rv)
            return rv.error();
        return value_type(
            *rv, rv->size(), false);
    }

    auto const it0 = it++;
    std::size_t n = 0;
    for(;;)
    {
        if(it == end)
            MIME_RETURN_EC(
                error::bad_quoted_string);
        if(*it == '"')
            break;
        if(*it == '\\')
        {
            ++it;
            if( it == end ||
                ! detail::qpchar(*it))
                MIME_RETURN_EC(
                    error::bad_quoted_string);
            ++it;
            ++n;
            continue;
        }
        if(! detail::qdtext(*it))
            MIME_RETURN_EC(
                error::bad_quoted_string);
        ++it;
        ++n;
    }
    ++it;
    return value_type(
        core::string_view(
            it0, static_cast<
                std::size_t>(it - it0)),
        n, true);
}

} // implementation_defined
} // mime
