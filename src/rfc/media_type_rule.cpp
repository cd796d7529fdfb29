//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/rfc/media_type_rule.hpp>
#include <mime/rfc/ows_rule.hpp>
#include <mime/rfc/token_rule.hpp>
#include <mime/error.hpp>

#include <boost/url/grammar/parse.hpp>

namespace mime {
namespace implementation_defined {

auto
media_type_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    value_type t;

    auto type = grammar::parse(
        it, end, token_rule);
    if(! type)
        MIME_RETURN_EC(error::bad_type);
    t.type = *type;

    grammar::parse(it, end, ows_rule).value();
    if( it == end ||
        *it != '/')
        MIME_RETURN_EC(error::bad_type);
    ++it;
    grammar::parse(it, end, ows_rule).value();

    auto subtype = grammar::parse(
        it, end, token_rule);
    if(! subtype)
        MIME_RETURN_EC(error::bad_type);
    t.subtype = *subtype;

    grammar::parse(it, end, ows_rule).value();

    auto params = grammar::parse(
        it, end, parameters_rule);
    if(! params)
        return params.error();
    t.params = *params;

    if( it != end &&
        *it == ';')
    {
        ++it;
        grammar::parse(it, end, ows_rule).value();
        if( it != end &&
            *it != ',')
        {
            // report a malformed quoted-string
            // rather than the semicolon before it
            auto rv = grammar::parse(
                it, end, parameter_rule);
            if( rv.has_error() &&
                rv.error() == error::bad_quoted_string)
                return rv.error();
            MIME_RETURN_EC(error::bad_parameter);
        }
    }

    return t;
}

} // implementation_defined
} // mime
