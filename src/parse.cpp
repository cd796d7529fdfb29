//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/parse.hpp>
#include <mime/rfc/media_type_rule.hpp>
#include <mime/rfc/ows_rule.hpp>
#include "src/rfc/detail/rules.hpp"

#include <boost/url/grammar/parse.hpp>

namespace mime {

namespace {

system::result<media_type>
parse_one(
    core::string_view s,
    parser_config const& cfg)
{
    auto it = s.data();
    auto const end = it + s.size();

    grammar::parse(it, end, ows_rule).value();
    if(it == end)
        MIME_RETURN_EC(error::empty_value);

    auto rv = grammar::parse(
        it, end, media_type_rule);
    if(! rv)
        return rv.error();

    // a comma here belongs to a list
    if(it != end)
        MIME_RETURN_EC(error::trailing_characters);

    if(rv->params.size() > cfg.max_params)
        MIME_RETURN_EC(error::too_many_params);

    return detail::media_type_builder::build(*rv);
}

} // (anon)

system::result<media_type>
try_parse_media_type(
    core::string_view s,
    parser_config const& cfg)
{
    if(s.size() > cfg.max_size)
        MIME_RETURN_EC(error::too_large);
    return parse_one(s, cfg);
}

media_type
parse_media_type(
    core::string_view s,
    parser_config const& cfg)
{
    return try_parse_media_type(s, cfg).value();
}

//------------------------------------------------

namespace detail {

system::error_code
append_media_types(
    std::vector<media_type>& v,
    core::string_view s,
    parser_config const& cfg)
{
    if(s.size() > cfg.max_size)
        MIME_RETURN_EC(error::too_large);

    auto it = s.data();
    auto const end = it + s.size();
    for(;;)
    {
        auto const e = grammar::parse(
            it, end, list_element_rule).value();

        // skip empty elements
        auto eit = e.data();
        auto const eend = eit + e.size();
        grammar::parse(eit, eend, ows_rule).value();
        if(eit != eend)
        {
            if(v.size() >= cfg.max_elements)
                MIME_RETURN_EC(error::too_many_elements);
            auto rv = parse_one(e, cfg);
            if(! rv)
                return rv.error();
            v.push_back(std::move(*rv));
        }

        if(it == end)
            break;
        ++it; // ','
    }
    return {};
}

} // detail

} // mime
