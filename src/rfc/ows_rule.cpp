//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <mime/rfc/ows_rule.hpp>
#include <mime/rfc/detail/ws.hpp>

namespace mime {
namespace implementation_defined {

auto
ows_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    auto const it0 = it;
    while(it != end)
    {
        if(detail::ws(*it))
        {
            ++it;
            continue;
        }
        // obs-fold
        if( *it == '\r' &&
            end - it >= 3 &&
            it[1] == '\n' &&
            detail::ws(it[2]))
        {
            it += 3;
            continue;
        }
        break;
    }
    return core::string_view(
        it0, static_cast<std::size_t>(it - it0));
}

} // implementation_defined
} // mime
