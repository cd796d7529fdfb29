//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/rfc/detail/rules.hpp"

#include "test_suite.hpp"

namespace mime {

struct list_element_rule_test
{
    void
    check(
        core::string_view s,
        core::string_view element)
    {
        auto it = s.data();
        auto const end = it + s.size();
        auto rv = detail::list_element_rule.parse(it, end);
        if(! BOOST_TEST(rv.has_value()))
            return;
        BOOST_TEST_EQ(*rv, element);
        BOOST_TEST(it == rv->data() + rv->size());
    }

    void
    run()
    {
        check("", "");
        check(",", "");
        check(" ,x", " ");
        check("text/plain", "text/plain");
        check("text/plain, text/html", "text/plain");
        check("a; x=\"1,2\", b", "a; x=\"1,2\"");
        check("a; x=\"\\\",\", b", "a; x=\"\\\",\"");
        check("a; x=\"1,2", "a; x=\"1,2");
        check("\"", "\"");
    }
};

TEST_SUITE(
    list_element_rule_test,
    "mime.list_element_rule");

} // mime
