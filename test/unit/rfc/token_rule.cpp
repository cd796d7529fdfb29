//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <mime/rfc/token_rule.hpp>

#include "test_helpers.hpp"

namespace mime {

struct token_rule_test
{
    void
    run()
    {
        bad(token_rule, "");
        bad(token_rule, " ");
        bad(token_rule, " x");
        bad(token_rule, "x ");
        bad(token_rule, "a b");
        bad(token_rule, "text/plain");
        bad(token_rule, "a,b");
        bad(token_rule, "a;b");
        bad(token_rule, "a=b");
        bad(token_rule, "\"x\"");
        bad(token_rule, "te\xc3\xa4xt");
        bad(token_rule, "a\x7f");

        ok(token_rule, "x");
        ok(token_rule, "*");
        ok(token_rule, "xhtml+xml");
        ok(token_rule,
            "!#$%&'*+-.^_`|~"
            "0123456789"
            "abcdefghijklmnopqrstuvwxyz"
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ");

        BOOST_TEST(tchars('a'));
        BOOST_TEST(tchars('~'));
        BOOST_TEST(! tchars('/'));
        BOOST_TEST(! tchars(' '));
        BOOST_TEST(! tchars('\x80'));
    }
};

TEST_SUITE(
    token_rule_test,
    "mime.token_rule");

} // mime
