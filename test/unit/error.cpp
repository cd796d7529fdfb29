//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <mime/error.hpp>

#include <cstring>

#include "test_suite.hpp"

namespace mime {

class error_test
{
public:
    void
    check(error e, char const* msg)
    {
        auto const ec = make_error_code(e);
        BOOST_TEST_EQ(std::strcmp(ec.category().name(), "mime"), 0);
        BOOST_TEST_EQ(ec.message(), msg);
        BOOST_TEST(ec.category().message(static_cast<int>(e), nullptr, 0) == ec.message());

        system::error_code ec2 = e;
        BOOST_TEST(ec2 == e);
        BOOST_TEST(ec2 == ec);
    }

    void
    check(condition c, error e)
    {
        {
            auto const ec = make_error_code(e);
            BOOST_TEST_EQ(std::strcmp(ec.category().name(), "mime"), 0);
            BOOST_TEST(ec == c);
            BOOST_TEST(ec != (c == condition::format_error ?
                condition::limit_exceeded : condition::format_error));
        }
        {
            auto ec = make_error_condition(c);
            BOOST_TEST_EQ(std::strcmp(ec.category().name(), "mime"), 0);
            BOOST_TEST(ec == e);
        }
    }

    void
    run()
    {
        check(error::empty_value, "empty value");
        check(error::bad_type, "bad type");
        check(error::bad_parameter, "bad parameter");
        check(error::bad_quoted_string, "bad quoted-string");
        check(error::trailing_characters, "trailing characters");
        check(error::bad_quality, "bad quality");
        check(error::empty_list, "empty list");
        check(error::too_large, "too large");
        check(error::too_many_params, "too many parameters");
        check(error::too_many_elements, "too many elements");

        check(condition::format_error, error::empty_value);
        check(condition::format_error, error::bad_type);
        check(condition::format_error, error::bad_parameter);
        check(condition::format_error, error::bad_quoted_string);
        check(condition::format_error, error::trailing_characters);
        check(condition::format_error, error::bad_quality);
        check(condition::format_error, error::empty_list);
        check(condition::limit_exceeded, error::too_large);
        check(condition::limit_exceeded, error::too_many_params);
        check(condition::limit_exceeded, error::too_many_elements);

        BOOST_TEST_EQ(
            make_error_condition(condition::format_error).message(),
            "format error");
        BOOST_TEST_EQ(
            make_error_condition(condition::limit_exceeded).message(),
            "limit exceeded");

        system::error_code ec;
        BOOST_TEST(ec != condition::format_error);
        BOOST_TEST(ec != condition::limit_exceeded);
    }
};

TEST_SUITE(
    error_test,
    "mime.error");

} // mime
