//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <mime/parameter.hpp>

#include <mime/error.hpp>
#include <mime/parameter_list.hpp>

#include <boost/system/system_error.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "test_suite.hpp"

namespace mime {

struct parameter_test
{
    void
    testCtor()
    {
        {
            parameter p("custom");
            BOOST_TEST_EQ(p.name(), "custom");
            BOOST_TEST(! p.has_value());
            BOOST_TEST(p.value().empty());
            BOOST_TEST(! p.is_read_only());
        }
        {
            parameter p("custom", "value");
            BOOST_TEST_EQ(p.name(), "custom");
            BOOST_TEST(p.has_value());
            BOOST_TEST_EQ(p.value(), "value");
        }
        {
            parameter p("custom", "\"custom value\"");
            BOOST_TEST_EQ(p.value(), "\"custom value\"");
        }
        {
            parameter p("custom", "");
            BOOST_TEST(p.has_value());
            BOOST_TEST(p.value().empty());
        }

        BOOST_TEST_THROWS(parameter(""), std::invalid_argument);
        BOOST_TEST_THROWS(parameter("", "x"), std::invalid_argument);
        BOOST_TEST_THROWS(parameter("a b"), system::system_error);
        BOOST_TEST_THROWS(parameter("a=b"), system::system_error);
        BOOST_TEST_THROWS(parameter(" a"), system::system_error);
        BOOST_TEST_THROWS(parameter("a", "b c"), system::system_error);
        BOOST_TEST_THROWS(parameter("a", "\"b"), system::system_error);
        BOOST_TEST_THROWS(parameter("a", "b;"), system::system_error);

        try
        {
            parameter p("a", "\"b");
            BOOST_ERROR("exception expected");
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::bad_quoted_string);
            BOOST_TEST(e.code() == condition::format_error);
        }

        try
        {
            parameter p("a", "b c");
            BOOST_ERROR("exception expected");
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == error::bad_parameter);
        }
    }

    void
    testModifiers()
    {
        parameter p("custom");
        p.set_value("x");
        BOOST_TEST(p.has_value());
        BOOST_TEST_EQ(p.value(), "x");
        p.set_value("\"a\\\"b\"");
        BOOST_TEST_EQ(p.value(), "\"a\\\"b\"");
        BOOST_TEST_THROWS(p.set_value("a b"), system::system_error);
        BOOST_TEST_EQ(p.value(), "\"a\\\"b\"");
        p.remove_value();
        BOOST_TEST(! p.has_value());
        BOOST_TEST(p.value().empty());
        BOOST_TEST_EQ(p.to_string(), "custom");
    }

    void
    testReadOnly()
    {
        parameter_list l;
        l.add(parameter("a", "1"));
        l.make_read_only();
        parameter& p = *l.begin();
        BOOST_TEST(p.is_read_only());
        BOOST_TEST_THROWS(p.set_value("2"), std::logic_error);
        BOOST_TEST_THROWS(p.remove_value(), std::logic_error);
        BOOST_TEST_EQ(p.value(), "1");

        BOOST_TEST_THROWS(p = parameter("x"), std::logic_error);
        BOOST_TEST_THROWS(*l.begin() = parameter("x", "y"), std::logic_error);
        BOOST_TEST_EQ(p.name(), "a");
        BOOST_TEST_EQ(p.value(), "1");

        // a copy shares the state
        parameter p2 = p;
        BOOST_TEST(p2.is_read_only());

        // moving leaves a read-only parameter intact
        parameter p4(std::move(p));
        BOOST_TEST(p4.is_read_only());
        BOOST_TEST_EQ(p.name(), "a");
        BOOST_TEST_EQ(p.value(), "1");
        {
            parameter p5("b");
            p5 = std::move(p);
            BOOST_TEST(! p5.is_read_only());
            BOOST_TEST_EQ(p5.to_string(), "a=1");
            BOOST_TEST_EQ(p.to_string(), "a=1");
        }

        // assignment keeps this parameter modifiable
        {
            parameter p5("b");
            p5 = p2;
            BOOST_TEST(! p5.is_read_only());
            p5.set_value("9");
            BOOST_TEST_EQ(p5.to_string(), "a=9");
        }

        // adding to another list makes it modifiable
        parameter_list l2;
        auto& p3 = l2.add(p2);
        BOOST_TEST(! p3.is_read_only());
        p3.set_value("3");
        BOOST_TEST_EQ(p3.value(), "3");
    }

    void
    testEquals()
    {
        BOOST_TEST(parameter("a") == parameter("a"));
        BOOST_TEST(parameter("a") == parameter("A"));
        BOOST_TEST(parameter("a", "x") == parameter("A", "X"));
        BOOST_TEST(parameter("a", "\"x y\"") == parameter("a", "\"X Y\""));
        BOOST_TEST(parameter("a") == parameter("a", ""));
        BOOST_TEST(parameter("a") != parameter("b"));
        BOOST_TEST(parameter("a", "x") != parameter("a", "y"));
        BOOST_TEST(parameter("a", "x") != parameter("a"));
        BOOST_TEST(parameter("a", "x") != parameter("a", "\"x\""));

        BOOST_TEST_EQ(
            hash_value(parameter("Charset", "UTF-8")),
            hash_value(parameter("charset", "utf-8")));
        BOOST_TEST_EQ(
            hash_value(parameter("a")),
            hash_value(parameter("a", "")));
    }

    void
    testToString()
    {
        BOOST_TEST_EQ(parameter("custom").to_string(), "custom");
        BOOST_TEST_EQ(parameter("a", "b").to_string(), "a=b");
        BOOST_TEST_EQ(parameter("a", "").to_string(), "a=");
        BOOST_TEST_EQ(
            parameter("a", "\"b c\"").to_string(), "a=\"b c\"");

        std::stringstream ss;
        ss << parameter("charset", "utf-8");
        BOOST_TEST_EQ(ss.str(), "charset=utf-8");
    }

    void
    run()
    {
        testCtor();
        testModifiers();
        testReadOnly();
        testEquals();
        testToString();
    }
};

TEST_SUITE(
    parameter_test,
    "mime.parameter");

} // mime
