//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <mime/parameter_list.hpp>

#include <stdexcept>
#include <utility>

#include "test_suite.hpp"

namespace mime {

struct parameter_list_test
{
    void
    testModifiers()
    {
        parameter_list l;
        BOOST_TEST(l.empty());
        BOOST_TEST_EQ(l.size(), 0u);
        BOOST_TEST(! l.is_read_only());

        auto& p = l.add(parameter("a", "1"));
        BOOST_TEST_EQ(p.name(), "a");
        l.add(parameter("b"));
        l.add(parameter("A", "2"));
        BOOST_TEST_EQ(l.size(), 3u);

        auto it = l.find("a");
        if(BOOST_TEST(it != l.end()))
            BOOST_TEST_EQ(it->value(), "1");
        BOOST_TEST(l.find("B") != l.end());
        BOOST_TEST(l.find("c") == l.end());

        // removes the first match only
        BOOST_TEST(l.remove(parameter("A", "x")));
        BOOST_TEST_EQ(l.size(), 2u);
        it = l.find("a");
        if(BOOST_TEST(it != l.end()))
            BOOST_TEST_EQ(it->value(), "2");
        BOOST_TEST(! l.remove("c"));
        BOOST_TEST_EQ(l.size(), 2u);
        BOOST_TEST(l.remove("b"));
        BOOST_TEST_EQ(l.size(), 1u);

        l.clear();
        BOOST_TEST(l.empty());

        parameter_list const& cl = l;
        BOOST_TEST(cl.find("a") == cl.end());
    }

    void
    testReadOnly()
    {
        parameter_list l;
        l.add(parameter("a", "1"));
        l.make_read_only();
        l.make_read_only();
        BOOST_TEST(l.is_read_only());
        BOOST_TEST_THROWS(l.add(parameter("b")), std::logic_error);
        BOOST_TEST_THROWS(l.remove("a"), std::logic_error);
        BOOST_TEST_THROWS(l.remove("c"), std::logic_error);
        BOOST_TEST_THROWS(l.clear(), std::logic_error);
        BOOST_TEST_THROWS(l.begin()->set_value("2"), std::logic_error);
        BOOST_TEST_EQ(l.size(), 1u);

        // assignment and swaps are modifications
        BOOST_TEST_THROWS(l = parameter_list(), std::logic_error);
        {
            parameter_list other;
            other.add(parameter("x"));
            BOOST_TEST_THROWS(l = other, std::logic_error);
        }
        BOOST_TEST_THROWS(*l.begin() = parameter("x"), std::logic_error);
        BOOST_TEST_EQ(l.size(), 1u);
        BOOST_TEST_EQ(l.begin()->to_string(), "a=1");

        // copies keep the state
        parameter_list l2 = l;
        BOOST_TEST(l2.is_read_only());
        BOOST_TEST_THROWS(l2.clear(), std::logic_error);

        // moving leaves a read-only list intact
        parameter_list l3(std::move(l));
        BOOST_TEST(l3.is_read_only());
        BOOST_TEST_EQ(l.size(), 1u);
        {
            parameter_list l4;
            l4 = std::move(l);
            BOOST_TEST(! l4.is_read_only());
            BOOST_TEST_EQ(l4.size(), 1u);
            BOOST_TEST(! l4.begin()->is_read_only());
            l4.begin()->set_value("2");
            BOOST_TEST_EQ(l4.begin()->value(), "2");
            BOOST_TEST_EQ(l.begin()->value(), "1");
            BOOST_TEST(l.is_read_only());
        }
    }

    void
    testEquals()
    {
        parameter_list l0;
        parameter_list l1;
        BOOST_TEST(l0 == l1);

        l0.add(parameter("a", "1"));
        l0.add(parameter("b"));
        BOOST_TEST(l0 != l1);

        l1.add(parameter("B"));
        l1.add(parameter("A", "1"));
        BOOST_TEST(l0 == l1);
        BOOST_TEST_EQ(hash_value(l0), hash_value(l1));

        l1.make_read_only();
        BOOST_TEST(l0 == l1);

        parameter_list l2;
        l2.add(parameter("a", "1"));
        l2.add(parameter("b", "2"));
        BOOST_TEST(l0 != l2);

        // a mutable list can be reassigned
        l2 = parameter_list();
        BOOST_TEST(l2.empty());
        l2 = l1;
        BOOST_TEST(l2 == l0);
        BOOST_TEST(! l2.is_read_only());
        BOOST_TEST(! l2.begin()->is_read_only());

        // duplicates count
        parameter_list d0;
        d0.add(parameter("a"));
        d0.add(parameter("a"));
        d0.add(parameter("b"));
        parameter_list d1;
        d1.add(parameter("a"));
        d1.add(parameter("b"));
        d1.add(parameter("b"));
        BOOST_TEST(d0 != d1);
        BOOST_TEST(d1 != d0);
    }

    void
    run()
    {
        testModifiers();
        testReadOnly();
        testEquals();
    }
};

TEST_SUITE(
    parameter_list_test,
    "mime.parameter_list");

} // mime
