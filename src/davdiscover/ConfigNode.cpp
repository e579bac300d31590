/*
 * Copyright (C) 2009 Patrick Ohly <patrick.ohly@gmx.de>
 * Copyright (C) 2009 Intel Corporation
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) version 3.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301  USA
 */

#include "config.h"
#include <davdiscover/ConfigNode.h>

#include <boost/algorithm/string/predicate.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include <davdiscover/IniConfigNode.h>
# include <davdiscover/StringDataBlob.h>
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

bool ConfigNode::getProperty(const std::string &property, std::string &value) const
{
    InitStateString str = readProperty(property);
    if (!str.wasSet()) {
        return false;
    }
    value = str.get();
    return true;
}

bool ConfigNode::getProperty(const std::string &property, bool &value) const
{
    InitStateString str = readProperty(property);
    if (!str.wasSet()) {
        return false;
    }
    if (boost::iequals(str.get(), "true") ||
        boost::iequals(str.get(), "yes") ||
        boost::iequals(str.get(), "on") ||
        str.get() == "1") {
        value = true;
        return true;
    } else if (boost::iequals(str.get(), "false") ||
               boost::iequals(str.get(), "no") ||
               boost::iequals(str.get(), "off") ||
               str.get() == "0") {
        value = false;
        return true;
    }
    return false;
}

#ifdef ENABLE_UNIT_TESTS

class ConfigNodeTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(ConfigNodeTest);
    CPPUNIT_TEST(testTyped);
    CPPUNIT_TEST(testFlush);
    CPPUNIT_TEST_SUITE_END();

    void testTyped()
    {
        std::shared_ptr<std::string> data(new std::string("timeout = 30\n"
                                                          "# comment = ignored\n"
                                                          "SSLVerifyServer = off\n"
                                                          "  user   =  joe  \n"
                                                          "broken\n"));
        IniHashConfigNode node(std::make_shared<StringDataBlob>("test.ini", data, true));
        int timeout = 0;
        CPPUNIT_ASSERT(node.getProperty("timeout", timeout));
        CPPUNIT_ASSERT_EQUAL(30, timeout);
        bool verify = true;
        CPPUNIT_ASSERT(node.getProperty("sslverifyserver", verify));
        CPPUNIT_ASSERT(!verify);
        std::string user;
        CPPUNIT_ASSERT(node.getProperty("user", user));
        CPPUNIT_ASSERT_EQUAL(std::string("joe"), user);
        CPPUNIT_ASSERT(!node.getProperty("comment", user));
        CPPUNIT_ASSERT(!node.getProperty("broken", user));

        StringMap props;
        node.readProperties(props);
        CPPUNIT_ASSERT_EQUAL((size_t)3, props.size());
    }

    void testFlush()
    {
        std::shared_ptr<StringDataBlob> blob(new StringDataBlob("out.ini", std::shared_ptr<std::string>(), false));
        IniHashConfigNode node(blob);
        CPPUNIT_ASSERT(!node.exists());
        node.setProperty("b", 1);
        node.setProperty("a", true);
        node.setProperty("c", "x y");
        node.flush();
        CPPUNIT_ASSERT(node.exists());
        CPPUNIT_ASSERT_EQUAL(std::string("a = true\n"
                                         "b = 1\n"
                                         "c = x y\n"),
                             *blob->getData());
        node.removeProperty("B");
        node.flush();
        CPPUNIT_ASSERT_EQUAL(std::string("a = true\n"
                                         "c = x y\n"),
                             *blob->getData());
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(ConfigNodeTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
