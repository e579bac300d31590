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

#ifdef ENABLE_UNIT_TESTS

#include "test.h"

#include <stdlib.h>
#include <iostream>
#include <set>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <pcrecpp.h>

#include <davdiscover/util.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

class SkipTest : public CppUnit::TestCase {
public:
    SkipTest(const std::string &name) :
        TestCase(name)
    {}
    void run (CppUnit::TestResult *result) {
        std::cerr << getName() << " *** skipped ***\n";
    }
};

void simplifyFilename(std::string &filename)
{
    size_t pos = 0;
    while (true) {
        pos = filename.find(":", pos);
        if (pos == filename.npos ) {
            break;
        }
        filename.replace(pos, 1, "_");
    }
    pos = 0;
    while (true) {
        pos = filename.find("__", pos);
        if (pos == filename.npos) {
            break;
        }
        filename.erase(pos, 1);
    }
}

CppUnit::Test *FilterTest(CppUnit::Test *test)
{
    static std::set<std::string> filter;
    static bool filterValid;

    if (!filterValid) {
        const char *str = getenv("DAVDISCOVER_TEST_SKIP");
        if (str) {
            boost::split(filter, str, boost::is_any_of(","));
        }
        filterValid = true;
    }

    std::string name = test->getName();
    if (TestNameMatches(name, filter)) {
        delete test;
        return new SkipTest(name);
    }

    return test;
}

bool TestNameMatches(const std::string &name, const std::set<std::string> &filter)
{
    for (const std::string &re: filter) {
        if (!re.empty() &&
            pcrecpp::RE(re).FullMatch(name)) {
            return true;
        }
    }
    return false;
}

class TestFilterTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(TestFilterTest);
    CPPUNIT_TEST(testRegex);
    CPPUNIT_TEST(testWholeName);
    CPPUNIT_TEST_SUITE_END();

    static std::set<std::string> parse(const char *str)
    {
        std::set<std::string> filter;
        boost::split(filter, str, boost::is_any_of(","));
        return filter;
    }

public:
    void testRegex()
    {
        std::set<std::string> filter = parse("ResourceFinderTest::testP.*,LogCollectTest::.*");
        CPPUNIT_ASSERT(TestNameMatches("ResourceFinderTest::testParallel", filter));
        CPPUNIT_ASSERT(TestNameMatches("ResourceFinderTest::testPrincipalResource", filter));
        CPPUNIT_ASSERT(!TestNameMatches("ResourceFinderTest::testWellKnown", filter));
        CPPUNIT_ASSERT(TestNameMatches("LogCollectTest::testLevel", filter));
    }

    void testWholeName()
    {
        std::set<std::string> filter = parse("ResourceFinderTest::testWellKnown,");
        CPPUNIT_ASSERT(TestNameMatches("ResourceFinderTest::testWellKnown", filter));
        // no partial matches, and the empty entry matches nothing
        CPPUNIT_ASSERT(!TestNameMatches("ResourceFinderTest", filter));
        CPPUNIT_ASSERT(!TestNameMatches("ResourceFinderTest::testWellKnownRedirect", filter));
        CPPUNIT_ASSERT(!TestNameMatches("", parse("")));
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(TestFilterTest);

DD_END_CXX

#endif // ENABLE_UNIT_TESTS
