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

/**
 * This file is used by source files which depend on CPPUnit and thus
 * the STL => using it here is allowed.
 */

#ifndef INCL_TEST_H
#define INCL_TEST_H
/** @cond DEV */

#include "config.h"

#include <davdiscover/declarations.h>

// ENABLE_UNIT_TESTS is set in config.h. It controls whether tests
// inside the library source code are compiled.
#ifdef ENABLE_UNIT_TESTS

// make common macros like CPPUNIT_TEST_ASSERT() available */
# include <cppunit/extensions/TestFactoryRegistry.h>
# include <cppunit/extensions/HelperMacros.h>
# include <set>
# include <string>

DD_BEGIN_CXX

// removes special characters like colons and slashes
extern void simplifyFilename(std::string &filename);

// redefine CPPUNIT_TEST so that we can filter tests
#undef CPPUNIT_TEST
#define CPPUNIT_TEST(testMethod) \
    CPPUNIT_TEST_SUITE_ADD_TEST( \
        ( FilterTest(new CPPUNIT_NS::TestCaller<TestFixtureType>( \
                     context.getTestNameFor( #testMethod), \
                     &TestFixtureType::testMethod, \
                     context.makeFixture() ) ) ) )

/**
 * replace test with dummy if filtered out via DAVDISCOVER_TEST_SKIP,
 * a comma separated list of regular expressions which must match
 * the whole test name
 */
CppUnit::Test *FilterTest(CppUnit::Test *test);

/** true if one of the regular expressions matches the whole name */
bool TestNameMatches(const std::string &name, const std::set<std::string> &filter);

DD_END_CXX

#endif // ENABLE_UNIT_TESTS

/** @endcond */

#endif // INCL_TEST_H
