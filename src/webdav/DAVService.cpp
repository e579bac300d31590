/*
 * Copyright (C) 2026 The davdiscover authors
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
#include "DAVService.h"

#include <algorithm>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

namespace {
const PropertyKind calDAVProps[] = {
    PROP_RESOURCETYPE,
    PROP_DISPLAYNAME,
    PROP_CALENDAR_COLOR,
    PROP_CALENDAR_DESCRIPTION,
    PROP_CALENDAR_TIMEZONE,
    PROP_CURRENT_USER_PRIVILEGE_SET,
    PROP_SUPPORTED_CALENDAR_COMPONENT_SET,
    PROP_CALENDAR_HOME_SET,
    PROP_CURRENT_USER_PRINCIPAL
};

const PropertyKind cardDAVProps[] = {
    PROP_RESOURCETYPE,
    PROP_DISPLAYNAME,
    PROP_ADDRESSBOOK_DESCRIPTION,
    PROP_ADDRESSBOOK_HOME_SET,
    PROP_CURRENT_USER_PRINCIPAL
};
}

const PropertyKinds &CalDAVService::probeProperties() const
{
    static const PropertyKinds props(calDAVProps,
                                     calDAVProps + sizeof(calDAVProps) / sizeof(calDAVProps[0]));
    return props;
}

const CalDAVService &CalDAVService::get()
{
    static const CalDAVService service;
    return service;
}

const PropertyKinds &CardDAVService::probeProperties() const
{
    static const PropertyKinds props(cardDAVProps,
                                     cardDAVProps + sizeof(cardDAVProps) / sizeof(cardDAVProps[0]));
    return props;
}

const CardDAVService &CardDAVService::get()
{
    static const CardDAVService service;
    return service;
}

#ifdef ENABLE_UNIT_TESTS

class DAVServiceTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(DAVServiceTest);
    CPPUNIT_TEST(testNames);
    CPPUNIT_TEST(testProps);
    CPPUNIT_TEST_SUITE_END();

    void testNames()
    {
        const DAVService &caldav = CalDAVService::get();
        const DAVService &carddav = CardDAVService::get();
        CPPUNIT_ASSERT_EQUAL(std::string("/.well-known/caldav"), caldav.wellKnownPath());
        CPPUNIT_ASSERT_EQUAL(std::string("/.well-known/carddav"), carddav.wellKnownPath());
        CPPUNIT_ASSERT_EQUAL(std::string("_caldavs._tcp.example.com"), caldav.srvName("example.com"));
        CPPUNIT_ASSERT_EQUAL(std::string("_carddavs._tcp.example.com"), carddav.srvName("example.com"));
        CPPUNIT_ASSERT_EQUAL(std::string("calendar-access"), caldav.capabilityToken());
        CPPUNIT_ASSERT_EQUAL(std::string("addressbook"), carddav.capabilityToken());
    }

    void testProps()
    {
        const PropertyKinds &cal = CalDAVService::get().probeProperties();
        CPPUNIT_ASSERT_EQUAL((size_t)9, cal.size());
        CPPUNIT_ASSERT_EQUAL(PROP_RESOURCETYPE, cal.front());
        CPPUNIT_ASSERT_EQUAL(PROP_CURRENT_USER_PRINCIPAL, cal.back());
        const PropertyKinds &card = CardDAVService::get().probeProperties();
        CPPUNIT_ASSERT_EQUAL((size_t)5, card.size());
        CPPUNIT_ASSERT(std::find(card.begin(), card.end(), PROP_ADDRESSBOOK_HOME_SET) != card.end());
        CPPUNIT_ASSERT(std::find(card.begin(), card.end(), PROP_CALENDAR_HOME_SET) == card.end());
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(DAVServiceTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
