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
#include "CollectionRecorder.h"

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

CollectionRecorder::CollectionRecorder(const Logger::Handle &logger) :
    m_logger(logger),
    m_prefix("collections")
{
}

void CollectionRecorder::recordIfCollectionOrHomeSet(const DAVResource &resource,
                                                     const DAVService &service,
                                                     ServiceInfo &result)
{
    const Neon::URI &location = resource.getLocation();

    if (resource.resourceTypes() & service.collectionType()) {
        Neon::URI url = location;
        url.m_path = Neon::URI::normalizePath(url.m_path, true);
        DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "found %s collection at %s",
                  service.serviceType().c_str(),
                  url.toURL().c_str());
        result.m_collections[url] = CollectionInfo::fromResource(resource);
    }

    for (const std::string &href: resource.hrefs(service.homeSetProperty())) {
        Neon::URI homeSet = location.resolve(href);
        homeSet.m_path = Neon::URI::normalizePath(homeSet.m_path, true);
        DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "found %s home set %s",
                  service.serviceType().c_str(),
                  homeSet.toURL().c_str());
        result.m_homeSets.insert(homeSet);
    }
}

#ifdef ENABLE_UNIT_TESTS

class CollectionRecorderTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(CollectionRecorderTest);
    CPPUNIT_TEST(testCollection);
    CPPUNIT_TEST(testHomeSets);
    CPPUNIT_TEST(testWrongService);
    CPPUNIT_TEST_SUITE_END();

    static DAVResource calendar(const std::string &url)
    {
        DAVResource resource(Neon::URI::parse(url));
        resource.setProperty(PROP_RESOURCETYPE,
                             "<DAV:collection></DAV:collection>"
                             "<urn:ietf:params:xml:ns:caldav:calendar></urn:ietf:params:xml:ns:caldav:calendar>");
        resource.setProperty(PROP_DISPLAYNAME, "Home");
        return resource;
    }

    void testCollection()
    {
        CollectionRecorder recorder;
        ServiceInfo result;
        recorder.recordIfCollectionOrHomeSet(calendar("https://example.com/cal/home"), CalDAVService::get(), result);
        recorder.recordIfCollectionOrHomeSet(calendar("https://example.com/cal/home/"), CalDAVService::get(), result);
        CPPUNIT_ASSERT_EQUAL((size_t)1, result.m_collections.size());
        const Neon::URI &key = result.m_collections.begin()->first;
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/cal/home/"), key.toURL());
        CPPUNIT_ASSERT_EQUAL(std::string("Home"), result.m_collections.begin()->second.m_displayName);
        CPPUNIT_ASSERT(result.m_homeSets.empty());
    }

    void testHomeSets()
    {
        CollectionRecorder recorder;
        ServiceInfo result;
        DAVResource resource = calendar("https://example.com/dav/principals/alice/");
        resource.setProperty(PROP_CALENDAR_HOME_SET,
                             "<DAV:href>/dav/calendars/alice</DAV:href>"
                             "<DAV:href>https://other.example.com/shared/</DAV:href>"
                             "<DAV:href>relative/</DAV:href>");
        recorder.recordIfCollectionOrHomeSet(resource, CalDAVService::get(), result);
        recorder.recordIfCollectionOrHomeSet(resource, CalDAVService::get(), result);

        // both effects apply to the same resource
        CPPUNIT_ASSERT_EQUAL((size_t)1, result.m_collections.size());
        CPPUNIT_ASSERT_EQUAL((size_t)3, result.m_homeSets.size());
        CPPUNIT_ASSERT(result.m_homeSets.count(Neon::URI::parse("https://example.com/dav/calendars/alice/")));
        CPPUNIT_ASSERT(result.m_homeSets.count(Neon::URI::parse("https://other.example.com/shared/")));
        CPPUNIT_ASSERT(result.m_homeSets.count(Neon::URI::parse("https://example.com/dav/principals/alice/relative/")));
    }

    void testWrongService()
    {
        CollectionRecorder recorder;
        ServiceInfo result;
        DAVResource resource = calendar("https://example.com/cal/home/");
        resource.setProperty(PROP_CALENDAR_HOME_SET, "<DAV:href>/cal/</DAV:href>");
        recorder.recordIfCollectionOrHomeSet(resource, CardDAVService::get(), result);
        CPPUNIT_ASSERT(!result.isUseful());
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(CollectionRecorderTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
