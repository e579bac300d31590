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
#include "DAVProperties.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <string.h>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

static const char DAV[] = "DAV:";
static const char CALDAV[] = "urn:ietf:params:xml:ns:caldav";
static const char CARDDAV[] = "urn:ietf:params:xml:ns:carddav";
static const char APPLE_ICAL[] = "http://apple.com/ns/ical/";

static const ne_propname propertyNames[PROP_MAX] = {
    { DAV, "resourcetype" },
    { DAV, "displayname" },
    { DAV, "current-user-principal" },
    { DAV, "current-user-privilege-set" },
    { CALDAV, "calendar-home-set" },
    { CALDAV, "calendar-description" },
    { APPLE_ICAL, "calendar-color" },
    { CALDAV, "calendar-timezone" },
    { CALDAV, "supported-calendar-component-set" },
    { CARDDAV, "addressbook-home-set" },
    { CARDDAV, "addressbook-description" }
};

const ne_propname &PropertyName(PropertyKind kind)
{
    return propertyNames[kind];
}

std::string PropertyKey(PropertyKind kind)
{
    const ne_propname &name = PropertyName(kind);
    return std::string(name.nspace) + ":" + name.name;
}

bool PropertyKindFromName(const ne_propname &name, PropertyKind &kind)
{
    for (int i = 0; i < PROP_MAX; i++) {
        if (name.nspace && name.name &&
            !strcmp(propertyNames[i].nspace, name.nspace) &&
            !strcmp(propertyNames[i].name, name.name)) {
            kind = PropertyKind(i);
            return true;
        }
    }
    return false;
}

std::string extractHREF(const std::string &propval)
{
    // all additional parameters after opening resp. closing tag
    static const std::string hrefStart = "<DAV:href";
    static const std::string hrefEnd = "</DAV:href";
    size_t start = propval.find(hrefStart);
    start = propval.find('>', start);
    if (start != propval.npos) {
        start++;
        size_t end = propval.find(hrefEnd, start);
        if (end != propval.npos) {
            return boost::trim_copy(propval.substr(start, end - start));
        }
    }
    return "";
}

std::list<std::string> extractHREFs(const std::string &propval)
{
    std::list<std::string> res;

    // all additional parameters after opening resp. closing tag
    static const std::string hrefStart = "<DAV:href";
    static const std::string hrefEnd = "</DAV:href";
    size_t current = 0;
    while (current < propval.size()) {
        size_t start = propval.find(hrefStart, current);
        start = propval.find('>', start);
        if (start != propval.npos) {
            start++;
            size_t end = propval.find(hrefEnd, start);
            if (end != propval.npos) {
                res.push_back(boost::trim_copy(propval.substr(start, end - start)));
                current = end;
            } else {
                break;
            }
        } else {
            break;
        }
    }
    return res;
}

/**
 * Checks for an element in a value formatted by neon. The tag
 * must be followed by the end of the tag or its attributes, so
 * that "<DAV:write" does not match "<DAV:write-properties".
 */
static bool hasElement(const std::string &value, const std::string &tag)
{
    size_t pos = 0;
    while ((pos = value.find(tag, pos)) != value.npos) {
        pos += tag.size();
        if (pos == value.size() ||
            value[pos] == '>' ||
            value[pos] == ' ' ||
            value[pos] == '/') {
            return true;
        }
    }
    return false;
}

void DAVResource::setProperty(PropertyKind kind, const std::string &value)
{
    m_props[kind] = boost::trim_copy_if(value, boost::is_space());
}

InitStateString DAVResource::getProperty(PropertyKind kind) const
{
    Props_t::const_iterator it = m_props.find(kind);
    if (it != m_props.end()) {
        return InitStateString(it->second, true);
    }
    return InitStateString();
}

int DAVResource::resourceTypes() const
{
    int types = 0;
    std::string type = getProperty(PROP_RESOURCETYPE);
    if (hasElement(type, "<DAV:collection")) {
        types |= COLLECTION;
    }
    if (hasElement(type, "<DAV:principal")) {
        types |= PRINCIPAL;
    }
    // also allow "caldavcalendar" and "carddavaddressbook"
    // (caused by invalid Neon string concatenation?!)
    if (hasElement(type, "<urn:ietf:params:xml:ns:caldav:calendar") ||
        hasElement(type, "<urn:ietf:params:xml:ns:caldavcalendar")) {
        types |= CALENDAR;
    }
    if (hasElement(type, "<urn:ietf:params:xml:ns:carddav:addressbook") ||
        hasElement(type, "<urn:ietf:params:xml:ns:carddavaddressbook")) {
        types |= ADDRESSBOOK;
    }
    return types;
}

bool DAVResource::canWrite() const
{
    InitStateString privileges = getProperty(PROP_CURRENT_USER_PRIVILEGE_SET);
    if (!privileges.wasSet()) {
        return true;
    }
    // Beware of the double vs. single colon oddity from libneon.
    static const char * const granting[] = {
        "<DAV:write", "<DAV::write",
        "<DAV:write-content", "<DAV::write-content",
        "<DAV:all", "<DAV::all",
        NULL
    };
    for (const char * const *tag = granting; *tag; ++tag) {
        if (hasElement(privileges, *tag)) {
            return true;
        }
    }
    return false;
}

bool DAVResource::supportsComponent(const std::string &component) const
{
    InitStateString comps = getProperty(PROP_SUPPORTED_CALENDAR_COMPONENT_SET);
    if (!comps.wasSet() ||
        comps.get().find("name=") == std::string::npos) {
        // nothing known about restrictions
        return true;
    }
    return comps.get().find("\"" + component + "\"") != std::string::npos ||
        comps.get().find("'" + component + "'") != std::string::npos;
}

std::string DAVResource::dump() const
{
    std::string res;
    for (const Props_t::value_type &entry: m_props) {
        res += StringPrintf("%s = %s\n",
                            PropertyKey(entry.first).c_str(),
                            entry.second.c_str());
    }
    return res;
}

#ifdef ENABLE_UNIT_TESTS

class DAVPropertiesTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(DAVPropertiesTest);
    CPPUNIT_TEST(testNames);
    CPPUNIT_TEST(testHREF);
    CPPUNIT_TEST(testResourceType);
    CPPUNIT_TEST(testPrivileges);
    CPPUNIT_TEST(testComponents);
    CPPUNIT_TEST_SUITE_END();

    void testNames()
    {
        CPPUNIT_ASSERT_EQUAL(std::string("DAV::resourcetype"), PropertyKey(PROP_RESOURCETYPE));
        CPPUNIT_ASSERT_EQUAL(std::string("urn:ietf:params:xml:ns:carddav:addressbook-home-set"),
                             PropertyKey(PROP_ADDRESSBOOK_HOME_SET));
        ne_propname name = { "urn:ietf:params:xml:ns:caldav", "calendar-home-set" };
        PropertyKind kind = PROP_MAX;
        CPPUNIT_ASSERT(PropertyKindFromName(name, kind));
        CPPUNIT_ASSERT_EQUAL(PROP_CALENDAR_HOME_SET, kind);
        ne_propname unknown = { "DAV:", "getetag" };
        CPPUNIT_ASSERT(!PropertyKindFromName(unknown, kind));
    }

    void testHREF()
    {
        std::string value = "<DAV:href>/a/</DAV:href>\n  <DAV:href xmlns:x='y'> /b/ </DAV:href>";
        CPPUNIT_ASSERT_EQUAL(std::string("/a/"), extractHREF(value));
        std::list<std::string> hrefs = extractHREFs(value);
        CPPUNIT_ASSERT_EQUAL((size_t)2, hrefs.size());
        CPPUNIT_ASSERT_EQUAL(std::string("/b/"), hrefs.back());
        CPPUNIT_ASSERT_EQUAL(std::string(""), extractHREF("plain"));
        CPPUNIT_ASSERT(extractHREFs("").empty());
    }

    void testResourceType()
    {
        DAVResource res;
        CPPUNIT_ASSERT_EQUAL(0, res.resourceTypes());
        res.setProperty(PROP_RESOURCETYPE,
                        "<DAV:collection></DAV:collection>"
                        "<urn:ietf:params:xml:ns:caldav:calendar></urn:ietf:params:xml:ns:caldav:calendar>");
        CPPUNIT_ASSERT_EQUAL((int)(DAVResource::COLLECTION|DAVResource::CALENDAR), res.resourceTypes());
        res.setProperty(PROP_RESOURCETYPE,
                        "<DAV:collection></DAV:collection>"
                        "<urn:ietf:params:xml:ns:carddavaddressbook></urn:ietf:params:xml:ns:carddavaddressbook>");
        CPPUNIT_ASSERT_EQUAL((int)(DAVResource::COLLECTION|DAVResource::ADDRESSBOOK), res.resourceTypes());
        res.setProperty(PROP_RESOURCETYPE, "<DAV:principal/>");
        CPPUNIT_ASSERT_EQUAL((int)DAVResource::PRINCIPAL, res.resourceTypes());
        res.setProperty(PROP_RESOURCETYPE, "<DAV:collection></DAV:collection><urn:ietf:params:xml:ns:caldav:calendar-proxy></urn:ietf:params:xml:ns:caldav:calendar-proxy>");
        CPPUNIT_ASSERT_EQUAL((int)DAVResource::COLLECTION, res.resourceTypes());
    }

    void testPrivileges()
    {
        DAVResource res;
        CPPUNIT_ASSERT(res.canWrite());
        res.setProperty(PROP_CURRENT_USER_PRIVILEGE_SET,
                        "<DAV:privilege><DAV:read></DAV:read></DAV:privilege>");
        CPPUNIT_ASSERT(!res.canWrite());
        res.setProperty(PROP_CURRENT_USER_PRIVILEGE_SET,
                        "<DAV:privilege><DAV:read></DAV:read></DAV:privilege>"
                        "<DAV:privilege><DAV:write-properties></DAV:write-properties></DAV:privilege>");
        CPPUNIT_ASSERT(!res.canWrite());
        res.setProperty(PROP_CURRENT_USER_PRIVILEGE_SET,
                        "<DAV:privilege><DAV:write-content></DAV:write-content></DAV:privilege>");
        CPPUNIT_ASSERT(res.canWrite());
        res.setProperty(PROP_CURRENT_USER_PRIVILEGE_SET,
                        "<DAV:privilege><DAV:all/></DAV:privilege>");
        CPPUNIT_ASSERT(res.canWrite());
    }

    void testComponents()
    {
        DAVResource res;
        CPPUNIT_ASSERT(res.supportsComponent("VEVENT"));
        res.setProperty(PROP_SUPPORTED_CALENDAR_COMPONENT_SET,
                        "<urn:ietf:params:xml:ns:caldav:comp name=\"VTODO\"></urn:ietf:params:xml:ns:caldav:comp>");
        CPPUNIT_ASSERT(!res.supportsComponent("VEVENT"));
        CPPUNIT_ASSERT(res.supportsComponent("VTODO"));
        res.setProperty(PROP_SUPPORTED_CALENDAR_COMPONENT_SET,
                        "<urn:ietf:params:xml:ns:caldav:comp></urn:ietf:params:xml:ns:caldav:comp>");
        CPPUNIT_ASSERT(res.supportsComponent("VEVENT"));
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(DAVPropertiesTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
