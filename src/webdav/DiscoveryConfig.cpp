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
#include "DiscoveryConfig.h"

#include <davdiscover/util.h>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include <davdiscover/IniConfigNode.h>
# include <davdiscover/StringDataBlob.h>
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

CollectionInfo CollectionInfo::fromResource(const DAVResource &resource)
{
    CollectionInfo info;
    int types = resource.resourceTypes();
    if (types & DAVResource::CALENDAR) {
        info.m_type = CALENDAR;
    } else if (types & DAVResource::ADDRESSBOOK) {
        info.m_type = ADDRESS_BOOK;
    }

    Neon::URI url = resource.getLocation();
    url.m_path = Neon::URI::normalizePath(url.m_path, true);
    info.m_url = url.toURL();

    info.m_readOnly = !resource.canWrite();
    info.m_displayName = resource.text(PROP_DISPLAYNAME);
    if (info.m_type == ADDRESS_BOOK) {
        info.m_description = resource.text(PROP_ADDRESSBOOK_DESCRIPTION);
    } else {
        info.m_description = resource.text(PROP_CALENDAR_DESCRIPTION);
        info.m_color = resource.text(PROP_CALENDAR_COLOR);
        info.m_timezone = resource.text(PROP_CALENDAR_TIMEZONE);
    }
    info.m_supportsVEVENT = resource.supportsComponent("VEVENT");
    info.m_supportsVTODO = resource.supportsComponent("VTODO");
    return info;
}

std::string CollectionInfo::typeToString(Type type)
{
    switch (type) {
    case CALENDAR:
        return "calendar";
    case ADDRESS_BOOK:
        return "address book";
    case UNKNOWN:
        break;
    }
    return "unknown";
}

std::string CollectionInfo::toString() const
{
    std::string res = m_url;
    res += " (";
    res += typeToString(m_type);
    if (!m_displayName.empty()) {
        res += ", \"";
        res += m_displayName;
        res += "\"";
    }
    if (m_readOnly) {
        res += ", read-only";
    }
    if (m_type == CALENDAR) {
        if (!m_color.empty()) {
            res += ", color ";
            res += m_color;
        }
        if (!m_supportsVEVENT) {
            res += ", no events";
        }
        if (!m_supportsVTODO) {
            res += ", no tasks";
        }
    }
    res += ")";
    return res;
}

bool ServiceInfo::isUseful() const
{
    return !m_principal.empty() ||
        !m_homeSets.empty() ||
        !m_collections.empty();
}

std::string ServiceInfo::toString(const std::string &indent) const
{
    std::string res;
    res += indent + "principal: " + (m_principal.empty() ? std::string("<unknown>") : m_principal.toURL()) + "\n";
    for (const Neon::URI &homeSet: m_homeSets) {
        res += indent + "home set: " + homeSet.toURL() + "\n";
    }
    for (const auto &entry: m_collections) {
        res += indent + "collection: " + entry.second.toString() + "\n";
    }
    return res;
}

void ServiceInfo::save(ConfigNode &node, const std::string &prefix) const
{
    StringEscape escape('%', StringEscape::INI_VALUE);

    if (!m_principal.empty()) {
        node.setProperty(prefix + ".principal", m_principal.toURL());
    }
    int index = 0;
    for (const Neon::URI &homeSet: m_homeSets) {
        node.setProperty(StringPrintf("%s.homeset.%d", prefix.c_str(), index++), homeSet.toURL());
    }
    index = 0;
    for (const auto &entry: m_collections) {
        const CollectionInfo &info = entry.second;
        std::string key = StringPrintf("%s.collection.%d.", prefix.c_str(), index++);
        node.setProperty(key + "url", info.m_url);
        node.setProperty(key + "type", CollectionInfo::typeToString(info.m_type));
        node.setProperty(key + "readonly", info.m_readOnly);
        if (!info.m_displayName.empty()) {
            node.setProperty(key + "displayname", escape.escape(info.m_displayName));
        }
        if (!info.m_description.empty()) {
            node.setProperty(key + "description", escape.escape(info.m_description));
        }
        if (info.m_type == CollectionInfo::CALENDAR) {
            if (!info.m_color.empty()) {
                node.setProperty(key + "color", info.m_color);
            }
            if (!info.m_timezone.empty()) {
                node.setProperty(key + "timezone", escape.escape(info.m_timezone));
            }
            node.setProperty(key + "vevent", info.m_supportsVEVENT);
            node.setProperty(key + "vtodo", info.m_supportsVTODO);
        }
    }
}

std::string Configuration::toString() const
{
    std::string res;
    res += "username: " + m_userName + "\n";
    res += "password: " + std::string(m_password.empty() ? "" : "*****") + "\n";
    res += std::string("preemptive authentication: ") + (m_preemptive ? "yes" : "no") + "\n";
    res += "CardDAV:";
    res += m_contacts ? "\n" + m_contacts->toString() : std::string(" not found\n");
    res += "CalDAV:";
    res += m_calendar ? "\n" + m_calendar->toString() : std::string(" not found\n");
    return res;
}

void Configuration::save(ConfigNode &node) const
{
    node.clear();
    node.setProperty("username", m_userName);
    node.setProperty("password", m_password);
    node.setProperty("preemptive", m_preemptive);
    if (m_contacts) {
        m_contacts->save(node, "contacts");
    }
    if (m_calendar) {
        m_calendar->save(node, "calendar");
    }
    node.setProperty("logs", StringEscape::escape(m_logs, '%', StringEscape::INI_VALUE));
}

#ifdef ENABLE_UNIT_TESTS

class DiscoveryConfigTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(DiscoveryConfigTest);
    CPPUNIT_TEST(testCollection);
    CPPUNIT_TEST(testUseful);
    CPPUNIT_TEST(testToString);
    CPPUNIT_TEST(testSave);
    CPPUNIT_TEST_SUITE_END();

    void testCollection()
    {
        DAVResource resource(Neon::URI::parse("https://dav.example.com/cal/work"));
        resource.setProperty(PROP_RESOURCETYPE, "<DAV:collection></DAV:collection><urn:ietf:params:xml:ns:caldav:calendar></urn:ietf:params:xml:ns:caldav:calendar>");
        resource.setProperty(PROP_DISPLAYNAME, "Work");
        resource.setProperty(PROP_CALENDAR_COLOR, "#FF0000");
        resource.setProperty(PROP_CURRENT_USER_PRIVILEGE_SET, "<DAV:privilege><DAV:read></DAV:read></DAV:privilege>");
        resource.setProperty(PROP_SUPPORTED_CALENDAR_COMPONENT_SET, "<urn:ietf:params:xml:ns:caldav:comp name=\"VTODO\"></urn:ietf:params:xml:ns:caldav:comp>");

        CollectionInfo info = CollectionInfo::fromResource(resource);
        CPPUNIT_ASSERT_EQUAL(CollectionInfo::CALENDAR, info.m_type);
        CPPUNIT_ASSERT_EQUAL(std::string("https://dav.example.com/cal/work/"), info.m_url);
        CPPUNIT_ASSERT_EQUAL(std::string("Work"), info.m_displayName);
        CPPUNIT_ASSERT_EQUAL(std::string("#FF0000"), info.m_color);
        CPPUNIT_ASSERT(info.m_readOnly);
        CPPUNIT_ASSERT(!info.m_supportsVEVENT);
        CPPUNIT_ASSERT(info.m_supportsVTODO);

        DAVResource book(Neon::URI::parse("https://dav.example.com/book/", true));
        book.setProperty(PROP_RESOURCETYPE, "<DAV:collection></DAV:collection><urn:ietf:params:xml:ns:carddav:addressbook></urn:ietf:params:xml:ns:carddav:addressbook>");
        book.setProperty(PROP_ADDRESSBOOK_DESCRIPTION, "private");
        info = CollectionInfo::fromResource(book);
        CPPUNIT_ASSERT_EQUAL(CollectionInfo::ADDRESS_BOOK, info.m_type);
        CPPUNIT_ASSERT_EQUAL(std::string("private"), info.m_description);
        CPPUNIT_ASSERT(!info.m_readOnly);
    }

    void testUseful()
    {
        ServiceInfo service;
        CPPUNIT_ASSERT(!service.isUseful());
        service.m_homeSets.insert(Neon::URI::parse("https://example.com/home/", true));
        CPPUNIT_ASSERT(service.isUseful());

        ServiceInfo principal;
        principal.m_principal = Neon::URI::parse("https://example.com/p/");
        CPPUNIT_ASSERT(principal.isUseful());
    }

    void testToString()
    {
        Configuration config;
        config.m_userName = "alice";
        config.m_password = "secret";
        boost::shared_ptr<ServiceInfo> calendar(new ServiceInfo);
        calendar->m_principal = Neon::URI::parse("https://example.com/principals/alice/");
        config.m_calendar = calendar;
        config.m_logs = "should not be shown";

        std::string str = config.toString();
        CPPUNIT_ASSERT_EQUAL(std::string("username: alice\n"
                                         "password: *****\n"
                                         "preemptive authentication: no\n"
                                         "CardDAV: not found\n"
                                         "CalDAV:\n"
                                         "  principal: https://example.com/principals/alice/\n"),
                             str);
    }

    void testSave()
    {
        Configuration config;
        config.m_userName = "alice";
        config.m_preemptive = true;
        boost::shared_ptr<ServiceInfo> contacts(new ServiceInfo);
        contacts->m_homeSets.insert(Neon::URI::parse("https://example.com/a/", true));
        contacts->m_homeSets.insert(Neon::URI::parse("https://example.com/b/", true));
        CollectionInfo info;
        info.m_type = CollectionInfo::ADDRESS_BOOK;
        info.m_url = "https://example.com/a/book/";
        info.m_displayName = "x = y";
        contacts->m_collections[Neon::URI::parse(info.m_url)] = info;
        config.m_contacts = contacts;
        config.m_logs = "line 1\nline 2\n";

        std::shared_ptr<StringDataBlob> blob(new StringDataBlob("result.ini", std::shared_ptr<std::string>(), false));
        IniHashConfigNode node(blob);
        node.setProperty("stale", "value");
        config.save(node);
        node.flush();
        CPPUNIT_ASSERT_EQUAL(std::string("contacts.collection.0.displayname = x %3d y\n"
                                         "contacts.collection.0.readonly = false\n"
                                         "contacts.collection.0.type = address book\n"
                                         "contacts.collection.0.url = https://example.com/a/book/\n"
                                         "contacts.homeset.0 = https://example.com/a/\n"
                                         "contacts.homeset.1 = https://example.com/b/\n"
                                         "logs = line 1%0aline 2%0a\n"
                                         "password = \n"
                                         "preemptive = true\n"
                                         "username = alice\n"),
                             *blob->getData());
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(DiscoveryConfigTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
