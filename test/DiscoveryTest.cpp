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

#ifdef ENABLE_UNIT_TESTS

#include "test.h"

#include "ResourceFinder.h"
#include "DAVClient.h"
#include "DNSResolver.h"
#include "DiscoverySettings.h"

#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/shared_ptr.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

namespace {

const char * const RESOURCETYPE_PRINCIPAL = "<DAV:principal></DAV:principal>";
const char * const RESOURCETYPE_CALENDAR =
    "<DAV:collection></DAV:collection>"
    "<urn:ietf:params:xml:ns:caldav:calendar></urn:ietf:params:xml:ns:caldav:calendar>";
const char * const RESOURCETYPE_ADDRESSBOOK =
    "<DAV:collection></DAV:collection>"
    "<urn:ietf:params:xml:ns:carddav:addressbook></urn:ietf:params:xml:ns:carddav:addressbook>";

std::string hrefProp(const std::string &href)
{
    return "<DAV:href>" + href + "</DAV:href>";
}

size_t countOccurrences(const std::string &haystack, const std::string &needle)
{
    size_t count = 0;
    size_t pos = 0;
    while ((pos = haystack.find(needle, pos)) != haystack.npos) {
        count++;
        pos += needle.size();
    }
    return count;
}

}

/**
 * What a set of fake WebDAV servers know, keyed by absolute URL.
 */
struct FakeServer
{
    std::map<std::string, DAVResource> m_resources;
    std::map<std::string, std::set<std::string> > m_capabilities;
    /** requests for these URLs fail */
    std::map<std::string, DAVStatus> m_errors;

    /** resource with the URL as location */
    DAVResource &add(const std::string &url)
    {
        DAVResource &resource = m_resources[url];
        resource.setLocation(Neon::URI::parse(url));
        return resource;
    }

    /** a resource which points to a principal */
    void principalAt(const std::string &url, const std::string &href)
    {
        add(url).setProperty(PROP_CURRENT_USER_PRINCIPAL, hrefProp(href));
    }

    /** OPTIONS result for the URL: DAV level 1 plus the given service tokens */
    void provides(const std::string &url, const std::string &token1, const std::string &token2 = "")
    {
        std::set<std::string> &tokens = m_capabilities[url];
        tokens.insert("1");
        tokens.insert(token1);
        if (!token2.empty()) {
            tokens.insert(token2);
        }
    }
};

/**
 * Answers requests from a FakeServer and counts them per URL.
 */
class FakeDAVClient : public DAVClient
{
    const FakeServer &m_server;
    std::map<std::string, int> m_propfinds;
    std::map<std::string, int> m_options;

    void checkError(const std::string &url)
    {
        std::map<std::string, DAVStatus>::const_iterator it = m_server.m_errors.find(url);
        if (it == m_server.m_errors.end()) {
            return;
        }
        switch (it->second) {
        case STATUS_NOT_FOUND:
        case STATUS_GONE:
            DD_THROW_EXCEPTION_STATUS(NotFoundException, url + ": gone", it->second);
        case STATUS_TRANSPORT_FAILURE:
            DD_THROW_EXCEPTION(TransportException, url + ": connection refused");
        case STATUS_PROTOCOL_FAILURE:
            DD_THROW_EXCEPTION(ProtocolException, url + ": malformed multistatus");
        default:
            DD_THROW_EXCEPTION_STATUS(TransportStatusException, url + ": bad status", it->second);
        }
    }

 public:
    FakeDAVClient(const FakeServer &server) : m_server(server) {}

    virtual DAVResource propfind(const Neon::URI &url, int depth, const PropertyKinds &props)
    {
        std::string key = url.toURL();
        m_propfinds[key]++;
        DD_LOG_DEBUG(NULL, "fake PROPFIND %s, depth %d, %d properties", key.c_str(), depth, (int)props.size());
        checkError(key);
        std::map<std::string, DAVResource>::const_iterator it = m_server.m_resources.find(key);
        if (it == m_server.m_resources.end()) {
            DD_THROW_EXCEPTION(NotFoundException, key + ": not found");
        }
        return it->second;
    }

    virtual std::set<std::string> options(const Neon::URI &url)
    {
        std::string key = url.toURL();
        m_options[key]++;
        DD_LOG_DEBUG(NULL, "fake OPTIONS %s", key.c_str());
        checkError(key);
        std::map<std::string, std::set<std::string> >::const_iterator it = m_server.m_capabilities.find(key);
        return it == m_server.m_capabilities.end() ? std::set<std::string>() : it->second;
    }

    int propfinds(const std::string &url) const { return GetWithDef(m_propfinds, url, 0); }
    int options(const std::string &url) const { return GetWithDef(m_options, url, 0); }
    int propfinds() const
    {
        int total = 0;
        for (const auto &entry: m_propfinds) {
            total += entry.second;
        }
        return total;
    }
};

/** SRV and TXT records, keyed by name */
struct FakeZone
{
    std::map<std::string, std::vector<SRVRecord> > m_srv;
    std::map<std::string, std::vector<TXTRecord> > m_txt;
    /** all lookups fail */
    bool m_fail;

    FakeZone() : m_fail(false) {}
};

class FakeDNSResolver : public DNSResolver
{
    const FakeZone &m_zone;
    std::map<std::string, int> m_srvLookups;
    std::map<std::string, int> m_txtLookups;

 public:
    FakeDNSResolver(const FakeZone &zone) : m_zone(zone) {}

    virtual std::vector<SRVRecord> lookupSRV(const std::string &name)
    {
        m_srvLookups[name]++;
        if (m_zone.m_fail) {
            DD_THROW_EXCEPTION(DNSException, name + ": no servers could be reached");
        }
        return GetWithDef(m_zone.m_srv, name).get();
    }

    virtual std::vector<TXTRecord> lookupTXT(const std::string &name)
    {
        m_txtLookups[name]++;
        if (m_zone.m_fail) {
            DD_THROW_EXCEPTION(DNSException, name + ": no servers could be reached");
        }
        return GetWithDef(m_zone.m_txt, name).get();
    }

    int srvLookups(const std::string &name) const { return GetWithDef(m_srvLookups, name, 0); }
    int lookups() const { return (int)(m_srvLookups.size() + m_txtLookups.size()); }
};

class ResourceFinderTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(ResourceFinderTest);
    CPPUNIT_TEST(testInputClassification);
    CPPUNIT_TEST(testInvalidInput);
    CPPUNIT_TEST(testStrategyOrdering);
    CPPUNIT_TEST(testWellKnown);
    CPPUNIT_TEST(testMailtoCollection);
    CPPUNIT_TEST(testTXTPrecedence);
    CPPUNIT_TEST(testTXTOrder);
    CPPUNIT_TEST(testSRVWithoutTarget);
    CPPUNIT_TEST(testCandidateExhaustion);
    CPPUNIT_TEST(testCapabilityGating);
    CPPUNIT_TEST(testPrincipalResource);
    CPPUNIT_TEST(testRelativePrincipal);
    CPPUNIT_TEST(testDNSFailure);
    CPPUNIT_TEST(testHTTPWithoutDiscovery);
    CPPUNIT_TEST(testParallel);
    CPPUNIT_TEST(testParallelNeon);
    CPPUNIT_TEST_SUITE_END();

    FakeServer m_server;
    FakeZone m_zone;
    boost::shared_ptr<FakeDAVClient> m_client;
    boost::shared_ptr<FakeDNSResolver> m_dns;
    int m_clientsCreated;

public:
    void setUp()
    {
        m_server = FakeServer();
        m_zone = FakeZone();
        m_client.reset(new FakeDAVClient(m_server));
        m_dns.reset(new FakeDNSResolver(m_zone));
        m_clientsCreated = 0;
    }

    void tearDown()
    {
        m_client.reset();
        m_dns.reset();
    }

private:
    boost::shared_ptr<DiscoverySettings> settings(bool parallel = false)
    {
        boost::shared_ptr<DiscoverySettings> settings(new DiscoverySettings);
        settings->m_username = "alice";
        settings->m_password = "secret";
        settings->m_parallel = parallel;
        return settings;
    }

    /** sequential discovery with the shared fakes */
    Configuration discover(const std::string &input)
    {
        ResourceFinder finder(settings(),
                              [this] (const Logger::Handle &) { m_clientsCreated++; return m_client; },
                              [this] (const Logger::Handle &) { return m_dns; });
        Configuration config = finder.findInitialConfiguration(input);
        DD_LOG_DEBUG(NULL, "result:\n%s", config.toString().c_str());
        return config;
    }

    static std::string principalOf(const boost::shared_ptr<const ServiceInfo> &info)
    {
        CPPUNIT_ASSERT(info);
        return info->m_principal.empty() ? std::string() : info->m_principal.toURL();
    }

    void testInputClassification()
    {
        DiscoveryInput input = DiscoveryInput::parse("HTTPS://example.com/dav");
        CPPUNIT_ASSERT_EQUAL(DiscoveryInput::URL, input.m_kind);
        CPPUNIT_ASSERT(input.isHTTPS());
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/dav"), input.m_url.toURL());
        CPPUNIT_ASSERT_EQUAL(443u, input.m_url.m_port);
        CPPUNIT_ASSERT_EQUAL(std::string("example.com"), input.m_domain);

        input = DiscoveryInput::parse("http://example.com:8080/");
        CPPUNIT_ASSERT_EQUAL(DiscoveryInput::URL, input.m_kind);
        CPPUNIT_ASSERT(!input.isHTTPS());
        CPPUNIT_ASSERT_EQUAL(std::string(""), input.m_domain);

        input = DiscoveryInput::parse("MailTo:alice@team@example.org?subject=hello");
        CPPUNIT_ASSERT_EQUAL(DiscoveryInput::MAILTO, input.m_kind);
        CPPUNIT_ASSERT_EQUAL(std::string("example.org"), input.m_domain);

        input = DiscoveryInput::parse("mailto:alice");
        CPPUNIT_ASSERT_EQUAL(DiscoveryInput::MAILTO, input.m_kind);
        CPPUNIT_ASSERT_EQUAL(std::string(""), input.m_domain);

        CPPUNIT_ASSERT_THROW(DiscoveryInput::parse("ftp://example.com/"), ProtocolException);
        CPPUNIT_ASSERT_THROW(DiscoveryInput::parse("alice@example.com"), ProtocolException);
        CPPUNIT_ASSERT_THROW(DiscoveryInput::parse("https://"), ProtocolException);
    }

    void testInvalidInput()
    {
        Configuration config = discover("ftp://example.com/");
        CPPUNIT_ASSERT(!config.isUseful());
        CPPUNIT_ASSERT_EQUAL(std::string("alice"), config.m_userName);
        CPPUNIT_ASSERT_EQUAL(std::string("secret"), config.m_password);
        CPPUNIT_ASSERT(config.m_logs.find("not an http(s) URL or mailto: address") != config.m_logs.npos);
        CPPUNIT_ASSERT_EQUAL(0, m_clientsCreated);
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds());
    }

    void testStrategyOrdering()
    {
        m_server.principalAt("https://example.com/dav/", "/principals/alice/");
        m_server.provides("https://example.com/principals/alice/", "calendar-access", "addressbook");

        Configuration config = discover("https://example.com/dav/");
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/alice/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/alice/"), principalOf(config.m_contacts));

        // one PROPFIND per pipeline, nothing else
        CPPUNIT_ASSERT_EQUAL(2, m_client->propfinds("https://example.com/dav/"));
        CPPUNIT_ASSERT_EQUAL(2, m_client->propfinds());
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds("https://example.com/.well-known/caldav"));
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds("https://example.com/.well-known/carddav"));
        CPPUNIT_ASSERT_EQUAL(0, m_dns->lookups());
        CPPUNIT_ASSERT_EQUAL(2, m_clientsCreated);
    }

    void testWellKnown()
    {
        m_server.principalAt("https://example.com/.well-known/caldav", "/principals/alice/");
        m_server.provides("https://example.com/principals/alice/", "calendar-access");

        Configuration config = discover("https://example.com/");
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/alice/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT(config.m_calendar->m_collections.empty());
        CPPUNIT_ASSERT(!config.m_contacts);

        // CalDAV stopped after the well-known URL, CardDAV went on to DNS
        CPPUNIT_ASSERT_EQUAL(0, m_dns->srvLookups("_caldavs._tcp.example.com"));
        CPPUNIT_ASSERT_EQUAL(1, m_dns->srvLookups("_carddavs._tcp.example.com"));
        CPPUNIT_ASSERT_EQUAL(1, m_client->propfinds("https://example.com/.well-known/caldav"));
        CPPUNIT_ASSERT_EQUAL(2, m_client->propfinds("https://example.com/.well-known/carddav"));
    }

    void testMailtoCollection()
    {
        m_zone.m_srv["_carddavs._tcp.example.com"].push_back(SRVRecord(0, 0, 443, "dav.example.com"));
        m_zone.m_txt["_carddavs._tcp.example.com"].push_back(TXTRecord(1, "path=/addressbooks/alice/"));
        DAVResource &book = m_server.add("https://dav.example.com/addressbooks/alice/");
        book.setProperty(PROP_RESOURCETYPE, RESOURCETYPE_ADDRESSBOOK);
        book.setProperty(PROP_DISPLAYNAME, "Alice");

        Configuration config = discover("mailto:alice@example.com");
        CPPUNIT_ASSERT(config.m_contacts);
        CPPUNIT_ASSERT(config.m_contacts->m_principal.empty());
        CPPUNIT_ASSERT_EQUAL((size_t)1, config.m_contacts->m_collections.size());
        ServiceInfo::Collections_t::const_iterator it =
            config.m_contacts->m_collections.find(Neon::URI::parse("https://dav.example.com/addressbooks/alice/"));
        CPPUNIT_ASSERT(it != config.m_contacts->m_collections.end());
        CPPUNIT_ASSERT_EQUAL(CollectionInfo::ADDRESS_BOOK, it->second.m_type);
        CPPUNIT_ASSERT_EQUAL(std::string("Alice"), it->second.m_displayName);
        CPPUNIT_ASSERT(!config.m_calendar);

        // mailto: never checks a user URL or well-known URL on the mail domain directly
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds("https://example.com/.well-known/carddav"));
        CPPUNIT_ASSERT_EQUAL(1, m_client->propfinds("https://dav.example.com/.well-known/carddav"));
    }

    void testTXTPrecedence()
    {
        m_zone.m_srv["_caldavs._tcp.example.com"].push_back(SRVRecord(0, 0, 8443, "dav.example.com"));
        m_zone.m_txt["_caldavs._tcp.example.com"].push_back(TXTRecord(1, "path=/dav/principals/"));
        m_server.principalAt("https://dav.example.com:8443/dav/principals/", "/dav/principals/alice/");
        m_server.provides("https://dav.example.com:8443/dav/principals/alice/", "calendar-access");
        // would also work, but must not be tried
        m_server.principalAt("https://dav.example.com:8443/.well-known/caldav", "/other/");
        m_server.provides("https://dav.example.com:8443/other/", "calendar-access");

        Configuration config = discover("mailto:alice@example.com");
        CPPUNIT_ASSERT_EQUAL(std::string("https://dav.example.com:8443/dav/principals/alice/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT_EQUAL(1, m_client->propfinds("https://dav.example.com:8443/dav/principals/"));
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds("https://dav.example.com:8443/.well-known/caldav"));
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds("https://dav.example.com:8443/"));
    }

    void testTXTOrder()
    {
        const std::string name = "_caldavs._tcp.example.com";
        m_zone.m_srv[name].push_back(SRVRecord(0, 0, 443, "dav.example.com"));
        TXTRecord first;
        first.push_back("v=1");
        first.push_back("path=/a/");
        m_zone.m_txt[name].push_back(first);
        m_zone.m_txt[name].push_back(TXTRecord(1, "path=/b/"));
        m_server.m_errors["https://dav.example.com/a/"] = STATUS_NOT_FOUND;
        m_server.principalAt("https://dav.example.com/b/", "/principals/alice/");
        m_server.provides("https://dav.example.com/principals/alice/", "calendar-access");

        Configuration config = discover("mailto:alice@example.com");
        CPPUNIT_ASSERT_EQUAL(std::string("https://dav.example.com/principals/alice/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT_EQUAL(1, m_client->propfinds("https://dav.example.com/a/"));
        CPPUNIT_ASSERT_EQUAL(1, m_client->propfinds("https://dav.example.com/b/"));
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds("https://dav.example.com/.well-known/caldav"));
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds("https://dav.example.com/"));

        const std::string trying = "trying to determine principal from initial context path ";
        size_t a = config.m_logs.find(trying + "https://dav.example.com/a/");
        size_t b = config.m_logs.find(trying + "https://dav.example.com/b/");
        CPPUNIT_ASSERT(a != config.m_logs.npos);
        CPPUNIT_ASSERT(b != config.m_logs.npos);
        CPPUNIT_ASSERT(a < b);
    }

    void testSRVWithoutTarget()
    {
        // "." as target: service explicitly not available at a separate host
        m_zone.m_srv["_caldavs._tcp.example.com"].push_back(SRVRecord(0, 0, 0, "."));
        m_server.principalAt("https://example.com/.well-known/caldav", "/principals/alice/");
        m_server.provides("https://example.com/principals/alice/", "calendar-access");

        Configuration config = discover("mailto:alice@example.com");
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/alice/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT(config.m_logs.find("SRV record without target") != config.m_logs.npos);
        CPPUNIT_ASSERT(config.m_logs.find("https://:") == config.m_logs.npos);
        CPPUNIT_ASSERT(config.m_logs.find("https://.:") == config.m_logs.npos);
    }

    void testCandidateExhaustion()
    {
        m_zone.m_srv["_caldavs._tcp.example.com"].push_back(SRVRecord(0, 0, 443, "dav.example.com"));
        m_zone.m_srv["_caldavs._tcp.example.com"].push_back(SRVRecord(10, 0, 443, "backup.example.com"));
        m_zone.m_txt["_caldavs._tcp.example.com"].push_back(TXTRecord(1, "path=/x/"));
        m_server.m_errors["https://dav.example.com/x/"] = STATUS_TRANSPORT_FAILURE;
        m_server.m_errors["https://dav.example.com/.well-known/caldav"] = STATUS_FATAL;
        m_server.m_errors["https://dav.example.com/"] = STATUS_PROTOCOL_FAILURE;

        Configuration config = discover("mailto:alice@example.com");
        CPPUNIT_ASSERT(!config.m_calendar);
        CPPUNIT_ASSERT(!config.m_contacts);
        CPPUNIT_ASSERT(!config.isUseful());

        // one log entry per candidate, first SRV record only
        const std::string trying = "trying to determine principal from initial context path ";
        CPPUNIT_ASSERT_EQUAL((size_t)1, countOccurrences(config.m_logs, trying + "https://dav.example.com/x/"));
        CPPUNIT_ASSERT_EQUAL((size_t)1, countOccurrences(config.m_logs, trying + "https://dav.example.com/.well-known/caldav"));
        CPPUNIT_ASSERT_EQUAL((size_t)1, countOccurrences(config.m_logs, trying + "https://dav.example.com/\n"));
        CPPUNIT_ASSERT_EQUAL((size_t)1, countOccurrences(config.m_logs, trying + "https://example.com/.well-known/carddav"));
        CPPUNIT_ASSERT_EQUAL((size_t)1, countOccurrences(config.m_logs, trying + "https://example.com/\n"));
        CPPUNIT_ASSERT_EQUAL((size_t)5, countOccurrences(config.m_logs, trying));
        CPPUNIT_ASSERT_EQUAL(0, m_client->propfinds("https://backup.example.com/x/"));
        CPPUNIT_ASSERT(config.m_logs.find("only the first one is used") != config.m_logs.npos);
        CPPUNIT_ASSERT(config.m_logs.find("no resource found at https://example.com/") != config.m_logs.npos);
    }

    void testCapabilityGating()
    {
        m_server.principalAt("https://example.com/", "/p/");
        m_server.provides("https://example.com/p/", "addressbook");
        m_server.principalAt("https://example.com/.well-known/caldav", "/p2/");
        m_server.provides("https://example.com/p2/", "calendar-access");

        Configuration config = discover("https://example.com/");
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/p/"), principalOf(config.m_contacts));
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/p2/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT_EQUAL(2, m_client->options("https://example.com/p/"));
        CPPUNIT_ASSERT(config.m_logs.find("does not provide required caldav service") != config.m_logs.npos);
    }

    void testPrincipalResource()
    {
        DAVResource &principal = m_server.add("https://example.com/principals/bob/");
        principal.setProperty(PROP_RESOURCETYPE, RESOURCETYPE_PRINCIPAL);
        principal.setProperty(PROP_CALENDAR_HOME_SET, hrefProp("/cal/bob"));
        m_server.provides("https://example.com/principals/bob/", "calendar-access");

        Configuration config = discover("https://example.com/principals/bob/");
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/bob/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT_EQUAL((size_t)1, config.m_calendar->m_homeSets.size());
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/cal/bob/"), config.m_calendar->m_homeSets.begin()->toURL());
        // same candidate, but without CardDAV
        CPPUNIT_ASSERT(!config.m_contacts);
    }

    void testRelativePrincipal()
    {
        // well-known URL redirected to another server
        DAVResource &wellKnown = m_server.add("https://example.com/.well-known/caldav");
        wellKnown.setLocation(Neon::URI::parse("https://cal.example.com/dav/"));
        wellKnown.setProperty(PROP_CURRENT_USER_PRINCIPAL, hrefProp("principals/alice/"));
        m_server.provides("https://cal.example.com/dav/principals/alice/", "calendar-access");

        Configuration config = discover("https://example.com/");
        CPPUNIT_ASSERT_EQUAL(std::string("https://cal.example.com/dav/principals/alice/"), principalOf(config.m_calendar));
    }

    void testDNSFailure()
    {
        m_zone.m_fail = true;
        m_server.principalAt("https://example.com/.well-known/caldav", "/principals/alice/");
        m_server.provides("https://example.com/principals/alice/", "calendar-access");

        Configuration config = discover("mailto:alice@example.com");
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/alice/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT(!config.m_contacts);
        CPPUNIT_ASSERT_EQUAL(1, m_dns->srvLookups("_caldavs._tcp.example.com"));
        CPPUNIT_ASSERT(config.m_logs.find("DNS problem") != config.m_logs.npos);
    }

    void testHTTPWithoutDiscovery()
    {
        DAVResource &calendar = m_server.add("http://example.com/cal");
        calendar.setProperty(PROP_RESOURCETYPE, RESOURCETYPE_CALENDAR);
        calendar.setProperty(PROP_DISPLAYNAME, "Work");

        Configuration config = discover("http://example.com/cal");
        CPPUNIT_ASSERT(config.m_calendar);
        CPPUNIT_ASSERT(config.m_calendar->m_principal.empty());
        CPPUNIT_ASSERT_EQUAL((size_t)1, config.m_calendar->m_collections.size());
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com/cal/"),
                             config.m_calendar->m_collections.begin()->first.toURL());
        CPPUNIT_ASSERT(!config.m_contacts);

        CPPUNIT_ASSERT_EQUAL(0, m_dns->lookups());
        CPPUNIT_ASSERT_EQUAL(2, m_client->propfinds());
    }

    void testParallel()
    {
        m_server.principalAt("https://example.com/.well-known/caldav", "/principals/alice/");
        m_server.provides("https://example.com/principals/alice/", "calendar-access");
        m_server.principalAt("https://example.com/.well-known/carddav", "/principals/alice/");
        m_server.provides("https://example.com/principals/alice/", "addressbook");

        ResourceFinder finder(settings(true),
                              [this] (const Logger::Handle &) { return boost::shared_ptr<DAVClient>(new FakeDAVClient(m_server)); },
                              [this] (const Logger::Handle &) { return boost::shared_ptr<DNSResolver>(new FakeDNSResolver(m_zone)); });
        Configuration config = finder.findInitialConfiguration("https://example.com/");
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/alice/"), principalOf(config.m_calendar));
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/alice/"), principalOf(config.m_contacts));

        // contacts log first, no interleaving
        size_t contacts = config.m_logs.find("finding initial carddav service configuration");
        size_t calendar = config.m_logs.find("finding initial caldav service configuration");
        CPPUNIT_ASSERT(contacts != config.m_logs.npos);
        CPPUNIT_ASSERT(calendar != config.m_logs.npos);
        CPPUNIT_ASSERT(contacts < calendar);
        CPPUNIT_ASSERT(config.m_logs.rfind("] carddav: ") < config.m_logs.find("] caldav: "));
    }

    void testParallelNeon()
    {
        // Real neon sessions created and destroyed in both threads at
        // once, with shared settings. Nothing listens on port 1, so
        // every request fails fast.
        const std::string host = "127.0.0.1";
        m_zone.m_srv["_caldavs._tcp." + host].push_back(SRVRecord(0, 0, 1, host));
        m_zone.m_srv["_carddavs._tcp." + host].push_back(SRVRecord(0, 0, 1, host));
        boost::shared_ptr<DiscoverySettings> shared = settings(true);
        shared->m_timeout = 10;

        ResourceFinder finder(shared,
                              [shared] (const Logger::Handle &logger) { return boost::shared_ptr<DAVClient>(new NeonDAVClient(shared, logger)); },
                              [this] (const Logger::Handle &) { return boost::shared_ptr<DNSResolver>(new FakeDNSResolver(m_zone)); });
        Configuration config = finder.findInitialConfiguration("https://" + host + ":1/");
        CPPUNIT_ASSERT(!config.m_calendar);
        CPPUNIT_ASSERT(!config.m_contacts);

        const std::string trying = "trying to determine principal from initial context path https://" + host + ":1/";
        CPPUNIT_ASSERT_EQUAL((size_t)1, countOccurrences(config.m_logs, trying + ".well-known/caldav"));
        CPPUNIT_ASSERT_EQUAL((size_t)1, countOccurrences(config.m_logs, trying + ".well-known/carddav"));
        CPPUNIT_ASSERT_EQUAL((size_t)2, countOccurrences(config.m_logs, trying + "\n"));
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(ResourceFinderTest);

DD_END_CXX

#endif // ENABLE_UNIT_TESTS
