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
#include "DiscoverySettings.h"

#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include <davdiscover/IniConfigNode.h>
# include <davdiscover/StringDataBlob.h>
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

DiscoverySettings::DiscoverySettings() :
    m_preemptive(false),
    m_timeout(60),
    m_verifyServer(true),
    m_verifyHost(true),
    m_logLevel(0),
    m_parallel(false)
{
}

template<class T> void DiscoverySettings::read(const ConfigNode &node, const std::string &property, T &value)
{
    InitStateString str = node.readProperty(property);
    if (str.wasSet() &&
        !node.getProperty(property, value)) {
        DD_THROW(StringPrintf("%s: invalid value for %s: '%s'",
                              node.getName().c_str(),
                              property.c_str(),
                              str.c_str()));
    }
}

void DiscoverySettings::load(const ConfigNode &node)
{
    read(node, "username", m_username);
    read(node, "password", m_password);
    read(node, "preemptive", m_preemptive);
    read(node, "timeout", m_timeout);
    read(node, "SSLVerifyServer", m_verifyServer);
    read(node, "SSLVerifyHost", m_verifyHost);
    read(node, "proxy", m_proxy);
    read(node, "loglevel", m_logLevel);
    read(node, "parallel", m_parallel);
}

void DiscoverySettings::getCredentials(const std::string &realm,
                                       std::string &username,
                                       std::string &password)
{
    if (m_username.empty()) {
        DD_THROW(StringPrintf("server requires authentication for '%s', but no username is set",
                              realm.c_str()));
    }
    username = m_username;
    password = m_password;
}

#ifdef ENABLE_UNIT_TESTS

class DiscoverySettingsTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(DiscoverySettingsTest);
    CPPUNIT_TEST(testDefaults);
    CPPUNIT_TEST(testLoad);
    CPPUNIT_TEST(testInvalid);
    CPPUNIT_TEST_SUITE_END();

    void testDefaults()
    {
        DiscoverySettings settings;
        CPPUNIT_ASSERT_EQUAL(60, settings.timeoutSeconds());
        CPPUNIT_ASSERT(settings.verifySSLCertificate());
        CPPUNIT_ASSERT(settings.verifySSLHost());
        CPPUNIT_ASSERT(!settings.preemptiveAuth());
        CPPUNIT_ASSERT_EQUAL(std::string(""), settings.proxy());
        std::string user, pw;
        CPPUNIT_ASSERT_THROW(settings.getCredentials("realm", user, pw), Exception);
    }

    void testLoad()
    {
        std::shared_ptr<std::string> data(new std::string("username = alice\n"
                                                          "password = secret\n"
                                                          "preemptive = yes\n"
                                                          "timeout = 10\n"
                                                          "sslverifyserver = false\n"
                                                          "proxy = http://proxy:3128\n"
                                                          "parallel = on\n"));
        IniHashConfigNode node(std::make_shared<StringDataBlob>("settings.ini", data, true));
        DiscoverySettings settings;
        settings.load(node);
        CPPUNIT_ASSERT_EQUAL(10, settings.timeoutSeconds());
        CPPUNIT_ASSERT(!settings.verifySSLCertificate());
        CPPUNIT_ASSERT(settings.verifySSLHost());
        CPPUNIT_ASSERT(settings.preemptiveAuth());
        CPPUNIT_ASSERT(settings.m_parallel);
        CPPUNIT_ASSERT_EQUAL(std::string("http://proxy:3128"), settings.proxy());
        std::string user, pw;
        settings.getCredentials("realm", user, pw);
        CPPUNIT_ASSERT_EQUAL(std::string("alice"), user);
        CPPUNIT_ASSERT_EQUAL(std::string("secret"), pw);
    }

    void testInvalid()
    {
        std::shared_ptr<std::string> data(new std::string("timeout = soon\n"));
        IniHashConfigNode node(std::make_shared<StringDataBlob>("settings.ini", data, true));
        DiscoverySettings settings;
        CPPUNIT_ASSERT_THROW(settings.load(node), Exception);
        CPPUNIT_ASSERT_EQUAL(60, settings.timeoutSeconds());
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(DiscoverySettingsTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
