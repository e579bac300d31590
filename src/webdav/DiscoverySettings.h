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

#ifndef INCL_DAVDISCOVER_DISCOVERYSETTINGS
#define INCL_DAVDISCOVER_DISCOVERYSETTINGS

#include "NeonCXX.h"

#include <davdiscover/ConfigNode.h>

#include <string>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Credentials and transport settings of one discovery run. Read
 * from a .ini file (see load()) and/or set directly, for example
 * from command line options.
 */
class DiscoverySettings : public Neon::Settings
{
 public:
    std::string m_username;
    std::string m_password;
    bool m_preemptive;
    /** seconds */
    int m_timeout;
    bool m_verifyServer;
    bool m_verifyHost;
    /** empty for the system default */
    std::string m_proxy;
    int m_logLevel;
    /** run CalDAV and CardDAV discovery in parallel */
    bool m_parallel;

    DiscoverySettings();

    /**
     * Overwrite those settings which are set in the node:
     * username, password, preemptive, timeout, SSLVerifyServer,
     * SSLVerifyHost, proxy, loglevel, parallel. Throws an error
     * for values which cannot be parsed.
     */
    void load(const ConfigNode &node);

    virtual bool verifySSLHost() { return m_verifyHost; }
    virtual bool verifySSLCertificate() { return m_verifyServer; }
    virtual std::string proxy() { return m_proxy; }
    virtual void getCredentials(const std::string &realm,
                                std::string &username,
                                std::string &password);
    virtual bool preemptiveAuth() { return m_preemptive; }
    virtual int logLevel() { return m_logLevel; }
    virtual int timeoutSeconds() const { return m_timeout; }

 private:
    template<class T> void read(const ConfigNode &node, const std::string &property, T &value);
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_DISCOVERYSETTINGS
