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

#ifndef INCL_DAVDISCOVER_DAVCLIENT
#define INCL_DAVDISCOVER_DAVCLIENT

#include "NeonCXX.h"
#include "DAVProperties.h"

#include <map>
#include <set>
#include <string>

#include <boost/shared_ptr.hpp>
#include <boost/noncopyable.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * The WebDAV operations needed by discovery. Implementations
 * report errors with exceptions:
 * - NotFoundException for 404 and 410
 * - TransportStatusException for other HTTP errors
 * - TransportException for network and TLS problems
 * - ProtocolException for responses which cannot be used
 *
 * An instance is used by one thread at a time.
 */
class DAVClient : private boost::noncopyable
{
 public:
    virtual ~DAVClient() {}

    /**
     * PROPFIND for the given properties. The location of the
     * result is where the properties were found, which is
     * different from the url after following redirects.
     */
    virtual DAVResource propfind(const Neon::URI &url, int depth, const PropertyKinds &props) = 0;

    /**
     * OPTIONS: the tokens of the DAV response header
     * ("1", "access-control", "calendar-access", ...).
     */
    virtual std::set<std::string> options(const Neon::URI &url) = 0;
};

/**
 * DAVClient on top of neon. Creates one session per server
 * (scheme, host, port) on demand and keeps it for the lifetime
 * of the client.
 */
class NeonDAVClient : public DAVClient
{
 public:
    /**
     * @param settings   credentials, TLS and proxy settings
     * @param logger     receives HTTP traces, empty for the global logger
     */
    NeonDAVClient(const boost::shared_ptr<Neon::Settings> &settings,
                  const Logger::Handle &logger = Logger::Handle());

    virtual DAVResource propfind(const Neon::URI &url, int depth, const PropertyKinds &props);
    virtual std::set<std::string> options(const Neon::URI &url);

    /** number of redirects followed before giving up */
    static const int MAX_REDIRECTS = 5;

 private:
    boost::shared_ptr<Neon::Settings> m_settings;
    Logger::Handle m_logger;
    typedef std::map<std::string, boost::shared_ptr<Neon::Session> > Sessions_t;
    Sessions_t m_sessions;

    /** properties per path, as collected from a multistatus */
    typedef std::map<std::string, DAVResource> Responses_t;

    Neon::Session &getSession(const Neon::URI &url);

    /** send credentials with the next request, if configured */
    void prepare(Neon::Session &session);

    /** where to go next, throws ProtocolException if not possible */
    Neon::URI redirect(const Neon::URI &current, const Neon::RedirectException &ex, int &redirects);

    static void storeProperty(Responses_t &responses,
                              const Neon::URI &uri,
                              const ne_propname *prop,
                              const char *value,
                              const ne_status *status);
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_DAVCLIENT
