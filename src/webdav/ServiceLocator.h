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

#ifndef INCL_DAVDISCOVER_SERVICELOCATOR
#define INCL_DAVDISCOVER_SERVICELOCATOR

#include "NeonCXX.h"
#include "DNSResolver.h"
#include "DAVService.h"

#include <davdiscover/Logging.h>

#include <list>
#include <string>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Where to look for a service: a TLS endpoint and the context
 * paths to try there, in this order.
 */
struct ServiceLocation
{
    std::string m_scheme;
    std::string m_host;
    unsigned int m_port;
    std::list<std::string> m_paths;

    ServiceLocation() : m_port(0) {}

    /** absolute URL of one of the paths */
    Neon::URI url(const std::string &path) const;
};

/**
 * DNS-based service discovery (RFC 6764): SRV record for the
 * server, TXT record for the initial context path.
 */
class ServiceLocator
{
 public:
    ServiceLocator(DNSResolver &resolver, const Logger::Handle &logger = Logger::Handle());

    /**
     * Determine host, port and candidate paths for the service in
     * the domain. Never fails: without usable DNS records the
     * domain itself is used on port 443, with the well-known path
     * and the root as candidates.
     */
    ServiceLocation locateService(const std::string &domain, const DAVService &service);

 private:
    DNSResolver &m_resolver;
    Logger::Handle m_logger;
    const std::string m_prefix;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_SERVICELOCATOR
