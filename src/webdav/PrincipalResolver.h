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

#ifndef INCL_DAVDISCOVER_PRINCIPALRESOLVER
#define INCL_DAVDISCOVER_PRINCIPALRESOLVER

#include "DAVClient.h"
#include "DAVService.h"
#include "CapabilityChecker.h"
#include "DiscoveryConfig.h"
#include "Outcome.h"

#include <davdiscover/Logging.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Finds the current-user-principal (RFC 5397) of a URL.
 */
class PrincipalResolver
{
 public:
    PrincipalResolver(DAVClient &client,
                      CapabilityChecker &checker,
                      const Logger::Handle &logger = Logger::Handle());

    /**
     * PROPFIND with depth 0 for current-user-principal, resolved
     * against the location where the property was found.
     *
     * @param url        where to ask
     * @param required   if not NULL, the principal is only
     *                   accepted if it provides this service
     * @param record     if not NULL (requires a service), the
     *                   properties of the service are requested
     *                   too and collections and home sets found
     *                   at the URL are added to it
     * @return FOUND with absolute principal URL, ABSENT if the
     *         property was missing or the service not provided,
     *         FAILED for errors (already logged)
     */
    Outcome<Neon::URI> resolvePrincipal(const Neon::URI &url,
                                        const DAVService *required,
                                        ServiceInfo *record = NULL);

    /**
     * Accept a principal candidate if it provides the service,
     * ABSENT otherwise.
     */
    Outcome<Neon::URI> confirm(const Neon::URI &principal, const DAVService *required);

 private:
    DAVClient &m_client;
    CapabilityChecker &m_checker;
    Logger::Handle m_logger;
    const std::string m_prefix;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_PRINCIPALRESOLVER
