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
#include "PrincipalResolver.h"
#include "CollectionRecorder.h"

#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

PrincipalResolver::PrincipalResolver(DAVClient &client,
                                     CapabilityChecker &checker,
                                     const Logger::Handle &logger) :
    m_client(client),
    m_checker(checker),
    m_logger(logger),
    m_prefix("principal")
{
}

Outcome<Neon::URI> PrincipalResolver::resolvePrincipal(const Neon::URI &url,
                                                      const DAVService *required,
                                                      ServiceInfo *record)
{
    try {
        bool recording = record && required;
        DAVResource resource = m_client.propfind(url, 0,
                                                 recording ?
                                                 required->probeProperties() :
                                                 PropertyKinds(1, PROP_CURRENT_USER_PRINCIPAL));
        if (recording) {
            CollectionRecorder(m_logger).recordIfCollectionOrHomeSet(resource, *required, *record);
        }
        std::string href = resource.href(PROP_CURRENT_USER_PRINCIPAL);
        if (href.empty()) {
            return Outcome<Neon::URI>::absent(StringPrintf("%s: no current-user-principal",
                                                           resource.getLocation().toURL().c_str()));
        }
        Neon::URI principal = resource.getLocation().resolve(href);
        DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "found current-user-principal %s",
                  principal.toURL().c_str());
        return confirm(principal, required);
    } catch (const Exception &) {
        return Outcome<Neon::URI>::fromException(m_logger, m_prefix);
    }
}

Outcome<Neon::URI> PrincipalResolver::confirm(const Neon::URI &principal, const DAVService *required)
{
    if (required &&
        !m_checker.providesService(principal, *required)) {
        std::string reason = StringPrintf("%s does not provide required %s service, dismissing",
                                          principal.toURL().c_str(),
                                          required->serviceType().c_str());
        DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "%s", reason.c_str());
        return Outcome<Neon::URI>::absent(reason);
    }
    return Outcome<Neon::URI>::found(principal);
}

DD_END_CXX
