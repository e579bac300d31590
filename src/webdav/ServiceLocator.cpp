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
#include "ServiceLocator.h"

#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <boost/algorithm/string/predicate.hpp>

#include <string.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

Neon::URI ServiceLocation::url(const std::string &path) const
{
    Neon::URI uri;
    uri.m_scheme = m_scheme;
    uri.m_host = m_host;
    uri.m_port = m_port;
    uri.m_path = Neon::URI::normalizePath(path, false);
    return uri;
}

ServiceLocator::ServiceLocator(DNSResolver &resolver, const Logger::Handle &logger) :
    m_resolver(resolver),
    m_logger(logger),
    m_prefix("dns")
{
}

ServiceLocation ServiceLocator::locateService(const std::string &domain, const DAVService &service)
{
    ServiceLocation location;
    location.m_scheme = "https";
    location.m_host = domain;
    location.m_port = 443;

    const std::string name = service.srvName(domain);
    DD_LOG_TO(m_logger, m_prefix, Logger::DEBUG, "looking up SRV records for %s", name.c_str());
    try {
        std::vector<SRVRecord> records = m_resolver.lookupSRV(name);
        if (!records.empty()) {
            if (records.size() > 1) {
                DD_LOG_TO(m_logger, m_prefix, Logger::WARNING,
                          "%s: %d SRV records, only the first one is used",
                          name.c_str(), (int)records.size());
            }
            const SRVRecord &srv = records.front();
            if (srv.m_target.empty() || srv.m_target == ".") {
                // RFC 2782: root target means "service not available"
                DD_LOG_TO(m_logger, m_prefix, Logger::INFO,
                          "%s: SRV record without target, trying at https://%s:%u",
                          name.c_str(), location.m_host.c_str(), location.m_port);
            } else {
                location.m_host = srv.m_target;
                location.m_port = srv.m_port;
                DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "found %s service at https://%s:%u",
                          service.serviceType().c_str(), location.m_host.c_str(), location.m_port);
            }
        } else {
            DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "no %s SRV record, trying at https://%s:%u",
                      service.serviceType().c_str(), location.m_host.c_str(), location.m_port);
        }
    } catch (const DNSException &) {
        Exception::handle(NULL, &m_prefix, NULL, Logger::INFO, HANDLE_EXCEPTION_FLAGS_NONE, m_logger);
        DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "SRV lookup failed, trying at https://%s:%u",
                  location.m_host.c_str(), location.m_port);
    }

    try {
        for (const TXTRecord &record: m_resolver.lookupTXT(name)) {
            for (const std::string &segment: record) {
                if (boost::starts_with(segment, "path=")) {
                    std::string path = segment.substr(strlen("path="));
                    DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "found TXT record, initial context path %s",
                              path.c_str());
                    location.m_paths.push_back(path);
                }
            }
        }
    } catch (const DNSException &) {
        Exception::handle(NULL, &m_prefix, NULL, Logger::INFO, HANDLE_EXCEPTION_FLAGS_NONE, m_logger);
    }

    // in case the TXT paths are wrong
    location.m_paths.push_back(service.wellKnownPath());
    location.m_paths.push_back("/");
    return location;
}

DD_END_CXX
