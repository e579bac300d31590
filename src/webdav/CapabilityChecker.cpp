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
#include "CapabilityChecker.h"

#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <boost/algorithm/string/join.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

CapabilityChecker::CapabilityChecker(DAVClient &client, const Logger::Handle &logger) :
    m_client(client),
    m_logger(logger),
    m_prefix("capabilities")
{
}

bool CapabilityChecker::providesService(const Neon::URI &url, const DAVService &service)
{
    try {
        std::set<std::string> capabilities = m_client.options(url);
        DD_LOG_TO(m_logger, m_prefix, Logger::DEBUG, "%s: DAV %s",
                  url.toURL().c_str(),
                  boost::join(capabilities, ", ").c_str());
        return capabilities.find(service.capabilityToken()) != capabilities.end();
    } catch (const Exception &) {
        std::string explanation;
        Exception::handle(NULL, &m_prefix, &explanation, Logger::DEBUG, HANDLE_EXCEPTION_FLAGS_NONE, m_logger);
        DD_LOG_TO(m_logger, m_prefix, Logger::INFO, "could not detect services on %s",
                  url.toURL().c_str());
    }
    return false;
}

DD_END_CXX
