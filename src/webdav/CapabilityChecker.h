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

#ifndef INCL_DAVDISCOVER_CAPABILITYCHECKER
#define INCL_DAVDISCOVER_CAPABILITYCHECKER

#include "DAVClient.h"
#include "DAVService.h"

#include <davdiscover/Logging.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Checks with OPTIONS whether a server advertises a service.
 */
class CapabilityChecker
{
 public:
    CapabilityChecker(DAVClient &client, const Logger::Handle &logger = Logger::Handle());

    /**
     * True if the DAV header of the OPTIONS response for the URL
     * contains the capability token of the service. Errors are
     * logged and mean "not provided".
     */
    bool providesService(const Neon::URI &url, const DAVService &service);

 private:
    DAVClient &m_client;
    Logger::Handle m_logger;
    const std::string m_prefix;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_CAPABILITYCHECKER
