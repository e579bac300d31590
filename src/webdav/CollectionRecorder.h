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

#ifndef INCL_DAVDISCOVER_COLLECTIONRECORDER
#define INCL_DAVDISCOVER_COLLECTIONRECORDER

#include "DAVProperties.h"
#include "DAVService.h"
#include "DiscoveryConfig.h"

#include <davdiscover/Logging.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Remembers collections and home sets of a service found
 * in a probed resource.
 */
class CollectionRecorder
{
 public:
    CollectionRecorder(const Logger::Handle &logger = Logger::Handle());

    /**
     * If the resource is a collection of the service, add or
     * replace it in result.m_collections. Independently, add
     * all home sets listed by the resource to result.m_homeSets.
     * URLs are stored with trailing slash.
     */
    void recordIfCollectionOrHomeSet(const DAVResource &resource,
                                     const DAVService &service,
                                     ServiceInfo &result);

 private:
    Logger::Handle m_logger;
    const std::string m_prefix;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_COLLECTIONRECORDER
