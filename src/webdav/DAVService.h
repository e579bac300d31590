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

#ifndef INCL_DAVDISCOVER_DAVSERVICE
#define INCL_DAVDISCOVER_DAVSERVICE

#include "DAVProperties.h"

#include <string>

#include <boost/noncopyable.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Everything that differs between discovering a CalDAV and a
 * CardDAV service. Instances are stateless and may be shared
 * between threads.
 */
class DAVService : private boost::noncopyable
{
 public:
    virtual ~DAVService() {}

    /** "caldav" or "carddav", used in SRV names and well-known paths */
    virtual std::string serviceType() const = 0;

    /** token in the DAV header of OPTIONS which confirms the service */
    virtual std::string capabilityToken() const = 0;

    /** property which points to the collection home sets */
    virtual PropertyKind homeSetProperty() const = 0;

    /** DAVResource::ResourceType bit of a collection of this service */
    virtual int collectionType() const = 0;

    /** properties requested when checking the URL given by the user */
    virtual const PropertyKinds &probeProperties() const = 0;

    /** /.well-known/<serviceType()> */
    std::string wellKnownPath() const { return "/.well-known/" + serviceType(); }

    /** _<serviceType()>s._tcp.<domain>: only TLS services are looked up */
    std::string srvName(const std::string &domain) const { return "_" + serviceType() + "s._tcp." + domain; }
};

class CalDAVService : public DAVService
{
 public:
    virtual std::string serviceType() const { return "caldav"; }
    virtual std::string capabilityToken() const { return "calendar-access"; }
    virtual PropertyKind homeSetProperty() const { return PROP_CALENDAR_HOME_SET; }
    virtual int collectionType() const { return DAVResource::CALENDAR; }
    virtual const PropertyKinds &probeProperties() const;

    /** shared instance */
    static const CalDAVService &get();
};

class CardDAVService : public DAVService
{
 public:
    virtual std::string serviceType() const { return "carddav"; }
    virtual std::string capabilityToken() const { return "addressbook"; }
    virtual PropertyKind homeSetProperty() const { return PROP_ADDRESSBOOK_HOME_SET; }
    virtual int collectionType() const { return DAVResource::ADDRESSBOOK; }
    virtual const PropertyKinds &probeProperties() const;

    /** shared instance */
    static const CardDAVService &get();
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_DAVSERVICE
