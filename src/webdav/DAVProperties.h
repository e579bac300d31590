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

#ifndef INCL_DAVDISCOVER_DAVPROPERTIES
#define INCL_DAVDISCOVER_DAVPROPERTIES

#include "NeonCXX.h"

#include <list>
#include <map>
#include <string>
#include <vector>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * The WebDAV, CalDAV and CardDAV properties which matter
 * during discovery. Anything else returned by a server is
 * ignored.
 */
enum PropertyKind {
    PROP_RESOURCETYPE,
    PROP_DISPLAYNAME,
    PROP_CURRENT_USER_PRINCIPAL,
    PROP_CURRENT_USER_PRIVILEGE_SET,
    PROP_CALENDAR_HOME_SET,
    PROP_CALENDAR_DESCRIPTION,
    PROP_CALENDAR_COLOR,
    PROP_CALENDAR_TIMEZONE,
    PROP_SUPPORTED_CALENDAR_COMPONENT_SET,
    PROP_ADDRESSBOOK_HOME_SET,
    PROP_ADDRESSBOOK_DESCRIPTION,
    PROP_MAX
};

typedef std::vector<PropertyKind> PropertyKinds;

/** namespace and name, as needed for ne_propfind_named() */
const ne_propname &PropertyName(PropertyKind kind);

/** "<namespace>:<name>", for example "DAV::displayname" */
std::string PropertyKey(PropertyKind kind);

/** reverse lookup, false for unknown properties */
bool PropertyKindFromName(const ne_propname &name, PropertyKind &kind);

/**
 * Extracts the first <DAV:href> content from a property value
 * as returned by neon. Empty if none.
 */
std::string extractHREF(const std::string &propval);

/** all <DAV:href> contents */
std::list<std::string> extractHREFs(const std::string &propval);

/**
 * The result of a depth 0 PROPFIND: where the resource was
 * found (after following redirects) and the raw values of
 * those properties which the server returned.
 */
class DAVResource
{
 public:
    /** bits returned by resourceTypes() */
    enum ResourceType {
        COLLECTION = 1 << 0,
        PRINCIPAL = 1 << 1,
        CALENDAR = 1 << 2,
        ADDRESSBOOK = 1 << 3
    };

    DAVResource() {}
    DAVResource(const Neon::URI &location) : m_location(location) {}

    const Neon::URI &getLocation() const { return m_location; }
    void setLocation(const Neon::URI &location) { m_location = location; }

    /** store raw value, with white space at start and end removed */
    void setProperty(PropertyKind kind, const std::string &value);
    bool hasProperty(PropertyKind kind) const { return m_props.find(kind) != m_props.end(); }
    InitStateString getProperty(PropertyKind kind) const;

    /** ResourceType bits set in the resourcetype property */
    int resourceTypes() const;

    /** first href in the property, empty if none */
    std::string href(PropertyKind kind) const { return extractHREF(getProperty(kind)); }
    /** all hrefs in the property */
    std::list<std::string> hrefs(PropertyKind kind) const { return extractHREFs(getProperty(kind)); }
    /** plain text value, empty if not set */
    std::string text(PropertyKind kind) const { return getProperty(kind); }

    /**
     * Write access according to current-user-privilege-set.
     * Without that property the resource is assumed to be
     * writable.
     */
    bool canWrite() const;

    /**
     * True if the supported-calendar-component-set lists the
     * component (VEVENT, VTODO, ...). Without that property,
     * all components are supported.
     */
    bool supportsComponent(const std::string &component) const;

    /** one line per property, for debug logging */
    std::string dump() const;

 private:
    Neon::URI m_location;
    typedef std::map<PropertyKind, std::string> Props_t;
    Props_t m_props;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_DAVPROPERTIES
