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

#ifndef INCL_DAVDISCOVER_DISCOVERYCONFIG
#define INCL_DAVDISCOVER_DISCOVERYCONFIG

#include "NeonCXX.h"
#include "DAVProperties.h"

#include <davdiscover/ConfigNode.h>

#include <map>
#include <set>
#include <string>

#include <boost/shared_ptr.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Metadata of one calendar or address book, as far as it was
 * returned by the server when the collection was found.
 */
struct CollectionInfo
{
    enum Type {
        UNKNOWN,
        CALENDAR,
        ADDRESS_BOOK
    };

    Type m_type;
    /** absolute, with trailing slash */
    std::string m_url;
    bool m_readOnly;
    std::string m_displayName;
    std::string m_description;
    /** calendar only */
    std::string m_color;
    /** calendar only, VTIMEZONE as sent by the server */
    std::string m_timezone;
    bool m_supportsVEVENT;
    bool m_supportsVTODO;

    CollectionInfo() :
        m_type(UNKNOWN),
        m_readOnly(false),
        m_supportsVEVENT(true),
        m_supportsVTODO(true)
    {}

    /**
     * Extract the metadata from a probed resource. The URL is the
     * location of the resource, turned into a collection URL.
     */
    static CollectionInfo fromResource(const DAVResource &resource);

    static std::string typeToString(Type type);

    /** one line: url, type, name and flags */
    std::string toString() const;
};

/**
 * Everything found about one service (CalDAV or CardDAV).
 * Filled during one discovery run, not modified afterwards.
 */
struct ServiceInfo
{
    /** current-user-principal, empty if not found */
    Neon::URI m_principal;
    /** absolute home set URLs with trailing slash */
    std::set<Neon::URI> m_homeSets;
    /** collections, keyed by their URL with trailing slash */
    typedef std::map<Neon::URI, CollectionInfo> Collections_t;
    Collections_t m_collections;

    /** anything found which allows setting up the service? */
    bool isUseful() const;

    /** multi-line description, each line indented */
    std::string toString(const std::string &indent = "  ") const;

    /** store as <prefix>.principal, <prefix>.homeset.<n>, ... */
    void save(ConfigNode &node, const std::string &prefix) const;
};

/**
 * The result of discovery: credentials as used for the
 * discovery, the services which were found (NULL if not found)
 * and the log of the discovery, for bug reports.
 */
struct Configuration
{
    std::string m_userName;
    std::string m_password;
    bool m_preemptive;

    boost::shared_ptr<const ServiceInfo> m_calendar;
    boost::shared_ptr<const ServiceInfo> m_contacts;

    std::string m_logs;

    Configuration() : m_preemptive(false) {}

    /** at least one service found? */
    bool isUseful() const { return m_calendar || m_contacts; }

    /** human-readable description, password masked, logs not included */
    std::string toString() const;

    /**
     * Replaces the content of the node with the configuration,
     * logs included. Does not flush.
     */
    void save(ConfigNode &node) const;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_DISCOVERYCONFIG
