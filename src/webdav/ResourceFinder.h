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

#ifndef INCL_DAVDISCOVER_RESOURCEFINDER
#define INCL_DAVDISCOVER_RESOURCEFINDER

#include "NeonCXX.h"
#include "DAVClient.h"
#include "DNSResolver.h"
#include "DAVService.h"
#include "DiscoveryConfig.h"
#include "DiscoverySettings.h"
#include "PrincipalResolver.h"
#include "CollectionRecorder.h"
#include "Outcome.h"

#include <davdiscover/Logging.h>

#include <functional>
#include <string>

#include <boost/shared_ptr.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * What the user entered: an http(s) URL or a mailto: address.
 */
struct DiscoveryInput
{
    enum Kind {
        URL,
        MAILTO
    };

    Kind m_kind;
    /** URL kind only, scheme in lower case */
    Neon::URI m_url;
    /** domain for DNS discovery, empty if not allowed or not known */
    std::string m_domain;

    DiscoveryInput() : m_kind(URL) {}

    bool isHTTPS() const { return m_kind == URL && m_url.m_scheme == "https"; }

    /**
     * Classify the input. Schemes are case-insensitive. DNS
     * discovery is only done for https URLs and for mailto
     * addresses, with the domain after the last @. Throws a
     * ProtocolException for anything else.
     */
    static DiscoveryInput parse(const std::string &input);
};

/**
 * Finds the CalDAV and CardDAV configuration for a user,
 * starting with a URL or email address. For each service:
 * - check the URL given by the user
 * - check the well-known URL on the same https server
 * - DNS SRV/TXT based discovery
 *
 * Each step is only taken as long as no principal has been
 * found. Errors never abort the discovery, they end up in the
 * log of the result.
 */
class ResourceFinder
{
 public:
    /** creates the client used by one pipeline, logging to the handle */
    typedef std::function<boost::shared_ptr<DAVClient> (const Logger::Handle &)> ClientFactory_t;
    /** creates the resolver used by one pipeline */
    typedef std::function<boost::shared_ptr<DNSResolver> (const Logger::Handle &)> ResolverFactory_t;

    /**
     * @param settings     credentials, copied into the result, and
     *                     the parallel flag
     * @param clients      called once per pipeline
     * @param resolvers    called once per pipeline
     */
    ResourceFinder(const boost::shared_ptr<DiscoverySettings> &settings,
                   const ClientFactory_t &clients,
                   const ResolverFactory_t &resolvers);

    /**
     * Discover both services. Never throws for server or
     * input problems, those are recorded in Configuration::m_logs.
     */
    Configuration findInitialConfiguration(const std::string &input);

    /**
     * One pipeline, for one service. Returns NULL if nothing
     * useful was found.
     */
    boost::shared_ptr<const ServiceInfo> findService(const DiscoveryInput &input,
                                                     const DAVService &service,
                                                     DAVClient &client,
                                                     DNSResolver &resolver,
                                                     const Logger::Handle &logger);

 private:
    boost::shared_ptr<DiscoverySettings> m_settings;
    ClientFactory_t m_clients;
    ResolverFactory_t m_resolvers;

    /** states of the per-service pipeline, in this order */
    enum State {
        USER_URL_CHECK,
        WELL_KNOWN_CHECK,
        DNS_DISCOVERY,
        DONE
    };

    struct Pipeline;
    void runPipeline(const DiscoveryInput &input, Pipeline &pipeline);

    Outcome<Neon::URI> checkUserGivenURL(const Neon::URI &url,
                                         const DAVService &service,
                                         DAVClient &client,
                                         PrincipalResolver &principals,
                                         ServiceInfo &info,
                                         const Logger::Handle &logger);
    Outcome<Neon::URI> discoverPrincipal(const std::string &domain,
                                         const DAVService &service,
                                         DNSResolver &resolver,
                                         PrincipalResolver &principals,
                                         ServiceInfo &info,
                                         const Logger::Handle &logger);
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_RESOURCEFINDER
