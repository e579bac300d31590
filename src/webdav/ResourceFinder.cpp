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
#include "ResourceFinder.h"
#include "ServiceLocator.h"
#include "CapabilityChecker.h"

#include <davdiscover/Exception.h>
#include <davdiscover/LogCollect.h>
#include <davdiscover/ThreadSupport.h>
#include <davdiscover/util.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

DiscoveryInput DiscoveryInput::parse(const std::string &input)
{
    DiscoveryInput res;
    size_t colon = input.find(':');
    std::string scheme;
    if (colon != input.npos) {
        scheme = boost::to_lower_copy(input.substr(0, colon));
    }

    if (scheme == "http" || scheme == "https") {
        res.m_kind = URL;
        // lower case scheme, for neon's default port
        res.m_url = Neon::URI::parse(scheme + input.substr(colon));
        // only secure service discovery is supported
        if (scheme == "https") {
            res.m_domain = res.m_url.m_host;
        }
    } else if (scheme == "mailto") {
        res.m_kind = MAILTO;
        std::string mailbox = Neon::URI::unescape(input.substr(colon + 1));
        size_t query = mailbox.find('?');
        if (query != mailbox.npos) {
            mailbox.resize(query);
        }
        size_t at = mailbox.rfind('@');
        if (at != mailbox.npos) {
            res.m_domain = mailbox.substr(at + 1);
        }
    } else {
        DD_THROW_EXCEPTION(ProtocolException,
                           StringPrintf("'%s': not an http(s) URL or mailto: address", input.c_str()));
    }
    return res;
}

struct ResourceFinder::Pipeline
{
    const DAVService &m_service;
    boost::shared_ptr<LogCollect> m_log;
    boost::shared_ptr<const ServiceInfo> m_result;

    Pipeline(const DAVService &service) :
        m_service(service),
        m_log(new LogCollect())
    {}
};

ResourceFinder::ResourceFinder(const boost::shared_ptr<DiscoverySettings> &settings,
                               const ClientFactory_t &clients,
                               const ResolverFactory_t &resolvers) :
    m_settings(settings),
    m_clients(clients),
    m_resolvers(resolvers)
{
}

Configuration ResourceFinder::findInitialConfiguration(const std::string &input)
{
    Configuration config;
    config.m_userName = m_settings->m_username;
    config.m_password = m_settings->m_password;
    config.m_preemptive = m_settings->m_preemptive;

    DiscoveryInput parsed;
    try {
        parsed = DiscoveryInput::parse(input);
    } catch (const Exception &) {
        boost::shared_ptr<LogCollect> log(new LogCollect());
        Exception::handle(NULL, NULL, NULL, Logger::ERROR, HANDLE_EXCEPTION_FLAGS_NONE, log);
        config.m_logs = log->getLog();
        return config;
    }

    Pipeline contacts(CardDAVService::get());
    Pipeline calendar(CalDAVService::get());
    if (m_settings->m_parallel) {
        GThreadCXX contactsThread("carddav", [this, &parsed, &contacts] () { runPipeline(parsed, contacts); });
        GThreadCXX calendarThread("caldav", [this, &parsed, &calendar] () { runPipeline(parsed, calendar); });
        contactsThread.join();
        calendarThread.join();
    } else {
        runPipeline(parsed, contacts);
        runPipeline(parsed, calendar);
    }

    config.m_contacts = contacts.m_result;
    config.m_calendar = calendar.m_result;
    config.m_logs = contacts.m_log->getLog() + calendar.m_log->getLog();
    return config;
}

void ResourceFinder::runPipeline(const DiscoveryInput &input, Pipeline &pipeline)
{
    Logger::Handle logger(pipeline.m_log);
    boost::shared_ptr<DAVClient> client = m_clients(logger);
    boost::shared_ptr<DNSResolver> resolver = m_resolvers(logger);
    if (!client || !resolver) {
        DD_THROW("no transport for service discovery");
    }
    pipeline.m_result = findService(input, pipeline.m_service, *client, *resolver, logger);
}

boost::shared_ptr<const ServiceInfo> ResourceFinder::findService(const DiscoveryInput &input,
                                                                 const DAVService &service,
                                                                 DAVClient &client,
                                                                 DNSResolver &resolver,
                                                                 const Logger::Handle &logger)
{
    const std::string prefix = service.serviceType();
    boost::shared_ptr<ServiceInfo> info(new ServiceInfo);
    CapabilityChecker checker(client, logger);
    PrincipalResolver principals(client, checker, logger);
    Outcome<Neon::URI> principal = Outcome<Neon::URI>::absent();

    DD_LOG_TO(logger, prefix, Logger::INFO, "finding initial %s service configuration", prefix.c_str());
    State state = USER_URL_CHECK;
    while (state != DONE) {
        switch (state) {
        case USER_URL_CHECK:
            if (input.m_kind == DiscoveryInput::URL) {
                principal = checkUserGivenURL(input.m_url, service, client, principals, *info, logger);
                DD_LOG_TO(logger, prefix, Logger::INFO, "user-given URL: %s", principal.toString().c_str());
            }
            state = WELL_KNOWN_CHECK;
            break;
        case WELL_KNOWN_CHECK:
            if (input.isHTTPS()) {
                Neon::URI wellKnown = input.m_url.resolve(service.wellKnownPath());
                DD_LOG_TO(logger, prefix, Logger::INFO, "checking well-known URL %s", wellKnown.toURL().c_str());
                principal = principals.resolvePrincipal(wellKnown, &service, info.get());
                DD_LOG_TO(logger, prefix, Logger::INFO, "well-known URL: %s", principal.toString().c_str());
            }
            state = DNS_DISCOVERY;
            break;
        case DNS_DISCOVERY:
            if (!input.m_domain.empty()) {
                DD_LOG_TO(logger, prefix, Logger::INFO, "no principal found yet, trying service discovery for %s",
                          input.m_domain.c_str());
                principal = discoverPrincipal(input.m_domain, service, resolver, principals, *info, logger);
            }
            state = DONE;
            break;
        case DONE:
            break;
        }
        if (principal.isFound()) {
            state = DONE;
        }
    }

    if (principal.isFound()) {
        info->m_principal = principal.get();
    }
    if (!info->isUseful()) {
        DD_LOG_TO(logger, prefix, Logger::INFO, "no %s service found", prefix.c_str());
        return boost::shared_ptr<const ServiceInfo>();
    }
    return info;
}

Outcome<Neon::URI> ResourceFinder::checkUserGivenURL(const Neon::URI &url,
                                                     const DAVService &service,
                                                     DAVClient &client,
                                                     PrincipalResolver &principals,
                                                     ServiceInfo &info,
                                                     const Logger::Handle &logger)
{
    const std::string prefix = service.serviceType();
    DD_LOG_TO(logger, prefix, Logger::INFO, "checking user-given URL %s", url.toURL().c_str());
    try {
        DAVResource resource = client.propfind(url, 0, service.probeProperties());
        CollectionRecorder(logger).recordIfCollectionOrHomeSet(resource, service, info);

        Neon::URI candidate;
        std::string href = resource.href(PROP_CURRENT_USER_PRINCIPAL);
        if (!href.empty()) {
            candidate = resource.getLocation().resolve(href);
        } else if (resource.resourceTypes() & DAVResource::PRINCIPAL) {
            // the URL itself is the principal
            candidate = resource.getLocation();
        }
        if (candidate.empty()) {
            return Outcome<Neon::URI>::absent("neither current-user-principal nor a principal");
        }
        DD_LOG_TO(logger, prefix, Logger::INFO, "principal candidate %s", candidate.toURL().c_str());
        return principals.confirm(candidate, &service);
    } catch (const Exception &) {
        return Outcome<Neon::URI>::fromException(logger, prefix);
    }
}

Outcome<Neon::URI> ResourceFinder::discoverPrincipal(const std::string &domain,
                                                     const DAVService &service,
                                                     DNSResolver &resolver,
                                                     PrincipalResolver &principals,
                                                     ServiceInfo &info,
                                                     const Logger::Handle &logger)
{
    const std::string prefix = service.serviceType();
    ServiceLocation location = ServiceLocator(resolver, logger).locateService(domain, service);

    for (const std::string &path: location.m_paths) {
        Neon::URI url = location.url(path);
        DD_LOG_TO(logger, prefix, Logger::INFO, "trying to determine principal from initial context path %s",
                  url.toURL().c_str());
        Outcome<Neon::URI> principal = principals.resolvePrincipal(url, &service, &info);
        if (principal.isFound()) {
            return principal;
        }
        if (principal.getStatus() == STATUS_NOT_FOUND ||
            principal.getStatus() == STATUS_GONE) {
            DD_LOG_TO(logger, prefix, Logger::WARNING, "no resource found at %s", url.toURL().c_str());
        } else {
            DD_LOG_TO(logger, prefix, Logger::INFO, "%s: %s", url.toURL().c_str(), principal.toString().c_str());
        }
    }
    return Outcome<Neon::URI>::absent(StringPrintf("no principal at any of the %d context paths",
                                                   (int)location.m_paths.size()));
}

DD_END_CXX
