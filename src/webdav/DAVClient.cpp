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
#include "DAVClient.h"

#include <boost/bind.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <vector>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/** path plus query, as needed for a request line */
static std::string requestPath(const Neon::URI &url)
{
    std::string path = url.m_path.empty() ? "/" : url.m_path;
    if (!url.m_query.empty()) {
        path += "?";
        path += url.m_query;
    }
    return path;
}

/** compare paths, ignoring a trailing slash */
static bool samePath(const std::string &a, const std::string &b)
{
    size_t lenA = a.size(), lenB = b.size();
    if (boost::ends_with(a, "/")) {
        lenA--;
    }
    if (boost::ends_with(b, "/")) {
        lenB--;
    }
    return lenA == lenB && !a.compare(0, lenA, b, 0, lenB);
}

NeonDAVClient::NeonDAVClient(const boost::shared_ptr<Neon::Settings> &settings,
                             const Logger::Handle &logger) :
    m_settings(settings),
    m_logger(logger)
{
}

Neon::Session &NeonDAVClient::getSession(const Neon::URI &url)
{
    std::string key = StringPrintf("%s://%s:%u",
                                   url.m_scheme.c_str(),
                                   url.m_host.c_str(),
                                   url.m_port);
    boost::shared_ptr<Neon::Session> &session = m_sessions[key];
    if (!session) {
        session.reset(new Neon::Session(m_settings, url, m_logger));
    }
    return *session;
}

void NeonDAVClient::prepare(Neon::Session &session)
{
    if (m_settings->preemptiveAuth()) {
        std::string username, password;
        m_settings->getCredentials("", username, password);
        session.forceAuthorization(username, password);
    }
}

Neon::URI NeonDAVClient::redirect(const Neon::URI &current, const Neon::RedirectException &ex, int &redirects)
{
    if (++redirects > MAX_REDIRECTS) {
        DD_THROW_EXCEPTION(ProtocolException,
                           StringPrintf("%s: too many redirects", current.toURL().c_str()));
    }
    if (ex.getLocation().empty()) {
        DD_THROW_EXCEPTION(ProtocolException,
                           StringPrintf("%s: %d redirect without location",
                                        current.toURL().c_str(),
                                        ex.getCode()));
    }
    Neon::URI next = current.resolve(ex.getLocation());
    DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "following %d redirect from %s to %s",
              ex.getCode(),
              current.toURL().c_str(),
              next.toURL().c_str());
    return next;
}

void NeonDAVClient::storeProperty(Responses_t &responses,
                                  const Neon::URI &uri,
                                  const ne_propname *prop,
                                  const char *value,
                                  const ne_status *status)
{
    // also remember responses without any known property
    DAVResource &resource = responses[uri.m_path];
    PropertyKind kind;
    if (value &&
        PropertyKindFromName(*prop, kind)) {
        resource.setProperty(kind, value);
    }
}

DAVResource NeonDAVClient::propfind(const Neon::URI &url, int depth, const PropertyKinds &props)
{
    std::vector<ne_propname> names;
    for (PropertyKind kind: props) {
        names.push_back(PropertyName(kind));
    }
    ne_propname end = { NULL, NULL };
    names.push_back(end);

    Neon::URI current = url;
    int redirects = 0;
    while (true) {
        Neon::Session &session = getSession(current);
        prepare(session);
        Responses_t responses;
        try {
            session.propfindProp(requestPath(current), depth, &names[0],
                                 boost::bind(&NeonDAVClient::storeProperty,
                                             boost::ref(responses),
                                             _1, _2, _3, _4));
        } catch (const Neon::RedirectException &ex) {
            current = redirect(current, ex, redirects);
            continue;
        }

        Responses_t::iterator it = responses.begin();
        while (it != responses.end() &&
               !samePath(it->first, current.m_path)) {
            ++it;
        }
        if (it == responses.end()) {
            if (responses.empty()) {
                DD_THROW_EXCEPTION(ProtocolException,
                                   StringPrintf("%s: PROPFIND response without properties",
                                                current.toURL().c_str()));
            }
            // No reply for requested path? Some servers return information
            // about a different path. Move to that path.
            it = responses.begin();
            DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "use properties for '%s' instead of '%s'",
                      it->first.c_str(), current.toURL().c_str());
        }

        DAVResource result = it->second;
        Neon::URI location = current;
        location.m_path = it->first;
        location.m_query.clear();
        result.setLocation(location);
        DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "properties of %s:\n%s",
                  location.toURL().c_str(),
                  result.dump().c_str());
        return result;
    }
}

std::set<std::string> NeonDAVClient::options(const Neon::URI &url)
{
    Neon::URI current = url;
    int redirects = 0;
    while (true) {
        Neon::Session &session = getSession(current);
        prepare(session);
        std::string path = requestPath(current);
        session.startOperation("OPTIONS", path);
        std::string result;
        Neon::Request req(session, "OPTIONS", path, "", result);
        try {
            req.run();
        } catch (const Neon::RedirectException &ex) {
            current = redirect(current, ex, redirects);
            continue;
        }

        std::set<std::string> capabilities;
        for (const std::string &header: req.getResponseHeaders("DAV")) {
            std::vector<std::string> tokens;
            boost::split(tokens, header, boost::is_any_of(","));
            for (std::string &token: tokens) {
                boost::trim(token);
                if (!token.empty()) {
                    capabilities.insert(token);
                }
            }
        }
        DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "DAV capabilities of %s: %s",
                  current.toURL().c_str(),
                  boost::join(capabilities, ", ").c_str());
        return capabilities;
    }
}

DD_END_CXX
