/*
 * Copyright (C) 2010 Patrick Ohly <patrick.ohly@gmx.de>
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

/**
 * Simplifies usage of neon in C++ by wrapping some calls in C++
 * classes. Includes all neon header files relevant for discovery.
 */

#ifndef INCL_DAVDISCOVER_NEONCXX
#define INCL_DAVDISCOVER_NEONCXX

#include <ne_session.h>
#include <ne_utils.h>
#include <ne_basic.h>
#include <ne_props.h>
#include <ne_request.h>
#include <ne_uri.h>

#include <string>
#include <list>

#include <boost/shared_ptr.hpp>
#include <boost/function.hpp>

#include <davdiscover/util.h>
#include <davdiscover/Logging.h>
#include <davdiscover/Exception.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

namespace Neon {
#if 0
}
#endif

/** comma separated list of features supported by libneon in use */
std::string features();

class Request;

class Settings {
 public:
    virtual ~Settings() {}

    /**
     * host name must match for SSL?
     */
    virtual bool verifySSLHost() = 0;

    /**
     * SSL certificate must be valid?
     */
    virtual bool verifySSLCertificate() = 0;

    /**
     * proxy URL, empty for system default
     */
    virtual std::string proxy() = 0;

    /**
     * fill in username and password for specified realm (URL?),
     * throw error if not available
     */
    virtual void getCredentials(const std::string &realm,
                                std::string &username,
                                std::string &password) = 0;

    /**
     * send Basic authorization with the first request of
     * each operation instead of waiting for a 401
     */
    virtual bool preemptiveAuth() = 0;

    /**
     * neon debugging level, see Session::Session() how that
     * is mapped to neon debug flags
     */
    virtual int logLevel() = 0;

    /**
     * duration in seconds after which communication with a server
     * fails with a timeout error; <= 0 picks a large default value
     */
    virtual int timeoutSeconds() const = 0;
};

struct URI {
    std::string m_scheme;
    std::string m_host;
    std::string m_userinfo;
    unsigned int m_port;
    std::string m_path;
    std::string m_query;
    std::string m_fragment;

    URI() : m_port(0) {}

    /**
     * Split URL into parts. Throws ProtocolException on
     * invalid url.  Port will be set to default for scheme if not set
     * in URL. Path is normalized.
     *
     * @param collection    set to true if the normalized path is for
     *                      a collection and shall have a trailing slash
     */
    static URI parse(const std::string &url, bool collection=false);

    static URI fromNeon(const ne_uri &other, bool collection=false);

    /**
     * Produce new URI from the current one and a reference, which
     * may be a full URL, an absolute path or a relative path
     * (RFC 3986 reference resolution). Query and fragment come
     * from the reference.
     */
    URI resolve(const std::string &reference) const;

    /**
     * compose URL from parts; the port is only included
     * when it is not the default port of the scheme
     */
    std::string toURL() const;

    /**
     * URL-escape string
     */
    static std::string escape(const std::string &text);
    static std::string unescape(const std::string &text);

    /**
     * Removes differences caused by escaping different characters.
     * Appends slash if path is a collection (or meant to be one) and
     * doesn't have a trailing slash. Removes double slashes.
     *
     * @param path   an absolute path (leading slash)
     */
    static std::string normalizePath(const std::string &path, bool collection);

    bool operator == (const URI &other) const {
        return m_scheme == other.m_scheme &&
        m_host == other.m_host &&
        m_userinfo == other.m_userinfo &&
        m_port == other.m_port &&
        m_path == other.m_path &&
        m_query == other.m_query &&
        m_fragment == other.m_fragment;
    }
    bool operator != (const URI &other) const { return !(*this == other); }

    /** ordering by URL, for use as map key */
    bool operator < (const URI &other) const { return toURL() < other.toURL(); }

    bool empty() const {
        return m_scheme.empty() &&
        m_host.empty() &&
        m_userinfo.empty() &&
        m_port == 0 &&
        m_path.empty() &&
        m_query.empty() &&
        m_fragment.empty();
    }
};

/** produce debug string for status, which may be NULL */
std::string Status2String(const ne_status *status);

/**
 * Wraps all session related activities for one scheme/host/port.
 * Throws transport errors for fatal problems.
 *
 * Not thread-safe: each thread needs its own sessions.
 */
class Session {
    bool m_forceAuthorizationOnce;
    std::string m_forceUsername, m_forcePassword;

    /**
     * current operation; used for debugging output
     */
    std::string m_operation;

 public:
    /**
     * @param settings    must provide information about settings on demand
     * @param uri         scheme, host and port of the server
     * @param logger      receives all debug output of the session
     */
    Session(const boost::shared_ptr<Settings> &settings,
            const URI &uri,
            const Logger::Handle &logger);
    ~Session();

    /**
     * called with URI and complete result set; exceptions are logged, but ignored
     */
    typedef boost::function<void (const URI &, const ne_prop_result_set *)> PropfindURICallback_t;

    /**
     * called with URI and specific property, value string may be NULL (error case);
     * exceptions are logged and abort iterating over properties (but not URIs)
     */
    typedef boost::function<void (const URI &, const ne_propname *, const char *, const ne_status *)> PropfindPropCallback_t;

    /** ne_propfind_named(): invoke callback for each URI */
    void propfindURI(const std::string &path, int depth,
                     const ne_propname *props,
                     const PropfindURICallback_t &callback);

    /** ne_propfind_named(): invoke callback for each property of each URI */
    void propfindProp(const std::string &path, int depth,
                      const ne_propname *props,
                      const PropfindPropCallback_t &callback);

    /** URL which is in use */
    std::string getURL() const { return m_uri.toURL(); }

    /**
     * to be called *once* before executing a request
     *
     * call sequence is this:
     * - startOperation()
     * - create request, run(), checkError()
     *
     * @param operation    internal descriptor for debugging (for example, PROPFIND)
     * @param path         the path that the operation is about
     */
    void startOperation(const std::string &operation, const std::string &path);

    /**
     * throw error if error code indicates failure;
     * pass additional status code from a request whenever possible
     *
     * @param error      return code from Neon API call
     * @param code       HTTP status code
     * @param status     optional ne_status pointer, non-NULL for all requests
     * @param location   optional "Location" header value
     */
    void checkError(int error, int code = 0, const ne_status *status = NULL,
                    const std::string &location = "");

    ne_session *getSession() const { return m_session; }

    /**
     * force next request in this session to have Basic authorization
     * with the given username/password (which may be invalid to
     * trigger real authorization)
     */
    void forceAuthorization(const std::string &username, const std::string &password);

 private:
    boost::shared_ptr<Settings> m_settings;
    Logger::Handle m_logger;
    ne_session *m_session;
    URI m_uri;
    std::string m_proxyURL;

    /** ne_set_server_auth() callback */
    static int getCredentials(void *userdata, const char *realm, int attempt, char *username, char *password) throw();

    /** ne_ssl_set_verify() callback */
    static int sslVerify(void *userdata, int failures, const ne_ssl_certificate *cert) throw();

    /** ne_props_result callback which invokes a PropfindURICallback_t as user data */
    struct PropsResultUserdata_t {
        Session *m_session;
        const PropfindURICallback_t *m_callback;
    };
    static void propsResult(void *userdata, const ne_uri *uri,
                            const ne_prop_result_set *results) throw();

    /** iterate over properties in result set */
    void propsIterate(const URI &uri, const ne_prop_result_set *results,
                      const PropfindPropCallback_t &callback);

    /** ne_propset_iterator callback which invokes pair<URI, PropfindPropCallback_t> */
    static int propIterator(void *userdata,
                            const ne_propname *pname,
                            const char *value,
                            const ne_status *status) throw();

    struct PropIteratorUserdata_t {
        Session *m_session;
        const URI *m_uri;
        const PropfindPropCallback_t *m_callback;
    };

    /** Neon callback for preSend() */
    static void preSendHook(ne_request *req, void *userdata, ne_buffer *header) throw();
    /** implements forced Basic authentication, if requested */
    void preSend(ne_request *req, ne_buffer *header);
};

/**
 * encapsulates a ne_request, with std::string as read and write buffer
 */
class Request
{
 public:
    /**
     * read and write buffers owned by caller
     */
    Request(Session &session,
            const std::string &method,
            const std::string &path,
            const std::string &body,
            std::string &result);
    ~Request();

    /**
     * Execute the request. May only be called once per request. Uses
     * Session::checkError() underneath to detect fatal errors and throw
     * exceptions.
     */
    void run();

    std::string getResponseHeader(const std::string &name) {
        const char *value = ne_get_response_header(m_req, name.c_str());
        return value ? value : "";
    }

    /** all values of a header which may occur more than once */
    std::list<std::string> getResponseHeaders(const std::string &name);

    int getStatusCode() { return ne_get_status(m_req)->code; }
    const ne_status *getStatus() { return ne_get_status(m_req); }

 private:
    // buffers for string (copied by ne_request_create(),
    // but due to a bug in neon, our method string is still used
    // for credentials)
    std::string m_method;

    Session &m_session;
    ne_request *m_req;
    std::string *m_result;

    /** ne_block_reader implementation */
    static int addResultData(void *userdata, const char *buf, size_t len);

    /** throw error if error code *or* current status indicates failure */
    void checkError(int error);
};

/** thrown for 3xx HTTP status */
class RedirectException : public TransportException
{
    const int m_code;
    const std::string m_url;

 public:
    RedirectException(const std::string &file,
                      int line,
                      const std::string &what,
                      int code,
                      const std::string &url) :
    TransportException(file, line, what),
    m_code(code),
    m_url(url)
    {}
    ~RedirectException() throw() {}

    /** returns exact HTTP status code (301, 302, ...) */
    int getCode() const { return m_code; }

    /** returns URL to where the request was redirected */
    std::string getLocation() const { return m_url; }
};

}
DD_END_CXX

#endif // INCL_DAVDISCOVER_NEONCXX
