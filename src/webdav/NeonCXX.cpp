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

#include "config.h"

#include "NeonCXX.h"
#include <ne_socket.h>
#include <ne_auth.h>
#include <ne_string.h>
#include <ne_alloc.h>

#include <list>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/finder.hpp>
#include <boost/bind.hpp>

#include <sstream>
#include <string.h>
#include <strings.h>

#include <davdiscover/ThreadSupport.h>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

namespace Neon {
#if 0
}
#endif

/**
 * Serializes ne_debug_init() and ne_sock_init()/ne_sock_exit(). They
 * modify process-wide state in neon, without locking, and sessions
 * get created and destroyed in several threads at once.
 */
static RecMutex globalMutex;

std::string features()
{
    std::list<std::string> res;

    if (ne_has_support(NE_FEATURE_SSL)) { res.push_back("SSL"); }
    if (ne_has_support(NE_FEATURE_ZLIB)) { res.push_back("ZLIB"); }
    if (ne_has_support(NE_FEATURE_IPV6)) { res.push_back("IPV6"); }
    if (ne_has_support(NE_FEATURE_LFS)) { res.push_back("LFS"); }
    if (ne_has_support(NE_FEATURE_SOCKS)) { res.push_back("SOCKS"); }
    if (ne_has_support(NE_FEATURE_TS_SSL)) { res.push_back("TS_SSL"); }
    if (ne_has_support(NE_FEATURE_I18N)) { res.push_back("I18N"); }
    return boost::join(res, ", ");
}

URI URI::parse(const std::string &url, bool collection)
{
    ne_uri uri;
    int error = ne_uri_parse(url.c_str(), &uri);
    URI res = fromNeon(uri, collection);
    if (!res.m_port) {
        res.m_port = ne_uri_defaultport(res.m_scheme.c_str());
    }
    ne_uri_free(&uri);
    if (error || res.m_scheme.empty() || res.m_host.empty()) {
        DD_THROW_EXCEPTION(ProtocolException,
                           StringPrintf("invalid URL '%s' (parsed as '%s')",
                                        url.c_str(),
                                        res.toURL().c_str()));
    }
    return res;
}

URI URI::fromNeon(const ne_uri &uri, bool collection)
{
    URI res;

    if (uri.scheme) { res.m_scheme = uri.scheme; }
    if (uri.host) { res.m_host = uri.host; }
    if (uri.userinfo) { res.m_userinfo = uri.userinfo; }
    if (uri.path) { res.m_path = normalizePath(uri.path, collection); }
    if (uri.query) { res.m_query = uri.query; }
    if (uri.fragment) { res.m_fragment = uri.fragment; }
    res.m_port = uri.port;

    return res;
}

/** NULL for empty strings, the way ne_uri expects unset parts */
static char *uriPart(const std::string &part)
{
    return part.empty() ? NULL : const_cast<char *>(part.c_str());
}

URI URI::resolve(const std::string &reference) const
{
    ne_uri base, rel, full;
    memset(&base, 0, sizeof(base));
    memset(&full, 0, sizeof(full));
    base.scheme = uriPart(m_scheme);
    base.host = uriPart(m_host);
    base.userinfo = uriPart(m_userinfo);
    base.port = m_port;
    base.path = const_cast<char *>(m_path.empty() ? "/" : m_path.c_str());
    base.query = uriPart(m_query);

    if (ne_uri_parse(reference.c_str(), &rel)) {
        ne_uri_free(&rel);
        DD_THROW_EXCEPTION(ProtocolException,
                           StringPrintf("invalid reference '%s' relative to '%s'",
                                        reference.c_str(),
                                        toURL().c_str()));
    }
    ne_uri_resolve(&base, &rel, &full);
    URI res = fromNeon(full);
    if (!res.m_port) {
        res.m_port = ne_uri_defaultport(res.m_scheme.c_str());
    }
    ne_uri_free(&rel);
    ne_uri_free(&full);
    return res;
}

std::string URI::toURL() const
{
    std::ostringstream buffer;

    buffer << m_scheme << "://";
    if (!m_userinfo.empty()) {
        buffer << m_userinfo << "@";
    }
    buffer << m_host;
    if (m_port &&
        m_port != ne_uri_defaultport(m_scheme.c_str())) {
        buffer << ":" << m_port;
    }
    buffer << m_path;
    if (!m_query.empty()) {
        buffer << "?" << m_query;
    }
    if (!m_fragment.empty()) {
        buffer << "#" << m_fragment;
    }
    return buffer.str();
}

std::string URI::escape(const std::string &text)
{
    boost::shared_ptr<char> tmp(ne_path_escape(text.c_str()), ne_free);
    // Fail gracefully: if the escaping fails, just return the same
    // string, because, well, it couldn't be escaped.
    return tmp ? tmp.get() : text;
}

std::string URI::unescape(const std::string &text)
{
    boost::shared_ptr<char> tmp(ne_path_unescape(text.c_str()), ne_free);
    // Fail gracefully. See also the similar comment for the escape() method.
    return tmp ? tmp.get() : text;
}

std::string URI::normalizePath(const std::string &path, bool collection)
{
    std::string res;
    res.reserve(path.size() * 150 / 100);

    // always start with one leading slash
    res = "/";

    typedef boost::split_iterator<std::string::const_iterator> string_split_iterator;
    string_split_iterator it =
        boost::make_split_iterator(path, boost::first_finder("/", boost::is_iequal()));
    while (!it.eof()) {
        if (it->begin() == it->end()) {
            // avoid adding empty path components
            ++it;
        } else {
            std::string split(it->begin(), it->end());
            res += escape(unescape(split));
            ++it;
            if (!it.eof()) {
                res += '/';
            }
        }
    }
    if (collection && !boost::ends_with(res, "/")) {
        res += '/';
    }
    return res;
}

std::string Status2String(const ne_status *status)
{
    if (!status) {
        return "<NULL status>";
    }
    return StringPrintf("<status %d.%d, code %d, class %d, %s>",
                        status->major_version,
                        status->minor_version,
                        status->code,
                        status->klass,
                        status->reason_phrase ? status->reason_phrase : "\"\"");
}

Session::Session(const boost::shared_ptr<Settings> &settings,
                 const URI &uri,
                 const Logger::Handle &logger) :
    m_forceAuthorizationOnce(false),
    m_settings(settings),
    m_logger(Logger::instance(logger)),
    m_session(NULL),
    m_uri(uri)
{
    int logLevel = m_settings->logLevel();
    RecMutex::Guard guard = globalMutex.lock();
    if (logLevel >= 3) {
        ne_debug_init(stderr,
                      NE_DBG_FLUSH|NE_DBG_HTTP|NE_DBG_HTTPAUTH|
                      (logLevel >= 4 ? NE_DBG_HTTPBODY : 0) |
                      (logLevel >= 5 ? (NE_DBG_LOCKS|NE_DBG_SSL) : 0)|
                      (logLevel >= 6 ? (NE_DBG_XML|NE_DBG_XMLPARSE) : 0)|
                      (logLevel >= 11 ? (NE_DBG_HTTPPLAIN) : 0));
    } else {
        ne_debug_init(NULL, 0);
    }

    ne_sock_init();
    guard.unlock();

    m_uri.m_path = "/";
    m_uri.m_query.clear();
    m_uri.m_fragment.clear();
    m_session = ne_session_create(m_uri.m_scheme.c_str(),
                                  m_uri.m_host.c_str(),
                                  m_uri.m_port);
    ne_set_server_auth(m_session, getCredentials, this);
    if (m_uri.m_scheme == "https") {
        // neon only initializes session->ssl_context if
        // using https and segfaults in ne_ssl_trust_default_ca()
        // of ne_gnutls.c if ne_ssl_trust_default_ca()
        // is called for non-https. So better call these
        // functions only when needed.
        ne_ssl_set_verify(m_session, sslVerify, this);
        ne_ssl_trust_default_ca(m_session);
    }

    m_proxyURL = settings->proxy();
    if (m_proxyURL.empty()) {
        ne_session_system_proxy(m_session, 0);
    } else {
        URI proxyuri = URI::parse(m_proxyURL);
        ne_session_proxy(m_session, proxyuri.m_host.c_str(), proxyuri.m_port);
    }

    int seconds = settings->timeoutSeconds();
    if (seconds <= 0) {
        seconds = 5 * 60;
    }
    ne_set_read_timeout(m_session, seconds);
    ne_set_connect_timeout(m_session, seconds);
    ne_hook_pre_send(m_session, preSendHook, this);
    DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "new neon session for %s, features %s",
              m_uri.toURL().c_str(),
              features().c_str());
}

Session::~Session()
{
    if (m_session) {
        ne_session_destroy(m_session);
    }
    RecMutex::Guard guard = globalMutex.lock();
    ne_sock_exit();
}

int Session::getCredentials(void *userdata, const char *realm, int attempt, char *username, char *password) throw()
{
    Session *session = static_cast<Session *>(userdata);
    try {
        if (!attempt) {
            // try again with credentials
            std::string user, pw;
            session->m_settings->getCredentials(realm, user, pw);
            Strncpy(username, user.c_str(), NE_ABUFSIZ);
            Strncpy(password, pw.c_str(), NE_ABUFSIZ);
            DD_LOG_TO(session->m_logger, NULL, Logger::DEBUG, "retry request with credentials");
            return 0;
        } else {
            // give up
            return 1;
        }
    } catch (...) {
        Exception::handle(NULL, NULL, NULL, Logger::ERROR, HANDLE_EXCEPTION_FLAGS_NONE, session->m_logger);
        DD_LOG_TO(session->m_logger, NULL, Logger::ERROR, "no credentials for %s", realm);
        return 1;
    }
}

void Session::forceAuthorization(const std::string &username, const std::string &password)
{
    m_forceAuthorizationOnce = true;
    m_forceUsername = username;
    m_forcePassword = password;
}

void Session::preSendHook(ne_request *req, void *userdata, ne_buffer *header) throw()
{
    Session *session = static_cast<Session *>(userdata);
    try {
        session->preSend(req, header);
    } catch (...) {
        Exception::handle(NULL, NULL, NULL, Logger::ERROR, HANDLE_EXCEPTION_FLAGS_NONE, session->m_logger);
    }
}

void Session::preSend(ne_request *req, ne_buffer *header)
{
    // sanity check: startOperation must have been called
    if (m_operation.empty()) {
        DD_THROW("internal error: startOperation() not called");
    }

    if (m_forceAuthorizationOnce) {
        // only do this once
        m_forceAuthorizationOnce = false;

        // append "Authorization: Basic" header if not present already
        if (!boost::starts_with(header->data, "Authorization:") &&
            !strstr(header->data, "\nAuthorization:")) {
            std::string credentials = m_forceUsername + ":" + m_forcePassword;
            boost::shared_ptr<char> blob(ne_base64((const unsigned char *)credentials.c_str(), credentials.size()),
                                         ne_free);
            ne_buffer_concat(header, "Authorization: Basic ", blob.get(), "\r\n", NULL);
        }

        DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "forced sending credentials");
    }
}

int Session::sslVerify(void *userdata, int failures, const ne_ssl_certificate *cert) throw()
{
    Session *session = static_cast<Session *>(userdata);
    try {
        static const Flag descr[] = {
            { NE_SSL_NOTYETVALID, "certificate not yet valid" },
            { NE_SSL_EXPIRED, "certificate has expired" },
            { NE_SSL_IDMISMATCH, "hostname mismatch" },
            { NE_SSL_UNTRUSTED, "untrusted certificate" },
            { 0, NULL }
        };

        DD_LOG_TO(session->m_logger, NULL, Logger::DEBUG,
                  "%s: SSL verification problem: %s",
                  session->getURL().c_str(),
                  Flags2String(failures, descr).c_str());
        if (!session->m_settings->verifySSLCertificate()) {
            DD_LOG_TO(session->m_logger, NULL, Logger::DEBUG, "ignoring bad certificate");
            return 0;
        }
        if (failures == NE_SSL_IDMISMATCH &&
            !session->m_settings->verifySSLHost()) {
            DD_LOG_TO(session->m_logger, NULL, Logger::DEBUG, "ignoring hostname mismatch");
            return 0;
        }
        return 1;
    } catch (...) {
        Exception::handle(NULL, NULL, NULL, Logger::ERROR, HANDLE_EXCEPTION_FLAGS_NONE, session->m_logger);
        return 1;
    }
}

class PropFindDeleter
{
public:
    void operator () (ne_propfind_handler *handler) { if (handler) { ne_propfind_destroy(handler); } }
};

void Session::propfindURI(const std::string &path, int depth,
                          const ne_propname *props,
                          const PropfindURICallback_t &callback)
{
    startOperation(StringPrintf("PROPFIND depth %d", depth), path);

    boost::shared_ptr<ne_propfind_handler> handler;
    int error;

    handler = boost::shared_ptr<ne_propfind_handler>(ne_propfind_create(m_session, path.c_str(), depth),
                                                     PropFindDeleter());
    PropsResultUserdata_t data = { this, &callback };
    if (props != NULL) {
        error = ne_propfind_named(handler.get(), props,
                                  propsResult, &data);
    } else {
        error = ne_propfind_allprop(handler.get(),
                                    propsResult, &data);
    }

    // remain valid as long as "handler" is valid
    ne_request *req = ne_propfind_get_request(handler.get());
    const ne_status *status = ne_get_status(req);
    const char *tmp = ne_get_response_header(req, "Location");
    std::string location(tmp ? tmp : "");

    checkError(error, status->code, status, location);
}

void Session::propsResult(void *userdata, const ne_uri *uri,
                          const ne_prop_result_set *results) throw()
{
    PropsResultUserdata_t *data = static_cast<PropsResultUserdata_t *>(userdata);
    try {
        (*data->m_callback)(URI::fromNeon(*uri), results);
    } catch (...) {
        Exception::handle(NULL, NULL, NULL, Logger::ERROR, HANDLE_EXCEPTION_FLAGS_NONE, data->m_session->m_logger);
    }
}

void Session::propfindProp(const std::string &path, int depth,
                           const ne_propname *props,
                           const PropfindPropCallback_t &callback)
{
    propfindURI(path, depth, props,
                boost::bind(&Session::propsIterate, this, _1, _2, boost::cref(callback)));
}

void Session::propsIterate(const URI &uri, const ne_prop_result_set *results,
                           const PropfindPropCallback_t &callback)
{
    PropIteratorUserdata_t data = { this, &uri, &callback };
    ne_propset_iterate(results,
                       propIterator,
                       &data);
}

int Session::propIterator(void *userdata,
                          const ne_propname *pname,
                          const char *value,
                          const ne_status *status) throw()
{
    const PropIteratorUserdata_t *data = static_cast<const PropIteratorUserdata_t *>(userdata);
    try {
        (*data->m_callback)(*data->m_uri, pname, value, status);
        return 0;
    } catch (...) {
        Exception::handle(NULL, NULL, NULL, Logger::ERROR, HANDLE_EXCEPTION_FLAGS_NONE, data->m_session->m_logger);
        return 1; // abort iterating
    }
}

void Session::startOperation(const std::string &operation, const std::string &path)
{
    URI uri = m_uri;
    uri.m_path = path;
    DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "starting %s %s, %s",
              operation.c_str(),
              uri.toURL().c_str(),
              m_forceAuthorizationOnce ? "with credentials" : "without credentials");

    // remember current operation attributes
    m_operation = operation;
}

void Session::checkError(int error, int code, const ne_status *status, const std::string &location)
{
    // unset operation
    std::string operation = m_operation;
    m_operation = "";

    // determine error description, may be made more specific below
    std::string descr;
    if (code) {
        descr = StringPrintf("%s: Neon error code %d, HTTP status %d: %s",
                             operation.c_str(),
                             error, code,
                             ne_get_error(m_session));
    } else {
        descr = StringPrintf("%s: Neon error code %d, no HTTP status: %s",
                             operation.c_str(),
                             error,
                             ne_get_error(m_session));
    }

    // detect redirect
    if ((error == NE_ERROR || error == NE_OK) &&
        (code >= 300 && code <= 399)) {
        DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "%s: %d status: redirected to %s",
                  operation.c_str(), code, location.c_str());
        DD_THROW_EXCEPTION_2(RedirectException,
                             StringPrintf("%s: %d status: redirected to %s",
                                          operation.c_str(),
                                          code,
                                          location.c_str()),
                             code,
                             location);
    }

    switch (error) {
    case NE_OK:
        // request itself completed, but might still have resulted in bad status
        if (code &&
            (code < 200 || code >= 300)) {
            if (status) {
                descr = StringPrintf("%s: bad HTTP status: %s",
                                     operation.c_str(),
                                     Status2String(status).c_str());
            } else {
                descr = StringPrintf("%s: bad HTTP status: %d",
                                     operation.c_str(),
                                     code);
            }
        } else {
            // all fine
            DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "%s: HTTP status %d",
                      operation.c_str(), code);
            return;
        }
        break;
    case NE_AUTH:
        // tell caller what kind of transport error occurred
        code = STATUS_UNAUTHORIZED;
        descr = StringPrintf("%s: Neon error code %d = NE_AUTH, HTTP status %d: %s",
                             operation.c_str(),
                             error, code,
                             ne_get_error(m_session));
        break;
    case NE_ERROR:
        if (code) {
            descr = StringPrintf("%s: Neon error code %d: %s",
                                 operation.c_str(),
                                 error,
                                 ne_get_error(m_session));
            if (code >= 200 && code <= 299) {
                // the server said yes, but we could not parse the reply
                DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "%s", descr.c_str());
                DD_THROW_EXCEPTION(ProtocolException, descr);
            }
        }
        break;
    }

    DD_LOG_TO(m_logger, NULL, Logger::DEBUG, "%s", descr.c_str());
    if (code == STATUS_NOT_FOUND || code == STATUS_GONE) {
        DD_THROW_EXCEPTION_STATUS(NotFoundException,
                                  descr,
                                  DAVStatus(code));
    } else if (code) {
        // copy error code into exception
        DD_THROW_EXCEPTION_STATUS(TransportStatusException,
                                  descr,
                                  DAVStatus(code));
    } else {
        DD_THROW_EXCEPTION(TransportException,
                           descr);
    }
}

Request::Request(Session &session,
                 const std::string &method,
                 const std::string &path,
                 const std::string &body,
                 std::string &result) :
    m_method(method),
    m_session(session),
    m_result(&result)
{
    m_req = ne_request_create(session.getSession(), m_method.c_str(), path.c_str());
    ne_set_request_body_buffer(m_req, body.c_str(), body.size());
}

Request::~Request()
{
    ne_request_destroy(m_req);
}

void Request::run()
{
    m_result->clear();
    ne_add_response_body_reader(m_req, ne_accept_2xx,
                                addResultData, this);
    int error = ne_request_dispatch(m_req);
    checkError(error);
}

std::list<std::string> Request::getResponseHeaders(const std::string &name)
{
    std::list<std::string> res;
    void *cursor = NULL;
    const char *header, *value;
    while ((cursor = ne_response_header_iterate(m_req, cursor, &header, &value)) != NULL) {
        if (!strcasecmp(header, name.c_str())) {
            res.push_back(value);
        }
    }
    return res;
}

int Request::addResultData(void *userdata, const char *buf, size_t len)
{
    Request *me = static_cast<Request *>(userdata);
    me->m_result->append(buf, len);
    return 0;
}

void Request::checkError(int error)
{
    m_session.checkError(error, getStatus()->code, getStatus(), getResponseHeader("Location"));
}

#ifdef ENABLE_UNIT_TESTS

class NeonURITest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(NeonURITest);
    CPPUNIT_TEST(testParse);
    CPPUNIT_TEST(testResolve);
    CPPUNIT_TEST(testNormalize);
    CPPUNIT_TEST_SUITE_END();

    void testParse()
    {
        URI uri = URI::parse("https://example.com/dav");
        CPPUNIT_ASSERT_EQUAL(std::string("https"), uri.m_scheme);
        CPPUNIT_ASSERT_EQUAL(std::string("example.com"), uri.m_host);
        CPPUNIT_ASSERT_EQUAL(443u, uri.m_port);
        CPPUNIT_ASSERT_EQUAL(std::string("/dav"), uri.m_path);
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/dav"), uri.toURL());

        uri = URI::parse("http://example.com:8008/dav", true);
        CPPUNIT_ASSERT_EQUAL(8008u, uri.m_port);
        CPPUNIT_ASSERT_EQUAL(std::string("http://example.com:8008/dav/"), uri.toURL());

        CPPUNIT_ASSERT_THROW(URI::parse("no url"), ProtocolException);
    }

    void testResolve()
    {
        URI base = URI::parse("https://example.com/dav/principals/");
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/principals/alice/"),
                             base.resolve("/principals/alice/").toURL());
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/dav/principals/bob/"),
                             base.resolve("bob/").toURL());
        CPPUNIT_ASSERT_EQUAL(std::string("https://other.example.com:8443/x/"),
                             base.resolve("https://other.example.com:8443/x/").toURL());
        CPPUNIT_ASSERT_EQUAL(std::string("https://example.com/dav/"),
                             base.resolve("..").toURL());
    }

    void testNormalize()
    {
        CPPUNIT_ASSERT_EQUAL(std::string("/"), URI::normalizePath("", false));
        CPPUNIT_ASSERT_EQUAL(std::string("/"), URI::normalizePath("", true));
        CPPUNIT_ASSERT_EQUAL(std::string("/a/b/"), URI::normalizePath("//a//b", true));
        CPPUNIT_ASSERT_EQUAL(std::string("/a/b/"), URI::normalizePath("/a/b/", true));
        CPPUNIT_ASSERT_EQUAL(std::string("/a/b"), URI::normalizePath("/a/b", false));
        CPPUNIT_ASSERT_EQUAL(URI::normalizePath("/a%20b/", true), URI::normalizePath("/a b", true));
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(NeonURITest);

#endif // ENABLE_UNIT_TESTS

}
DD_END_CXX
