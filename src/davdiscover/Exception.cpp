/*
 * Copyright (C) 2009 Patrick Ohly <patrick.ohly@gmx.de>
 * Copyright (C) 2009 Intel Corporation
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
#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <errno.h>
#include <string.h>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include <davdiscover/LogCollect.h>
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

static const char * const TRANSPORT_PROBLEM = "transport problem: ";
static const char * const DNS_PROBLEM = "DNS problem: ";
static const char * const DAVDISCOVER_PROBLEM = "error code from davdiscover ";

DAVStatus Exception::handle(DAVStatus *status,
                            const std::string *logPrefix,
                            std::string *explanation,
                            Logger::Level level,
                            HandleExceptionFlags flags,
                            const Logger::Handle &logger)
{
    // any problem here is a fatal local problem, unless set otherwise
    // by the specific exception
    DAVStatus new_status = STATUS_FATAL;
    std::string error;

    try {
        throw;
    } catch (const TransportException &ex) {
        DD_LOG_TO(logger, logPrefix, Logger::DEBUG, "TransportException thrown at %s:%d",
                  ex.m_file.c_str(), ex.m_line);
        error = std::string(TRANSPORT_PROBLEM) + ex.what();
        new_status = STATUS_TRANSPORT_FAILURE;
    } catch (const DNSException &ex) {
        DD_LOG_TO(logger, logPrefix, Logger::DEBUG, "DNSException thrown at %s:%d",
                  ex.m_file.c_str(), ex.m_line);
        error = std::string(DNS_PROBLEM) + ex.what();
        new_status = ex.davStatus();
    } catch (const StatusException &ex) {
        new_status = ex.davStatus();
        DD_LOG_TO(logger, logPrefix, Logger::DEBUG, "exception thrown at %s:%d",
                  ex.m_file.c_str(), ex.m_line);
        error = StringPrintf("%s%s: %s",
                             DAVDISCOVER_PROBLEM,
                             Status2String(new_status).c_str(), ex.what());
        if ((new_status == STATUS_NOT_FOUND || new_status == STATUS_GONE) &&
            (flags & HANDLE_EXCEPTION_404_IS_OKAY)) {
            level = Logger::DEBUG;
        }
    } catch (const Exception &ex) {
        DD_LOG_TO(logger, logPrefix, Logger::DEBUG, "exception thrown at %s:%d",
                  ex.m_file.c_str(), ex.m_line);
        error = ex.what();
    } catch (const std::exception &ex) {
        error = ex.what();
    } catch (...) {
        error = "unknown error";
    }
    if (flags & HANDLE_EXCEPTION_NO_ERROR) {
        level = Logger::DEBUG;
    }
    DD_LOG_TO(logger, logPrefix, level, "%s", error.c_str());

    if (explanation) {
        *explanation = error;
    }

    if (status && *status == STATUS_OK) {
        *status = new_status;
    }
    return status ? *status : new_status;
}

void Exception::throwError(const SourceLocation &where, const std::string &error)
{
    throwError(where, STATUS_FATAL, error);
}

void Exception::throwError(const SourceLocation &where, DAVStatus status, const std::string &error)
{
    throw StatusException(where.m_file, where.m_line, error, status);
}

void Exception::throwError(const SourceLocation &where, const std::string &action, int error)
{
    std::string what = action + ": " + strerror(error);
    // be as specific if we can be: "file not found" is expected
    // when reading optional config files
    if (error == ENOENT) {
        throwError(where, STATUS_NOT_FOUND, what);
    } else {
        throwError(where, what);
    }
}

#ifdef ENABLE_UNIT_TESTS

class ExceptionTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(ExceptionTest);
    CPPUNIT_TEST(testHandle);
    CPPUNIT_TEST(testNotFound);
    CPPUNIT_TEST(testErrno);
    CPPUNIT_TEST_SUITE_END();

    class Sink : public Logger
    {
    public:
        virtual void messagev(const MessageOptions &options,
                              const char *format,
                              va_list args) {}
    };

    void testHandle()
    {
        boost::shared_ptr<LogCollect> collect(new LogCollect(Logger::Handle(new Sink)));
        std::string explanation;
        DAVStatus status = STATUS_OK;
        try {
            DD_THROW_EXCEPTION(TransportException, "connection refused");
        } catch (...) {
            Exception::handle(&status, NULL, &explanation, Logger::ERROR,
                              HANDLE_EXCEPTION_FLAGS_NONE, collect);
        }
        CPPUNIT_ASSERT_EQUAL(STATUS_TRANSPORT_FAILURE, status);
        CPPUNIT_ASSERT_EQUAL(std::string("transport problem: connection refused"), explanation);
        CPPUNIT_ASSERT(collect->getLog().find("[ERROR] transport problem: connection refused\n") != std::string::npos);

        // first status wins
        try {
            DD_THROW_EXCEPTION(ProtocolException, "no multistatus");
        } catch (...) {
            Exception::handle(&status, NULL, &explanation, Logger::ERROR,
                              HANDLE_EXCEPTION_FLAGS_NONE, collect);
        }
        CPPUNIT_ASSERT_EQUAL(STATUS_TRANSPORT_FAILURE, status);
        CPPUNIT_ASSERT_EQUAL(std::string("error code from davdiscover unexpected server response (local, status 20044): no multistatus"),
                             explanation);
    }

    void testNotFound()
    {
        boost::shared_ptr<LogCollect> collect(new LogCollect(Logger::Handle(new Sink)));
        const std::string prefix("carddav");
        DAVStatus status;
        try {
            DD_THROW_EXCEPTION_STATUS(NotFoundException, "https://example.com/x", STATUS_GONE);
        } catch (...) {
            status = Exception::handle(NULL, &prefix, NULL, Logger::ERROR,
                                       HANDLE_EXCEPTION_404_IS_OKAY, collect);
        }
        CPPUNIT_ASSERT_EQUAL(STATUS_GONE, status);
        CPPUNIT_ASSERT(collect->getLog().find("[ERROR]") == std::string::npos);
        CPPUNIT_ASSERT(collect->getLog().find("[DEBUG] carddav: error code from davdiscover object gone") != std::string::npos);
    }

    void testErrno()
    {
        try {
            Exception::throwError(DD_HERE, "/no/such/file", ENOENT);
            CPPUNIT_FAIL("should have thrown");
        } catch (const StatusException &ex) {
            CPPUNIT_ASSERT_EQUAL(STATUS_NOT_FOUND, ex.davStatus());
            CPPUNIT_ASSERT(std::string(ex.what()).find("/no/such/file: ") == 0);
        }
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(ExceptionTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
