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

#ifndef INCL_DAVDISCOVER_EXCEPTION
#define INCL_DAVDISCOVER_EXCEPTION

#include <davdiscover/Logging.h>
#include <davdiscover/DAVStatus.h>

#include <stdexcept>
#include <string>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/** Encapsulates source information. */
class SourceLocation
{
 public:
    const char *m_file;
    int m_line;

    SourceLocation(const char *file, int line) :
       m_file(file),
       m_line(line)
    {}
};

/** Convenience macro to create a SourceLocation for the current location. */
#define DD_HERE DavDiscover::SourceLocation(__FILE__, __LINE__)

enum HandleExceptionFlags {
    HANDLE_EXCEPTION_FLAGS_NONE = 0,

    /**
     * a 404 status error is possible and must not be logged as ERROR
     */
    HANDLE_EXCEPTION_404_IS_OKAY = 1 << 0,
    /**
     * don't log exception as ERROR
     */
    HANDLE_EXCEPTION_NO_ERROR = 1 << 1,
    HANDLE_EXCEPTION_MAX = 1 << 2,
};

/**
 * an exception which records the source file and line
 * where it was thrown
 */
class Exception : public std::runtime_error
{
 public:
    Exception(const std::string &file,
              int line,
              const std::string &what) :
    std::runtime_error(what),
        m_file(file),
        m_line(line)
        {}
    ~Exception() throw() {}
    const std::string m_file;
    const int m_line;

    /**
     * Convenience function, to be called inside a catch(..) block.
     *
     * Rethrows the exception to determine what it is, then logs it
     * at the chosen level (error by default).
     *
     * Turns certain known exceptions into the corresponding
     * status code if status still was STATUS_OK when called.
     * Returns updated status code.
     *
     * @param logPrefix      passed to DD_LOG* messages
     * @retval explanation   set to explanation for problem, if non-NULL
     * @param level          level to be used for logging
     * @param logger         where the messages go, the global logger if empty
     */
    static DAVStatus handle(DAVStatus *status = NULL,
                            const std::string *logPrefix = NULL,
                            std::string *explanation = NULL,
                            Logger::Level level = Logger::ERROR,
                            HandleExceptionFlags flags = HANDLE_EXCEPTION_FLAGS_NONE,
                            const Logger::Handle &logger = Logger::Handle());
    static DAVStatus handle(const std::string &logPrefix, HandleExceptionFlags flags = HANDLE_EXCEPTION_FLAGS_NONE) { return handle(NULL, &logPrefix, NULL, Logger::ERROR, flags); }
    static DAVStatus handle(std::string &explanation, HandleExceptionFlags flags = HANDLE_EXCEPTION_FLAGS_NONE) { return handle(NULL, NULL, &explanation, Logger::ERROR, flags); }
    static void handle(HandleExceptionFlags flags) { handle(NULL, NULL, NULL, Logger::ERROR, flags); }
    static void log() { handle(NULL, NULL, NULL, Logger::DEBUG); }

    /**
     * throws a StatusException with a local, fatal error with the given string
     *
     * output format: <error>
     *
     * @param error     a string describing the error
     */
    static void throwError(const SourceLocation &where, const std::string &error) DD_NORETURN;

    /**
     * throw an exception with a specific status code after an operation failed
     *
     * output format: <failure>
     *
     * @param status     a more specific status code; other throwError() variants
     *                   use STATUS_FATAL
     * @param action     a string describing what was attempted *and* how it failed
     */
    static void throwError(const SourceLocation &where, DAVStatus status, const std::string &failure) DD_NORETURN;

    /**
     * throw an exception after an operation failed
     *
     * output format: <action>: <error string>
     *
     * @Param action   a string describing the operation or object involved
     * @param error    the errno error code for the failure
     */
    static void throwError(const SourceLocation &where, const std::string &action, int error) DD_NORETURN;
};

/**
 * StatusException by wrapping a DAV status
 */
class StatusException : public Exception
{
public:
    StatusException(const std::string &file,
                    int line,
                    const std::string &what,
                    DAVStatus status)
        : Exception(file, line, what), m_status(status)
    {}

    DAVStatus davStatus() const { return m_status; }
protected:
    DAVStatus m_status;
};

/** network, TLS or timeout problem: no usable response from the server */
class TransportException : public Exception
{
 public:
    TransportException(const std::string &file,
                       int line,
                       const std::string &what) :
    Exception(file, line, what) {}
    ~TransportException() throw() {}
};

/** server answered with an HTTP error status */
class TransportStatusException : public StatusException
{
 public:
    TransportStatusException(const std::string &file,
                             int line,
                             const std::string &what,
                             DAVStatus status) :
    StatusException(file, line, what, status) {}
    ~TransportStatusException() throw() {}
};

/** resource does not exist (404 or 410) */
class NotFoundException : public TransportStatusException
{
 public:
    NotFoundException(const std::string &file,
                      int line,
                      const std::string &what,
                      DAVStatus status = STATUS_NOT_FOUND) :
    TransportStatusException(file, line, what, status) {}
    ~NotFoundException() throw() {}
};

/** response could be retrieved, but not interpreted */
class ProtocolException : public StatusException
{
 public:
    ProtocolException(const std::string &file,
                      int line,
                      const std::string &what) :
    StatusException(file, line, what, STATUS_PROTOCOL_FAILURE) {}
    ~ProtocolException() throw() {}
};

/** DNS resolution itself failed, as opposed to "no such records" */
class DNSException : public StatusException
{
 public:
    DNSException(const std::string &file,
                 int line,
                 const std::string &what) :
    StatusException(file, line, what, STATUS_DNS_FAILURE) {}
    ~DNSException() throw() {}
};

/** throw a normal davdiscover Exception, including source information */
#define DD_THROW(_what) \
    DD_THROW_EXCEPTION(DavDiscover::Exception, _what)

/** throw a class which accepts file, line, what parameters */
#define DD_THROW_EXCEPTION(_class,  _what) \
    throw _class(__FILE__, __LINE__, _what)

/** throw a class which accepts file, line, what plus 1 additional parameter */
#define DD_THROW_EXCEPTION_1(_class,  _what, _x1)   \
    throw _class(__FILE__, __LINE__, (_what), (_x1))

/** throw a class which accepts file, line, what plus 2 additional parameters */
#define DD_THROW_EXCEPTION_2(_class,  _what, _x1, _x2) \
    throw _class(__FILE__, __LINE__, (_what), (_x1), (_x2))

/** throw a class which accepts file, line, what parameters and status parameters*/
#define DD_THROW_EXCEPTION_STATUS(_class,  _what, _status) \
    throw _class(__FILE__, __LINE__, _what, _status)

DD_END_CXX
#endif // INCL_DAVDISCOVER_EXCEPTION
