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

#ifndef INCL_DAVDISCOVER_DAVSTATUS
#define INCL_DAVDISCOVER_DAVSTATUS

#include <string>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Status codes used in exceptions and results. Values in the
 * 100-599 range are HTTP status codes as returned by the server,
 * everything else is a local problem.
 */
enum DAVStatus {
    /** no error */
    STATUS_OK = 0,
    STATUS_HTTP_OK = 200,
    STATUS_MULTISTATUS = 207,
    STATUS_UNAUTHORIZED = 401,
    STATUS_FORBIDDEN = 403,
    STATUS_NOT_FOUND = 404,
    STATUS_METHOD_NOT_ALLOWED = 405,
    STATUS_GONE = 410,
    /** generic local or remote failure */
    STATUS_FATAL = 500,

    /** network or TLS problem, no HTTP status available */
    STATUS_TRANSPORT_FAILURE = 20043,
    /** server response could not be interpreted */
    STATUS_PROTOCOL_FAILURE = 20044,
    /** DNS lookup failed */
    STATUS_DNS_FAILURE = 20045,

    STATUS_MAX = 0x7FFFFFF
};

/** human readable description, including the numeric code */
std::string Status2String(DAVStatus status);

DD_END_CXX
#endif // INCL_DAVDISCOVER_DAVSTATUS
