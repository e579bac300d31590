/*
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

/**
 * Header file that is included by all davdiscover files.
 * Sets up the "DavDiscover" namespace.
 */

#ifndef INCL_DAVDISCOVER_DECLARATIONS
#define INCL_DAVDISCOVER_DECLARATIONS

#define DD_BEGIN_CXX namespace DavDiscover {
#define DD_END_CXX }

#ifdef __GNUC__
# define DD_NORETURN __attribute__((noreturn))
#else
# define DD_NORETURN
#endif

DD_BEGIN_CXX
/*
 * Library code never writes to standard IO directly: messages go
 * through the Logger, results are returned to the caller. Only the
 * command line tool decides where output ends up.
 *
 * These dummy declarations trip up code inside the DavDiscover
 * namespace which uses plain "cout << something" after a "using
 * namespace std".
 */
struct DontUseStandardIO;
extern DontUseStandardIO *cout;
extern DontUseStandardIO *cerr;
DD_END_CXX

#endif /** INCL_DAVDISCOVER_DECLARATIONS */
