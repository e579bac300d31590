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

#ifndef INCL_DAVDISCOVER_DNSRESOLVER
#define INCL_DAVDISCOVER_DNSRESOLVER

#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/** one SRV resource record */
struct SRVRecord {
    int m_priority;
    int m_weight;
    int m_port;
    /** host name without trailing dot, empty for "service not available" */
    std::string m_target;

    SRVRecord() : m_priority(0), m_weight(0), m_port(0) {}
    SRVRecord(int priority, int weight, int port, const std::string &target) :
        m_priority(priority),
        m_weight(weight),
        m_port(port),
        m_target(target)
    {}
};

/** one TXT resource record: its character strings in order */
typedef std::vector<std::string> TXTRecord;

/**
 * DNS lookups needed for service discovery (RFC 6764). An empty
 * result means that the name has no such records. A failed lookup
 * (no answer from the name server, malformed reply) throws a
 * DNSException.
 */
class DNSResolver : private boost::noncopyable
{
 public:
    virtual ~DNSResolver() {}

    /** SRV records in the order of the answer section */
    virtual std::vector<SRVRecord> lookupSRV(const std::string &name) = 0;

    /** TXT records in the order of the answer section */
    virtual std::vector<TXTRecord> lookupTXT(const std::string &name) = 0;
};

/**
 * Uses the thread-safe res_n* API of libresolv, with resolver
 * state that only exists during one lookup.
 */
class ResolvDNSResolver : public DNSResolver
{
 public:
    virtual std::vector<SRVRecord> lookupSRV(const std::string &name);
    virtual std::vector<TXTRecord> lookupTXT(const std::string &name);

    /**
     * Extract the SRV records from a complete DNS answer as returned
     * by res_nquery(). An empty answer or a failure rcode yields no
     * records, a malformed answer throws a DNSException. A root
     * target (".") becomes an empty m_target.
     *
     * @param name     queried name, for error messages
     */
    static std::vector<SRVRecord> parseSRV(const std::string &name, const std::string &answer);

    /** same as parseSRV() for TXT records */
    static std::vector<TXTRecord> parseTXT(const std::string &name, const std::string &answer);

 private:
    /**
     * Run the query and return the raw answer, empty if the
     * name has no records of that type.
     */
    std::string query(const std::string &name, int type);
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_DNSRESOLVER
