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
#include "DNSResolver.h"

#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>
#include <netdb.h>
#include <string.h>

#include <list>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

namespace {
/** initialized resolver state, closed again when going out of scope */
class ResState : private boost::noncopyable
{
    struct __res_state m_state;

public:
    ResState(const std::string &name)
    {
        memset(&m_state, 0, sizeof(m_state));
        if (res_ninit(&m_state)) {
            DD_THROW_EXCEPTION(DNSException,
                               StringPrintf("%s: initializing resolver failed", name.c_str()));
        }
    }
    ~ResState() { res_nclose(&m_state); }
    res_state get() { return &m_state; }
};
}

std::string ResolvDNSResolver::query(const std::string &name, int type)
{
    ResState state(name);
    unsigned char answer[NS_MAXMSG];
    int len = res_nquery(state.get(), name.c_str(), ns_c_in, type, answer, sizeof(answer));
    if (len < 0) {
        int error = state.get()->res_h_errno;
        if (error == HOST_NOT_FOUND ||
            error == NO_DATA) {
            // authoritative "no such records"
            return "";
        }
        DD_THROW_EXCEPTION(DNSException,
                           StringPrintf("%s: %s", name.c_str(), hstrerror(error)));
    }
    return std::string((const char *)answer, len);
}

std::vector<SRVRecord> ResolvDNSResolver::lookupSRV(const std::string &name)
{
    return parseSRV(name, query(name, ns_t_srv));
}

std::vector<TXTRecord> ResolvDNSResolver::lookupTXT(const std::string &name)
{
    return parseTXT(name, query(name, ns_t_txt));
}

std::vector<SRVRecord> ResolvDNSResolver::parseSRV(const std::string &name, const std::string &answer)
{
    std::vector<SRVRecord> res;
    if (answer.empty()) {
        return res;
    }

    ns_msg handle;
    if (ns_initparse((const unsigned char *)answer.c_str(), answer.size(), &handle)) {
        DD_THROW_EXCEPTION(DNSException, StringPrintf("%s: malformed SRV answer", name.c_str()));
    }
    if (ns_msg_getflag(handle, ns_f_rcode) != ns_r_noerror) {
        return res;
    }

    for (int i = 0; i < ns_msg_count(handle, ns_s_an); i++) {
        ns_rr rr;
        if (ns_parserr(&handle, ns_s_an, i, &rr)) {
            DD_THROW_EXCEPTION(DNSException, StringPrintf("%s: malformed SRV record", name.c_str()));
        }
        if (ns_rr_type(rr) != ns_t_srv ||
            ns_rr_rdlen(rr) < 3 * NS_INT16SZ) {
            // CNAME or other records which may come along
            continue;
        }
        const unsigned char *ptr = ns_rr_rdata(rr);
        SRVRecord record;
        record.m_priority = ns_get16(ptr);
        record.m_weight = ns_get16(ptr + NS_INT16SZ);
        record.m_port = ns_get16(ptr + 2 * NS_INT16SZ);
        char target[NS_MAXDNAME];
        if (ns_name_uncompress(ns_msg_base(handle), ns_msg_end(handle),
                               ptr + 3 * NS_INT16SZ,
                               target, sizeof(target)) < 0) {
            DD_THROW_EXCEPTION(DNSException, StringPrintf("%s: malformed SRV target", name.c_str()));
        }
        record.m_target = target;
        if (!record.m_target.empty() &&
            record.m_target[record.m_target.size() - 1] == '.') {
            record.m_target.resize(record.m_target.size() - 1);
        }
        res.push_back(record);
    }
    return res;
}

std::vector<TXTRecord> ResolvDNSResolver::parseTXT(const std::string &name, const std::string &answer)
{
    std::vector<TXTRecord> res;
    if (answer.empty()) {
        return res;
    }

    ns_msg handle;
    if (ns_initparse((const unsigned char *)answer.c_str(), answer.size(), &handle)) {
        DD_THROW_EXCEPTION(DNSException, StringPrintf("%s: malformed TXT answer", name.c_str()));
    }
    if (ns_msg_getflag(handle, ns_f_rcode) != ns_r_noerror) {
        return res;
    }

    for (int i = 0; i < ns_msg_count(handle, ns_s_an); i++) {
        ns_rr rr;
        if (ns_parserr(&handle, ns_s_an, i, &rr)) {
            DD_THROW_EXCEPTION(DNSException, StringPrintf("%s: malformed TXT record", name.c_str()));
        }
        if (ns_rr_type(rr) != ns_t_txt) {
            continue;
        }
        // sequence of <length><characters>
        const unsigned char *ptr = ns_rr_rdata(rr);
        const unsigned char *end = ptr + ns_rr_rdlen(rr);
        TXTRecord record;
        while (ptr < end) {
            size_t len = *ptr++;
            if (ptr + len > end) {
                DD_THROW_EXCEPTION(DNSException, StringPrintf("%s: truncated TXT record", name.c_str()));
            }
            record.push_back(std::string((const char *)ptr, len));
            ptr += len;
        }
        res.push_back(record);
    }
    return res;
}

#ifdef ENABLE_UNIT_TESTS

/**
 * Builds DNS answers in wire format: one question, answers
 * which refer to the question name via a compression pointer.
 */
class DNSAnswerBuilder
{
    std::string m_question;
    int m_type;
    int m_rcode;
    std::list<std::string> m_rdata;

    static void put16(std::string &buffer, int value)
    {
        buffer += (char)((value >> 8) & 0xFF);
        buffer += (char)(value & 0xFF);
    }

 public:
    DNSAnswerBuilder(const std::string &name, int type, int rcode = ns_r_noerror) :
        m_question(encodeName(name)),
        m_type(type),
        m_rcode(rcode)
    {}

    static std::string encodeName(const std::string &name)
    {
        std::string res;
        size_t start = 0;
        while (start < name.size()) {
            size_t dot = name.find('.', start);
            if (dot == name.npos) {
                dot = name.size();
            }
            if (dot == start) {
                // "." is the root, no label
                start++;
                continue;
            }
            res += (char)(dot - start);
            res += name.substr(start, dot - start);
            start = dot + 1;
        }
        res += '\0';
        return res;
    }

    void addSRV(int priority, int weight, int port, const std::string &target)
    {
        std::string rdata;
        put16(rdata, priority);
        put16(rdata, weight);
        put16(rdata, port);
        rdata += encodeName(target);
        m_rdata.push_back(rdata);
    }

    void addTXT(const std::list<std::string> &strings)
    {
        std::string rdata;
        for (const std::string &str: strings) {
            rdata += (char)str.size();
            rdata += str;
        }
        m_rdata.push_back(rdata);
    }

    /** raw record data, for malformed records */
    void addRaw(const std::string &rdata) { m_rdata.push_back(rdata); }

    std::string get() const
    {
        std::string msg;
        put16(msg, 0x1234);
        // response, recursion desired and available
        put16(msg, 0x8180 | m_rcode);
        put16(msg, 1);
        put16(msg, (int)m_rdata.size());
        put16(msg, 0);
        put16(msg, 0);
        msg += m_question;
        put16(msg, m_type);
        put16(msg, ns_c_in);
        for (const std::string &rdata: m_rdata) {
            // pointer to the question name at offset 12
            msg += (char)0xC0;
            msg += (char)0x0C;
            put16(msg, m_type);
            put16(msg, ns_c_in);
            put16(msg, 0);
            put16(msg, 3600);
            put16(msg, (int)rdata.size());
            msg += rdata;
        }
        return msg;
    }
};

class DNSResolverTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(DNSResolverTest);
    CPPUNIT_TEST(testSRV);
    CPPUNIT_TEST(testTXT);
    CPPUNIT_TEST(testNoRecords);
    CPPUNIT_TEST(testMalformed);
    CPPUNIT_TEST_SUITE_END();

    static const std::string NAME;

    void testSRV()
    {
        DNSAnswerBuilder answer(NAME, ns_t_srv);
        answer.addSRV(10, 20, 8443, "dav.example.com");
        answer.addSRV(0, 0, 0, ".");
        std::vector<SRVRecord> records = ResolvDNSResolver::parseSRV(NAME, answer.get());
        CPPUNIT_ASSERT_EQUAL((size_t)2, records.size());
        CPPUNIT_ASSERT_EQUAL(10, records[0].m_priority);
        CPPUNIT_ASSERT_EQUAL(20, records[0].m_weight);
        CPPUNIT_ASSERT_EQUAL(8443, records[0].m_port);
        CPPUNIT_ASSERT_EQUAL(std::string("dav.example.com"), records[0].m_target);
        // "service not available"
        CPPUNIT_ASSERT_EQUAL(std::string(""), records[1].m_target);
    }

    void testTXT()
    {
        DNSAnswerBuilder answer(NAME, ns_t_txt);
        answer.addTXT({ "v=1", "path=/a/" });
        answer.addTXT({ "path=/b/" });
        answer.addTXT({ "" });
        std::vector<TXTRecord> records = ResolvDNSResolver::parseTXT(NAME, answer.get());
        CPPUNIT_ASSERT_EQUAL((size_t)3, records.size());
        CPPUNIT_ASSERT_EQUAL((size_t)2, records[0].size());
        CPPUNIT_ASSERT_EQUAL(std::string("v=1"), records[0][0]);
        CPPUNIT_ASSERT_EQUAL(std::string("path=/a/"), records[0][1]);
        CPPUNIT_ASSERT_EQUAL((size_t)1, records[1].size());
        CPPUNIT_ASSERT_EQUAL(std::string("path=/b/"), records[1][0]);
        CPPUNIT_ASSERT_EQUAL((size_t)1, records[2].size());
        CPPUNIT_ASSERT_EQUAL(std::string(""), records[2][0]);
    }

    void testNoRecords()
    {
        CPPUNIT_ASSERT(ResolvDNSResolver::parseSRV(NAME, "").empty());
        CPPUNIT_ASSERT(ResolvDNSResolver::parseTXT(NAME, "").empty());
        CPPUNIT_ASSERT(ResolvDNSResolver::parseSRV(NAME, DNSAnswerBuilder(NAME, ns_t_srv).get()).empty());

        DNSAnswerBuilder nxdomain(NAME, ns_t_srv, ns_r_nxdomain);
        CPPUNIT_ASSERT(ResolvDNSResolver::parseSRV(NAME, nxdomain.get()).empty());

        // SRV answer section may contain other types, they are skipped
        DNSAnswerBuilder other(NAME, ns_t_txt);
        other.addTXT({ "path=/" });
        CPPUNIT_ASSERT(ResolvDNSResolver::parseSRV(NAME, other.get()).empty());
    }

    void testMalformed()
    {
        CPPUNIT_ASSERT_THROW(ResolvDNSResolver::parseSRV(NAME, std::string("\x12\x34\x81", 3)), DNSException);

        // character string longer than the record
        DNSAnswerBuilder truncated(NAME, ns_t_txt);
        truncated.addRaw(std::string("\x05" "ab", 3));
        CPPUNIT_ASSERT_THROW(ResolvDNSResolver::parseTXT(NAME, truncated.get()), DNSException);

        // answer cut off in the middle of a record
        DNSAnswerBuilder cut(NAME, ns_t_srv);
        cut.addSRV(0, 0, 443, "dav.example.com");
        std::string msg = cut.get();
        CPPUNIT_ASSERT_THROW(ResolvDNSResolver::parseSRV(NAME, msg.substr(0, msg.size() - 5)), DNSException);
    }
};

const std::string DNSResolverTest::NAME("_caldavs._tcp.example.com");

DAVDISCOVER_TEST_SUITE_REGISTRATION(DNSResolverTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
