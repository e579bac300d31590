/*
 * Copyright (C) 2008-2009 Patrick Ohly <patrick.ohly@gmx.de>
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
#include <davdiscover/util.h>
#include <davdiscover/Exception.h>

#include <boost/scoped_array.hpp>
#include <boost/algorithm/string/join.hpp>
#include <fstream>

#include <errno.h>
#include <string.h>
#include <stdio.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#ifdef ENABLE_UNIT_TESTS
#include "test.h"
CPPUNIT_REGISTRY_ADD_TO_DEFAULT("davdiscover");
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

std::string normalizePath(const std::string &path)
{
    std::string res;

    res.reserve(path.size());
    size_t index = 0;
    while (index < path.size()) {
        char curr = path[index];
        res += curr;
        index++;
        if (curr == '/') {
            while (index < path.size() &&
                   (path[index] == '/' ||
                    (path[index] == '.' &&
                     index + 1 < path.size() &&
                     path[index + 1] == '/'))) {
                index++;
            }
        }
    }
    if (!res.empty() && res[res.size() - 1] == '/') {
        res.resize(res.size() - 1);
    }
    return res;
}

void splitPath(const std::string &path, std::string &dir, std::string &file)
{
    std::string normal = normalizePath(path);
    size_t offset = normal.rfind('/');
    if (offset != normal.npos) {
        dir = normal.substr(0, offset);
        file = normal.substr(offset + 1);
    } else {
        dir = "";
        file = normal;
    }
}

void mkdir_p(const std::string &path)
{
    boost::scoped_array<char> dirs(new char[path.size() + 1]);
    char *curr = dirs.get();
    strcpy(curr, path.c_str());
    do {
        char *nextdir = strchr(curr, '/');
        if (nextdir) {
            *nextdir = 0;
            nextdir++;
        }
        if (*curr) {
            if (access(dirs.get(),
                       nextdir ? (R_OK|X_OK) : (R_OK|X_OK|W_OK)) &&
                (errno != ENOENT ||
                 mkdir(dirs.get(), 0700))) {
                Exception::throwError(DD_HERE, std::string(dirs.get()), errno);
            }
        }
        if (nextdir) {
            nextdir[-1] = '/';
        }
        curr = nextdir;
    } while (curr);
}

bool ReadFile(const std::string &filename, std::string &content)
{
    std::ifstream in;
    in.open(filename.c_str());
    return ReadFile(in, content);
}

bool ReadFile(std::istream &in, std::string &content)
{
    std::ostringstream out;
    char buf[8192];
    do {
        in.read(buf, sizeof(buf));
        out.write(buf, in.gcount());
    } while(in);

    content = out.str();
    return in.eof();
}

std::string StringEscape::escape(const std::string &str, char escapeChar, Mode mode)
{
    std::string res;
    char buffer[4];
    bool isLeadingSpace = true;
    res.reserve(str.size() * 3);

    for (char c: str) {
        if(c != escapeChar &&
           (mode == STRICT ?
            (isalnum(c) ||
             c == '-' ||
             c == '_') :
            !(((isLeadingSpace || mode == INI_WORD) && isspace(c)) ||
              c == '=' ||
              c == '\r' ||
              c == '\n'))) {
            res += c;
            if (!isspace(c)) {
                isLeadingSpace = false;
            }
        } else {
            sprintf(buffer, "%c%02x",
                    escapeChar,
                    (unsigned int)(unsigned char)c);
            res += buffer;
        }
    }

    // also encode trailing space?
    if (mode == INI_VALUE) {
        size_t numspaces = 0;
        ssize_t off = res.size() - 1;
        while (off >= 0 && isspace(res[off])) {
            off--;
            numspaces++;
        }
        res.resize(res.size() - numspaces);
        for (char c: str.substr(str.size() - numspaces)) {
            sprintf(buffer, "%c%02x",
                    escapeChar,
                    (unsigned int)(unsigned char)c);
            res += buffer;
        }
    }

    return res;
}

std::string StringEscape::unescape(const std::string &str, char escapeChar)
{
    std::string res;
    size_t curr;

    res.reserve(str.size());

    curr = 0;
    while (curr < str.size()) {
        if (str[curr] == escapeChar) {
            std::string hex = str.substr(curr + 1, 2);
            res += (char)strtol(hex.c_str(), NULL, 16);
            curr += 3;
        } else {
            res += str[curr];
            curr++;
        }
    }

    return res;
}

std::string StringPrintf(const char *format, ...)
{
    va_list ap;
    va_start(ap, format);
    std::string res = StringPrintfV(format, ap);
    va_end(ap);
    return res;
}

std::string StringPrintfV(const char *format, va_list ap)
{
    va_list aq;

    char *buffer = NULL, *nbuffer = NULL;
    ssize_t size = 0;
    ssize_t realsize = 255;
    do {
        // vsnprintf() destroys ap, so make a copy first
        va_copy(aq, ap);

        if (size < realsize) {
            nbuffer = (char *)realloc(buffer, realsize + 1);
            if (!nbuffer) {
                if (buffer) {
                    free(buffer);
                }
                return "";
            }
            size = realsize;
            buffer = nbuffer;
        }

        realsize = vsnprintf(buffer, size + 1, format, aq);
        if (realsize == -1) {
            // old-style vnsprintf: exact len unknown, try again with doubled size
            realsize = size * 2;
        }
        va_end(aq);
    } while(realsize > size);

    std::string res = buffer;
    free(buffer);
    return res;
}

char *Strncpy(char *dest, const char *src, size_t n)
{
    strncpy(dest, src, n);
    if (n) {
        dest[n - 1] = 0;
    }
    return dest;
}

std::string Flags2String(int flags, const Flag *descr, const std::string &sep)
{
    std::list<std::string> tmp;

    while (descr->m_flag) {
        if (flags & descr->m_flag) {
            tmp.push_back(descr->m_description);
        }
        ++descr;
    }
    return boost::join(tmp, sep);
}

std::string Status2String(DAVStatus status)
{
    std::string error;

    switch (status) {
    case STATUS_OK:
    case STATUS_HTTP_OK:
        error = "no error";
        break;
    case STATUS_MULTISTATUS:
        error = "multi-status";
        break;
    case STATUS_UNAUTHORIZED:
        error = "authorization failed";
        break;
    case STATUS_FORBIDDEN:
        error = "access denied";
        break;
    case STATUS_NOT_FOUND:
        error = "object not found";
        break;
    case STATUS_METHOD_NOT_ALLOWED:
        error = "method not allowed";
        break;
    case STATUS_GONE:
        error = "object gone";
        break;
    case STATUS_FATAL:
        error = "fatal error";
        break;
    case STATUS_TRANSPORT_FAILURE:
        error = "transport failure (no connection?)";
        break;
    case STATUS_PROTOCOL_FAILURE:
        error = "unexpected server response";
        break;
    case STATUS_DNS_FAILURE:
        error = "DNS lookup failed";
        break;
    default:
        error = status >= 100 && status <= 599 ?
            "HTTP error" :
            "unknown error";
        break;
    }

    return StringPrintf("%s (%s, status %d)",
                        error.c_str(),
                        (status >= 100 && status <= 599) ? "remote" : "local",
                        (int)status);
}

#ifdef ENABLE_UNIT_TESTS

class StringEscapeTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(StringEscapeTest);
    CPPUNIT_TEST(escape);
    CPPUNIT_TEST(unescape);
    CPPUNIT_TEST_SUITE_END();

    void escape() {
        const std::string test = " _-%\rfoo bar?! \n ";

        StringEscape def;
        CPPUNIT_ASSERT_EQUAL(std::string("%20_-%25%0dfoo%20bar%3f%21%20%0a%20"), def.escape(test));

        StringEscape word('%', StringEscape::INI_WORD);
        CPPUNIT_ASSERT_EQUAL(std::string("%20_-%25%0dfoo%20bar?!%20%0a%20"), word.escape(test));

        StringEscape ini('%', StringEscape::INI_VALUE);
        CPPUNIT_ASSERT_EQUAL(std::string("%20_-%25%0dfoo bar?! %0a%20"), ini.escape(test));

        // a multi-line diagnostic log must end up on one .ini line
        std::string log = "[INFO] line 1\n[INFO] x = y\n";
        std::string escaped = StringEscape::escape(log, '%', StringEscape::INI_VALUE);
        CPPUNIT_ASSERT_EQUAL(std::string::npos, escaped.find('\n'));
        CPPUNIT_ASSERT_EQUAL(std::string::npos, escaped.find('='));
        CPPUNIT_ASSERT_EQUAL(log, StringEscape::unescape(escaped, '%'));
    }

    void unescape() {
        const std::string escaped = "%20_-%25foo%20bar%3F%21%20%0A";
        const std::string plain = " _-%foo bar?! \n";

        StringEscape def;
        CPPUNIT_ASSERT_EQUAL(plain, def.unescape(escaped));
        CPPUNIT_ASSERT_EQUAL(std::string("%41B"), StringEscape::unescape("%41!42", '!'));
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(StringEscapeTest);

class StatusTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(StatusTest);
    CPPUNIT_TEST(describe);
    CPPUNIT_TEST_SUITE_END();

    void describe() {
        CPPUNIT_ASSERT_EQUAL(std::string("object not found (remote, status 404)"),
                             Status2String(STATUS_NOT_FOUND));
        CPPUNIT_ASSERT_EQUAL(std::string("DNS lookup failed (local, status 20045)"),
                             Status2String(STATUS_DNS_FAILURE));
        CPPUNIT_ASSERT_EQUAL(std::string("HTTP error (remote, status 502)"),
                             Status2String(DAVStatus(502)));
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(StatusTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
