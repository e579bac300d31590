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

#ifndef INCL_DAVDISCOVER_UTIL
# define INCL_DAVDISCOVER_UTIL

#include <davdiscover/DAVStatus.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/utility/value_init.hpp>
#include <boost/type_traits/is_class.hpp>

#include <stdarg.h>
#include <stdlib.h>

#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <list>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/** case-insensitive less than for assoziative containers */
template <class T> class Nocase {
public:
    bool operator()(const T &x, const T &y) const { return boost::ilexicographical_compare(x, y); }
};

/** shorthand for string maps and their entries */
typedef std::pair<std::string, std::string> StringPair;
typedef std::map<std::string, std::string> StringMap;

/**
 * remove multiple slashes in a row and dots directly after a slash
 * (only file names, not URLs)
 */
std::string normalizePath(const std::string &path);

/**
 * split path into directory and file part, with the directory
 * part being empty if the path has no slash
 */
void splitPath(const std::string &path, std::string &dir, std::string &file);

/** ensure that the directory exists and is writable, otherwise throw error */
void mkdir_p(const std::string &path);

/**
 * read a file or stream completely into memory
 *
 * @return true if reading ended at the end of the data,
 *         false for an error
 */
bool ReadFile(const std::string &filename, std::string &content);
bool ReadFile(std::istream &in, std::string &content);

/**
 * Escapes characters so that the result is safe to store as one
 * word or one value in a .ini file. Escaped characters are
 * replaced by the escape character followed by two hex digits.
 */
class StringEscape
{
 public:
    enum Mode {
        INI_VALUE,         /**< right hand side of .ini assignment:
                              escape all spaces at start and end (but not in the middle),
                              the equal sign and line breaks */
        INI_WORD,          /**< same as before, but keep it one word:
                              escape all spaces and the equal sign = */
        STRICT             /**< general purpose:
                              escape all characters besides alphanumeric and -_ */
    };

 private:
    char m_escapeChar;
    Mode m_mode;

 public:
    StringEscape(char escapeChar = '%', Mode mode = STRICT) :
        m_escapeChar(escapeChar),
        m_mode(mode)
    {}

    char getEscapeChar() const { return m_escapeChar; }
    Mode getMode() const { return m_mode; }

    /** escape string according to current settings */
    std::string escape(const std::string &str) const { return escape(str, m_escapeChar, m_mode); }

    /** escape string with the given settings */
    static std::string escape(const std::string &str, char escapeChar, Mode mode);

    /** unescape string, with escape character as currently set */
    std::string unescape(const std::string &str) const { return unescape(str, m_escapeChar); }

    /** unescape string, with escape character as given */
    static std::string unescape(const std::string &str, char escapeChar);
};

/**
 * Using this macro ensures that tests, even if defined in
 * object files which are not normally linked into the test
 * binary, are included in the test suite under the group
 * "davdiscover".
 *
 * Use it like this:
 * @verbatim
   #include "config.h"
   #ifdef ENABLE_UNIT_TESTS
   # include "test.h"
   class Foo : public CppUnit::TestFixture {
       CPPUNIT_TEST_SUITE(foo);
       CPPUNIT_TEST(testBar);
       CPPUNIT_TEST_SUITE_END();

     public:
       void testBar();
   };
   # DAVDISCOVER_TEST_SUITE_REGISTRATION(classname)
   #endif
   @endverbatim
 */
#define DAVDISCOVER_TEST_SUITE_REGISTRATION( ATestFixtureType ) \
    CPPUNIT_TEST_SUITE_NAMED_REGISTRATION( ATestFixtureType, "davdiscover" ); \
    extern "C" { int davdiscoverAutoRegisterRegistry ## ATestFixtureType = 12345; }

std::string StringPrintf(const char *format, ...)
#ifdef __GNUC__
        __attribute__((format(printf, 1, 2)))
#endif
;
std::string StringPrintfV(const char *format, va_list ap);

/**
 * strncpy() which inserts adds 0 byte
 */
char *Strncpy(char *dest, const char *src, size_t n);

/**
 * Acts like the underlying type. In addition ensures that plain types
 * are not left uninitialized and tracks whether a value was set
 * explicitly.
 */
template<class T, bool isClass> class InitStateBase {
    T m_value;

 protected:
    InitStateBase() : m_value(boost::value_initialized<T>()) {}
    InitStateBase(const InitStateBase &other) : m_value(other.m_value) {}
    template<class V> InitStateBase(const V &val) : m_value(val) {}

 public:
    operator const T & () const { return m_value; }
    operator T & () { return m_value; }
    const T & get() const { return m_value; }
    T & get() { return m_value; }
};

/** version of InitState for classes: can call methods directly */
template<class T> class InitStateBase<T, true> : public T {
 protected:
    InitStateBase() {}
    template<class V> InitStateBase(const V &val) : T(val) {}
    InitStateBase(const InitStateBase &other) : T(other) {}

 public:
    const T & get() const { return *this; }
    T & get() { return *this; }
};

template<class T> class InitState : public InitStateBase<T, boost::is_class<T>::value> {
    typedef InitStateBase<T, boost::is_class<T>::value> parent_type;
    bool m_wasSet;

 public:
    typedef T value_type;

    InitState() : m_wasSet(false) {}
    InitState(const InitState &other) : parent_type(other.get()), m_wasSet(other.m_wasSet) {}
    template<class V> InitState(const V &val, bool wasSet = false) : parent_type(val), m_wasSet(wasSet) {}
    InitState & operator = (const InitState &val) { this->get() = val; m_wasSet = val.m_wasSet; return *this; }
    template<class V> InitState & operator = (const V &val) { this->get() = val; m_wasSet = true; return *this; }

    /**
     * Only tracks modifications done through this class.
     * Modifications of the contained value after obtaining
     * direct access to it (for example, via get()) are not
     * noticed.
     */
    bool wasSet() const { return m_wasSet; }
};

typedef InitState<std::string> InitStateString;

/**
 * Retrieve value if found in map, otherwise the default. wasSet()
 * returns true only in the first case.
 */
template<class C> InitState<typename C::mapped_type>
GetWithDef(const C &map,
           const typename C::key_type &key,
           const typename C::mapped_type &def = boost::value_initialized<typename C::mapped_type>())
{
    typename C::const_iterator it = map.find(key);
    if (it != map.end()) {
        return InitState<typename C::mapped_type>(it->second, true);
    } else {
        return InitState<typename C::mapped_type>(def, false);
    }
}

/**
 * an item in a list which describes the individual bits
 * of a flag set
 */
struct Flag {
    int m_flag;
    const char *m_description;
};

/**
 * turn flags into comma separated list of descriptions
 *
 * @param flags     bits to be described
 * @param descr     list of bit and description pairs, terminated by { 0, NULL }
 * @param sep       separator between descriptions
 */
std::string Flags2String(int flags, const Flag *descr, const std::string &sep = ", ");

DD_END_CXX
#endif // INCL_DAVDISCOVER_UTIL
