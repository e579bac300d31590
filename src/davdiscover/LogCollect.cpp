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
#include <davdiscover/LogCollect.h>
#include <davdiscover/util.h>

#include <boost/bind.hpp>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

LogCollect::LogCollect(const Handle &parent) :
    m_parent(Logger::instance(parent))
{
    setLevel(DEBUG);
}

void LogCollect::append(std::string &chunk, size_t expectedTotal)
{
    if (expectedTotal > m_log.capacity() - m_log.size()) {
        m_log.reserve(m_log.size() + expectedTotal);
    }
    m_log.append(chunk);
}

void LogCollect::messagev(const MessageOptions &options,
                          const char *format,
                          va_list args)
{
    {
        va_list argscopy;
        va_copy(argscopy, args);
        m_parent.messagev(options, format, argscopy);
        va_end(argscopy);
    }

    if (options.m_level <= getLevel()) {
        DynMutex::Guard guard = m_mutex.lock();
        formatLines(options.m_level, INFO,
                    options.m_prefix,
                    format, args,
                    boost::bind(&LogCollect::append, this, _1, _2));
    }
}

std::string LogCollect::getLog()
{
    DynMutex::Guard guard = m_mutex.lock();
    return m_log;
}

#ifdef ENABLE_UNIT_TESTS

class LogCollectTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(LogCollectTest);
    CPPUNIT_TEST(testCollect);
    CPPUNIT_TEST(testLevel);
    CPPUNIT_TEST_SUITE_END();

    /** swallows everything, stands in for stdout */
    class Sink : public Logger
    {
    public:
        int m_count;
        Sink() : m_count(0) {}
        virtual void messagev(const MessageOptions &options,
                              const char *format,
                              va_list args) { m_count++; }
    };

    void testCollect()
    {
        boost::shared_ptr<Sink> sink(new Sink);
        boost::shared_ptr<LogCollect> collect(new LogCollect(sink));
        Logger::Handle handle(collect);
        DD_LOG_TO(handle, "caldav", Logger::INFO, "first %d\nsecond", 1);
        DD_LOG_TO(handle, NULL, Logger::SHOW, "plain");
        CPPUNIT_ASSERT_EQUAL(std::string("[INFO] caldav: first 1\n"
                                         "[INFO] caldav: second\n"
                                         "plain\n"),
                             collect->getLog());
        CPPUNIT_ASSERT_EQUAL(2, sink->m_count);
    }

    void testLevel()
    {
        boost::shared_ptr<Sink> sink(new Sink);
        boost::shared_ptr<LogCollect> collect(new LogCollect(sink));
        collect->setLevel(Logger::WARNING);
        DD_LOG_TO(collect, NULL, Logger::DEBUG, "hidden");
        DD_LOG_TO(collect, NULL, Logger::ERROR, "visible");
        CPPUNIT_ASSERT_EQUAL(std::string("[ERROR] visible\n"), collect->getLog());
        CPPUNIT_ASSERT_EQUAL(2, sink->m_count);
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(LogCollectTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
