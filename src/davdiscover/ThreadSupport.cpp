/*
 * Copyright (C) 2013 Intel Corporation
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
#include <davdiscover/ThreadSupport.h>
#include <davdiscover/util.h>

#ifdef ENABLE_UNIT_TESTS
# include "test.h"
# include <stdexcept>
#endif

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

GThreadCXX::GThreadCXX(const std::string &name, const std::function<void ()> &action) :
    m_action(action),
    m_thread(NULL)
{
    // g_thread_new() aborts the process if the thread cannot be created
    m_thread = g_thread_new(name.c_str(), run, this);
}

GThreadCXX::~GThreadCXX()
{
    if (m_thread) {
        g_thread_join(m_thread);
    }
}

void GThreadCXX::join()
{
    if (m_thread) {
        g_thread_join(m_thread);
        m_thread = NULL;
    }
    if (m_exception) {
        std::exception_ptr exception = m_exception;
        m_exception = nullptr;
        std::rethrow_exception(exception);
    }
}

gpointer GThreadCXX::run(gpointer data) throw ()
{
    GThreadCXX *me = static_cast<GThreadCXX *>(data);
    // Catch exceptions, then rethrow them in the joining thread.
    try {
        me->m_action();
    } catch (...) {
        me->m_exception = std::current_exception();
    }
    return NULL;
}

#ifdef ENABLE_UNIT_TESTS

class ThreadTest : public CppUnit::TestFixture {
    CPPUNIT_TEST_SUITE(ThreadTest);
    CPPUNIT_TEST(result);
    CPPUNIT_TEST(exception);
    CPPUNIT_TEST_SUITE_END();

    void result() {
        int value = 0;
        GThreadCXX thread("test", [&value] () { value = 42; });
        thread.join();
        CPPUNIT_ASSERT_EQUAL(42, value);
    }

    void exception() {
        GThreadCXX thread("test", [] () { throw std::runtime_error("thread failure"); });
        CPPUNIT_ASSERT_THROW(thread.join(), std::runtime_error);
        // exception is reported only once
        thread.join();
    }
};

DAVDISCOVER_TEST_SUITE_REGISTRATION(ThreadTest);

#endif // ENABLE_UNIT_TESTS

DD_END_CXX
