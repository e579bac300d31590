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

#ifndef INCL_DAVDISCOVER_THREAD_SUPPORT
# define INCL_DAVDISCOVER_THREAD_SUPPORT

#include <glib.h>

#include <exception>
#include <functional>
#include <string>

#include <boost/shared_ptr.hpp>
#include <boost/noncopyable.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Core building block for mutices.
 */
template<class M, void (*_lock)(M *), void (*_unlock)(M *)> class MutexTemplate
{
 protected:
    M m_mutex;

 public:
    /**
     * Created when locking the mutex. When the last copy of it
     * gets destroyed, the mutex gets unlocked again.
     */
    class Guard : private boost::shared_ptr<M>
    {
        Guard(M *mutex) throw () :
           boost::shared_ptr<M>(mutex, _unlock)
        {}
        friend class MutexTemplate;

    public:
        Guard() throw()
        {}

        void unlock() throw()
        {
            boost::shared_ptr<M>::reset();
        }
    };

    /**
     * Lock the mutex and return a handle that'll automatically
     * unlock the mutex when the last copy gets destroyed.
     */
    Guard lock() throw ()
    {
        _lock(&m_mutex);
        return Guard(&m_mutex);
    }
};

/**
 * Initializes a mutex which was allocated dynamically
 * on the heap or stack and frees allocated resources
 * when done. It's an error to free a locked mutex.
 */
template<class M, void (*_lock)(M *), void (*_unlock)(M *), void (*_init)(M *), void (*_clear)(M *)> class DynMutexTemplate :
    public MutexTemplate<M, _lock, _unlock>
{
 public:
    DynMutexTemplate()
    {
        _init(&MutexTemplate<M, _lock, _unlock>::m_mutex);
    }
    ~DynMutexTemplate()
    {
        _clear(&MutexTemplate<M, _lock, _unlock>::m_mutex);
    }
};

/** for static instances, which glib allows to use without init */
typedef MutexTemplate<GRecMutex, g_rec_mutex_lock, g_rec_mutex_unlock> RecMutex;
/** for members of dynamically allocated objects */
typedef DynMutexTemplate<GMutex, g_mutex_lock, g_mutex_unlock, g_mutex_init, g_mutex_clear> DynMutex;

/**
 * Runs a function in a new glib thread. join() waits for it and
 * rethrows any exception that escaped from the function in the
 * joining thread. The destructor joins if that was not done yet,
 * but then drops the exception.
 */
class GThreadCXX : private boost::noncopyable
{
 public:
    GThreadCXX(const std::string &name, const std::function<void ()> &action);
    ~GThreadCXX();

    void join();

 private:
    std::function<void ()> m_action;
    std::exception_ptr m_exception;
    GThread *m_thread;

    static gpointer run(gpointer data) throw ();
};

DD_END_CXX

#endif // INCL_DAVDISCOVER_THREAD_SUPPORT
