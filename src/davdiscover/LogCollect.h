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

#ifndef INCL_DAVDISCOVER_LOGCOLLECT
#define INCL_DAVDISCOVER_LOGCOLLECT

#include <davdiscover/Logging.h>
#include <davdiscover/ThreadSupport.h>
#include <string>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Keeps a copy of all formatted messages at or below its own
 * level in memory and passes every message on to the parent
 * logger. One instance is used per discovery pipeline, so the
 * collected text only contains that pipeline's messages even
 * when several of them run at the same time.
 *
 * Not meant to be pushed onto the global logger stack: it
 * forwards to the logger which was at the top when it was
 * created.
 */
class LogCollect : public Logger
{
    Handle m_parent;
    DynMutex m_mutex;
    std::string m_log;

    void append(std::string &chunk, size_t expectedTotal);

 public:
    /**
     * @param parent   receives all messages, empty for the
     *                 current top of the logger stack
     */
    LogCollect(const Handle &parent = Handle());

    virtual void messagev(const MessageOptions &options,
                          const char *format,
                          va_list args);

    /** all lines collected so far */
    std::string getLog();
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_LOGCOLLECT
