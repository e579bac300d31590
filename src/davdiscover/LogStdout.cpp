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

#include "config.h"
#include <davdiscover/LogStdout.h>
#include <davdiscover/Exception.h>

#include <errno.h>
#include <boost/bind.hpp>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

LoggerStdout::LoggerStdout(FILE *file) :
    m_file(file),
    m_closeFile(false)
{
}

LoggerStdout::LoggerStdout(const std::string &filename) :
    m_file(fopen(filename.c_str(), "w")),
    m_closeFile(true)
{
    if (!m_file) {
        Exception::throwError(DD_HERE, std::string("opening ") + filename, errno);
    }
}

LoggerStdout::~LoggerStdout()
{
    if (m_closeFile) {
        fclose(m_file);
    }
}

void LoggerStdout::write(std::string &chunk, size_t expectedTotal)
{
    fwrite(chunk.c_str(), 1, chunk.size(), m_file);
}

void LoggerStdout::messagev(const MessageOptions &options,
                            const char *format,
                            va_list args)
{
    RecMutex::Guard guard = lock();
    if (m_file &&
        options.m_level <= getLevel()) {
        formatLines(options.m_level, getLevel(),
                    options.m_prefix,
                    format, args,
                    boost::bind(&LoggerStdout::write, this, _1, _2));
        fflush(m_file);
    }
}

DD_END_CXX
