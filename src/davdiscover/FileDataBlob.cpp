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
#include <davdiscover/FileDataBlob.h>
#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <fstream>
#include <sstream>
#include <errno.h>
#include <unistd.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

FileDataBlob::FileDataBlob(const std::string &path, const std::string &fileName, bool readonly) :
    m_path(path),
    m_fileName(fileName),
    m_readonly(readonly)
{
    m_fullpath = m_path.empty() ? m_fileName : m_path + "/" + m_fileName;
}

FileDataBlob::FileDataBlob(const std::string &fullpath, bool readonly) :
    m_fullpath(fullpath),
    m_readonly(readonly)
{
    splitPath(m_fullpath, m_path, m_fileName);
}

std::shared_ptr<std::ostream> FileDataBlob::write()
{
    if (m_readonly) {
        Exception::throwError(DD_HERE, m_fullpath + ": internal error: writing read-only file not allowed");
    }
    if (!m_path.empty()) {
        mkdir_p(m_path);
    }

    std::shared_ptr<std::ofstream> file(new std::ofstream(m_fullpath.c_str()));
    if (!file->good()) {
        Exception::throwError(DD_HERE, m_fullpath + ": cannot open for writing", errno);
    }
    return file;
}

std::shared_ptr<std::istream> FileDataBlob::read()
{
    std::shared_ptr<std::ifstream> file(new std::ifstream(m_fullpath.c_str()));
    if (file->good()) {
        return file;
    }
    return std::make_shared<std::istringstream>(std::string());
}

std::string FileDataBlob::getName() const
{
    return m_fullpath;
}

bool FileDataBlob::exists() const
{
    return !access(m_fullpath.c_str(), F_OK);
}

DD_END_CXX
