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
#include <davdiscover/StringDataBlob.h>
#include <davdiscover/Exception.h>

#include <sstream>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

class StringDataBlob::write_stream : public std::ostringstream
{
    std::shared_ptr<std::string> m_data;

public:
    write_stream(const std::shared_ptr<std::string> &data) :
        m_data(data)
    {}

    ~write_stream()
    {
        *m_data = str();
    }
};

StringDataBlob::StringDataBlob(const std::string &name,
                               const std::shared_ptr<std::string> &data,
                               bool readonly) :
    m_name(name),
    m_data(data),
    m_readonly(readonly)
{
}

std::shared_ptr<std::ostream> StringDataBlob::write()
{
    if (m_readonly) {
        Exception::throwError(DD_HERE, m_name + ": internal error: writing read-only data not allowed");
    }
    if (!m_data) {
        m_data = std::make_shared<std::string>();
    }
    return std::make_shared<write_stream>(m_data);
}

std::shared_ptr<std::istream> StringDataBlob::read()
{
    return std::make_shared<std::istringstream>(m_data ? *m_data : std::string());
}

DD_END_CXX
