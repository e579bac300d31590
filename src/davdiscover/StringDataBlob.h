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

#ifndef INCL_DAVDISCOVER_STRINGDATABLOB
#define INCL_DAVDISCOVER_STRINGDATABLOB

#include <davdiscover/DataBlob.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Stores data in a string which is shared with the creator of
 * the blob. The string is updated when the stream returned by
 * write() is destroyed.
 */
class StringDataBlob : public DataBlob
{
    std::string m_name;
    std::shared_ptr<std::string> m_data;
    bool m_readonly;

    class write_stream;

 public:
    /**
     * @param name      user visible name
     * @param data      content, may be empty pointer for "does not exist"
     */
    StringDataBlob(const std::string &name,
                   const std::shared_ptr<std::string> &data,
                   bool readonly);

    std::shared_ptr<std::ostream> write();
    std::shared_ptr<std::istream> read();

    std::shared_ptr<std::string> getData() { return m_data; }

    virtual std::string getName() const { return m_name; }
    virtual bool exists() const { return static_cast<bool>(m_data); }
    virtual bool isReadonly() const { return m_readonly; }
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_STRINGDATABLOB
