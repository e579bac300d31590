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

#ifndef INCL_DAVDISCOVER_FILEDATABLOB
#define INCL_DAVDISCOVER_FILEDATABLOB

#include <davdiscover/DataBlob.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Stores data in a file. The directory is created on demand
 * when writing.
 */
class FileDataBlob : public DataBlob
{
    std::string m_path;
    std::string m_fileName;
    std::string m_fullpath;
    bool m_readonly;

 public:
    /**
     * @param path      directory which contains the file
     * @param fileName  file name inside that directory
     * @param readonly  do not create or write file, it must exist;
     *                  write() will throw an exception
     */
    FileDataBlob(const std::string &path, const std::string &fileName, bool readonly);
    /** split the full path into directory and file name */
    FileDataBlob(const std::string &fullpath, bool readonly);

    std::shared_ptr<std::ostream> write();
    std::shared_ptr<std::istream> read();

    virtual std::string getName() const;
    virtual bool exists() const;
    virtual bool isReadonly() const { return m_readonly; }
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_FILEDATABLOB
