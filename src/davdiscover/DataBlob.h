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

#ifndef INCL_DAVDISCOVER_DATABLOB
#define INCL_DAVDISCOVER_DATABLOB

#include <iostream>
#include <memory>
#include <string>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * Abstract base class for a chunk of data.
 * Can be opened for reading and writing.
 * Meant to be used for plain files and
 * for in-memory data.
 */
class DataBlob
{
 public:
    virtual ~DataBlob() {}

    /**
     * Create stream for writing data.
     * Always overwrites old data.
     */
    virtual std::shared_ptr<std::ostream> write() = 0;

    /**
     * Create stream for reading data. Empty if
     * the data does not exist yet.
     */
    virtual std::shared_ptr<std::istream> read() = 0;

    /** some kind of user visible name for the data */
    virtual std::string getName() const = 0;

    /** true if the data exists already */
    virtual bool exists() const = 0;

    virtual bool isReadonly() const = 0;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_DATABLOB
