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

#ifndef INCL_DAVDISCOVER_INI_CONFIG_NODE
#define INCL_DAVDISCOVER_INI_CONFIG_NODE

#include <davdiscover/ConfigNode.h>
#include <davdiscover/DataBlob.h>

#include <map>
#include <memory>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * A base class for .ini style data blobs.
 */
class IniBaseConfigNode : public ConfigNode {
 protected:
    std::shared_ptr<DataBlob> m_data;
    bool m_modified;

    /**
     * Open or create a new blob. The blob will be read (if it
     * exists) but not created or written to unless flush() is
     * called explicitly.
     */
    IniBaseConfigNode(const std::shared_ptr<DataBlob> &data);

    /**
     * a virtual function to write the current properties to a stream
     */
    virtual void toFile(std::ostream &file) = 0;

    /**
     * initialize from the blob content
     */
    virtual void read() = 0;

 public:
    virtual void flush();
    virtual std::string getName() const { return m_data->getName(); }
    virtual bool exists() const { return m_data->exists(); }
    virtual bool isReadOnly() const { return m_data->isReadonly(); }
};

/**
 * The key/value pairs of a .ini file, kept in a map. Comments
 * and the order of lines are lost when writing; keys are
 * written sorted.
 */
class IniHashConfigNode : public IniBaseConfigNode {
    typedef std::map<std::string, std::string, Nocase<std::string> > Props_t;
    Props_t m_props;

    virtual void toFile(std::ostream &file);
    virtual void read();

 public:
    IniHashConfigNode(const std::shared_ptr<DataBlob> &data);
    IniHashConfigNode(const std::string &path, const std::string &fileName, bool readonly);

    virtual InitStateString readProperty(const std::string &property) const;
    virtual void writeProperty(const std::string &property,
                               const InitStateString &value,
                               const std::string &comment = std::string());
    virtual void readProperties(StringMap &props) const;
    virtual void removeProperty(const std::string &property);
    virtual void clear();
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_INI_CONFIG_NODE
