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

#ifndef INCL_DAVDISCOVER_CONFIG_NODE
#define INCL_DAVDISCOVER_CONFIG_NODE

#include <davdiscover/util.h>

#include <string>
#include <sstream>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

/**
 * This class corresponds to a single .ini file: a flat list of
 * key/value pairs. Keys are compared case-insensitively.
 *
 * Values are strings. The typed getProperty()/setProperty()
 * variants convert with iostreams, except for booleans which
 * accept the usual keywords.
 */
class ConfigNode {
 public:
    virtual ~ConfigNode() {}

    /** a name for the node that the user can understand */
    virtual std::string getName() const = 0;

    /**
     * save values to disk
     */
    virtual void flush() = 0;

    /**
     * Returns the value of the given property, unset if not found.
     */
    virtual InitStateString readProperty(const std::string &property) const = 0;

    /**
     * Sets a property value. A value which was not set explicitly
     * removes the property.
     *
     * @param property    the name of the property which is to be set
     * @param value       the new value
     * @param comment     ignored by nodes which cannot store comments
     */
    virtual void writeProperty(const std::string &property,
                               const InitStateString &value,
                               const std::string &comment = std::string()) = 0;

    /**
     * Extract all list of all currently defined properties
     * and their values. Does not include values which were
     * initialized with their defaults.
     */
    virtual void readProperties(StringMap &props) const = 0;

    /**
     * Remove a certain property.
     */
    virtual void removeProperty(const std::string &property) = 0;

    /**
     * Remove all properties.
     */
    virtual void clear() = 0;

    /**
     * Node exists in backend storage.
     */
    virtual bool exists() const = 0;

    /**
     * Node is read-only. Callers can read properties but
     * not write them.
     */
    virtual bool isReadOnly() const = 0;

    /** set a string value */
    void setProperty(const std::string &property,
                     const std::string &value,
                     const std::string &comment = std::string()) {
        writeProperty(property, InitStateString(value, true), comment);
    }
    void setProperty(const std::string &property,
                     const char *value,
                     const std::string &comment = std::string()) {
        setProperty(property, std::string(value), comment);
    }
    void setProperty(const std::string &property,
                     bool value,
                     const std::string &comment = std::string()) {
        setProperty(property, std::string(value ? "true" : "false"), comment);
    }

    /** set any value which can be printed with operator << */
    template <class T> void setProperty(const std::string &property,
                                        const T &value,
                                        const std::string &comment = std::string()) {
        std::stringstream strval;
        strval << value;
        setProperty(property, strval.str(), comment);
    }

    /**
     * Retrieves a value and converts it. Leaves the value
     * unmodified and returns false if not set or the
     * conversion failed.
     */
    template <class T> bool getProperty(const std::string &property,
                                        T &value) const {
        InitStateString str = readProperty(property);
        if (!str.wasSet()) {
            return false;
        }
        std::stringstream strval(str.get());
        T tmp;
        strval >> tmp;
        if (strval.fail()) {
            return false;
        }
        value = tmp;
        return true;
    }

    bool getProperty(const std::string &property, std::string &value) const;
    bool getProperty(const std::string &property, bool &value) const;
};

DD_END_CXX
#endif // INCL_DAVDISCOVER_CONFIG_NODE
