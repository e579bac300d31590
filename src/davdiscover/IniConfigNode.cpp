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
#include <davdiscover/IniConfigNode.h>
#include <davdiscover/FileDataBlob.h>
#include <davdiscover/Exception.h>
#include <davdiscover/util.h>

#include <sstream>
#include <ctype.h>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

IniBaseConfigNode::IniBaseConfigNode(const std::shared_ptr<DataBlob> &data) :
    m_data(data),
    m_modified(false)
{
}

void IniBaseConfigNode::flush()
{
    if (!m_modified) {
        return;
    }

    if (m_data->isReadonly()) {
        Exception::throwError(DD_HERE, m_data->getName() + ": internal error: flushing read-only config node not allowed");
    }

    // Sometimes changes are made that once complete, lead to the
    // exact same file content. Catch that with a brute-force memory
    // compare and avoid rewriting the file unless something changed.
    std::stringstream temp;
    toFile(temp);
    std::string newcontent = temp.str();
    std::shared_ptr<std::istream> oldfile = m_data->read();
    std::string oldcontent;
    if (!m_data->exists() ||
        !ReadFile(*oldfile, oldcontent) ||
        oldcontent != newcontent) {
        std::shared_ptr<std::ostream> newfile = m_data->write();
        *newfile << newcontent;
        newfile->flush();
        if (newfile->fail()) {
            Exception::throwError(DD_HERE, m_data->getName() + ": writing failed");
        }
    }

    m_modified = false;
}

/**
 * get property and value from line, if any present
 */
static bool getContent(const std::string &line,
                       std::string &property,
                       std::string &value)
{
    size_t start = 0;
    while (start < line.size() &&
           isspace(line[start])) {
        start++;
    }

    // empty line or comment?
    if (start == line.size() ||
        line[start] == '#') {
        return false;
    }

    // extract property
    size_t end = start;
    while (end < line.size() &&
           !isspace(line[end]) &&
           line[end] != '=') {
        end++;
    }
    property = line.substr(start, end - start);

    // skip assignment
    start = end;
    while (start < line.size() &&
           isspace(line[start])) {
        start++;
    }
    if (start == line.size() ||
        line[start] != '=') {
        // invalid syntax
        return false;
    }

    // extract value
    start++;
    while (start < line.size() &&
           isspace(line[start])) {
        start++;
    }

    value = line.substr(start);
    // remove trailing white space: usually it is
    // added accidentally by users
    size_t numspaces = 0;
    while (numspaces < value.size() &&
           isspace(value[value.size() - 1 - numspaces])) {
        numspaces++;
    }
    value.erase(value.size() - numspaces);

    return true;
}

IniHashConfigNode::IniHashConfigNode(const std::shared_ptr<DataBlob> &data) :
    IniBaseConfigNode(data)
{
    read();
}

IniHashConfigNode::IniHashConfigNode(const std::string &path, const std::string &fileName, bool readonly) :
    IniBaseConfigNode(std::make_shared<FileDataBlob>(path, fileName, readonly))
{
    read();
}

void IniHashConfigNode::read()
{
    std::shared_ptr<std::istream> file(m_data->read());
    std::string line;
    while (std::getline(*file, line)) {
        std::string property, value;
        if (getContent(line, property, value)) {
            // only the first instance of the property counts
            m_props.insert(StringPair(property, value));
        }
    }
    m_modified = false;
}

void IniHashConfigNode::toFile(std::ostream &file)
{
    for (const Props_t::value_type &prop: m_props) {
        file << prop.first << " = " <<  prop.second << std::endl;
    }
}

void IniHashConfigNode::readProperties(StringMap &props) const
{
    for (const Props_t::value_type &prop: m_props) {
        props.insert(StringPair(prop.first, prop.second));
    }
}

InitStateString IniHashConfigNode::readProperty(const std::string &property) const
{
    Props_t::const_iterator it = m_props.find(property);
    if (it != m_props.end()) {
        return InitStateString(it->second, true);
    } else {
        return InitStateString();
    }
}

void IniHashConfigNode::removeProperty(const std::string &property)
{
    Props_t::iterator it = m_props.find(property);
    if (it != m_props.end()) {
        m_props.erase(it);
        m_modified = true;
    }
}

void IniHashConfigNode::clear()
{
    if (!m_props.empty()) {
        m_props.clear();
        m_modified = true;
    }
}

void IniHashConfigNode::writeProperty(const std::string &property,
                                      const InitStateString &newvalue,
                                      const std::string &comment)
{
    // we only store explicitly set properties
    if (!newvalue.wasSet()) {
        removeProperty(property);
        return;
    }
    Props_t::iterator it = m_props.find(property);
    if (it != m_props.end()) {
        if (it->second != newvalue.get()) {
            it->second = newvalue.get();
            m_modified = true;
        }
    } else {
        m_props.insert(StringPair(property, newvalue.get()));
        m_modified = true;
    }
}

DD_END_CXX
