/* Copyright (C) 2006-2018 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU Lesser General Public License as published by
 *   the Free Software Foundation; either version 2.1 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU Lesser General Public License for more details.
 *
 *   You should have received a copy of the GNU Lesser General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _CONFTREE_H_INCLUDED_
#define _CONFTREE_H_INCLUDED_

/**
 * A simple configuration file: lines of "name = value", '#' comments,
 * blank lines ignored. A line ending with a backslash is continued on
 * the next one. Lines like "[section]" start a named subkey: the
 * following names are stored under that subkey. Names before any
 * section belong to the empty subkey.
 *
 * The file is read once, at construction. This is read-only.
 */

#include <istream>
#include <map>
#include <string>
#include <vector>

class ConfSimple {
public:
    enum StatusCode {STATUS_ERROR = 0, STATUS_RO = 1};

    /**
     * Build the object by reading content from file.
     * @param fname file name. An empty name produces an empty config.
     * @param tildexp expand a leading '~' in fname.
     */
    ConfSimple(const std::string& fname, bool tildexp = false);

    /** Build the object from a stream, for data not in a file. */
    ConfSimple(std::istream& input);

    /** Successfully read? */
    bool ok() const {
        return m_status != STATUS_ERROR;
    }
    StatusCode getStatus() const {
        return m_status;
    }

    /**
     * Get string value for named parameter, from specified subsection.
     * @return true if the name was found. value is untouched otherwise.
     */
    bool get(const std::string& name, std::string& value,
             const std::string& sk = std::string()) const;

    /** Return all names in given subkey */
    std::vector<std::string> getNames(const std::string& sk) const;

    const std::string& getFilename() const {
        return m_filename;
    }

private:
    std::string m_filename;
    StatusCode m_status{STATUS_RO};
    std::map<std::string, std::map<std::string, std::string> > m_submaps;

    void parseinput(std::istream& input);
};

/** Read a boolean parameter ("1", "true", "yes"...), with default. */
extern bool confBool(const ConfSimple& conf, const std::string& name,
                     bool dflt);
/** Read an integer parameter, with default. */
extern int confInt(const ConfSimple& conf, const std::string& name, int dflt);

#endif /* _CONFTREE_H_INCLUDED_ */
