/* Copyright (C) 2003-2018 J.F.Dockes
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

#include "conftree.h"

#include <stdlib.h>

#include <fstream>

#include "fmdxutils.hxx"
#include "log.h"

using namespace std;

static string tildexpand(const string& fname)
{
    if (fname.empty() || fname[0] != '~') {
        return fname;
    }
    const char *home = getenv("HOME");
    if (nullptr == home) {
        return fname;
    }
    return string(home) + fname.substr(1);
}

ConfSimple::ConfSimple(const string& fname, bool tildexp)
    : m_filename(tildexp ? tildexpand(fname) : fname)
{
    if (m_filename.empty()) {
        return;
    }
    ifstream input(m_filename.c_str(), ios::in);
    if (!input.is_open()) {
        LOGERR("ConfSimple::ConfSimple: can't open " << m_filename << "\n");
        m_status = STATUS_ERROR;
        return;
    }
    parseinput(input);
}

ConfSimple::ConfSimple(istream& input)
{
    parseinput(input);
}

void ConfSimple::parseinput(istream& input)
{
    string submapkey;
    string line;
    bool appending = false;
    string cline;

    for (;;) {
        if (!getline(input, cline)) {
            if (input.bad()) {
                LOGERR("ConfSimple::parseinput: read error\n");
                m_status = STATUS_ERROR;
            }
            break;
        }
        if (!cline.empty() && cline.back() == '\r') {
            cline.pop_back();
        }
        if (appending) {
            line += cline;
        } else {
            line = cline;
        }
        trimstring(line);
        if (line.empty() || line[0] == '#') {
            appending = false;
            continue;
        }
        if (line.back() == '\\') {
            line.pop_back();
            appending = true;
            continue;
        }
        appending = false;

        if (line[0] == '[') {
            trimstring(line, "[] \t");
            submapkey = line;
            continue;
        }

        string::size_type eqpos = line.find('=');
        if (eqpos == string::npos) {
            LOGDEB("ConfSimple: ignoring line without '=': [" << line << "]\n");
            continue;
        }
        string nm = line.substr(0, eqpos);
        trimstring(nm);
        string val = line.substr(eqpos + 1);
        trimstring(val);
        if (nm.empty()) {
            continue;
        }
        m_submaps[submapkey][nm] = val;
    }
}

bool ConfSimple::get(const string& nm, string& value, const string& sk) const
{
    auto ss = m_submaps.find(sk);
    if (ss == m_submaps.end()) {
        return false;
    }
    auto s = ss->second.find(nm);
    if (s == ss->second.end()) {
        return false;
    }
    value = s->second;
    return true;
}

vector<string> ConfSimple::getNames(const string& sk) const
{
    vector<string> names;
    auto ss = m_submaps.find(sk);
    if (ss == m_submaps.end()) {
        return names;
    }
    for (const auto& entry : ss->second) {
        names.push_back(entry.first);
    }
    return names;
}

bool confBool(const ConfSimple& conf, const string& name, bool dflt)
{
    string value;
    if (!conf.get(name, value)) {
        return dflt;
    }
    return stringToBool(value);
}

int confInt(const ConfSimple& conf, const string& name, int dflt)
{
    string value;
    if (!conf.get(name, value) || value.empty()) {
        return dflt;
    }
    return atoi(value.c_str());
}
