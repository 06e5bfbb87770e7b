/*
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

#include "fmdxutils.hxx"

#include <ctype.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>

#include "exitsignal.h"
#include "log.h"

using namespace std;

bool mhzToKhz(const string& _mhz, int *khz)
{
    string mhz(_mhz);
    trimstring(mhz);
    if (mhz.empty()) {
        return false;
    }
    for (auto& c : mhz) {
        if (c == ',') {
            c = '.';
        }
    }
    // strtod would accept hex, inf, nan...: only allow plain decimals
    for (auto c : mhz) {
        if (!isdigit((unsigned char)c) && c != '.' && c != '+' && c != '-') {
            return false;
        }
    }
    char *endp;
    double value = strtod(mhz.c_str(), &endp);
    if (endp == mhz.c_str() || *endp != 0) {
        return false;
    }
    if (value < FREQ_MIN_KHZ / 1000.0 || value > FREQ_MAX_KHZ / 1000.0) {
        return false;
    }
    // Round to Hz first, so that 97.3 does not become 97299.
    long hz = lround(value * 1000000.0);
    *khz = int(hz / 1000);
    return true;
}

int clampKhz(int khz)
{
    if (khz < FREQ_MIN_KHZ)
        return FREQ_MIN_KHZ;
    if (khz > FREQ_MAX_KHZ)
        return FREQ_MAX_KHZ;
    return khz;
}

string khzToMHzString(int khz)
{
    char buf[30];
    snprintf(buf, sizeof(buf), "%d.%03d", khz / 1000, khz % 1000);
    return buf;
}

string tuneCommandText(int khz)
{
    return string("T") + to_string(khz);
}

bool buildWsUris(const string& _address, string& audiouri, string& texturi)
{
    string address(_address);
    trimstring(address);
    bool secure = false;
    string::size_type pos = address.find("://");
    if (pos != string::npos) {
        string scheme = stringtolower(address.substr(0, pos));
        secure = scheme == "https" || scheme == "wss";
        address = address.substr(pos + 3);
    }
    // Drop any path: we supply our own
    pos = address.find('/');
    if (pos != string::npos) {
        address = address.substr(0, pos);
    }
    string host(address);
    string port;
    if (!host.empty() && host[0] == '[') {
        // [ipv6]:port
        pos = host.find(']');
        if (pos == string::npos) {
            return false;
        }
        if (pos + 1 < host.size() && host[pos+1] == ':') {
            port = host.substr(pos + 2);
        }
        host = host.substr(0, pos + 1);
    } else {
        pos = host.rfind(':');
        if (pos != string::npos) {
            port = host.substr(pos + 1);
            host = host.substr(0, pos);
        }
    }
    if (host.empty() || host == "[]") {
        LOGERR("buildWsUris: no host in [" << _address << "]\n");
        return false;
    }
    if (port.empty()) {
        port = secure ? "443" : "80";
    }
    string base = string(secure ? "wss://" : "ws://") + host + ":" + port;
    audiouri = base + "/audio";
    texturi = base + "/text";
    return true;
}

void trimstring(string& s, const char *ws)
{
    string::size_type pos = s.find_first_not_of(ws);
    if (pos == string::npos) {
        s.clear();
        return;
    }
    s.replace(0, pos, string());
    pos = s.find_last_not_of(ws);
    if (pos != string::npos && pos != s.length() - 1)
        s.replace(pos + 1, string::npos, string());
}

string stringtolower(const string& in)
{
    string out(in);
    for (auto& c : out) {
        c = tolower((unsigned char)c);
    }
    return out;
}

bool stringToBool(const string& s)
{
    if (s.empty())
        return false;
    if (isdigit((unsigned char)s[0])) {
        return atoi(s.c_str()) != 0;
    }
    return s.find_first_of("yYtT") == 0;
}

void stringToStrings(const string& s, vector<string>& tokens)
{
    string current;
    bool inquote = false;
    bool havetoken = false;
    for (auto c : s) {
        if (c == '"') {
            inquote = !inquote;
            havetoken = true;
            continue;
        }
        if (!inquote && (c == ' ' || c == '\t' || c == '\n')) {
            if (havetoken) {
                tokens.push_back(current);
                current.clear();
                havetoken = false;
            }
            continue;
        }
        current += c;
        havetoken = true;
    }
    if (havetoken) {
        tokens.push_back(current);
    }
}

string truncateText(const string& s, size_t maxlen)
{
    if (s.size() <= maxlen) {
        return s;
    }
    if (maxlen <= 3) {
        return s.substr(0, maxlen);
    }
    return s.substr(0, maxlen - 3) + "...";
}

long ReconnectPacer::delayms() const
{
    if (m_attempts == 0) {
        return 0;
    }
    long left = m_laststart.remaining(m_intervalms);
    return left > 0 ? left : 0;
}

bool ReconnectPacer::waitNextAttempt(ExitSignal& sig)
{
    long ms = delayms();
    if (ms > 0) {
        LOGDEB1("ReconnectPacer: waiting " << ms << " mS\n");
        if (sig.waitFor(int(ms))) {
            return false;
        }
    } else if (sig.isSet()) {
        return false;
    }
    m_laststart.restart();
    m_attempts++;
    return true;
}
