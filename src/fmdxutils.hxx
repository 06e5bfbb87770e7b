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
#ifndef _FMDXUTILS_H_X_INCLUDED_
#define _FMDXUTILS_H_X_INCLUDED_

#include <string>
#include <vector>

#include "chrono.h"

class ExitSignal;

// FM broadcast band limits, and tuning step, in kHz
const int FREQ_MIN_KHZ = 87500;
const int FREQ_MAX_KHZ = 108000;
const int FREQ_STEP_KHZ = 100;

/// Parse a frequency in MHz as sent by the server or typed by the
/// user: "97.3", "97,300", " 97.300 ". Comma or dot decimal.
/// @param[out] khz integral kHz value, set only on success.
/// @return false if the text is not a number or is outside the band.
extern bool mhzToKhz(const std::string& mhz, int *khz);

/// Check a kHz value against the band limits
inline bool khzInBand(int khz)
{
    return khz >= FREQ_MIN_KHZ && khz <= FREQ_MAX_KHZ;
}

/// Clamp to the band
extern int clampKhz(int khz);

/// 97300 -> "97.300"
extern std::string khzToMHzString(int khz);

/// Text of the tune command sent on the metadata connection
extern std::string tuneCommandText(int khz);

/// Compute the audio and metadata WebSocket URIs from the server
/// address given by the user. This can be "host", "host:port", or
/// "http(s)://host[:port]" (ws:// and wss:// are accepted too). https
/// and wss map to secure connections.
/// @return false if no host name could be extracted.
extern bool buildWsUris(const std::string& address, std::string& audiouri,
                        std::string& texturi);

extern void trimstring(std::string& s, const char *ws = " \t\r\n");
extern std::string stringtolower(const std::string& in);
extern bool stringToBool(const std::string& s);
/// Split on white space, honoring double quotes
extern void stringToStrings(const std::string& s,
                            std::vector<std::string>& tokens);
/// Truncate for display, appending "..." if something was cut
extern std::string truncateText(const std::string& s, size_t maxlen);

/**
 * Minimum interval between connection attempts. The interval is
 * counted from the start of the previous attempt, on the monotonic
 * clock, so that an attempt which took long to fail does not delay
 * the next one further.
 */
class ReconnectPacer {
public:
    ReconnectPacer(int intervalms)
        : m_intervalms(intervalms) {}

    /** mS to wait before the next attempt is allowed, 0 if now */
    long delayms() const;

    /** Sleep until the next attempt is allowed, then record its
     * start time.
     * @return false if the exit signal was raised while waiting. */
    bool waitNextAttempt(ExitSignal& sig);

    int attempts() const {
        return m_attempts;
    }

private:
    int m_intervalms;
    int m_attempts{0};
    Chrono m_laststart;
};

#endif /* _FMDXUTILS_H_X_INCLUDED_ */
