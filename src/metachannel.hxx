/*
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation; either version 2 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.
 *
 *   You should have received a copy of the GNU General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _METACHANNEL_H_X_INCLUDED_
#define _METACHANNEL_H_X_INCLUDED_

#include <memory>
#include <mutex>
#include <string>

class Session;
class WsClient;

/**
 * The metadata connection to the server ("/text" endpoint).
 *
 * The server pushes one JSON object per text message, with the RDS
 * data and the current frequency. We send tune commands the other
 * way. The connection is kept up forever, reconnecting as needed,
 * until the session exit signal is raised.
 */
class MetaChannel {
public:
    MetaChannel(Session& session);
    ~MetaChannel();

    /** Task body. Returns when the session is shutting down. Throws
     * TaskError(ERR_FATAL) if the server URI is unusable. */
    void run();

    enum TuneResult {TUNE_SENT, TUNE_NOTCONNECTED, TUNE_FAILED};

    /** Send a tune command on the current connection, if any. Called
     * from the command forwarder thread. */
    TuneResult sendTune(int khz);

    /** Process one text message from the server: emit the data
     * event, then the frequency if there is a valid one. */
    void processMessage(const std::string& text);

    bool connected();

private:
    Session& m_session;
    // The live connection, only set while it is usable for sending
    std::shared_ptr<WsClient> m_conn;
    std::mutex m_connmutex;

    void setConnection(std::shared_ptr<WsClient> conn);
    void receiveLoop(WsClient& conn);
};

#endif /* _METACHANNEL_H_X_INCLUDED_ */
