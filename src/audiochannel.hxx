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
#ifndef _AUDIOCHANNEL_H_X_INCLUDED_
#define _AUDIOCHANNEL_H_X_INCLUDED_

#include <memory>
#include <string>

class ExecCmd;
class Session;
class WsClient;

/**
 * The audio connection to the server ("/audio" endpoint).
 *
 * MP3 frames arrive as binary messages. They are written to the local
 * player (unless we are only restreaming), and to the AAC transcoder
 * if streaming is enabled. The transcoder output is picked up by the
 * AacRelay.
 *
 * The processes are started after each successful connection and
 * stopped when it ends.
 */
class AudioChannel {
public:
    AudioChannel(Session& session);
    ~AudioChannel();

    /** Task body. Returns when the session is shutting down. Throws
     * TaskError(ERR_FATAL) if the server URI is unusable or the
     * player is needed and can't be found. */
    void run();

    /** Start the player and transcoder as needed by the session.
     * A transcoder failure disables streaming but is not an error here.
     * @return false if the player could not be started (retry later). */
    bool startProcesses();

    /** Terminate both processes. */
    void stopProcesses();

    /** Look for exited processes and handle them.
     * @return false if the player is gone and a new connection cycle
     *   is needed. */
    bool checkProcesses();

    /** Pass one MP3 frame to the live processes */
    void feed(const std::string& data);

    std::shared_ptr<ExecCmd> player() const {
        return m_player;
    }
    std::shared_ptr<ExecCmd> transcoder() const {
        return m_transcoder;
    }

private:
    Session& m_session;
    std::shared_ptr<ExecCmd> m_player;
    std::shared_ptr<ExecCmd> m_transcoder;

    void runLoop();
    void pumpLoop(WsClient& conn);
    void dropTranscoder();
};

#endif /* _AUDIOCHANNEL_H_X_INCLUDED_ */
