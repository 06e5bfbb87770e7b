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
#ifndef _SESSION_H_X_INCLUDED_
#define _SESSION_H_X_INCLUDED_

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "exitsignal.h"

class ExecCmd;
class UpdateBus;

/// Relay parameters. Defaults are the values used by the program
/// when nothing is set in the configuration.
struct RelayOptions {
    RelayOptions();

    std::string audiouri;
    std::string texturi;

    // Feature switches. restreamonly implies streaming and no local
    // playback.
    bool streaming{false};
    bool restreamonly{false};

    // Local AAC stream server
    int streamport{8080};
    std::string streampath{"/stream.aac"};
    std::string contenttype{"audio/aac"};
    // Max chunks buffered per client, and silence before we drop one
    size_t sinksize{10};
    int clienttimeoutms{30000};
    // Bytes read from the transcoder at a time
    size_t relaychunk{1024};

    // Media processes. The transcoder command gets the bitrate
    // substituted for any "%b" argument.
    std::vector<std::string> playercmd;
    std::vector<std::string> transcodercmd;
    std::string aacbitrate{"96k"};

    // Connection pacing and timeouts
    int reconnectdelayms{5000};
    int settledelayms{500};
    int textopentimeoutms{10000};
    int textpingintervalms{20000};
    int textpingtimeoutms{10000};
    int audioopentimeoutms{15000};
    int audiorecvtimeoutms{15000};
    int audiopingtimeoutms{5000};

    // Controller
    int stopgracems{7000};
    int monitorpollms{500};

    std::vector<std::string> transcoderArgs() const;
};

/**
 * State shared by all the tasks of one controller run: options, the
 * update channel, the shutdown signal, the feature flags, the
 * transcoder handoff between the audio channel and the relay, and the
 * list of all the processes started, for the final cleanup.
 */
class Session {
public:
    Session(const RelayOptions& opts, UpdateBus& updates);
    ~Session();

    const RelayOptions& opts;
    UpdateBus& updates;
    ExitSignal exitsig;

    // Local playback through the player process. Fixed for the session.
    const bool playback;
    // Transcoding and the stream server. Can be turned off by failures.
    std::atomic<bool> streaming;

    bool shuttingDown() const {
        return exitsig.isSet();
    }

    /** Turn the streaming feature off for the rest of the session.
     * @return true if it was on. */
    bool disableStreaming();

    /** Publish the current transcoder (or null when it is gone) */
    void setTranscoder(std::shared_ptr<ExecCmd> cmd);
    /** Wait for a transcoder different from 'current'.
     * @return the new one, or null on timeout or shutdown. */
    std::shared_ptr<ExecCmd> waitTranscoder(
        const std::shared_ptr<ExecCmd>& current, int timeoutms);

    /** Remember a process for killAll() */
    void registerProcess(std::shared_ptr<ExecCmd> cmd);
    /** SIGKILL all processes still alive. */
    int killAll();

    /** Wake up everybody: shutdown signal and handoff waiters */
    void requestExit();

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::shared_ptr<ExecCmd> m_transcoder;
    std::vector<std::weak_ptr<ExecCmd> > m_processes;
};

#endif /* _SESSION_H_X_INCLUDED_ */
