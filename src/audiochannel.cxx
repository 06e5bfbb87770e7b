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

#include "audiochannel.hxx"

#include <json/json.h>

#include "execmd.h"
#include "fmdxutils.hxx"
#include "log.h"
#include "session.hxx"
#include "taskerror.hxx"
#include "updates.hxx"
#include "wsclient.hxx"

using namespace std;

// Short process name for messages: "/usr/bin/ffmpeg" -> "ffmpeg"
static string cmdName(const vector<string>& cmd)
{
    if (cmd.empty()) {
        return "(none)";
    }
    string::size_type pos = cmd[0].rfind('/');
    return pos == string::npos ? cmd[0] : cmd[0].substr(pos + 1);
}

// Ask the server for the MP3 stream
static string audioRequest()
{
    Json::Value req;
    req["type"] = "fallback";
    req["data"] = "mp3";
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, req);
}

AudioChannel::AudioChannel(Session& session)
    : m_session(session)
{
}

AudioChannel::~AudioChannel()
{
    stopProcesses();
}

bool AudioChannel::startProcesses()
{
    const RelayOptions& opts = m_session.opts;
    UpdateBus& updates = m_session.updates;

    if (m_session.playback && !m_player) {
        string name = cmdName(opts.playercmd);
        updates.status(string("Starting audio player (") + name + ")...");
        shared_ptr<ExecCmd> cmd(new ExecCmd(name));
        cmd->setStderrCallback([&updates, name](const string& line) {
                updates.error(name + ": " + line);
            });
        switch (cmd->startExec(opts.playercmd, false)) {
        case ExecCmd::EXEC_OK:
            break;
        case ExecCmd::EXEC_NOTFOUND:
            throw TaskError(ERR_FATAL, string("Fatal: '") + name +
                            "' command not found. Please install it or "
                            "use restream-only mode.");
        default:
            updates.error(string("Failed to start ") + name + ": " +
                          cmd->getreason());
            return false;
        }
        m_session.registerProcess(cmd);
        m_player = cmd;
        LOGINF("AudioChannel: started " << name << ", pid " <<
               cmd->getChildPid() << endl);
    }

    if (m_session.streaming && !m_transcoder) {
        string name = cmdName(opts.transcodercmd);
        shared_ptr<ExecCmd> cmd(new ExecCmd(name));
        cmd->setLogAllStderr(true);
        cmd->setStderrCallback([&updates, name](const string& line) {
                updates.error(name + ": " + line);
            });
        ExecCmd::ExecStatus st = cmd->startExec(opts.transcoderArgs(), true);
        if (st != ExecCmd::EXEC_OK) {
            // Streaming is optional: go on without it.
            m_session.disableStreaming();
            string why = st == ExecCmd::EXEC_NOTFOUND ?
                name + " not found" : name + " failed to start";
            LOGERR("AudioChannel: " << why << ": " << cmd->getreason() << endl);
            updates.streamStatus(string("Stream: disabled (") + why + ")");
            updates.error(string("'") + name + "' could not be started (" +
                          cmd->getreason() + "). AAC streaming disabled.");
        } else {
            m_session.registerProcess(cmd);
            m_transcoder = cmd;
            m_session.setTranscoder(cmd);
            LOGINF("AudioChannel: started " << name << ", pid " <<
                   cmd->getChildPid() << endl);
            updates.status(string("Started AAC transcoder (") + name + ").");
        }
    }
    return true;
}

void AudioChannel::dropTranscoder()
{
    if (m_transcoder) {
        m_transcoder->terminate();
        m_session.setTranscoder(shared_ptr<ExecCmd>());
        m_transcoder.reset();
    }
}

void AudioChannel::stopProcesses()
{
    if (m_player) {
        m_player->terminate();
        m_player.reset();
    }
    dropTranscoder();
}

bool AudioChannel::checkProcesses()
{
    UpdateBus& updates = m_session.updates;
    int status;

    if (m_transcoder) {
        if (!m_session.streaming) {
            // Turned off from elsewhere (e.g. stream server failure)
            LOGINF("AudioChannel: streaming disabled, stopping transcoder\n");
            dropTranscoder();
        } else if (m_transcoder->maybereap(&status)) {
            string name = cmdName(m_session.opts.transcodercmd);
            bool unexpected = ExecCmd::unexpectedExit(status);
            LOGERR("AudioChannel: " << name << " " <<
                   ExecCmd::statusString(status) << endl);
            m_session.setTranscoder(shared_ptr<ExecCmd>());
            m_transcoder.reset();
            if (m_session.disableStreaming()) {
                updates.streamStatus("Stream: disabled (transcoder exited)");
                if (unexpected) {
                    updates.error(name + " exited unexpectedly (" +
                                  ExecCmd::statusString(status) +
                                  "). AAC streaming disabled.");
                } else {
                    updates.status(name + " exited. AAC streaming disabled.");
                }
            }
        }
    }

    if (m_player && m_player->maybereap(&status)) {
        string name = cmdName(m_session.opts.playercmd);
        if (ExecCmd::unexpectedExit(status)) {
            updates.error(name + " exited unexpectedly (" +
                          ExecCmd::statusString(status) + ").");
        } else {
            updates.status(name + " exited.");
        }
        m_player.reset();
        return false;
    }
    if (m_session.playback && !m_player) {
        return false;
    }
    return true;
}

void AudioChannel::feed(const string& data)
{
    ExitSignal& exitsig = m_session.exitsig;
    UpdateBus& updates = m_session.updates;

    if (m_player && !m_player->terminated()) {
        if (!m_player->send(data.data(), data.size(), &exitsig)) {
            if (exitsig.isSet()) {
                return;
            }
            // Make it go away. The next checkProcesses() reaps it and
            // triggers a new connection cycle, with a new player.
            updates.error(cmdName(m_session.opts.playercmd) +
                          " input pipe broken.");
            m_player->terminate();
        }
    }
    if (m_transcoder && m_session.streaming) {
        if (!m_transcoder->send(data.data(), data.size(), &exitsig)) {
            if (exitsig.isSet()) {
                return;
            }
            dropTranscoder();
            if (m_session.disableStreaming()) {
                updates.streamStatus("Stream: disabled (transcoder input "
                                     "closed)");
                updates.error(cmdName(m_session.opts.transcodercmd) +
                              " input pipe broken. AAC streaming disabled.");
            }
        }
    }
}

void AudioChannel::pumpLoop(WsClient& conn)
{
    const RelayOptions& opts = m_session.opts;
    UpdateBus& updates = m_session.updates;
    ExitSignal& exitsig = m_session.exitsig;

    while (!exitsig.isSet()) {
        if (!checkProcesses()) {
            LOGINF("AudioChannel: player gone, reconnecting\n");
            return;
        }
        WsClient::Message msg;
        WsClient::Status st = conn.recv(msg, opts.audiorecvtimeoutms, &exitsig);
        if (st == WsClient::WS_TIMEOUT) {
            LOGINF("AudioChannel: no data for " << opts.audiorecvtimeoutms <<
                   " mS, pinging\n");
            updates.status("Audio WS recv timeout, pinging...");
            if (conn.sendPing() != WsClient::WS_OK) {
                updates.error(string("Audio WS ping failed: ") +
                              conn.getreason());
                return;
            }
            st = conn.recv(msg, opts.audiopingtimeoutms, &exitsig);
            if (st == WsClient::WS_TIMEOUT) {
                updates.status("Audio WS ping timeout.");
                return;
            }
        }
        switch (st) {
        case WsClient::WS_OK:
            if (msg.opcode == WsClient::OP_BINARY && !msg.data.empty()) {
                feed(msg.data);
            } else if (msg.opcode == WsClient::OP_TEXT) {
                LOGDEB("AudioChannel: text message: " << msg.data << endl);
            }
            break;
        case WsClient::WS_CANCELLED:
            return;
        case WsClient::WS_CLOSED:
            updates.status(string("Audio WS closed (Code: ") +
                           to_string(conn.closeCode()) + ")");
            return;
        default:
            updates.error(string("Audio WS Recv Error: ") + conn.getreason());
            return;
        }
    }
}

void AudioChannel::run()
{
    try {
        runLoop();
    } catch (...) {
        // Don't leave the processes behind, then let the controller
        // deal with the error.
        stopProcesses();
        throw;
    }
}

void AudioChannel::runLoop()
{
    const RelayOptions& opts = m_session.opts;
    UpdateBus& updates = m_session.updates;
    ExitSignal& exitsig = m_session.exitsig;

    if (!WsClient::parseUri(opts.audiouri, nullptr, nullptr, nullptr,
                            nullptr)) {
        throw TaskError(ERR_FATAL, string("Fatal: Invalid Audio WS URI: ") +
                        opts.audiouri);
    }

    ReconnectPacer pacer(opts.reconnectdelayms);
    while (!exitsig.isSet()) {
        if (!pacer.waitNextAttempt(exitsig)) {
            break;
        }
        updates.status("Connecting Audio WS...");
        WsClient conn(opts.audiouri);
        WsClient::Status st = conn.open(opts.audioopentimeoutms, &exitsig);
        if (st == WsClient::WS_CANCELLED) {
            break;
        }
        if (st == WsClient::WS_BADURI) {
            throw TaskError(ERR_FATAL, string("Fatal: Invalid Audio WS URI: ")
                            + opts.audiouri);
        }
        if (st != WsClient::WS_OK) {
            if (st == WsClient::WS_REFUSED) {
                updates.status("Audio WS connection refused.");
            } else if (st == WsClient::WS_TIMEOUT) {
                updates.status("Audio WS connection timeout.");
            } else {
                updates.error(string("Audio WS Error: ") + conn.getreason());
            }
            LOGINF("AudioChannel: connection to " << opts.audiouri <<
                   " failed: " << conn.getreason() << endl);
            exitsig.waitFor(opts.settledelayms);
            continue;
        }
        LOGINF("AudioChannel: connected to " << opts.audiouri << endl);
        updates.status("Audio WS connected.");

        if (conn.sendText(audioRequest()) != WsClient::WS_OK) {
            updates.error(string("Audio WS Error: ") + conn.getreason());
            conn.close();
            exitsig.waitFor(opts.settledelayms);
            continue;
        }

        if (!startProcesses()) {
            conn.close();
            stopProcesses();
            exitsig.waitFor(opts.reconnectdelayms);
            continue;
        }

        pumpLoop(conn);

        conn.close();
        stopProcesses();
        if (exitsig.isSet()) {
            break;
        }
        updates.status("Audio stream disconnected. Retrying...");
        exitsig.waitFor(opts.settledelayms);
    }
    stopProcesses();
    LOGDEB("AudioChannel::run: done\n");
}
