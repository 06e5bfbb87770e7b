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

#include "session.hxx"

#include <chrono>

#include "execmd.h"
#include "log.h"

using namespace std;

RelayOptions::RelayOptions()
    : playercmd{"ffplay", "-probesize", "32", "-analyzeduration", "0",
            "-fflags", "nobuffer", "-flags", "low_delay", "-f", "mp3", "-",
            "-nodisp", "-autoexit", "-loglevel", "error"},
      transcodercmd{"ffmpeg", "-hide_banner", "-loglevel", "error",
              "-probesize", "32", "-analyzeduration", "0", "-f", "mp3",
              "-i", "-", "-c:a", "aac", "-b:a", "%b", "-f", "adts",
              "-avioflags", "direct", "-flush_packets", "1", "-"}
{
}

vector<string> RelayOptions::transcoderArgs() const
{
    vector<string> args(transcodercmd);
    for (auto& arg : args) {
        if (arg == "%b") {
            arg = aacbitrate;
        }
    }
    return args;
}

Session::Session(const RelayOptions& _opts, UpdateBus& _updates)
    : opts(_opts), updates(_updates), playback(!_opts.restreamonly),
      streaming(_opts.streaming || _opts.restreamonly)
{
}

Session::~Session()
{
    killAll();
}

bool Session::disableStreaming()
{
    bool was = streaming.exchange(false);
    if (was) {
        LOGINF("Session: streaming disabled\n");
    }
    unique_lock<mutex> lock(m_mutex);
    m_cv.notify_all();
    return was;
}

void Session::setTranscoder(shared_ptr<ExecCmd> cmd)
{
    unique_lock<mutex> lock(m_mutex);
    m_transcoder = cmd;
    m_cv.notify_all();
}

shared_ptr<ExecCmd> Session::waitTranscoder(const shared_ptr<ExecCmd>& current,
                                            int timeoutms)
{
    unique_lock<mutex> lock(m_mutex);
    m_cv.wait_for(lock, chrono::milliseconds(timeoutms), [&] {
            return exitsig.isSet() || !streaming ||
                (m_transcoder && m_transcoder != current);
        });
    if (exitsig.isSet() || !m_transcoder || m_transcoder == current) {
        return shared_ptr<ExecCmd>();
    }
    return m_transcoder;
}

void Session::registerProcess(shared_ptr<ExecCmd> cmd)
{
    unique_lock<mutex> lock(m_mutex);
    // Forget the dead ones
    for (auto it = m_processes.begin(); it != m_processes.end();) {
        if (it->expired()) {
            it = m_processes.erase(it);
        } else {
            it++;
        }
    }
    m_processes.push_back(cmd);
}

int Session::killAll()
{
    vector<shared_ptr<ExecCmd> > alive;
    {
        unique_lock<mutex> lock(m_mutex);
        for (auto& wp : m_processes) {
            shared_ptr<ExecCmd> cmd = wp.lock();
            if (cmd) {
                alive.push_back(cmd);
            }
        }
    }
    int cnt = 0;
    for (auto& cmd : alive) {
        int status;
        if (!cmd->maybereap(&status)) {
            LOGDEB("Session::killAll: killing pid " << cmd->getChildPid() <<
                   endl);
            cmd->kill();
            cnt++;
        }
    }
    return cnt;
}

void Session::requestExit()
{
    exitsig.set();
    unique_lock<mutex> lock(m_mutex);
    m_cv.notify_all();
}
