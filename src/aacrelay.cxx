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

#include "aacrelay.hxx"

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

#include <vector>

#include "execmd.h"
#include "log.h"
#include "session.hxx"
#include "updates.hxx"

using namespace std;

AacRelay::AacRelay(Session& session)
    : m_session(session)
{
}

AacRelay::~AacRelay()
{
    terminateSinks();
}

ClientSinkP AacRelay::addSink()
{
    unique_lock<mutex> lock(m_mutex);
    if (m_closed) {
        return ClientSinkP();
    }
    ClientSinkP sink(new ClientSink("clientsink", m_session.opts.sinksize));
    m_sinks.insert(sink);
    LOGDEB("AacRelay::addSink: " << m_sinks.size() << " sinks\n");
    return sink;
}

void AacRelay::removeSink(ClientSinkP sink)
{
    if (!sink) {
        return;
    }
    {
        unique_lock<mutex> lock(m_mutex);
        m_sinks.erase(sink);
        LOGDEB("AacRelay::removeSink: " << m_sinks.size() << " sinks\n");
    }
    sink->drain();
}

size_t AacRelay::sinkCount()
{
    unique_lock<mutex> lock(m_mutex);
    return m_sinks.size();
}

void AacRelay::distribute(const ABufferP& chunk)
{
    // Work on a copy: sinks added from now on start with the next chunk
    vector<ClientSinkP> sinks;
    {
        unique_lock<mutex> lock(m_mutex);
        sinks.assign(m_sinks.begin(), m_sinks.end());
    }
    for (auto& sink : sinks) {
        size_t evicted;
        if (sink->putEvictOldest(chunk, &evicted) && evicted) {
            LOGDEB1("AacRelay::distribute: slow client, dropped " <<
                    evicted << " chunk(s)\n");
        }
    }
    m_bytes += chunk->bytes;
}

void AacRelay::broadcastEOS()
{
    distribute(eosABuffer());
}

void AacRelay::terminateSinks()
{
    vector<ClientSinkP> sinks;
    {
        unique_lock<mutex> lock(m_mutex);
        m_closed = true;
        sinks.assign(m_sinks.begin(), m_sinks.end());
    }
    for (auto& sink : sinks) {
        sink->setTerminate();
    }
}

AacRelay::PumpStatus AacRelay::pump(int fd)
{
    ExitSignal& exitsig = m_session.exitsig;
    size_t chunksize = m_session.opts.relaychunk;
    if (chunksize == 0) {
        chunksize = 1024;
    }
    vector<char> buf(chunksize);

    for (;;) {
        struct pollfd fds[2];
        fds[0].fd = fd;
        fds[0].events = POLLIN;
        fds[1].fd = exitsig.fd();
        fds[1].events = POLLIN;
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOGSYSERR("AacRelay::pump", "poll", "");
            return PUMP_ERROR;
        }
        if (exitsig.isSet()) {
            return PUMP_STOP;
        }
        if (fds[0].revents == 0) {
            continue;
        }
        ssize_t cnt = read(fd, &buf[0], buf.size());
        if (cnt < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOGSYSERR("AacRelay::pump", "read", fd);
            return PUMP_ERROR;
        }
        if (cnt == 0) {
            return PUMP_EOF;
        }
        distribute(ABufferP(new ABuffer(&buf[0], size_t(cnt))));
    }
}

void AacRelay::run()
{
    ExitSignal& exitsig = m_session.exitsig;
    const RelayOptions& opts = m_session.opts;

    shared_ptr<ExecCmd> current;
    while (!exitsig.isSet() && m_session.streaming) {
        shared_ptr<ExecCmd> cmd =
            m_session.waitTranscoder(current, opts.monitorpollms);
        if (!cmd) {
            continue;
        }
        current = cmd;
        int fd = cmd->stdoutFd();
        if (fd < 0) {
            LOGERR("AacRelay::run: transcoder has no output pipe\n");
            continue;
        }
        LOGINF("AacRelay::run: relaying from pid " << cmd->getChildPid() <<
               endl);

        PumpStatus st = pump(fd);
        // Let the clients close cleanly
        broadcastEOS();
        if (st == PUMP_STOP || exitsig.isSet()) {
            break;
        }
        if (st == PUMP_EOF && cmd->terminated()) {
            // Stopped by the audio channel. A new one will come.
            LOGDEB("AacRelay::run: transcoder was stopped, waiting\n");
            continue;
        }
        LOGERR("AacRelay::run: transcoder output ended after " <<
               m_bytes.load() << " bytes\n");
        if (m_session.disableStreaming()) {
            m_session.updates.streamStatus(
                "Stream: disabled (transcoder exited)");
            m_session.updates.error("ffmpeg exited unexpectedly during relay.");
        }
        break;
    }
    LOGDEB("AacRelay::run: done\n");
}
