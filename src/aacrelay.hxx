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
#ifndef _AACRELAY_H_X_INCLUDED_
#define _AACRELAY_H_X_INCLUDED_

#include <stdint.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <set>

#include "abuffer.h"
#include "bufxchange.h"

class Session;

/// One client's queue of stream chunks. The relay pushes with
/// putEvictOldest(), so a slow client loses its oldest data instead of
/// holding up the others. An empty buffer marks the end of stream.
typedef BufXChange<ABufferP> ClientSink;
typedef std::shared_ptr<ClientSink> ClientSinkP;

/**
 * Fan-out of the transcoder output to the stream clients.
 *
 * The relay task waits for the audio channel to publish a transcoder,
 * then reads its standard output and distributes the data to all
 * registered sinks. The stream server adds and removes sinks from its
 * connection threads.
 */
class AacRelay {
public:
    AacRelay(Session& session);
    ~AacRelay();

    /** Task body. Returns at shutdown, or when streaming gets
     * disabled. */
    void run();

    /** Create and register a sink for a new client.
     * @return the sink, or null if the relay is shut down. */
    ClientSinkP addSink();
    /** Unregister a sink and discard what it still holds */
    void removeSink(ClientSinkP sink);
    size_t sinkCount();

    /** Push a chunk to every sink registered at this point. */
    void distribute(const ABufferP& chunk);

    /** Send the end of stream marker to all sinks */
    void broadcastEOS();

    /** Terminate all sinks, waking up the clients waiting on them, and
     * refuse new ones. Used at shutdown. */
    void terminateSinks();

    enum PumpStatus {PUMP_EOF, PUMP_STOP, PUMP_ERROR};
    /** Read from fd and distribute until end of file or shutdown. */
    PumpStatus pump(int fd);

    uint64_t bytesRelayed() const {
        return m_bytes;
    }

private:
    Session& m_session;
    std::mutex m_mutex;
    std::set<ClientSinkP> m_sinks;
    bool m_closed{false};
    std::atomic<uint64_t> m_bytes{0};
};

#endif /* _AACRELAY_H_X_INCLUDED_ */
