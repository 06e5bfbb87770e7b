/* Copyright (C) 2024 J.F.Dockes
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
#ifndef _STREAMSERVER_H_X_INCLUDED_
#define _STREAMSERVER_H_X_INCLUDED_

#include <memory>

class AacRelay;
class Session;

/// HTTP server for the local AAC stream.
///
/// Uses microhttpd, one thread per connection. Each client gets a sink
/// from the relay, and receives the transcoder output until the end of
/// stream, a stall longer than the client timeout, or disconnection.
class StreamServer {
public:
    StreamServer(Session& session, AacRelay& relay);
    ~StreamServer();

    /** Task body: start(), serve until shutdown or until streaming is
     * disabled, then stop(). */
    void run();

    /** Bind the port and start the daemon.
     * Throws TaskError(ERR_FEATURE) on failure, in particular if the port
     * is already in use. */
    void start();
    /** Close all client streams and stop the daemon. */
    void stop();

    /** Listening port, useful if 0 was requested. -1 if not started */
    int port() const;
    int clientCount() const;

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

#endif /* _STREAMSERVER_H_X_INCLUDED_ */
