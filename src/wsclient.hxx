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
#ifndef _WSCLIENT_H_X_INCLUDED_
#define _WSCLIENT_H_X_INCLUDED_

#include <memory>
#include <string>

class ExitSignal;

//
// WebSocket client connection (RFC 6455), for ws:// and wss:// URIs.
//
// Thin layer over the libcurl WebSocket API: curl performs the
// upgrade (CURLOPT_CONNECT_ONLY=2) and the framing. We add the
// timeouts and the exit signal wakeup, message reassembly, and the
// close code bookkeeping. The curl sockets are close-on-exec.
//
// One object is used for one connection attempt. Once closed or
// failed, it can't be reopened: create another one.
//
// recv() is meant to be called from a single thread. send methods
// may be called from another thread while a recv() is waiting.
class WsClient {
public:
    enum State {WS_DISCONNECTED, WS_CONNECTING, WS_CONNECTED, WS_CLOSING};
    enum Status {
        WS_OK = 0,
        // Nothing arrived in time
        WS_TIMEOUT,
        // Connection closed by the peer (close frame or EOF)
        WS_CLOSED,
        // TCP connection refused
        WS_REFUSED,
        // Network or protocol error
        WS_ERROR,
        // The exit signal was raised
        WS_CANCELLED,
        // The URI can't be used: no point in retrying
        WS_BADURI,
    };
    enum Opcode {OP_CONT = 0, OP_TEXT = 1, OP_BINARY = 2, OP_CLOSE = 8,
                 OP_PING = 9, OP_PONG = 10};

    struct Message {
        int opcode{OP_TEXT};
        std::string data;
    };

    WsClient(const std::string& uri);
    ~WsClient();

    /** Check and split a ws:// or wss:// URI. path includes any query. */
    static bool parseUri(const std::string& uri, bool *secure,
                         std::string *host, int *port, std::string *path);

    /** Connect and perform the upgrade handshake.
     * @param timeoutms limit for the whole operation.
     * @param sig if set, raising it aborts the operation. */
    Status open(int timeoutms, ExitSignal *sig = nullptr);

    /** Wait for the next data message. Pings are answered by curl.
     * Pong frames are returned too, with opcode OP_PONG. Fragmented
     * messages are reassembled.
     * @param timeoutms < 0 for no timeout.
     * @return WS_OK if msg was set. */
    Status recv(Message& msg, int timeoutms, ExitSignal *sig = nullptr);

    Status sendText(const std::string& data);
    Status sendBinary(const std::string& data);
    Status sendPing(const std::string& payload = std::string());

    /** Send a close frame if still connected, and release the
     * connection. Does not wait for the peer's answer. */
    void close(int code = 1000, const std::string& reason = std::string());

    State state() const;
    bool connected() const {
        return state() == WS_CONNECTED;
    }

    /** Code and reason from the peer close frame. 1006 if the
     * connection was lost without one. */
    int closeCode() const;
    std::string closeReason() const;

    /** Error message for the last failure */
    std::string getreason() const;
    const std::string& uri() const;

    static const char *statusName(Status st);

    class Internal;
private:
    std::unique_ptr<Internal> m;

    WsClient(const WsClient&);
    WsClient& operator=(const WsClient&);
};

#endif /* _WSCLIENT_H_X_INCLUDED_ */
