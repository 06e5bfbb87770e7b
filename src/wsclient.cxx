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

#include "wsclient.hxx"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>

#include <atomic>
#include <mutex>

#include <curl/curl.h>

#include "chrono.h"
#include "exitsignal.h"
#include "fmdxutils.hxx"
#include "log.h"

using namespace std;

// Global libcurl initialization.
class CurlInit {
public:
    CurlInit() {
        int opts = CURL_GLOBAL_ALL;
#ifdef CURL_GLOBAL_ACK_EINTR
        opts |= CURL_GLOBAL_ACK_EINTR;
#endif
        curl_global_init(opts);
    }
};
static CurlInit curlglobalinit;

// Biggest message we accept. Audio frames are a few kB, metadata a
// few hundred bytes.
static const size_t maxMessageSize = 16 * 1024 * 1024;

// Close code used when the connection dropped without a close frame
static const int closeCodeAbnormal = 1006;

// Limit for pushing one message out when the peer does not read
static const int sendTimeoutMs = 10000;

class WsClient::Internal {
public:
    Internal(const string& u)
        : uri(u) {}
    ~Internal() {
        cleanup();
    }

    void cleanup() {
        if (curl) {
            curl_easy_cleanup(curl);
            curl = nullptr;
        }
        fd = CURL_SOCKET_BAD;
    }

    Status sendFrame(unsigned int flags, const string& payload);
    Status waitSocket(short events, const Chrono& chron, int timeoutms,
                      ExitSignal *sig);
    void setreason(const string& r) {
        unique_lock<mutex> lock(statemutex);
        reason = r;
    }
    int curlSockoptCB(curl_socket_t cfd, curlsocktype);

    string uri;
    bool secure{false};
    string host;
    int port{80};
    string path;

    CURL *curl{nullptr};
    curl_socket_t fd{CURL_SOCKET_BAD};
    char curlerrbuf[CURL_ERROR_SIZE];

    atomic<int> state{WS_DISCONNECTED};
    // Receive side, only accessed from the recv() thread: the frame
    // being read and the message being reassembled.
    string framedata;
    int msgopcode{-1};
    string msgdata;

    // Serializes the curl calls between the recv and send threads
    mutex iomutex;
    // Protects the error/close data
    mutable mutex statemutex;
    int closecode{closeCodeAbnormal};
    string closereason;
    string reason;
};

// The media processes must not inherit our connections.
static int curl_sockopt_cb(void *userp, curl_socket_t curlfd,
                           curlsocktype purpose)
{
    WsClient::Internal *me = (WsClient::Internal *)userp;
    return me ? me->curlSockoptCB(curlfd, purpose) : CURL_SOCKOPT_ERROR;
}

int WsClient::Internal::curlSockoptCB(curl_socket_t cfd, curlsocktype)
{
    int flags = fcntl(cfd, F_GETFD);
    if (flags < 0 || fcntl(cfd, F_SETFD, flags | FD_CLOEXEC) < 0) {
        LOGSYSERR("WsClient::curlSockoptCB", "fcntl", cfd);
        return CURL_SOCKOPT_ERROR;
    }
    return CURL_SOCKOPT_OK;
}

WsClient::WsClient(const string& uri)
    : m(new Internal(uri))
{
}

WsClient::~WsClient()
{
    close();
}

const char *WsClient::statusName(Status st)
{
    switch (st) {
    case WS_OK: return "ok";
    case WS_TIMEOUT: return "timeout";
    case WS_CLOSED: return "closed";
    case WS_REFUSED: return "connection refused";
    case WS_ERROR: return "error";
    case WS_CANCELLED: return "cancelled";
    case WS_BADURI: return "invalid uri";
    }
    return "unknown";
}

bool WsClient::parseUri(const string& uri, bool *secure, string *host,
                        int *port, string *path)
{
    for (auto c : uri) {
        if ((unsigned char)c <= ' ' || c == 0x7f) {
            return false;
        }
    }
    string::size_type pos = uri.find("://");
    if (pos == string::npos) {
        return false;
    }
    string scheme = stringtolower(uri.substr(0, pos));
    bool sec;
    if (scheme == "ws") {
        sec = false;
    } else if (scheme == "wss") {
        sec = true;
    } else {
        return false;
    }
    string rest = uri.substr(pos + 3);
    pos = rest.find_first_of("/?#");
    string authority = rest.substr(0, pos);
    string pth = pos == string::npos ? string("/") : rest.substr(pos);
    if (!pth.empty() && pth[0] != '/') {
        pth = "/" + pth;
    }
    pos = pth.find('#');
    if (pos != string::npos) {
        pth = pth.substr(0, pos);
    }
    if (authority.find('@') != string::npos) {
        return false;
    }

    string hst, prt;
    if (!authority.empty() && authority[0] == '[') {
        pos = authority.find(']');
        if (pos == string::npos) {
            return false;
        }
        hst = authority.substr(0, pos + 1);
        string tail = authority.substr(pos + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') {
                return false;
            }
            prt = tail.substr(1);
        }
        if (hst.size() <= 2) {
            return false;
        }
    } else {
        pos = authority.find(':');
        hst = authority.substr(0, pos);
        if (pos != string::npos) {
            prt = authority.substr(pos + 1);
            if (prt.empty()) {
                return false;
            }
        }
        if (hst.empty() || hst.find_first_of("[]:") != string::npos) {
            return false;
        }
    }

    int prtnum = sec ? 443 : 80;
    if (!prt.empty()) {
        if (prt.size() > 5 ||
            prt.find_first_not_of("0123456789") != string::npos) {
            return false;
        }
        prtnum = atoi(prt.c_str());
        if (prtnum <= 0 || prtnum > 65535) {
            return false;
        }
    }
    if (secure)
        *secure = sec;
    if (host)
        *host = hst;
    if (port)
        *port = prtnum;
    if (path)
        *path = pth;
    return true;
}

static int xferinfo_cb(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                       curl_off_t)
{
    ExitSignal *sig = static_cast<ExitSignal*>(clientp);
    // Non-zero aborts the transfer
    return (sig && sig->isSet()) ? 1 : 0;
}

WsClient::Status WsClient::open(int timeoutms, ExitSignal *sig)
{
    if (m->state != WS_DISCONNECTED || m->curl) {
        LOGERR("WsClient::open: " << m->uri << ": already used\n");
        return WS_ERROR;
    }
    if (!parseUri(m->uri, &m->secure, &m->host, &m->port, &m->path)) {
        m->setreason(string("invalid uri: [") + m->uri + "]");
        LOGERR("WsClient::open: " << m->reason << endl);
        return WS_BADURI;
    }
    m->state = WS_CONNECTING;

    m->curl = curl_easy_init();
    if (nullptr == m->curl) {
        m->setreason("curl_easy_init failed");
        m->state = WS_DISCONNECTED;
        return WS_ERROR;
    }
    string url = string(m->secure ? "wss://" : "ws://") + m->host + ":" +
        to_string(m->port) + m->path;
    m->curlerrbuf[0] = 0;
    curl_easy_setopt(m->curl, CURLOPT_URL, url.c_str());
    // 2: perform the upgrade, then hand over the connection to
    // curl_ws_send/recv
    curl_easy_setopt(m->curl, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(m->curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(m->curl, CURLOPT_ERRORBUFFER, m->curlerrbuf);
    curl_easy_setopt(m->curl, CURLOPT_TIMEOUT_MS, long(timeoutms));
    curl_easy_setopt(m->curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(m->curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(m->curl, CURLOPT_XFERINFODATA, sig);
    curl_easy_setopt(m->curl, CURLOPT_SOCKOPTFUNCTION, curl_sockopt_cb);
    curl_easy_setopt(m->curl, CURLOPT_SOCKOPTDATA, m.get());
    curl_easy_setopt(m->curl, CURLOPT_TCP_NODELAY, 1L);
    curl_easy_setopt(m->curl, CURLOPT_USERAGENT, "fmdxrelay");

    LOGDEB("WsClient::open: connecting to " << url << endl);
    CURLcode code = curl_easy_perform(m->curl);
    if (code != CURLE_OK) {
        string msg = m->curlerrbuf[0] ? string(m->curlerrbuf) :
            string(curl_easy_strerror(code));
        m->setreason(msg);
        LOGDEB("WsClient::open: " << m->uri << ": " << msg << endl);
        m->cleanup();
        m->state = WS_DISCONNECTED;
        switch (code) {
        case CURLE_ABORTED_BY_CALLBACK: return WS_CANCELLED;
        case CURLE_OPERATION_TIMEDOUT: return WS_TIMEOUT;
        case CURLE_COULDNT_CONNECT: return WS_REFUSED;
        case CURLE_URL_MALFORMAT: return WS_BADURI;
        default: return WS_ERROR;
        }
    }
    // The timeout was for the upgrade, not for the connection life
    curl_easy_setopt(m->curl, CURLOPT_TIMEOUT_MS, 0L);

    curl_socket_t sock;
    code = curl_easy_getinfo(m->curl, CURLINFO_ACTIVESOCKET, &sock);
    if (code != CURLE_OK || sock == CURL_SOCKET_BAD) {
        m->setreason("could not get the connection socket");
        m->cleanup();
        m->state = WS_DISCONNECTED;
        return WS_ERROR;
    }
    m->fd = sock;
    m->state = WS_CONNECTED;
    LOGDEB("WsClient::open: connected to " << m->uri << endl);
    return WS_OK;
}

// Wait for the socket to be ready, the deadline, or the exit signal.
WsClient::Status WsClient::Internal::waitSocket(
    short events, const Chrono& chron, int timeoutms, ExitSignal *sig)
{
    if (sig && sig->isSet()) {
        return WS_CANCELLED;
    }
    int waitms = 1000;
    if (timeoutms >= 0) {
        long left = chron.remaining(timeoutms);
        if (left <= 0) {
            return WS_TIMEOUT;
        }
        waitms = int(left);
    }
    struct pollfd pfds[2];
    pfds[0].fd = fd;
    pfds[0].events = events;
    pfds[1].fd = sig ? sig->fd() : -1;
    pfds[1].events = POLLIN;
    int ret = poll(pfds, 2, waitms);
    if (ret < 0 && errno != EINTR) {
        setreason(string("poll: ") + strerror(errno));
        return WS_ERROR;
    }
    return WS_OK;
}

WsClient::Status WsClient::Internal::sendFrame(unsigned int flags,
                                               const string& payload)
{
    unique_lock<mutex> lock(iomutex);
    if (nullptr == curl) {
        setreason("not connected");
        return WS_CLOSED;
    }
    Chrono chron;
    size_t done = 0;
    for (;;) {
        size_t sent = 0;
        CURLcode code = curl_ws_send(curl, payload.data() + done,
                                     payload.size() - done, &sent, 0, flags);
        done += sent;
        if (code == CURLE_OK) {
            if (done >= payload.size()) {
                return WS_OK;
            }
            continue;
        }
        if (code != CURLE_AGAIN) {
            setreason(curl_easy_strerror(code));
            return WS_ERROR;
        }
        // Send buffer full. The peer is not reading.
        Status st = waitSocket(POLLOUT, chron, sendTimeoutMs, nullptr);
        if (st == WS_TIMEOUT) {
            setreason("send timeout");
        }
        if (st != WS_OK) {
            return st;
        }
    }
}

WsClient::Status WsClient::recv(Message& msg, int timeoutms, ExitSignal *sig)
{
    if (m->state != WS_CONNECTED && m->state != WS_CLOSING) {
        return WS_CLOSED;
    }
    Chrono chron;
    char buf[16384];
    for (;;) {
        size_t cnt = 0;
        const struct curl_ws_frame *meta = nullptr;
        CURLcode code;
        {
            unique_lock<mutex> lock(m->iomutex);
            if (nullptr == m->curl) {
                return WS_CLOSED;
            }
            code = curl_ws_recv(m->curl, buf, sizeof(buf), &cnt, &meta);
        }
        if (code == CURLE_AGAIN) {
            Status st = m->waitSocket(POLLIN, chron, timeoutms, sig);
            if (st == WS_ERROR) {
                m->state = WS_DISCONNECTED;
            }
            if (st != WS_OK) {
                return st;
            }
            continue;
        }
        if (code != CURLE_OK) {
            m->state = WS_DISCONNECTED;
            if (code == CURLE_GOT_NOTHING) {
                m->setreason("connection closed by peer");
                return WS_CLOSED;
            }
            m->setreason(curl_easy_strerror(code));
            return WS_ERROR;
        }
        if (nullptr == meta) {
            continue;
        }

        // A frame bigger than our buffer comes in several pieces
        if (m->framedata.size() + cnt > maxMessageSize) {
            m->setreason("frame too big");
            close(1009);
            return WS_ERROR;
        }
        m->framedata.append(buf, cnt);
        if (meta->bytesleft > 0) {
            continue;
        }
        string payload;
        payload.swap(m->framedata);
        int flags = meta->flags;

        if (flags & CURLWS_PING) {
            // libcurl answers it
            LOGDEB1("WsClient::recv: ping\n");
            continue;
        }
        if (flags & CURLWS_PONG) {
            msg.opcode = OP_PONG;
            msg.data = payload;
            return WS_OK;
        }
        if (flags & CURLWS_CLOSE) {
            int ccode = 1005;
            string reason;
            if (payload.size() >= 2) {
                ccode = ((unsigned char)payload[0] << 8) |
                    (unsigned char)payload[1];
                reason = payload.substr(2);
            }
            {
                unique_lock<mutex> lock(m->statemutex);
                m->closecode = ccode;
                m->closereason = reason;
                m->reason = string("closed by peer, code ") + to_string(ccode);
            }
            LOGDEB("WsClient::recv: " << m->uri << " close frame, code " <<
                   ccode << " reason [" << reason << "]\n");
            if (m->state == WS_CONNECTED) {
                // Echo the close frame
                if (m->sendFrame(CURLWS_CLOSE, payload.substr(0, 2)) != WS_OK) {
                    LOGDEB("WsClient::recv: close echo failed\n");
                }
            }
            m->state = WS_DISCONNECTED;
            return WS_CLOSED;
        }
        if (flags & (CURLWS_TEXT | CURLWS_BINARY)) {
            if (m->msgopcode < 0) {
                m->msgopcode = (flags & CURLWS_TEXT) ? OP_TEXT : OP_BINARY;
            }
            if (m->msgdata.size() + payload.size() > maxMessageSize) {
                m->setreason("message too big");
                close(1009);
                return WS_ERROR;
            }
            m->msgdata += payload;
            if (flags & CURLWS_CONT) {
                // More fragments to come
                continue;
            }
            msg.opcode = m->msgopcode;
            msg.data.swap(m->msgdata);
            m->msgdata.clear();
            m->msgopcode = -1;
            return WS_OK;
        }
        LOGDEB("WsClient::recv: ignoring frame with flags " << flags << endl);
    }
}

WsClient::Status WsClient::sendText(const string& data)
{
    if (m->state != WS_CONNECTED) {
        return WS_CLOSED;
    }
    return m->sendFrame(CURLWS_TEXT, data);
}

WsClient::Status WsClient::sendBinary(const string& data)
{
    if (m->state != WS_CONNECTED) {
        return WS_CLOSED;
    }
    return m->sendFrame(CURLWS_BINARY, data);
}

WsClient::Status WsClient::sendPing(const string& payload)
{
    if (m->state != WS_CONNECTED) {
        return WS_CLOSED;
    }
    return m->sendFrame(CURLWS_PING, payload);
}

void WsClient::close(int code, const string& reason)
{
    if (m->state == WS_CONNECTED) {
        m->state = WS_CLOSING;
        string payload;
        payload += char((code >> 8) & 0xff);
        payload += char(code & 0xff);
        payload += reason.substr(0, 120);
        if (m->sendFrame(CURLWS_CLOSE, payload) != WS_OK) {
            LOGDEB1("WsClient::close: " << m->uri << ": no close frame sent\n");
        }
    }
    unique_lock<mutex> lock(m->iomutex);
    m->cleanup();
    m->state = WS_DISCONNECTED;
}

WsClient::State WsClient::state() const
{
    return State(m->state.load());
}

int WsClient::closeCode() const
{
    unique_lock<mutex> lock(m->statemutex);
    return m->closecode;
}

string WsClient::closeReason() const
{
    unique_lock<mutex> lock(m->statemutex);
    return m->closereason;
}

string WsClient::getreason() const
{
    unique_lock<mutex> lock(m->statemutex);
    return m->reason;
}

const string& WsClient::uri() const
{
    return m->uri;
}
