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

#include "wstestserver.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>

#include <openssl/evp.h>

#include "fmdxutils.hxx"

using namespace std;

// Sec-WebSocket-Accept value for a client key
static string acceptKey(const string& key)
{
    string in = key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0;
    if (EVP_Digest(in.data(), in.size(), md, &mdlen, EVP_sha1(),
                   nullptr) != 1) {
        return string();
    }
    unsigned char out[4 * EVP_MAX_MD_SIZE];
    int cnt = EVP_EncodeBlock(out, md, int(mdlen));
    return string((const char *)out, cnt);
}

static string headerValue(const string& headers, const string& name)
{
    string lower = stringtolower(headers);
    string::size_type pos = lower.find(string("\r\n") + name + ":");
    if (pos == string::npos) {
        return string();
    }
    pos += name.size() + 3;
    string::size_type eol = headers.find("\r\n", pos);
    string value = headers.substr(pos, eol == string::npos ? eol : eol - pos);
    trimstring(value);
    return value;
}

WsTestServer::WsTestServer()
{
    m_listenfd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_listenfd < 0) {
        return;
    }
    int one = 1;
    setsockopt(m_listenfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(m_listenfd, (struct sockaddr *)&addr, sizeof(addr)) < 0 ||
        listen(m_listenfd, 16) < 0) {
        close(m_listenfd);
        m_listenfd = -1;
        return;
    }
    socklen_t len = sizeof(addr);
    if (getsockname(m_listenfd, (struct sockaddr *)&addr, &len) == 0) {
        m_port = ntohs(addr.sin_port);
    }
    m_acceptthread = thread(&WsTestServer::acceptLoop, this);
}

WsTestServer::~WsTestServer()
{
    m_stop = true;
    if (m_acceptthread.joinable()) {
        m_acceptthread.join();
    }
    vector<shared_ptr<Conn> > conns;
    {
        unique_lock<mutex> lock(m_mutex);
        for (auto& conn : m_conns) {
            if (conn->open) {
                shutdown(conn->fd, SHUT_RDWR);
            }
        }
        conns = m_conns;
    }
    for (auto& conn : conns) {
        if (conn->thread.joinable()) {
            conn->thread.join();
        }
    }
    if (m_listenfd >= 0) {
        close(m_listenfd);
    }
}

string WsTestServer::address() const
{
    return string("127.0.0.1:") + to_string(m_port);
}

string WsTestServer::uri(const string& path) const
{
    return string("ws://") + address() + path;
}

void WsTestServer::acceptLoop()
{
    while (!m_stop) {
        struct pollfd pfd;
        pfd.fd = m_listenfd;
        pfd.events = POLLIN;
        if (poll(&pfd, 1, 100) <= 0) {
            continue;
        }
        int fd = accept4(m_listenfd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            continue;
        }
        shared_ptr<Conn> conn(new Conn);
        conn->fd = fd;
        unique_lock<mutex> lock(m_mutex);
        m_conns.push_back(conn);
        conn->thread = thread(&WsTestServer::serveConn, this, conn);
    }
}

// Read some more data, giving up when the server stops
static bool readMore(int fd, string& buf, const atomic<bool>& stop)
{
    while (!stop) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, 100);
        if (ret < 0 && errno != EINTR) {
            return false;
        }
        if (ret <= 0) {
            continue;
        }
        char tmp[4096];
        ssize_t cnt = recv(fd, tmp, sizeof(tmp), 0);
        if (cnt <= 0) {
            return false;
        }
        buf.append(tmp, cnt);
        return true;
    }
    return false;
}

static bool readAtLeast(int fd, string& buf, size_t n, const atomic<bool>& stop)
{
    while (buf.size() < n) {
        if (!readMore(fd, buf, stop)) {
            return false;
        }
    }
    return true;
}

bool WsTestServer::writeFrame(int fd, int opcode, const string& data)
{
    string frame;
    frame += char(0x80 | opcode);
    uint64_t len = data.size();
    if (len < 126) {
        frame += char(len);
    } else if (len < 65536) {
        frame += char(126);
        frame += char((len >> 8) & 0xff);
        frame += char(len & 0xff);
    } else {
        frame += char(127);
        for (int i = 7; i >= 0; i--) {
            frame += char((len >> (8 * i)) & 0xff);
        }
    }
    frame += data;
    size_t done = 0;
    while (done < frame.size()) {
        ssize_t cnt = send(fd, frame.data() + done, frame.size() - done,
                           MSG_NOSIGNAL);
        if (cnt <= 0) {
            if (cnt < 0 && errno == EINTR) {
                continue;
            }
            return false;
        }
        done += cnt;
    }
    return true;
}

void WsTestServer::serveConn(shared_ptr<Conn> conn)
{
    string buf;
    string::size_type hdrend;
    while ((hdrend = buf.find("\r\n\r\n")) == string::npos) {
        if (!readMore(conn->fd, buf, m_stop)) {
            goto out;
        }
    }
    {
        // "GET /path HTTP/1.1"
        string::size_type sp1 = buf.find(' ');
        string::size_type sp2 = buf.find(' ', sp1 + 1);
        string path = buf.substr(sp1 + 1, sp2 - sp1 - 1);
        string key = headerValue(buf.substr(0, hdrend + 2),
                                 "sec-websocket-key");
        buf.erase(0, hdrend + 4);
        string resp = string("HTTP/1.1 101 Switching Protocols\r\n"
                             "Upgrade: websocket\r\n"
                             "Connection: Upgrade\r\n"
                             "Sec-WebSocket-Accept: ") + acceptKey(key) +
            "\r\n\r\n";
        if (send(conn->fd, resp.data(), resp.size(), MSG_NOSIGNAL) !=
            ssize_t(resp.size())) {
            goto out;
        }
        unique_lock<mutex> lock(m_mutex);
        conn->path = path;
        m_accepts[path]++;
        m_cv.notify_all();
    }

    for (;;) {
        if (!readAtLeast(conn->fd, buf, 2, m_stop)) {
            break;
        }
        int opcode = buf[0] & 0x0f;
        bool masked = (buf[1] & 0x80) != 0;
        uint64_t len = buf[1] & 0x7f;
        size_t hdrlen = 2;
        if (len == 126) {
            if (!readAtLeast(conn->fd, buf, 4, m_stop))
                break;
            len = ((unsigned char)buf[2] << 8) | (unsigned char)buf[3];
            hdrlen = 4;
        } else if (len == 127) {
            if (!readAtLeast(conn->fd, buf, 10, m_stop))
                break;
            len = 0;
            for (int i = 0; i < 8; i++) {
                len = (len << 8) | (unsigned char)buf[2 + i];
            }
            hdrlen = 10;
        }
        size_t masklen = masked ? 4 : 0;
        if (!readAtLeast(conn->fd, buf, hdrlen + masklen + len, m_stop)) {
            break;
        }
        string payload = buf.substr(hdrlen + masklen, len);
        if (masked) {
            for (size_t i = 0; i < payload.size(); i++) {
                payload[i] ^= buf[hdrlen + (i % 4)];
            }
        }
        buf.erase(0, hdrlen + masklen + len);

        if (opcode == 1) {
            unique_lock<mutex> lock(m_mutex);
            m_texts[conn->path].push_back(payload);
            m_cv.notify_all();
        } else if (opcode == 9) {
            unique_lock<mutex> lock(m_mutex);
            m_pings[conn->path]++;
            m_cv.notify_all();
            if (!m_silent[conn->path]) {
                writeFrame(conn->fd, 10, payload);
            }
        } else if (opcode == 8) {
            unique_lock<mutex> lock(m_mutex);
            if (conn->open) {
                writeFrame(conn->fd, 8, payload.substr(0, 2));
            }
            break;
        }
    }

out:
    unique_lock<mutex> lock(m_mutex);
    conn->open = false;
    close(conn->fd);
    m_cv.notify_all();
}

bool WsTestServer::waitConnection(const string& path, int timeoutms)
{
    unique_lock<mutex> lock(m_mutex);
    return m_cv.wait_for(lock, chrono::milliseconds(timeoutms), [&] {
            for (auto& conn : m_conns) {
                if (conn->open && conn->path == path)
                    return true;
            }
            return false;
        });
}

int WsTestServer::connectionCount(const string& path)
{
    unique_lock<mutex> lock(m_mutex);
    int cnt = 0;
    for (auto& conn : m_conns) {
        if (conn->open && conn->path == path)
            cnt++;
    }
    return cnt;
}

int WsTestServer::acceptCount(const string& path)
{
    unique_lock<mutex> lock(m_mutex);
    auto it = m_accepts.find(path);
    return it == m_accepts.end() ? 0 : it->second;
}

bool WsTestServer::sendFrame(const string& path, int opcode, const string& data)
{
    unique_lock<mutex> lock(m_mutex);
    bool sent = false;
    for (auto& conn : m_conns) {
        if (conn->open && conn->path == path) {
            if (writeFrame(conn->fd, opcode, data))
                sent = true;
        }
    }
    return sent;
}

bool WsTestServer::sendText(const string& path, const string& data)
{
    return sendFrame(path, 1, data);
}

bool WsTestServer::sendBinary(const string& path, const string& data)
{
    return sendFrame(path, 2, data);
}

void WsTestServer::closeAll(const string& path)
{
    unique_lock<mutex> lock(m_mutex);
    for (auto& conn : m_conns) {
        if (conn->open && conn->path == path) {
            // Status 1000
            writeFrame(conn->fd, 8, string("\x03\xe8", 2));
            shutdown(conn->fd, SHUT_RDWR);
        }
    }
}

bool WsTestServer::waitText(const string& path, string& out, int timeoutms)
{
    unique_lock<mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, chrono::milliseconds(timeoutms), [&] {
                return !m_texts[path].empty();
            })) {
        return false;
    }
    out = m_texts[path].front();
    m_texts[path].pop_front();
    return true;
}

void WsTestServer::setSilent(const string& path, bool silent)
{
    unique_lock<mutex> lock(m_mutex);
    m_silent[path] = silent;
}

int WsTestServer::pingCount(const string& path)
{
    unique_lock<mutex> lock(m_mutex);
    auto it = m_pings.find(path);
    return it == m_pings.end() ? 0 : it->second;
}
