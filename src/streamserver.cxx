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

#include "streamserver.hxx"

#include <errno.h>
#include <string.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>

#include <microhttpd.h>

#include <atomic>
#include <mutex>
#include <string>

#include "aacrelay.hxx"
#include "log.h"
#include "session.hxx"
#include "taskerror.hxx"
#include "updates.hxx"

using namespace std;

// The callback return type changed in microhttpd 0.9.71
#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MHDResult;
#else
typedef int MHDResult;
#endif

// Reads the data for one client from its sink.
class SinkReader {
public:
    SinkReader(AacRelay& _relay, ClientSinkP _sink, int _timeoutms)
        : relay(_relay), sink(_sink), timeoutms(_timeoutms) {
    }
    ~SinkReader() {
        relay.removeSink(sink);
    }
    ssize_t contentRead(uint64_t pos, char *buf, size_t max);

    AacRelay& relay;
    ClientSinkP sink;
    int timeoutms;
    // Partially consumed buffer
    ABufferP cur;
    size_t curoffs{0};
    bool normalEOS{false};
};

ssize_t SinkReader::contentRead(uint64_t pos, char *obuf, size_t max)
{
    LOGDEB1("SinkReader::contentRead: pos " << pos << " max " << max << endl);
    if (normalEOS) {
        return MHD_CONTENT_READER_END_OF_STREAM;
    }
    size_t totcnt = 0;
    while (totcnt < max) {
        if (!cur) {
            // Only wait if we have nothing to return yet
            if (!sink->take(&cur, totcnt ? 0 : timeoutms)) {
                if (totcnt) {
                    break;
                }
                if (sink->terminated()) {
                    LOGDEB("SinkReader::contentRead: sink terminated\n");
                } else {
                    LOGINF("SinkReader::contentRead: no data for " <<
                           timeoutms << " mS, dropping client\n");
                }
                return MHD_CONTENT_READER_END_WITH_ERROR;
            }
            curoffs = 0;
            if (cur->eos()) {
                cur.reset();
                normalEOS = true;
                if (totcnt == 0) {
                    return MHD_CONTENT_READER_END_OF_STREAM;
                }
                // Return the data, EOS on next call.
                break;
            }
        }
        size_t tocopy = min(max - totcnt, cur->bytes - curoffs);
        memcpy(obuf + totcnt, cur->buf + curoffs, tocopy);
        totcnt += tocopy;
        curoffs += tocopy;
        if (curoffs >= cur->bytes) {
            cur.reset();
        }
    }
    return totcnt;
}

static ssize_t content_reader_cb(void *cls, uint64_t pos, char *buf, size_t max)
{
    SinkReader *reader = static_cast<SinkReader*>(cls);
    if (reader) {
        return reader->contentRead(pos, buf, max);
    } else {
        return MHD_CONTENT_READER_END_WITH_ERROR;
    }
}


class StreamServer::Internal {
public:
    Internal(Session& _session, AacRelay& _relay)
        : session(_session), relay(_relay) {
    }
    ~Internal() {
        stopMHD();
    }

    void bindListen();
    void startMHD();
    void stopMHD();
    void statusUpdate();

    MHDResult answerConn(
        struct MHD_Connection *connection, const char *url,
        const char *method, const char *version,
        const char *upload_data, size_t *upload_data_size,
        void **con_cls);

    void requestCompleted(
        struct MHD_Connection *conn,
        void **con_cls, enum MHD_RequestTerminationCode toe);

    Session& session;
    AacRelay& relay;
    int sock{-1};
    int listenport{-1};
    struct MHD_Daemon *mhd{nullptr};
    std::atomic<int> clients{0};
    std::mutex mmutex;
};


StreamServer::StreamServer(Session& session, AacRelay& relay)
    : m(new Internal(session, relay))
{
}

StreamServer::~StreamServer()
{
}

int StreamServer::port() const
{
    return m->listenport;
}

int StreamServer::clientCount() const
{
    return m->clients;
}

void StreamServer::Internal::statusUpdate()
{
    const RelayOptions& opts = session.opts;
    session.updates.streamStatus(
        string("Stream: AAC @ :") + to_string(listenport) + opts.streampath +
        " | Clients: " + to_string(clients.load()));
}

static MHDResult answer_to_connection(
    void *cls, struct MHD_Connection *conn,
    const char *url, const char *method, const char *version,
    const char *upload_data, size_t *upload_data_size,
    void **con_cls)
{
    StreamServer::Internal *internal =
        static_cast<StreamServer::Internal*>(cls);

    if (internal) {
        return internal->answerConn(
            conn, url, method, version, upload_data, upload_data_size, con_cls);
    } else {
        return MHD_NO;
    }
}

static MHDResult queueEmpty(struct MHD_Connection *mhdconn, unsigned int code)
{
    struct MHD_Response *response =
        MHD_create_response_from_buffer(0, 0, MHD_RESPMEM_PERSISTENT);
    if (nullptr == response) {
        return MHD_NO;
    }
    MHDResult ret = MHD_queue_response(mhdconn, code, response);
    MHD_destroy_response(response);
    return ret;
}

MHDResult StreamServer::Internal::answerConn(
    struct MHD_Connection *mhdconn, const char *_url,
    const char *method, const char *version,
    const char *upload_data, size_t *upload_data_size,
    void **con_cls)
{
    const RelayOptions& opts = session.opts;

    if (nullptr == *con_cls) {
        // First call, look at method and url.
        if (strcmp("GET", method) && strcmp("HEAD", method)) {
            LOGERR("StreamServer::answerConn: method is not GET or HEAD\n");
            return MHD_NO;
        }
        if (opts.streampath != _url) {
            LOGDEB("StreamServer::answerConn: not found: " << _url << endl);
            return queueEmpty(mhdconn, MHD_HTTP_NOT_FOUND);
        }
        ClientSinkP sink = relay.addSink();
        if (!sink) {
            return queueEmpty(mhdconn, MHD_HTTP_SERVICE_UNAVAILABLE);
        }

        // Push each chunk out as soon as we get it
        const union MHD_ConnectionInfo *cinf =
            MHD_get_connection_info(mhdconn, MHD_CONNECTION_INFO_CONNECTION_FD);
        if (nullptr == cinf) {
            LOGERR("StreamServer::answerConn: can't get connection fd\n");
        } else {
            int one = 1;
            if (setsockopt(cinf->connect_fd, IPPROTO_TCP, TCP_NODELAY,
                           &one, sizeof(one)) < 0) {
                LOGSYSERR("StreamServer::answerConn", "setsockopt",
                          "TCP_NODELAY");
            }
        }

        int timeoutms = opts.clienttimeoutms > 0 ? opts.clienttimeoutms : -1;
        *con_cls = new SinkReader(relay, sink, timeoutms);
        clients++;
        LOGINF("StreamServer: new client, " << clients << " connected\n");
        statusUpdate();
        return MHD_YES;
    }

    // Second call for this request.
    SinkReader *reader = static_cast<SinkReader*>(*con_cls);
    // The block size seems to be ignored by libmicrohttpd
    struct MHD_Response *response =
        MHD_create_response_from_callback(MHD_SIZE_UNKNOWN, 4096,
                                          content_reader_cb, reader, nullptr);
    if (response == NULL) {
        LOGERR("StreamServer::answerConn: could not create response" << endl);
        return MHD_NO;
    }
    MHD_add_response_header(response, "Content-Type",
                            opts.contenttype.c_str());
    MHD_add_response_header(response, "Cache-Control", "no-cache");
    MHDResult ret = MHD_queue_response(mhdconn, MHD_HTTP_OK, response);
    MHD_destroy_response(response);
    return ret;
}

static void
request_completed_callback(
    void *cls, struct MHD_Connection *conn,
    void **con_cls, enum MHD_RequestTerminationCode toe)
{
    // We get this even if the answer callback returned MHD_NO. Check
    // con_cls and do nothing if it's not set.
    if (cls && *con_cls) {
        StreamServer::Internal *internal =
            static_cast<StreamServer::Internal*>(cls);
        return internal->requestCompleted(conn, con_cls, toe);
    }
}

void StreamServer::Internal::requestCompleted(
    struct MHD_Connection *conn,
    void **con_cls, enum MHD_RequestTerminationCode toe)
{
    LOGDEB("StreamServer::requestCompleted: status " << int(toe) << endl);
    if (*con_cls) {
        SinkReader *reader = static_cast<SinkReader*>(*con_cls);
        delete reader;
        *con_cls = nullptr;
        clients--;
        LOGINF("StreamServer: client gone, " << clients << " connected\n");
        if (!session.shuttingDown()) {
            statusUpdate();
        }
    }
}

void StreamServer::Internal::bindListen()
{
    int port = session.opts.streamport;
    sock = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        LOGSYSERR("StreamServer::bindListen", "socket", "");
        throw TaskError(ERR_FEATURE, string("Stream server: socket failed: ") +
                        strerror(errno), "Stream: Server Failed");
    }
    int one = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
        LOGSYSERR("StreamServer::bindListen", "setsockopt", "SO_REUSEADDR");
    }
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (::bind(sock, (struct sockaddr *)&addr, sizeof(addr)) < 0 ||
        listen(sock, 32) < 0) {
        int err = errno;
        LOGSYSERR("StreamServer::bindListen", "bind/listen", port);
        close(sock);
        sock = -1;
        if (err == EADDRINUSE) {
            throw TaskError(ERR_FEATURE, string("Fatal: Port ") +
                            to_string(port) +
                            " already in use. Streaming disabled.",
                            string("Stream Err: Port ") + to_string(port) +
                            " in use");
        }
        throw TaskError(ERR_FEATURE, string("Stream server: can't listen on "
                                            "port ") + to_string(port) + ": " +
                        strerror(err), "Stream: Server Failed");
    }
    socklen_t len = sizeof(addr);
    if (getsockname(sock, (struct sockaddr *)&addr, &len) == 0) {
        listenport = ntohs(addr.sin_port);
    } else {
        listenport = port;
    }
}

void StreamServer::Internal::startMHD()
{
    mhd = MHD_start_daemon(
        MHD_USE_THREAD_PER_CONNECTION|MHD_USE_SELECT_INTERNALLY|MHD_USE_DEBUG,
        listenport,
        /* Accept policy callback and arg */
        nullptr, nullptr,
        /* handler and arg */
        &answer_to_connection, this,
        MHD_OPTION_NOTIFY_COMPLETED, request_completed_callback, this,
        MHD_OPTION_LISTEN_SOCKET, sock,
        MHD_OPTION_END);

    if (nullptr == mhd) {
        LOGERR("StreamServer: MHD_start_daemon failed\n");
        close(sock);
        sock = -1;
        throw TaskError(ERR_FEATURE, "Stream server: could not start HTTP "
                        "daemon.", "Stream: Server Failed");
    }
    LOGINF("StreamServer: listening on port " << listenport << endl);
}

void StreamServer::Internal::stopMHD()
{
    if (mhd) {
        // The daemon joins the connection threads: wake them up first.
        relay.terminateSinks();
        // This also closes the listening socket
        MHD_stop_daemon(mhd);
        mhd = nullptr;
        sock = -1;
    } else if (sock >= 0) {
        close(sock);
        sock = -1;
    }
}

void StreamServer::start()
{
    unique_lock<mutex> lock(m->mmutex);
    if (m->mhd) {
        return;
    }
    m->bindListen();
    m->startMHD();
    m->statusUpdate();
}

void StreamServer::stop()
{
    unique_lock<mutex> lock(m->mmutex);
    if (nullptr == m->mhd) {
        return;
    }
    m->stopMHD();
    m->session.updates.streamStatus("Stream: Stopped");
}

void StreamServer::run()
{
    Session& session = m->session;
    start();
    while (!session.shuttingDown() && session.streaming) {
        session.exitsig.waitFor(session.opts.monitorpollms);
    }
    LOGDEB("StreamServer::run: " << (session.shuttingDown() ? "shutdown" :
                                     "streaming disabled") << endl);
    stop();
}
