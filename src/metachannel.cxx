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

#include "metachannel.hxx"

#include <sstream>

#include <json/json.h>

#include "chrono.h"
#include "fmdxutils.hxx"
#include "log.h"
#include "session.hxx"
#include "taskerror.hxx"
#include "updates.hxx"
#include "wsclient.hxx"

using namespace std;

MetaChannel::MetaChannel(Session& session)
    : m_session(session)
{
}

MetaChannel::~MetaChannel()
{
}

void MetaChannel::setConnection(shared_ptr<WsClient> conn)
{
    unique_lock<mutex> lock(m_connmutex);
    m_conn = conn;
}

bool MetaChannel::connected()
{
    unique_lock<mutex> lock(m_connmutex);
    return m_conn && m_conn->connected();
}

MetaChannel::TuneResult MetaChannel::sendTune(int khz)
{
    // Holding the lock while sending: the receive thread can't
    // release the connection under us.
    unique_lock<mutex> lock(m_connmutex);
    if (!m_conn || !m_conn->connected()) {
        return TUNE_NOTCONNECTED;
    }
    WsClient::Status st = m_conn->sendText(tuneCommandText(khz));
    if (st != WsClient::WS_OK) {
        LOGERR("MetaChannel::sendTune: send failed: " <<
               m_conn->getreason() << endl);
        return TUNE_FAILED;
    }
    LOGDEB("MetaChannel::sendTune: sent " << tuneCommandText(khz) << endl);
    return TUNE_SENT;
}

void MetaChannel::processMessage(const string& text)
{
    Json::Value decoded;
    try {
        istringstream input(text);
        input >> decoded;
    } catch (std::exception& e) {
        LOGERR("MetaChannel: Json decode failed for [" << text << "]: " <<
               e.what() << endl);
        m_session.updates.error("Invalid JSON received (Text WS).");
        return;
    }
    if (!decoded.isObject()) {
        LOGERR("MetaChannel: not a Json object: [" << text << "]\n");
        m_session.updates.error("Invalid JSON received (Text WS).");
        return;
    }

    m_session.updates.data(decoded);

    const Json::Value& freq = decoded["freq"];
    if (freq.isString() || freq.isNumeric()) {
        int khz;
        if (mhzToKhz(freq.asString(), &khz)) {
            m_session.updates.currentFrequency(khz);
        } else {
            LOGDEB("MetaChannel: bad frequency [" << freq.asString() << "]\n");
        }
    }
}

void MetaChannel::receiveLoop(WsClient& conn)
{
    const RelayOptions& opts = m_session.opts;
    UpdateBus& updates = m_session.updates;

    // Keepalive: ping at regular intervals, give up on the connection
    // if nothing comes back in time.
    Chrono pingchron;
    bool pingpending = false;
    for (;;) {
        long waitms = pingpending ? pingchron.remaining(opts.textpingtimeoutms)
            : pingchron.remaining(opts.textpingintervalms);
        if (waitms <= 0) {
            if (pingpending) {
                LOGINF("MetaChannel: keepalive timeout\n");
                updates.status("Text WS keepalive timeout.");
                return;
            }
            if (conn.sendPing() != WsClient::WS_OK) {
                updates.error(string("Text WS Error: ") + conn.getreason());
                return;
            }
            pingpending = true;
            pingchron.restart();
            continue;
        }

        WsClient::Message msg;
        WsClient::Status st = conn.recv(msg, int(waitms), &m_session.exitsig);
        switch (st) {
        case WsClient::WS_OK:
            if (pingpending) {
                // Anything coming in proves that the link is alive
                pingpending = false;
                pingchron.restart();
            }
            if (msg.opcode == WsClient::OP_TEXT) {
                processMessage(msg.data);
            } else if (msg.opcode == WsClient::OP_BINARY) {
                LOGDEB("MetaChannel: ignoring binary message\n");
            }
            break;
        case WsClient::WS_TIMEOUT:
            break;
        case WsClient::WS_CANCELLED:
            return;
        case WsClient::WS_CLOSED:
            updates.status(string("Text WS closed (Code: ") +
                           to_string(conn.closeCode()) + ", Reason: " +
                           conn.closeReason() + ")");
            return;
        default:
            updates.error(string("Text WS Error: ") + conn.getreason());
            return;
        }
    }
}

void MetaChannel::run()
{
    const RelayOptions& opts = m_session.opts;
    UpdateBus& updates = m_session.updates;
    ExitSignal& exitsig = m_session.exitsig;

    if (!WsClient::parseUri(opts.texturi, nullptr, nullptr, nullptr, nullptr)) {
        throw TaskError(ERR_FATAL, string("Fatal: Invalid Text WS URI: ") +
                        opts.texturi);
    }

    ReconnectPacer pacer(opts.reconnectdelayms);
    while (!exitsig.isSet()) {
        if (!pacer.waitNextAttempt(exitsig)) {
            break;
        }
        LOGDEB("MetaChannel: connecting to " << opts.texturi << endl);
        updates.status("Connecting Text WS...");
        shared_ptr<WsClient> conn(new WsClient(opts.texturi));
        WsClient::Status st = conn->open(opts.textopentimeoutms, &exitsig);
        if (st == WsClient::WS_CANCELLED) {
            break;
        }
        if (st == WsClient::WS_BADURI) {
            throw TaskError(ERR_FATAL, string("Fatal: Invalid Text WS URI: ") +
                            opts.texturi);
        }
        if (st != WsClient::WS_OK) {
            switch (st) {
            case WsClient::WS_REFUSED:
                updates.status("Text WS connection refused.");
                break;
            case WsClient::WS_TIMEOUT:
                updates.status("Text WS connection timeout.");
                break;
            default:
                updates.error(string("Text WS Error: ") + conn->getreason());
                break;
            }
            LOGINF("MetaChannel: connection to " << opts.texturi <<
                   " failed: " << conn->getreason() << endl);
            exitsig.waitFor(opts.settledelayms);
            continue;
        }

        LOGINF("MetaChannel: connected to " << opts.texturi << endl);
        updates.status("Text WS connected.");
        setConnection(conn);
        receiveLoop(*conn);
        // Withdraw the send capability before closing
        setConnection(shared_ptr<WsClient>());
        conn->close();

        if (exitsig.isSet()) {
            break;
        }
        updates.status("Text WS disconnected. Retrying...");
        exitsig.waitFor(opts.settledelayms);
    }
    setConnection(shared_ptr<WsClient>());
    LOGDEB("MetaChannel::run: done\n");
}
