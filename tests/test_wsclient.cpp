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

#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "exitsignal.h"
#include "testutil.h"
#include "wsclient.hxx"
#include "wstestserver.h"

using namespace std;

TEST(WsClientTest, ParseUri)
{
    bool secure;
    string host, path;
    int port;
    ASSERT_TRUE(WsClient::parseUri("wss://example.org/text", &secure, &host,
                                   &port, &path));
    EXPECT_TRUE(secure);
    EXPECT_EQ("example.org", host);
    EXPECT_EQ(443, port);
    EXPECT_EQ("/text", path);
    ASSERT_TRUE(WsClient::parseUri("ws://[::1]:8073/audio?x=1", &secure,
                                   &host, &port, &path));
    EXPECT_FALSE(secure);
    EXPECT_EQ("[::1]", host);
    EXPECT_EQ(8073, port);
    EXPECT_EQ("/audio?x=1", path);
    EXPECT_FALSE(WsClient::parseUri("http://host/", 0, 0, 0, 0));
    EXPECT_FALSE(WsClient::parseUri("ws://host:99999/", 0, 0, 0, 0));
    EXPECT_FALSE(WsClient::parseUri("ws://user@host/", 0, 0, 0, 0));
    EXPECT_FALSE(WsClient::parseUri("ws://ho st/", 0, 0, 0, 0));
}

TEST(WsClientTest, Messages)
{
    WsTestServer server;
    WsClient conn(server.uri("/text"));
    ASSERT_EQ(WsClient::WS_OK, conn.open(5000));
    EXPECT_TRUE(conn.connected());
    ASSERT_TRUE(server.waitConnection("/text", 5000));

    ASSERT_EQ(WsClient::WS_OK, conn.sendText("T97500"));
    string text;
    ASSERT_TRUE(server.waitText("/text", text, 5000));
    EXPECT_EQ("T97500", text);

    ASSERT_TRUE(server.sendText("/text", "{\"ps\":\"X\"}"));
    WsClient::Message msg;
    ASSERT_EQ(WsClient::WS_OK, conn.recv(msg, 5000));
    EXPECT_EQ(WsClient::OP_TEXT, msg.opcode);
    EXPECT_EQ("{\"ps\":\"X\"}", msg.data);

    // Bigger than one read buffer
    string big(100000, 'x');
    big[0] = 'a';
    big[big.size() - 1] = 'z';
    ASSERT_TRUE(server.sendBinary("/text", big));
    ASSERT_EQ(WsClient::WS_OK, conn.recv(msg, 5000));
    EXPECT_EQ(WsClient::OP_BINARY, msg.opcode);
    EXPECT_EQ(big, msg.data);

    conn.close();
    EXPECT_EQ(WsClient::WS_DISCONNECTED, conn.state());
    EXPECT_EQ(WsClient::WS_CLOSED, conn.sendText("late"));
}

TEST(WsClientTest, PingGetsPong)
{
    WsTestServer server;
    WsClient conn(server.uri("/audio"));
    ASSERT_EQ(WsClient::WS_OK, conn.open(5000));
    ASSERT_EQ(WsClient::WS_OK, conn.sendPing());
    WsClient::Message msg;
    ASSERT_EQ(WsClient::WS_OK, conn.recv(msg, 5000));
    EXPECT_EQ(WsClient::OP_PONG, msg.opcode);
    EXPECT_EQ(1, server.pingCount("/audio"));

    server.setSilent("/audio", true);
    ASSERT_EQ(WsClient::WS_OK, conn.sendPing());
    EXPECT_EQ(WsClient::WS_TIMEOUT, conn.recv(msg, 300));
    EXPECT_TRUE(waitFor([&server] {return server.pingCount("/audio") == 2;},
                        5000));
}

TEST(WsClientTest, PeerClose)
{
    WsTestServer server;
    WsClient conn(server.uri("/text"));
    ASSERT_EQ(WsClient::WS_OK, conn.open(5000));
    ASSERT_TRUE(server.waitConnection("/text", 5000));
    server.closeAll("/text");
    WsClient::Message msg;
    EXPECT_EQ(WsClient::WS_CLOSED, conn.recv(msg, 5000));
    EXPECT_EQ(1000, conn.closeCode());
    EXPECT_FALSE(conn.connected());
}

TEST(WsClientTest, RecvWakesUpOnExitSignal)
{
    WsTestServer server;
    WsClient conn(server.uri("/text"));
    ASSERT_EQ(WsClient::WS_OK, conn.open(5000));
    ExitSignal sig;
    std::thread setter([&sig] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            sig.set();
        });
    WsClient::Message msg;
    Chrono chron;
    EXPECT_EQ(WsClient::WS_CANCELLED, conn.recv(msg, 10000, &sig));
    EXPECT_LT(chron.millis(), 5000);
    setter.join();
}

TEST(WsClientTest, BadUriAndRefused)
{
    WsClient bad("not a uri");
    EXPECT_EQ(WsClient::WS_BADURI, bad.open(1000));

    int port;
    {
        WsTestServer server;
        port = server.port();
    }
    WsClient refused(string("ws://127.0.0.1:") + to_string(port) + "/text");
    EXPECT_EQ(WsClient::WS_REFUSED, refused.open(5000));
    EXPECT_EQ(WsClient::WS_DISCONNECTED, refused.state());
}
