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

#include <signal.h>
#include <sys/wait.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "execmd.h"
#include "session.hxx"
#include "testutil.h"
#include "updates.hxx"

using namespace std;

TEST(SessionTest, FeatureFlags)
{
    UpdateBus updates;
    RelayOptions opts;
    {
        Session session(opts, updates);
        EXPECT_TRUE(session.playback);
        EXPECT_FALSE(session.streaming);
        EXPECT_FALSE(session.disableStreaming());
    }
    opts.restreamonly = true;
    Session session(opts, updates);
    EXPECT_FALSE(session.playback);
    EXPECT_TRUE(session.streaming);
    EXPECT_TRUE(session.disableStreaming());
    EXPECT_FALSE(session.disableStreaming());
    EXPECT_FALSE(session.streaming);
}

TEST(SessionTest, TranscoderHandoff)
{
    UpdateBus updates;
    RelayOptions opts;
    opts.streaming = true;
    Session session(opts, updates);
    shared_ptr<ExecCmd> none;
    EXPECT_FALSE(session.waitTranscoder(none, 50));

    shared_ptr<ExecCmd> cmd(new ExecCmd("first"));
    std::thread setter([&session, cmd] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            session.setTranscoder(cmd);
        });
    EXPECT_EQ(cmd, session.waitTranscoder(none, 5000));
    setter.join();
    // Same one again: nothing new
    EXPECT_FALSE(session.waitTranscoder(cmd, 50));

    // Shutdown wakes up the waiter
    std::thread exiter([&session] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            session.requestExit();
        });
    Chrono chron;
    EXPECT_FALSE(session.waitTranscoder(cmd, 10000));
    EXPECT_LT(chron.millis(), 5000);
    exiter.join();
}

TEST(SessionTest, KillAllKillsStubbornProcesses)
{
    UpdateBus updates;
    RelayOptions opts;
    Session session(opts, updates);

    shared_ptr<ExecCmd> stubborn(new ExecCmd("stubborn"));
    vector<string> args{"sh", "-c", "trap '' TERM; exec sleep 30"};
    ASSERT_EQ(ExecCmd::EXEC_OK, stubborn->startExec(args));
    session.registerProcess(stubborn);
    shared_ptr<ExecCmd> quick(new ExecCmd("true"));
    ASSERT_EQ(ExecCmd::EXEC_OK, quick->startExec(vector<string>{"true"}));
    session.registerProcess(quick);
    int status;
    ASSERT_TRUE(waitFor([&quick, &status] {
                return quick->maybereap(&status);
            }, 5000));

    // Let the shell set up the trap before asking politely
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    stubborn->terminate();
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(stubborn->maybereap(&status));

    EXPECT_EQ(1, session.killAll());
    ASSERT_TRUE(waitFor([&stubborn, &status] {
                return stubborn->maybereap(&status);
            }, 5000));
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(SIGKILL, WTERMSIG(status));
    EXPECT_EQ(0, session.killAll());
}
