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

#include "chrono.h"
#include "exitsignal.h"
#include "fmdxutils.hxx"

#include <thread>

using namespace std;

TEST(FrequencyTest, ParsesDotAndCommaDecimals)
{
    int khz = 0;
    ASSERT_TRUE(mhzToKhz("97.3", &khz));
    EXPECT_EQ(97300, khz);
    ASSERT_TRUE(mhzToKhz("97,3", &khz));
    EXPECT_EQ(97300, khz);
    ASSERT_TRUE(mhzToKhz(" 97.300 ", &khz));
    EXPECT_EQ(97300, khz);
    ASSERT_TRUE(mhzToKhz("87.5", &khz));
    EXPECT_EQ(87500, khz);
    ASSERT_TRUE(mhzToKhz("108", &khz));
    EXPECT_EQ(108000, khz);
}

TEST(FrequencyTest, RejectsOutOfBand)
{
    int khz = 12345;
    EXPECT_FALSE(mhzToKhz("86.9", &khz));
    EXPECT_FALSE(mhzToKhz("108.1", &khz));
    EXPECT_FALSE(mhzToKhz("0", &khz));
    EXPECT_EQ(12345, khz);
}

TEST(FrequencyTest, RejectsNonNumeric)
{
    int khz;
    EXPECT_FALSE(mhzToKhz("", &khz));
    EXPECT_FALSE(mhzToKhz("abc", &khz));
    EXPECT_FALSE(mhzToKhz("97.3MHz", &khz));
    EXPECT_FALSE(mhzToKhz("0x60", &khz));
    EXPECT_FALSE(mhzToKhz("nan", &khz));
    EXPECT_FALSE(mhzToKhz("97..3", &khz));
}

TEST(FrequencyTest, FormatsAndClamps)
{
    EXPECT_EQ("97.300", khzToMHzString(97300));
    EXPECT_EQ("108.000", khzToMHzString(108000));
    EXPECT_EQ("T97500", tuneCommandText(97500));
    EXPECT_EQ(FREQ_MIN_KHZ, clampKhz(87400));
    EXPECT_EQ(FREQ_MAX_KHZ, clampKhz(108100));
    EXPECT_EQ(100000, clampKhz(100000));
    EXPECT_TRUE(khzInBand(87500));
    EXPECT_FALSE(khzInBand(108001));
}

TEST(WsUriTest, PlainHost)
{
    string audio, text;
    ASSERT_TRUE(buildWsUris("fmdx.example.org", audio, text));
    EXPECT_EQ("ws://fmdx.example.org:80/audio", audio);
    EXPECT_EQ("ws://fmdx.example.org:80/text", text);
}

TEST(WsUriTest, SchemesAndPorts)
{
    string audio, text;
    ASSERT_TRUE(buildWsUris("https://fmdx.example.org/", audio, text));
    EXPECT_EQ("wss://fmdx.example.org:443/audio", audio);
    ASSERT_TRUE(buildWsUris("http://192.168.1.10:8073", audio, text));
    EXPECT_EQ("ws://192.168.1.10:8073/text", text);
    ASSERT_TRUE(buildWsUris("wss://host:9000/some/path", audio, text));
    EXPECT_EQ("wss://host:9000/audio", audio);
    ASSERT_TRUE(buildWsUris("[::1]:8080", audio, text));
    EXPECT_EQ("ws://[::1]:8080/text", text);
}

TEST(WsUriTest, NoHost)
{
    string audio, text;
    EXPECT_FALSE(buildWsUris("", audio, text));
    EXPECT_FALSE(buildWsUris("http://", audio, text));
    EXPECT_FALSE(buildWsUris("[::1", audio, text));
}

TEST(StringUtilsTest, Misc)
{
    string s("  a b \r\n");
    trimstring(s);
    EXPECT_EQ("a b", s);
    EXPECT_EQ("abc", stringtolower("AbC"));
    EXPECT_TRUE(stringToBool("yes"));
    EXPECT_TRUE(stringToBool("1"));
    EXPECT_FALSE(stringToBool("0"));
    EXPECT_EQ("abcdefg", truncateText("abcdefg", 7));
    EXPECT_EQ("abcd...", truncateText("abcdefghij", 7));

    vector<string> tokens;
    stringToStrings("ffmpeg -i \"a file\" -", tokens);
    ASSERT_EQ(4u, tokens.size());
    EXPECT_EQ("a file", tokens[2]);
}

TEST(ReconnectPacerTest, FirstAttemptIsImmediate)
{
    ExitSignal sig;
    ReconnectPacer pacer(5000);
    EXPECT_EQ(0, pacer.delayms());
    Chrono chron;
    ASSERT_TRUE(pacer.waitNextAttempt(sig));
    EXPECT_LT(chron.millis(), 100);
    EXPECT_EQ(1, pacer.attempts());
}

TEST(ReconnectPacerTest, IntervalCountsFromAttemptStart)
{
    ExitSignal sig;
    ReconnectPacer pacer(300);
    ASSERT_TRUE(pacer.waitNextAttempt(sig));
    Chrono chron;
    // A slow failure eats part of the interval
    sig.waitFor(200);
    ASSERT_TRUE(pacer.waitNextAttempt(sig));
    long elapsed = chron.millis();
    EXPECT_GE(elapsed, 290);
    EXPECT_LT(elapsed, 600);

    Chrono chron1;
    ASSERT_TRUE(pacer.waitNextAttempt(sig));
    EXPECT_GE(chron1.millis(), 290);
}

TEST(ReconnectPacerTest, ExitSignalInterruptsWait)
{
    ExitSignal sig;
    ReconnectPacer pacer(10000);
    ASSERT_TRUE(pacer.waitNextAttempt(sig));
    std::thread setter([&sig] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            sig.set();
        });
    Chrono chron;
    EXPECT_FALSE(pacer.waitNextAttempt(sig));
    EXPECT_LT(chron.millis(), 2000);
    setter.join();
}
