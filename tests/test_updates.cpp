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

#include "updates.hxx"

using namespace std;

TEST(UpdateBusTest, DropsWhenFull)
{
    UpdateBus bus(3);
    EXPECT_TRUE(bus.status("one"));
    EXPECT_TRUE(bus.status("two"));
    EXPECT_TRUE(bus.error("three"));
    EXPECT_FALSE(bus.status("four"));
    EXPECT_EQ(1u, bus.drops());

    UpdateEvent ev;
    ASSERT_TRUE(bus.take(&ev, 0));
    EXPECT_EQ(UpdateEvent::UPD_STATUS, ev.kind);
    EXPECT_EQ("one", ev.text);
}

TEST(UpdateBusTest, ClosedAlwaysGetsIn)
{
    UpdateBus bus(2);
    bus.status("one");
    bus.status("two");
    EXPECT_TRUE(bus.closed());
    UpdateEvent ev;
    ASSERT_TRUE(bus.take(&ev, 0));
    EXPECT_EQ("two", ev.text);
    ASSERT_TRUE(bus.take(&ev, 0));
    EXPECT_EQ(UpdateEvent::UPD_CLOSED, ev.kind);
    EXPECT_FALSE(bus.take(&ev, 0));
}

TEST(UpdateBusTest, TextIsTruncated)
{
    UpdateBus bus(10, 10);
    bus.error(string(50, 'x'));
    UpdateEvent ev;
    ASSERT_TRUE(bus.take(&ev, 0));
    EXPECT_EQ(10u, ev.text.size());
    EXPECT_EQ("xxxxxxx...", ev.text);
}

TEST(UpdateBusTest, TypedPayloads)
{
    UpdateBus bus;
    Json::Value rec;
    rec["ps"] = "RADIO1";
    bus.data(rec);
    bus.currentFrequency(97300);
    UpdateEvent ev;
    ASSERT_TRUE(bus.take(&ev, 0));
    EXPECT_EQ(UpdateEvent::UPD_DATA, ev.kind);
    EXPECT_EQ("RADIO1", ev.record["ps"].asString());
    ASSERT_TRUE(bus.take(&ev, 0));
    EXPECT_EQ(UpdateEvent::UPD_CURFREQ, ev.kind);
    EXPECT_EQ(97300, ev.khz);
}

TEST(RecordTest, Summary)
{
    Json::Value rec;
    rec["freq"] = "97.300";
    rec["pi"] = "F201";
    rec["ps"] = " RADIO1 ";
    rec["rt0"] = "Some text  ";
    rec["users"] = 3;
    EXPECT_EQ("[97.300] PI F201 PS 'RADIO1' RT0 'Some text' users 3",
              recordSummary(rec));
}

TEST(RecordTest, OddMemberTypes)
{
    Json::Value rec;
    rec["ps"]["a"] = 1;
    rec["rt0"].append(1);
    rec["rt1"] = Json::Value::null;
    rec["pi"] = true;
    EXPECT_EQ("", recordField(rec, "ps"));
    EXPECT_EQ("x", recordField(rec, "rt0", "x"));
    EXPECT_EQ("", recordField(rec, "rt1"));
    EXPECT_EQ("true", recordField(rec, "pi"));
    std::string line;
    EXPECT_NO_THROW(line = recordSummary(rec));
    EXPECT_EQ("[] PI true PS '' users N/A", line);

    Json::Value arr(Json::arrayValue);
    arr.append("ps");
    EXPECT_NO_THROW(line = recordSummary(arr));
    EXPECT_EQ("[] PI ---- PS '' users N/A", line);
}

TEST(CommandQueueTest, BoundedAndNonBlocking)
{
    CommandQueue q("commands", 2);
    EXPECT_TRUE(q.tryPut(TuneCommand::tune(97300)));
    EXPECT_TRUE(q.tryPut(TuneCommand::tune(97400)));
    EXPECT_FALSE(q.tryPut(TuneCommand::tune(97500)));
    TuneCommand cmd;
    ASSERT_TRUE(q.tryTake(&cmd));
    EXPECT_EQ(TuneCommand::CMD_TUNE, cmd.kind);
    EXPECT_EQ(97300, cmd.khz);
}
