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

#include <thread>

#include "bufxchange.h"
#include "chrono.h"

using namespace std;

TEST(BufXChangeTest, TryPutRefusesWhenFull)
{
    BufXChange<int> q("test", 2);
    EXPECT_TRUE(q.tryPut(1));
    EXPECT_TRUE(q.tryPut(2));
    EXPECT_FALSE(q.tryPut(3));
    int v;
    ASSERT_TRUE(q.tryTake(&v));
    EXPECT_EQ(1, v);
    ASSERT_TRUE(q.tryTake(&v));
    EXPECT_EQ(2, v);
    EXPECT_FALSE(q.tryTake(&v));
}

TEST(BufXChangeTest, EvictOldestKeepsNewest)
{
    BufXChange<int> q("test", 3);
    size_t evicted = 99;
    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(q.putEvictOldest(i, &evicted));
        EXPECT_EQ(0u, evicted);
    }
    ASSERT_TRUE(q.putEvictOldest(3, &evicted));
    EXPECT_EQ(1u, evicted);
    ASSERT_TRUE(q.putEvictOldest(4));
    EXPECT_EQ(3u, q.qsize());
    EXPECT_EQ(2u, q.evictions());
    int v;
    for (int expected = 2; expected <= 4; expected++) {
        ASSERT_TRUE(q.tryTake(&v));
        EXPECT_EQ(expected, v);
    }
}

TEST(BufXChangeTest, TakeTimesOut)
{
    BufXChange<int> q("test", 0);
    int v;
    Chrono chron;
    EXPECT_FALSE(q.take(&v, 100));
    EXPECT_GE(chron.millis(), 90);
}

TEST(BufXChangeTest, TakeWaitsForProducer)
{
    BufXChange<int> q("test", 0);
    thread producer([&q] {
            this_thread::sleep_for(chrono::milliseconds(50));
            q.tryPut(42);
        });
    int v = 0;
    EXPECT_TRUE(q.take(&v, 5000));
    EXPECT_EQ(42, v);
    producer.join();
}

TEST(BufXChangeTest, TerminateWakesConsumer)
{
    BufXChange<int> q("test", 0);
    thread killer([&q] {
            this_thread::sleep_for(chrono::milliseconds(50));
            q.setTerminate();
        });
    int v;
    Chrono chron;
    EXPECT_FALSE(q.take(&v));
    EXPECT_LT(chron.millis(), 5000);
    killer.join();
    EXPECT_TRUE(q.terminated());
    EXPECT_FALSE(q.tryPut(1));
    EXPECT_FALSE(q.putEvictOldest(1));
}

TEST(BufXChangeTest, DrainAndReset)
{
    BufXChange<int> q("test", 5);
    q.tryPut(1);
    q.tryPut(2);
    EXPECT_EQ(2u, q.drain());
    EXPECT_EQ(0u, q.qsize());
    q.setTerminate();
    q.reset();
    EXPECT_FALSE(q.terminated());
    EXPECT_TRUE(q.tryPut(3));
}
