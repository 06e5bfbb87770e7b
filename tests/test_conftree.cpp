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

#include <sstream>

#include "conftree.h"

using namespace std;

TEST(ConfSimpleTest, ParsesNamesValuesAndComments)
{
    istringstream input(
        "# fmdxrelay configuration\n"
        "server = fmdx.example.org:8073\n"
        "  stream=1\n"
        "streamport = 8090 \n"
        "transcodercmd = ffmpeg -i - \\\n"
        "   -f adts -\n"
        "\n"
        "[other]\n"
        "server = elsewhere\n");
    ConfSimple conf(input);
    ASSERT_TRUE(conf.ok());

    string value;
    ASSERT_TRUE(conf.get("server", value));
    EXPECT_EQ("fmdx.example.org:8073", value);
    ASSERT_TRUE(conf.get("server", value, "other"));
    EXPECT_EQ("elsewhere", value);
    ASSERT_TRUE(conf.get("transcodercmd", value));
    EXPECT_NE(string::npos, value.find("-f adts -"));
    EXPECT_FALSE(conf.get("nosuchname", value));

    EXPECT_TRUE(confBool(conf, "stream", false));
    EXPECT_FALSE(confBool(conf, "restreamonly", false));
    EXPECT_EQ(8090, confInt(conf, "streamport", 8080));
    EXPECT_EQ(10, confInt(conf, "sinksize", 10));
}

TEST(ConfSimpleTest, MissingFileIsAnError)
{
    ConfSimple conf("/nonexistent/fmdxrelay.conf");
    EXPECT_FALSE(conf.ok());
}

TEST(ConfSimpleTest, EmptyNameGivesEmptyConfig)
{
    ConfSimple conf(string(""));
    EXPECT_TRUE(conf.ok());
    EXPECT_TRUE(conf.getNames("").empty());
}
