/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being tests of the progress reporter

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions
and limitations under the License.
*****************************************************************************/
#include <unistd.h>

#include <string>

#include <gtest/gtest.h>

#include "progress.h"
#include "util.h"

#define MS  1000000LL
#define SEC (1000 * MS)

TEST(HumanReadable, ByteCounts)
{
    EXPECT_EQ("0 B", human_readable_byte_count(0));
    EXPECT_EQ("1023 B", human_readable_byte_count(1023));
    EXPECT_EQ("1.0 KiB", human_readable_byte_count(1024));
    EXPECT_EQ("1.5 KiB", human_readable_byte_count(1536));
    EXPECT_EQ("2.0 MiB", human_readable_byte_count(2 * 1024 * 1024));
    EXPECT_EQ("3.0 GiB", human_readable_byte_count(3LL * 1024 * 1024 * 1024));
}

TEST(HumanReadable, Durations)
{
    EXPECT_EQ("500 ns", human_readable_time(500));
    EXPECT_EQ("2 ms", human_readable_time(2500000));
    EXPECT_EQ("350 ms", human_readable_time(350 * MS));
    EXPECT_EQ("4 s", human_readable_time(4 * SEC + 200 * MS));
    EXPECT_EQ("2 min 5 s", human_readable_time(125 * SEC));
    EXPECT_EQ("1 hr 3 min", human_readable_time(3780 * SEC));
    EXPECT_EQ("1 min", human_readable_time(60 * SEC + 300 * MS));
    EXPECT_EQ("0 ns", human_readable_time(-5));
}

TEST(GetScale, PicksDecimalUnits)
{
    char label[8];

    EXPECT_EQ(SIZE_B, get_scale(999, label));
    EXPECT_STREQ("B", label);
    EXPECT_EQ(SIZE_MB, get_scale(5000000, label));
    EXPECT_STREQ("MB", label);
}

TEST(Progress, ReportWithoutRecentBytesHasNoEstimate)
{
    Progress progress(NULL, 1000, 0);

    std::string line = progress.report();
    EXPECT_NE(std::string::npos, line.find(" 0% processed (0 B/1000 B)")) << line;
    EXPECT_NE(std::string::npos, line.find("Estimated time: unknown")) << line;
}

TEST(Progress, ReportCountsBytes)
{
    Progress progress(NULL, 1000, 0);

    usleep(1000);
    progress.add(500);
    EXPECT_EQ(500, progress.get_current());

    std::string line = progress.report();
    EXPECT_NE(std::string::npos, line.find("50% processed (500 B/1000 B)")) << line;
    EXPECT_EQ(std::string::npos, line.find("Estimated time: unknown")) << line;

    // the recent window starts over after each report
    line = progress.report();
    EXPECT_NE(std::string::npos, line.find("Current speed: 0 B/s")) << line;
}

TEST(Progress, StopIsIdempotent)
{
    Progress progress(NULL, 100, 0);

    // before start
    progress.stop();
    EXPECT_FALSE(progress.is_running());

    ASSERT_EQ(RET_SUCCESS, progress.start());
    EXPECT_TRUE(progress.is_running());

    progress.stop();
    progress.stop();
    EXPECT_FALSE(progress.is_running());
}

TEST(Progress, AutoStopAtTotal)
{
    Progress progress(NULL, 100, 1);

    ASSERT_EQ(RET_SUCCESS, progress.start());
    progress.add(40);
    EXPECT_TRUE(progress.is_running());

    progress.add(60);
    EXPECT_FALSE(progress.is_running());
}

TEST(Progress, WithoutAutoStopKeepsRunning)
{
    Progress progress(NULL, 10, 0);

    ASSERT_EQ(RET_SUCCESS, progress.start());
    progress.add(10);
    EXPECT_TRUE(progress.is_running());
    // destructor joins the timer thread
}
