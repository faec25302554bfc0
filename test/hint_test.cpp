/*****************************************************************************
Copyright 2014 Laboratory for Advanced Computing at the University of Chicago

    This file is part of myshell, being tests of the marker recognizer

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
#include <string.h>

#include <string>

#include <gtest/gtest.h>

#include "hint.h"

static hint_t recognize(const char* s)
{
    return try_recognize_hint(s, strlen(s));
}

TEST(TryRecognizeHint, ExactMarkers)
{
    EXPECT_EQ(HINT_DOWNLOAD, recognize("__DOWNLOAD_START"));
    EXPECT_EQ(HINT_UPLOAD, recognize("__UPLOAD_START"));
    EXPECT_EQ(HINT_END, recognize("__TRANSFER_END"));
}

TEST(TryRecognizeHint, PlainTextIsNotAHint)
{
    EXPECT_EQ(HINT_NONE, recognize(""));
    EXPECT_EQ(HINT_NONE, recognize("ls -l"));
    EXPECT_EQ(HINT_NONE, recognize("__DOWNLOAD_STAR"));
    EXPECT_EQ(HINT_NONE, recognize("__download_start"));
    EXPECT_EQ(HINT_NONE, recognize(" __UPLOAD_START"));
}

TEST(TryRecognizeHint, MarkerAtStartOfLongerRead)
{
    EXPECT_EQ(HINT_UPLOAD, recognize("__UPLOAD_STARTsome/path"));
}

TEST(HintKeyword, NamesEveryHint)
{
    EXPECT_STREQ(DOWNLOAD_KEYWORD, hint_keyword(HINT_DOWNLOAD));
    EXPECT_STREQ(UPLOAD_KEYWORD, hint_keyword(HINT_UPLOAD));
    EXPECT_STREQ(TRANSFER_END_KEYWORD, hint_keyword(HINT_END));
    EXPECT_STREQ("", hint_keyword(HINT_NONE));
}

TEST(HintScanner, TextPassesThrough)
{
    HintScanner scanner;
    std::string text;

    EXPECT_EQ(HINT_NONE, scanner.scan("total 3\n", 8, text));
    EXPECT_EQ("total 3\n", text);
    EXPECT_EQ(0, scanner.held_back());
}

TEST(HintScanner, TextBeforeMarkerIsKept)
{
    HintScanner scanner;
    std::string text;
    const char* data = "$home> __DOWNLOAD_START";

    EXPECT_EQ(HINT_DOWNLOAD, scanner.scan(data, strlen(data), text));
    EXPECT_EQ("$home> ", text);
}

TEST(HintScanner, MarkerSplitAcrossReads)
{
    HintScanner scanner;
    std::string text;

    EXPECT_EQ(HINT_NONE, scanner.scan("done\n__DOWN", 11, text));
    EXPECT_EQ("done\n", text);
    EXPECT_EQ(6, scanner.held_back());

    EXPECT_EQ(HINT_DOWNLOAD, scanner.scan("LOAD_START", 10, text));
    EXPECT_EQ("done\n", text);
    EXPECT_EQ(0, scanner.held_back());
}

TEST(HintScanner, MarkerOneByteAtATime)
{
    HintScanner scanner;
    std::string text;
    const char* marker = TRANSFER_END_KEYWORD;
    size_t len = strlen(marker);

    for ( size_t i = 0; i + 1 < len; i++ ) {
        ASSERT_EQ(HINT_NONE, scanner.scan(marker + i, 1, text));
    }
    EXPECT_EQ(HINT_END, scanner.scan(marker + len - 1, 1, text));
    EXPECT_TRUE(text.empty());
}

TEST(HintScanner, HeldPrefixThatNeverCompletesIsText)
{
    HintScanner scanner;
    std::string text;

    EXPECT_EQ(HINT_NONE, scanner.scan("a__UP", 5, text));
    EXPECT_EQ("a", text);

    EXPECT_EQ(HINT_NONE, scanner.scan("side down\n", 10, text));
    EXPECT_EQ("a__UPside down\n", text);
}

TEST(HintScanner, FlushReleasesHeldBytes)
{
    HintScanner scanner;
    std::string text;

    EXPECT_EQ(HINT_NONE, scanner.scan("bye __", 6, text));
    EXPECT_EQ("bye ", text);

    scanner.flush(text);
    EXPECT_EQ("bye __", text);
    EXPECT_EQ(0, scanner.held_back());
}

TEST(HintScanner, BytesAfterMarkerWaitForNextScan)
{
    HintScanner scanner;
    std::string text;
    const char* data = "__TRANSFER_ENDexit\n";

    EXPECT_EQ(HINT_END, scanner.scan(data, strlen(data), text));
    EXPECT_TRUE(text.empty());
    EXPECT_EQ(5, scanner.held_back());

    scanner.flush(text);
    EXPECT_EQ("exit\n", text);
}

TEST(HintScanner, SecondMarkerFoundOnNextScan)
{
    HintScanner scanner;
    std::string text;
    const char* data = "__TRANSFER_END__DOWNLOAD_START";

    EXPECT_EQ(HINT_END, scanner.scan(data, strlen(data), text));
    EXPECT_EQ(HINT_DOWNLOAD, scanner.scan("", 0, text));
    EXPECT_TRUE(text.empty());
}
