/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "RoffParseImpl.h"

namespace rpm = roff_parseman::impl;
using words_t = std::vector<std::string>;

namespace {
	TEST(RoffPMLexical, SplitsBareAndQuotedWords) {
		EXPECT_EQ(rpm::splitRequest("TH LS 1 \"2024-01-01\" \"GNU coreutils\""),
			(words_t{ "TH", "LS", "1", "2024-01-01", "GNU coreutils" }));
		EXPECT_EQ(rpm::splitRequest("BR ls (1) ,"), (words_t{ "BR", "ls", "(1)", "," }));
	}

	TEST(RoffPMLexical, KeepsEmptyQuotedWords) {
		EXPECT_EQ(rpm::splitRequest("IP \"\" 4"), (words_t{ "IP", "", "4" }));
	}

	TEST(RoffPMLexical, EscapedSpaceStaysInsideWord) {
		EXPECT_EQ(rpm::splitRequest("B file\\ name"), (words_t{ "B", "file name" }));
	}

	TEST(RoffPMLexical, UnterminatedQuoteRunsToEndOfLine) {
		EXPECT_EQ(rpm::splitRequest("SH \"unterminated heading"), (words_t{ "SH", "unterminated heading" }));
	}

	TEST(RoffPMLexical, QuoteDirectlyFollowedByWord) {
		EXPECT_EQ(rpm::splitRequest("BR \"a b\"c"), (words_t{ "BR", "a b", "c" }));
	}

	TEST(RoffPMLexical, BlankLineHasNoWords) {
		EXPECT_TRUE(rpm::splitRequest("").empty());
		EXPECT_TRUE(rpm::splitRequest("   \t ").empty());
	}

	TEST(RoffPMLexical, EscapesOtherThanSpaceArePreserved) {
		EXPECT_EQ(rpm::splitRequest("IP \\(bu 2"), (words_t{ "IP", "\\(bu", "2" }));
	}
}
