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
#include <gtest/gtest.h>
#include "RoffParseImpl.h"

namespace rpm = roff_parseman::impl;

namespace {
	TEST(RoffPMFragments, FirstUseIsUnqualified) {
		rpm::FragmentRegistry registry{};
		EXPECT_EQ(registry.allocate("NAME"), "NAME");
		EXPECT_EQ(registry.allocate("NAME"), "NAME_2");
		EXPECT_EQ(registry.allocate("NAME"), "NAME_3");
		EXPECT_EQ(registry.size(), 3u);
		EXPECT_TRUE(registry.contains("NAME_2"));
	}

	TEST(RoffPMFragments, SuffixSkipsTakenKeys) {
		rpm::FragmentRegistry registry{};
		EXPECT_EQ(registry.allocate("A_2"), "A_2");
		EXPECT_EQ(registry.allocate("A"), "A");
		EXPECT_EQ(registry.allocate("A"), "A_3");
	}

	TEST(RoffPMFragments, NormalizeStripsMarkupAndCollapsesSpace) {
		EXPECT_EQ(rpm::FragmentRegistry::normalize("  SEE   ALSO "), "SEE_ALSO");
		EXPECT_EQ(rpm::FragmentRegistry::normalize("<b>\"quoted\" name</b>"), "quoted_name");
		EXPECT_EQ(rpm::FragmentRegistry::normalize("a\tb"), "a_b");
	}

	TEST(RoffPMFragments, KeysAreDistinctAfterNormalizing) {
		rpm::FragmentRegistry registry{};
		EXPECT_EQ(registry.allocate("SEE ALSO"), "SEE_ALSO");
		EXPECT_EQ(registry.allocate("<i>SEE</i> ALSO"), "SEE_ALSO_2");
	}
}
