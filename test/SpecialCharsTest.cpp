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
	TEST(RoffPMSpecials, NamedGlyphs) {
		EXPECT_EQ(rpm::translateSpecials("a \\(em b"), "a &mdash; b");
		EXPECT_EQ(rpm::translateSpecials("\\[co] 2024"), "&copy; 2024");
		EXPECT_EQ(rpm::translateSpecials("\\(*a\\(*b"), "&alpha;&beta;");
	}

	TEST(RoffPMSpecials, MinusBecomesEnDash) {
		EXPECT_EQ(rpm::translateSpecials("\\-v"), "&ndash;v");
	}

	TEST(RoffPMSpecials, UnicodeEscape) {
		EXPECT_EQ(rpm::translateSpecials("caf\\[u00E9]"), "caf&#x00E9;");
	}

	TEST(RoffPMSpecials, AmpersandsAndAngles) {
		EXPECT_EQ(rpm::translateSpecials("AT&T <x>"), "AT&amp;T &lt;x&gt;");
		EXPECT_EQ(rpm::translateSpecials("&amp; &#38; &#x26;"), "&amp; &#38; &#x26;");
	}

	TEST(RoffPMSpecials, TranslationIsIdempotent) {
		const std::string once = rpm::translateSpecials("AT&T <x> \\(co \\[u00E9] \\-n C:\\\\dir");
		EXPECT_EQ(rpm::translateSpecials(once), once);
	}

	TEST(RoffPMSpecials, ZeroWidthEscapesVanish) {
		EXPECT_EQ(rpm::translateSpecials("\\&.B"), ".B");
		EXPECT_EQ(rpm::translateSpecials("a\\|b\\^c\\%d"), "abcd");
		EXPECT_EQ(rpm::translateSpecials("\\s+2big\\s0"), "big");
	}

	TEST(RoffPMSpecials, PointSizeEscapesOfEveryForm) {
		EXPECT_EQ(rpm::translateSpecials("\\s10big\\s0"), "big");
		EXPECT_EQ(rpm::translateSpecials("\\s12a\\s5b"), "ab");
		EXPECT_EQ(rpm::translateSpecials("\\s(12x\\s[0]y\\s-(10z"), "xyz");
		EXPECT_EQ(rpm::translateSpecials("\\s(+12x\\s'14'y"), "xy");
		EXPECT_EQ(rpm::translateSpecials("\\s45"), "5");
		EXPECT_EQ(rpm::translateSpecials("\\sx"), "\\sx");
	}

	TEST(RoffPMSpecials, UnpaddableSpace) {
		EXPECT_EQ(rpm::translateSpecials("a\\ b\\~c"), "a&nbsp;b&nbsp;c");
	}

	TEST(RoffPMSpecials, LiteralBackslash) {
		EXPECT_EQ(rpm::translateSpecials("C:\\\\path"), "C:&#92;path");
		EXPECT_EQ(rpm::translateSpecials("\\efB"), "&#92;fB");
		EXPECT_EQ(rpm::translateSpecials("\\(rs"), "&#92;");
	}

	TEST(RoffPMSpecials, PredefinedStrings) {
		EXPECT_EQ(rpm::translateSpecials("X\\*(Tm"), "X&trade;");
		EXPECT_EQ(rpm::translateSpecials("\\*R"), "&reg;");
		EXPECT_EQ(rpm::translateSpecials("\\*[lq]x\\*[rq]"), "&ldquo;x&rdquo;");
	}

	TEST(RoffPMSpecials, UnknownNamesPassThrough) {
		EXPECT_EQ(rpm::translateSpecials("\\(zz"), "\\(zz");
		EXPECT_EQ(rpm::translateSpecials("\\[nosuch]"), "\\[nosuch]");
		EXPECT_EQ(rpm::translateSpecials("\\fBx\\fR"), "\\fBx\\fR");
	}

	TEST(RoffPMSpecials, LinksBareUrls) {
		EXPECT_EQ(rpm::linkUrls("See https://www.gnu.org/software/coreutils."),
			"See <a href=\"https://www.gnu.org/software/coreutils\">https://www.gnu.org/software/coreutils</a>.");
		EXPECT_EQ(rpm::linkUrls("http://a.org and http://b.org"),
			"<a href=\"http://a.org\">http://a.org</a> and <a href=\"http://b.org\">http://b.org</a>");
	}

	TEST(RoffPMSpecials, UrlExceptionsStayPlain) {
		EXPECT_EQ(rpm::linkUrls("Try http://localhost:8080/ now"), "Try http://localhost:8080/ now");
		EXPECT_EQ(rpm::linkUrls("Visit http://www.example.com/x"), "Visit http://www.example.com/x");
		EXPECT_EQ(rpm::linkUrls("bare http:// only"), "bare http:// only");
	}

	TEST(RoffPMSpecials, LookupTables) {
		EXPECT_EQ(rpm::lookupGlyph("bu").value_or(""), "&bull;");
		EXPECT_FALSE(rpm::lookupGlyph("??").has_value());
		EXPECT_EQ(rpm::lookupString("Tm").value_or(""), "&trade;");
	}
}
