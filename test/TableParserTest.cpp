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

#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "RoffParseImpl.h"

namespace rpm = roff_parseman::impl;
using roff_parseman::ColumnFormat;
using roff_parseman::FormatLine;
using roff_parseman::TableOptions;
using lines_t = std::vector<std::string>;

namespace {
	auto readFrom(const std::string& text, std::ostream& diag) -> roff_parseman::TableSpec {
		std::istringstream in{ text };
		rpm::LineSource src{};
		src.push("<table>", in);
		return rpm::readTable(src, diag);
	}

	TEST(RoffPMTables, FormatKeysAndModifiers) {
		std::vector<FormatLine> rows{};
		ASSERT_TRUE(rpm::parseFormatRows("l r c n.", rows));
		ASSERT_EQ(rows.size(), 1u);
		const FormatLine& line = rows[0];
		ASSERT_EQ(line.size(), 4u);
		EXPECT_EQ(line[0].align, ColumnFormat::align_e::Left);
		EXPECT_EQ(line[1].align, ColumnFormat::align_e::Right);
		EXPECT_EQ(line[2].align, ColumnFormat::align_e::Center);
		EXPECT_EQ(line[3].align, ColumnFormat::align_e::Numeric);

		std::vector<FormatLine> styledRows{};
		ASSERT_TRUE(rpm::parseFormatRows("lb | ciw(2i) ||", styledRows));
		ASSERT_EQ(styledRows.size(), 1u);
		const FormatLine& styled = styledRows[0];
		ASSERT_EQ(styled.size(), 2u);
		EXPECT_TRUE(styled[0].bold);
		EXPECT_EQ(styled[1].align, ColumnFormat::align_e::Center);
		EXPECT_TRUE(styled[1].italic);
		EXPECT_EQ(styled[1].ruleBefore, ColumnFormat::rule_e::Single);
		EXPECT_EQ(styled[1].ruleAfter, ColumnFormat::rule_e::Double);
	}

	TEST(RoffPMTables, CommaStartsNewFormatRow) {
		std::vector<FormatLine> rows{};
		ASSERT_TRUE(rpm::parseFormatRows("c s |, l l.", rows));
		ASSERT_EQ(rows.size(), 2u);
		ASSERT_EQ(rows[0].size(), 2u);
		EXPECT_EQ(rows[0][1].align, ColumnFormat::align_e::Span);
		EXPECT_EQ(rows[0][1].ruleAfter, ColumnFormat::rule_e::Single);
		ASSERT_EQ(rows[1].size(), 2u);
		EXPECT_EQ(rows[1][0].align, ColumnFormat::align_e::Left);
		EXPECT_EQ(rows[1][0].ruleBefore, ColumnFormat::rule_e::None);
	}

	TEST(RoffPMTables, MalformedFormatFails) {
		std::vector<FormatLine> rows{};
		EXPECT_FALSE(rpm::parseFormatRows("l q", rows));
		EXPECT_TRUE(rows.empty());
	}

	TEST(RoffPMTables, CommaRowsSplitHeaderFromBody) {
		std::ostringstream diag{};
		auto table = readFrom("tab(;);\nc s, l r.\nTitle\na;1\nb;2\n.TE\n", diag);
		EXPECT_EQ(table.formats.size(), 2u);
		EXPECT_EQ(rpm::renderTable(table), (lines_t{
			"<table>",
			"<tr><th colspan=\"2\" style=\"text-align: center\">Title</th></tr>",
			"<tr><td>a</td><td style=\"text-align: right\">1</td></tr>",
			"<tr><td>b</td><td style=\"text-align: right\">2</td></tr>",
			"</table>" }));
	}

	TEST(RoffPMTables, OptionsLine) {
		TableOptions opts{};
		ASSERT_TRUE(rpm::parseTableOptions("center tab(:);", opts));
		EXPECT_EQ(opts.alignment, "center");
		EXPECT_EQ(opts.separator, ':');
		EXPECT_FALSE(opts.boxed);

		TableOptions boxed{};
		ASSERT_TRUE(rpm::parseTableOptions("ALLBOX;", boxed));
		EXPECT_TRUE(boxed.boxed);
		EXPECT_EQ(boxed.separator, '\t');
	}

	TEST(RoffPMTables, HeaderRowsAndMultiLineCells) {
		std::ostringstream diag{};
		auto table = readFrom("tab(;);\nc c\nl n.\nName;Value\nx;1\n_\nT{\nlong\ncell\nT};2\n.TE\nafter\n", diag);
		EXPECT_EQ(table.formats.size(), 2u);
		EXPECT_EQ(table.rows.size(), 3u);
		EXPECT_TRUE(diag.str().empty());
		EXPECT_EQ(rpm::renderTable(table), (lines_t{
			"<table>",
			"<tr><th style=\"text-align: center\">Name</th><th style=\"text-align: center\">Value</th></tr>",
			"<tr><td>x</td><td style=\"text-align: right\">1</td></tr>",
			"<tr><td>long cell</td><td style=\"text-align: right\">2</td></tr>",
			"</table>" }));
	}

	TEST(RoffPMTables, LastColumnAndLastLineAreReused) {
		std::ostringstream diag{};
		auto table = readFrom("tab(;);\nc\nl r.\nhead\na;b;c\nd;e\n.TE\n", diag);
		EXPECT_EQ(rpm::renderTable(table), (lines_t{
			"<table>",
			"<tr><th style=\"text-align: center\">head</th></tr>",
			"<tr><td>a</td><td style=\"text-align: right\">b</td><td style=\"text-align: right\">c</td></tr>",
			"<tr><td>d</td><td style=\"text-align: right\">e</td></tr>",
			"</table>" }));
	}

	TEST(RoffPMTables, SpansAndBoldColumns) {
		std::ostringstream diag{};
		auto table = readFrom("box tab(;);\nlb s\nl l.\nTitle\nk;\\fIv\\fR\n.TE\n", diag);
		EXPECT_EQ(rpm::renderTable(table), (lines_t{
			"<table border=\"1\">",
			"<tr><th colspan=\"2\"><b>Title</b></th></tr>",
			"<tr><td>k</td><td><i>v</i></td></tr>",
			"</table>" }));
	}

	TEST(RoffPMTables, UnmatchedMultiLineCellIsFatal) {
		std::ostringstream diag{};
		EXPECT_THROW(readFrom("l.\nT{\nnever closed\n", diag), roff_parseman::FatalError);
	}

	TEST(RoffPMTables, MissingTableEndWarns) {
		std::ostringstream diag{};
		auto table = readFrom("l.\nonly\n", diag);
		EXPECT_EQ(table.rows.size(), 1u);
		EXPECT_NE(diag.str().find("warning: table not terminated"), std::string::npos);
	}
}
