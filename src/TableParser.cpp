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

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>
#include "RoffParseImpl.h"
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "tao/pegtl.hpp"

using roff_parseman::ColumnFormat;
using roff_parseman::FormatLine;
using roff_parseman::TableOptions;
using roff_parseman::TableSpec;

namespace tbllang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct fmt_sep : one<' ', '\t'> {};
	struct fmt_row_break : one<','> {};
	struct fmt_double_rule : string<'|', '|'> {};
	struct fmt_single_rule : one<'|'> {};
	struct fmt_rule : sor<fmt_double_rule, fmt_single_rule> {};
	struct fmt_key : one<'l', 'L', 'r', 'R', 'c', 'C', 'n', 'N', 's', 'S', 'a', 'A', '^', '_', '-', '='> {};

	struct fmt_bold : one<'b', 'B'> {};
	struct fmt_italic : one<'i', 'I'> {};
	struct fmt_font_name : sor<
		seq<one<'('>, any, any>,
		seq<one<'['>, star<not_one<']'>>, one<']'>>,
		seq<one<'C'>, opt<one<'W', 'R', 'B', 'I'>>>,
		alnum> {};
	struct fmt_font : seq<one<'f', 'F'>, fmt_font_name> {};
	struct fmt_width : seq<one<'w', 'W'>, one<'('>, star<not_one<')'>>, one<')'>> {};
	struct fmt_flag : one<'e', 'E', 't', 'T', 'u', 'U', 'z', 'Z', 'd', 'D', 'x', 'X'> {};
	struct fmt_spacing : plus<digit> {};
	struct fmt_modifier : sor<fmt_bold, fmt_italic, fmt_font, fmt_width, fmt_spacing, fmt_flag> {};
	struct fmt_column : seq<fmt_key, star<fmt_modifier>> {};
	struct format_line : seq<star<sor<fmt_sep, fmt_row_break, fmt_rule, fmt_column>>, opt<one<'.'>>, star<fmt_sep>, eof> {};

	// a comma ends one format row and starts the next within the same line
	struct FormatState {
		std::vector<FormatLine>& rows;
		ColumnFormat::rule_e pendingRule;

		FormatLine& columns() { return rows.back(); }
		void flushRule() {
			if (pendingRule != ColumnFormat::rule_e::None and !columns().empty()) {
				columns().back().ruleAfter = pendingRule;
			}
			pendingRule = ColumnFormat::rule_e::None;
		}
	};

	template <typename Rule>
	struct format_action : nothing<Rule> {};

	template <>
	struct format_action<fmt_key> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, FormatState& st) {
			using align_e = ColumnFormat::align_e;
			ColumnFormat col{};
			switch (*in.begin()) {
			case 'r': case 'R': col.align = align_e::Right;
				break;
			case 'c': case 'C': col.align = align_e::Center;
				break;
			case 'n': case 'N': col.align = align_e::Numeric;
				break;
			case 's': case 'S': col.align = align_e::Span;
				break;
			case '_': case '-': case '=': col.align = align_e::HRule;
				break;
			default: col.align = align_e::Left;
				break;
			}
			col.ruleBefore = st.pendingRule;
			st.pendingRule = ColumnFormat::rule_e::None;
			st.columns().push_back(col);
		}
	};
	template <>
	struct format_action<fmt_row_break> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, FormatState& st) {
			st.flushRule();
			st.rows.emplace_back();
		}
	};
	template <>
	struct format_action<fmt_single_rule> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, FormatState& st) noexcept {
			st.pendingRule = ColumnFormat::rule_e::Single;
		}
	};
	template <>
	struct format_action<fmt_double_rule> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, FormatState& st) noexcept {
			st.pendingRule = ColumnFormat::rule_e::Double;
		}
	};
	template <>
	struct format_action<fmt_bold> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, FormatState& st) noexcept {
			st.columns().back().bold = true;
		}
	};
	template <>
	struct format_action<fmt_italic> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput&, FormatState& st) noexcept {
			st.columns().back().italic = true;
		}
	};
	template <>
	struct format_action<fmt_font> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, FormatState& st) {
			const std::string name = in.string().substr(1);
			st.columns().back().bold = name.find('B') != std::string::npos or name.find('3') != std::string::npos;
			st.columns().back().italic = name.find('I') != std::string::npos or name.find('2') != std::string::npos;
		}
	};

	struct opt_sep : one<' ', '\t', ','> {};
	struct opt_tab : seq<istring<'t', 'a', 'b'>, one<'('>, any, one<')'>> {};
	struct opt_arg : seq<one<'('>, star<not_one<')'>>, one<')'>> {};
	struct opt_keyword : plus<alpha> {};
	struct opt_word : seq<opt_keyword, opt<opt_arg>> {};
	struct options_line : seq<star<opt_sep>, star<sor<opt_tab, opt_word>, star<opt_sep>>, one<';'>, star<blank>, eof> {};

	template <typename Rule>
	struct options_action : nothing<Rule> {};

	template <>
	struct options_action<opt_tab> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, TableOptions& opts) {
			opts.separator = in.string()[4];
		}
	};
	template <>
	struct options_action<opt_keyword> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, TableOptions& opts) {
			std::string word = in.string();
			std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
			if (word == "center" or word == "centre") {
				opts.alignment = "center";
			}
			else if (word == "expand") {
				opts.alignment = "expand";
			}
			else if (word == "box" or word == "allbox" or word == "doublebox" or word == "frame" or word == "doubleframe") {
				opts.boxed = true;
			}
		}
	};
}

namespace peggi = TAO_PEGTL_NAMESPACE;
namespace rpm = roff_parseman::impl;

bool rpm::parseFormatRows(std::string_view line, std::vector<FormatLine>& dest) {
	std::vector<FormatLine> rows(1);
	tbllang::FormatState st{ rows, ColumnFormat::rule_e::None };
	peggi::memory_input<peggi::tracking_mode::eager> input{ line.data(), line.data() + line.size(), "format" };
	if (not peggi::parse<tbllang::format_line, tbllang::format_action>(input, st)) {
		return false;
	}
	st.flushRule();
	for (auto& row : rows) {
		if (!row.empty()) {
			dest.push_back(std::move(row));
		}
	}
	return true;
}

bool rpm::parseTableOptions(std::string_view line, TableOptions& dest) {
	TableOptions parsed = dest;
	peggi::memory_input<peggi::tracking_mode::eager> input{ line.data(), line.data() + line.size(), "options" };
	if (not peggi::parse<tbllang::options_line, tbllang::options_action>(input, parsed)) {
		return false;
	}
	dest = parsed;
	return true;
}

namespace {
	std::string_view trim(std::string_view s) noexcept {
		while (!s.empty() and std::isspace(static_cast<unsigned char>(s.front()))) {
			s.remove_prefix(1);
		}
		while (!s.empty() and std::isspace(static_cast<unsigned char>(s.back()))) {
			s.remove_suffix(1);
		}
		return s;
	}

	bool isTableEnd(std::string_view line) noexcept {
		line = trim(line);
		return line.substr(0, 3) == ".TE" and (line.size() == 3 or std::isspace(static_cast<unsigned char>(line[3])));
	}

	bool isRuleRow(std::string_view line) noexcept {
		line = trim(line);
		return line == "_" or line == "=";
	}

	size_t countOf(const std::string& s, std::string_view needle) {
		size_t n = 0;
		for (size_t i = 0; (i = s.find(needle, i)) != std::string::npos; i += needle.size()) {
			++n;
		}
		return n;
	}

	void eraseAll(std::string& s, std::string_view needle) {
		for (size_t i = 0; (i = s.find(needle, i)) != std::string::npos; ) {
			s.erase(i, needle.size());
		}
	}
}

auto rpm::readTable(LineSource& src, std::ostream& diag) -> TableSpec {
	TableSpec table{};
	for (bool formatDone = false; !formatDone; ) {
		auto line = src.nextLine();
		if (!line) {
			warn(diag, src, "table not terminated");
			return table;
		}
		if (isTableEnd(*line)) {
			warn(diag, src, "table ended inside its format section");
			return table;
		}
		std::string_view text = trim(*line);
		if (!text.empty() and text.back() == ';') {
			if (!parseTableOptions(text, table.options)) {
				warn(diag, src, fmt::format("unrecognized table options '{}'", text));
			}
			continue;
		}
		if (!parseFormatRows(text, table.formats)) {
			warn(diag, src, fmt::format("malformed table format '{}'", text));
			table.formats.push_back(FormatLine(1, ColumnFormat{}));
		}
		formatDone = !text.empty() and text.back() == '.';
	}

	while (auto line = src.nextLine()) {
		if (isTableEnd(*line)) {
			return table;
		}
		if (isRuleRow(*line) or (!line->empty() and (line->front() == '.' or line->front() == '\''))) {
			continue;
		}
		std::string row = std::move(*line);
		while (countOf(row, "T{") > countOf(row, "T}")) {
			auto more = src.nextLine();
			if (!more) {
				fail(src, "unmatched multi-line table cell");
			}
			row.push_back(' ');
			row.append(*more);
		}
		eraseAll(row, "T{");
		eraseAll(row, "T}");
		table.rows.push_back(std::move(row));
	}
	warn(diag, src, "table not terminated");
	return table;
}

namespace {
	std::vector<std::string_view> splitCells(std::string_view row, char separator) {
		std::vector<std::string_view> cells{};
		for (size_t begin = 0; ; ) {
			size_t end = row.find(separator, begin);
			cells.push_back(trim(row.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin)));
			if (end == std::string_view::npos) {
				break;
			}
			begin = end + 1;
		}
		return cells;
	}

	std::string renderCell(std::string_view text, const ColumnFormat& col) {
		if (col.align == ColumnFormat::align_e::HRule or text == "_" or text == "=" or text == "\\_") {
			return "<hr>";
		}
		std::string wrapped{};
		if (col.bold) {
			wrapped = "\\fB";
		}
		else if (col.italic) {
			wrapped = "\\fI";
		}
		wrapped.append(text);
		roff_parseman::FontState scoped{};
		return rpm::applyFontEscapes(rpm::translateSpecials(wrapped), scoped, true);
	}

	std::string_view ruleStyle(ColumnFormat::rule_e rule) noexcept {
		switch (rule) {
		case ColumnFormat::rule_e::Single: return "1px solid";
		case ColumnFormat::rule_e::Double: return "3px double";
		default: return "";
		}
	}

	std::string cellAttributes(const ColumnFormat& col, unsigned span) {
		std::vector<std::string> styles{};
		switch (col.align) {
		case ColumnFormat::align_e::Right:
		case ColumnFormat::align_e::Numeric:
			styles.emplace_back("text-align: right");
			break;
		case ColumnFormat::align_e::Center:
			styles.emplace_back("text-align: center");
			break;
		default:
			break;
		}
		if (col.ruleBefore != ColumnFormat::rule_e::None) {
			styles.push_back(fmt::format("border-left: {}", ruleStyle(col.ruleBefore)));
		}
		if (col.ruleAfter != ColumnFormat::rule_e::None) {
			styles.push_back(fmt::format("border-right: {}", ruleStyle(col.ruleAfter)));
		}
		std::string attrs{};
		if (span > 1) {
			attrs.append(fmt::format(" colspan=\"{}\"", span));
		}
		if (!styles.empty()) {
			attrs.append(fmt::format(" style=\"{}\"", fmt::join(styles, "; ")));
		}
		return attrs;
	}

	struct RenderedCell {
		std::string body;
		ColumnFormat column;
		unsigned span;
	};
}

auto rpm::renderTable(const TableSpec& table) -> std::vector<std::string> {
	static const FormatLine fallback{ ColumnFormat{} };
	std::vector<std::string> lines{};

	std::string opening{ "<table" };
	if (!table.options.alignment.empty()) {
		opening.append(fmt::format(" class=\"{}\"", table.options.alignment));
	}
	if (table.options.boxed) {
		opening.append(" border=\"1\"");
	}
	opening.push_back('>');
	lines.push_back(std::move(opening));

	const size_t k = table.formats.size();
	const size_t headerRows = k > 1 ? k - 1 : 0;
	for (size_t r = 0; r < table.rows.size(); ++r) {
		const FormatLine& format = k == 0 ? fallback : table.formats[std::min(r, k - 1)];
		const auto cells = splitCells(table.rows[r], table.options.separator);

		std::vector<RenderedCell> rendered{};
		for (size_t j = 0; j < cells.size(); ++j) {
			const ColumnFormat& col = j < format.size() ? format[j] : format.back();
			if (col.align == ColumnFormat::align_e::Span and !rendered.empty()) {
				++rendered.back().span;
				continue;
			}
			rendered.push_back({ renderCell(cells[j], col), col, 1 });
		}
		for (size_t j = cells.size(); j < format.size() and format[j].align == ColumnFormat::align_e::Span and !rendered.empty(); ++j) {
			++rendered.back().span;
		}

		const char* tag = r < headerRows ? "th" : "td";
		std::string line{ "<tr>" };
		for (const auto& cell : rendered) {
			line.append(fmt::format("<{0}{1}>{2}</{0}>", tag, cellAttributes(cell.column, cell.span), cell.body));
		}
		line.append("</tr>");
		lines.push_back(std::move(line));
	}
	lines.push_back("</table>");
	return lines;
}
