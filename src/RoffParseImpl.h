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

#ifndef ROFF_PARSE_IMPL_H
#define ROFF_PARSE_IMPL_H
#include <iosfwd>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include "roff_parseman/BlockInfoTags.h"
#include "roff_parseman/RoffParseMan.h"

namespace roff_parseman::impl {

	struct InputFrame {
		std::string name;
		std::istream* stream;
		std::unique_ptr<std::ifstream> owned;
		size_t lineNo;
	};

	// Stack of open sources; nested includes push, end-of-source pops.
	class LineSource {
	public:
		LineSource() = default;
		LineSource(const LineSource&) = delete;
		LineSource& operator=(const LineSource&) = delete;
		LineSource(LineSource&&) noexcept = default;
		LineSource& operator=(LineSource&&) noexcept = default;
		~LineSource();

		void open(const std::string& name);
		void push(const std::string& name, std::istream& in);
		auto nextLine() -> std::optional<std::string>;

		bool empty() const noexcept { return frames_.empty(); }
		size_t depth() const noexcept { return frames_.size(); }
		auto location() const -> std::string;
		auto resolve(const std::string& name) const -> std::string;
	private:
		void pop();

		std::vector<InputFrame> frames_;
		std::string lastName_ = "<input>";
		size_t lastLine_ = 0;
	};

	void warn(std::ostream& diag, const LineSource& src, std::string_view msg);
	[[noreturn]] void fail(const LineSource& src, std::string_view msg);

	auto splitRequest(std::string_view text) -> std::vector<std::string>;

	constexpr char BACKSLASH_PLACEHOLDER = '\x01';
	auto lookupGlyph(std::string_view name) -> std::optional<std::string_view>;
	auto lookupString(std::string_view name) -> std::optional<std::string_view>;
	auto translateSpecials(std::string_view text) -> std::string;
	auto linkUrls(std::string_view text) -> std::string;

	// std::nullopt for font names this converter does not know
	auto resolveFont(std::string_view name, const FontState& state) noexcept -> std::optional<Font>;
	auto applyFontEscapes(std::string_view text, FontState& state, bool addClose) -> std::string;
	auto closeFont(FontState& state) -> std::string;
	auto fontMacro(char letter, const std::vector<std::string>& args) -> std::string;
	auto alternatingFontMacro(std::string_view letters, const std::vector<std::string>& args) -> std::string;

	class BlockStack {
	public:
		BlockStack() : modes_{ BlockMode::Paragraph } {}

		BlockMode top() const noexcept { return modes_.back(); }
		size_t depth() const noexcept { return modes_.size(); }

		void enterMargin();
		struct MarginExit {
			std::string_view closing;
			bool underflow;
		};
		auto exitMargin() -> MarginExit;

		auto closeTop() -> std::string_view;
		auto closeAll() -> std::vector<std::string_view>;
		auto paragraphBreak(bool indentedVariant) -> std::vector<std::string_view>;
		auto beginItem(BlockMode mode) -> std::vector<std::string_view>;

		static auto closingMarkup(BlockMode mode) noexcept -> std::string_view;
		static auto openingMarkup(BlockMode mode) noexcept -> std::string_view;
		static auto itemSeparator(BlockMode mode) noexcept -> std::string_view;
	private:
		std::vector<BlockMode> modes_;
	};

	class FragmentRegistry {
	public:
		auto allocate(std::string_view rawText) -> std::string;
		static auto normalize(std::string_view rawText) -> std::string;
		bool contains(const std::string& key) const { return used_.count(key) != 0; }
		size_t size() const noexcept { return used_.size(); }
	private:
		std::unordered_set<std::string> used_;
	};

	// appends one FormatLine per comma-separated row; dest is untouched on failure
	bool parseFormatRows(std::string_view line, std::vector<FormatLine>& dest);
	bool parseTableOptions(std::string_view line, TableOptions& dest);
	auto readTable(LineSource& src, std::ostream& diag) -> TableSpec;
	auto renderTable(const TableSpec& table) -> std::vector<std::string>;

	struct TitleInfo {
		std::string title;
		std::string section;
		std::string date;
		std::string source;
		std::string manual;
	};
	auto sectionDescription(std::string_view section) -> std::optional<std::string_view>;
	auto titleHeader(const ConvertOptions& options, const TitleInfo& info) -> std::vector<std::string>;
	auto titleTrailer(OutputStyle style) -> std::optional<std::string>;
}

#endif
