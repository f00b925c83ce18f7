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

#include "roff_parseman/RoffParseMan.h"
#include <cstdint>
#include <istream>
#include <ostream>
#include <iostream>
#include <string>
#include <string_view>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include "RoffParseImpl.h"

namespace roff_parseman {
	namespace impl {
		enum class Request : uint8_t {
			Title,
			Section,
			Subsection,
			Paragraph,
			IndentedParagraph,
			TaggedParagraph,
			MarginIn,
			MarginOut,
			FontMacro,
			AlternatingFont,
			FontChange,
			TableStart,
			TableEnd,
			Include,
			LineBreak,
			NoFill,
			Fill,
			UrlStart,
			UrlEnd,
			Ignored
		};

		struct Context {
			Context(ConvertOptions opts, std::ostream& o, std::ostream& d) :
				options{ std::move(opts) }, out{ &o }, diag{ &d } {}

			ConvertOptions options;
			std::ostream* out;
			std::ostream* diag;

			LineSource input;
			FontState bodyFont;
			BlockStack blocks;
			FragmentRegistry fragments;
			std::optional<std::string> trailer;

			bool titled = false;
			bool noFill = false;
			bool linkOpen = false;
			bool finalized = false;
		};
	}
}

namespace rpm = roff_parseman::impl;
namespace rp = roff_parseman;
using rpm::Request;

namespace {
	const std::unordered_map<std::string_view, Request>& requestTable() {
		static const std::unordered_map<std::string_view, Request> table{
			{ "TH", Request::Title },
			{ "SH", Request::Section }, { "SS", Request::Subsection },
			{ "PP", Request::Paragraph }, { "P", Request::Paragraph }, { "LP", Request::Paragraph }, { "HP", Request::Paragraph },
			{ "IP", Request::IndentedParagraph }, { "TP", Request::TaggedParagraph },
			{ "RS", Request::MarginIn }, { "RE", Request::MarginOut },
			{ "B", Request::FontMacro }, { "I", Request::FontMacro }, { "SB", Request::FontMacro }, { "SM", Request::FontMacro },
			{ "BR", Request::AlternatingFont }, { "BI", Request::AlternatingFont }, { "IB", Request::AlternatingFont },
			{ "IR", Request::AlternatingFont }, { "RB", Request::AlternatingFont }, { "RI", Request::AlternatingFont },
			{ "ft", Request::FontChange },
			{ "TS", Request::TableStart }, { "TE", Request::TableEnd },
			{ "so", Request::Include },
			{ "br", Request::LineBreak }, { "sp", Request::LineBreak },
			{ "nf", Request::NoFill }, { "EX", Request::NoFill }, { "fi", Request::Fill }, { "EE", Request::Fill },
			{ "UR", Request::UrlStart }, { "UE", Request::UrlEnd },
			{ "ad", Request::Ignored }, { "na", Request::Ignored }, { "hy", Request::Ignored }, { "nh", Request::Ignored },
			{ "ne", Request::Ignored }, { "ll", Request::Ignored }, { "in", Request::Ignored }, { "ti", Request::Ignored },
			{ "PD", Request::Ignored }, { "ta", Request::Ignored }, { "IX", Request::Ignored }, { "ns", Request::Ignored },
			{ "rs", Request::Ignored }, { "bp", Request::Ignored }, { "DT", Request::Ignored }, { "UC", Request::Ignored },
			{ "ce", Request::Ignored }, { "ps", Request::Ignored }, { "vs", Request::Ignored },
		};
		return table;
	}

	auto lookupRequest(std::string_view name) -> std::optional<Request> {
		const auto& table = requestTable();
		if (auto it = table.find(name); it != table.end()) {
			return it->second;
		}
		return std::nullopt;
	}

	bool isControlLine(std::string_view line) noexcept {
		return !line.empty() and (line.front() == '.' or line.front() == '\'');
	}

	bool isBulletGlyph(std::string_view arg) noexcept {
		return arg == "\\(bu" or arg == "\\[bu]" or arg == "*" or arg == "-" or arg == "\\-" or
			arg == "o" or arg == "\\(em" or arg == "\\(en" or arg == "\\(ci" or arg == "\\[ci]";
	}

	// position of the backslash starting a \" comment, or npos
	size_t commentStart(std::string_view line) noexcept {
		for (size_t i = line.find('"'); i != std::string_view::npos; i = line.find('"', i + 1)) {
			size_t slashes = 0;
			while (slashes < i and line[i - 1 - slashes] == '\\') {
				++slashes;
			}
			if (slashes % 2 == 1) {
				return i - 1;
			}
		}
		return std::string_view::npos;
	}

	bool isCommentLine(std::string_view line) noexcept {
		if (isControlLine(line)) {
			line.remove_prefix(1);
			while (!line.empty() and (line.front() == ' ' or line.front() == '\t')) {
				line.remove_prefix(1);
			}
		}
		return line.substr(0, 2) == "\\\"";
	}

	std::string joinArgs(const std::vector<std::string>& words, size_t first) {
		std::string joined{};
		for (size_t i = first; i < words.size(); ++i) {
			if (i != first) {
				joined.push_back(' ');
			}
			joined.append(words[i]);
		}
		return joined;
	}

	std::vector<std::string> argsOf(const std::vector<std::string>& words) {
		return { words.begin() + 1, words.end() };
	}

	void emit(rpm::Context& ctx, std::string_view line) {
		*ctx.out << line << '\n';
	}

	void emitAll(rpm::Context& ctx, const std::vector<std::string_view>& lines) {
		for (auto line : lines) {
			if (!line.empty()) {
				emit(ctx, line);
			}
		}
	}

	void emitAll(rpm::Context& ctx, const std::vector<std::string>& lines) {
		for (const auto& line : lines) {
			emit(ctx, line);
		}
	}

	std::string expandText(rpm::Context& ctx, std::string_view text) {
		return rpm::linkUrls(rpm::applyFontEscapes(rpm::translateSpecials(text), ctx.bodyFont, false));
	}

	std::string expandScoped(std::string_view text) {
		rp::FontState scoped{};
		return rpm::applyFontEscapes(rpm::translateSpecials(text), scoped, true);
	}

	std::string renderFontRequest(Request kind, const std::vector<std::string>& words) {
		const std::string& cmd = words.front();
		if (kind == Request::AlternatingFont) {
			return rpm::alternatingFontMacro(cmd, argsOf(words));
		}
		char letter = cmd == "SM" ? 'R' : cmd.back();
		return rpm::fontMacro(letter, argsOf(words));
	}

	// The line pulled by .IP and .TP belongs to the current request; it is never dispatched.
	std::string expandLookahead(rpm::Context& ctx, std::string line) {
		if (size_t c = commentStart(line); c != std::string::npos) {
			line.erase(c);
		}
		if (!isControlLine(line)) {
			return rpm::linkUrls(expandScoped(line));
		}
		auto words = rpm::splitRequest(std::string_view{ line }.substr(1));
		if (words.empty()) {
			return {};
		}
		auto kind = lookupRequest(words.front());
		if (kind == Request::FontMacro or kind == Request::AlternatingFont) {
			return renderFontRequest(*kind, words);
		}
		rpm::warn(*ctx.diag, ctx.input, fmt::format("request '{}' cannot be used as an item line", words.front()));
		return {};
	}

	std::string nextItemLine(rpm::Context& ctx) {
		auto line = ctx.input.nextLine();
		if (!line) {
			rpm::warn(*ctx.diag, ctx.input, "list item is missing its line");
			return {};
		}
		return expandLookahead(ctx, std::move(*line));
	}

	void handleTitle(rpm::Context& ctx, const std::vector<std::string>& words) {
		if (ctx.titled) {
			rpm::warn(*ctx.diag, ctx.input, "repeated title request ignored");
			return;
		}
		ctx.titled = true;
		auto arg = [&words](size_t i) { return i < words.size() ? rpm::translateSpecials(words[i]) : std::string{}; };
		rpm::TitleInfo info{ arg(1), arg(2), arg(3), arg(4), arg(5) };
		emitAll(ctx, rpm::titleHeader(ctx.options, info));
		ctx.trailer = rpm::titleTrailer(ctx.options.style);
	}

	void handleHeading(rpm::Context& ctx, const std::vector<std::string>& words, int level) {
		const std::string text = joinArgs(words, 1);
		if (text.empty()) {
			rpm::warn(*ctx.diag, ctx.input, "empty heading ignored");
			return;
		}
		if (auto closing = rpm::closeFont(ctx.bodyFont); !closing.empty()) {
			emit(ctx, closing);
		}
		if (auto owed = ctx.blocks.closeTop(); !owed.empty()) {
			emit(ctx, owed);
		}
		const std::string label = expandScoped(text);
		const std::string key = ctx.fragments.allocate(label);
		emit(ctx, fmt::format("<h{0} id=\"{1}\"><a href=\"#{1}\">{2}</a></h{0}>", level, key, label));
	}

	void handleIndentedParagraph(rpm::Context& ctx, const std::vector<std::string>& words) {
		if (words.size() < 2 or words[1].empty()) {
			emitAll(ctx, ctx.blocks.paragraphBreak(true));
		}
		else if (isBulletGlyph(words[1])) {
			emitAll(ctx, ctx.blocks.beginItem(rp::BlockMode::BulletList));
			emit(ctx, "<li>" + nextItemLine(ctx));
		}
		else {
			emitAll(ctx, ctx.blocks.beginItem(rp::BlockMode::DefinitionList));
			emit(ctx, fmt::format("<dt>{}</dt><dd>", expandScoped(words[1])));
		}
	}

	void handleFontChange(rpm::Context& ctx, const std::vector<std::string>& words) {
		std::string name = words.size() > 1 ? words[1] : std::string{ "P" };
		if (!rpm::resolveFont(name, ctx.bodyFont)) {
			rpm::warn(*ctx.diag, ctx.input, fmt::format("unknown font '{}'", name));
			return;
		}
		std::string escape = name.size() == 1 ? "\\f" + name : "\\f[" + name + "]";
		std::string markup = rpm::applyFontEscapes(escape, ctx.bodyFont, false);
		if (!markup.empty()) {
			emit(ctx, markup);
		}
	}

	void handleRequest(rpm::Context& ctx, const std::vector<std::string>& words) {
		auto kind = lookupRequest(words.front());
		if (!kind) {
			rpm::warn(*ctx.diag, ctx.input, fmt::format("unrecognized request '{}'", words.front()));
			return;
		}
		switch (*kind) {
		case Request::Title:
			handleTitle(ctx, words);
			break;
		case Request::Section:
			handleHeading(ctx, words, 1);
			break;
		case Request::Subsection:
			handleHeading(ctx, words, 2);
			break;
		case Request::Paragraph:
			emitAll(ctx, ctx.blocks.paragraphBreak(false));
			break;
		case Request::IndentedParagraph:
			handleIndentedParagraph(ctx, words);
			break;
		case Request::TaggedParagraph:
			emitAll(ctx, ctx.blocks.beginItem(rp::BlockMode::DefinitionList));
			emit(ctx, fmt::format("<dt>{}</dt><dd>", nextItemLine(ctx)));
			break;
		case Request::MarginIn:
			ctx.blocks.enterMargin();
			break;
		case Request::MarginOut: {
			auto [closing, underflow] = ctx.blocks.exitMargin();
			if (underflow) {
				rpm::warn(*ctx.diag, ctx.input, "margin exit without matching margin enter");
			}
			if (!closing.empty()) {
				emit(ctx, closing);
			}
			break;
		}
		case Request::FontMacro:
		case Request::AlternatingFont:
			if (auto markup = renderFontRequest(*kind, words); !markup.empty()) {
				emit(ctx, markup);
			}
			break;
		case Request::FontChange:
			handleFontChange(ctx, words);
			break;
		case Request::TableStart:
			emitAll(ctx, rpm::renderTable(rpm::readTable(ctx.input, *ctx.diag)));
			break;
		case Request::TableEnd:
			rpm::warn(*ctx.diag, ctx.input, "table end without table start");
			break;
		case Request::Include:
			if (words.size() < 2) {
				rpm::warn(*ctx.diag, ctx.input, "include request without a file name");
			}
			else {
				ctx.input.open(words[1]);
			}
			break;
		case Request::LineBreak:
			emit(ctx, "<br>");
			break;
		case Request::NoFill:
			if (!ctx.noFill) {
				ctx.noFill = true;
				emit(ctx, "<pre>");
			}
			break;
		case Request::Fill:
			if (ctx.noFill) {
				ctx.noFill = false;
				emit(ctx, "</pre>");
			}
			break;
		case Request::UrlStart:
			if (words.size() < 2) {
				rpm::warn(*ctx.diag, ctx.input, "link request without a target");
			}
			else if (!ctx.linkOpen) {
				ctx.linkOpen = true;
				emit(ctx, fmt::format("<a href=\"{}\">", rpm::translateSpecials(words[1])));
			}
			break;
		case Request::UrlEnd:
			if (ctx.linkOpen) {
				ctx.linkOpen = false;
				emit(ctx, "</a>" + rpm::translateSpecials(joinArgs(words, 1)));
			}
			break;
		case Request::Ignored:
			break;
		}
	}

	void dispatchLine(rpm::Context& ctx, std::string line) {
		if (line.empty()) {
			if (ctx.noFill) {
				emit(ctx, "");
			}
			else {
				emitAll(ctx, ctx.blocks.paragraphBreak(false));
			}
			return;
		}
		if (isCommentLine(line)) {
			return;
		}
		if (size_t c = commentStart(line); c != std::string::npos) {
			line.erase(c);
		}
		if (isControlLine(line)) {
			auto words = rpm::splitRequest(std::string_view{ line }.substr(1));
			if (!words.empty()) {
				handleRequest(ctx, words);
			}
			return;
		}
		emit(ctx, expandText(ctx, line));
	}
}

rp::Converter::Converter(rp::Converter&& o) noexcept : ctx_{ o.ctx_ } {
	o.ctx_ = nullptr;
}

rp::Converter::Converter(ConvertOptions options, std::ostream& out) :
	Converter{ std::move(options), out, std::cerr } {}

rp::Converter::Converter(ConvertOptions options, std::ostream& out, std::ostream& diag) :
	ctx_{ new impl::Context{ std::move(options), out, diag } } {}

rp::Converter::~Converter() {
	delete ctx_;
}

void rp::Converter::open(const std::string& name) {
	ctx_->input.open(name);
}

void rp::Converter::push(const std::string& name, std::istream& in) {
	ctx_->input.push(name, in);
}

bool rp::Converter::processLine() {
	auto line = ctx_->input.nextLine();
	if (!line) {
		return false;
	}
	dispatchLine(*ctx_, std::move(*line));
	return true;
}

void rp::Converter::finalizeDocument() {
	impl::Context& ctx = *ctx_;
	if (ctx.finalized) {
		return;
	}
	ctx.finalized = true;
	if (auto closing = impl::closeFont(ctx.bodyFont); !closing.empty()) {
		emit(ctx, closing);
	}
	if (ctx.linkOpen) {
		ctx.linkOpen = false;
		emit(ctx, "</a>");
	}
	if (ctx.noFill) {
		ctx.noFill = false;
		emit(ctx, "</pre>");
	}
	emitAll(ctx, ctx.blocks.closeAll());
	if (ctx.trailer) {
		emit(ctx, *ctx.trailer);
	}
	ctx.out->flush();
}
