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
#include <string_view>
#include <optional>
#include "RoffParseImpl.h"

namespace rpm = roff_parseman::impl;
using roff_parseman::Font;
using roff_parseman::FontState;

namespace {
	constexpr std::string_view openingTag(Font f) noexcept {
		switch (f) {
		case Font::Bold: return "<b>";
		case Font::Italic: return "<i>";
		default: return "";
		}
	}
	constexpr std::string_view closingTag(Font f) noexcept {
		switch (f) {
		case Font::Bold: return "</b>";
		case Font::Italic: return "</i>";
		default: return "";
		}
	}

	void switchFont(std::string& out, FontState& state, Font target) {
		if (target != state.current) {
			out.append(closingTag(state.current));
			out.append(openingTag(target));
		}
		state.previous = state.current;
		state.current = target;
	}
}

// "P" and "" mean the previous font
auto rpm::resolveFont(std::string_view name, const FontState& state) noexcept -> std::optional<Font> {
	if (name == "P" or name.empty()) {
		return state.previous;
	}
	if (name == "B" or name == "3" or name == "BI" or name == "CB") {
		return Font::Bold;
	}
	if (name == "I" or name == "2" or name == "CI") {
		return Font::Italic;
	}
	if (name == "R" or name == "1" or name == "CW" or name == "CR" or name == "C") {
		return Font::Roman;
	}
	return std::nullopt;
}

auto rpm::applyFontEscapes(std::string_view text, FontState& state, bool addClose) -> std::string {
	std::string out{};
	out.reserve(text.size() + 8);
	size_t i = 0;
	const size_t n = text.size();
	while (i < n) {
		if (text[i] != '\\' or i + 1 >= n or text[i + 1] != 'f') {
			out.push_back(text[i++]);
			continue;
		}
		size_t nameBegin = i + 2, nameEnd = nameBegin + 1, next = nameEnd;
		if (nameBegin < n and text[nameBegin] == '(') {
			nameBegin += 1;
			nameEnd = nameBegin + 2;
			next = nameEnd;
		}
		else if (nameBegin < n and text[nameBegin] == '[') {
			nameBegin += 1;
			nameEnd = text.find(']', nameBegin);
			next = nameEnd == std::string_view::npos ? nameEnd : nameEnd + 1;
		}
		if (nameEnd > n or next > n) {
			out.append(text.substr(i));
			break;
		}
		auto target = rpm::resolveFont(text.substr(nameBegin, nameEnd - nameBegin), state);
		if (!target) {
			out.append(text.substr(i, next - i));
		}
		else {
			switchFont(out, state, *target);
		}
		i = next;
	}
	if (addClose) {
		out.append(closeFont(state));
	}
	return out;
}

auto rpm::closeFont(FontState& state) -> std::string {
	std::string closing{ closingTag(state.current) };
	state = FontState{};
	return closing;
}

auto rpm::fontMacro(char letter, const std::vector<std::string>& args) -> std::string {
	if (args.empty()) {
		return {};
	}
	std::string text{ "\\f" };
	text.push_back(letter);
	for (size_t i = 0; i < args.size(); ++i) {
		if (i != 0) {
			text.push_back(' ');
		}
		text.append(args[i]);
	}
	FontState scoped{};
	return applyFontEscapes(translateSpecials(text), scoped, true);
}

auto rpm::alternatingFontMacro(std::string_view letters, const std::vector<std::string>& args) -> std::string {
	if (args.empty() or letters.empty()) {
		return {};
	}
	std::string text{};
	for (size_t i = 0; i < args.size(); ++i) {
		text.append("\\f");
		text.push_back(letters[i % letters.size()]);
		text.append(args[i]);
	}
	FontState scoped{};
	return applyFontEscapes(translateSpecials(text), scoped, true);
}
