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

#include <string_view>
#include <vector>
#include "RoffParseImpl.h"

namespace rpm = roff_parseman::impl;
using roff_parseman::BlockMode;

auto rpm::BlockStack::closingMarkup(BlockMode mode) noexcept -> std::string_view {
	switch (mode) {
	case BlockMode::BulletList: return "</li></ul>";
	case BlockMode::DefinitionList: return "</dd></dl>";
	default: return "";
	}
}

auto rpm::BlockStack::openingMarkup(BlockMode mode) noexcept -> std::string_view {
	switch (mode) {
	case BlockMode::BulletList: return "<ul>";
	case BlockMode::DefinitionList: return "<dl>";
	default: return "";
	}
}

auto rpm::BlockStack::itemSeparator(BlockMode mode) noexcept -> std::string_view {
	switch (mode) {
	case BlockMode::BulletList: return "</li>";
	case BlockMode::DefinitionList: return "</dd>";
	default: return "";
	}
}

void rpm::BlockStack::enterMargin() {
	modes_.push_back(BlockMode::Paragraph);
}

auto rpm::BlockStack::exitMargin() -> MarginExit {
	if (modes_.size() <= 1) {
		std::string_view owed = closingMarkup(modes_.back());
		modes_.assign(1, BlockMode::Paragraph);
		return { owed, true };
	}
	std::string_view owed = closingMarkup(modes_.back());
	modes_.pop_back();
	return { owed, false };
}

auto rpm::BlockStack::closeTop() -> std::string_view {
	std::string_view owed = closingMarkup(modes_.back());
	modes_.back() = BlockMode::Paragraph;
	return owed;
}

auto rpm::BlockStack::closeAll() -> std::vector<std::string_view> {
	std::vector<std::string_view> owed{};
	for (auto it = modes_.rbegin(); it != modes_.rend(); ++it) {
		if (*it != BlockMode::Paragraph) {
			owed.push_back(closingMarkup(*it));
		}
	}
	modes_.assign(1, BlockMode::Paragraph);
	return owed;
}

auto rpm::BlockStack::paragraphBreak(bool indentedVariant) -> std::vector<std::string_view> {
	std::vector<std::string_view> markup{};
	if (!indentedVariant and top() != BlockMode::Paragraph) {
		markup.push_back(closeTop());
	}
	markup.push_back("<p>");
	return markup;
}

auto rpm::BlockStack::beginItem(BlockMode mode) -> std::vector<std::string_view> {
	std::vector<std::string_view> markup{};
	if (top() == mode) {
		markup.push_back(itemSeparator(mode));
		return markup;
	}
	if (top() != BlockMode::Paragraph) {
		markup.push_back(closeTop());
	}
	markup.push_back(openingMarkup(mode));
	modes_.back() = mode;
	return markup;
}
