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

#include "RoffParseImpl.h"
#include <filesystem>
#include <iostream>
#include <istream>
#include <fmt/format.h>
#include <fmt/ostream.h>

namespace rpm = roff_parseman::impl;

rpm::LineSource::~LineSource() {
	while (!frames_.empty()) {
		pop();
	}
}

auto rpm::LineSource::resolve(const std::string& name) const -> std::string {
	std::filesystem::path target{ name };
	if (target.is_absolute() or frames_.empty()) {
		return name;
	}
	std::filesystem::path enclosing = std::filesystem::path{ frames_.back().name }.parent_path();
	if (enclosing.empty()) {
		return name;
	}
	return (enclosing / target).string();
}

void rpm::LineSource::open(const std::string& name) {
	if (name == "-") {
		frames_.push_back({ "<stdin>", &std::cin, nullptr, 0 });
		return;
	}
	std::string resolved = resolve(name);
	auto file = std::make_unique<std::ifstream>(resolved);
	if (!*file) {
		if (frames_.empty()) {
			throw FatalError{ fmt::format("error: cannot open '{}'", resolved) };
		}
		fail(*this, fmt::format("cannot open '{}'", resolved));
	}
	std::istream* stream = file.get();
	frames_.push_back({ std::move(resolved), stream, std::move(file), 0 });
}

void rpm::LineSource::push(const std::string& name, std::istream& in) {
	frames_.push_back({ name, &in, nullptr, 0 });
}

void rpm::LineSource::pop() {
	InputFrame& top = frames_.back();
	lastName_ = top.name;
	lastLine_ = top.lineNo;
	if (top.owned) {
		top.owned->close();
	}
	frames_.pop_back();
}

auto rpm::LineSource::nextLine() -> std::optional<std::string> {
	std::string line;
	while (!frames_.empty()) {
		InputFrame& top = frames_.back();
		if (std::getline(*top.stream, line)) {
			++top.lineNo;
			if (!line.empty() and line.back() == '\r') {
				line.pop_back();
			}
			return line;
		}
		pop();
	}
	return std::nullopt;
}

auto rpm::LineSource::location() const -> std::string {
	if (frames_.empty()) {
		return fmt::format("{}:{}", lastName_, lastLine_);
	}
	return fmt::format("{}:{}", frames_.back().name, frames_.back().lineNo);
}

void rpm::warn(std::ostream& diag, const LineSource& src, std::string_view msg) {
	fmt::print(diag, "{}: warning: {}\n", src.location(), msg);
}

void rpm::fail(const LineSource& src, std::string_view msg) {
	throw FatalError{ fmt::format("{}: error: {}", src.location(), msg) };
}
