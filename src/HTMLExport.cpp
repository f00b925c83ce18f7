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
#include "RoffParseImpl.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace rpm = roff_parseman::impl;

auto roff_parseman::parseOutputStyle(std::string_view name) -> OutputStyle {
	std::string lowered{ name };
	std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "html") {
		return OutputStyle::Html;
	}
	if (lowered == "frontmatter" or lowered == "front-matter") {
		return OutputStyle::FrontMatter;
	}
	if (lowered == "raw") {
		return OutputStyle::Raw;
	}
	if (lowered == "doxygen") {
		return OutputStyle::Doxygen;
	}
	throw FatalError{ fmt::format("error: unknown output style '{}'", name) };
}

auto rpm::sectionDescription(std::string_view section) -> std::optional<std::string_view> {
	if (section.empty()) {
		return std::nullopt;
	}
	switch (section.front()) {
	case '1': return "User Commands";
	case '2': return "System Calls";
	case '3': return "Library Functions";
	case '4': return "Special Files";
	case '5': return "File Formats";
	case '6': return "Games";
	case '7': return "Miscellaneous";
	case '8': return "System Administration";
	default: return std::nullopt;
	}
}

auto rpm::titleHeader(const ConvertOptions& options, const TitleInfo& info) -> std::vector<std::string> {
	const std::string heading = info.section.empty() ? info.title : fmt::format("{}({})", info.title, info.section);
	std::vector<std::string> lines{};
	switch (options.style) {
	case OutputStyle::Html:
		lines = {
			"<!DOCTYPE html>",
			"<html>",
			"<head>",
			"<meta http-equiv=\"Content-Type\" content=\"text/html; charset=UTF-8\">",
			fmt::format("<title>{}</title>", heading),
			"</head>",
			"<body>"
		};
		break;
	case OutputStyle::FrontMatter:
		lines.emplace_back("---");
		if (options.permalink) {
			lines.push_back(fmt::format("permalink: {}", *options.permalink));
		}
		lines.emplace_back("layout: manpage");
		lines.push_back(fmt::format("title: {}", heading));
		if (!info.source.empty()) {
			lines.push_back(fmt::format("package: {}", info.source));
		}
		if (!info.date.empty()) {
			lines.push_back(fmt::format("date: {}", info.date));
		}
		if (auto desc = sectionDescription(info.section)) {
			lines.push_back(fmt::format("description: {}", *desc));
		}
		lines.emplace_back("---");
		break;
	case OutputStyle::Doxygen:
		lines.emplace_back("/*!");
		lines.push_back(fmt::format("\\page {} {}", info.title, heading));
		break;
	case OutputStyle::Raw:
		break;
	}
	return lines;
}

auto rpm::titleTrailer(OutputStyle style) -> std::optional<std::string> {
	switch (style) {
	case OutputStyle::Html: return std::string{ "</body>\n</html>" };
	case OutputStyle::Doxygen: return std::string{ "*/" };
	default: return std::nullopt;
	}
}

auto roff_parseman::manToHtml(std::string str, OutputStyle style) -> std::string {
	std::istringstream in{ std::move(str) };
	return manToHtml(in, style);
}

auto roff_parseman::manToHtml(std::istream& in, OutputStyle style) -> std::string {
	std::ostringstream sout{};
	Converter converter{ ConvertOptions{ style, std::nullopt }, sout, std::cerr };
	converter.push("<string>", in);
	bool success = true;
	while (success) {
		success = converter.processLine();
	}
	converter.finalizeDocument();
	return sout.str();
}
