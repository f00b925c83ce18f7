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

#include <cctype>
#include <string>
#include "RoffParseImpl.h"
#include <fmt/format.h>

namespace rpm = roff_parseman::impl;

auto rpm::FragmentRegistry::normalize(std::string_view rawText) -> std::string {
	std::string key{};
	key.reserve(rawText.size());
	bool inTag = false;
	bool pendingSeparator = false;
	for (char c : rawText) {
		if (inTag) {
			inTag = c != '>';
			continue;
		}
		if (c == '<') {
			inTag = true;
			continue;
		}
		if (c == '"') {
			continue;
		}
		if (std::isspace(static_cast<unsigned char>(c))) {
			pendingSeparator = !key.empty();
			continue;
		}
		if (pendingSeparator) {
			key.push_back('_');
			pendingSeparator = false;
		}
		key.push_back(c);
	}
	return key;
}

auto rpm::FragmentRegistry::allocate(std::string_view rawText) -> std::string {
	const std::string base = normalize(rawText);
	std::string key = base;
	for (unsigned suffix = 2; used_.count(key) != 0; ++suffix) {
		key = fmt::format("{}_{}", base, suffix);
	}
	used_.insert(key);
	return key;
}
