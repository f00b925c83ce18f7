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
#include <vector>
#include "RoffParseImpl.h"

#include "tao/pegtl.hpp"

namespace rofflang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct whitespace0 : one<' ', '\t'> {};
	struct escaped_space : seq<one<'\\'>, one<' '>> {};
	struct bare_char : sor<escaped_space, not_one<' ', '\t'>> {};
	struct bare_word : plus<bare_char> {};
	struct quoted_body : star<not_one<'"'>> {};
	struct quoted_word : seq<one<'"'>, quoted_body, sor<one<'"'>, eof>> {};
	struct word : sor<quoted_word, bare_word> {};
	struct request_line : seq<star<whitespace0>, opt<list<word, star<whitespace0>>>, star<whitespace0>, eof> {};

	template <typename Rule>
	struct split_action : nothing<Rule> {};

	template <>
	struct split_action<bare_word> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, std::vector<std::string>& words) {
			std::string w;
			w.reserve(in.size());
			for (auto p = in.begin(); p != in.end(); ++p) {
				if (*p == '\\' and p + 1 != in.end() and *(p + 1) == ' ') {
					continue;
				}
				w.push_back(*p);
			}
			words.push_back(std::move(w));
		}
	};
	template <>
	struct split_action<quoted_body> : require_apply {
		template <typename ParseInput>
		static void apply(const ParseInput& in, std::vector<std::string>& words) {
			words.push_back(in.string());
		}
	};
}

auto roff_parseman::impl::splitRequest(std::string_view text) -> std::vector<std::string> {
	namespace peggi = TAO_PEGTL_NAMESPACE;
	std::vector<std::string> words{};
	peggi::memory_input<peggi::tracking_mode::eager> input{ text.data(), text.data() + text.size(), "request" };
	if (not peggi::parse<rofflang::request_line, rofflang::split_action>(input, words)) {
		words.clear();
	}
	return words;
}
