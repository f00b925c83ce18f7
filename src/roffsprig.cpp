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


#include <fstream>
#include <iostream>
#include <utility>
#include <string>

#include <CLI/CLI.hpp>
#include "roff_parseman/RoffParseMan.h"

namespace roffsprig {
	struct CmdArgInfo {
		std::string input = "-";
		std::string output;
		std::string style = "html";
		std::string permalink;
	};
}

void configureParser(CLI::App& cmdArgParser, roffsprig::CmdArgInfo& argInfo);
auto makeOptions(const CLI::App& argProcessor, const roffsprig::CmdArgInfo& argInfo) -> roff_parseman::ConvertOptions;
void convert(roff_parseman::Converter& converter, const std::string& input);

int main(int argc, char* argv[])
{
	roffsprig::CmdArgInfo cmdArgResult{};

	CLI::App argProcessor{ "A man page (roff man macro) to html converter.", "roffsprig" };

	configureParser(argProcessor, cmdArgResult);

	CLI11_PARSE(argProcessor, argc, argv);

	try {
		auto options = makeOptions(argProcessor, cmdArgResult);
		if (cmdArgResult.output.empty()) {
			roff_parseman::Converter converter{ std::move(options), std::cout };
			convert(converter, cmdArgResult.input);
			return std::cout ? 0 : 1;
		}

		std::ofstream outFile{ cmdArgResult.output };
		if (!outFile) {
			throw roff_parseman::FatalError{ "error: cannot open output '" + cmdArgResult.output + "'" };
		}
		{
			roff_parseman::Converter converter{ std::move(options), outFile };
			convert(converter, cmdArgResult.input);
		}
		outFile.close();
		if (!outFile) {
			throw roff_parseman::FatalError{ "error: cannot close output '" + cmdArgResult.output + "'" };
		}
	}
	catch (const roff_parseman::FatalError& e) {
		std::cerr << e.what() << "\n";
		return 1;
	}
	return 0;
}

void configureParser(CLI::App& cmdArgParser, roffsprig::CmdArgInfo& argInfo) {
	cmdArgParser.add_option("input", argInfo.input, "Man page to convert; - reads standard input");
	cmdArgParser.add_option("-o, --output", argInfo.output, "Output file as this filename");
	cmdArgParser.add_option("-s, --style", argInfo.style, "Output style: html, frontmatter, raw or doxygen");
	cmdArgParser.add_option("--permalink", argInfo.permalink, "Permalink written into the front matter");
}

auto makeOptions(const CLI::App& argProcessor, const roffsprig::CmdArgInfo& argInfo) -> roff_parseman::ConvertOptions {
	roff_parseman::ConvertOptions options{};
	options.style = roff_parseman::parseOutputStyle(argInfo.style);
	if (argProcessor.count("--permalink") != 0) {
		options.permalink = argInfo.permalink;
	}
	return options;
}

void convert(roff_parseman::Converter& converter, const std::string& input) {
	converter.open(input);
	bool success = true;
	while (success) {
		success = converter.processLine();
	}
	converter.finalizeDocument();
}
