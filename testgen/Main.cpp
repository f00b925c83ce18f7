#include <iostream>
#include <fstream>
#include <cctype>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include "StringParts.h"

std::string outResult(nlohmann::json& jc, int indentLvl);
std::string func(nlohmann::json& jc, int indentLvl);
std::string body_(nlohmann::json::const_iterator it, size_t n, int indentLvl);
std::map<nlohmann::json::iterator, size_t> organizeJson(nlohmann::json& root);
std::string styleName(const nlohmann::json& example);

template<char OldVal, char NewVal, bool NeedEscape>
void escapeBackslashString(std::string& str);
void keepIdentifierChars(std::string& str);

// roffpm_testgen <examples.json> <generated.cpp>
int main(int argc, char** argv) {
	if (argc != 3) {
		std::cerr << "usage: roffpm_testgen <examples.json> <generated.cpp>\n";
		return 1;
	}
	nlohmann::json jcee{};
	std::ifstream fileIn{ argv[1] };
	if (!fileIn) {
		std::cerr << "File not found: " << argv[1] << "\n";
		return 1;
	}
	try {
		fileIn >> jcee;
	}
	catch (const nlohmann::json::exception& e) {
		std::cerr << argv[1] << ": " << e.what() << "\n";
		return 1;
	}
	for (auto& el : jcee) {
		for (const char* field : { "roff", "html" }) {
			auto& arg = el[field].get_ref<std::string&>();
			escapeBackslashString<'\\', '\\', true>(arg);
			escapeBackslashString<'\n', 'n', true>(arg);
			escapeBackslashString<'\t', 't', true>(arg);
			escapeBackslashString<'"', '"', true>(arg);
		}
		keepIdentifierChars(el["section"].get_ref<std::string&>());
	}

	std::ofstream fileOut{ argv[2] };
	fileOut << outResult(jcee, 0);
	fileOut.close();
	if (!fileOut) {
		std::cerr << "Could not write " << argv[2] << "\n";
		return 1;
	}
	return 0;
}

std::string outResult(nlohmann::json& jc, int indentLvl) {
	return std::string{ includes } + anonNamespaceBegin + func(jc, indentLvl + 1) + anonNamespaceEnd;
}

std::string func(nlohmann::json& jc, int indentLvl) {
	std::string testName = "RoffPMExamples";
	auto groups = organizeJson(jc);
	std::string res{};
	for (auto it = groups.begin(); it != groups.end(); ++it) {
		res.append(fmt::format("{0: <{3}}TEST({1}, {2}) {{\n{4}{0: <{3}}}}\n\n", "", testName,
			(*it->first)["section"].get_ref<const std::string&>(), indentLvl * 4, body_(it->first, it->second, indentLvl + 1)));
	}
	return res;
}

std::string body_(nlohmann::json::const_iterator it, size_t n, int indentLvl) {
	std::string res{};
	const std::string section = (*it)["section"].get<std::string>();
	for (size_t emitted = 0; emitted < n; ++it) {
		if ((*it)["section"].get_ref<const std::string&>() != section) {
			continue;
		}
		res.append(fmt::format("{0: <{4}}auto str{3:0>4d} = roff_parseman::manToHtml(\"{1}\", {5}{6});\n"
			"{0: <{4}}EXPECT_STREQ(str{3:0>4d}.c_str(), \"{2}\");\n\n", "",
			(*it)["roff"].get_ref<const std::string&>(), (*it)["html"].get_ref<const std::string&>(),
			(*it)["example"].get<unsigned int>(), indentLvl * 4, styleEnumPrefix, styleName(*it)));
		++emitted;
	}
	return res;
}

// first entry of each section, mapped to how many entries share that section
std::map<nlohmann::json::iterator, size_t> organizeJson(nlohmann::json& root) {
	std::map<nlohmann::json::iterator, size_t> res{};
	std::map<std::string, nlohmann::json::iterator> lookup{};
	for (auto it = root.begin(); it != root.end(); ++it) {
		const auto& section = (*it)["section"].get_ref<const std::string&>();
		if (auto found = lookup.find(section); found != lookup.end()) {
			res[found->second]++;
		}
		else {
			lookup.emplace(section, it);
			res.emplace(it, 1);
		}
	}
	return res;
}

std::string styleName(const nlohmann::json& example) {
	const std::string style = example.value("style", "html");
	if (style == "frontmatter") {
		return "FrontMatter";
	}
	if (style == "raw") {
		return "Raw";
	}
	if (style == "doxygen") {
		return "Doxygen";
	}
	return "Html";
}

template<char OldVal, char NewVal, bool NeedEscape=false>
void escapeBackslashString(std::string& str) {
	for (size_t i = 0; i < str.size(); ++i) {
		if (i = str.find(OldVal, i); i != std::string::npos) {
			str[i] = NewVal;
			if (NeedEscape) {
				str.insert(str.begin() + i, '\\');
				++i;
			}
		}
		else {
			break;
		}
	}
}

void keepIdentifierChars(std::string& str) {
	std::string kept{};
	for (char c : str) {
		if (std::isalnum(static_cast<unsigned char>(c)) or c == '_') {
			kept.push_back(c);
		}
	}
	str = kept;
}
