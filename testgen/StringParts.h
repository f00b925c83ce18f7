#ifndef STRING_PARTS_H
#define STRING_PARTS_H
#include <string_view>
using tgstr = const char*;
using tgsv = std::string_view;

tgstr includes =
"// Generated by roffpm_testgen; edit test/cases/roff_examples.json instead.\n"
"#include \"roff_parseman/RoffParseMan.h\"\n#include <gtest/gtest.h>\n\n";

tgstr anonNamespaceBegin = "namespace {\n";
tgstr anonNamespaceEnd = "}\n";

tgsv styleEnumPrefix = "roff_parseman::OutputStyle::";

#endif
