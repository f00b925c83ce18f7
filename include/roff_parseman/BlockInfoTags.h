#ifndef ROFF_BLOCK_INFO_TAGS_H
#define ROFF_BLOCK_INFO_TAGS_H
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace roff_parseman {

	enum class Font : uint8_t {
		Roman,
		Bold,
		Italic
	};

	struct FontState {
		Font current = Font::Roman;
		Font previous = Font::Roman;

		bool operator==(const FontState& rhs) const noexcept { return current == rhs.current and previous == rhs.previous; }
		bool operator!=(const FontState& rhs) const noexcept { return !operator==(rhs); }
	};

	// one entry per margin level
	enum class BlockMode : uint8_t {
		Paragraph,
		BulletList,
		DefinitionList
	};

	struct ColumnFormat {
		enum class align_e : char {
			Left = 'l',
			Right = 'r',
			Center = 'c',
			Numeric = 'n',
			Span = 's',
			HRule = '_'
		};
		enum class rule_e : uint8_t {
			None, Single, Double
		};
		align_e align = align_e::Left;
		bool bold = false;
		bool italic = false;
		rule_e ruleBefore = rule_e::None;
		rule_e ruleAfter = rule_e::None;
	};

	using FormatLine = std::vector<ColumnFormat>;

	struct TableOptions {
		std::string alignment;
		bool boxed = false;
		char separator = '\t';
	};

	struct TableSpec {
		std::vector<FormatLine> formats;
		TableOptions options;
		std::vector<std::string> rows;
	};

}

#endif
