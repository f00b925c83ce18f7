// RoffParseMan.h : public interface of the man-page converter.
#ifndef ROFF_PARSE_MAN_H
#define ROFF_PARSE_MAN_H
#include <iosfwd>
#include <string>
#include <string_view>
#include <optional>
#include <stdexcept>
#include "BlockInfoTags.h"
#include "roffparseman_export.h"

namespace roff_parseman {
	namespace impl {
		struct Context;
	}

	enum class OutputStyle : uint8_t {
		Html,
		FrontMatter,
		Raw,
		Doxygen
	};

	struct ConvertOptions {
		OutputStyle style = OutputStyle::Html;
		std::optional<std::string> permalink;
	};

	class ROFFPARSEMAN_EXPORT FatalError : public std::runtime_error {
	public:
		explicit FatalError(const std::string& what) : std::runtime_error{ what } {}
	};

	// Throws FatalError for anything other than html, frontmatter, raw or doxygen.
	ROFFPARSEMAN_EXPORT auto parseOutputStyle(std::string_view name) -> OutputStyle;

	class Converter {
	public:
		Converter(const Converter&) = delete;
		Converter& operator=(const Converter&) = delete;
		ROFFPARSEMAN_EXPORT Converter(Converter&& o) noexcept;

		ROFFPARSEMAN_EXPORT Converter(ConvertOptions options, std::ostream& out);
		ROFFPARSEMAN_EXPORT Converter(ConvertOptions options, std::ostream& out, std::ostream& diag);
		ROFFPARSEMAN_EXPORT virtual ~Converter();

		/// Push a named source ("-" is standard input) onto the input stack.
		ROFFPARSEMAN_EXPORT void open(const std::string& name);
		/// Push a caller-owned stream; it must outlive the conversion.
		ROFFPARSEMAN_EXPORT void push(const std::string& name, std::istream& in);

		/// Reads and converts one logical line. Returns false once all input is consumed.
		ROFFPARSEMAN_EXPORT bool processLine();

		/// Closes whatever is still open and writes the trailer. Safe to call twice.
		ROFFPARSEMAN_EXPORT void finalizeDocument();
	private:
		impl::Context* ctx_;
	};

	ROFFPARSEMAN_EXPORT auto manToHtml(std::string str, OutputStyle style = OutputStyle::Html) -> std::string;
	ROFFPARSEMAN_EXPORT auto manToHtml(std::istream& in, OutputStyle style = OutputStyle::Html) -> std::string;

}

#endif
