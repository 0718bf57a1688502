#pragma once

#include <boost/regex.hpp>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace mediaq {

namespace detail {
constexpr std::size_t MAX_FILENAME_LENGTH = 180;
constexpr unsigned char MAX_ASCII = 127;

inline bool is_utf8_continuation(char c) {
	return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}
}  // namespace detail

/// Values available to an output template.
struct OutputFields {
	std::string title;
	std::string id;
	std::string variant_id;
	std::string ext;
	std::string resolution;
	int fps = 0;
};

/// Sanitize a title into a file name: anything outside letters, digits,
/// "_-.()[]" and space becomes '_', runs of spaces/underscores collapse into
/// one space, the result is capped and never empty.
inline std::string sanitize_filename(std::string_view name) {
	// Trim surrounding whitespace first
	auto first = name.find_first_not_of(" \t\r\n");
	auto last = name.find_last_not_of(" \t\r\n");
	if (first == std::string_view::npos) return "video";
	name = name.substr(first, last - first + 1);

	std::string result;
	result.reserve(name.size());
	for (char c : name) {
		auto uc = static_cast<unsigned char>(c);
		if (uc > detail::MAX_ASCII) {
			// Keep UTF-8 sequences intact
			result += c;
			continue;
		}
		switch (c) {
			case '_':
			case '-':
			case '.':
			case '(':
			case ')':
			case '[':
			case ']':
			case ' ': result += c; break;
			default:
				result += std::isalnum(uc) ? c : '_';
				break;
		}
	}

	static const boost::regex separators("[ _]+");
	result = boost::regex_replace(result, separators, " ");

	if (result.size() > detail::MAX_FILENAME_LENGTH) {
		std::size_t cut = detail::MAX_FILENAME_LENGTH;
		while (cut > 0 && detail::is_utf8_continuation(result[cut])) --cut;
		result.resize(cut);
	}

	// Trim trailing spaces and dots (Windows issues)
	while (!result.empty() && (result.back() == ' ' || result.back() == '.')) {
		result.pop_back();
	}

	if (result.empty()) { result = "video"; }

	return result;
}

/// Expand an output template using %(field)s syntax.
/// Supported fields: title, id, variant_id, ext, resolution, fps
inline std::string expand_output_template(std::string_view tpl,
										  const OutputFields &fields) {
	std::string result(tpl);

	auto replace_field =
		[&result](const std::string &field, const std::string &value) {
			// Match %(field)s or %(field).Ns patterns
			boost::regex pattern("%\\(" + field + "\\)(?:\\.\\d+)?s");
			// Literal replacement, titles may contain '$' or '\'
			result = boost::regex_replace(
				result, pattern, value,
				boost::regex_constants::format_literal);
		};

	replace_field("title", sanitize_filename(fields.title));
	replace_field("id", fields.id);
	replace_field("variant_id", sanitize_filename(fields.variant_id));
	replace_field("ext", fields.ext);
	replace_field("resolution", fields.resolution);
	replace_field("fps", fields.fps > 0 ? std::to_string(fields.fps) : "");

	return result;
}

/// Returns `path` when free, otherwise "name (1).ext", "name (2).ext", ...
inline std::filesystem::path ensure_unique_path(
	const std::filesystem::path &path) {
	std::error_code ec;
	if (!std::filesystem::exists(path, ec)) return path;

	const auto stem = path.stem().string();
	const auto ext = path.extension().string();
	for (int counter = 1;; ++counter) {
		auto candidate = path.parent_path() /
						 (stem + " (" + std::to_string(counter) + ")" + ext);
		if (!std::filesystem::exists(candidate, ec)) return candidate;
	}
}

}  // namespace mediaq
