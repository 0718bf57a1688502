#pragma once

#include <mediaq/mediaq_export.h>

#include <boost/outcome.hpp>
#include <string>
#include <system_error>

namespace mediaq {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Resolution errors
	unsupported_url = 10,
	network_unavailable,
	auth_required,
	no_variants_found,

	// Transfer errors
	io_error = 20,
	stream_error,
	canceled,

	// Usage errors
	not_found = 30,
	invalid_state,
	invalid_concurrency_limit,

	// Settings
	invalid_settings = 40,

	unknown = 100
};

enum class error_group { none, resolution, transfer, usage, settings, other };

MEDIAQ_EXPORT const std::error_category &mediaq_category();
MEDIAQ_EXPORT std::error_code make_error_code(errc e);

MEDIAQ_EXPORT error_group group_of(const std::error_code &ec);

// Only transfer failures that may succeed on a second attempt.
MEDIAQ_EXPORT bool is_retryable(const std::error_code &ec);

}  // namespace mediaq

namespace std {
template <>
struct is_error_code_enum<mediaq::errc> : true_type {};
}  // namespace std

namespace mediaq {

/// Error payload carried by every Result: the code plus a detail string
/// naming the offending job, state, variant or setting.
struct MEDIAQ_EXPORT Error {
	std::error_code code;
	std::string detail;

	Error() = default;
	Error(std::error_code ec, std::string d = {})
		: code(ec), detail(std::move(d)) {}
	Error(errc e, std::string d = {})
		: code(make_error_code(e)), detail(std::move(d)) {}

	[[nodiscard]] std::string message() const;
};

inline bool operator==(const Error &a, const Error &b) {
	return a.code == b.code && a.detail == b.detail;
}

// Lets Outcome treat Error as an error code.
inline const std::error_code &make_error_code(const Error &e) {
	return e.code;
}

[[noreturn]] MEDIAQ_EXPORT void outcome_throw_as_system_error_with_payload(
	const Error &e);

template <typename T>
using Result = outcome::result<T, Error>;

inline auto fail(errc e, std::string detail = {}) {
	return outcome::failure(Error{e, std::move(detail)});
}

}  // namespace mediaq
