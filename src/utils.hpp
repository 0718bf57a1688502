#pragma once

#include <boost/charconv.hpp>
#include <cmath>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace mediaq::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
std::optional<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return std::nullopt;
}

inline std::optional<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

// =============================================================================
// JSON Traversal Utilities
// =============================================================================

/// Read `key` from a JSON object as T. Returns std::nullopt when the key is
/// missing or holds a value of the wrong type.
template <typename T>
std::optional<T> traverse_obj(const nlohmann::json &j, std::string_view key) {
	if (!j.is_object()) return std::nullopt;
	auto it = j.find(std::string(key));
	if (it == j.end()) return std::nullopt;

	try {
		return it->get<T>();
	} catch (const nlohmann::json::exception &) { return std::nullopt; }
}

/// Check if a key exists in a JSON object
inline bool path_exists(const nlohmann::json &j, std::string_view key) {
	return j.is_object() && j.find(std::string(key)) != j.end();
}

// =============================================================================
// Presentation helpers
// =============================================================================

/// 1536 -> "1.5 KB". Empty for zero or negative values.
inline std::string human_readable_bytes(double num_bytes) {
	if (!(num_bytes > 0)) return "";
	static constexpr const char *kUnits[] = {"B", "KB", "MB", "GB", "TB"};
	constexpr int kLast = 4;
	int idx = static_cast<int>(std::log(num_bytes) / std::log(1024.0));
	if (idx < 0) idx = 0;
	if (idx > kLast) idx = kLast;
	double value = num_bytes / std::pow(1024.0, idx);
	return fmt::format("{:.1f} {}", value, kUnits[idx]);
}

/// 3723 -> "1h 02m 03s", 245 -> "4m 05s", 7 -> "7s". Empty when unknown.
inline std::string human_readable_eta(std::optional<double> seconds) {
	if (!seconds || !(*seconds > 0)) return "";
	auto total = static_cast<long long>(*seconds);
	long long h = total / 3600;
	long long m = (total % 3600) / 60;
	long long s = total % 60;
	if (h > 0) return fmt::format("{}h {:02}m {:02}s", h, m, s);
	if (m > 0) return fmt::format("{}m {:02}s", m, s);
	return fmt::format("{}s", s);
}

}  // namespace mediaq::utils
