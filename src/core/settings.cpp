#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <mediaq/settings.hpp>
#include <set>
#include <utility>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace mediaq {

namespace {

constexpr const char *kAppDirName = "mediaq";

const std::set<std::string> &known_keys() {
	static const std::set<std::string> keys = {
		"max_concurrent",	 "max_concurrent_downloads",
		"destination_root",	 "download_dir",
		"output_template",	 "cookies_file",
		"max_retries",		 "retry_backoff_ms",
		"retry_backoff_max_ms", "idle_timeout_ms",
		"progress_interval_ms", "progress_bytes",
		"poll_interval_ms",	 "event_buffer",
		"resolver_threads"};
	return keys;
}

// Reads `key` into `out` when present; a present key of the wrong type is an
// error rather than a silent default.
template <typename T>
Result<void> read_key(const nlohmann::json &j, const char *key, T &out) {
	if (!utils::path_exists(j, key)) return outcome::success();
	auto value = utils::traverse_obj<T>(j, key);
	if (!value) {
		return fail(errc::invalid_settings,
					fmt::format("'{}' has the wrong type", key));
	}
	out = std::move(*value);
	return outcome::success();
}

// Integers go through long long and a range check, so a negative count
// never wraps into an unsigned field and nothing is silently truncated.
template <typename T>
Result<void> read_int(const nlohmann::json &j, const char *key, T &out) {
	if (!utils::path_exists(j, key)) return outcome::success();
	const auto &value = j.at(key);
	if (!value.is_number_integer()) {
		return fail(errc::invalid_settings,
					fmt::format("'{}' must be an integer", key));
	}
	if (value.is_number_unsigned() &&
		value.get<std::uint64_t>() >
			static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
		return fail(errc::invalid_settings, fmt::format("'{}' is out of range", key));
	}
	const auto wide = value.get<long long>();
	if (!std::in_range<T>(wide)) {
		return fail(errc::invalid_settings,
					fmt::format("'{}' is out of range: {}", key, wide));
	}
	out = static_cast<T>(wide);
	return outcome::success();
}

Result<void> read_ms(const nlohmann::json &j, const char *key,
					 std::chrono::milliseconds &out) {
	long long ms = out.count();
	BOOST_OUTCOME_TRYV(read_int(j, key, ms));
	out = std::chrono::milliseconds(ms);
	return outcome::success();
}

}  // namespace

fs::path Settings::default_destination_root() {
	if (const char *xdg = std::getenv("XDG_VIDEOS_DIR"); xdg && *xdg) {
		return fs::path(xdg) / kAppDirName;
	}
	if (const char *home = std::getenv("HOME"); home && *home) {
		return fs::path(home) / "Videos" / kAppDirName;
	}
	return fs::current_path() / kAppDirName;
}

TransferOptions Settings::transfer_options() const {
	TransferOptions options;
	options.progress_interval = progress_interval;
	options.progress_bytes = progress_bytes;
	options.idle_timeout = idle_timeout;
	options.poll_interval = poll_interval;
	return options;
}

Credentials Settings::credentials() const { return Credentials{cookies_file}; }

std::chrono::milliseconds Settings::backoff_for(int attempt) const {
	auto delay = retry_backoff;
	for (int i = 1; i < attempt && delay < retry_backoff_max; ++i) delay *= 2;
	return std::min(delay, retry_backoff_max);
}

Result<void> validate(const Settings &s) {
	using std::chrono::milliseconds;

	if (s.max_concurrent < 1) {
		return fail(errc::invalid_concurrency_limit,
					fmt::format("{} (must be at least 1)", s.max_concurrent));
	}
	if (s.destination_root.empty())
		return fail(errc::invalid_settings, "destination_root is empty");
	if (s.output_template.empty())
		return fail(errc::invalid_settings, "output_template is empty");
	if (s.max_retries < 0)
		return fail(errc::invalid_settings, "max_retries is negative");
	if (s.retry_backoff < milliseconds::zero() ||
		s.retry_backoff_max < s.retry_backoff) {
		return fail(errc::invalid_settings,
					"retry backoff must be >= 0 and <= retry_backoff_max");
	}
	if (s.idle_timeout <= milliseconds::zero())
		return fail(errc::invalid_settings, "idle_timeout must be positive");
	if (s.progress_interval <= milliseconds::zero() || s.progress_bytes <= 0)
		return fail(errc::invalid_settings,
					"progress sampling thresholds must be positive");
	if (s.poll_interval <= milliseconds::zero() ||
		s.poll_interval > kMaxPollInterval) {
		return fail(errc::invalid_settings,
					fmt::format("poll_interval must be in (0, {}] ms",
								kMaxPollInterval.count()));
	}
	if (s.event_buffer == 0)
		return fail(errc::invalid_settings, "event_buffer must be positive");
	if (s.resolver_threads < 1)
		return fail(errc::invalid_settings,
					"resolver_threads must be at least 1");
	return outcome::success();
}

Result<Settings> parse_settings(const nlohmann::json &j, Settings base) {
	if (!j.is_object())
		return fail(errc::invalid_settings, "settings must be a JSON object");

	for (const auto &item : j.items()) {
		if (!known_keys().count(item.key())) {
			spdlog::warn("Ignoring unknown setting '{}'", item.key());
		}
	}

	// Names used by the desktop application's settings.json come first so
	// the native names win when both are present
	BOOST_OUTCOME_TRYV(read_int(j, "max_concurrent_downloads", base.max_concurrent));
	BOOST_OUTCOME_TRYV(read_int(j, "max_concurrent", base.max_concurrent));

	std::string root = base.destination_root.string();
	BOOST_OUTCOME_TRYV(read_key(j, "download_dir", root));
	BOOST_OUTCOME_TRYV(read_key(j, "destination_root", root));
	base.destination_root = root;

	BOOST_OUTCOME_TRYV(read_key(j, "output_template", base.output_template));

	if (utils::path_exists(j, "cookies_file")) {
		if (j.at("cookies_file").is_null()) {
			base.cookies_file.reset();
		} else {
			std::string cookies;
			BOOST_OUTCOME_TRYV(read_key(j, "cookies_file", cookies));
			if (cookies.empty()) {
				base.cookies_file.reset();
			} else {
				base.cookies_file = fs::path(cookies);
			}
		}
	}

	BOOST_OUTCOME_TRYV(read_int(j, "max_retries", base.max_retries));
	BOOST_OUTCOME_TRYV(read_ms(j, "retry_backoff_ms", base.retry_backoff));
	BOOST_OUTCOME_TRYV(read_ms(j, "retry_backoff_max_ms", base.retry_backoff_max));
	BOOST_OUTCOME_TRYV(read_ms(j, "idle_timeout_ms", base.idle_timeout));
	BOOST_OUTCOME_TRYV(read_ms(j, "progress_interval_ms", base.progress_interval));
	BOOST_OUTCOME_TRYV(read_int(j, "progress_bytes", base.progress_bytes));
	BOOST_OUTCOME_TRYV(read_ms(j, "poll_interval_ms", base.poll_interval));
	BOOST_OUTCOME_TRYV(read_int(j, "event_buffer", base.event_buffer));
	BOOST_OUTCOME_TRYV(read_int(j, "resolver_threads", base.resolver_threads));

	BOOST_OUTCOME_TRYV(validate(base));
	return base;
}

Result<Settings> load_settings(const fs::path &path, Settings base) {
	std::ifstream in(path);
	if (!in.is_open()) {
		return fail(errc::invalid_settings, "cannot open " + path.string());
	}

	nlohmann::json j;
	try {
		in >> j;
	} catch (const nlohmann::json::parse_error &e) {
		return fail(errc::invalid_settings,
					fmt::format("{}: {}", path.string(), e.what()));
	}

	spdlog::debug("Loaded settings from {}", path.string());
	return parse_settings(j, std::move(base));
}

void to_json(nlohmann::json &j, const Settings &s) {
	j = nlohmann::json{
		{"max_concurrent", s.max_concurrent},
		{"destination_root", s.destination_root.string()},
		{"output_template", s.output_template},
		{"cookies_file", s.cookies_file ? nlohmann::json(s.cookies_file->string())
										: nlohmann::json(nullptr)},
		{"max_retries", s.max_retries},
		{"retry_backoff_ms", s.retry_backoff.count()},
		{"retry_backoff_max_ms", s.retry_backoff_max.count()},
		{"idle_timeout_ms", s.idle_timeout.count()},
		{"progress_interval_ms", s.progress_interval.count()},
		{"progress_bytes", s.progress_bytes},
		{"poll_interval_ms", s.poll_interval.count()},
		{"event_buffer", s.event_buffer},
		{"resolver_threads", s.resolver_threads}};
}

}  // namespace mediaq
