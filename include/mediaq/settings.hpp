#pragma once

#include <mediaq/mediaq_export.h>

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <mediaq/result.hpp>
#include <mediaq/transfer.hpp>
#include <mediaq/types.hpp>

namespace mediaq {

// Cancellation must be observed within this bound
constexpr std::chrono::milliseconds kMaxPollInterval{200};

/// Every tunable of the queue. All of it may be changed while jobs run;
/// destination_root and output_template only affect jobs started later.
struct MEDIAQ_EXPORT Settings {
	int max_concurrent = 2;
	std::filesystem::path destination_root = default_destination_root();
	std::string output_template = "%(title)s.%(ext)s";
	std::optional<std::filesystem::path> cookies_file;

	int max_retries = 3;
	std::chrono::milliseconds retry_backoff{1000};
	std::chrono::milliseconds retry_backoff_max{30000};

	std::chrono::milliseconds idle_timeout{30000};
	std::chrono::milliseconds progress_interval{250};
	long long progress_bytes = 4LL * 1024 * 1024;
	std::chrono::milliseconds poll_interval{100};

	std::size_t event_buffer = 256;
	int resolver_threads = 4;

	/// $XDG_VIDEOS_DIR or $HOME/Videos, plus "mediaq".
	static std::filesystem::path default_destination_root();

	[[nodiscard]] TransferOptions transfer_options() const;
	[[nodiscard]] Credentials credentials() const;

	/// Delay before automatic retry number `attempt` (1-based).
	[[nodiscard]] std::chrono::milliseconds backoff_for(int attempt) const;
};

MEDIAQ_EXPORT Result<void> validate(const Settings &settings);

/// Overlay the keys present in `j` on `base`. Durations use "<name>_ms".
MEDIAQ_EXPORT Result<Settings> parse_settings(const nlohmann::json &j,
											  Settings base = {});

MEDIAQ_EXPORT Result<Settings> load_settings(const std::filesystem::path &path,
											 Settings base = {});

MEDIAQ_EXPORT void to_json(nlohmann::json &j, const Settings &s);

}  // namespace mediaq
