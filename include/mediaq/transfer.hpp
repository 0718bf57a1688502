#pragma once

#include <mediaq/mediaq_export.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <mediaq/resolver.hpp>
#include <mediaq/result.hpp>

namespace mediaq {

struct MEDIAQ_EXPORT TransferOptions {
	std::chrono::milliseconds progress_interval{250};
	long long progress_bytes = 4LL * 1024 * 1024;
	std::chrono::milliseconds idle_timeout{30000};
	// Upper bound of one blocking read, and so of cancellation latency
	std::chrono::milliseconds poll_interval{100};
	std::chrono::milliseconds speed_half_life{2000};
	std::size_t buffer_size = 256 * 1024;
	std::string temp_suffix = ".part";
};

/// Options shared between the queue and its running transfers. A transfer
/// re-reads the timing fields on every loop iteration, so `set` reaches
/// transfers that are already in flight.
class MEDIAQ_EXPORT LiveTransferOptions {
   public:
	explicit LiveTransferOptions(TransferOptions options);

	[[nodiscard]] std::shared_ptr<const TransferOptions> get() const;
	void set(TransferOptions options);

   private:
	mutable std::mutex mutex_;
	std::shared_ptr<const TransferOptions> current_;
};

enum class StopReason : std::uint8_t { none, pause, cancel };

struct MEDIAQ_EXPORT ProgressSample {
	long long bytes_transferred = 0;
	std::optional<long long> total_bytes;
	double speed_bytes_per_sec = 0.0;
	std::optional<double> eta_seconds;
	// First sample of an attempt; bytes may restart from 0
	bool attempt_start = false;
};

/// Exponentially weighted transfer rate.
class MEDIAQ_EXPORT SpeedMeter {
   public:
	using clock = std::chrono::steady_clock;

	explicit SpeedMeter(std::chrono::milliseconds half_life);

	void reset(long long bytes, clock::time_point now);

	/// Feed the running byte total; returns the smoothed rate.
	double update(long long bytes, clock::time_point now);

	[[nodiscard]] double speed() const { return speed_; }

   private:
	double half_life_s_;
	long long last_bytes_ = 0;
	clock::time_point last_time_{};
	double speed_ = 0.0;
	bool primed_ = false;
};

/// (total - done) / speed, unknown without a total or a positive speed.
MEDIAQ_EXPORT std::optional<double> estimate_eta(
	long long done, std::optional<long long> total, double speed);

/// Drives one byte stream into a destination file.
class MEDIAQ_EXPORT TransferExecutor {
   public:
	using SampleCallback = std::function<void(const ProgressSample &)>;

	explicit TransferExecutor(TransferOptions options);
	explicit TransferExecutor(std::shared_ptr<LiveTransferOptions> options);

	/// Stream into `<destination><temp_suffix>`, then rename to a free final
	/// name. A positive `resume_offset` continues an earlier attempt's temp
	/// file when the stream allows it.
	/// Fails with io_error, stream_error or canceled. A cancel stop deletes
	/// the temp file, a pause stop keeps it.
	Result<std::filesystem::path> run(ByteStream &stream,
									  const std::filesystem::path &destination,
									  long long resume_offset,
									  const std::atomic<StopReason> &stop,
									  const SampleCallback &on_sample) const;

	[[nodiscard]] static std::filesystem::path temp_path_for(
		const std::filesystem::path &destination, std::string_view suffix);

   private:
	std::shared_ptr<LiveTransferOptions> options_;
};

}  // namespace mediaq
