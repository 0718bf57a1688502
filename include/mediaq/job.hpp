#pragma once

#include <mediaq/mediaq_export.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <mediaq/result.hpp>
#include <mediaq/transfer.hpp>
#include <mediaq/types.hpp>

namespace mediaq {

enum class JobState : std::uint8_t {
	pending,
	resolving,
	awaiting_selection,
	queued,
	running,
	paused,
	succeeded,
	failed,
	canceled
};

MEDIAQ_EXPORT std::string_view to_string(JobState state);

constexpr bool is_terminal(JobState state) {
	return state == JobState::succeeded || state == JobState::failed ||
		   state == JobState::canceled;
}

/// Whether `from -> to` is an edge of the job lifecycle.
MEDIAQ_EXPORT bool can_transition(JobState from, JobState to);

/// Value copy of a job handed out to callers.
struct MEDIAQ_EXPORT JobSnapshot {
	JobId id = 0;
	std::string url;
	std::string title;
	JobState state = JobState::pending;
	std::optional<VariantDescriptor> variant;
	std::filesystem::path destination;
	std::optional<std::filesystem::path> output_path;
	ProgressSnapshot progress;
	std::optional<Error> last_error;
};

/// One download request and its lifecycle. Not thread-safe; the scheduler
/// owns every instance and serializes access.
class MEDIAQ_EXPORT Job {
   public:
	using clock = std::chrono::steady_clock;

	Job(JobId id, std::string url);

	[[nodiscard]] JobId id() const { return id_; }
	[[nodiscard]] const std::string &url() const { return url_; }
	[[nodiscard]] JobState state() const { return state_; }
	[[nodiscard]] const std::string &title() const { return title_; }

	/// Move to `next`, returning the previous state. Edges outside the
	/// lifecycle fail with invalid_state naming the current state.
	Result<JobState> transition_to(JobState next);

	void set_media(MediaInfo info);
	[[nodiscard]] const std::vector<VariantDescriptor> &variants() const {
		return variants_;
	}
	[[nodiscard]] bool has_variants() const { return media_known_; }

	/// Pick one of the resolved variants. not_found for an unknown id.
	Result<void> select_variant(std::string_view variant_id);
	[[nodiscard]] const std::optional<VariantDescriptor> &variant() const {
		return variant_;
	}

	/// Apply an executor sample. Rejected when it would move the byte count
	/// backwards outside the first sample of an attempt.
	bool apply_sample(const ProgressSample &sample);
	void reset_progress();
	void clear_rate() {
		progress_.speed_bytes_per_sec = 0.0;
		progress_.eta_seconds.reset();
	}
	[[nodiscard]] const ProgressSnapshot &progress() const { return progress_; }

	[[nodiscard]] int retry_count() const { return progress_.retry_count; }
	void count_retry() { ++progress_.retry_count; }
	void reset_retries() { progress_.retry_count = 0; }

	void set_destination(std::filesystem::path path) {
		destination_ = std::move(path);
	}
	[[nodiscard]] const std::filesystem::path &destination() const {
		return destination_;
	}

	void set_output_path(std::filesystem::path path) {
		output_path_ = std::move(path);
	}

	void set_error(Error error) { last_error_ = std::move(error); }
	void clear_error() { last_error_.reset(); }
	[[nodiscard]] const std::optional<Error> &last_error() const {
		return last_error_;
	}

	// Admission order, assigned the first time the job is queued
	[[nodiscard]] const std::optional<std::uint64_t> &ticket() const {
		return ticket_;
	}
	void set_ticket(std::uint64_t ticket) { ticket_ = ticket; }

	// Earliest admission time while backing off before a retry
	[[nodiscard]] clock::time_point not_before() const { return not_before_; }
	void set_not_before(clock::time_point t) { not_before_ = t; }

	[[nodiscard]] JobSnapshot snapshot() const;

   private:
	JobId id_;
	std::string url_;
	std::string title_;
	JobState state_ = JobState::pending;

	bool media_known_ = false;
	std::vector<VariantDescriptor> variants_;
	std::optional<VariantDescriptor> variant_;

	std::filesystem::path destination_;
	std::optional<std::filesystem::path> output_path_;
	ProgressSnapshot progress_;
	std::optional<Error> last_error_;

	std::optional<std::uint64_t> ticket_;
	clock::time_point not_before_{};
};

}  // namespace mediaq
