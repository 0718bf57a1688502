#include <fmt/format.h>

#include <algorithm>
#include <mediaq/job.hpp>

namespace mediaq {

std::string_view to_string(JobState state) {
	switch (state) {
		case JobState::pending: return "Pending";
		case JobState::resolving: return "VariantsResolving";
		case JobState::awaiting_selection: return "AwaitingSelection";
		case JobState::queued: return "Queued";
		case JobState::running: return "Running";
		case JobState::paused: return "Paused";
		case JobState::succeeded: return "Succeeded";
		case JobState::failed: return "Failed";
		case JobState::canceled: return "Canceled";
	}
	return "Unknown";
}

bool can_transition(JobState from, JobState to) {
	using S = JobState;
	switch (from) {
		case S::pending: return to == S::resolving || to == S::canceled;
		case S::resolving:
			return to == S::awaiting_selection || to == S::failed ||
				   to == S::canceled;
		case S::awaiting_selection:
			return to == S::queued || to == S::canceled;
		case S::queued: return to == S::running || to == S::canceled;
		case S::running:
			return to == S::succeeded || to == S::queued ||
				   to == S::failed || to == S::canceled || to == S::paused;
		case S::paused: return to == S::queued || to == S::canceled;
		// Manual retry is the only way out of a terminal state
		case S::failed: return to == S::queued || to == S::pending;
		case S::succeeded:
		case S::canceled: return false;
	}
	return false;
}

Job::Job(JobId id, std::string url) : id_(id), url_(std::move(url)) {}

Result<JobState> Job::transition_to(JobState next) {
	if (!can_transition(state_, next)) {
		return fail(errc::invalid_state,
					fmt::format("job {} is {}, cannot become {}", id_,
								to_string(state_), to_string(next)));
	}
	auto previous = state_;
	state_ = next;
	return previous;
}

void Job::set_media(MediaInfo info) {
	title_ = std::move(info.title);
	variants_ = std::move(info.variants);
	normalize_variants(variants_);
	media_known_ = true;
}

Result<void> Job::select_variant(std::string_view variant_id) {
	auto it = std::find_if(
		variants_.begin(), variants_.end(),
		[&](const VariantDescriptor &v) { return v.id == variant_id; });
	if (it == variants_.end()) {
		return fail(errc::not_found,
					fmt::format("job {} has no variant '{}'", id_, variant_id));
	}
	variant_ = *it;
	if (it->approx_size) progress_.total_bytes = it->approx_size;
	return outcome::success();
}

bool Job::apply_sample(const ProgressSample &sample) {
	if (!sample.attempt_start &&
		sample.bytes_transferred < progress_.bytes_transferred) {
		return false;
	}
	progress_.bytes_transferred = sample.bytes_transferred;
	if (sample.total_bytes) progress_.total_bytes = sample.total_bytes;
	progress_.speed_bytes_per_sec = sample.speed_bytes_per_sec;
	// Streams without a length still get an ETA from the variant's size
	progress_.eta_seconds =
		sample.eta_seconds
			? sample.eta_seconds
			: estimate_eta(progress_.bytes_transferred, progress_.total_bytes,
						   progress_.speed_bytes_per_sec);
	return true;
}

void Job::reset_progress() {
	progress_.bytes_transferred = 0;
	progress_.speed_bytes_per_sec = 0.0;
	progress_.eta_seconds.reset();
}

JobSnapshot Job::snapshot() const {
	JobSnapshot snap;
	snap.id = id_;
	snap.url = url_;
	snap.title = title_;
	snap.state = state_;
	snap.variant = variant_;
	snap.destination = destination_;
	snap.output_path = output_path_;
	snap.progress = progress_;
	snap.last_error = last_error_;
	return snap;
}

}  // namespace mediaq
