#pragma once

#include <mediaq/mediaq_export.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <mediaq/job.hpp>
#include <mediaq/result.hpp>
#include <mediaq/types.hpp>

namespace mediaq {

enum class EventKind : std::uint8_t {
	state_changed,
	progress,
	// Marker: `dropped_count` progress events were coalesced or dropped
	dropped
};

struct MEDIAQ_EXPORT Event {
	EventKind kind = EventKind::state_changed;
	JobId job_id = 0;
	JobState previous_state = JobState::pending;
	JobState state = JobState::pending;
	ProgressSnapshot progress;
	std::optional<Error> error;
	std::size_t dropped_count = 0;
	std::chrono::system_clock::time_point timestamp;
};

/// Per-observer bounded channel. Progress events are coalesced when the
/// buffer is full; state events are always kept.
class MEDIAQ_EXPORT Subscription {
   public:
	explicit Subscription(std::size_t capacity);

	Subscription(const Subscription &) = delete;
	Subscription &operator=(const Subscription &) = delete;

	[[nodiscard]] std::optional<Event> try_next();
	[[nodiscard]] std::optional<Event> wait_next(
		std::chrono::milliseconds timeout);
	[[nodiscard]] std::vector<Event> drain();

	/// Events coalesced or dropped over the subscription's lifetime.
	[[nodiscard]] std::size_t dropped_total() const;
	[[nodiscard]] std::size_t pending() const;
	[[nodiscard]] std::size_t capacity() const { return capacity_; }

	// Producer side, never blocks
	void push(const Event &event);

   private:
	std::optional<Event> pop_locked();

	const std::size_t capacity_;
	mutable std::mutex mutex_;
	std::condition_variable ready_;
	std::deque<Event> queue_;
	std::size_t unreported_drops_ = 0;
	std::size_t dropped_total_ = 0;
};

/// Fan-out of job events to every live subscription.
class MEDIAQ_EXPORT EventBus {
   public:
	explicit EventBus(std::size_t default_capacity = 256);

	EventBus(const EventBus &) = delete;
	EventBus &operator=(const EventBus &) = delete;

	/// The subscription ends when the returned handle is released.
	[[nodiscard]] std::shared_ptr<Subscription> subscribe(
		std::size_t capacity = 0);

	void publish(const Event &event);

	[[nodiscard]] std::size_t subscriber_count() const;

	void set_default_capacity(std::size_t capacity);

   private:
	mutable std::mutex mutex_;
	std::size_t default_capacity_;
	std::vector<std::weak_ptr<Subscription>> subscribers_;
};

}  // namespace mediaq
