#include <spdlog/spdlog.h>

#include <algorithm>
#include <mediaq/event_bus.hpp>

namespace mediaq {

Subscription::Subscription(std::size_t capacity)
	: capacity_(std::max<std::size_t>(capacity, 1)) {}

void Subscription::push(const Event &event) {
	{
		std::lock_guard lock(mutex_);
		if (queue_.size() < capacity_) {
			queue_.push_back(event);
		} else if (event.kind == EventKind::progress) {
			// Newest queued event of this job is progress: overwrite it
			auto last_of_job = std::find_if(
				queue_.rbegin(), queue_.rend(),
				[&](const Event &e) { return e.job_id == event.job_id; });
			if (last_of_job != queue_.rend() &&
				last_of_job->kind == EventKind::progress) {
				*last_of_job = event;
			} else {
				auto oldest = std::find_if(
					queue_.begin(), queue_.end(), [](const Event &e) {
						return e.kind == EventKind::progress;
					});
				if (oldest != queue_.end()) {
					queue_.erase(oldest);
					queue_.push_back(event);
				}
				// Nothing evictable: the incoming sample is the one lost
			}
			++unreported_drops_;
			++dropped_total_;
		} else {
			// State changes are never dropped; make room if possible
			auto oldest =
				std::find_if(queue_.begin(), queue_.end(), [](const Event &e) {
					return e.kind == EventKind::progress;
				});
			if (oldest != queue_.end()) {
				queue_.erase(oldest);
				++unreported_drops_;
				++dropped_total_;
			}
			queue_.push_back(event);
		}
	}
	ready_.notify_one();
}

std::optional<Event> Subscription::pop_locked() {
	if (unreported_drops_ > 0) {
		Event marker;
		marker.kind = EventKind::dropped;
		marker.dropped_count = unreported_drops_;
		marker.timestamp = std::chrono::system_clock::now();
		unreported_drops_ = 0;
		return marker;
	}
	if (queue_.empty()) return std::nullopt;
	Event event = std::move(queue_.front());
	queue_.pop_front();
	return event;
}

std::optional<Event> Subscription::try_next() {
	std::lock_guard lock(mutex_);
	return pop_locked();
}

std::optional<Event> Subscription::wait_next(std::chrono::milliseconds timeout) {
	std::unique_lock lock(mutex_);
	ready_.wait_for(lock, timeout, [this] {
		return !queue_.empty() || unreported_drops_ > 0;
	});
	return pop_locked();
}

std::vector<Event> Subscription::drain() {
	std::lock_guard lock(mutex_);
	std::vector<Event> out;
	out.reserve(queue_.size() + 1);
	while (auto event = pop_locked()) out.push_back(std::move(*event));
	return out;
}

std::size_t Subscription::dropped_total() const {
	std::lock_guard lock(mutex_);
	return dropped_total_;
}

std::size_t Subscription::pending() const {
	std::lock_guard lock(mutex_);
	return queue_.size();
}

EventBus::EventBus(std::size_t default_capacity)
	: default_capacity_(default_capacity) {}

std::shared_ptr<Subscription> EventBus::subscribe(std::size_t capacity) {
	std::lock_guard lock(mutex_);
	auto sub = std::make_shared<Subscription>(
		capacity > 0 ? capacity : default_capacity_);
	subscribers_.push_back(sub);
	spdlog::debug("Event subscriber added ({} total)", subscribers_.size());
	return sub;
}

void EventBus::publish(const Event &event) {
	std::lock_guard lock(mutex_);
	// Cleanup released subscriptions while we're here
	subscribers_.erase(
		std::remove_if(subscribers_.begin(), subscribers_.end(),
					   [](const auto &wp) { return wp.expired(); }),
		subscribers_.end());
	for (auto &wp : subscribers_) {
		if (auto sub = wp.lock()) sub->push(event);
	}
}

std::size_t EventBus::subscriber_count() const {
	std::lock_guard lock(mutex_);
	return static_cast<std::size_t>(
		std::count_if(subscribers_.begin(), subscribers_.end(),
					  [](const auto &wp) { return !wp.expired(); }));
}

void EventBus::set_default_capacity(std::size_t capacity) {
	std::lock_guard lock(mutex_);
	default_capacity_ = capacity;
}

}  // namespace mediaq
