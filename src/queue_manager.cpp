#include <spdlog/spdlog.h>

#include <stdexcept>

#include <mediaq/queue_manager.hpp>

#include "scheduler/scheduler.hpp"

namespace mediaq {

struct QueueManager::Impl {
	// The bus outlives the scheduler that publishes into it
	EventBus bus;
	Scheduler scheduler;

	Impl(std::shared_ptr<Resolver> resolver, Settings settings)
		: bus(settings.event_buffer),
		  scheduler(std::move(resolver), bus, std::move(settings)) {}
};

QueueManager::QueueManager(std::shared_ptr<Resolver> resolver,
						   Settings settings) {
	if (!resolver) throw std::invalid_argument("QueueManager needs a resolver");
	if (auto res = validate(settings); !res) {
		spdlog::warn("Invalid settings ({}), using defaults",
					 res.error().message());
		settings = Settings{};
	}
	m_impl = std::make_unique<Impl>(std::move(resolver), std::move(settings));
}

QueueManager::~QueueManager() = default;
QueueManager::QueueManager(QueueManager &&) noexcept = default;
QueueManager &QueueManager::operator=(QueueManager &&) noexcept = default;

JobId QueueManager::submit(std::string url) {
	return m_impl->scheduler.submit(std::move(url));
}

Result<std::vector<VariantDescriptor>> QueueManager::list_variants(
	JobId id) const {
	return m_impl->scheduler.variants(id);
}

Result<void> QueueManager::select_variant(JobId id,
										  std::string_view variant_id) {
	return m_impl->scheduler.select_variant(id, variant_id);
}

Result<void> QueueManager::pause(JobId id) {
	return m_impl->scheduler.pause(id);
}

Result<void> QueueManager::resume(JobId id) {
	return m_impl->scheduler.resume(id);
}

Result<void> QueueManager::cancel(JobId id) {
	return m_impl->scheduler.cancel(id);
}

Result<void> QueueManager::retry_now(JobId id) {
	return m_impl->scheduler.retry_now(id);
}

Result<void> QueueManager::remove(JobId id) {
	return m_impl->scheduler.remove(id);
}

Result<void> QueueManager::reorder(JobId id, std::size_t position) {
	return m_impl->scheduler.reorder(id, position);
}

Result<void> QueueManager::set_concurrency_limit(int limit) {
	return m_impl->scheduler.set_concurrency_limit(limit);
}

int QueueManager::concurrency_limit() const {
	return m_impl->scheduler.concurrency_limit();
}

Result<void> QueueManager::apply_settings(Settings settings) {
	return m_impl->scheduler.apply_settings(std::move(settings));
}

Settings QueueManager::settings() const {
	return m_impl->scheduler.settings();
}

Result<JobSnapshot> QueueManager::job(JobId id) const {
	return m_impl->scheduler.snapshot(id);
}

std::vector<JobSnapshot> QueueManager::jobs() const {
	return m_impl->scheduler.snapshots();
}

std::shared_ptr<Subscription> QueueManager::subscribe(std::size_t capacity) {
	return m_impl->bus.subscribe(capacity);
}

}  // namespace mediaq
