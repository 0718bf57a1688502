#pragma once

#include <mediaq/mediaq_export.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <mediaq/event_bus.hpp>
#include <mediaq/job.hpp>
#include <mediaq/resolver.hpp>
#include <mediaq/result.hpp>
#include <mediaq/settings.hpp>
#include <mediaq/types.hpp>

namespace mediaq {

/// Public entry point: accepts URLs, lets the caller pick a variant, runs at
/// most `concurrency_limit()` transfers at once and reports every state
/// change and progress update through subscriptions.
///
/// All operations are thread-safe and return without waiting for transfers.
/// Destroying the manager pauses running transfers (partial files are kept)
/// and joins every worker.
class MEDIAQ_EXPORT QueueManager {
   public:
	QueueManager(const QueueManager &) = delete;
	QueueManager &operator=(const QueueManager &) = delete;
	QueueManager(QueueManager &&) noexcept;
	QueueManager &operator=(QueueManager &&) noexcept;
	~QueueManager();

	explicit QueueManager(std::shared_ptr<Resolver> resolver,
						  Settings settings = {});

	/// Create a Pending job and start resolving its variants.
	JobId submit(std::string url);

	/// Variants best first. invalid_state until resolution succeeded.
	Result<std::vector<VariantDescriptor>> list_variants(JobId id) const;

	/// AwaitingSelection -> Queued. not_found for an unknown variant id.
	Result<void> select_variant(JobId id, std::string_view variant_id);

	// Running jobs are signalled; the Paused or Canceled event follows once
	// the transfer has stopped.
	Result<void> pause(JobId id);
	Result<void> resume(JobId id);
	Result<void> cancel(JobId id);

	/// Failed -> Queued (or back to resolution when it never succeeded).
	Result<void> retry_now(JobId id);

	/// Forget a terminal job.
	Result<void> remove(JobId id);

	/// Move a Queued job to `position` (0 = next) among Queued jobs.
	Result<void> reorder(JobId id, std::size_t position);

	/// Takes effect at the next admission; running jobs are never preempted.
	Result<void> set_concurrency_limit(int limit);
	[[nodiscard]] int concurrency_limit() const;

	Result<void> apply_settings(Settings settings);
	[[nodiscard]] Settings settings() const;

	Result<JobSnapshot> job(JobId id) const;
	/// Every known job, in submission order.
	[[nodiscard]] std::vector<JobSnapshot> jobs() const;

	/// 0 uses the configured event_buffer.
	[[nodiscard]] std::shared_ptr<Subscription> subscribe(
		std::size_t capacity = 0);

   private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};

}  // namespace mediaq
