#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <mediaq/event_bus.hpp>
#include <mediaq/job.hpp>
#include <mediaq/resolver.hpp>
#include <mediaq/result.hpp>
#include <mediaq/settings.hpp>
#include <mediaq/transfer.hpp>

namespace mediaq {

namespace asio = boost::asio;

/// Owns the job table and every worker. All mutations go through one mutex,
/// so admission decisions always see the current running count and limit.
class Scheduler {
   public:
	using clock = std::chrono::steady_clock;

	Scheduler(std::shared_ptr<Resolver> resolver, EventBus &bus,
			  Settings settings);
	~Scheduler();

	Scheduler(const Scheduler &) = delete;
	Scheduler &operator=(const Scheduler &) = delete;

	JobId submit(std::string url);

	Result<std::vector<VariantDescriptor>> variants(JobId id) const;
	Result<void> select_variant(JobId id, std::string_view variant_id);
	Result<void> pause(JobId id);
	Result<void> resume(JobId id);
	Result<void> cancel(JobId id);
	Result<void> retry_now(JobId id);
	Result<void> remove(JobId id);
	Result<void> reorder(JobId id, std::size_t position);

	Result<void> set_concurrency_limit(int limit);
	[[nodiscard]] int concurrency_limit() const;
	Result<void> apply_settings(Settings settings);
	[[nodiscard]] Settings settings() const;

	Result<JobSnapshot> snapshot(JobId id) const;
	[[nodiscard]] std::vector<JobSnapshot> snapshots() const;

   private:
	struct Worker {
		std::thread thread;
		std::shared_ptr<std::atomic<StopReason>> stop;
	};

	// Everything one attempt needs, captured at admission time
	struct WorkerPlan {
		std::string url;
		VariantDescriptor variant;
		std::filesystem::path destination;
		long long resume_offset = 0;
		std::shared_ptr<LiveTransferOptions> options;
		Credentials credentials;
		std::shared_ptr<std::atomic<StopReason>> stop;
	};

	// Callers of the *_locked helpers hold mutex_
	Result<Job *> lookup_locked(JobId id);
	Result<const Job *> lookup_locked(JobId id) const;
	Result<void> transition_locked(Job &job, JobState next,
								   std::optional<Error> error = std::nullopt);
	void pump_locked();
	void start_worker_locked(Job &job);
	void start_resolution_locked(Job &job);
	void schedule_wakeup_locked(std::chrono::milliseconds delay);
	void remove_temp_locked(const Job &job);
	std::filesystem::path destination_for_locked(const Job &job) const;

	// Worker and resolver threads
	void run_worker(JobId id, WorkerPlan plan);
	void on_resolved(JobId id, Result<MediaInfo> result);
	void on_sample(JobId id, const ProgressSample &sample);
	void on_transfer_done(JobId id, Result<std::filesystem::path> result);

	// Joins workers that already reported; never call with mutex_ held
	void reap_finished();

	std::shared_ptr<Resolver> resolver_;
	EventBus &bus_;

	mutable std::mutex mutex_;
	Settings settings_;
	// Running transfers see settings reloads through this
	std::shared_ptr<LiveTransferOptions> live_options_;
	std::map<JobId, Job> jobs_;
	std::map<JobId, Worker> workers_;
	std::vector<std::thread> finished_threads_;
	std::size_t running_ = 0;
	JobId next_id_ = 1;
	std::uint64_t next_ticket_ = 1;
	bool shutting_down_ = false;

	asio::io_context timer_ctx_;
	asio::executor_work_guard<asio::io_context::executor_type> timer_guard_;
	std::thread timer_thread_;
	asio::thread_pool resolve_pool_;
};

}  // namespace mediaq
