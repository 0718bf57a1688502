#include "scheduler/scheduler.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <mediaq/output_template.hpp>

namespace fs = std::filesystem;

namespace mediaq {

namespace {

Error invalid_state(const Job &job) {
	return Error{errc::invalid_state,
				 fmt::format("job {} is {}", job.id(), to_string(job.state()))};
}

}  // namespace

Scheduler::Scheduler(std::shared_ptr<Resolver> resolver, EventBus &bus,
					 Settings settings)
	: resolver_(std::move(resolver)),
	  bus_(bus),
	  settings_(std::move(settings)),
	  live_options_(
		  std::make_shared<LiveTransferOptions>(settings_.transfer_options())),
	  timer_guard_(asio::make_work_guard(timer_ctx_)),
	  timer_thread_([this] { timer_ctx_.run(); }),
	  resolve_pool_(static_cast<std::size_t>(
		  std::max(settings_.resolver_threads, 1))) {
	bus_.set_default_capacity(settings_.event_buffer);
}

Scheduler::~Scheduler() {
	std::vector<std::thread> threads;
	{
		std::lock_guard lock(mutex_);
		shutting_down_ = true;
		// Keep partial files around for a later session
		for (auto &[id, worker] : workers_) {
			worker.stop->store(StopReason::pause, std::memory_order_release);
		}
		for (auto &[id, worker] : workers_) {
			threads.push_back(std::move(worker.thread));
		}
		workers_.clear();
		for (auto &t : finished_threads_) threads.push_back(std::move(t));
		finished_threads_.clear();
	}

	resolve_pool_.join();
	for (auto &t : threads) {
		if (t.joinable()) t.join();
	}
	// Workers that reported while we were joining
	reap_finished();

	timer_guard_.reset();
	timer_ctx_.stop();
	if (timer_thread_.joinable()) timer_thread_.join();
}

// =============================================================================
// Public operations
// =============================================================================

JobId Scheduler::submit(std::string url) {
	std::lock_guard lock(mutex_);
	const JobId id = next_id_++;
	auto [it, inserted] = jobs_.emplace(id, Job(id, std::move(url)));
	Job &job = it->second;
	spdlog::info("Job {} submitted: {}", id, job.url());

	start_resolution_locked(job);
	return id;
}

Result<std::vector<VariantDescriptor>> Scheduler::variants(JobId id) const {
	std::lock_guard lock(mutex_);
	BOOST_OUTCOME_TRY(job, lookup_locked(id));
	if (!job->has_variants()) return outcome::failure(invalid_state(*job));
	return job->variants();
}

Result<void> Scheduler::select_variant(JobId id, std::string_view variant_id) {
	{
		std::lock_guard lock(mutex_);
		BOOST_OUTCOME_TRY(job, lookup_locked(id));
		if (job->state() != JobState::awaiting_selection) {
			return outcome::failure(invalid_state(*job));
		}
		BOOST_OUTCOME_TRYV(job->select_variant(variant_id));
		if (!job->ticket()) job->set_ticket(next_ticket_++);
		BOOST_OUTCOME_TRYV(transition_locked(*job, JobState::queued));
		pump_locked();
	}
	reap_finished();
	return outcome::success();
}

Result<void> Scheduler::pause(JobId id) {
	std::lock_guard lock(mutex_);
	BOOST_OUTCOME_TRY(job, lookup_locked(id));
	auto worker = workers_.find(id);
	if (job->state() != JobState::running || worker == workers_.end()) {
		return outcome::failure(invalid_state(*job));
	}

	auto expected = StopReason::none;
	if (!worker->second.stop->compare_exchange_strong(expected,
													  StopReason::pause)) {
		if (expected == StopReason::pause) return outcome::success();
		return fail(errc::invalid_state,
					fmt::format("job {} is {} and being canceled", id,
								to_string(job->state())));
	}
	spdlog::debug("Job {} pause requested", id);
	return outcome::success();
}

Result<void> Scheduler::resume(JobId id) {
	{
		std::lock_guard lock(mutex_);
		BOOST_OUTCOME_TRY(job, lookup_locked(id));
		if (job->state() != JobState::paused) {
			return outcome::failure(invalid_state(*job));
		}
		job->set_not_before(clock::time_point{});
		BOOST_OUTCOME_TRYV(transition_locked(*job, JobState::queued));
		pump_locked();
	}
	reap_finished();
	return outcome::success();
}

Result<void> Scheduler::cancel(JobId id) {
	{
		std::lock_guard lock(mutex_);
		BOOST_OUTCOME_TRY(job, lookup_locked(id));
		switch (job->state()) {
			case JobState::running: {
				// The worker reports Canceled once it has stopped
				auto worker = workers_.find(id);
				if (worker == workers_.end()) {
					return outcome::failure(invalid_state(*job));
				}
				worker->second.stop->store(StopReason::cancel,
										   std::memory_order_release);
				spdlog::debug("Job {} cancel requested", id);
				return outcome::success();
			}
			case JobState::queued:
			case JobState::paused:
				// Left over from a paused or failed attempt
				remove_temp_locked(*job);
				[[fallthrough]];
			case JobState::pending:
			case JobState::resolving:
			case JobState::awaiting_selection: {
				BOOST_OUTCOME_TRYV(transition_locked(*job, JobState::canceled));
				break;
			}
			default: return outcome::failure(invalid_state(*job));
		}
	}
	reap_finished();
	return outcome::success();
}

Result<void> Scheduler::retry_now(JobId id) {
	{
		std::lock_guard lock(mutex_);
		BOOST_OUTCOME_TRY(job, lookup_locked(id));
		if (job->state() != JobState::failed) {
			return outcome::failure(invalid_state(*job));
		}

		job->reset_retries();
		job->reset_progress();
		job->clear_error();
		job->set_not_before(clock::time_point{});

		if (job->variant()) {
			if (!job->ticket()) job->set_ticket(next_ticket_++);
			BOOST_OUTCOME_TRYV(transition_locked(*job, JobState::queued));
			pump_locked();
		} else {
			// Resolution never succeeded, start over
			BOOST_OUTCOME_TRYV(transition_locked(*job, JobState::pending));
			start_resolution_locked(*job);
		}
		spdlog::info("Job {} retried manually", id);
	}
	reap_finished();
	return outcome::success();
}

Result<void> Scheduler::remove(JobId id) {
	{
		std::lock_guard lock(mutex_);
		BOOST_OUTCOME_TRY(job, lookup_locked(id));
		if (!is_terminal(job->state())) {
			return outcome::failure(invalid_state(*job));
		}
		jobs_.erase(id);
		spdlog::debug("Job {} removed", id);
	}
	// The job's worker, if any, already reported; make sure it is gone
	reap_finished();
	return outcome::success();
}

Result<void> Scheduler::reorder(JobId id, std::size_t position) {
	std::lock_guard lock(mutex_);
	BOOST_OUTCOME_TRY(job, lookup_locked(id));
	if (job->state() != JobState::queued) {
		return outcome::failure(invalid_state(*job));
	}

	std::vector<Job *> queued;
	for (auto &[jid, j] : jobs_) {
		if (j.state() == JobState::queued) queued.push_back(&j);
	}
	std::sort(queued.begin(), queued.end(), [](const Job *a, const Job *b) {
		return *a->ticket() < *b->ticket();
	});

	// Permute the existing tickets so jobs outside the queue keep their rank
	std::vector<std::uint64_t> tickets;
	tickets.reserve(queued.size());
	for (const Job *j : queued) tickets.push_back(*j->ticket());

	queued.erase(std::find(queued.begin(), queued.end(), job));
	position = std::min(position, queued.size());
	queued.insert(queued.begin() + static_cast<std::ptrdiff_t>(position), job);

	for (std::size_t i = 0; i < queued.size(); ++i) {
		queued[i]->set_ticket(tickets[i]);
	}
	spdlog::debug("Job {} moved to queue position {}", id, position);
	return outcome::success();
}

Result<void> Scheduler::set_concurrency_limit(int limit) {
	if (limit < 1) {
		return fail(errc::invalid_concurrency_limit,
					fmt::format("{} (must be at least 1)", limit));
	}
	{
		std::lock_guard lock(mutex_);
		settings_.max_concurrent = limit;
		spdlog::info("Concurrency limit set to {}", limit);
		pump_locked();
	}
	reap_finished();
	return outcome::success();
}

int Scheduler::concurrency_limit() const {
	std::lock_guard lock(mutex_);
	return settings_.max_concurrent;
}

Result<void> Scheduler::apply_settings(Settings settings) {
	BOOST_OUTCOME_TRYV(validate(settings));
	{
		std::lock_guard lock(mutex_);
		if (settings.resolver_threads != settings_.resolver_threads) {
			spdlog::warn(
				"resolver_threads changes take effect on the next start");
		}
		settings_ = std::move(settings);
		live_options_->set(settings_.transfer_options());
		bus_.set_default_capacity(settings_.event_buffer);
		spdlog::info("Settings reloaded (limit {}, retries {}, root {})",
					 settings_.max_concurrent, settings_.max_retries,
					 settings_.destination_root.string());
		pump_locked();
	}
	reap_finished();
	return outcome::success();
}

Settings Scheduler::settings() const {
	std::lock_guard lock(mutex_);
	return settings_;
}

Result<JobSnapshot> Scheduler::snapshot(JobId id) const {
	std::lock_guard lock(mutex_);
	BOOST_OUTCOME_TRY(job, lookup_locked(id));
	return job->snapshot();
}

std::vector<JobSnapshot> Scheduler::snapshots() const {
	std::lock_guard lock(mutex_);
	std::vector<JobSnapshot> out;
	out.reserve(jobs_.size());
	for (const auto &[id, job] : jobs_) out.push_back(job.snapshot());
	return out;
}

// =============================================================================
// Locked helpers
// =============================================================================

Result<Job *> Scheduler::lookup_locked(JobId id) {
	auto it = jobs_.find(id);
	if (it == jobs_.end()) return fail(errc::not_found, fmt::format("job {}", id));
	return &it->second;
}

Result<const Job *> Scheduler::lookup_locked(JobId id) const {
	auto it = jobs_.find(id);
	if (it == jobs_.end()) return fail(errc::not_found, fmt::format("job {}", id));
	return &it->second;
}

Result<void> Scheduler::transition_locked(Job &job, JobState next,
										  std::optional<Error> error) {
	BOOST_OUTCOME_TRY(previous, job.transition_to(next));

	if (previous == JobState::running) --running_;
	if (next == JobState::running) ++running_;

	// Rate and ETA only mean something while bytes flow
	if (next != JobState::running) job.clear_rate();

	spdlog::debug("Job {}: {} -> {}", job.id(), to_string(previous),
				  to_string(next));

	Event event;
	event.kind = EventKind::state_changed;
	event.job_id = job.id();
	event.previous_state = previous;
	event.state = next;
	event.progress = job.progress();
	event.error = std::move(error);
	event.timestamp = std::chrono::system_clock::now();
	bus_.publish(event);
	return outcome::success();
}

void Scheduler::pump_locked() {
	if (shutting_down_) return;

	const auto now = clock::now();
	while (running_ < static_cast<std::size_t>(settings_.max_concurrent)) {
		Job *next = nullptr;
		for (auto &[id, job] : jobs_) {
			if (job.state() != JobState::queued) continue;
			// Previous attempt still winding down
			if (workers_.count(id)) continue;
			// Backing off before a retry
			if (job.not_before() > now) continue;
			if (!next || *job.ticket() < *next->ticket()) next = &job;
		}
		if (!next) break;
		start_worker_locked(*next);
	}
}

fs::path Scheduler::destination_for_locked(const Job &job) const {
	OutputFields fields;
	fields.title = job.title();
	fields.id = std::to_string(job.id());
	if (const auto &variant = job.variant()) {
		fields.variant_id = variant->id;
		fields.ext = variant->container.empty() ? "bin" : variant->container;
		fields.resolution = variant->resolution;
		fields.fps = variant->fps;
	}
	auto path = settings_.destination_root /
				expand_output_template(settings_.output_template, fields);

	// Two live jobs must never share a temp file
	auto taken = [&](const fs::path &candidate) {
		return std::any_of(jobs_.begin(), jobs_.end(), [&](const auto &entry) {
			const Job &other = entry.second;
			return other.id() != job.id() && !is_terminal(other.state()) &&
				   other.destination() == candidate;
		});
	};
	if (!taken(path)) return path;

	const auto stem = path.stem().string();
	const auto ext = path.extension().string();
	for (int n = 1;; ++n) {
		auto candidate = path.parent_path() / fmt::format("{} ({}){}", stem, n, ext);
		if (!taken(candidate)) return candidate;
	}
}

void Scheduler::start_worker_locked(Job &job) {
	// The destination root only applies to jobs that have not started yet
	if (job.destination().empty()) {
		job.set_destination(destination_for_locked(job));
	}

	if (auto res = transition_locked(job, JobState::running); !res) {
		spdlog::error("Cannot admit job {}: {}", job.id(),
					  res.error().message());
		return;
	}

	WorkerPlan plan;
	plan.url = job.url();
	plan.variant = *job.variant();
	plan.destination = job.destination();
	plan.resume_offset = job.progress().bytes_transferred;
	plan.options = live_options_;
	plan.credentials = settings_.credentials();
	plan.stop = std::make_shared<std::atomic<StopReason>>(StopReason::none);

	spdlog::info("Job {} admitted ({} of {} slots), attempt {}", job.id(),
				 running_, settings_.max_concurrent, job.retry_count() + 1);

	Worker worker;
	worker.stop = plan.stop;
	try {
		worker.thread = std::thread(
			[this, id = job.id(), plan = std::move(plan)]() mutable {
				run_worker(id, std::move(plan));
			});
	} catch (const std::system_error &e) {
		spdlog::error("Cannot start worker for job {}: {}", job.id(),
					  e.what());
		Error error{errc::io_error, fmt::format("cannot start worker: {}",
												e.what())};
		job.set_error(error);
		if (auto res = transition_locked(job, JobState::failed, error); !res) {
			spdlog::error("Job {}: {}", job.id(), res.error().message());
		}
		return;
	}
	workers_.emplace(job.id(), std::move(worker));
}

void Scheduler::start_resolution_locked(Job &job) {
	if (auto res = transition_locked(job, JobState::resolving); !res) {
		spdlog::error("Cannot resolve job {}: {}", job.id(),
					  res.error().message());
		return;
	}

	asio::post(resolve_pool_, [this, id = job.id(), url = job.url(),
							   credentials = settings_.credentials()]() {
		Result<MediaInfo> result = fail(errc::unknown);
		try {
			result = resolver_->resolve(url, credentials);
		} catch (const std::exception &e) {
			result = fail(errc::unknown, e.what());
		}
		on_resolved(id, std::move(result));
	});
}

void Scheduler::schedule_wakeup_locked(std::chrono::milliseconds delay) {
	auto timer = std::make_shared<asio::steady_timer>(timer_ctx_, delay);
	timer->async_wait([this, timer](const boost::system::error_code &ec) {
		if (ec) return;
		{
			std::lock_guard lock(mutex_);
			pump_locked();
		}
		reap_finished();
	});
}

void Scheduler::remove_temp_locked(const Job &job) {
	if (job.destination().empty()) return;
	auto temp = TransferExecutor::temp_path_for(
		job.destination(), settings_.transfer_options().temp_suffix);
	std::error_code ec;
	if (fs::remove(temp, ec)) {
		spdlog::debug("Removed {}", temp.string());
	} else if (ec) {
		spdlog::warn("Failed to remove {}: {}", temp.string(), ec.message());
	}
}

// =============================================================================
// Worker side
// =============================================================================

void Scheduler::run_worker(JobId id, WorkerPlan plan) {
	Result<fs::path> result = fail(errc::unknown);
	try {
		auto opened = resolver_->open(plan.url, plan.variant, plan.credentials);
		if (opened.has_error()) {
			auto error = opened.error();
			// A connection hiccup is worth another attempt, a refusal is not
			if (error.code == errc::network_unavailable) {
				error = Error{errc::stream_error, error.message()};
			}
			result = outcome::failure(std::move(error));
		} else {
			TransferExecutor executor(plan.options);
			result = executor.run(
				*opened.value(), plan.destination, plan.resume_offset,
				*plan.stop,
				[this, id](const ProgressSample &sample) {
					on_sample(id, sample);
				});
		}
	} catch (const std::exception &e) {
		result = fail(errc::stream_error, e.what());
	}
	on_transfer_done(id, std::move(result));
}

void Scheduler::on_resolved(JobId id, Result<MediaInfo> result) {
	std::lock_guard lock(mutex_);
	if (shutting_down_) return;

	auto it = jobs_.find(id);
	// Canceled or removed while resolving
	if (it == jobs_.end() || it->second.state() != JobState::resolving) return;
	Job &job = it->second;

	if (result.has_value()) {
		job.set_media(std::move(result).value());
		if (!job.variants().empty()) {
			spdlog::info("Job {}: '{}' has {} variant(s)", id, job.title(),
						 job.variants().size());
			if (auto res = transition_locked(job, JobState::awaiting_selection);
				!res) {
				spdlog::error("Job {}: {}", id, res.error().message());
			}
			return;
		}
		result = fail(errc::no_variants_found, job.url());
	}

	const auto &error = result.error();
	spdlog::warn("Job {}: resolution failed: {}", id, error.message());
	job.set_error(error);
	if (auto res = transition_locked(job, JobState::failed, error); !res) {
		spdlog::error("Job {}: {}", id, res.error().message());
	}
}

void Scheduler::on_sample(JobId id, const ProgressSample &sample) {
	std::lock_guard lock(mutex_);
	if (shutting_down_) return;

	auto it = jobs_.find(id);
	if (it == jobs_.end() || it->second.state() != JobState::running) return;
	Job &job = it->second;
	if (!job.apply_sample(sample)) return;

	Event event;
	event.kind = EventKind::progress;
	event.job_id = id;
	event.previous_state = JobState::running;
	event.state = JobState::running;
	event.progress = job.progress();
	event.timestamp = std::chrono::system_clock::now();
	bus_.publish(event);
}

void Scheduler::on_transfer_done(JobId id, Result<fs::path> result) {
	std::lock_guard lock(mutex_);

	auto requested = StopReason::none;
	if (auto worker = workers_.find(id); worker != workers_.end()) {
		requested = worker->second.stop->load(std::memory_order_acquire);
		finished_threads_.push_back(std::move(worker->second.thread));
		workers_.erase(worker);
	}
	if (shutting_down_) return;

	auto it = jobs_.find(id);
	if (it == jobs_.end() || it->second.state() != JobState::running) {
		pump_locked();
		return;
	}
	Job &job = it->second;

	auto report = [&](JobState next, std::optional<Error> error) {
		if (auto res = transition_locked(job, next, std::move(error)); !res) {
			spdlog::error("Job {}: {}", id, res.error().message());
		}
	};

	if (result.has_value()) {
		job.set_output_path(result.value());
		job.clear_error();
		spdlog::info("Job {} finished: {}", id, result.value().string());
		report(JobState::succeeded, std::nullopt);
	} else if (requested == StopReason::cancel) {
		// Whatever ended the attempt, the user asked for it to go away
		remove_temp_locked(job);
		spdlog::info("Job {} canceled", id);
		report(JobState::canceled, std::nullopt);
	} else if (requested == StopReason::pause) {
		spdlog::info("Job {} paused at {} bytes", id,
					 job.progress().bytes_transferred);
		report(JobState::paused, std::nullopt);
	} else {
		const auto &error = result.error();
		if (is_retryable(error.code) &&
			job.retry_count() < settings_.max_retries) {
			job.count_retry();
			job.set_error(error);
			auto delay = settings_.backoff_for(job.retry_count());
			job.set_not_before(clock::now() + delay);
			spdlog::warn("Job {} attempt {} failed ({}), retrying in {} ms", id,
						 job.retry_count(), error.message(), delay.count());
			report(JobState::queued, error);
			if (delay.count() > 0) schedule_wakeup_locked(delay);
		} else {
			job.set_error(error);
			remove_temp_locked(job);
			spdlog::error("Job {} failed: {}", id, error.message());
			report(JobState::failed, error);
		}
	}

	pump_locked();
}

void Scheduler::reap_finished() {
	std::vector<std::thread> done;
	{
		std::lock_guard lock(mutex_);
		done.swap(finished_threads_);
	}
	for (auto &t : done) {
		if (t.joinable()) t.join();
	}
}

}  // namespace mediaq
