#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <mediaq/output_template.hpp>
#include <mediaq/transfer.hpp>
#include <vector>

namespace fs = std::filesystem;

namespace mediaq {

namespace {
// Shorter windows make the instantaneous rate too noisy to smooth
constexpr auto kMinRateWindow = std::chrono::milliseconds(50);
}  // namespace

SpeedMeter::SpeedMeter(std::chrono::milliseconds half_life)
	: half_life_s_(std::chrono::duration<double>(half_life).count()) {}

void SpeedMeter::reset(long long bytes, clock::time_point now) {
	last_bytes_ = bytes;
	last_time_ = now;
	speed_ = 0.0;
	primed_ = false;
}

double SpeedMeter::update(long long bytes, clock::time_point now) {
	auto elapsed = now - last_time_;
	if (elapsed < kMinRateWindow) return speed_;

	double dt = std::chrono::duration<double>(elapsed).count();
	double instant = static_cast<double>(bytes - last_bytes_) / dt;
	if (!primed_) {
		speed_ = instant;
		primed_ = true;
	} else {
		double alpha =
			half_life_s_ > 0 ? 1.0 - std::exp(-dt * std::log(2.0) / half_life_s_)
							 : 1.0;
		speed_ += alpha * (instant - speed_);
	}
	last_bytes_ = bytes;
	last_time_ = now;
	return speed_;
}

std::optional<double> estimate_eta(long long done,
								   std::optional<long long> total,
								   double speed) {
	if (!total || !(speed > 0)) return std::nullopt;
	long long remaining = *total - done;
	if (remaining < 0) remaining = 0;
	return static_cast<double>(remaining) / speed;
}

LiveTransferOptions::LiveTransferOptions(TransferOptions options)
	: current_(std::make_shared<const TransferOptions>(std::move(options))) {}

std::shared_ptr<const TransferOptions> LiveTransferOptions::get() const {
	std::lock_guard lock(mutex_);
	return current_;
}

void LiveTransferOptions::set(TransferOptions options) {
	auto next = std::make_shared<const TransferOptions>(std::move(options));
	std::lock_guard lock(mutex_);
	current_ = std::move(next);
}

TransferExecutor::TransferExecutor(TransferOptions options)
	: options_(std::make_shared<LiveTransferOptions>(std::move(options))) {}

TransferExecutor::TransferExecutor(std::shared_ptr<LiveTransferOptions> options)
	: options_(std::move(options)) {}

fs::path TransferExecutor::temp_path_for(const fs::path &destination,
										 std::string_view suffix) {
	auto temp = destination;
	temp += std::string(suffix);
	return temp;
}

Result<fs::path> TransferExecutor::run(ByteStream &stream,
									   const fs::path &destination,
									   long long resume_offset,
									   const std::atomic<StopReason> &stop,
									   const SampleCallback &on_sample) const {
	using clock = std::chrono::steady_clock;

	// Buffer, smoothing and temp name are fixed for the attempt; the timing
	// fields are re-read below on every iteration
	auto opts = options_->get();
	const auto temp = temp_path_for(destination, opts->temp_suffix);
	std::error_code ec;

	if (destination.has_parent_path()) {
		fs::create_directories(destination.parent_path(), ec);
		if (ec) {
			stream.close();
			return fail(errc::io_error,
						fmt::format("cannot create {}: {}",
									destination.parent_path().string(),
									ec.message()));
		}
	}

	// Continue the previous attempt when both the file and the stream allow
	long long offset = 0;
	if (resume_offset > 0) {
		auto existing = fs::file_size(temp, ec);
		if (!ec && static_cast<long long>(existing) >= resume_offset &&
			stream.resume_from(resume_offset)) {
			fs::resize_file(temp, static_cast<std::uintmax_t>(resume_offset),
							ec);
			if (!ec) {
				offset = resume_offset;
			} else {
				stream.resume_from(0);
			}
		}
		if (offset == 0) {
			spdlog::info("Cannot resume {} at {} bytes, restarting",
						 temp.string(), resume_offset);
		}
	}

	std::ofstream out(temp, offset > 0 ? std::ios::binary | std::ios::app
									   : std::ios::binary | std::ios::trunc);
	if (!out.is_open()) {
		stream.close();
		return fail(errc::io_error, "cannot open " + temp.string());
	}

	auto bail = [&](Error error) -> Result<fs::path> {
		stream.close();
		out.close();
		return outcome::failure(std::move(error));
	};

	const auto total = stream.total_bytes();
	auto now = clock::now();
	SpeedMeter meter(opts->speed_half_life);
	meter.reset(offset, now);

	long long bytes = offset;
	long long last_sample_bytes = bytes;
	auto last_sample_time = now;
	auto last_data_time = now;

	auto emit = [&](bool attempt_start) {
		if (!on_sample) return;
		ProgressSample sample;
		sample.bytes_transferred = bytes;
		sample.total_bytes = total;
		sample.speed_bytes_per_sec = meter.speed();
		sample.eta_seconds = estimate_eta(bytes, total, meter.speed());
		sample.attempt_start = attempt_start;
		on_sample(sample);
		last_sample_bytes = bytes;
		last_sample_time = clock::now();
	};

	emit(true);

	std::vector<char> buffer(opts->buffer_size);
	while (!stream.eof()) {
		opts = options_->get();
		auto reason = stop.load(std::memory_order_acquire);
		if (reason != StopReason::none) {
			stream.close();
			out.close();
			if (reason == StopReason::cancel) {
				fs::remove(temp, ec);
				if (ec) {
					spdlog::warn("Failed to remove {}: {}", temp.string(),
								 ec.message());
				}
				return fail(errc::canceled);
			}
			return fail(errc::canceled, "paused");
		}

		auto read = stream.read_some(buffer, opts->poll_interval);
		if (read.has_error()) {
			auto error = read.error();
			if (group_of(error.code) != error_group::transfer) {
				error = Error{errc::stream_error, error.message()};
			}
			return bail(std::move(error));
		}

		now = clock::now();
		const auto n = read.value();
		if (n > 0) {
			out.write(buffer.data(), static_cast<std::streamsize>(n));
			if (!out) {
				return bail(Error{errc::io_error,
								   "write failed: " + temp.string()});
			}
			bytes += static_cast<long long>(n);
			last_data_time = now;
		} else if (!stream.eof() &&
				   now - last_data_time >= opts->idle_timeout) {
			return bail(Error{
				errc::stream_error,
				fmt::format("stalled, no data for {} ms",
							std::chrono::duration_cast<std::chrono::milliseconds>(
								now - last_data_time)
								.count())});
		}

		meter.update(bytes, now);
		if (now - last_sample_time >= opts->progress_interval ||
			bytes - last_sample_bytes >= opts->progress_bytes) {
			emit(false);
		}
	}

	stream.close();
	out.close();
	if (out.fail()) {
		return fail(errc::io_error, "failed to flush " + temp.string());
	}

	if (total && bytes < *total) {
		return fail(errc::stream_error,
					fmt::format("stream ended at {} of {} bytes", bytes,
								*total));
	}

	if (bytes != last_sample_bytes) emit(false);

	auto final_path = ensure_unique_path(destination);
	fs::rename(temp, final_path, ec);
	if (ec) {
		return fail(errc::io_error,
					fmt::format("cannot rename {} to {}: {}", temp.string(),
								final_path.string(), ec.message()));
	}

	spdlog::debug("Transfer complete: {} ({} bytes)", final_path.string(),
				  bytes);
	return final_path;
}

}  // namespace mediaq
