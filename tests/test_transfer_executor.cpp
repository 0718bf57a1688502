#include <gtest/gtest.h>

#include <fstream>
#include <mediaq/transfer.hpp>
#include <thread>

#include "fake_resolver.hpp"

using namespace mediaq;
using namespace std::chrono_literals;
using mediaq::testing::FakeStream;
using mediaq::testing::StreamScript;
using mediaq::testing::TempDir;
using mediaq::testing::make_payload;
using mediaq::testing::read_file;

namespace {

TransferOptions fast_options() {
	TransferOptions o;
	o.progress_interval = 5ms;
	o.idle_timeout = 100ms;
	o.poll_interval = 10ms;
	o.buffer_size = 4096;
	return o;
}

}  // namespace

TEST(TransferExecutor, CopiesStreamAndReportsSamples) {
	TempDir dir;
	auto payload = make_payload(20000);
	StreamScript script;
	script.data = payload;
	FakeStream stream(script);

	std::vector<ProgressSample> samples;
	std::atomic<StopReason> stop{StopReason::none};
	TransferExecutor exec(fast_options());
	auto dest = dir.path() / "sub" / "out.mp4";
	auto res = exec.run(stream, dest, 0, stop,
						[&](const ProgressSample &s) { samples.push_back(s); });

	ASSERT_TRUE(res) << res.error().message();
	EXPECT_EQ(res.value(), dest);
	EXPECT_EQ(read_file(dest), payload);
	EXPECT_FALSE(std::filesystem::exists(
		TransferExecutor::temp_path_for(dest, ".part")));

	ASSERT_GE(samples.size(), 2u);
	EXPECT_TRUE(samples.front().attempt_start);
	EXPECT_EQ(samples.front().bytes_transferred, 0);
	EXPECT_EQ(samples.back().bytes_transferred, 20000);
	EXPECT_EQ(samples.back().total_bytes, 20000);
	for (std::size_t i = 1; i < samples.size(); ++i) {
		EXPECT_FALSE(samples[i].attempt_start);
		EXPECT_GE(samples[i].bytes_transferred, samples[i - 1].bytes_transferred);
	}
}

TEST(TransferExecutor, NeverOverwritesExistingFile) {
	TempDir dir;
	auto dest = dir.path() / "clip.webm";
	std::ofstream(dest) << "old";

	StreamScript script;
	script.data = "new data";
	FakeStream stream(script);
	std::atomic<StopReason> stop{StopReason::none};
	auto res = TransferExecutor(fast_options()).run(stream, dest, 0, stop, {});

	ASSERT_TRUE(res);
	EXPECT_EQ(res.value(), dir.path() / "clip (1).webm");
	EXPECT_EQ(read_file(dest), "old");
	EXPECT_EQ(read_file(res.value()), "new data");
}

TEST(TransferExecutor, CancelRemovesPartialFile) {
	TempDir dir;
	StreamScript script;
	script.data = make_payload(100000);
	script.chunk = 100;
	script.chunk_delay = 2ms;
	FakeStream stream(script);

	std::atomic<StopReason> stop{StopReason::none};
	auto dest = dir.path() / "x.mp4";
	auto res = TransferExecutor(fast_options())
				   .run(stream, dest, 0, stop, [&](const ProgressSample &s) {
					   if (s.bytes_transferred > 0) stop = StopReason::cancel;
				   });

	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::canceled);
	EXPECT_FALSE(std::filesystem::exists(dest));
	EXPECT_FALSE(std::filesystem::exists(
		TransferExecutor::temp_path_for(dest, ".part")));
}

TEST(TransferExecutor, PauseKeepsPartialFile) {
	TempDir dir;
	StreamScript script;
	script.data = make_payload(100000);
	script.chunk = 100;
	script.chunk_delay = 2ms;
	FakeStream stream(script);

	std::atomic<StopReason> stop{StopReason::none};
	long long seen = 0;
	auto dest = dir.path() / "x.mp4";
	auto res = TransferExecutor(fast_options())
				   .run(stream, dest, 0, stop, [&](const ProgressSample &s) {
					   seen = s.bytes_transferred;
					   if (seen > 0) stop = StopReason::pause;
				   });

	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::canceled);
	auto temp = TransferExecutor::temp_path_for(dest, ".part");
	ASSERT_TRUE(std::filesystem::exists(temp));
	EXPECT_GE(static_cast<long long>(std::filesystem::file_size(temp)), seen);
	EXPECT_FALSE(std::filesystem::exists(dest));
}

TEST(TransferExecutor, StallBecomesStreamError) {
	TempDir dir;
	StreamScript script;
	script.data = make_payload(5000);
	script.stall_after = 1000;
	FakeStream stream(script);

	std::atomic<StopReason> stop{StopReason::none};
	auto start = std::chrono::steady_clock::now();
	auto res = TransferExecutor(fast_options())
				   .run(stream, dir.path() / "s.bin", 0, stop, {});

	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::stream_error);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
}

TEST(TransferExecutor, PicksUpOptionsChangedMidTransfer) {
	TempDir dir;
	StreamScript script;
	script.data = make_payload(5000);
	script.stall_after = 1000;
	FakeStream stream(script);

	auto opts = fast_options();
	opts.idle_timeout = 30s;
	auto live = std::make_shared<LiveTransferOptions>(opts);
	TransferExecutor exec(live);

	std::atomic<StopReason> stop{StopReason::none};
	std::atomic<bool> lowered{false};
	auto start = std::chrono::steady_clock::now();
	auto res = exec.run(stream, dir.path() / "l.bin", 0, stop,
						[&](const ProgressSample &s) {
							if (s.bytes_transferred >= 1000 && !lowered) {
								auto next = opts;
								next.idle_timeout = 100ms;
								live->set(next);
								lowered = true;
							}
						});

	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::stream_error);
	EXPECT_TRUE(lowered);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
	EXPECT_EQ(live->get()->idle_timeout, 100ms);
}

TEST(TransferExecutor, ShortStreamIsIncomplete) {
	TempDir dir;
	StreamScript script;
	script.data = make_payload(1000);
	script.total = 2000;
	FakeStream stream(script);

	std::atomic<StopReason> stop{StopReason::none};
	auto dest = dir.path() / "short.bin";
	auto res = TransferExecutor(fast_options()).run(stream, dest, 0, stop, {});

	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::stream_error);
	EXPECT_FALSE(std::filesystem::exists(dest));
}

TEST(TransferExecutor, ReadErrorsBecomeTransferErrors) {
	TempDir dir;
	StreamScript script;
	script.data = make_payload(4000);
	script.fail_after = 2000;
	script.fail_with = errc::network_unavailable;
	FakeStream stream(script);

	std::atomic<StopReason> stop{StopReason::none};
	auto res = TransferExecutor(fast_options())
				   .run(stream, dir.path() / "e.bin", 0, stop, {});
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::stream_error);
	EXPECT_TRUE(is_retryable(res.error().code));
}

TEST(TransferExecutor, ResumesFromPartialFile) {
	TempDir dir;
	auto payload = make_payload(8000);
	auto dest = dir.path() / "r.mp4";
	auto temp = TransferExecutor::temp_path_for(dest, ".part");
	std::ofstream(temp, std::ios::binary) << payload.substr(0, 3000);

	StreamScript script;
	script.data = payload;
	FakeStream stream(script);
	std::vector<ProgressSample> samples;
	std::atomic<StopReason> stop{StopReason::none};
	auto res = TransferExecutor(fast_options())
				   .run(stream, dest, 3000, stop,
						[&](const ProgressSample &s) { samples.push_back(s); });

	ASSERT_TRUE(res) << res.error().message();
	EXPECT_EQ(stream.resumed_at_, 3000);
	EXPECT_EQ(read_file(dest), payload);
	ASSERT_FALSE(samples.empty());
	EXPECT_EQ(samples.front().bytes_transferred, 3000);
}

TEST(TransferExecutor, RestartsWhenStreamCannotResume) {
	TempDir dir;
	auto payload = make_payload(6000);
	auto dest = dir.path() / "n.mp4";
	std::ofstream(TransferExecutor::temp_path_for(dest, ".part"),
				  std::ios::binary)
		<< "garbage that must not survive";

	StreamScript script;
	script.data = payload;
	script.resumable = false;
	FakeStream stream(script);
	std::atomic<StopReason> stop{StopReason::none};
	auto res = TransferExecutor(fast_options()).run(stream, dest, 20, stop, {});

	ASSERT_TRUE(res) << res.error().message();
	EXPECT_EQ(stream.resumed_at_, -1);
	EXPECT_EQ(read_file(dest), payload);
}

TEST(SpeedMeter, SmoothsTowardsSteadyRate) {
	using clock = SpeedMeter::clock;
	SpeedMeter meter(1000ms);
	auto t = clock::now();
	meter.reset(0, t);

	// Updates inside the minimum window are ignored
	EXPECT_EQ(meter.update(500, t + 10ms), 0.0);

	EXPECT_DOUBLE_EQ(meter.update(1000, t + 1000ms), 1000.0);
	double s = meter.update(3000, t + 2000ms);
	EXPECT_GT(s, 1000.0);
	EXPECT_LT(s, 2000.0);
}

TEST(SpeedMeter, EtaNeedsTotalAndSpeed) {
	EXPECT_FALSE(estimate_eta(10, std::nullopt, 100.0));
	EXPECT_FALSE(estimate_eta(10, 100, 0.0));
	EXPECT_DOUBLE_EQ(*estimate_eta(100, 1100, 50.0), 20.0);
	EXPECT_DOUBLE_EQ(*estimate_eta(2000, 1000, 50.0), 0.0);
}
