#include <gtest/gtest.h>

#include <mediaq/job.hpp>

#include "fake_resolver.hpp"

using namespace mediaq;
using mediaq::testing::make_variant;

namespace {

Job awaiting_job() {
	Job job(1, "https://example.com/v");
	EXPECT_TRUE(job.transition_to(JobState::resolving));
	job.set_media(MediaInfo{"Title", {make_variant("low", 360),
									  make_variant("high", 1080)}});
	EXPECT_TRUE(job.transition_to(JobState::awaiting_selection));
	return job;
}

}  // namespace

TEST(JobState, NamesMatchLifecycle) {
	EXPECT_EQ(to_string(JobState::pending), "Pending");
	EXPECT_EQ(to_string(JobState::resolving), "VariantsResolving");
	EXPECT_EQ(to_string(JobState::awaiting_selection), "AwaitingSelection");
	EXPECT_EQ(to_string(JobState::canceled), "Canceled");
}

TEST(JobState, TerminalStates) {
	EXPECT_TRUE(is_terminal(JobState::succeeded));
	EXPECT_TRUE(is_terminal(JobState::failed));
	EXPECT_TRUE(is_terminal(JobState::canceled));
	EXPECT_FALSE(is_terminal(JobState::paused));
	EXPECT_FALSE(is_terminal(JobState::queued));
}

TEST(JobState, AllowedEdges) {
	using S = JobState;
	EXPECT_TRUE(can_transition(S::pending, S::resolving));
	EXPECT_TRUE(can_transition(S::resolving, S::failed));
	EXPECT_TRUE(can_transition(S::awaiting_selection, S::queued));
	EXPECT_TRUE(can_transition(S::queued, S::running));
	EXPECT_TRUE(can_transition(S::running, S::queued));
	EXPECT_TRUE(can_transition(S::running, S::paused));
	EXPECT_TRUE(can_transition(S::paused, S::queued));
	EXPECT_TRUE(can_transition(S::failed, S::queued));
	EXPECT_TRUE(can_transition(S::failed, S::pending));

	EXPECT_FALSE(can_transition(S::pending, S::queued));
	EXPECT_FALSE(can_transition(S::awaiting_selection, S::running));
	EXPECT_FALSE(can_transition(S::queued, S::paused));
	EXPECT_FALSE(can_transition(S::paused, S::running));
	EXPECT_FALSE(can_transition(S::succeeded, S::queued));
	EXPECT_FALSE(can_transition(S::canceled, S::pending));
	EXPECT_FALSE(can_transition(S::failed, S::running));
}

TEST(JobState, InvalidTransitionNamesCurrentState) {
	Job job(4, "u");
	auto res = job.transition_to(JobState::running);
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::invalid_state);
	EXPECT_NE(res.error().detail.find("Pending"), std::string::npos);
	EXPECT_EQ(job.state(), JobState::pending);
}

TEST(JobState, TransitionReturnsPreviousState) {
	Job job(1, "u");
	auto prev = job.transition_to(JobState::resolving);
	ASSERT_TRUE(prev);
	EXPECT_EQ(prev.value(), JobState::pending);
	EXPECT_EQ(job.state(), JobState::resolving);
}

TEST(JobState, SetMediaNormalizesVariants) {
	auto job = awaiting_job();
	ASSERT_TRUE(job.has_variants());
	ASSERT_EQ(job.variants().size(), 2u);
	EXPECT_EQ(job.variants()[0].id, "high");
	EXPECT_EQ(job.title(), "Title");
}

TEST(JobState, SelectUnknownVariantFails) {
	auto job = awaiting_job();
	auto res = job.select_variant("nope");
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::not_found);
	EXPECT_FALSE(job.variant());
}

TEST(JobState, SelectVariantTakesApproxSize) {
	auto job = awaiting_job();
	ASSERT_TRUE(job.select_variant("low"));
	ASSERT_TRUE(job.variant());
	EXPECT_EQ(job.variant()->id, "low");
	EXPECT_FALSE(job.progress().total_bytes);

	Job sized(2, "u");
	ASSERT_TRUE(sized.transition_to(JobState::resolving));
	auto v = make_variant("v", 720);
	v.approx_size = 4096;
	sized.set_media(MediaInfo{"t", {v}});
	ASSERT_TRUE(sized.select_variant("v"));
	EXPECT_EQ(sized.progress().total_bytes, 4096);
}

TEST(JobState, ProgressNeverMovesBackwardsWithinAttempt) {
	Job job(1, "u");
	ProgressSample s;
	s.bytes_transferred = 100;
	s.total_bytes = 1000;
	EXPECT_TRUE(job.apply_sample(s));

	s.bytes_transferred = 50;
	EXPECT_FALSE(job.apply_sample(s));
	EXPECT_EQ(job.progress().bytes_transferred, 100);

	// A new attempt may restart from zero
	s.bytes_transferred = 0;
	s.attempt_start = true;
	EXPECT_TRUE(job.apply_sample(s));
	EXPECT_EQ(job.progress().bytes_transferred, 0);
	EXPECT_EQ(job.progress().total_bytes, 1000);
}

TEST(JobState, EtaFallsBackToVariantSize) {
	Job job(1, "u");
	ASSERT_TRUE(job.transition_to(JobState::resolving));
	auto v = make_variant("v", 720);
	v.approx_size = 200000;
	job.set_media(MediaInfo{"t", {v}});
	ASSERT_TRUE(job.select_variant("v"));

	// The stream announces no length
	ProgressSample s;
	s.bytes_transferred = 40000;
	s.speed_bytes_per_sec = 20000.0;
	ASSERT_TRUE(job.apply_sample(s));
	EXPECT_EQ(job.progress().total_bytes, 200000);
	ASSERT_TRUE(job.progress().eta_seconds);
	EXPECT_DOUBLE_EQ(*job.progress().eta_seconds, 8.0);

	// Without a speed there is still nothing to estimate from
	s.bytes_transferred = 50000;
	s.speed_bytes_per_sec = 0.0;
	ASSERT_TRUE(job.apply_sample(s));
	EXPECT_FALSE(job.progress().eta_seconds);

	// A stream-provided estimate wins
	s.speed_bytes_per_sec = 1000.0;
	s.eta_seconds = 3.5;
	ASSERT_TRUE(job.apply_sample(s));
	EXPECT_DOUBLE_EQ(*job.progress().eta_seconds, 3.5);
}

TEST(JobState, RetryCountIsPartOfProgress) {
	Job job(1, "u");
	job.count_retry();
	job.count_retry();
	EXPECT_EQ(job.retry_count(), 2);
	EXPECT_EQ(job.snapshot().progress.retry_count, 2);
	job.reset_retries();
	EXPECT_EQ(job.retry_count(), 0);
}

TEST(JobState, SnapshotCopiesState) {
	auto job = awaiting_job();
	job.set_error(Error{errc::stream_error, "x"});
	auto snap = job.snapshot();
	EXPECT_EQ(snap.id, 1u);
	EXPECT_EQ(snap.state, JobState::awaiting_selection);
	ASSERT_TRUE(snap.last_error);
	EXPECT_EQ(snap.last_error->code, errc::stream_error);
}
