#include <gtest/gtest.h>

#include <fstream>
#include <mediaq/settings.hpp>

#include "fake_resolver.hpp"

using namespace mediaq;
using namespace std::chrono_literals;

TEST(Settings, DefaultsAreValid) {
	Settings s;
	EXPECT_EQ(s.max_concurrent, 2);
	EXPECT_EQ(s.max_retries, 3);
	EXPECT_EQ(s.poll_interval, 100ms);
	EXPECT_EQ(s.output_template, "%(title)s.%(ext)s");
	EXPECT_EQ(s.destination_root.filename(), "mediaq");
	EXPECT_TRUE(validate(s));
}

TEST(Settings, RejectsZeroConcurrency) {
	Settings s;
	s.max_concurrent = 0;
	auto res = validate(s);
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::invalid_concurrency_limit);
}

TEST(Settings, RejectsSlowCancellationPolling) {
	Settings s;
	s.poll_interval = 250ms;
	auto res = validate(s);
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::invalid_settings);
}

TEST(Settings, BackoffDoublesUpToMaximum) {
	Settings s;
	s.retry_backoff = 1000ms;
	s.retry_backoff_max = 5000ms;
	EXPECT_EQ(s.backoff_for(1), 1000ms);
	EXPECT_EQ(s.backoff_for(2), 2000ms);
	EXPECT_EQ(s.backoff_for(3), 4000ms);
	EXPECT_EQ(s.backoff_for(4), 5000ms);
	EXPECT_EQ(s.backoff_for(30), 5000ms);
}

TEST(Settings, ParseOverlaysKnownKeys) {
	auto j = nlohmann::json::parse(R"({
		"max_concurrent": 4,
		"destination_root": "/tmp/dl",
		"max_retries": 1,
		"idle_timeout_ms": 2000,
		"cookies_file": "/tmp/cookies.txt",
		"something_else": true
	})");
	auto res = parse_settings(j);
	ASSERT_TRUE(res) << res.error().message();
	const auto &s = res.value();
	EXPECT_EQ(s.max_concurrent, 4);
	EXPECT_EQ(s.destination_root, "/tmp/dl");
	EXPECT_EQ(s.max_retries, 1);
	EXPECT_EQ(s.idle_timeout, 2000ms);
	ASSERT_TRUE(s.cookies_file);
	EXPECT_EQ(*s.cookies_file, "/tmp/cookies.txt");
	// Untouched keys keep their defaults
	EXPECT_EQ(s.poll_interval, 100ms);
}

TEST(Settings, ParseAcceptsDesktopAliases) {
	auto j = nlohmann::json::parse(
		R"({"max_concurrent_downloads": 3, "download_dir": "/srv/v", "cookies_file": null})");
	auto res = parse_settings(j);
	ASSERT_TRUE(res);
	EXPECT_EQ(res.value().max_concurrent, 3);
	EXPECT_EQ(res.value().destination_root, "/srv/v");
	EXPECT_FALSE(res.value().cookies_file);
}

TEST(Settings, ParseRejectsWrongTypes) {
	auto res = parse_settings(nlohmann::json::parse(R"({"max_retries": "many"})"));
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::invalid_settings);

	auto zero = parse_settings(nlohmann::json::parse(R"({"max_concurrent": 0})"));
	ASSERT_TRUE(zero.has_error());
	EXPECT_EQ(zero.error().code, errc::invalid_concurrency_limit);
}

TEST(Settings, ParseRejectsOutOfRangeIntegers) {
	auto expect_invalid = [](const char *text) {
		auto res = parse_settings(nlohmann::json::parse(text));
		ASSERT_TRUE(res.has_error()) << text;
		EXPECT_EQ(res.error().code, errc::invalid_settings) << text;
	};
	// Would wrap to a huge buffer when read as unsigned
	expect_invalid(R"({"event_buffer": -1})");
	// Would be truncated to a small positive limit when read as int
	expect_invalid(R"({"max_concurrent": 5000000000})");
	expect_invalid(R"({"max_retries": 18446744073709551615})");
	expect_invalid(R"({"idle_timeout_ms": 1.5})");

	auto ok = parse_settings(nlohmann::json::parse(R"({"event_buffer": 64})"));
	ASSERT_TRUE(ok) << ok.error().message();
	EXPECT_EQ(ok.value().event_buffer, 64u);
}

TEST(Settings, LoadReportsMissingAndMalformedFiles) {
	mediaq::testing::TempDir dir;
	auto missing = load_settings(dir.path() / "nope.json");
	ASSERT_TRUE(missing.has_error());
	EXPECT_EQ(missing.error().code, errc::invalid_settings);

	auto bad = dir.path() / "bad.json";
	std::ofstream(bad) << "{ not json";
	auto parsed = load_settings(bad);
	ASSERT_TRUE(parsed.has_error());
	EXPECT_EQ(parsed.error().code, errc::invalid_settings);
}

TEST(Settings, JsonRoundTripThroughFile) {
	mediaq::testing::TempDir dir;
	Settings s;
	s.max_concurrent = 5;
	s.retry_backoff = 250ms;
	s.output_template = "%(id)s.%(ext)s";

	nlohmann::json j = s;
	auto file = dir.path() / "settings.json";
	std::ofstream(file) << j.dump(2);

	auto loaded = load_settings(file);
	ASSERT_TRUE(loaded) << loaded.error().message();
	EXPECT_EQ(loaded.value().max_concurrent, 5);
	EXPECT_EQ(loaded.value().retry_backoff, 250ms);
	EXPECT_EQ(loaded.value().output_template, "%(id)s.%(ext)s");
}

TEST(Settings, TransferOptionsFollowSettings) {
	Settings s;
	s.poll_interval = 20ms;
	s.idle_timeout = 900ms;
	auto o = s.transfer_options();
	EXPECT_EQ(o.poll_interval, 20ms);
	EXPECT_EQ(o.idle_timeout, 900ms);
	EXPECT_EQ(o.temp_suffix, ".part");
}
