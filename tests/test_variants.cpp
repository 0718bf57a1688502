#include <gtest/gtest.h>

#include <mediaq/types.hpp>

#include "fake_resolver.hpp"

using namespace mediaq;
using mediaq::testing::make_variant;

TEST(Variants, DropsEntriesWithoutAudioOrVideo) {
	auto storyboard = make_variant("sb", 0);
	storyboard.acodec = "none";
	std::vector<VariantDescriptor> v = {make_variant("a", 720), storyboard,
										make_variant("b", 0)};
	normalize_variants(v);
	ASSERT_EQ(v.size(), 2u);
	EXPECT_EQ(v[0].id, "a");
	EXPECT_EQ(v[1].id, "b");
}

TEST(Variants, OrdersBestFirst) {
	auto hd30 = make_variant("hd30", 1080);
	hd30.fps = 30;
	auto hd60 = make_variant("hd60", 1080);
	hd60.fps = 60;
	auto sd_fast = make_variant("sd_fast", 480);
	sd_fast.tbr = 2000;
	auto sd_slow = make_variant("sd_slow", 480);
	sd_slow.tbr = 900;
	auto audio = make_variant("audio", 0);

	std::vector<VariantDescriptor> v = {audio, sd_slow, hd30, sd_fast, hd60};
	normalize_variants(v);

	std::vector<std::string> ids;
	for (const auto &x : v) ids.push_back(x.id);
	EXPECT_EQ(ids, (std::vector<std::string>{"hd60", "hd30", "sd_fast",
											 "sd_slow", "audio"}));
}

TEST(Variants, DisplayTextJoinsKnownParts) {
	auto v = make_variant("137", 1080);
	v.fps = 30;
	v.approx_size = 12 * 1024 * 1024 + 300 * 1024;
	v.note = "HD";
	EXPECT_EQ(display_text(v), "1080p • 30fps • avc1 • mp4a • 12.3 MB • mp4 • HD");

	VariantDescriptor bare;
	bare.container = "webm";
	EXPECT_EQ(display_text(bare), "webm");
}

TEST(Variants, PercentageNeedsKnownTotal) {
	ProgressSnapshot p;
	p.bytes_transferred = 50;
	EXPECT_FALSE(p.percentage());
	p.total_bytes = 200;
	ASSERT_TRUE(p.percentage());
	EXPECT_DOUBLE_EQ(*p.percentage(), 25.0);
}
