#include <gtest/gtest.h>

#include <fstream>
#include <mediaq/resolver.hpp>

#include "fake_resolver.hpp"

using namespace mediaq;
using namespace std::chrono_literals;

TEST(FileResolver, LocalPathAcceptsFileUrlsAndAbsolutePaths) {
	EXPECT_EQ(FileResolver::local_path("file:///a/b.mp4"), "/a/b.mp4");
	EXPECT_EQ(FileResolver::local_path("file://localhost/a/b.mp4"), "/a/b.mp4");
	EXPECT_EQ(FileResolver::local_path("file:///my%20clip.webm"),
			  "/my clip.webm");
	EXPECT_EQ(FileResolver::local_path("/srv/x.mkv"), "/srv/x.mkv");

	EXPECT_FALSE(FileResolver::local_path("relative/x.mp4"));
	EXPECT_FALSE(FileResolver::local_path("file://host/x.mp4"));
	EXPECT_FALSE(FileResolver::local_path("https://example.com/x.mp4"));
}

TEST(FileResolver, ResolvesSingleSourceVariant) {
	mediaq::testing::TempDir dir;
	auto file = dir.path() / "Holiday.MP4";
	std::ofstream(file, std::ios::binary) << mediaq::testing::make_payload(3000);

	FileResolver resolver;
	auto res = resolver.resolve("file://" + file.string(), {});
	ASSERT_TRUE(res) << res.error().message();
	EXPECT_EQ(res.value().title, "Holiday");
	ASSERT_EQ(res.value().variants.size(), 1u);
	const auto &v = res.value().variants.front();
	EXPECT_EQ(v.id, "source");
	EXPECT_EQ(v.container, "mp4");
	EXPECT_EQ(v.approx_size, 3000);
}

TEST(FileResolver, ResolveErrors) {
	mediaq::testing::TempDir dir;
	FileResolver resolver;

	auto missing = resolver.resolve((dir.path() / "gone.mp4").string(), {});
	ASSERT_TRUE(missing.has_error());
	EXPECT_EQ(missing.error().code, errc::no_variants_found);

	auto remote = resolver.resolve("https://example.com/v.mp4", {});
	ASSERT_TRUE(remote.has_error());
	EXPECT_EQ(remote.error().code, errc::unsupported_url);

	auto directory = resolver.resolve(dir.path().string(), {});
	ASSERT_TRUE(directory.has_error());
	EXPECT_EQ(directory.error().code, errc::unsupported_url);
}

TEST(FileResolver, OpenReadsWholeFileAndResumes) {
	mediaq::testing::TempDir dir;
	auto file = dir.path() / "a.bin";
	auto payload = mediaq::testing::make_payload(5000);
	std::ofstream(file, std::ios::binary) << payload;

	FileResolver resolver;
	auto info = resolver.resolve(file.string(), {});
	ASSERT_TRUE(info);
	auto opened = resolver.open(file.string(), info.value().variants.front(), {});
	ASSERT_TRUE(opened) << opened.error().message();
	auto &stream = *opened.value();
	EXPECT_EQ(stream.total_bytes(), 5000);

	ASSERT_TRUE(stream.resume_from(4000));
	std::string got;
	std::vector<char> buf(512);
	while (!stream.eof()) {
		auto n = stream.read_some(buf, 10ms);
		ASSERT_TRUE(n);
		got.append(buf.data(), n.value());
	}
	EXPECT_EQ(got, payload.substr(4000));
	EXPECT_FALSE(stream.resume_from(6000));
	stream.close();
}

TEST(FileResolver, OpenRejectsForeignVariant) {
	mediaq::testing::TempDir dir;
	auto file = dir.path() / "a.bin";
	std::ofstream(file) << "x";

	FileResolver resolver;
	auto res = resolver.open(file.string(), mediaq::testing::make_variant("137", 1080), {});
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::no_variants_found);
}
