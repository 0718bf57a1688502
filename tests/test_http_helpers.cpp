#include <gtest/gtest.h>

#include <fstream>
#include <mediaq/http_resolver.hpp>

#include "fake_resolver.hpp"

using namespace mediaq;
using namespace std::chrono_literals;

namespace {

std::filesystem::path write_cookies(const std::filesystem::path &dir) {
	auto file = dir / "cookies.txt";
	std::ofstream out(file);
	out << "# Netscape HTTP Cookie File\n"
		<< "\n"
		<< ".example.com\tTRUE\t/\tFALSE\t0\tsession\tabc\n"
		<< "#HttpOnly_video.example.com\tFALSE\t/media\tTRUE\t0\ttoken\txyz\r\n"
		<< "example.org\tFALSE\t/\tFALSE\t0\tother\tnope\n"
		<< ".example.com\tTRUE\t/\tFALSE\t1000\texpired\told\n"
		<< "broken line without tabs\n";
	return file;
}

}  // namespace

TEST(CookieHeader, MatchesDomainPathAndSecurity) {
	mediaq::testing::TempDir dir;
	auto file = write_cookies(dir.path());

	EXPECT_EQ(cookie_header_for(file, "example.com", "/", false), "session=abc");
	EXPECT_EQ(cookie_header_for(file, "cdn.example.com", "/x", true),
			  "session=abc");
	EXPECT_EQ(cookie_header_for(file, "video.example.com", "/media/1.mp4", true),
			  "session=abc; token=xyz");
	// Secure cookie over plain http, and outside its path
	EXPECT_EQ(cookie_header_for(file, "video.example.com", "/media/1.mp4", false),
			  "session=abc");
	EXPECT_EQ(cookie_header_for(file, "video.example.com", "/other", true),
			  "session=abc");
	EXPECT_EQ(cookie_header_for(file, "VIDEO.Example.COM", "/media", true),
			  "session=abc; token=xyz");
}

TEST(CookieHeader, NoMatchForForeignHosts) {
	mediaq::testing::TempDir dir;
	auto file = write_cookies(dir.path());

	EXPECT_EQ(cookie_header_for(file, "badexample.com", "/", true), "");
	EXPECT_EQ(cookie_header_for(file, "sub.example.org", "/", true), "");
	EXPECT_EQ(cookie_header_for(file, "example.org", "/", true), "other=nope");
}

TEST(CookieHeader, UnreadableFileGivesNothing) {
	mediaq::testing::TempDir dir;
	EXPECT_EQ(cookie_header_for(dir.path() / "absent.txt", "example.com", "/", true),
			  "");
}

TEST(ContentType, MapsCommonMediaTypes) {
	EXPECT_EQ(container_for_content_type("video/mp4"), "mp4");
	EXPECT_EQ(container_for_content_type("video/webm"), "webm");
	EXPECT_EQ(container_for_content_type("video/x-matroska"), "mkv");
	EXPECT_EQ(container_for_content_type("audio/mpeg"), "mp3");
	EXPECT_EQ(container_for_content_type("application/octet-stream"), "");
	EXPECT_EQ(container_for_content_type(""), "");
}

TEST(HttpResolver, RejectsOtherSchemes) {
	HttpResolver resolver;
	auto res = resolver.resolve("ftp://example.com/a.mp4", {});
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::unsupported_url);

	auto garbage = resolver.resolve("not a url", {});
	ASSERT_TRUE(garbage.has_error());
	EXPECT_EQ(garbage.error().code, errc::unsupported_url);
}

TEST(HttpResolver, OpenNeedsDirectVariant) {
	HttpResolver resolver;
	auto res = resolver.open("https://example.com/a.mp4",
							 mediaq::testing::make_variant("137", 1080), {});
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::no_variants_found);
}

TEST(HttpResolver, RefusedConnectionIsNetworkError) {
	HttpResolverOptions options;
	options.connect_timeout = 2s;
	HttpResolver resolver(options);
	// Nothing listens on the tcpmux port
	auto res = resolver.resolve("http://127.0.0.1:1/a.mp4", {});
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error().code, errc::network_unavailable);
}
