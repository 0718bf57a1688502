#pragma once

#include <mediaq/mediaq_export.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <mediaq/resolver.hpp>

namespace mediaq {

struct MEDIAQ_EXPORT HttpResolverOptions {
	std::chrono::seconds connect_timeout{30};
	int max_redirects = 5;
	std::size_t read_buffer = 256 * 1024;
	std::string user_agent = "mediaq/1.0";
};

/// Direct links to media files over http:// and https://. A HEAD request
/// yields a single variant; streams are plain GETs, resumable with Range.
class MEDIAQ_EXPORT HttpResolver : public Resolver {
   public:
	HttpResolver(const HttpResolver &) = delete;
	HttpResolver &operator=(const HttpResolver &) = delete;
	~HttpResolver() override;

	explicit HttpResolver(HttpResolverOptions options = {});

	Result<MediaInfo> resolve(const std::string &url,
							  const Credentials &credentials) override;

	Result<std::unique_ptr<ByteStream>> open(
		const std::string &url, const VariantDescriptor &variant,
		const Credentials &credentials) override;

	struct Impl;

   private:
	std::shared_ptr<Impl> m_impl;
};

/// Build a Cookie header value from a Netscape cookie file for a request to
/// `host` + `path`. Empty when nothing matches or the file is unreadable.
MEDIAQ_EXPORT std::string cookie_header_for(
	const std::filesystem::path &cookie_file, const std::string &host,
	const std::string &path, bool secure);

/// "video/mp4" -> "mp4". Empty for types without a usual extension.
MEDIAQ_EXPORT std::string container_for_content_type(std::string_view type);

}  // namespace mediaq
