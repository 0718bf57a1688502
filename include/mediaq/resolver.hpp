#pragma once

#include <mediaq/mediaq_export.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <mediaq/result.hpp>
#include <mediaq/types.hpp>

namespace mediaq {

/// Readable byte source for one chosen variant.
class MEDIAQ_EXPORT ByteStream {
   public:
	virtual ~ByteStream() = default;

	[[nodiscard]] virtual std::optional<long long> total_bytes() const = 0;

	/// Read up to buffer.size() bytes, blocking for at most `wait`.
	/// Returns 0 with eof() == false when nothing arrived in time.
	virtual Result<std::size_t> read_some(std::span<char> buffer,
										  std::chrono::milliseconds wait) = 0;

	[[nodiscard]] virtual bool eof() const = 0;

	/// Position the stream so the next read returns byte `offset`.
	/// Streams that cannot resume only accept 0.
	virtual bool resume_from(long long offset) { return offset == 0; }

	virtual void close() = 0;
};

/// Pluggable extraction backend. Implementations must be safe to call
/// concurrently for distinct URLs and never retry on their own.
class MEDIAQ_EXPORT Resolver {
   public:
	virtual ~Resolver() = default;

	/// unsupported_url, network_unavailable, auth_required, no_variants_found
	virtual Result<MediaInfo> resolve(const std::string &url,
									  const Credentials &credentials) = 0;

	virtual Result<std::unique_ptr<ByteStream>> open(
		const std::string &url, const VariantDescriptor &variant,
		const Credentials &credentials) = 0;
};

/// Serves file:// URLs and absolute paths as a single variant.
class MEDIAQ_EXPORT FileResolver : public Resolver {
   public:
	Result<MediaInfo> resolve(const std::string &url,
							  const Credentials &credentials) override;

	Result<std::unique_ptr<ByteStream>> open(
		const std::string &url, const VariantDescriptor &variant,
		const Credentials &credentials) override;

	/// "file:///a/b.mp4" -> "/a/b.mp4", plain absolute paths pass through.
	static std::optional<std::string> local_path(const std::string &url);
};

}  // namespace mediaq
