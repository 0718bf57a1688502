#pragma once

#include <mediaq/mediaq_export.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediaq {

using JobId = std::uint64_t;

/// One selectable quality/format option for a source URL. Produced once per
/// resolution and never mutated afterwards.
struct MEDIAQ_EXPORT VariantDescriptor {
	std::string id;
	std::string resolution;	 // e.g. "1080p", empty for audio only
	int height = 0;
	int fps = 0;
	std::string vcodec;		// "none" when the variant carries no video
	std::string acodec;		// "none" when the variant carries no audio
	std::string container;	// e.g. "mp4", "webm"
	std::optional<long long> approx_size;
	double tbr = 0.0;  // total bitrate in kbit/s, 0 when unknown
	std::string note;  // e.g. "HD", "DASH video"
};

/// What a resolver knows about a URL.
struct MEDIAQ_EXPORT MediaInfo {
	std::string title;
	std::vector<VariantDescriptor> variants;
};

/// Opaque credential artifact handed through to the resolver.
struct MEDIAQ_EXPORT Credentials {
	std::optional<std::filesystem::path> cookies_file;
};

struct MEDIAQ_EXPORT ProgressSnapshot {
	long long bytes_transferred = 0;
	std::optional<long long> total_bytes;
	double speed_bytes_per_sec = 0.0;
	std::optional<double> eta_seconds;
	int retry_count = 0;

	[[nodiscard]] std::optional<double> percentage() const {
		if (!total_bytes || *total_bytes <= 0) return std::nullopt;
		return static_cast<double>(bytes_transferred) * 100.0 /
			   static_cast<double>(*total_bytes);
	}
};

/// Drops variants carrying neither audio nor video and orders the rest best
/// first: height, fps, bitrate, size.
MEDIAQ_EXPORT void normalize_variants(std::vector<VariantDescriptor> &variants);

/// "1080p • 30fps • avc1 • mp4a • 12.3 MB • mp4 • HD"
MEDIAQ_EXPORT std::string display_text(const VariantDescriptor &variant);

}  // namespace mediaq
