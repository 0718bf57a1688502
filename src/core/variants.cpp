#include <fmt/format.h>

#include <algorithm>
#include <mediaq/types.hpp>
#include <string>
#include <vector>

namespace mediaq {

namespace {
constexpr double MIB = 1024.0 * 1024.0;

bool carries(const std::string &codec) {
	// Unknown codecs count as present, only an explicit "none" is absent
	return codec != "none";
}
}  // namespace

void normalize_variants(std::vector<VariantDescriptor> &variants) {
	variants.erase(std::remove_if(variants.begin(), variants.end(),
								  [](const VariantDescriptor &v) {
									  return !carries(v.vcodec) &&
											 !carries(v.acodec);
								  }),
				   variants.end());

	// Best first: height, fps, bitrate, size
	std::stable_sort(variants.begin(), variants.end(),
					 [](const VariantDescriptor &a, const VariantDescriptor &b) {
						 if (a.height != b.height) return a.height > b.height;
						 if (a.fps != b.fps) return a.fps > b.fps;
						 if (a.tbr != b.tbr) return a.tbr > b.tbr;
						 return a.approx_size.value_or(0) >
								b.approx_size.value_or(0);
					 });
}

std::string display_text(const VariantDescriptor &variant) {
	std::vector<std::string> parts;
	if (!variant.resolution.empty()) parts.push_back(variant.resolution);
	if (variant.fps > 0) parts.push_back(fmt::format("{}fps", variant.fps));
	if (!variant.vcodec.empty() && variant.vcodec != "none")
		parts.push_back(variant.vcodec);
	if (!variant.acodec.empty() && variant.acodec != "none")
		parts.push_back(variant.acodec);
	if (variant.approx_size && *variant.approx_size > 0) {
		parts.push_back(fmt::format(
			"{:.1f} MB", static_cast<double>(*variant.approx_size) / MIB));
	}
	if (!variant.container.empty()) parts.push_back(variant.container);
	if (!variant.note.empty()) parts.push_back(variant.note);

	std::string out;
	for (const auto &part : parts) {
		if (!out.empty()) out += " • ";
		out += part;
	}
	return out;
}

}  // namespace mediaq
