#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mediaq/resolver.hpp>

namespace fs = std::filesystem;

namespace mediaq {

namespace {

constexpr std::string_view kFileScheme = "file://";

int hex_value(char c) {
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

std::string percent_decode(std::string_view in) {
	std::string out;
	out.reserve(in.size());
	for (std::size_t i = 0; i < in.size(); ++i) {
		if (in[i] == '%' && i + 2 < in.size()) {
			int hi = hex_value(in[i + 1]);
			int lo = hex_value(in[i + 2]);
			if (hi >= 0 && lo >= 0) {
				out += static_cast<char>(hi * 16 + lo);
				i += 2;
				continue;
			}
		}
		out += in[i];
	}
	return out;
}

class FileStream : public ByteStream {
   public:
	FileStream(const fs::path &path, long long size)
		: in_(path, std::ios::binary), size_(size) {}

	[[nodiscard]] bool is_open() const { return in_.is_open(); }

	[[nodiscard]] std::optional<long long> total_bytes() const override {
		return size_;
	}

	Result<std::size_t> read_some(std::span<char> buffer,
								  std::chrono::milliseconds) override {
		if (eof_) return std::size_t{0};
		in_.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		auto got = static_cast<std::size_t>(in_.gcount());
		if (in_.eof()) {
			eof_ = true;
		} else if (!in_) {
			return fail(errc::stream_error, "file read failed");
		}
		return got;
	}

	[[nodiscard]] bool eof() const override { return eof_; }

	bool resume_from(long long offset) override {
		if (offset < 0 || offset > size_) return false;
		in_.clear();
		in_.seekg(offset);
		eof_ = false;
		return static_cast<bool>(in_);
	}

	void close() override { in_.close(); }

   private:
	std::ifstream in_;
	long long size_;
	bool eof_ = false;
};

}  // namespace

std::optional<std::string> FileResolver::local_path(const std::string &url) {
	std::string_view sv = url;
	if (sv.substr(0, kFileScheme.size()) == kFileScheme) {
		sv.remove_prefix(kFileScheme.size());
		// Optional authority; only the local host makes sense here
		if (sv.substr(0, 9) == "localhost") sv.remove_prefix(9);
		if (sv.empty() || sv.front() != '/') return std::nullopt;
		return percent_decode(sv);
	}
	if (!sv.empty() && sv.front() == '/') return std::string(sv);
	return std::nullopt;
}

Result<MediaInfo> FileResolver::resolve(const std::string &url,
										const Credentials &) {
	auto path_str = local_path(url);
	if (!path_str) return fail(errc::unsupported_url, url);

	fs::path path(*path_str);
	std::error_code ec;
	if (!fs::exists(path, ec)) return fail(errc::no_variants_found, url);
	if (!fs::is_regular_file(path, ec))
		return fail(errc::unsupported_url, "not a regular file: " + url);

	auto size = fs::file_size(path, ec);
	if (ec) return fail(errc::no_variants_found, ec.message());

	std::string ext = path.extension().string();
	if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
	std::transform(ext.begin(), ext.end(), ext.begin(),
				   [](unsigned char c) { return std::tolower(c); });

	VariantDescriptor variant;
	variant.id = "source";
	variant.container = ext;
	variant.approx_size = static_cast<long long>(size);
	variant.note = "local file";

	spdlog::debug("Resolved local file {} ({} bytes)", path.string(), size);
	return MediaInfo{path.stem().string(), {variant}};
}

Result<std::unique_ptr<ByteStream>> FileResolver::open(
	const std::string &url, const VariantDescriptor &variant,
	const Credentials &) {
	if (variant.id != "source") return fail(errc::no_variants_found, variant.id);

	auto path_str = local_path(url);
	if (!path_str) return fail(errc::unsupported_url, url);

	std::error_code ec;
	auto size = fs::file_size(*path_str, ec);
	if (ec) return fail(errc::stream_error, ec.message());

	auto stream =
		std::make_unique<FileStream>(*path_str, static_cast<long long>(size));
	if (!stream->is_open()) return fail(errc::stream_error, "cannot open " + url);
	return std::unique_ptr<ByteStream>(std::move(stream));
}

}  // namespace mediaq
