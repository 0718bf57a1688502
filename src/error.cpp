#include <mediaq/result.hpp>

#include <string>

namespace mediaq {

struct mediaq_error_category : std::error_category {
	const char *name() const noexcept override { return "mediaq"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::unsupported_url: return "Unsupported URL";
			case errc::network_unavailable: return "Network unavailable";
			case errc::auth_required: return "Authentication required";
			case errc::no_variants_found: return "No variants found";
			case errc::io_error: return "I/O error";
			case errc::stream_error: return "Stream error";
			case errc::canceled: return "Canceled";
			case errc::not_found: return "Not found";
			case errc::invalid_state: return "Invalid state";
			case errc::invalid_concurrency_limit:
				return "Invalid concurrency limit";
			case errc::invalid_settings: return "Invalid settings";
			default: return "Unknown error";
		}
	}
};

const std::error_category &mediaq_category() {
	static mediaq_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), mediaq_category()};
}

error_group group_of(const std::error_code &ec) {
	if (!ec) return error_group::none;
	if (ec.category() != mediaq_category()) return error_group::other;
	const int v = ec.value();
	if (v >= 10 && v < 20) return error_group::resolution;
	if (v >= 20 && v < 30) return error_group::transfer;
	if (v >= 30 && v < 40) return error_group::usage;
	if (v >= 40 && v < 50) return error_group::settings;
	return error_group::other;
}

bool is_retryable(const std::error_code &ec) {
	return ec == errc::io_error || ec == errc::stream_error;
}

std::string Error::message() const {
	if (detail.empty()) return code.message();
	return code.message() + ": " + detail;
}

void outcome_throw_as_system_error_with_payload(const Error &e) {
	throw std::system_error(e.code, e.detail);
}

}  // namespace mediaq
