#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <limits>
#include <mediaq/http_resolver.hpp>
#include <sstream>
#include <vector>

#include "utils.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
namespace fs = std::filesystem;
using tcp = asio::ip::tcp;

namespace mediaq {

namespace {

std::string to_lower(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(),
				   [](unsigned char c) { return std::tolower(c); });
	return s;
}

std::string header_value(const http::response_header<> &h, http::field f) {
	auto it = h.find(f);
	if (it == h.end()) return {};
	return std::string(it->value().data(), it->value().size());
}

struct Target {
	bool tls = false;
	std::string host;
	std::string port;
	std::string target;	 // encoded path and query, as sent
	std::string origin;	 // scheme://authority, for relative redirects
	std::string path;	 // decoded path
};

Result<Target> parse_target(const std::string &url) {
	auto u_res = boost::urls::parse_uri(url);
	if (u_res.has_error()) return fail(errc::unsupported_url, url);
	boost::urls::url_view u = u_res.value();

	Target t;
	std::string scheme = to_lower(std::string(u.scheme()));
	if (scheme != "http" && scheme != "https") {
		return fail(errc::unsupported_url, url);
	}
	t.tls = scheme == "https";
	t.host = u.host();
	if (t.host.empty()) return fail(errc::unsupported_url, url);
	t.port = std::string(u.port());
	if (t.port.empty()) t.port = t.tls ? "443" : "80";

	t.target = std::string(u.encoded_path());
	if (u.has_query()) {
		t.target += "?";
		t.target += std::string(u.encoded_query());
	}
	if (t.target.empty()) t.target = "/";
	t.path = u.path();
	t.origin = scheme + "://" + std::string(u.encoded_authority());
	return t;
}

Result<void> check_status(int status, const std::string &url) {
	if (status == 401 || status == 403) {
		return fail(errc::auth_required, fmt::format("HTTP {} for {}", status, url));
	}
	if (status == 404 || status == 410) {
		return fail(errc::no_variants_found,
					fmt::format("HTTP {} for {}", status, url));
	}
	if (status >= 400) {
		return fail(errc::network_unavailable,
					fmt::format("HTTP {} for {}", status, url));
	}
	return outcome::success();
}

bool is_redirect(int status) {
	return status == 301 || status == 302 || status == 303 || status == 307 ||
		   status == 308;
}

// =============================================================================
// One HTTP(S) connection driven by its own io_context. Every operation runs
// the context until the operation completes, so callers see blocking calls
// with beast's per-operation timeouts.
// =============================================================================

class Connection {
   public:
	Connection(ssl::context &ctx, Target target) : target_(std::move(target)) {
		if (target_.tls) {
			tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(
				ioc_, ctx);
		} else {
			plain_ = std::make_unique<beast::tcp_stream>(ioc_);
		}
	}

	Connection(const Connection &) = delete;
	Connection &operator=(const Connection &) = delete;

	~Connection() { close(); }

	[[nodiscard]] const Target &target() const { return target_; }

	Result<void> connect(std::chrono::seconds timeout) {
		beast::error_code ec;
		tcp::resolver resolver(ioc_);
		tcp::resolver::results_type results;
		resolver.async_resolve(
			target_.host, target_.port,
			[&](beast::error_code e, tcp::resolver::results_type r) {
				ec = e;
				results = std::move(r);
			});
		run();
		if (ec) {
			return fail(errc::network_unavailable,
						fmt::format("resolve {}: {}", target_.host, ec.message()));
		}

		lowest().expires_after(timeout);
		lowest().async_connect(
			results, [&](beast::error_code e, const tcp::endpoint &) { ec = e; });
		run();
		if (ec) {
			return fail(errc::network_unavailable,
						fmt::format("connect {}:{}: {}", target_.host,
									target_.port, ec.message()));
		}

		if (tls_) {
			// SNI
			if (!SSL_set_tlsext_host_name(tls_->native_handle(),
										  target_.host.c_str())) {
				return fail(errc::network_unavailable,
							"cannot set TLS server name");
			}
			boost::certify::set_server_hostname(*tls_, target_.host);

			lowest().expires_after(timeout);
			tls_->async_handshake(ssl::stream_base::client,
								  [&](beast::error_code e) { ec = e; });
			run();
			if (ec) {
				return fail(errc::network_unavailable,
							fmt::format("TLS handshake with {}: {}",
										target_.host, ec.message()));
			}
		}
		return outcome::success();
	}

	template <class Request, class Parser>
	beast::error_code exchange_header(Request &req, Parser &parser,
									  std::chrono::seconds timeout) {
		beast::error_code ec;
		lowest().expires_after(timeout);
		with_stream([&](auto &s) {
			http::async_write(s, req,
							  [&](beast::error_code e, std::size_t) { ec = e; });
		});
		run();
		if (ec) return ec;

		lowest().expires_after(timeout);
		with_stream([&](auto &s) {
			http::async_read_header(
				s, buffer_, parser,
				[&](beast::error_code e, std::size_t) { ec = e; });
		});
		run();
		// Body reads are bounded by the caller's idle timeout instead
		lowest().expires_never();
		return ec;
	}

	template <class Parser, class Handler>
	void async_read_some(Parser &parser, Handler &&handler) {
		with_stream([&](auto &s) {
			http::async_read_some(s, buffer_, parser,
								  std::forward<Handler>(handler));
		});
	}

	// Run handlers for at most `wait`
	void run_for(std::chrono::milliseconds wait) {
		if (ioc_.stopped()) ioc_.restart();
		ioc_.run_for(wait);
	}

	void close() {
		if (closed_) return;
		closed_ = true;
		beast::error_code ec;
		lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
		lowest().close();
		// Let aborted handlers complete while their owners are still alive
		run();
	}

   private:
	template <class F>
	void with_stream(F &&f) {
		if (tls_) {
			f(*tls_);
		} else {
			f(*plain_);
		}
	}

	beast::tcp_stream &lowest() {
		return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
	}

	void run() {
		ioc_.restart();
		ioc_.run();
	}

	Target target_;
	asio::io_context ioc_;
	std::unique_ptr<beast::tcp_stream> plain_;
	std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
	beast::flat_buffer buffer_;
	bool closed_ = false;
};

using BodyParser = http::response_parser<http::buffer_body>;

// A response whose header has been read
struct Exchange {
	std::unique_ptr<Connection> conn;
	std::unique_ptr<BodyParser> parser;
	std::string final_url;
	int status = 0;
};

}  // namespace

// =============================================================================
// Resolver implementation
// =============================================================================

struct HttpResolver::Impl {
	HttpResolverOptions options;
	ssl::context ssl_ctx;

	explicit Impl(HttpResolverOptions o)
		: options(std::move(o)), ssl_ctx(ssl::context::tlsv12_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	/// Send `verb` to `url`, following redirects, and read the final
	/// response header. `offset` > 0 asks for a byte range.
	Result<Exchange> exchange(const std::string &url, http::verb verb,
							  long long offset, const Credentials &creds) {
		std::string current = url;
		for (int hop = 0; hop <= options.max_redirects; ++hop) {
			BOOST_OUTCOME_TRY(target, parse_target(current));

			auto conn = std::make_unique<Connection>(ssl_ctx, target);
			BOOST_OUTCOME_TRYV(conn->connect(options.connect_timeout));

			http::request<http::empty_body> req{verb, target.target, 11};
			req.set(http::field::host, target.host);
			req.set(http::field::user_agent, options.user_agent);
			req.set(http::field::accept, "*/*");
			// Bytes must arrive exactly as stored
			req.set(http::field::accept_encoding, "identity");
			if (offset > 0) {
				req.set(http::field::range, fmt::format("bytes={}-", offset));
			}
			if (creds.cookies_file) {
				auto cookie = cookie_header_for(*creds.cookies_file,
												target.host, target.path,
												target.tls);
				if (!cookie.empty()) req.set(http::field::cookie, cookie);
			}

			auto parser = std::make_unique<BodyParser>();
			parser->body_limit((std::numeric_limits<std::uint64_t>::max)());
			if (verb == http::verb::head) parser->skip(true);

			spdlog::debug("{} {}{}", std::string(http::to_string(verb)),
						  current,
						  offset > 0 ? fmt::format(" (from {})", offset) : "");
			auto ec = conn->exchange_header(req, *parser,
											options.connect_timeout);
			if (ec) {
				return fail(errc::network_unavailable,
							fmt::format("{}: {}", current, ec.message()));
			}

			int status = static_cast<int>(parser->get().result_int());
			if (is_redirect(status)) {
				auto location =
					header_value(parser->get().base(), http::field::location);
				if (location.empty()) {
					return fail(errc::network_unavailable,
								fmt::format("HTTP {} without Location from {}",
											status, current));
				}
				if (location.front() == '/') {
					location = target.origin + location;
				}
				spdlog::debug("Redirected to {}", location);
				current = std::move(location);
				continue;
			}

			Exchange ex;
			ex.conn = std::move(conn);
			ex.parser = std::move(parser);
			ex.final_url = std::move(current);
			ex.status = status;
			return ex;
		}
		return fail(errc::network_unavailable,
					fmt::format("too many redirects for {}", url));
	}
};

namespace {

std::optional<long long> content_length(const BodyParser &parser) {
	auto value = header_value(parser.get().base(), http::field::content_length);
	if (value.empty()) return std::nullopt;
	return utils::to_long(value);
}

// "bytes 100-199/1000" -> 1000
std::optional<long long> content_range_total(const BodyParser &parser) {
	auto value = header_value(parser.get().base(), http::field::content_range);
	auto slash = value.find('/');
	if (slash == std::string::npos) return std::nullopt;
	return utils::to_long(std::string_view(value).substr(slash + 1));
}

class HttpByteStream : public ByteStream {
   public:
	HttpByteStream(std::shared_ptr<HttpResolver::Impl> owner, std::string url,
				   Credentials creds, Exchange ex)
		: owner_(std::move(owner)),
		  url_(std::move(url)),
		  creds_(std::move(creds)),
		  buf_(owner_->options.read_buffer) {
		adopt(std::move(ex), 0);
	}

	~HttpByteStream() override { close(); }

	[[nodiscard]] std::optional<long long> total_bytes() const override {
		return total_;
	}

	Result<std::size_t> read_some(std::span<char> out,
								  std::chrono::milliseconds wait) override {
		if (staged_ < staged_end_) return take(out);
		if (eof_ || !ex_.conn) return std::size_t{0};

		if (!in_flight_) start_read();
		ex_.conn->run_for(wait);
		if (!read_done_) return std::size_t{0};

		in_flight_ = false;
		read_done_ = false;
		if (read_ec_ == http::error::need_buffer) read_ec_ = {};
		if (read_ec_) {
			return fail(errc::stream_error,
						fmt::format("{}: {}", url_, read_ec_.message()));
		}

		staged_ = 0;
		staged_end_ = buf_.size() - ex_.parser->get().body().size;
		if (ex_.parser->is_done()) eof_ = true;
		return take(out);
	}

	[[nodiscard]] bool eof() const override {
		return eof_ && staged_ >= staged_end_;
	}

	bool resume_from(long long offset) override {
		if (offset == position_) return true;
		if (offset < 0 || (total_ && offset > *total_)) return false;

		auto res = owner_->exchange(url_, http::verb::get, offset, creds_);
		if (!res) {
			// Keep the current response; the caller restarts from it
			spdlog::warn("Cannot resume {} at {}: {}", url_, offset,
						 res.error().message());
			return false;
		}
		auto ex = std::move(res).value();
		if (ex.status == 206) {
			adopt(std::move(ex), offset);
			spdlog::debug("Resumed {} at {}", url_, offset);
			return true;
		}
		if (!check_status(ex.status, url_)) return false;
		// Range ignored, the new response starts over
		adopt(std::move(ex), 0);
		return false;
	}

	void close() override {
		if (ex_.conn) ex_.conn->close();
	}

   private:
	void adopt(Exchange ex, long long position) {
		if (ex_.conn) ex_.conn->close();
		ex_ = std::move(ex);
		position_ = position;
		in_flight_ = false;
		read_done_ = false;
		eof_ = ex_.parser->is_done();
		staged_ = staged_end_ = 0;

		if (ex_.status == 206) {
			if (auto t = content_range_total(*ex_.parser)) total_ = t;
		} else if (auto len = content_length(*ex_.parser)) {
			total_ = len;
		}
	}

	void start_read() {
		auto &body = ex_.parser->get().body();
		body.data = buf_.data();
		body.size = buf_.size();
		in_flight_ = true;
		ex_.conn->async_read_some(
			*ex_.parser, [this](beast::error_code ec, std::size_t) {
				read_ec_ = ec;
				read_done_ = true;
			});
	}

	std::size_t take(std::span<char> out) {
		std::size_t n = std::min(out.size(), staged_end_ - staged_);
		std::memcpy(out.data(), buf_.data() + staged_, n);
		staged_ += n;
		position_ += static_cast<long long>(n);
		return n;
	}

	std::shared_ptr<HttpResolver::Impl> owner_;
	std::string url_;
	Credentials creds_;
	Exchange ex_;

	std::vector<char> buf_;
	std::size_t staged_ = 0;
	std::size_t staged_end_ = 0;

	std::optional<long long> total_;
	long long position_ = 0;
	bool in_flight_ = false;
	bool read_done_ = false;
	beast::error_code read_ec_;
	bool eof_ = false;
};

std::string container_from_path(const std::string &path) {
	std::string ext = fs::path(path).extension().string();
	if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
	if (ext.empty() || ext.size() > 5) return {};
	return to_lower(ext);
}

}  // namespace

HttpResolver::HttpResolver(HttpResolverOptions options)
	: m_impl(std::make_shared<Impl>(std::move(options))) {}

HttpResolver::~HttpResolver() = default;

Result<MediaInfo> HttpResolver::resolve(const std::string &url,
										const Credentials &credentials) {
	auto res = m_impl->exchange(url, http::verb::head, 0, credentials);
	if (res && (res.value().status == 405 || res.value().status == 501)) {
		// No HEAD support; the GET header carries the same information
		res = m_impl->exchange(url, http::verb::get, 0, credentials);
	}
	if (!res) {
		spdlog::warn("Resolving {} failed: {}", url, res.error().message());
		return outcome::failure(res.error());
	}
	auto ex = std::move(res).value();
	BOOST_OUTCOME_TRYV(check_status(ex.status, url));

	BOOST_OUTCOME_TRY(target, parse_target(ex.final_url));
	const auto &header = ex.parser->get().base();
	std::string content_type = to_lower(header_value(header, http::field::content_type));
	if (auto semi = content_type.find(';'); semi != std::string::npos) {
		content_type.resize(semi);
	}

	VariantDescriptor variant;
	variant.id = "direct";
	variant.container = container_from_path(target.path);
	if (variant.container.empty()) {
		variant.container = container_for_content_type(content_type);
	}
	if (variant.container.empty()) variant.container = "bin";
	if (content_type.rfind("audio/", 0) == 0) variant.vcodec = "none";
	variant.approx_size = content_length(*ex.parser);
	variant.note = content_type.empty() ? "direct link" : content_type;

	std::string title = fs::path(target.path).stem().string();
	if (title.empty()) title = target.host;

	spdlog::debug("Resolved {} -> {} ({}, {} bytes)", url, title,
				  variant.container, variant.approx_size.value_or(-1));
	ex.conn->close();
	return MediaInfo{std::move(title), {std::move(variant)}};
}

Result<std::unique_ptr<ByteStream>> HttpResolver::open(
	const std::string &url, const VariantDescriptor &variant,
	const Credentials &credentials) {
	if (variant.id != "direct") {
		return fail(errc::no_variants_found, variant.id);
	}
	BOOST_OUTCOME_TRY(ex, m_impl->exchange(url, http::verb::get, 0, credentials));
	BOOST_OUTCOME_TRYV(check_status(ex.status, url));
	return std::unique_ptr<ByteStream>(std::make_unique<HttpByteStream>(
		m_impl, url, credentials, std::move(ex)));
}

// =============================================================================
// Helpers
// =============================================================================

std::string container_for_content_type(std::string_view type) {
	static constexpr std::pair<std::string_view, std::string_view> kTypes[] = {
		{"video/mp4", "mp4"},		   {"video/webm", "webm"},
		{"video/x-matroska", "mkv"},   {"video/quicktime", "mov"},
		{"video/x-flv", "flv"},		   {"video/mp2t", "ts"},
		{"audio/mp4", "m4a"},		   {"audio/mpeg", "mp3"},
		{"audio/webm", "weba"},		   {"audio/ogg", "ogg"},
		{"audio/opus", "opus"},		   {"audio/flac", "flac"},
		{"audio/wav", "wav"},		   {"audio/x-wav", "wav"},
	};
	for (const auto &[mime, ext] : kTypes) {
		if (type == mime) return std::string(ext);
	}
	return {};
}

std::string cookie_header_for(const fs::path &cookie_file,
							  const std::string &host, const std::string &path,
							  bool secure) {
	std::ifstream in(cookie_file);
	if (!in) {
		spdlog::warn("Cannot read cookie file {}", cookie_file.string());
		return {};
	}

	const std::string lhost = to_lower(host);
	const auto now = static_cast<long long>(std::time(nullptr));
	std::string header;
	std::string line;
	while (std::getline(in, line)) {
		if (!line.empty() && line.back() == '\r') line.pop_back();
		constexpr std::string_view kHttpOnly = "#HttpOnly_";
		if (line.rfind(kHttpOnly, 0) == 0) {
			line.erase(0, kHttpOnly.size());
		} else if (line.empty() || line.front() == '#') {
			continue;
		}

		std::vector<std::string> fields;
		std::istringstream ss(line);
		std::string field;
		while (std::getline(ss, field, '\t')) fields.push_back(field);
		if (fields.size() < 7) continue;

		std::string domain = to_lower(fields[0]);
		bool subdomains = fields[1] == "TRUE";
		if (!domain.empty() && domain.front() == '.') {
			domain.erase(0, 1);
			subdomains = true;
		}

		bool host_match = lhost == domain;
		if (!host_match && subdomains && lhost.size() > domain.size()) {
			host_match =
				lhost.compare(lhost.size() - domain.size(), domain.size(),
							  domain) == 0 &&
				lhost[lhost.size() - domain.size() - 1] == '.';
		}
		if (!host_match) continue;
		if (path.rfind(fields[2], 0) != 0) continue;
		if (fields[3] == "TRUE" && !secure) continue;

		auto expiry = utils::to_long(fields[4]);
		if (expiry && *expiry != 0 && *expiry < now) continue;

		if (!header.empty()) header += "; ";
		header += fields[5];
		header += '=';
		header += fields[6];
	}
	return header;
}

}  // namespace mediaq
