#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <mediaq/http_resolver.hpp>
#include <mediaq/queue_manager.hpp>
#include <mediaq/resolver.hpp>
#include <mediaq/settings.hpp>

#include "utils.hpp"

namespace po = boost::program_options;
namespace asio = boost::asio;

namespace {

// =============================================================================
// Resolver routing: local files and direct HTTP(S) links
// =============================================================================

class RoutingResolver : public mediaq::Resolver {
   public:
	mediaq::Result<mediaq::MediaInfo> resolve(
		const std::string &url, const mediaq::Credentials &creds) override {
		return pick(url).resolve(url, creds);
	}

	mediaq::Result<std::unique_ptr<mediaq::ByteStream>> open(
		const std::string &url, const mediaq::VariantDescriptor &variant,
		const mediaq::Credentials &creds) override {
		return pick(url).open(url, variant, creds);
	}

   private:
	mediaq::Resolver &pick(const std::string &url) {
		if (mediaq::FileResolver::local_path(url)) return file_;
		return http_;
	}

	mediaq::FileResolver file_;
	mediaq::HttpResolver http_;
};

// =============================================================================
// Variant Table Printing
// =============================================================================

void print_variants_table(const std::string &title,
						  const std::vector<mediaq::VariantDescriptor> &variants) {
	fmt::print("[info] Available formats for {}:\n", title);
	fmt::print("{:<10} {:<5} {:<12} {:<4} {:>10} {:>7} {:<14} {:<10} {}\n",
			   "ID", "EXT", "RESOLUTION", "FPS", "FILESIZE", "TBR", "VCODEC",
			   "ACODEC", "INFO");

	constexpr double MIB = 1024.0 * 1024.0;
	for (const auto &v : variants) {
		std::string res = v.vcodec == "none"	   ? "audio only"
						  : !v.resolution.empty() ? v.resolution
												  : "unknown";
		std::string fps = v.fps > 0 ? std::to_string(v.fps) : "";
		std::string size =
			v.approx_size
				? fmt::format("{:.2f}MiB", static_cast<double>(*v.approx_size) / MIB)
				: "~";
		std::string tbr = v.tbr > 0 ? fmt::format("{:.0f}k", v.tbr) : "";
		std::string vcodec = v.vcodec.empty()	   ? ""
							 : v.vcodec == "none" ? "audio only"
												  : v.vcodec.substr(0, 14);
		std::string acodec = v.acodec.empty()	   ? ""
							 : v.acodec == "none" ? "video only"
												  : v.acodec.substr(0, 10);

		auto line = fmt::format(
			"{:<10} {:<5} {:<12} {:<4} {:>10} {:>7} {:<14} {:<10} {}", v.id,
			v.container, res, fps, size, tbr, vcodec, acodec, v.note);
		if (v.vcodec == "none" || v.acodec == "none") {
			fmt::print(fg(fmt::color::dim_gray), "{}\n", line);
		} else {
			fmt::print("{}\n", line);
		}
	}
}

struct CliOptions {
	std::vector<std::string> urls;
	std::string format = "best";
	bool list_formats = false;
	bool quiet = false;
};

// =============================================================================
// Event loop: drives every job to a terminal state
// =============================================================================

class App {
   public:
	App(asio::io_context &ioc, mediaq::QueueManager &queue, CliOptions opts)
		: queue_(queue),
		  opts_(std::move(opts)),
		  timer_(ioc),
		  signals_(ioc, SIGINT, SIGTERM) {}

	void start() {
		sub_ = queue_.subscribe(1024);
		for (const auto &url : opts_.urls) {
			auto id = queue_.submit(url);
			open_.insert(id);
			fmt::print(stderr, "[queue] {}: {}\n", id, url);
		}

		signals_.async_wait([this](const boost::system::error_code &ec, int sig) {
			if (ec) return;
			fmt::print(stderr, "\nReceived signal {}, canceling downloads.\n",
					   sig);
			interrupted_ = true;
			for (auto id : open_) {
				if (auto res = queue_.cancel(id); !res) {
					spdlog::debug("cancel {}: {}", id, res.error().message());
				}
			}
		});
		poll();
	}

	[[nodiscard]] int exit_code() const {
		return (failures_ == 0 && !interrupted_) ? 0 : 1;
	}

   private:
	void poll() {
		for (const auto &event : sub_->drain()) handle(event);
		if (open_.empty()) {
			signals_.cancel();
			return;
		}
		timer_.expires_after(std::chrono::milliseconds(100));
		timer_.async_wait([this](const boost::system::error_code &ec) {
			if (!ec) poll();
		});
	}

	void handle(const mediaq::Event &event) {
		using mediaq::JobState;
		switch (event.kind) {
			case mediaq::EventKind::dropped:
				spdlog::debug("{} progress updates skipped", event.dropped_count);
				return;
			case mediaq::EventKind::progress:
				print_progress(event);
				return;
			case mediaq::EventKind::state_changed: break;
		}

		const auto id = event.job_id;
		switch (event.state) {
			case JobState::awaiting_selection: on_variants(id); break;
			case JobState::queued:
				if (event.error) {
					end_progress_line();
					fmt::print(stderr, "[download] {}: retrying after: {}\n", id,
							   event.error->message());
				}
				break;
			case JobState::succeeded: {
				end_progress_line();
				auto snap = queue_.job(id);
				if (!opts_.quiet && snap && snap.value().output_path) {
					fmt::print("[download] {}: saved {}\n", id,
							   snap.value().output_path->string());
				}
				open_.erase(id);
				break;
			}
			case JobState::failed:
				end_progress_line();
				fmt::print(stderr, "ERROR: job {}: {}\n", id,
						   event.error ? event.error->message() : "failed");
				++failures_;
				open_.erase(id);
				break;
			case JobState::canceled:
				end_progress_line();
				// Listing formats cancels on purpose
				if (!opts_.list_formats) {
					fmt::print(stderr, "[download] {}: canceled\n", id);
					++failures_;
				}
				open_.erase(id);
				break;
			default: break;
		}
	}

	void on_variants(mediaq::JobId id) {
		auto variants = queue_.list_variants(id);
		if (!variants) {
			spdlog::error("job {}: {}", id, variants.error().message());
			return;
		}

		if (opts_.list_formats) {
			auto snap = queue_.job(id);
			print_variants_table(snap ? snap.value().title : std::to_string(id),
								 variants.value());
			if (auto res = queue_.cancel(id); !res) {
				spdlog::warn("job {}: {}", id, res.error().message());
			}
			return;
		}

		std::string chosen = opts_.format;
		if (chosen == "best") chosen = variants.value().front().id;

		if (auto res = queue_.select_variant(id, chosen); !res) {
			// Counted as a failure once the Canceled event arrives
			fmt::print(stderr, "ERROR: job {}: {}\n", id, res.error().message());
			if (auto c = queue_.cancel(id); !c) {
				spdlog::warn("job {}: {}", id, c.error().message());
			}
			return;
		}
		if (!opts_.quiet) {
			fmt::print(stderr, "[info] {}: downloading format {}\n", id, chosen);
		}
	}

	void print_progress(const mediaq::Event &event) {
		if (opts_.quiet) return;
		const auto &p = event.progress;
		auto pct = p.percentage();
		auto total = p.total_bytes
						 ? mediaq::utils::human_readable_bytes(
							   static_cast<double>(*p.total_bytes))
						 : std::string("~");
		auto speed = mediaq::utils::human_readable_bytes(p.speed_bytes_per_sec);
		auto eta = mediaq::utils::human_readable_eta(p.eta_seconds);

		fmt::print(stderr, "\r[download] {}: {:>5} of {} at {}/s ETA {}   ",
				   event.job_id, pct ? fmt::format("{:.1f}%", *pct) : "?",
				   total, speed.empty() ? "0 B" : speed,
				   eta.empty() ? "--" : eta);
		line_open_ = true;
	}

	void end_progress_line() {
		if (line_open_) fmt::print(stderr, "\n");
		line_open_ = false;
	}

	mediaq::QueueManager &queue_;
	CliOptions opts_;
	asio::steady_timer timer_;
	asio::signal_set signals_;
	std::shared_ptr<mediaq::Subscription> sub_;
	std::set<mediaq::JobId> open_;
	int failures_ = 0;
	bool interrupted_ = false;
	bool line_open_ = false;
};

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[%l] %v");

		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			("url", po::value<std::vector<std::string>>(), "URLs to download")
			("format,f", po::value<std::string>()->default_value("best"),
			 "Variant to download (best or a variant id)")
			("list-formats,F", "List available variants and exit")
			("config,c", po::value<std::string>(), "JSON settings file")
			("output,o", po::value<std::string>(),
			 "Output filename template (e.g., %(title)s.%(ext)s)")
			("paths,P", po::value<std::string>(), "Destination directory")
			("concurrent,N", po::value<int>(), "Maximum parallel downloads")
			("retries,R", po::value<int>(), "Automatic retries per download")
			("cookies", po::value<std::string>(),
			 "Netscape format cookie file")
			("quiet,q", "Only print warnings and errors")
			("verbose,v", "Enable verbose logging");
		// clang-format on

		po::positional_options_description p;
		p.add("url", -1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(desc)
					  .positional(p)
					  .run(),
				  vm);
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << "Usage: mediaq-cli [options] URL...\n" << desc << "\n";
			return 0;
		}

		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else if (vm.count("quiet")) {
			spdlog::set_level(spdlog::level::warn);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		if (!vm.count("url")) {
			std::cout << "Usage: mediaq-cli [options] URL...\n" << desc << "\n";
			return 1;
		}

		// Settings: defaults, then the file, then the command line
		mediaq::Settings settings;
		if (vm.count("config")) {
			auto loaded = mediaq::load_settings(vm["config"].as<std::string>());
			if (!loaded) {
				fmt::print(stderr, "ERROR: {}\n", loaded.error().message());
				return 1;
			}
			settings = std::move(loaded).value();
		}
		if (vm.count("output")) {
			settings.output_template = vm["output"].as<std::string>();
		}
		if (vm.count("paths")) {
			settings.destination_root = vm["paths"].as<std::string>();
		}
		if (vm.count("concurrent")) {
			settings.max_concurrent = vm["concurrent"].as<int>();
		}
		if (vm.count("retries")) {
			settings.max_retries = vm["retries"].as<int>();
		}
		if (vm.count("cookies")) {
			settings.cookies_file = vm["cookies"].as<std::string>();
		}
		if (auto valid = mediaq::validate(settings); !valid) {
			fmt::print(stderr, "ERROR: {}\n", valid.error().message());
			return 1;
		}

		CliOptions opts;
		opts.urls = vm["url"].as<std::vector<std::string>>();
		opts.format = vm["format"].as<std::string>();
		opts.list_formats = vm.count("list-formats") > 0;
		opts.quiet = vm.count("quiet") > 0;

		asio::io_context ioc;
		mediaq::QueueManager queue(std::make_shared<RoutingResolver>(),
								   settings);

		App app(ioc, queue, std::move(opts));
		app.start();
		ioc.run();
		return app.exit_code();

	} catch (const std::exception &e) {
		fmt::print(stderr, "ERROR: {}\n", e.what());
		return 1;
	}
}
