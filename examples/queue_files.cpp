#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <mediaq/queue_manager.hpp>
#include <set>

using namespace mediaq;

// Copies local files through the queue: mediaq_queue_example <dest> <file>...
int main(int argc, char *argv[]) {
	if (argc < 3) {
		std::cerr << "Usage: " << argv[0] << " <destination> <file>...\n";
		return 1;
	}

	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("mediaq", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	Settings settings;
	settings.destination_root = argv[1];
	settings.max_concurrent = 2;

	QueueManager queue(std::make_shared<FileResolver>(), settings);
	auto events = queue.subscribe();

	std::set<JobId> open;
	for (int i = 2; i < argc; ++i) open.insert(queue.submit(argv[i]));

	int failed = 0;
	while (!open.empty()) {
		auto event = events->wait_next(std::chrono::seconds(1));
		if (!event || event->kind != EventKind::state_changed) continue;

		switch (event->state) {
			case JobState::awaiting_selection: {
				// Best variant first
				auto variants = queue.list_variants(event->job_id);
				Result<void> res = fail(errc::no_variants_found);
				if (variants) {
					std::cout << event->job_id << ": "
							  << display_text(variants.value().front()) << "\n";
					res = queue.select_variant(event->job_id,
											   variants.value().front().id);
				}
				if (!res) {
					spdlog::error("{}", res.error().message());
					if (auto c = queue.cancel(event->job_id); !c) {
						spdlog::error("{}", c.error().message());
					}
				}
				break;
			}
			case JobState::succeeded: {
				auto job = queue.job(event->job_id);
				if (job && job.value().output_path) {
					std::cout << "Copied to: " << *job.value().output_path
							  << "\n";
				}
				open.erase(event->job_id);
				break;
			}
			case JobState::failed:
			case JobState::canceled:
				std::cerr << event->job_id << " did not finish: "
						  << (event->error ? event->error->message() : "")
						  << "\n";
				++failed;
				open.erase(event->job_id);
				break;
			default: break;
		}
	}
	return failed == 0 ? 0 : 1;
}
