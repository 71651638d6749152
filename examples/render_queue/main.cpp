/**
 * @file main.cpp
 * @brief Render Queue - durable job queue demonstration
 *
 * Queues a batch of simulated render jobs at mixed priorities, lets the
 * scheduler run them one at a time and prints the final queue listing.
 * Jobs still queued when the program exits are picked up on the next run
 * when a database path is given.
 *
 * Usage:
 *   jobq_render_queue [options]
 *
 * Example:
 *   jobq_render_queue --db render.db --jobs 8 --cooldown 500
 *   jobq_render_queue --db render.db --list
 */

#include <jobq/di/ilogger.hpp>
#include <jobq/integration/logger_adapter.hpp>
#include <jobq/queue/event_emitter.hpp>
#include <jobq/queue/queue_manager.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

/**
 * @brief Command line options
 */
struct options {
    std::optional<std::filesystem::path> db_path;
    int job_count{6};
    std::chrono::milliseconds cooldown{0};
    std::size_t max_consecutive{0};
    std::chrono::hours prune_age{0};
    bool list_only{false};
    bool verbose{false};
};

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << R"(
Render Queue - Durable Job Queue Demonstration

Usage: )" << program_name
              << R"( [options]

Options:
  -h, --help              Show this help message
  -d, --db <path>         SQLite database (in-memory when omitted)
  -n, --jobs <count>      Number of render jobs to queue (default: 6)
  --cooldown <ms>         Pause between consecutive jobs
  --max-consecutive <n>   Force a pause after n back-to-back jobs
  --prune <hours>         Delete finished jobs older than the given age
  -l, --list              Only list the stored jobs
  -v, --verbose           Debug logging, including progress events

Exit Codes:
  0  All queued jobs finished
  1  Invalid arguments
  2  Queue error
)";
}

/**
 * @brief Parse command line arguments
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " requires a value\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--db" || arg == "-d") {
            auto value = next_value("--db");
            if (!value) return false;
            opts.db_path = value;
        } else if (arg == "--jobs" || arg == "-n") {
            auto value = next_value("--jobs");
            if (!value) return false;
            opts.job_count = std::atoi(value);
        } else if (arg == "--cooldown") {
            auto value = next_value("--cooldown");
            if (!value) return false;
            opts.cooldown = std::chrono::milliseconds{std::atoi(value)};
        } else if (arg == "--max-consecutive") {
            auto value = next_value("--max-consecutive");
            if (!value) return false;
            opts.max_consecutive = static_cast<std::size_t>(std::atoi(value));
        } else if (arg == "--prune") {
            auto value = next_value("--prune");
            if (!value) return false;
            opts.prune_age = std::chrono::hours{std::atoi(value)};
        } else if (arg == "--list" || arg == "-l") {
            opts.list_only = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        }
    }

    if (opts.job_count < 0 || opts.cooldown.count() < 0) {
        std::cerr << "Error: Counts and durations must not be negative\n";
        return false;
    }
    return true;
}

/**
 * @brief Simulated frame renderer
 *
 * The payload is the frame count. A payload of "0" fails, so the listing
 * shows every terminal status.
 */
jobq::queue::job_outcome render_frames(const jobq::queue::job_payload& payload,
                                       jobq::queue::job_context& ctx) {
    auto frames = static_cast<std::uint64_t>(std::strtoull(payload.data.c_str(), nullptr, 10));
    if (frames == 0) {
        return jobq::queue::job_outcome::failure("scene has no frames");
    }

    for (std::uint64_t frame = 1; frame <= frames; ++frame) {
        if (ctx.is_cancelled()) {
            return jobq::queue::job_outcome::cancelled();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        ctx.report_progress(frame, frames);
    }
    return jobq::queue::job_outcome::success(std::to_string(frames) + " frames rendered");
}

void print_listing(const std::vector<jobq::queue::job_record>& records) {
    std::cout << std::left << std::setw(38) << "JOB ID" << std::setw(11) << "STATUS"
              << std::setw(8) << "PRIO" << std::setw(9) << "ATTEMPT" << "DETAIL\n";
    for (const auto& record : records) {
        std::string detail;
        if (record.result) {
            detail = record.result->output ? *record.result->output
                                           : record.result->error_message;
        } else if (record.progress.total_steps > 0) {
            detail = std::to_string(record.progress.current_step) + "/" +
                     std::to_string(record.progress.total_steps);
        }
        std::cout << std::setw(38) << record.job_id
                  << std::setw(11) << jobq::queue::to_string(record.status)
                  << std::setw(8) << jobq::queue::to_string(record.priority)
                  << std::setw(9) << record.attempt_count << detail << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace jobq::queue;

    options opts;
    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    jobq::integration::logger_config log_config;
    log_config.enable_file = false;
    log_config.min_level = opts.verbose ? jobq::integration::log_level::debug
                                        : jobq::integration::log_level::info;
    jobq::integration::logger_adapter::initialize(log_config);
    jobq::integration::logger_adapter::info(
        "Render queue starting (log level {})",
        jobq::integration::logger_adapter::log_level_to_string(
            jobq::integration::logger_adapter::get_config().min_level));

    auto logger = std::make_shared<jobq::di::LoggerService>();
    auto registry = std::make_shared<handler_registry>();
    if (auto registered = registry->register_handler("render", render_frames);
        registered.is_err()) {
        std::cerr << "Error: " << registered.error().message << "\n";
        return 2;
    }

    queue_config config;
    config.db_path = opts.db_path;
    config.cooldown = opts.cooldown;
    config.max_consecutive = opts.max_consecutive;
    config.poll_interval = std::chrono::milliseconds{500};
    config.auto_start = !opts.list_only;

    auto created = queue_manager::create(config, registry,
                                         std::make_shared<logging_event_emitter>(logger),
                                         logger);
    if (created.is_err()) {
        std::cerr << "Error: " << created.error().message << "\n";
        jobq::integration::logger_adapter::shutdown();
        return 2;
    }
    auto& manager = *created.value();

    if (opts.prune_age.count() > 0) {
        auto pruned = manager.prune(opts.prune_age);
        if (pruned.is_err()) {
            std::cerr << "Error: " << pruned.error().message << "\n";
        } else {
            std::cout << "Pruned " << pruned.value() << " finished jobs\n";
        }
    }

    int exit_code = 0;
    if (!opts.list_only) {
        std::vector<std::string> ids;
        for (int i = 0; i < opts.job_count; ++i) {
            auto priority = job_priority_from_int(i % 3);
            auto frames = std::to_string(i % 4 == 3 ? 0 : 5 + i);
            auto id = manager.enqueue({"render", frames}, priority);
            if (id.is_err()) {
                std::cerr << "Error: " << id.error().message << "\n";
                exit_code = 2;
                break;
            }
            ids.push_back(id.value());
        }

        // The last queued job is withdrawn to demonstrate cancellation
        if (ids.size() > 1) {
            if (auto cancelled = manager.cancel(ids.back()); cancelled.is_err()) {
                std::cerr << "Error: " << cancelled.error().message << "\n";
            }
        }

        for (const auto& id : ids) {
            auto waiting = manager.wait_for_completion(id);
            if (waiting.is_ok()) {
                waiting.value().wait();
            }
        }
        manager.stop();
    }

    auto records = manager.list();
    if (records.is_err()) {
        std::cerr << "Error: " << records.error().message << "\n";
        exit_code = 2;
    } else {
        print_listing(records.value());
    }

    created.value().reset();
    jobq::integration::logger_adapter::shutdown();
    return exit_code;
}
