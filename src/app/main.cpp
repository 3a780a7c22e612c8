/**
 * @file main.cpp
 * @brief jobtier daemon entry point.
 *
 * Wires all modules into a running job runtime:
 *   Config → Logger → Runtime (Analyzer, Strategies, Governor) → Worker
 *
 * The same binary is the isolated host: started with `--run-job-bundle`, it
 * rebuilds one job from its bundle, runs it and exits.
 */

#include "app/example_jobs.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "job/isolated_host.hpp"
#include "job/job_registry.hpp"
#include "resource_monitor/monitor.hpp"
#include "runtime/job_source.hpp"
#include "runtime/runtime.hpp"
#include "runtime/worker.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

using namespace jobtier;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║              jobtier v1.0.0               ║
  ║   Tiered Job Execution Runtime            ║
  ║   inline · pooled · isolated              ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: jobtier [OPTIONS]\n"
                      << "  --config <path>          Configuration file (default: config/default.toml)\n"
                      << "  --log-dir <path>         Log output directory\n"
                      << "  --demo                   Run a small batch of example jobs, then exit\n"
                      << "  --run-job-bundle <path>  Run one bundled job (isolated host mode)\n"
                      << "  --help, -h               Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

Config load_or_default(const std::filesystem::path& path) {
    auto loaded = load_config(path);
    if (!loaded) {
        std::cerr << "Failed to load config: " << loaded.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
        return default_config();
    }
    if (auto valid = validate_config(*loaded); !valid) {
        std::cerr << "Invalid config: " << valid.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
        return default_config();
    }
    return *loaded;
}

/**
 * @brief Queue one job of each bundled type (a few emails, a report, a
 *        transcode) and return how many were queued.
 */
size_t queue_demo_batch(const JobRegistry& registry, QueueJobSource& source, Logger& logger) {
    const auto scratch = std::filesystem::temp_directory_path();

    struct DemoJob {
        std::string type;
        JobOptions options;
        nlohmann::json fields;
    };
    std::vector<DemoJob> batch;
    for (int i = 0; i < 3; ++i) {
        batch.push_back({"SendEmailJob", JobOptions{.timeout_s = 5, .priority = 10},
                         {{"recipient", "user" + std::to_string(i) + "@example.com"},
                          {"subject", "Welcome"},
                          {"body", "Thanks for signing up."}}});
    }
    batch.push_back({"GenerateReportJob", JobOptions{.timeout_s = 60, .max_memory_mb = 128},
                     {{"rows", 5000},
                      {"output_path", (scratch / "jobtier_demo_report.csv").string()}}});
    batch.push_back({"ProcessVideoExport", JobOptions{.timeout_s = 30, .max_memory_mb = 256},
                     {{"input", (scratch / "jobtier_demo_input.mp4").string()},
                      {"output", (scratch / "jobtier_demo_output.mp4").string()}}});

    size_t queued = 0;
    for (auto& entry : batch) {
        auto job = registry.create(entry.type, entry.options);
        if (!job) {
            logger.error("Cannot create demo job: " + job.error().message);
            continue;
        }
        if (auto loaded = (*job)->load_fields(entry.fields); !loaded) {
            logger.error("Cannot configure demo job: " + loaded.error().message);
            continue;
        }
        source.push(std::move(job).value());
        ++queued;
    }
    return queued;
}

}  // namespace

int main(int argc, char* argv[]) {
    JobRegistry registry;
    if (auto registered = register_example_jobs(registry); !registered) {
        std::cerr << "Failed to register job types: " << registered.error().message << std::endl;
        return EXIT_FAILURE;
    }

    // ── Isolated host mode ───────────────────
    if (auto bundle = find_bundle_argument(argc, argv)) {
        return run_isolated_host(registry, *bundle);
    }

    print_banner();
    auto args = parse_args(argc, argv);

    auto config = load_or_default(args.config_path);
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logging ───────────────────
    Runtime<LinuxMonitor>::Options opts;
    if (!config.telemetry.log_dir.empty()) {
        opts.log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "jobtier",
                                                       config.telemetry.max_file_size_mb,
                                                       config.telemetry.rotate_count);
        opts.event_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                         "jobtier_events",
                                                         config.telemetry.max_file_size_mb,
                                                         config.telemetry.rotate_count);
    } else {
        opts.log_sink = std::make_unique<StdoutSink>();
    }
    opts.log_level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    opts.config = config;

    Runtime<LinuxMonitor> runtime(std::move(opts));
    Logger& logger = runtime.logger();
    logger.info("jobtier starting...");
    logger.info("Job types: " + std::to_string(registry.size()));
    logger.info("Limits: timeout " + std::to_string(config.limits.max_timeout_s) + "s, memory "
                + std::to_string(config.limits.max_memory_mb) + " MB, "
                + std::to_string(config.limits.max_jobs_per_minute) + " jobs/min");

    // Signals only set a flag; the loop turns it into a stop request
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source stop_source;
    runtime.loop().add_periodic_timer(std::chrono::milliseconds{100}, [&stop_source, &logger] {
        if (g_shutdown_requested && !stop_source.stop_requested()) {
            logger.info("Shutdown requested by signal");
            stop_source.request_stop();
        }
    });

    // ── Job source and worker ────────────────
    QueueJobSource source;
    WorkerConfig worker_config = config.worker;
    if (args.demo_mode) {
        logger.info("=== Demo Mode ===");
        worker_config.max_jobs = static_cast<uint32_t>(queue_demo_batch(registry, source, logger));
    }

    Worker<Runtime<LinuxMonitor>> worker(runtime, source, worker_config, logger);
    worker.start();

    if (!args.demo_mode) {
        logger.info("Entering main loop. Press Ctrl+C to shutdown.");
    }
    runtime.run(stop_source.get_token());

    auto stats = runtime.stats();
    logger.info("jobtier stopped: " + std::to_string(stats.processed) + " succeeded, "
                + std::to_string(stats.failed) + " failed, "
                + std::to_string(stats.timed_out) + " timed out, "
                + std::to_string(worker.dropped()) + " dropped");
    return 0;
}
