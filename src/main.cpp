//
// Created by Sanger Steel on 6/6/25.
//

#include <atomic>
#include <csignal>
#include <execinfo.h>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include "autotune/autotuner.hpp"
#include "config.hpp"
#include "drivers/request_driver.hpp"
#include "errors.hpp"
#include "load_executor.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include "run_recorder.hpp"
#include "telemetry.hpp"

// Results go to stdout, so logs go to stderr
const std::string filename = "stderr";

#ifdef NDEBUG
LoggingContext Logger(filename, INFO);
#else
LoggingContext Logger(filename, DEBUG);
#endif


const std::string_view help_text = R"(
Usage: tokenbench <command> --config <path-to-yaml> [OPTIONS]

Commands:
  run                    Run one benchmark and record it
  autotune               Search concurrency, batching and token sizes for the best setting (Ctrl-C stops)
  history                List recorded runs, most recent first
  show <id>              Print one recorded run
  sample                 Print one hardware telemetry snapshot

Options:
  --config <path>        Path to a .yaml file with backends and defaults (required)
  --target <name>        Backend to benchmark, as named in the config
  --prompt <text>        Prompt sent with every request
  --requests <int>       Total requests in a run
  --concurrency <int>    Maximum requests in flight
  --max-tokens <int>     Maximum generated tokens per request
  --batch-size <int>     Pseudo-batch size for non-streaming runs
  --stream               Stream responses and measure time to first token
  --timeout <int>        Per-request timeout in seconds (default 120)
  --log-level <level>    error, warn, info or debug
  --autotune             With `history`: list auto-tune sessions instead of runs
  --help                 Show this help message
)";

namespace ExitCodes {
    static constexpr int Ok = 0;
    static constexpr int Failure = 1;
    static constexpr int Configuration = 2;
    static constexpr int Run = 3;
    static constexpr int Conflict = 4;
}

std::atomic<bool> interrupted = false;

struct CliOptions {
    std::string command;
    std::string config_path;
    std::optional<std::string> target = std::nullopt;
    std::optional<std::string> prompt = std::nullopt;
    std::optional<int> requests = std::nullopt;
    std::optional<int> concurrency = std::nullopt;
    std::optional<int> max_tokens = std::nullopt;
    std::optional<int> batch_size = std::nullopt;
    bool stream = false;
    std::optional<long> timeout = std::nullopt;
    std::optional<std::string> log_level = std::nullopt;
    bool autotune_history = false;
    std::optional<int> show_id = std::nullopt;
};

int parse_int(const std::string& value, const char* cli_arg) {
    size_t consumed = 0;
    int parsed;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError(std::format("{} expects an integer, got '{}'", cli_arg, value));
    }
    if (consumed != value.size()) {
        throw ConfigurationError(std::format("{} expects an integer, got '{}'", cli_arg, value));
    }
    return parsed;
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions options;
    options.command = argv[1];

    std::string arg;
    for (int i = 2; i < argc; ++i) {
        arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            options.target = argv[++i];
        } else if (arg == "--prompt" && i + 1 < argc) {
            options.prompt = argv[++i];
        } else if (arg == "--requests" && i + 1 < argc) {
            options.requests = parse_int(argv[++i], "--requests");
        } else if (arg == "--concurrency" && i + 1 < argc) {
            options.concurrency = parse_int(argv[++i], "--concurrency");
        } else if (arg == "--max-tokens" && i + 1 < argc) {
            options.max_tokens = parse_int(argv[++i], "--max-tokens");
        } else if (arg == "--batch-size" && i + 1 < argc) {
            options.batch_size = parse_int(argv[++i], "--batch-size");
        } else if (arg == "--timeout" && i + 1 < argc) {
            options.timeout = parse_int(argv[++i], "--timeout");
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.log_level = argv[++i];
        } else if (arg == "--stream") {
            options.stream = true;
        } else if (arg == "--autotune") {
            options.autotune_history = true;
        } else if (options.command == "show" && !options.show_id.has_value() && !arg.starts_with("--")) {
            options.show_id = parse_int(arg, "<id>");
        } else {
            throw ConfigurationError(std::format("Unrecognized or incomplete argument: {}", arg));
        }
    }
    if (options.config_path.empty()) {
        throw ConfigurationError("Required arg not set: --config");
    }
    return options;
}

BenchmarkConfig benchmark_from(const AppConfig& app, const CliOptions& options) {
    BenchmarkConfig config = app.benchmark;
    if (options.target.has_value()) config.target = options.target.value();
    if (options.prompt.has_value()) config.prompt = options.prompt.value();
    if (options.requests.has_value()) config.total_requests = options.requests.value();
    if (options.concurrency.has_value()) config.concurrency = options.concurrency.value();
    if (options.max_tokens.has_value()) config.max_tokens = options.max_tokens.value();
    if (options.batch_size.has_value()) config.batch_size = options.batch_size.value();
    if (options.stream) config.stream = true;
    if (config.name.empty()) {
        config.name = std::format("benchmark_{}", config.target);
    }
    return config;
}

struct Services {
    std::shared_ptr<StaticConnectionResolver> resolver;
    std::shared_ptr<TelemetrySampler> sampler;
    std::shared_ptr<LoadExecutor> executor;
    SharedProgress progress;
};

Services build_services(const AppConfig& app, const CliOptions& options) {
    Services services;
    services.resolver = std::make_shared<StaticConnectionResolver>(app.backends);
    services.sampler = std::make_shared<TelemetrySampler>(std::make_shared<SystemProbe>(), app.telemetry.history);
    services.progress = std::make_shared<LoggingProgress>();
    long timeout = options.timeout.value_or(app.request_timeout_s);
    if (timeout <= 0) {
        throw ConfigurationError(std::format("--timeout must be > 0, got {}", timeout));
    }
    services.executor = std::make_shared<LoadExecutor>(
        services.sampler,
        http_driver_factory(timeout),
        services.progress,
        ExecutorSettings{app.telemetry.interval}
    );
    return services;
}

int run_command(const AppConfig& app, const CliOptions& options) {
    auto config = benchmark_from(app, options);
    validate(config);

    auto services = build_services(app, options);
    auto connection = services.resolver->resolve(config.target);

    RunRecorder recorder(app.results_dir);
    auto result = services.executor->run(config, connection);
    auto record = recorder.record(config.name, result);

    Logger.info("\n{}", result.display());
    std::cout << record.to_json().dump(2) << std::endl;
    return ExitCodes::Ok;
}

int autotune_command(const AppConfig& app, const CliOptions& options) {
    auto config = benchmark_from(app, options);
    if (config.target.empty()) {
        throw ConfigurationError("target is required");
    }

    auto services = build_services(app, options);
    auto archive = std::make_shared<AutoTuneArchive>(app.autotune_dir);
    AutoTuner tuner(services.executor, services.resolver, archive, app.autotune, services.progress);
    Logger.debug("Auto-tune settings: {}", tuner.get_settings().to_json().dump());

    std::signal(SIGINT, [](int) {
        interrupted.store(true);
    });

    std::atomic<bool> finished = false;
    std::thread watcher([&] {
        while (!finished.load(std::memory_order_acquire)) {
            if (interrupted.exchange(false)) {
                Logger.info("Interrupt received, auto-benchmark will stop after the current test");
                tuner.stop();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    AutoTuneState session;
    try {
        session = tuner.search(config.target, config.prompt);
    } catch (...) {
        finished.store(true, std::memory_order_release);
        watcher.join();
        throw;
    }
    finished.store(true, std::memory_order_release);
    watcher.join();

    std::cout << session.to_json().dump(2) << std::endl;
    return session.status == TuneStatus::Error ? ExitCodes::Run : ExitCodes::Ok;
}

int history_command(const AppConfig& app, const CliOptions& options) {
    json listing = json::array();
    if (options.autotune_history) {
        AutoTuneArchive archive(app.autotune_dir);
        for (auto& session: archive.list()) {
            listing.emplace_back(std::move(session));
        }
    } else {
        RunRecorder recorder(app.results_dir);
        for (const auto& record: recorder.history()) {
            listing.emplace_back(record.to_json());
        }
    }
    std::cout << listing.dump(2) << std::endl;
    return ExitCodes::Ok;
}

int show_command(const AppConfig& app, const CliOptions& options) {
    if (!options.show_id.has_value()) {
        throw ConfigurationError("Required arg not set: <id>");
    }
    RunRecorder recorder(app.results_dir);
    auto record = recorder.get(options.show_id.value());
    if (!record.has_value()) {
        std::cerr << "No recorded run with id " << options.show_id.value() << std::endl;
        return ExitCodes::Failure;
    }
    std::cout << record->to_json().dump(2) << std::endl;
    return ExitCodes::Ok;
}

int sample_command(const AppConfig& app) {
    TelemetrySampler sampler(std::make_shared<SystemProbe>(), app.telemetry.history);
    std::cout << sampler.sample().to_json().dump(2) << std::endl;
    return ExitCodes::Ok;
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return ExitCodes::Configuration;
        case ErrorKind::Run: return ExitCodes::Run;
        case ErrorKind::Conflict: return ExitCodes::Conflict;
        default: return ExitCodes::Failure;
    }
}

int main(int argc, char* argv[]) {
    signal(SIGABRT, [](int) {
        void* trace[64];
        int n = backtrace(trace, 64);
        backtrace_symbols_fd(trace, n, STDERR_FILENO);
        _exit(1);
    });

    if (argc < 2 || std::string(argv[1]) == "--help") {
        std::cout << help_text << std::endl;
        return argc < 2 ? ExitCodes::Failure : ExitCodes::Ok;
    }

    try {
        auto options = parse_args(argc, argv);
        auto app = load_config(options.config_path);

        if (options.log_level.has_value()) {
            Logger.set_level(log_level_from_string(options.log_level.value()));
        } else if (app.log_level.has_value()) {
            Logger.set_level(app.log_level.value());
        }

        if (options.command == "run") {
            int rc = run_command(app, options);
            Logger.dump_debugging_state();
            return rc;
        } else if (options.command == "autotune") {
            int rc = autotune_command(app, options);
            Logger.dump_debugging_state();
            return rc;
        } else if (options.command == "history") {
            return history_command(app, options);
        } else if (options.command == "show") {
            return show_command(app, options);
        } else if (options.command == "sample") {
            return sample_command(app);
        }
        throw ConfigurationError(std::format("Unknown command: {}", options.command));
    } catch (const BenchmarkError& e) {
        Logger.error("{} error: {}", to_string(e.kind()), e.what());
        std::cerr << e.what() << std::endl;
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        Logger.error("Unexpected failure: {}", e.what());
        std::cerr << e.what() << std::endl;
        return ExitCodes::Failure;
    }
}
