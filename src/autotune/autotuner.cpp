//
// Created by Sanger Steel on 7/6/25.
//

#include "autotune/autotuner.hpp"
#include <algorithm>
#include <format>
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace {

// Releases the single-flight flag, and clears any stop request, on every exit path of a search.
class RunningFlag {
public:
    RunningFlag(std::mutex& mu, std::atomic<bool>& running, std::atomic<bool>& stop_requested)
        : mu(mu), running(running), stop_requested(stop_requested) {}

    ~RunningFlag() {
        std::lock_guard<std::mutex> lock(mu);
        stop_requested.store(false, std::memory_order_release);
        running.store(false, std::memory_order_release);
    }

    RunningFlag(const RunningFlag&) = delete;
    RunningFlag& operator=(const RunningFlag&) = delete;

private:
    std::mutex& mu;
    std::atomic<bool>& running;
    std::atomic<bool>& stop_requested;
};

void require_positive(const std::vector<int>& values, const char* field) {
    if (values.empty()) {
        throw ConfigurationError(std::format("autotune.{} must not be empty", field));
    }
    for (auto value: values) {
        if (value <= 0) {
            throw ConfigurationError(std::format("autotune.{} must only hold positive values, got {}", field, value));
        }
    }
}

std::string test_name(const std::string& target, int concurrency, int batch_size, int token_size, bool streaming) {
    return std::format("auto_{}_c{}_b{}_t{}_{}", target, concurrency, batch_size, token_size,
                       streaming ? "stream" : "batch");
}

}

void TunerSettings::validate() const {
    if (min_acceptable_tps < 0) {
        throw ConfigurationError(std::format("autotune.min_acceptable_tps must be >= 0, got {}", min_acceptable_tps));
    }
    if (near_best_band < 0 || near_best_band >= 1) {
        throw ConfigurationError(std::format("autotune.near_best_band must be in [0, 1), got {}", near_best_band));
    }
    if (max_concurrency < 1 || max_concurrency > BenchmarkLimits::MaxConcurrency) {
        throw ConfigurationError(std::format("autotune.max_concurrency must be in [1, {}], got {}",
                                             BenchmarkLimits::MaxConcurrency, max_concurrency));
    }
    require_positive(concurrency_steps, "concurrency_steps");
    require_positive(batch_sizes, "batch_sizes");
    require_positive(token_sizes, "token_sizes");
    require_positive(probe_token_sizes, "probe_token_sizes");
    if (probe_requests <= 0) {
        throw ConfigurationError(std::format("autotune.probe_requests must be > 0, got {}", probe_requests));
    }
    if (requests_per_test <= 0) {
        throw ConfigurationError(std::format("autotune.requests_per_test must be > 0, got {}", requests_per_test));
    }
    if (fallback_token_size <= 0) {
        throw ConfigurationError(std::format("autotune.fallback_token_size must be > 0, got {}", fallback_token_size));
    }
}

json TunerSettings::to_json() const {
    json j;
    j["min_acceptable_tps"] = min_acceptable_tps;
    j["near_best_band"] = near_best_band;
    j["max_concurrency"] = max_concurrency;
    j["concurrency_steps"] = concurrency_steps;
    j["batch_sizes"] = batch_sizes;
    j["token_sizes"] = token_sizes;
    j["probe_token_sizes"] = probe_token_sizes;
    j["probe_requests"] = probe_requests;
    j["requests_per_test"] = requests_per_test;
    j["fallback_token_size"] = fallback_token_size;
    return j;
}

const char* to_string(TuneStatus status) {
    switch (status) {
        case TuneStatus::Pending: return "pending";
        case TuneStatus::Running: return "running";
        case TuneStatus::Completed: return "completed";
        case TuneStatus::Error: return "error";
        case TuneStatus::Stopping: return "stopping";
        default: return "unknown";
    }
}

const char* to_string(StopResult result) {
    switch (result) {
        case StopResult::Stopping: return "stopping";
        case StopResult::NotRunning: return "not_running";
        default: return "unknown";
    }
}

json AutoTuneState::to_json() const {
    json j;
    j["model_id"] = target;
    j["timestamp"] = started_at;
    j["token_sizes"] = token_sizes;
    j["tests"] = json::array();
    for (const auto& test: tests) {
        j["tests"].emplace_back(test.to_json());
    }
    j["optimal_config"] = best.has_value() ? best->to_json() : json(nullptr);
    j["status"] = to_string(status);
    if (error.has_value()) {
        j["error"] = error.value();
    }
    return j;
}

AutoTuner::AutoTuner(
    std::shared_ptr<BenchmarkRunner> runner,
    std::shared_ptr<ConnectionResolver> resolver,
    std::shared_ptr<AutoTuneArchive> archive,
    TunerSettings settings,
    SharedProgress progress
) : runner(std::move(runner)), resolver(std::move(resolver)), archive(std::move(archive)),
    settings(std::move(settings)), progress(std::move(progress)) {
    if (!this->runner || !this->resolver) {
        throw ConfigurationError("auto-tuner needs a benchmark runner and a connection resolver");
    }
    this->settings.validate();
}

AutoTuneState AutoTuner::search(const std::string& target, const std::string& base_prompt) {
    {
        std::lock_guard<std::mutex> lock(run_mu);
        if (running.exchange(true, std::memory_order_acq_rel)) {
            Logger.warn("Auto-benchmark is already running, rejecting search for {}", target);
            throw AlreadyRunningError("Auto-benchmark is already running");
        }
        stop_requested.store(false, std::memory_order_release);
    }
    RunningFlag flag(run_mu, running, stop_requested);

    if (base_prompt.empty()) {
        throw ConfigurationError("prompt is required");
    }
    auto connection = resolver->resolve(target);

    {
        std::lock_guard<std::mutex> lock(state_mu);
        state = AutoTuneState{};
        state.target = target;
        state.started_at = iso_timestamp(std::chrono::system_clock::now());
        state.status = TuneStatus::Running;
    }
    Logger.info("Starting auto-benchmark for {} with prompt: {}", target, base_prompt);

    try {
        int max_supported = probe_capacity(connection, base_prompt);
        Logger.info("Maximum supported token size: {}", max_supported);

        std::vector<int> token_sizes;
        std::vector<std::string> token_labels;
        for (auto size: settings.token_sizes) {
            if (size <= max_supported) {
                token_sizes.emplace_back(size);
                token_labels.emplace_back(std::to_string(size));
            }
        }
        if (token_sizes.empty()) {
            token_sizes.emplace_back(settings.fallback_token_size);
            token_labels.emplace_back(std::to_string(settings.fallback_token_size));
        }
        {
            std::lock_guard<std::mutex> lock(state_mu);
            state.token_sizes = token_sizes;
        }
        Logger.info("Using token sizes: [{}]", join(token_labels));

        sweep_streaming(connection, base_prompt, token_sizes.front());
        sweep_batches(connection, base_prompt, token_sizes.front());
        scale_tokens(connection, base_prompt, token_sizes);

        auto best = select_best(tests_snapshot(), settings.min_acceptable_tps, settings.near_best_band);
        {
            std::lock_guard<std::mutex> lock(state_mu);
            state.best = best;
            state.status = TuneStatus::Completed;
        }
        if (best.has_value()) {
            Logger.info("Optimal configuration: {}", best->name);
        } else {
            Logger.warn("No optimal configuration found for {}", target);
        }
    } catch (const std::exception& e) {
        Logger.error("Auto-benchmark for {} failed: {}", target, e.what());
        std::lock_guard<std::mutex> lock(state_mu);
        state.status = TuneStatus::Error;
        state.error = e.what();
    }

    persist();
    return status();
}

int AutoTuner::probe_capacity(const ConnectionInfo& connection, const std::string& prompt) {
    for (auto size: settings.probe_token_sizes) {
        if (should_stop()) {
            break;
        }
        Logger.info("Testing max token size: {}", size);
        auto probe = run_test(connection, prompt, 1, false, 1, size, settings.probe_requests);
        if (probe.ok()) {
            return size;
        }
        Logger.warn("Token size {} failed: {}", size, probe.error.value());
    }
    return settings.fallback_token_size;
}

void AutoTuner::sweep_streaming(const ConnectionInfo& connection, const std::string& prompt, int token_size) {
    Logger.info("Testing streaming mode...");
    for (auto concurrency: settings.concurrency_steps) {
        if (should_stop() || concurrency > settings.max_concurrency) {
            break;
        }
        auto record = run_test(connection, prompt, concurrency, true, 1, token_size, settings.requests_per_test);
        append(record);

        if (record.ok() && record.tokens_per_second < settings.min_acceptable_tps) {
            Logger.info("Streaming performance dropped below threshold at concurrency {}", concurrency);
            break;
        }
        if (concurrency >= settings.max_concurrency) {
            break;
        }
    }
}

void AutoTuner::sweep_batches(const ConnectionInfo& connection, const std::string& prompt, int token_size) {
    Logger.info("Testing batch mode...");
    for (auto concurrency: settings.concurrency_steps) {
        if (should_stop() || concurrency > settings.max_concurrency) {
            break;
        }
        std::vector<TestRecord> at_concurrency;
        for (auto batch_size: settings.batch_sizes) {
            if (batch_size > concurrency) {
                continue;
            }
            if (should_stop()) {
                break;
            }
            auto record = run_test(connection, prompt, concurrency, false, batch_size, token_size,
                                   settings.requests_per_test);
            append(record);
            at_concurrency.emplace_back(std::move(record));
        }

        // Error entries are ignored; with none left the level counts as underperforming
        bool all_below = std::all_of(at_concurrency.begin(), at_concurrency.end(), [this](const TestRecord& r) {
            return !r.ok() || r.tokens_per_second < settings.min_acceptable_tps;
        });
        if (all_below) {
            Logger.info("Batch performance below threshold for every batch size at concurrency {}", concurrency);
            break;
        }
        if (concurrency >= settings.max_concurrency) {
            break;
        }
    }
}

void AutoTuner::scale_tokens(const ConnectionInfo& connection, const std::string& prompt, const std::vector<int>& token_sizes) {
    if (should_stop()) {
        return;
    }
    Logger.info("Testing token size scaling...");
    auto best = select_best(tests_snapshot(), settings.min_acceptable_tps, settings.near_best_band);
    if (!best.has_value()) {
        Logger.warn("No usable configuration to scale token sizes with");
        return;
    }
    for (auto token_size: token_sizes) {
        if (token_size <= token_sizes.front()) {
            continue;
        }
        if (should_stop()) {
            break;
        }
        append(run_test(connection, prompt, best->concurrency, best->streaming, best->batch_size, token_size,
                        settings.requests_per_test));
    }
}

TestRecord AutoTuner::run_test(
    const ConnectionInfo& connection,
    const std::string& prompt,
    int concurrency,
    bool streaming,
    int batch_size,
    int token_size,
    int total_requests
) {
    BenchmarkConfig config;
    config.name = test_name(connection.target, concurrency, batch_size, token_size, streaming);
    config.target = connection.target;
    config.prompt = prompt;
    config.total_requests = total_requests;
    config.concurrency = concurrency;
    config.max_tokens = token_size;
    config.stream = streaming;
    config.batch_size = streaming ? 1 : batch_size;

    TestRecord record;
    record.name = config.name;
    record.target = connection.target;
    record.concurrency = concurrency;
    record.streaming = streaming;
    record.batch_size = config.batch_size;
    record.token_size = token_size;

    Logger.info("Running test: {}", config.name);
    auto started = std::chrono::high_resolution_clock::now();
    try {
        validate(config);
        auto result = runner->run(config, connection);
        record.tokens_per_second = result.tokens_per_second;
        record.latency_ms = result.latency_ms;
        record.p95_latency_ms = result.p95_latency_ms;
        record.ttft_ms = result.ttft_ms;
        record.gpu_utilization = result.peaks.gpu_utilization;
        record.gpu_memory = result.peaks.gpu_memory;
        Logger.info("Test {} completed: {:.2f} tokens/sec", record.name, record.tokens_per_second);
    } catch (const std::exception& e) {
        Logger.error("Test {} failed: {}", record.name, e.what());
        record.name += "_error";
        record.error = e.what();
    }
    record.duration_seconds = seconds_between(started, std::chrono::high_resolution_clock::now());
    record.timestamp = iso_timestamp(std::chrono::system_clock::now());
    return record;
}

void AutoTuner::append(const TestRecord& record) {
    size_t done;
    {
        std::lock_guard<std::mutex> lock(state_mu);
        state.tests.emplace_back(record);
        done = state.tests.size();
    }
    ProgressUpdate update;
    update.source = "autotune";
    update.completed = static_cast<int>(done);
    update.current_tps = record.tokens_per_second;
    update.message = record.ok()
        ? std::format("{}: {:.2f} tok/s", record.name, record.tokens_per_second)
        : std::format("{}: {}", record.name, record.error.value());
    publish_progress(progress, update);
}

std::vector<TestRecord> AutoTuner::tests_snapshot() const {
    std::lock_guard<std::mutex> lock(state_mu);
    return state.tests;
}

void AutoTuner::persist() {
    if (!archive) {
        return;
    }
    auto session = status();
    try {
        archive->save(session.to_json(), session.target);
    } catch (const std::exception& e) {
        Logger.error("Error saving auto-benchmark results for {}: {}", session.target, e.what());
    }
}

StopResult AutoTuner::stop() {
    {
        std::lock_guard<std::mutex> lock(run_mu);
        if (!is_running()) {
            return StopResult::NotRunning;
        }
        stop_requested.store(true, std::memory_order_release);
    }
    {
        std::lock_guard<std::mutex> lock(state_mu);
        if (state.status == TuneStatus::Running) {
            state.status = TuneStatus::Stopping;
        }
    }
    Logger.info("Stopping auto-benchmark...");
    return StopResult::Stopping;
}

AutoTuneState AutoTuner::status() const {
    std::lock_guard<std::mutex> lock(state_mu);
    return state;
}

std::vector<json> AutoTuner::history() const {
    if (!archive) {
        return {};
    }
    return archive->list();
}
