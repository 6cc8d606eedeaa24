//
// Created by Sanger Steel on 7/6/25.
//

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "autotune/selection.hpp"
#include "connection.hpp"
#include "load_executor.hpp"
#include "progress.hpp"
#include "run_recorder.hpp"

using json = nlohmann::json;

struct TunerSettings {
    double min_acceptable_tps = 12.0;
    // Attempts within this fraction of the best throughput compete on latency
    double near_best_band = 0.10;
    int max_concurrency = 64;
    std::vector<int> concurrency_steps = {1, 2, 4, 8, 16, 24, 32, 48, 64};
    std::vector<int> batch_sizes = {1, 2, 4, 8};
    std::vector<int> token_sizes = {32, 128, 512};
    // Tried largest first
    std::vector<int> probe_token_sizes = {512, 256, 128, 64, 32};
    int probe_requests = 2;
    int requests_per_test = 10;
    int fallback_token_size = 32;

    // Throws ConfigurationError
    void validate() const;

    json to_json() const;
};

enum class TuneStatus {
    Pending,
    Running,
    Completed,
    Error,
    Stopping,
};

const char* to_string(TuneStatus status);

enum class StopResult {
    Stopping,
    NotRunning,
};

const char* to_string(StopResult result);

struct AutoTuneState {
    std::string target;
    std::string started_at;
    std::vector<int> token_sizes;
    std::vector<TestRecord> tests;
    std::optional<TestRecord> best = std::nullopt;
    TuneStatus status = TuneStatus::Pending;
    std::optional<std::string> error = std::nullopt;

    json to_json() const;
};

// Searches concurrency, batching and generation length for the setting with
// the best throughput/latency trade-off. One search at a time per tuner.
class AutoTuner {
public:
    AutoTuner(
        std::shared_ptr<BenchmarkRunner> runner,
        std::shared_ptr<ConnectionResolver> resolver,
        std::shared_ptr<AutoTuneArchive> archive,
        TunerSettings settings = {},
        SharedProgress progress = nullptr
    );

    // Throws AlreadyRunningError while another search is active and
    // ConfigurationError for an unknown target. Everything after target
    // resolution is captured in the returned state, which is also archived.
    AutoTuneState search(const std::string& target, const std::string& base_prompt);

    // Cooperative: the test in flight finishes, no new one starts.
    StopResult stop();

    bool is_running() const {
        return running.load(std::memory_order_acquire);
    }

    AutoTuneState status() const;

    std::vector<json> history() const;

    const TunerSettings& get_settings() const {
        return settings;
    }

private:
    int probe_capacity(const ConnectionInfo& connection, const std::string& prompt);

    void sweep_streaming(const ConnectionInfo& connection, const std::string& prompt, int token_size);

    void sweep_batches(const ConnectionInfo& connection, const std::string& prompt, int token_size);

    void scale_tokens(const ConnectionInfo& connection, const std::string& prompt, const std::vector<int>& token_sizes);

    TestRecord run_test(const ConnectionInfo& connection, const std::string& prompt, int concurrency,
                        bool streaming, int batch_size, int token_size, int total_requests);

    void append(const TestRecord& record);

    std::vector<TestRecord> tests_snapshot() const;

    bool should_stop() const {
        return stop_requested.load(std::memory_order_acquire);
    }

    void persist();

    std::shared_ptr<BenchmarkRunner> runner;
    std::shared_ptr<ConnectionResolver> resolver;
    std::shared_ptr<AutoTuneArchive> archive;
    TunerSettings settings;
    SharedProgress progress;

    // Orders stop requests against the start and end of a search
    std::mutex run_mu;
    std::atomic<bool> running = false;
    std::atomic<bool> stop_requested = false;

    mutable std::mutex state_mu;
    AutoTuneState state;
};
