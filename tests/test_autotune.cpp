//
// Created by Sanger Steel on 7/6/25.
//

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <thread>
#include "autotune/autotuner.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

TestRecord attempt(int concurrency, double tps, double latency) {
    TestRecord record;
    record.name = "c" + std::to_string(concurrency);
    record.concurrency = concurrency;
    record.tokens_per_second = tps;
    record.latency_ms = latency;
    return record;
}

TestRecord failed_attempt(int concurrency) {
    auto record = attempt(concurrency, 0, 0);
    record.error = "boom";
    return record;
}

// Scripted runner: `behaviour` maps a config to throughput or throws.
class FakeRunner final : public BenchmarkRunner {
public:
    BenchmarkResult run(const BenchmarkConfig& config, const ConnectionInfo& connection) override {
        {
            std::lock_guard<std::mutex> lock(mu);
            seen.push_back(config);
        }
        entered.fetch_add(1);
        while (hold.load()) {
            std::this_thread::sleep_for(1ms);
        }
        if (on_run) {
            on_run(config);
        }
        BenchmarkResult result;
        result.config = config;
        result.model_name = connection.model;
        result.tokens_per_second = behaviour(config);
        result.latency_ms = 1000.0 / result.tokens_per_second;
        result.p95_latency_ms = result.latency_ms * 1.5;
        result.peaks.gpu_utilization = 70;
        return result;
    }

    std::vector<BenchmarkConfig> configs() {
        std::lock_guard<std::mutex> lock(mu);
        return seen;
    }

    std::function<double(const BenchmarkConfig&)> behaviour = [](const BenchmarkConfig&) { return 50.0; };
    std::function<void(const BenchmarkConfig&)> on_run;
    std::atomic<bool> hold = false;
    std::atomic<int> entered = 0;

private:
    std::mutex mu;
    std::vector<BenchmarkConfig> seen;
};

TunerSettings small_settings() {
    TunerSettings settings;
    settings.min_acceptable_tps = 12;
    settings.max_concurrency = 4;
    settings.concurrency_steps = {1, 2, 4, 8};
    settings.batch_sizes = {1, 2};
    settings.token_sizes = {32, 128};
    settings.probe_token_sizes = {128, 64};
    settings.probe_requests = 1;
    settings.requests_per_test = 2;
    return settings;
}

std::shared_ptr<StaticConnectionResolver> mock_resolver() {
    return std::make_shared<StaticConnectionResolver>(std::vector<BackendEntry>{
        BackendEntry{"mock", Protocol::OpenAI, "http://mock", "llama3", "", ""}
    });
}

// Streaming scales with concurrency, batching with concurrency * batch size,
// and longer generations are proportionally slower.
double scripted_tps(const BenchmarkConfig& config) {
    double scale = 32.0 / config.max_tokens.value_or(32);
    if (config.stream) {
        return 20.0 * config.concurrency * scale;
    }
    return 15.0 * config.concurrency * config.batch_size * scale;
}

}

TEST_CASE( "selection prefers lower latency within the near-best band" ) {
    std::vector<TestRecord> tests{attempt(8, 100, 50), attempt(16, 95, 20), attempt(32, 60, 10)};
    auto best = select_best(tests, 12, 0.10);
    REQUIRE(best.has_value());
    REQUIRE(best->concurrency == 16);
}

TEST_CASE( "selection ignores failed attempts" ) {
    std::vector<TestRecord> tests{attempt(8, 100, 50), failed_attempt(64), attempt(16, 95, 20)};
    REQUIRE(select_best(tests, 12, 0.10)->concurrency == 16);
}

TEST_CASE( "selection falls back to the fastest attempt below the threshold" ) {
    std::vector<TestRecord> tests{attempt(1, 5, 10), attempt(2, 9, 30), attempt(4, 7, 5)};
    auto best = select_best(tests, 12, 0.10);
    REQUIRE(best.has_value());
    REQUIRE(best->concurrency == 2);
}

TEST_CASE( "selection with no attempts" ) {
    REQUIRE_FALSE(select_best({}, 12, 0.10).has_value());
}

TEST_CASE( "selection falls back to an errored attempt when every attempt errored" ) {
    auto slow = failed_attempt(1);
    auto fast = failed_attempt(2);
    fast.tokens_per_second = 3;
    auto best = select_best({slow, fast}, 12, 0.10);
    REQUIRE(best.has_value());
    REQUIRE(best->concurrency == 2);
    REQUIRE(best->error.has_value());
}

TEST_CASE( "test record json" ) {
    auto ok = attempt(4, 80, 12).to_json();
    REQUIRE(ok["concurrency"] == 4);
    REQUIRE(ok["tokens_per_second"] == 80);
    REQUIRE_FALSE(ok.contains("error"));
    REQUIRE(failed_attempt(1).to_json()["error"] == "boom");
}

TEST_CASE( "settings validation" ) {
    auto settings = small_settings();
    REQUIRE_NOTHROW(settings.validate());

    SECTION( "band must be a fraction" ) {
        settings.near_best_band = 1.5;
        REQUIRE_THROWS_AS(settings.validate(), ConfigurationError);
    }
    SECTION( "no empty sweeps" ) {
        settings.batch_sizes.clear();
        REQUIRE_THROWS_AS(settings.validate(), ConfigurationError);
    }
    SECTION( "concurrency ceiling" ) {
        settings.max_concurrency = BenchmarkLimits::MaxConcurrency + 1;
        REQUIRE_THROWS_AS(settings.validate(), ConfigurationError);
    }
    SECTION( "rejected at construction" ) {
        settings.requests_per_test = 0;
        REQUIRE_THROWS_AS(AutoTuner(std::make_shared<FakeRunner>(), mock_resolver(), nullptr, settings),
                          ConfigurationError);
    }
}

TEST_CASE( "full search walks every phase" ) {
    auto runner = std::make_shared<FakeRunner>();
    runner->behaviour = scripted_tps;
    AutoTuner tuner(runner, mock_resolver(), nullptr, small_settings());

    auto state = tuner.search("mock", "Explain TCP slow start.");
    REQUIRE(state.status == TuneStatus::Completed);
    REQUIRE(state.target == "mock");
    REQUIRE(state.token_sizes == std::vector<int>{32, 128});

    // streaming c1 c2 c4, batch c1b1 c2b1 c2b2 c4b1 c4b2, one scaled token size
    REQUIRE(state.tests.size() == 9);
    REQUIRE(state.tests[0].streaming);
    REQUIRE(state.tests[2].concurrency == 4);
    REQUIRE_FALSE(state.tests[3].streaming);
    REQUIRE(state.tests.back().token_size == 128);
    REQUIRE(state.tests.back().concurrency == 4);
    REQUIRE(state.tests.back().batch_size == 2);

    REQUIRE(state.best.has_value());
    REQUIRE(state.best->name == "auto_mock_c4_b2_t32_batch");

    // Probe runs are issued but not reported
    auto configs = runner->configs();
    REQUIRE(configs.size() == 10);
    REQUIRE(configs.front().max_tokens == 128);
    REQUIRE(configs.front().total_requests == 1);
    for (size_t i = 1; i < configs.size(); ++i) {
        REQUIRE(configs[i].total_requests == 2);
        REQUIRE(configs[i].concurrency <= 4);
    }
    REQUIRE_FALSE(tuner.is_running());
}

TEST_CASE( "streaming sweep stops below the threshold" ) {
    auto runner = std::make_shared<FakeRunner>();
    runner->behaviour = [](const BenchmarkConfig& config) {
        return config.stream && config.concurrency >= 2 ? 5.0 : 50.0;
    };
    AutoTuner tuner(runner, mock_resolver(), nullptr, small_settings());
    auto state = tuner.search("mock", "hi");

    int streaming_tests = 0;
    for (const auto& test: state.tests) {
        if (test.streaming && test.token_size == 32) {
            streaming_tests++;
        }
    }
    REQUIRE(streaming_tests == 2);
}

TEST_CASE( "failed probes fall back to the smallest token size" ) {
    auto runner = std::make_shared<FakeRunner>();
    runner->behaviour = [](const BenchmarkConfig& config) -> double {
        if (config.total_requests == 1) {
            throw RunError("No successful requests completed");
        }
        return 40.0;
    };
    AutoTuner tuner(runner, mock_resolver(), nullptr, small_settings());
    auto state = tuner.search("mock", "hi");

    REQUIRE(state.status == TuneStatus::Completed);
    REQUIRE(state.token_sizes == std::vector<int>{32});
    for (const auto& test: state.tests) {
        REQUIRE(test.token_size == 32);
    }
}

TEST_CASE( "failed tests are recorded and the sweep continues" ) {
    auto runner = std::make_shared<FakeRunner>();
    runner->behaviour = [](const BenchmarkConfig& config) -> double {
        if (config.stream && config.concurrency == 2) {
            throw RunError("No successful requests completed (2 failed)");
        }
        return 50.0;
    };
    AutoTuner tuner(runner, mock_resolver(), nullptr, small_settings());
    auto state = tuner.search("mock", "hi");

    REQUIRE(state.tests[1].name == "auto_mock_c2_b1_t32_stream_error");
    REQUIRE(state.tests[1].error.has_value());
    REQUIRE(state.tests[2].streaming);
    REQUIRE(state.tests[2].concurrency == 4);
    REQUIRE(state.best.has_value());
    REQUIRE(state.best->ok());
}

TEST_CASE( "stop keeps partial results" ) {
    auto runner = std::make_shared<FakeRunner>();
    std::shared_ptr<AutoTuner> tuner = std::make_shared<AutoTuner>(runner, mock_resolver(), nullptr, small_settings());
    runner->on_run = [&tuner](const BenchmarkConfig& config) {
        if (config.stream) {
            REQUIRE(tuner->stop() == StopResult::Stopping);
        }
    };

    auto state = tuner->search("mock", "hi");
    REQUIRE(state.status == TuneStatus::Completed);
    REQUIRE(state.tests.size() == 1);
    REQUIRE(state.best.has_value());
    REQUIRE(tuner->stop() == StopResult::NotRunning);

    // A stop does not leak into the next search
    runner->on_run = nullptr;
    auto next = tuner->search("mock", "hi");
    REQUIRE(next.tests.size() > 1);
}

TEST_CASE( "stop racing the end of a search leaves no stale request" ) {
    auto runner = std::make_shared<FakeRunner>();
    AutoTuner tuner(runner, mock_resolver(), nullptr, small_settings());

    std::atomic<bool> done = false;
    std::thread stopper([&] {
        while (!done.load()) {
            tuner.stop();
        }
    });
    for (int i = 0; i < 50; ++i) {
        tuner.search("mock", "hi");
    }
    done.store(true);
    stopper.join();

    REQUIRE_FALSE(tuner.is_running());
    auto state = tuner.search("mock", "hi");
    REQUIRE(state.status == TuneStatus::Completed);
    REQUIRE(state.tests.size() > 1);
}

TEST_CASE( "stop without a search" ) {
    AutoTuner tuner(std::make_shared<FakeRunner>(), mock_resolver(), nullptr);
    REQUIRE(tuner.stop() == StopResult::NotRunning);
    REQUIRE(tuner.status().status == TuneStatus::Pending);
}

TEST_CASE( "a second search is rejected while one is running" ) {
    auto runner = std::make_shared<FakeRunner>();
    runner->hold = true;
    AutoTuner tuner(runner, mock_resolver(), nullptr, small_settings());

    AutoTuneState first;
    std::thread searching([&] {
        first = tuner.search("mock", "first prompt");
    });
    while (runner->entered.load() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    auto before = tuner.status();
    REQUIRE(tuner.is_running());
    REQUIRE_THROWS_AS(tuner.search("mock", "second prompt"), AlreadyRunningError);
    auto after = tuner.status();
    REQUIRE(after.status == before.status);
    REQUIRE(after.started_at == before.started_at);
    REQUIRE(after.tests.size() == before.tests.size());

    runner->hold = false;
    searching.join();
    REQUIRE(first.status == TuneStatus::Completed);
    for (const auto& config: runner->configs()) {
        REQUIRE(config.prompt == "first prompt");
    }
}

TEST_CASE( "bad targets and prompts are configuration errors" ) {
    auto runner = std::make_shared<FakeRunner>();
    AutoTuner tuner(runner, mock_resolver(), nullptr, small_settings());
    REQUIRE_THROWS_AS(tuner.search("missing", "hi"), ConfigurationError);
    REQUIRE_THROWS_AS(tuner.search("mock", ""), ConfigurationError);
    REQUIRE_FALSE(tuner.is_running());
    REQUIRE(runner->entered.load() == 0);
    REQUIRE_NOTHROW(tuner.search("mock", "hi"));
}

TEST_CASE( "sessions are archived" ) {
    std::random_device rd;
    auto dir = fs::temp_directory_path() / ("tokenbench_autotune_" + std::to_string(rd()));
    {
        auto archive = std::make_shared<AutoTuneArchive>(dir);
        AutoTuner tuner(std::make_shared<FakeRunner>(), mock_resolver(), archive, small_settings());
        auto state = tuner.search("mock", "hi");

        auto history = tuner.history();
        REQUIRE(history.size() == 1);
        REQUIRE(history[0]["model_id"] == "mock");
        REQUIRE(history[0]["status"] == "completed");
        REQUIRE(history[0]["tests"].size() == state.tests.size());
        REQUIRE(history[0]["optimal_config"]["name"] == state.best->name);
    }
    fs::remove_all(dir);
}
