//
// Created by Sanger Steel on 7/6/25.
//

#include "autotune/selection.hpp"
#include <algorithm>

json TestRecord::to_json() const {
    json j;
    j["name"] = name;
    j["model_id"] = target;
    j["concurrency"] = concurrency;
    j["streaming"] = streaming;
    j["batch_size"] = batch_size;
    j["token_size"] = token_size;
    j["tokens_per_second"] = tokens_per_second;
    j["latency"] = latency_ms;
    j["p95_latency"] = p95_latency_ms;
    j["time_to_first_token"] = ttft_ms;
    j["gpu_utilization"] = gpu_utilization;
    j["gpu_memory"] = gpu_memory;
    j["total_duration"] = duration_seconds;
    j["timestamp"] = timestamp;
    if (error.has_value()) {
        j["error"] = error.value();
    }
    return j;
}

std::optional<TestRecord> select_best(const std::vector<TestRecord>& tests, double min_tps, double band) {
    auto by_throughput = [](const TestRecord* a, const TestRecord* b) {
        return a->tokens_per_second < b->tokens_per_second;
    };

    if (tests.empty()) {
        return std::nullopt;
    }

    std::vector<const TestRecord*> qualifying;
    for (const auto& test: tests) {
        if (test.ok() && test.tokens_per_second >= min_tps) {
            qualifying.emplace_back(&test);
        }
    }

    // Nothing met the threshold: the fastest attempt wins, errored ones included
    if (qualifying.empty()) {
        std::vector<const TestRecord*> all;
        for (const auto& test: tests) {
            all.emplace_back(&test);
        }
        return **std::max_element(all.begin(), all.end(), by_throughput);
    }

    double best_tps = (*std::max_element(qualifying.begin(), qualifying.end(), by_throughput))->tokens_per_second;
    double floor_tps = best_tps * (1.0 - band);

    const TestRecord* best = nullptr;
    for (const auto* test: qualifying) {
        if (test->tokens_per_second < floor_tps) {
            continue;
        }
        if (!best || test->latency_ms < best->latency_ms) {
            best = test;
        }
    }
    return *best;
}
