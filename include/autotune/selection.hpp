//
// Created by Sanger Steel on 7/6/25.
//

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// One auto-tune attempt, successful or not.
struct TestRecord {
    std::string name;
    std::string target;
    int concurrency = 1;
    bool streaming = false;
    int batch_size = 1;
    int token_size = 0;
    double tokens_per_second = 0;
    double latency_ms = 0;
    double p95_latency_ms = 0;
    double ttft_ms = 0;
    double gpu_utilization = 0;
    double gpu_memory = 0;
    double duration_seconds = 0;
    std::string timestamp;
    std::optional<std::string> error = std::nullopt;

    bool ok() const {
        return !error.has_value();
    }

    json to_json() const;
};

// Among error-free attempts at or above `min_tps`, those within `band` of the
// best throughput compete on mean latency. Without any such attempt the
// fastest error-free attempt wins regardless of the threshold.
std::optional<TestRecord> select_best(const std::vector<TestRecord>& tests, double min_tps, double band);
