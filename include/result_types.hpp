//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "request_parameters.hpp"
#include "telemetry.hpp"

using json = nlohmann::json;

// Outcome of one request. Lives only for the duration of a run.
struct RequestSample {
    bool success = false;
    long long tokens = 0;
    double latency_ms = 0;
    // Only set when the first token could be observed
    std::optional<double> ttft_ms = std::nullopt;
    // Streaming only
    std::vector<double> inter_token_ms;
    std::optional<double> backend_tokens_per_second = std::nullopt;
    std::string error;

    static RequestSample failure(std::string error, double latency_ms = 0) {
        RequestSample sample;
        sample.latency_ms = latency_ms;
        sample.error = std::move(error);
        return sample;
    }
};

// Reduction of one Load Executor run.
struct BenchmarkResult {
    BenchmarkConfig config;
    std::string model_name;

    double tokens_per_second = 0;
    double peak_tokens_per_second = 0;
    double latency_ms = 0;
    double p95_latency_ms = 0;
    double ttft_ms = 0;
    double inter_token_latency_ms = 0;
    int successful_requests = 0;
    int failed_requests = 0;
    long long total_tokens = 0;
    double duration_seconds = 0;
    double tokens_per_watt = 0;
    double backend_tokens_per_second = 0;
    std::vector<double> latencies_ms;

    TelemetrySnapshot final_snapshot;
    PeakTelemetry peaks;

    json metrics_json() const;

    json to_json() const;

    std::string display() const;
};
