//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace BenchmarkLimits {
    static constexpr int MaxConcurrency = 512;
}

struct SamplingParameters {
    float temperature = 0.7f;
    float top_p = 0.9f;
    int top_k = 40;
};

// Immutable input of one Load Executor run.
struct BenchmarkConfig {
    std::string name;
    std::string target;
    std::string prompt;
    int total_requests = 10;
    int concurrency = 1;
    std::optional<int> max_tokens = 50;
    bool stream = false;
    int batch_size = 1;
    SamplingParameters sampling;
    // nullopt means "auto": let the backend pick its window
    std::optional<int> context_size = std::nullopt;

    // Streaming requests are never pseudo-batched.
    int effective_batch_size() const {
        return stream ? 1 : batch_size;
    }

    json to_json() const;
    std::string to_str() const;
};

BenchmarkConfig config_from_json(const json& j);

// Throws ConfigurationError naming the first offending field.
void validate(const BenchmarkConfig& config);
