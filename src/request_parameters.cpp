//
// Created by Sanger Steel on 5/20/25.
//

#include "request_parameters.hpp"
#include "errors.hpp"
#include <format>

json BenchmarkConfig::to_json() const {
    json j;
    j["name"] = name;
    j["target"] = target;
    j["prompt"] = prompt;
    j["total_requests"] = total_requests;
    j["concurrency_level"] = concurrency;
    if (max_tokens.has_value()) {
        j["max_tokens"] = max_tokens.value();
    } else {
        j["max_tokens"] = nullptr;
    }
    j["stream"] = stream;
    j["batch_size"] = effective_batch_size();
    j["temperature"] = sampling.temperature;
    j["top_p"] = sampling.top_p;
    j["top_k"] = sampling.top_k;
    if (context_size.has_value()) {
        j["context_size"] = context_size.value();
    } else {
        j["context_size"] = "auto";
    }
    return j;
}

std::string BenchmarkConfig::to_str() const {
    std::string str = "==========\nBENCHMARK CONFIG\n";
    str += std::format("name: {}\n", name);
    str += std::format("target: {}\n", target);
    str += std::format("prompt: {}\n", prompt);
    str += std::format("total_requests: {}\n", total_requests);
    str += std::format("concurrency: {}\n", concurrency);
    str += std::format("max_tokens: {}\n", max_tokens.has_value() ? std::to_string(max_tokens.value()) : "backend default");
    str += std::format("stream: {}\n", stream);
    str += std::format("batch_size: {}\n", effective_batch_size());
    str += std::format("temperature: {}\n", sampling.temperature);
    str += std::format("top_p: {}\n", sampling.top_p);
    str += std::format("top_k: {}\n", sampling.top_k);
    str += std::format("context_size: {}\n", context_size.has_value() ? std::to_string(context_size.value()) : "auto");
    str += "==========\n";
    return str;
}

BenchmarkConfig config_from_json(const json& j) {
    BenchmarkConfig config;
    config.name = j.value("name", "");
    j.at("target").get_to(config.target);
    j.at("prompt").get_to(config.prompt);
    j.at("total_requests").get_to(config.total_requests);
    j.at("concurrency_level").get_to(config.concurrency);
    if (j.contains("max_tokens") && !j["max_tokens"].is_null()) {
        config.max_tokens = j["max_tokens"].get<int>();
    } else {
        config.max_tokens = std::nullopt;
    }
    config.stream = j.value("stream", false);
    config.batch_size = j.value("batch_size", 1);
    config.sampling.temperature = j.value("temperature", config.sampling.temperature);
    config.sampling.top_p = j.value("top_p", config.sampling.top_p);
    config.sampling.top_k = j.value("top_k", config.sampling.top_k);
    if (j.contains("context_size") && j["context_size"].is_number_integer()) {
        config.context_size = j["context_size"].get<int>();
    }
    return config;
}

void validate(const BenchmarkConfig& config) {
    if (config.target.empty()) {
        throw ConfigurationError("target is required");
    }
    if (config.prompt.empty()) {
        throw ConfigurationError("prompt is required");
    }
    if (config.total_requests <= 0) {
        throw ConfigurationError(std::format("total_requests must be > 0, got {}", config.total_requests));
    }
    if (config.concurrency < 1 || config.concurrency > BenchmarkLimits::MaxConcurrency) {
        throw ConfigurationError(std::format("concurrency must be in [1, {}], got {}",
                                             BenchmarkLimits::MaxConcurrency, config.concurrency));
    }
    if (config.batch_size < 1 || config.batch_size > BenchmarkLimits::MaxConcurrency) {
        throw ConfigurationError(std::format("batch_size must be in [1, {}], got {}",
                                             BenchmarkLimits::MaxConcurrency, config.batch_size));
    }
    if (config.max_tokens.has_value() && config.max_tokens.value() <= 0) {
        throw ConfigurationError(std::format("max_tokens must be > 0, got {}", config.max_tokens.value()));
    }
    if (config.sampling.temperature < 0 || config.sampling.temperature > 2) {
        throw ConfigurationError(std::format("temperature must be in [0, 2], got {}", config.sampling.temperature));
    }
    if (config.sampling.top_p <= 0 || config.sampling.top_p > 1) {
        throw ConfigurationError(std::format("top_p must be in (0, 1], got {}", config.sampling.top_p));
    }
    if (config.sampling.top_k < 0) {
        throw ConfigurationError(std::format("top_k must be >= 0, got {}", config.sampling.top_k));
    }
    if (config.context_size.has_value() && config.context_size.value() <= 0) {
        throw ConfigurationError(std::format("context_size must be > 0, got {}", config.context_size.value()));
    }
}
