//
// Created by Sanger Steel on 7/3/25.
//

#include "drivers/request_driver.hpp"

std::string GenerateDriver::endpoint(const ConnectionInfo& connection) const {
    return connection.base_url + "/api/generate";
}

json GenerateDriver::build_body(const ConnectionInfo& connection, const BenchmarkConfig& config) const {
    json options;
    if (config.max_tokens.has_value()) {
        options["num_predict"] = config.max_tokens.value();
    }
    options["temperature"] = config.sampling.temperature;
    options["top_p"] = config.sampling.top_p;
    options["top_k"] = config.sampling.top_k;
    if (config.context_size.has_value()) {
        options["num_ctx"] = config.context_size.value();
    }

    json j;
    j["model"] = connection.model;
    j["prompt"] = config.prompt;
    j["stream"] = config.stream;
    j["options"] = options;
    return j;
}

std::string OpenAIDriver::endpoint(const ConnectionInfo& connection) const {
    return connection.base_url + "/v1/completions";
}

json OpenAIDriver::build_body(const ConnectionInfo& connection, const BenchmarkConfig& config) const {
    json j;
    j["model"] = connection.model;
    j["prompt"] = config.prompt;
    if (config.max_tokens.has_value()) {
        j["max_tokens"] = config.max_tokens.value();
    }
    j["temperature"] = config.sampling.temperature;
    j["top_p"] = config.sampling.top_p;
    j["top_k"] = config.sampling.top_k;
    j["stream"] = config.stream;
    if (config.stream) {
        // Final chunk then carries usage.completion_tokens
        j["stream_options"] = {{"include_usage", true}};
    }
    return j;
}

std::string ContainerDriver::endpoint(const ConnectionInfo& connection) const {
    return connection.base_url + "/v1/chat/completions";
}

json ContainerDriver::build_body(const ConnectionInfo& connection, const BenchmarkConfig& config) const {
    json message;
    message["role"] = "user";
    message["content"] = config.prompt;

    json j;
    j["model"] = connection.model;
    j["messages"] = json::array();
    j["messages"].push_back(message);
    if (config.max_tokens.has_value()) {
        j["max_tokens"] = config.max_tokens.value();
    }
    j["temperature"] = config.sampling.temperature;
    j["top_p"] = config.sampling.top_p;
    j["stream"] = config.stream;
    return j;
}
