//
// Created by Sanger Steel on 7/3/25.
//

#include "drivers/request_driver.hpp"
#include <format>
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

BackendRequestDriver::BackendRequestDriver(SharedClient client) : client(std::move(client)) {
    if (!this->client) {
        throw ConfigurationError("request driver needs an HTTP client");
    }
}

RequestSample BackendRequestDriver::drive(const ConnectionInfo& connection, const BenchmarkConfig& config) {
    auto start = std::chrono::high_resolution_clock::now();
    std::string uri = connection.base_url;
    try {
        uri = endpoint(connection);
        auto body = build_body(connection, config).dump();
        Logger.requests_sent.fetch_add(1, std::memory_order_relaxed);
        if (config.stream) {
            return drive_streaming(uri, body);
        }
        return drive_batched(uri, body);
    } catch (const RequestError& e) {
        return fail(uri, e.what(), ms_between(start, std::chrono::high_resolution_clock::now()));
    }
}

RequestSample BackendRequestDriver::fail(const std::string& uri, std::string error, double latency_ms) const {
    Logger.requests_failed.fetch_add(1, std::memory_order_relaxed);
    Logger.warn("Request to {} failed after {:.1f}ms: {}", uri, latency_ms, error);
    return RequestSample::failure(std::move(error), latency_ms);
}

RequestSample BackendRequestDriver::drive_batched(const std::string& uri, const std::string& body) {
    auto start = std::chrono::high_resolution_clock::now();
    auto response = client->post(uri, body);
    auto latency = ms_between(start, std::chrono::high_resolution_clock::now());

    if (!response.transport_ok() || !response.status_ok()) {
        return fail(uri, response.describe_failure(), latency);
    }

    CompletionResults completion;
    try {
        completion = parser()(json::parse(response.body));
    } catch (const json::exception& e) {
        return fail(uri, std::format("malformed response body: {}", e.what()), latency);
    } catch (const RequestError& e) {
        return fail(uri, std::format("malformed response body: {}", e.what()), latency);
    }

    RequestSample sample;
    sample.success = true;
    sample.latency_ms = latency;
    sample.tokens = completion.reported_tokens.value_or(count_whitespace_tokens(completion.text));
    // Nothing arrives before the whole body
    sample.ttft_ms = latency;
    sample.backend_tokens_per_second = completion.backend_tokens_per_second;
    return sample;
}

RequestSample BackendRequestDriver::drive_streaming(const std::string& uri, const std::string& body) {
    StreamingResponse stream(framing(), parser());
    auto response = client->post_stream(uri, body, stream);
    auto latency = ms_between(stream.start, std::chrono::high_resolution_clock::now());

    if (!response.transport_ok()) {
        return fail(uri, response.describe_failure(), latency);
    }
    if (!response.status_ok()) {
        return fail(uri, std::format("HTTP {}: {}", response.status, trim_copy(stream.head_bytes())), latency);
    }
    if (stream.content_chunks() == 0 && !stream.saw_done()) {
        return fail(uri, std::format("stream ended without a usable chunk ({} malformed)", stream.malformed_chunks()), latency);
    }

    RequestSample sample;
    sample.success = true;
    sample.latency_ms = latency;
    sample.tokens = stream.token_count();
    sample.ttft_ms = stream.ttft_ms();
    sample.inter_token_ms = stream.inter_token_intervals_ms();
    sample.backend_tokens_per_second = stream.backend_tokens_per_second();
    return sample;
}

SharedDriver make_driver(Protocol protocol, SharedClient client) {
    switch (protocol) {
        case Protocol::Generate:
            return std::make_shared<GenerateDriver>(std::move(client));
        case Protocol::OpenAI:
            return std::make_shared<OpenAIDriver>(std::move(client));
        case Protocol::Container:
            return std::make_shared<ContainerDriver>(std::move(client));
        default:
            throw ConfigurationError("unsupported protocol");
    }
}

DriverFactory http_driver_factory(std::optional<long> timeout_seconds) {
    return [timeout_seconds](const ConnectionInfo& connection) {
        auto client = std::make_shared<CURLHandler>(timeout_seconds, connection.api_key);
        return make_driver(connection.protocol, std::move(client));
    };
}
