//
// Created by Sanger Steel on 7/3/25.
//

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "completion_types.hpp"
#include "connection.hpp"
#include "curl.hpp"
#include "request_parameters.hpp"
#include "result_types.hpp"
#include "streaming_response.hpp"

using json = nlohmann::json;

// Issues one generation request and reduces the response to a RequestSample.
// Per-request failures come back as a failed sample, never as an exception.
class RequestDriver {
public:
    virtual ~RequestDriver() = default;

    virtual RequestSample drive(const ConnectionInfo& connection, const BenchmarkConfig& config) = 0;
};

using SharedDriver = std::shared_ptr<RequestDriver>;
using SharedClient = std::shared_ptr<CURLHandler>;

// Timing and failure handling shared by every HTTP backend. Subclasses only
// describe the endpoint, the request body and the response shape.
class BackendRequestDriver : public RequestDriver {
public:
    explicit BackendRequestDriver(SharedClient client);

    RequestSample drive(const ConnectionInfo& connection, const BenchmarkConfig& config) final;

protected:
    virtual std::string endpoint(const ConnectionInfo& connection) const = 0;

    virtual json build_body(const ConnectionInfo& connection, const BenchmarkConfig& config) const = 0;

    virtual StreamFraming framing() const = 0;

    virtual CompletionParser parser() const = 0;

private:
    RequestSample drive_batched(const std::string& uri, const std::string& body);

    RequestSample drive_streaming(const std::string& uri, const std::string& body);

    RequestSample fail(const std::string& uri, std::string error, double latency_ms) const;

    SharedClient client;
};

// POST {base}/api/generate, newline-delimited JSON when streaming.
class GenerateDriver final : public BackendRequestDriver {
public:
    using BackendRequestDriver::BackendRequestDriver;

protected:
    std::string endpoint(const ConnectionInfo& connection) const override;

    json build_body(const ConnectionInfo& connection, const BenchmarkConfig& config) const override;

    StreamFraming framing() const override {
        return StreamFraming::NewlineDelimited;
    }

    CompletionParser parser() const override {
        return parse_generate_chunk;
    }
};

// POST {base}/v1/completions, server-sent events when streaming.
class OpenAIDriver final : public BackendRequestDriver {
public:
    using BackendRequestDriver::BackendRequestDriver;

protected:
    std::string endpoint(const ConnectionInfo& connection) const override;

    json build_body(const ConnectionInfo& connection, const BenchmarkConfig& config) const override;

    StreamFraming framing() const override {
        return StreamFraming::ServerSentEvents;
    }

    CompletionParser parser() const override {
        return parse_completion_chunk;
    }
};

// POST {base}/v1/chat/completions on a local inference container.
class ContainerDriver final : public BackendRequestDriver {
public:
    using BackendRequestDriver::BackendRequestDriver;

protected:
    std::string endpoint(const ConnectionInfo& connection) const override;

    json build_body(const ConnectionInfo& connection, const BenchmarkConfig& config) const override;

    StreamFraming framing() const override {
        return StreamFraming::ServerSentEvents;
    }

    CompletionParser parser() const override {
        return parse_chat_chunk;
    }
};

SharedDriver make_driver(Protocol protocol, SharedClient client);

// Builds a driver for a resolved connection. Injected into the Load Executor.
using DriverFactory = std::function<SharedDriver(const ConnectionInfo&)>;

// One CURLHandler per connection, carrying its API key and the request timeout.
DriverFactory http_driver_factory(std::optional<long> timeout_seconds = CURLHandler::BenchmarkTimeoutSeconds);
