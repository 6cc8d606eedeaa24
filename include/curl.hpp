//
// Created by Sanger Steel on 5/7/25.
//

#pragma once
#include <optional>
#include <string>
#include <curl/curl.h>
#include "streaming_response.hpp"

struct HttpResponse {
    CURLcode curl_code = CURLE_OK;
    long status = 0;
    std::string body;
    // Seconds, as reported by libcurl
    double start_transfer = 0;
    double total = 0;

    bool transport_ok() const {
        return curl_code == CURLE_OK;
    }

    bool status_ok() const {
        return status >= 200 && status < 300;
    }

    // "HTTP 503: <body head>" or the curl error text
    std::string describe_failure() const;
};

// Owns the header list shared by every request to one backend. Each call
// uses its own easy handle, so one handler may be used from many threads.
class CURLHandler {
public:
    explicit CURLHandler(
        std::optional<long> timeout = BenchmarkTimeoutSeconds,
        const std::optional<std::string>& api_key = std::nullopt);

    ~CURLHandler();

    CURLHandler(const CURLHandler&) = delete;
    CURLHandler& operator=(const CURLHandler&) = delete;

    static constexpr long BenchmarkTimeoutSeconds = 120;

    std::optional<long> timeout;

    HttpResponse post(const std::string& uri, const std::string& body) const;

    // Feeds the body into `resp` block by block, stamping each block on arrival.
    // The returned HttpResponse carries status and timings but an empty body.
    HttpResponse post_stream(const std::string& uri, const std::string& body, StreamingResponse& resp) const;

private:
    CURL* prepare(const std::string& uri, const std::string& body) const;

    curl_slist* headers = nullptr;
};

// Runs curl_global_init exactly once for the process.
void ensure_curl_initialized();
