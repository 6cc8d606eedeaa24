//
// Created by Sanger Steel on 5/7/25.
//

#include "curl.hpp"
#include <format>
#include <mutex>
#include <stdexcept>
#include "errors.hpp"
#include "logger.hpp"


namespace {

std::once_flag curl_init_flag;

size_t write_cb_default(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string *) userp)->append((char *) contents, size * nmemb);
    return size * nmemb;
}

size_t write_cb_to_stream(void* contents, size_t size, size_t nmemb, void* userp) {
    auto arrived = std::chrono::high_resolution_clock::now();
    auto as_streaming_resp = (StreamingResponse *) userp;
    as_streaming_resp->push(std::string_view((char *) contents, size * nmemb), arrived);
    return size * nmemb;
}

void read_timings(CURL* handle, HttpResponse& response) {
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_getinfo(handle, CURLINFO_STARTTRANSFER_TIME, &response.start_transfer);
    curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &response.total);
}

}

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, [] {
        auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
        }
    });
}

std::string HttpResponse::describe_failure() const {
    if (!transport_ok()) {
        return curl_easy_strerror(curl_code);
    }
    constexpr size_t max_body = 200;
    return std::format("HTTP {}: {}", status, body.substr(0, max_body));
}

CURLHandler::CURLHandler(std::optional<long> timeout, const std::optional<std::string>& api_key) : timeout(timeout) {
    ensure_curl_initialized();
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (api_key.has_value() && !api_key->empty()) {
        std::string token_header = std::format("Authorization: Bearer {}", api_key.value());
        headers = curl_slist_append(headers, token_header.c_str());
    }
}

CURLHandler::~CURLHandler() {
    curl_slist_free_all(headers);
}

CURL* CURLHandler::prepare(const std::string& uri, const std::string& body) const {
    CURL* ephemeral = curl_easy_init();
    if (!ephemeral) {
        throw RequestError("curl_easy_init failed");
    }
    curl_easy_setopt(ephemeral, CURLOPT_URL, uri.c_str());
    curl_easy_setopt(ephemeral, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(ephemeral, CURLOPT_POST, 1L);
    curl_easy_setopt(ephemeral, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(ephemeral, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    // Timeouts must not raise SIGALRM in a multi-threaded process
    curl_easy_setopt(ephemeral, CURLOPT_NOSIGNAL, 1L);
    if (this->timeout.has_value()) {
        curl_easy_setopt(ephemeral, CURLOPT_TIMEOUT, this->timeout.value());
    }
    return ephemeral;
}

HttpResponse CURLHandler::post(const std::string& uri, const std::string& body) const {
    HttpResponse response;
    CURL* ephemeral = prepare(uri, body);
    curl_easy_setopt(ephemeral, CURLOPT_WRITEFUNCTION, write_cb_default);
    curl_easy_setopt(ephemeral, CURLOPT_WRITEDATA, &response.body);

    auto idx = Logger.set_start();
    response.curl_code = curl_easy_perform(ephemeral);
    Logger.set_stop_and_display_time(idx, "e2e from server");
    read_timings(ephemeral, response);
    curl_easy_cleanup(ephemeral);

    Logger.debug("POST {} -> status={} TTFB={}s Total={}s", uri, response.status,
                 response.start_transfer, response.total);
    return response;
}

HttpResponse CURLHandler::post_stream(const std::string& uri, const std::string& body, StreamingResponse& resp) const {
    HttpResponse response;
    CURL* ephemeral = prepare(uri, body);
    curl_easy_setopt(ephemeral, CURLOPT_WRITEFUNCTION, write_cb_to_stream);
    curl_easy_setopt(ephemeral, CURLOPT_WRITEDATA, &resp);

    auto idx = Logger.set_start();
    resp.begin(std::chrono::high_resolution_clock::now());
    response.curl_code = curl_easy_perform(ephemeral);
    resp.finalize(std::chrono::high_resolution_clock::now());
    Logger.set_stop_and_display_time(idx, "e2e stream from server");
    read_timings(ephemeral, response);
    curl_easy_cleanup(ephemeral);

    Logger.debug("POST (stream) {} -> status={} chunks={} TTFB={}s Total={}s", uri, response.status,
                 resp.content_chunks(), response.start_transfer, response.total);
    return response;
}
