//
// Created by Sanger Steel on 6/6/25.
//

#include "streaming_response.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace {

constexpr std::string_view data_token = "data:";
constexpr std::string_view done_token = "[DONE]";
constexpr size_t max_head_bytes = 512;

}

StreamingResponse::StreamingResponse(StreamFraming framing, CompletionParser parser)
    : start(std::chrono::high_resolution_clock::now()), framing(framing), parser(std::move(parser)) {
}

void StreamingResponse::begin(time_point at) {
    start = at;
}

void StreamingResponse::push(std::string_view bytes, time_point arrived) {
    if (head.size() < max_head_bytes) {
        head.append(bytes.substr(0, max_head_bytes - head.size()));
    }
    pending.append(bytes);

    size_t line_start = 0;
    while (true) {
        auto newline = pending.find('\n', line_start);
        if (newline == std::string::npos) {
            break;
        }
        handle_line(std::string_view(pending).substr(line_start, newline - line_start), arrived);
        line_start = newline + 1;
    }
    pending.erase(0, line_start);
}

void StreamingResponse::finalize(time_point at) {
    if (!pending.empty()) {
        auto rest = std::move(pending);
        pending.clear();
        handle_line(rest, at);
    }
}

void StreamingResponse::handle_line(std::string_view line, time_point arrived) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return;
    }
    if (framing == StreamFraming::ServerSentEvents) {
        // Only data fields carry chunks; event names, ids and ":" comments are skipped
        if (!line.starts_with(data_token)) {
            return;
        }
        line.remove_prefix(data_token.size());
        if (!line.empty() && line.front() == ' ') {
            line.remove_prefix(1);
        }
        if (line == done_token) {
            done = true;
            return;
        }
    }
    handle_payload(line, arrived);
}

void StreamingResponse::handle_payload(std::string_view payload, time_point arrived) {
    CompletionResults chunk;
    try {
        chunk = parser(json::parse(payload));
    } catch (const json::exception& e) {
        malformed++;
        Logger.malformed_chunks.fetch_add(1, std::memory_order_relaxed);
        Logger.debug("Skipping malformed chunk ({}): {}", e.what(), trim_copy(payload));
        return;
    } catch (const RequestError& e) {
        malformed++;
        Logger.malformed_chunks.fetch_add(1, std::memory_order_relaxed);
        Logger.debug("Skipping malformed chunk ({}): {}", e.what(), trim_copy(payload));
        return;
    }

    if (chunk.has_content()) {
        content_stamps.emplace_back(arrived);
        generated += chunk.text;
    }
    if (chunk.reported_tokens.has_value()) {
        reported_tokens = chunk.reported_tokens;
    }
    if (chunk.backend_tokens_per_second.has_value()) {
        backend_tps = chunk.backend_tokens_per_second;
    }
    if (chunk.done) {
        done = true;
    }
}

std::optional<double> StreamingResponse::ttft_ms() const {
    if (content_stamps.empty()) {
        return std::nullopt;
    }
    return ms_between(start, content_stamps.front());
}

std::vector<double> StreamingResponse::inter_token_intervals_ms() const {
    std::vector<double> intervals;
    if (content_stamps.size() < 2) {
        return intervals;
    }
    intervals.reserve(content_stamps.size() - 1);
    for (size_t i = 1; i < content_stamps.size(); ++i) {
        intervals.emplace_back(ms_between(content_stamps[i - 1], content_stamps[i]));
    }
    return intervals;
}

double StreamingResponse::inter_token_ms() const {
    return mean_interval_ms(content_stamps);
}

long long StreamingResponse::token_count() const {
    if (reported_tokens.has_value()) {
        return reported_tokens.value();
    }
    return static_cast<long long>(content_stamps.size());
}
