//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "completion_types.hpp"
#include "latency_metrics.hpp"

enum class StreamFraming {
    ServerSentEvents,   // "data: {...}\n\n" ... "data: [DONE]"
    NewlineDelimited,   // one JSON object per line
};

// Collects the chunks of one streamed response. Bytes arrive in arbitrary
// blocks; complete lines are parsed as they appear and every chunk that
// carries generated text is stamped with the arrival time of its block.
// Owned by the thread performing the request, not shared.
class StreamingResponse {
public:
    StreamingResponse(StreamFraming framing, CompletionParser parser);

    time_point start;

    void begin(time_point at);

    void push(std::string_view bytes, time_point arrived);

    // Parses a trailing line that was not newline-terminated.
    void finalize(time_point at);

    // Request start to first content-bearing chunk
    std::optional<double> ttft_ms() const;

    // Deltas between consecutive content-bearing chunks
    std::vector<double> inter_token_intervals_ms() const;

    double inter_token_ms() const;

    // Backend-reported count when one was seen, else one per content chunk
    long long token_count() const;

    size_t content_chunks() const {
        return content_stamps.size();
    }

    size_t malformed_chunks() const {
        return malformed;
    }

    bool saw_done() const {
        return done;
    }

    const std::string& text() const {
        return generated;
    }

    std::optional<double> backend_tokens_per_second() const {
        return backend_tps;
    }

    // First bytes of the body, for error reports
    const std::string& head_bytes() const {
        return head;
    }

private:
    void handle_line(std::string_view line, time_point arrived);

    void handle_payload(std::string_view payload, time_point arrived);

    StreamFraming framing;
    CompletionParser parser;
    std::string pending;
    std::string head;
    std::string generated;
    std::vector<time_point> content_stamps;
    std::optional<long long> reported_tokens = std::nullopt;
    std::optional<double> backend_tps = std::nullopt;
    size_t malformed = 0;
    bool done = false;
};
