//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>


using json = nlohmann::json;

// One parsed unit of a backend response: a stream chunk or a whole
// non-streaming body.
struct CompletionResults {
    std::string text;
    // Token count the backend itself reported, if any
    std::optional<long long> reported_tokens = std::nullopt;
    // Backend-side generation rate, when it reports generation time
    std::optional<double> backend_tokens_per_second = std::nullopt;
    std::string finish_reason;
    bool done = false;

    bool has_content() const {
        return !text.empty();
    }
};

using CompletionParser = std::function<CompletionResults(const json&)>;

// Ollama-style: {"response": "...", "done": bool, "eval_count": n, "eval_duration": ns}
CompletionResults parse_generate_chunk(const json& j);

// OpenAI completions: {"choices": [{"text": "...", "finish_reason": ...}], "usage": {"completion_tokens": n}}
CompletionResults parse_completion_chunk(const json& j);

// OpenAI chat completions, streamed (choices[0].delta.content) or whole (choices[0].message.content)
CompletionResults parse_chat_chunk(const json& j);
