//
// Created by Sanger Steel on 6/8/25.
//

#include "completion_types.hpp"
#include "errors.hpp"

namespace {

std::optional<long long> usage_completion_tokens(const json& j) {
    if (!j.contains("usage") || !j["usage"].is_object()) {
        return std::nullopt;
    }
    const auto& usage = j["usage"];
    if (usage.contains("completion_tokens") && usage["completion_tokens"].is_number_integer()) {
        return usage["completion_tokens"].get<long long>();
    }
    return std::nullopt;
}

const json* first_choice(const json& j) {
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        return nullptr;
    }
    return &j["choices"][0];
}

void read_finish_reason(const json& choice, CompletionResults& results) {
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        choice.at("finish_reason").get_to(results.finish_reason);
        results.done = true;
    }
}

}

CompletionResults parse_generate_chunk(const json& j) {
    CompletionResults results;
    if (!j.is_object()) {
        throw RequestError("generate chunk is not a JSON object");
    }
    if (j.contains("response") && j["response"].is_string()) {
        j.at("response").get_to(results.text);
    }
    results.done = j.value("done", false);
    if (j.contains("eval_count") && j["eval_count"].is_number_integer()) {
        results.reported_tokens = j["eval_count"].get<long long>();
        if (j.contains("eval_duration") && j["eval_duration"].is_number()) {
            // Reported in nanoseconds
            auto eval_seconds = j["eval_duration"].get<double>() / 1'000'000'000.0;
            if (eval_seconds > 0) {
                results.backend_tokens_per_second =
                    static_cast<double>(results.reported_tokens.value()) / eval_seconds;
            }
        }
    }
    if (j.contains("done_reason") && j["done_reason"].is_string()) {
        j.at("done_reason").get_to(results.finish_reason);
    }
    return results;
}

CompletionResults parse_completion_chunk(const json& j) {
    CompletionResults results;
    if (!j.is_object()) {
        throw RequestError("completion chunk is not a JSON object");
    }
    if (const json* choice = first_choice(j)) {
        if (choice->contains("text") && (*choice)["text"].is_string()) {
            choice->at("text").get_to(results.text);
        }
        read_finish_reason(*choice, results);
    }
    results.reported_tokens = usage_completion_tokens(j);
    return results;
}

CompletionResults parse_chat_chunk(const json& j) {
    CompletionResults results;
    if (!j.is_object()) {
        throw RequestError("chat chunk is not a JSON object");
    }
    if (const json* choice = first_choice(j)) {
        for (const char* key: {"delta", "message"}) {
            if (choice->contains(key) && (*choice)[key].is_object()) {
                const auto& body = (*choice)[key];
                if (body.contains("content") && body["content"].is_string()) {
                    body.at("content").get_to(results.text);
                }
            }
        }
        read_finish_reason(*choice, results);
    }
    results.reported_tokens = usage_completion_tokens(j);
    return results;
}
