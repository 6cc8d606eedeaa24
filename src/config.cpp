//
// Created by Sanger Steel on 7/7/25.
//

#include "config.hpp"
#include <format>
#include "errors.hpp"
#include "utils.hpp"

namespace {

template<typename T>
void read_if_present(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

BackendEntry parse_backend(const YAML::Node& node) {
    BackendEntry entry;
    entry.name = node["name"].as<std::string>();
    entry.protocol = protocol_from_string(node["protocol"].as<std::string>("generate"));
    read_if_present(node, "base_url", entry.base_url);
    read_if_present(node, "model", entry.model);
    read_if_present(node, "image", entry.image);
    read_if_present(node, "api_key_env", entry.api_key_env);
    return entry;
}

BenchmarkConfig parse_benchmark(const YAML::Node& node) {
    BenchmarkConfig config;
    read_if_present(node, "name", config.name);
    read_if_present(node, "target", config.target);
    read_if_present(node, "prompt", config.prompt);
    read_if_present(node, "total_requests", config.total_requests);
    read_if_present(node, "concurrency", config.concurrency);
    read_if_present(node, "stream", config.stream);
    read_if_present(node, "batch_size", config.batch_size);
    read_if_present(node, "temperature", config.sampling.temperature);
    read_if_present(node, "top_p", config.sampling.top_p);
    read_if_present(node, "top_k", config.sampling.top_k);
    if (node["max_tokens"]) {
        if (node["max_tokens"].IsNull()) {
            config.max_tokens = std::nullopt;
        } else {
            config.max_tokens = node["max_tokens"].as<int>();
        }
    }
    if (node["context_size"] && !node["context_size"].IsNull()) {
        auto raw = node["context_size"].as<std::string>();
        lower(raw);
        if (raw == "auto") {
            config.context_size = std::nullopt;
        } else {
            config.context_size = node["context_size"].as<int>();
        }
    }
    return config;
}

TunerSettings parse_autotune(const YAML::Node& node) {
    TunerSettings settings;
    read_if_present(node, "min_acceptable_tps", settings.min_acceptable_tps);
    read_if_present(node, "near_best_band", settings.near_best_band);
    read_if_present(node, "max_concurrency", settings.max_concurrency);
    read_if_present(node, "concurrency_steps", settings.concurrency_steps);
    read_if_present(node, "batch_sizes", settings.batch_sizes);
    read_if_present(node, "token_sizes", settings.token_sizes);
    read_if_present(node, "probe_token_sizes", settings.probe_token_sizes);
    read_if_present(node, "probe_requests", settings.probe_requests);
    read_if_present(node, "requests_per_test", settings.requests_per_test);
    read_if_present(node, "fallback_token_size", settings.fallback_token_size);
    settings.validate();
    return settings;
}

}

AppConfig parse_config(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigurationError("config root must be a mapping");
    }

    try {
        if (root["log_level"]) {
            config.log_level = log_level_from_string(root["log_level"].as<std::string>());
        }
        read_if_present(root, "results_dir", config.results_dir);
        read_if_present(root, "autotune_dir", config.autotune_dir);
        read_if_present(root, "request_timeout_s", config.request_timeout_s);

        if (auto telemetry = root["telemetry"]) {
            if (telemetry["interval_ms"]) {
                config.telemetry.interval = std::chrono::milliseconds(telemetry["interval_ms"].as<long>());
            }
            read_if_present(telemetry, "history", config.telemetry.history);
        }
        if (auto backends = root["backends"]) {
            for (const auto& backend: backends) {
                config.backends.emplace_back(parse_backend(backend));
            }
        }
        if (auto benchmark = root["benchmark"]) {
            config.benchmark = parse_benchmark(benchmark);
        }
        if (auto autotune = root["autotune"]) {
            config.autotune = parse_autotune(autotune);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::format("invalid config: {}", e.what()));
    }

    if (config.request_timeout_s <= 0) {
        throw ConfigurationError(std::format("request_timeout_s must be > 0, got {}", config.request_timeout_s));
    }
    if (config.telemetry.interval.count() <= 0) {
        throw ConfigurationError(std::format("telemetry.interval_ms must be > 0, got {}", config.telemetry.interval.count()));
    }
    if (config.telemetry.history == 0) {
        throw ConfigurationError("telemetry.history must be > 0");
    }
    return config;
}

AppConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::format("cannot load {}: {}", path, e.what()));
    }
    return parse_config(root);
}
