//
// Created by Sanger Steel on 7/2/25.
//

#include "connection.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <format>

const char* to_string(Protocol protocol) {
    switch (protocol) {
        case Protocol::Generate: return "generate";
        case Protocol::OpenAI: return "openai";
        case Protocol::Container: return "container";
        default: return "unknown";
    }
}

Protocol protocol_from_string(std::string_view name) {
    std::string lowered(name);
    lower(lowered);
    if (lowered == "generate" || lowered == "ollama") return Protocol::Generate;
    if (lowered == "openai" || lowered == "vllm") return Protocol::OpenAI;
    if (lowered == "container" || lowered == "nim") return Protocol::Container;
    throw ConfigurationError(std::format("unknown backend protocol '{}'", name));
}

std::string default_base_url(Protocol protocol) {
    switch (protocol) {
        case Protocol::Generate: return "http://localhost:11434";
        case Protocol::OpenAI:
        case Protocol::Container:
        default: return "http://localhost:8000";
    }
}

std::string model_path_from_image(const std::string& image) {
    auto parts = split(image, '/');
    auto name = parts.back();
    auto tag_at = name.find(':');
    if (tag_at != std::string::npos) {
        name = name.substr(0, tag_at);
    }
    if (parts.size() < 2) {
        return name;
    }
    return std::format("{}/{}", parts[parts.size() - 2], name);
}

StaticConnectionResolver::StaticConnectionResolver(std::vector<BackendEntry> entries) {
    for (auto& entry: entries) {
        if (entry.name.empty()) {
            throw ConfigurationError("backend entry without a name");
        }
        if (entry.base_url.empty()) {
            entry.base_url = default_base_url(entry.protocol);
        }
        while (!entry.base_url.empty() && entry.base_url.back() == '/') {
            entry.base_url.pop_back();
        }
        if (entry.model.empty() && !entry.image.empty()) {
            entry.model = model_path_from_image(entry.image);
        }
        if (entry.model.empty()) {
            throw ConfigurationError(std::format("backend '{}' needs a model or an image", entry.name));
        }
        auto name = entry.name;
        if (!backends.emplace(name, std::move(entry)).second) {
            throw ConfigurationError(std::format("backend '{}' is defined twice", name));
        }
    }
}

ConnectionInfo StaticConnectionResolver::resolve(const std::string& target) {
    auto found = backends.find(target);
    if (found == backends.end()) {
        throw ConfigurationError(std::format("unknown target '{}'", target));
    }
    const auto& entry = found->second;
    ConnectionInfo info;
    info.target = entry.name;
    info.base_url = entry.base_url;
    info.protocol = entry.protocol;
    info.model = entry.model;
    if (!entry.api_key_env.empty()) {
        if (const char* key = std::getenv(entry.api_key_env.c_str())) {
            info.api_key = std::string(key);
        } else {
            Logger.warn("API key variable {} is not set for target {}", entry.api_key_env, target);
        }
    }
    return info;
}

std::vector<std::string> StaticConnectionResolver::targets() const {
    std::vector<std::string> names;
    for (const auto& [name, _]: backends) {
        names.emplace_back(name);
    }
    return names;
}
