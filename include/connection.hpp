//
// Created by Sanger Steel on 7/2/25.
//

#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Protocol {
    Generate,   // Ollama-style /api/generate
    OpenAI,     // OpenAI-compatible /v1/completions
    Container,  // inference container, /v1/chat/completions
};

const char* to_string(Protocol protocol);

// Throws ConfigurationError for an unknown name.
Protocol protocol_from_string(std::string_view name);

std::string default_base_url(Protocol protocol);

// "nvcr.io/nim/meta/llama3-8b-instruct:1.0" -> "meta/llama3-8b-instruct"
std::string model_path_from_image(const std::string& image);

struct BackendEntry {
    std::string name;
    Protocol protocol = Protocol::Generate;
    std::string base_url;
    std::string model;
    std::string image;
    std::string api_key_env;
};

struct ConnectionInfo {
    std::string target;
    std::string base_url;
    Protocol protocol = Protocol::Generate;
    std::string model;
    std::optional<std::string> api_key = std::nullopt;
};

class ConnectionResolver {
public:
    virtual ~ConnectionResolver() = default;

    // Throws ConfigurationError when the target is unknown.
    virtual ConnectionInfo resolve(const std::string& target) = 0;
};

class StaticConnectionResolver final : public ConnectionResolver {
public:
    explicit StaticConnectionResolver(std::vector<BackendEntry> entries);

    ConnectionInfo resolve(const std::string& target) override;

    std::vector<std::string> targets() const;

private:
    std::map<std::string, BackendEntry> backends;
};
