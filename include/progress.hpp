//
// Created by Sanger Steel on 7/4/25.
//

#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct ProgressUpdate {
    std::string source;
    int completed = 0;
    int total = 0;
    double current_tps = 0;
    double eta_seconds = 0;
    std::string message;

    json to_json() const;
};

// elapsed / completed * remaining, 0 until something completed
double estimate_eta_seconds(double elapsed_seconds, int completed, int total);

// Fire-and-forget sink for progress. Implementations must not throw or block.
class ProgressChannel {
public:
    virtual ~ProgressChannel() = default;

    virtual void publish(const ProgressUpdate& update) noexcept = 0;
};

using SharedProgress = std::shared_ptr<ProgressChannel>;

class LoggingProgress final : public ProgressChannel {
public:
    void publish(const ProgressUpdate& update) noexcept override;
};

// Null channel means no subscriber.
void publish_progress(const SharedProgress& channel, const ProgressUpdate& update) noexcept;
