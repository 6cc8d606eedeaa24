//
// Created by Sanger Steel on 7/4/25.
//

#include "progress.hpp"
#include <exception>
#include "logger.hpp"

json ProgressUpdate::to_json() const {
    json j;
    j["source"] = source;
    j["completed"] = completed;
    j["total"] = total;
    j["current_tps"] = current_tps;
    j["eta"] = eta_seconds;
    j["message"] = message;
    return j;
}

double estimate_eta_seconds(double elapsed_seconds, int completed, int total) {
    if (completed <= 0 || total <= completed) {
        return 0;
    }
    return elapsed_seconds / completed * (total - completed);
}

void LoggingProgress::publish(const ProgressUpdate& update) noexcept {
    try {
        if (update.message.empty()) {
            Logger.info("[{}] {}/{} done, {:.2f} tok/s, eta {:.1f}s", update.source, update.completed,
                        update.total, update.current_tps, update.eta_seconds);
        } else {
            Logger.info("[{}] {}/{} {}", update.source, update.completed, update.total, update.message);
        }
    } catch (const std::exception& e) {
        Logger.error("Dropping progress update from {}: {}", update.source, e.what());
    }
}

void publish_progress(const SharedProgress& channel, const ProgressUpdate& update) noexcept {
    if (channel) {
        channel->publish(update);
    }
}
