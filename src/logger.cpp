//
// Created by Sanger Steel on 5/22/25.
//

#include "logger.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>

thread_local std::vector<time_point> AsyncLogger::time_starts;

const char* log_level_as_str(LogLevel level) {
    switch (level) {
        case NOTSET: return "NOTSET";
        case ERROR: return "ERROR";
        case WARN: return "WARN";
        case INFO: return "INFO";
        case DEBUG: return "DEBUG";
        default: return "INVALID";
    }
}

LogLevel log_level_from_string(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "error") return ERROR;
    if (lowered == "warn" || lowered == "warning") return WARN;
    if (lowered == "info") return INFO;
    if (lowered == "debug") return DEBUG;
    throw ConfigurationError(std::format("unknown log level '{}'", name));
}

AsyncLogger::AsyncLogger(const std::string& filename) : done(false) {
    if (filename == "stdout") {
        fd = STDOUT_FILENO;
    } else if (filename == "stderr") {
        fd = STDERR_FILENO;
    } else {
        fd = open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd == -1) {
            perror("open");
            exit(1);
        }
    }
    // Deploy logger thread
    logger = std::thread(&AsyncLogger::display_loop, this);
}

AsyncLogger::~AsyncLogger() { {
        std::lock_guard<std::mutex> lock(mu);
        done = true;
        ready_to_read = true;
    }
    cv.notify_one(); // Make sure the display loop isn't stuck waiting to be able to query `done`
    logger.join();
    if (fd != STDOUT_FILENO && fd != STDERR_FILENO) {
        close(fd);
    }
}

void AsyncLogger::write(std::string message) {
    messages.push_blocking(std::move(message));

    // Multiple producers (possible log writers), so ready_to_read can risk data races,
    // which is why it's atomic here
    ready_to_read.store(true, std::memory_order_release);
    cv.notify_one();
}

void AsyncLogger::drain() {
    while (true) {
        auto to_display = messages.fetch();
        if (to_display.state != RingState::SUCCESS) {
            return;
        }
        auto to_write = std::format("{}\n", to_display.content.value());
        ::write(fd, to_write.c_str(), to_write.size());
    }
}

void AsyncLogger::display_loop() {
    while (true) {
        bool finishing;
        {
            std::unique_lock<std::mutex> wait_response_lock(mu);
            // Writers notify without holding `mu`, so bound the wait to pick up a missed wakeup
            cv.wait_for(wait_response_lock, std::chrono::milliseconds(50), [this] {
                return ready_to_read.load(std::memory_order_acquire) || done;
            });
            ready_to_read.store(false, std::memory_order_release);
            finishing = done;
        }
        drain();
        if (finishing) {
            // Producers may have raced the shutdown flag
            drain();
            return;
        }
    }
}

LoggingContext::LoggingContext(const std::string& filename, LogLevel level) : level(level), logger(filename) {
}

void LoggingContext::emit(LogLevel at, std::string message) {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    logger.write(std::format("{:%F %T} {}: {}", now, log_level_as_str(at), message));
}

size_t LoggingContext::set_start() {
    if (enabled(DEBUG)) {
        if (logger.time_starts.size() > 10000) {
            logger.time_starts.clear();
            logger.time_starts.shrink_to_fit();
        }
        auto time_start = std::chrono::high_resolution_clock::now();
        logger.time_starts.emplace_back(time_start);
        return logger.time_starts.size() - 1;
    }
    return 0;
}

void LoggingContext::set_stop_and_display_time(size_t idx, const char* name) {
    if (enabled(DEBUG) && idx < logger.time_starts.size()) {
        auto end_minus_start = std::chrono::high_resolution_clock::now() - logger.time_starts[idx];
        auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(end_minus_start).count();
        debug("{} took {} s", name, duration);
    }
}

void LoggingContext::dump_debugging_state() {
    debug("requests sent: {}, failed: {}, malformed chunks skipped: {}, telemetry failures: {}",
          requests_sent.load(), requests_failed.load(), malformed_chunks.load(), telemetry_failures.load());
}
