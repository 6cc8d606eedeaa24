//
// Created by Sanger Steel on 5/22/25.
//

#pragma once
#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include "latency_metrics.hpp"
#include "ring_buffers.hpp"

enum LogLevel {
    NOTSET,
    ERROR,
    WARN,
    INFO,
    DEBUG,
};

const char* log_level_as_str(LogLevel level);

// Accepts "error", "warn", "info", "debug" (any case). Throws ConfigurationError otherwise.
LogLevel log_level_from_string(std::string_view name);

class AsyncLogger {
public:
    void display_loop();

    explicit AsyncLogger(const std::string& filename);

    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void write(std::string message);

    static thread_local std::vector<time_point> time_starts;

private:
    void drain();

    MPSCRingBuffer<std::string, LogRingBufferMaxSize> messages;
    int fd;
    std::condition_variable cv;
    std::mutex mu;
    bool done;
    std::atomic<bool> ready_to_read = false;
    std::thread logger;
};

struct LoggingContext {
    std::atomic<LogLevel> level;
    AsyncLogger logger;

    LoggingContext(const std::string& filename, LogLevel level);

    ~LoggingContext() = default;

    bool enabled(LogLevel at) const {
        return level.load(std::memory_order_relaxed) >= at;
    }

    void set_level(LogLevel new_level) {
        level.store(new_level, std::memory_order_relaxed);
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(DEBUG)) {
            emit(DEBUG, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(INFO)) {
            emit(INFO, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(WARN)) {
            emit(WARN, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        if (enabled(ERROR)) {
            emit(ERROR, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    size_t set_start();

    void set_stop_and_display_time(size_t id, const char* name);

    std::atomic<int> requests_sent = 0;

    std::atomic<int> requests_failed = 0;

    std::atomic<int> malformed_chunks = 0;

    std::atomic<int> telemetry_failures = 0;

    void dump_debugging_state();

private:
    void emit(LogLevel at, std::string message);
};


extern LoggingContext Logger;
