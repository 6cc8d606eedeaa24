//
// Created by Sanger Steel on 7/2/25.
//

#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Configuration,
    Request,
    Run,
    Telemetry,
    Conflict,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Request: return "request";
        case ErrorKind::Run: return "run";
        case ErrorKind::Telemetry: return "telemetry";
        case ErrorKind::Conflict: return "conflict";
        default: return "unknown";
    }
}

class BenchmarkError : public std::runtime_error {
public:
    BenchmarkError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Bad or missing input, rejected before any request is issued.
class ConfigurationError : public BenchmarkError {
public:
    explicit ConfigurationError(const std::string& message)
        : BenchmarkError(ErrorKind::Configuration, message) {}
};

// One request failed. Drivers turn this into a failed sample, it never escapes a run.
class RequestError : public BenchmarkError {
public:
    explicit RequestError(const std::string& message)
        : BenchmarkError(ErrorKind::Request, message) {}
};

// A run produced no usable measurement.
class RunError : public BenchmarkError {
public:
    explicit RunError(const std::string& message)
        : BenchmarkError(ErrorKind::Run, message) {}
};

class TelemetryError : public BenchmarkError {
public:
    explicit TelemetryError(const std::string& message)
        : BenchmarkError(ErrorKind::Telemetry, message) {}
};

class AlreadyRunningError : public BenchmarkError {
public:
    explicit AlreadyRunningError(const std::string& message)
        : BenchmarkError(ErrorKind::Conflict, message) {}
};
