//
// Created by Sanger Steel on 7/7/25.
//

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "yaml-cpp/yaml.h"
#include "autotune/autotuner.hpp"
#include "connection.hpp"
#include "curl.hpp"
#include "logger.hpp"
#include "request_parameters.hpp"
#include "telemetry.hpp"

struct TelemetrySettings {
    std::chrono::milliseconds interval = ExecutorConstants::SamplingInterval;
    size_t history = TelemetrySampler::DefaultHistory;
};

struct AppConfig {
    std::optional<LogLevel> log_level = std::nullopt;
    std::string results_dir = "benchmarks";
    std::string autotune_dir = "autobenchmark_results";
    TelemetrySettings telemetry;
    long request_timeout_s = CURLHandler::BenchmarkTimeoutSeconds;
    std::vector<BackendEntry> backends;
    // Target and prompt may be left for the command line
    BenchmarkConfig benchmark;
    TunerSettings autotune;
};

// Throws ConfigurationError for unreadable YAML, wrong value types and out-of-range settings.
AppConfig load_config(const std::string& path);

AppConfig parse_config(const YAML::Node& root);
