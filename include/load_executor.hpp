//
// Created by Sanger Steel on 7/4/25.
//

#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <vector>
#include "connection.hpp"
#include "drivers/request_driver.hpp"
#include "progress.hpp"
#include "request_parameters.hpp"
#include "result_types.hpp"
#include "ring_buffers.hpp"
#include "telemetry.hpp"

namespace ExecutorConstants {
    // 2 samples/sec
    static constexpr std::chrono::milliseconds SamplingInterval{500};
}

struct ExecutorSettings {
    std::chrono::milliseconds sampling_interval = ExecutorConstants::SamplingInterval;
};

using SampleBuffer = MPSCRingBuffer<RequestSample, SampleRingBufferMaxSize>;

// Runs one benchmark configuration to completion.
class BenchmarkRunner {
public:
    virtual ~BenchmarkRunner() = default;

    // Throws RunError when no request succeeded.
    virtual BenchmarkResult run(const BenchmarkConfig& config, const ConnectionInfo& connection) = 0;
};

// Aggregates samples in completion order. Only touched by the collector thread.
struct SampleAccumulator {
    int successes = 0;
    int failures = 0;
    long long tokens = 0;
    std::vector<double> latencies_ms;
    std::vector<double> ttfts_ms;
    std::vector<double> inter_token_ms;
    double best_backend_tps = 0;
    double peak_wall_tps = 0;

    void add(const RequestSample& sample);

    int completed() const {
        return successes + failures;
    }
};

class LoadExecutor final : public BenchmarkRunner {
public:
    LoadExecutor(
        std::shared_ptr<TelemetrySampler> sampler,
        DriverFactory driver_factory,
        SharedProgress progress = nullptr,
        ExecutorSettings settings = {}
    );

    BenchmarkResult run(const BenchmarkConfig& config, const ConnectionInfo& connection) override;

private:
    // min(concurrency, total) workers pulling request ids off a shared counter
    void run_concurrent(const BenchmarkConfig& config, const ConnectionInfo& connection,
                        RequestDriver& driver, SampleBuffer& samples);

    // Consecutive batches; a batch starts once every request of the previous one returned
    void run_batched(const BenchmarkConfig& config, const ConnectionInfo& connection,
                     RequestDriver& driver, SampleBuffer& samples);

    void issue(const BenchmarkConfig& config, const ConnectionInfo& connection,
               RequestDriver& driver, SampleBuffer& samples);

    void collect(const BenchmarkConfig& config, SampleBuffer& samples, SampleAccumulator& acc,
                 const std::atomic<bool>& producers_done, time_point started);

    BenchmarkResult reduce(const BenchmarkConfig& config, const ConnectionInfo& connection,
                           SampleAccumulator& acc, double elapsed_seconds);

    std::shared_ptr<TelemetrySampler> sampler;
    DriverFactory driver_factory;
    SharedProgress progress;
    ExecutorSettings settings;
};
