//
// Created by Sanger Steel on 7/4/25.
//

#include "load_executor.hpp"
#include <algorithm>
#include <format>
#include <system_error>
#include <thread>
#include "errors.hpp"
#include "logger.hpp"

namespace {

// Runs `body` on `n` threads and joins them. Threads already started are
// joined before a thread-creation failure surfaces as a RunError.
template<typename Body>
void run_workers(int n, const Body& body) {
    std::vector<std::thread> workers;
    workers.reserve(n);
    try {
        for (int i = 0; i < n; ++i) {
            workers.emplace_back(body);
        }
    } catch (const std::system_error& e) {
        for (auto& worker: workers) {
            worker.join();
        }
        throw RunError(std::format("Could not start worker {} of {}: {}", workers.size() + 1, n, e.what()));
    }
    for (auto& worker: workers) {
        worker.join();
    }
}

// Stops the sampler on every exit path of a run.
class SamplingSession {
public:
    SamplingSession(TelemetrySampler& sampler, std::chrono::milliseconds interval) : sampler(sampler) {
        sampler.reset();
        sampler.start(interval);
    }

    ~SamplingSession() {
        sampler.stop();
    }

    SamplingSession(const SamplingSession&) = delete;
    SamplingSession& operator=(const SamplingSession&) = delete;

private:
    TelemetrySampler& sampler;
};

}

void SampleAccumulator::add(const RequestSample& sample) {
    if (!sample.success) {
        failures++;
        return;
    }
    successes++;
    tokens += sample.tokens;
    latencies_ms.emplace_back(sample.latency_ms);
    if (sample.ttft_ms.has_value()) {
        ttfts_ms.emplace_back(sample.ttft_ms.value());
    }
    if (!sample.inter_token_ms.empty()) {
        inter_token_ms.emplace_back(mean(sample.inter_token_ms));
    }
    if (sample.backend_tokens_per_second.has_value()) {
        best_backend_tps = std::max(best_backend_tps, sample.backend_tokens_per_second.value());
    }
}

LoadExecutor::LoadExecutor(
    std::shared_ptr<TelemetrySampler> sampler,
    DriverFactory driver_factory,
    SharedProgress progress,
    ExecutorSettings settings
) : sampler(std::move(sampler)), driver_factory(std::move(driver_factory)),
    progress(std::move(progress)), settings(settings) {
    if (!this->sampler) {
        throw ConfigurationError("load executor needs a telemetry sampler");
    }
    if (!this->driver_factory) {
        throw ConfigurationError("load executor needs a driver factory");
    }
}

void LoadExecutor::issue(
    const BenchmarkConfig& config,
    const ConnectionInfo& connection,
    RequestDriver& driver,
    SampleBuffer& samples
) {
    RequestSample sample;
    try {
        sample = driver.drive(connection, config);
    } catch (const std::exception& e) {
        Logger.requests_failed.fetch_add(1, std::memory_order_relaxed);
        Logger.warn("Driver raised instead of reporting a failed sample: {}", e.what());
        sample = RequestSample::failure(e.what());
    }
    if (sample.success) {
        sampler->record_tokens(sample.tokens);
    }
    samples.push_blocking(std::move(sample));
}

void LoadExecutor::run_concurrent(
    const BenchmarkConfig& config,
    const ConnectionInfo& connection,
    RequestDriver& driver,
    SampleBuffer& samples
) {
    std::atomic<int> job_id = 0;
    int n_workers = std::min(config.concurrency, config.total_requests);
    Logger.debug("Launching {} workers for {} requests", n_workers, config.total_requests);

    run_workers(n_workers, [&] {
        while (job_id.fetch_add(1, std::memory_order_acq_rel) < config.total_requests) {
            issue(config, connection, driver, samples);
        }
    });
}

void LoadExecutor::run_batched(
    const BenchmarkConfig& config,
    const ConnectionInfo& connection,
    RequestDriver& driver,
    SampleBuffer& samples
) {
    int batch_size = config.effective_batch_size();
    int n_batches = (config.total_requests + batch_size - 1) / batch_size;
    Logger.info("Running {} batches with batch_size={}", n_batches, batch_size);

    for (int batch = 0; batch < n_batches; ++batch) {
        int first = batch * batch_size;
        int in_batch = std::min(batch_size, config.total_requests - first);

        run_workers(in_batch, [&] {
            issue(config, connection, driver, samples);
        });
        Logger.debug("Completed batch {}/{}", batch + 1, n_batches);
    }
}

void LoadExecutor::collect(
    const BenchmarkConfig& config,
    SampleBuffer& samples,
    SampleAccumulator& acc,
    const std::atomic<bool>& producers_done,
    time_point started
) {
    while (true) {
        auto fetched = samples.fetch();
        if (fetched.state != RingState::SUCCESS) {
            if (producers_done.load(std::memory_order_acquire) && samples.is_empty()) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        acc.add(fetched.content.value());

        auto elapsed = seconds_between(started, std::chrono::high_resolution_clock::now());
        double current_tps = throughput(acc.tokens, elapsed);
        acc.peak_wall_tps = std::max(acc.peak_wall_tps, current_tps);

        ProgressUpdate update;
        update.source = config.name.empty() ? config.target : config.name;
        update.completed = acc.completed();
        update.total = config.total_requests;
        update.current_tps = current_tps;
        update.eta_seconds = estimate_eta_seconds(elapsed, acc.completed(), config.total_requests);
        publish_progress(progress, update);
    }
}

BenchmarkResult LoadExecutor::run(const BenchmarkConfig& config, const ConnectionInfo& connection) {
    if (config.total_requests <= 0) {
        throw RunError(std::format("No successful requests completed: {} requests configured", config.total_requests));
    }
    validate(config);
    auto driver = driver_factory(connection);
    if (!driver) {
        throw ConfigurationError(std::format("no driver for target {}", connection.target));
    }

    Logger.info("Starting benchmark against {} ({}, {})", connection.target, to_string(connection.protocol),
                connection.base_url);
    Logger.debug("{}", config.to_str());

    SamplingSession session(*sampler, settings.sampling_interval);

    auto samples = std::make_unique<SampleBuffer>();
    SampleAccumulator acc;
    std::atomic<bool> producers_done = false;

    auto started = std::chrono::high_resolution_clock::now();
    std::thread collector([&] {
        collect(config, *samples, acc, producers_done, started);
    });

    try {
        if (config.effective_batch_size() > 1) {
            run_batched(config, connection, *driver, *samples);
        } else {
            run_concurrent(config, connection, *driver, *samples);
        }
    } catch (...) {
        producers_done.store(true, std::memory_order_release);
        collector.join();
        throw;
    }
    producers_done.store(true, std::memory_order_release);
    collector.join();

    auto elapsed = seconds_between(started, std::chrono::high_resolution_clock::now());

    if (acc.successes == 0) {
        throw RunError(std::format("No successful requests completed ({} failed)", acc.failures));
    }
    return reduce(config, connection, acc, elapsed);
}

BenchmarkResult LoadExecutor::reduce(
    const BenchmarkConfig& config,
    const ConnectionInfo& connection,
    SampleAccumulator& acc,
    double elapsed_seconds
) {
    BenchmarkResult result;
    result.config = config;
    result.model_name = connection.model;
    result.successful_requests = acc.successes;
    result.failed_requests = config.total_requests - acc.successes;
    result.total_tokens = acc.tokens;
    result.duration_seconds = elapsed_seconds;
    result.tokens_per_second = throughput(acc.tokens, elapsed_seconds);
    result.latency_ms = mean(acc.latencies_ms);
    result.p95_latency_ms = p95(acc.latencies_ms);
    result.ttft_ms = mean(acc.ttfts_ms);
    result.inter_token_latency_ms = mean(acc.inter_token_ms);
    result.backend_tokens_per_second = acc.best_backend_tps;
    result.latencies_ms = std::move(acc.latencies_ms);

    result.peaks = sampler->peaks();
    result.peak_tokens_per_second = std::max(result.peaks.tokens_per_second, acc.peak_wall_tps);
    result.final_snapshot = sampler->sample();

    double total_latency_s = 0;
    for (auto latency: result.latencies_ms) {
        total_latency_s += latency / 1000.0;
    }
    if (result.final_snapshot.power_draw > 0 && total_latency_s > 0) {
        result.tokens_per_watt = (static_cast<double>(result.total_tokens) / total_latency_s) / result.final_snapshot.power_draw;
    }

    Logger.info("Benchmark against {} finished: {} ok, {} failed, {:.2f} tok/s", connection.target,
                result.successful_requests, result.failed_requests, result.tokens_per_second);
    return result;
}
