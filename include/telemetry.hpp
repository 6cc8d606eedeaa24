//
// Created by Sanger Steel on 7/3/25.
//

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "latency_metrics.hpp"
#include "ring_buffers.hpp"

using json = nlohmann::json;

struct GpuReading {
    int index = 0;
    std::string name;
    double utilization = 0;   // %
    double memory_used = 0;   // MiB
    double memory_total = 0;  // MiB
    double temperature = 0;   // C
    double power_draw = 0;    // W
    double sm_clock = 0;      // MHz

    json to_json() const;
};

struct CpuReading {
    std::vector<double> per_core_utilization;  // %
    double utilization = 0;                    // mean over cores, %
    double frequency_mhz = 0;
    std::vector<double> temperatures;          // C
    int core_count = 0;

    json to_json() const;
};

struct TelemetrySnapshot {
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::vector<GpuReading> gpus;
    CpuReading cpu;
    double tokens_per_second = 0;
    double peak_tokens_per_second = 0;
    double avg_gpu_utilization = 0;
    double power_draw = 0;  // mean over accelerators, W

    // True when the hardware query for this tick failed
    bool empty() const {
        return gpus.empty() && cpu.core_count == 0;
    }

    json to_json() const;
};

struct PeakTelemetry {
    double tokens_per_second = 0;
    double gpu_utilization = 0;
    double gpu_memory = 0;
    long long total_tokens = 0;

    json to_json() const;
};

struct CpuTimes {
    uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
    uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
    uint64_t busy() const { return user + nice + system + irq + softirq + steal; }
};

// Parses `nvidia-smi --query-gpu=index,utilization.gpu,memory.used,memory.total,
// temperature.gpu,power.draw,clocks.sm,name --format=csv,nounits,noheader`.
// "[N/A]" fields read as 0. Throws TelemetryError on anything else unparseable.
std::vector<GpuReading> parse_gpu_csv(const std::string& csv);

// Per-core "cpuN" lines of /proc/stat, in order. The aggregate "cpu" line is skipped.
std::vector<CpuTimes> parse_proc_stat(std::istream& in);

// parse_proc_stat over the live /proc/stat. Throws TelemetryError when it cannot be read.
std::vector<CpuTimes> read_proc_stat();

// Busy share of each core between two /proc/stat readings, in %.
std::vector<double> cpu_utilization(const std::vector<CpuTimes>& before, const std::vector<CpuTimes>& after);

class HardwareProbe {
public:
    virtual ~HardwareProbe() = default;

    // Empty when the machine has no accelerators. Throws TelemetryError when the query fails.
    virtual std::vector<GpuReading> query_gpus() = 0;

    virtual CpuReading query_cpu() = 0;
};

// nvidia-smi for accelerators, /proc and /sys for the CPU.
class SystemProbe final : public HardwareProbe {
public:
    using CpuTimesSource = std::function<std::vector<CpuTimes>()>;

    static constexpr std::chrono::milliseconds BaselineWindow{200};

    // Without a previous reading, query_cpu takes one and waits
    // `baseline_window` before the measured read.
    explicit SystemProbe(CpuTimesSource cpu_times = read_proc_stat,
                         std::chrono::milliseconds baseline_window = BaselineWindow);

    std::vector<GpuReading> query_gpus() override;

    CpuReading query_cpu() override;

private:
    bool nvidia_smi_available;
    CpuTimesSource cpu_times;
    std::chrono::milliseconds baseline_window;
    std::mutex mu;
    std::vector<CpuTimes> last_cpu_times;
};

// Samples hardware on its own thread and keeps running token-throughput
// and utilization maxima for the current measurement session.
class TelemetrySampler {
public:
    static constexpr size_t DefaultHistory = 60;

    // `history` bounds the buffered snapshots, up to the ring capacity.
    explicit TelemetrySampler(std::shared_ptr<HardwareProbe> probe, size_t history = DefaultHistory);

    ~TelemetrySampler();

    TelemetrySampler(const TelemetrySampler&) = delete;
    TelemetrySampler& operator=(const TelemetrySampler&) = delete;

    // No-op while already running.
    void start(std::chrono::milliseconds interval);

    // No-op while stopped. Returns once the sampling thread has exited.
    void stop();

    bool is_running() const {
        return running.load(std::memory_order_acquire);
    }

    // One synchronous hardware query, independent of the loop.
    TelemetrySnapshot sample();

    void record_tokens(long long n);

    PeakTelemetry peaks();

    // Zeroes counters and peaks and drops buffered snapshots.
    void reset();

    std::optional<TelemetrySnapshot> latest();

    // Snapshots produced by the loop, oldest first. Bounded; the oldest is dropped when full.
    RingResult<TelemetrySnapshot> fetch_snapshot();

private:
    void sampling_loop(std::chrono::milliseconds interval);

    void tick();

    TelemetrySnapshot query_hardware();

    // Caller holds `mu`
    double derive_tokens_per_second(time_point now);

    // Caller holds `mu`
    void update_accelerator_peaks(const TelemetrySnapshot& snapshot);

    std::shared_ptr<HardwareProbe> probe;
    size_t history;

    std::mutex mu;
    long long tokens_count = 0;
    long long tokens_last_window = 0;
    time_point last_update;
    double current_tps = 0;
    double peak_tps = 0;
    double peak_gpu_util = 0;
    double peak_gpu_mem = 0;
    std::optional<TelemetrySnapshot> latest_snapshot;
    MPSCRingBuffer<TelemetrySnapshot, SnapshotRingBufferMaxSize> snapshots;

    std::mutex lifecycle_mu;
    std::mutex loop_mu;
    std::condition_variable wake;
    bool stop_requested = false;
    std::atomic<bool> running = false;
    std::thread worker;
};
