//
// Created by Sanger Steel on 7/3/25.
//

#include "telemetry.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr size_t GpuCsvFields = 8;

const char* nvidia_smi_query =
    "timeout 5 nvidia-smi "
    "--query-gpu=index,utilization.gpu,memory.used,memory.total,temperature.gpu,power.draw,clocks.sm,name "
    "--format=csv,nounits,noheader 2>/dev/null";

bool on_path(const std::string& binary) {
    const char* path = std::getenv("PATH");
    if (!path) {
        return false;
    }
    for (const auto& dir: split(path, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::error_code ec;
        if (fs::exists(fs::path(dir) / binary, ec)) {
            return true;
        }
    }
    return false;
}

std::string popen_read_all(const char* cmd) {
    FILE* fp = popen(cmd, "r");
    if (!fp) {
        throw TelemetryError("popen failed");
    }
    std::string out;
    char buf[4096];
    while (true) {
        size_t n = fread(buf, 1, sizeof(buf), fp);
        if (n > 0) out.append(buf, n);
        if (n < sizeof(buf)) break;
    }
    int rc = pclose(fp);
    if (rc != 0) {
        throw TelemetryError(std::format("command exited with status {}: {}", rc, cmd));
    }
    return out;
}

double parse_field(const std::string& raw) {
    auto field = trim_copy(raw);
    if (field.empty() || field == "[N/A]" || field == "N/A" || field == "[Not Supported]") {
        return 0;
    }
    size_t consumed = 0;
    double value;
    try {
        value = std::stod(field, &consumed);
    } catch (const std::logic_error&) {
        throw TelemetryError(std::format("unparseable telemetry field '{}'", field));
    }
    if (consumed != field.size()) {
        throw TelemetryError(std::format("unparseable telemetry field '{}'", field));
    }
    return value;
}

double average_cpu_mhz() {
    std::ifstream cpuinfo("/proc/cpuinfo");
    if (!cpuinfo.is_open()) {
        return 0;
    }
    std::string line;
    double sum = 0;
    int count = 0;
    while (std::getline(cpuinfo, line)) {
        if (!line.starts_with("cpu MHz")) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        try {
            sum += std::stod(line.substr(colon + 1));
            count++;
        } catch (const std::logic_error&) {
            continue;
        }
    }
    return count > 0 ? sum / count : 0;
}

std::vector<double> cpu_temperatures() {
    std::vector<double> temps;
    std::error_code ec;
    fs::path hwmon_root("/sys/class/hwmon");
    if (!fs::exists(hwmon_root, ec)) {
        return temps;
    }
    for (const auto& hwmon: fs::directory_iterator(hwmon_root, ec)) {
        std::ifstream name_file(hwmon.path() / "name");
        std::string name;
        if (!(name_file >> name) || (name != "coretemp" && name != "k10temp")) {
            continue;
        }
        for (const auto& entry: fs::directory_iterator(hwmon.path(), ec)) {
            auto filename = entry.path().filename().string();
            if (!filename.starts_with("temp") || !filename.ends_with("_input")) {
                continue;
            }
            std::ifstream temp_file(entry.path());
            long millidegrees;
            if (temp_file >> millidegrees) {
                temps.emplace_back(static_cast<double>(millidegrees) / 1000.0);
            }
        }
    }
    return temps;
}

}

json GpuReading::to_json() const {
    json j;
    j["index"] = index;
    j["name"] = name;
    j["gpu_utilization"] = utilization;
    j["gpu_memory_used"] = memory_used;
    j["gpu_memory_total"] = memory_total;
    j["gpu_temp"] = temperature;
    j["power_draw"] = power_draw;
    j["sm_clock"] = sm_clock;
    return j;
}

json CpuReading::to_json() const {
    json j;
    j["utilization"] = per_core_utilization;
    j["average_utilization"] = utilization;
    j["frequency"] = frequency_mhz;
    j["temperature"] = temperatures;
    j["core_count"] = core_count;
    return j;
}

json TelemetrySnapshot::to_json() const {
    json j;
    j["timestamp"] = iso_timestamp(timestamp);
    j["gpu_metrics"] = json::array();
    for (const auto& gpu: gpus) {
        j["gpu_metrics"].emplace_back(gpu.to_json());
    }
    j["cpu_metrics"] = cpu.to_json();
    j["tokens_per_second"] = tokens_per_second;
    j["peak_tps"] = peak_tokens_per_second;
    j["avg_gpu_utilization"] = avg_gpu_utilization;
    j["power_draw"] = power_draw;
    return j;
}

json PeakTelemetry::to_json() const {
    json j;
    j["peak_tps"] = tokens_per_second;
    j["peak_gpu_utilization"] = gpu_utilization;
    j["peak_gpu_memory"] = gpu_memory;
    j["total_tokens"] = total_tokens;
    return j;
}

std::vector<GpuReading> parse_gpu_csv(const std::string& csv) {
    std::vector<GpuReading> gpus;
    std::istringstream lines(csv);
    std::string line;
    while (std::getline(lines, line)) {
        if (trim_copy(line).empty()) {
            continue;
        }
        auto fields = split(line, ',');
        if (fields.size() < GpuCsvFields) {
            throw TelemetryError(std::format("expected {} fields per GPU, got {}: {}", GpuCsvFields, fields.size(), line));
        }
        // GPU names may themselves contain commas
        std::vector<std::string> name_parts(fields.begin() + GpuCsvFields - 1, fields.end());

        GpuReading gpu;
        gpu.index = static_cast<int>(parse_field(fields[0]));
        gpu.utilization = parse_field(fields[1]);
        gpu.memory_used = parse_field(fields[2]);
        gpu.memory_total = parse_field(fields[3]);
        gpu.temperature = parse_field(fields[4]);
        gpu.power_draw = parse_field(fields[5]);
        gpu.sm_clock = parse_field(fields[6]);
        gpu.name = trim_copy(join(name_parts, ","));
        gpus.emplace_back(std::move(gpu));
    }
    return gpus;
}

std::vector<CpuTimes> parse_proc_stat(std::istream& in) {
    std::vector<CpuTimes> cores;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.starts_with("cpu")) {
            continue;
        }
        std::istringstream fields(line);
        std::string label;
        fields >> label;
        if (label == "cpu") {
            continue;
        }
        CpuTimes times;
        fields >> times.user >> times.nice >> times.system >> times.idle
               >> times.iowait >> times.irq >> times.softirq >> times.steal;
        if (fields.fail()) {
            throw TelemetryError(std::format("malformed /proc/stat line: {}", line));
        }
        cores.emplace_back(times);
    }
    return cores;
}

std::vector<double> cpu_utilization(const std::vector<CpuTimes>& before, const std::vector<CpuTimes>& after) {
    std::vector<double> usage(after.size(), 0.0);
    if (before.size() != after.size()) {
        return usage;
    }
    for (size_t i = 0; i < after.size(); ++i) {
        auto total = after[i].total() - before[i].total();
        auto busy = after[i].busy() - before[i].busy();
        if (after[i].total() > before[i].total() && total > 0) {
            usage[i] = 100.0 * static_cast<double>(busy) / static_cast<double>(total);
        }
    }
    return usage;
}

std::vector<CpuTimes> read_proc_stat() {
    std::ifstream stat("/proc/stat");
    if (!stat.is_open()) {
        throw TelemetryError("cannot open /proc/stat");
    }
    return parse_proc_stat(stat);
}

SystemProbe::SystemProbe(CpuTimesSource cpu_times, std::chrono::milliseconds baseline_window)
    : nvidia_smi_available(on_path("nvidia-smi")), cpu_times(std::move(cpu_times)), baseline_window(baseline_window) {
    if (!this->cpu_times) {
        throw ConfigurationError("system probe needs a CPU times source");
    }
    if (!nvidia_smi_available) {
        Logger.info("nvidia-smi not found on PATH, accelerator telemetry disabled");
    }
}

std::vector<GpuReading> SystemProbe::query_gpus() {
    if (!nvidia_smi_available) {
        return {};
    }
    return parse_gpu_csv(popen_read_all(nvidia_smi_query));
}

CpuReading SystemProbe::query_cpu() {
    CpuReading cpu;
    std::vector<CpuTimes> now;
    {
        std::lock_guard<std::mutex> lock(mu);
        if (last_cpu_times.empty()) {
            last_cpu_times = cpu_times();
            std::this_thread::sleep_for(baseline_window);
        }
        now = cpu_times();
        cpu.per_core_utilization = cpu_utilization(last_cpu_times, now);
        last_cpu_times = now;
    }
    cpu.utilization = mean(cpu.per_core_utilization);
    cpu.core_count = static_cast<int>(now.size());
    cpu.frequency_mhz = average_cpu_mhz();
    cpu.temperatures = cpu_temperatures();
    return cpu;
}

TelemetrySampler::TelemetrySampler(std::shared_ptr<HardwareProbe> probe, size_t history)
    : probe(std::move(probe)),
      history(std::clamp<size_t>(history, 1, decltype(snapshots)::capacity())),
      last_update(std::chrono::high_resolution_clock::now()) {
    if (!this->probe) {
        throw ConfigurationError("telemetry sampler needs a hardware probe");
    }
}

TelemetrySampler::~TelemetrySampler() {
    stop();
}

void TelemetrySampler::start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu);
    if (running.load(std::memory_order_acquire)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(loop_mu);
        stop_requested = false;
    }
    worker = std::thread(&TelemetrySampler::sampling_loop, this, interval);
    running.store(true, std::memory_order_release);
    Logger.debug("Telemetry sampling started every {} ms", interval.count());
}

void TelemetrySampler::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu);
    if (!running.load(std::memory_order_acquire)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(loop_mu);
        stop_requested = true;
    }
    wake.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    running.store(false, std::memory_order_release);
    Logger.debug("Telemetry sampling stopped");
}

void TelemetrySampler::sampling_loop(std::chrono::milliseconds interval) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(loop_mu);
            if (wake.wait_for(lock, interval, [this] { return stop_requested; })) {
                return;
            }
        }
        tick();
    }
}

TelemetrySnapshot TelemetrySampler::query_hardware() {
    TelemetrySnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    try {
        snapshot.gpus = probe->query_gpus();
        snapshot.cpu = probe->query_cpu();
    } catch (const std::exception& e) {
        Logger.telemetry_failures.fetch_add(1, std::memory_order_relaxed);
        Logger.warn("Telemetry query failed, recording an empty reading: {}", e.what());
        return TelemetrySnapshot{snapshot.timestamp};
    }
    if (!snapshot.gpus.empty()) {
        double util = 0;
        double power = 0;
        for (const auto& gpu: snapshot.gpus) {
            util += gpu.utilization;
            power += gpu.power_draw;
        }
        snapshot.avg_gpu_utilization = util / static_cast<double>(snapshot.gpus.size());
        snapshot.power_draw = power / static_cast<double>(snapshot.gpus.size());
    }
    return snapshot;
}

double TelemetrySampler::derive_tokens_per_second(time_point now) {
    auto window = seconds_between(last_update, now);
    if (window <= 0) {
        return current_tps;
    }
    current_tps = static_cast<double>(tokens_count - tokens_last_window) / window;
    tokens_last_window = tokens_count;
    last_update = now;
    peak_tps = std::max(peak_tps, current_tps);
    return current_tps;
}

void TelemetrySampler::update_accelerator_peaks(const TelemetrySnapshot& snapshot) {
    for (const auto& gpu: snapshot.gpus) {
        peak_gpu_util = std::max(peak_gpu_util, gpu.utilization);
        peak_gpu_mem = std::max(peak_gpu_mem, gpu.memory_used);
    }
}

void TelemetrySampler::tick() {
    // The hardware query is slow; only the bookkeeping happens under the lock
    auto snapshot = query_hardware();

    std::lock_guard<std::mutex> lock(mu);
    snapshot.tokens_per_second = derive_tokens_per_second(std::chrono::high_resolution_clock::now());
    snapshot.peak_tokens_per_second = peak_tps;
    update_accelerator_peaks(snapshot);
    latest_snapshot = snapshot;

    while (snapshots.size() >= history) {
        snapshots.fetch();
    }
    snapshots.push(std::move(snapshot));
}

TelemetrySnapshot TelemetrySampler::sample() {
    auto snapshot = query_hardware();

    std::lock_guard<std::mutex> lock(mu);
    snapshot.tokens_per_second = current_tps;
    snapshot.peak_tokens_per_second = peak_tps;
    update_accelerator_peaks(snapshot);
    return snapshot;
}

void TelemetrySampler::record_tokens(long long n) {
    std::lock_guard<std::mutex> lock(mu);
    tokens_count += n;
}

PeakTelemetry TelemetrySampler::peaks() {
    std::lock_guard<std::mutex> lock(mu);
    PeakTelemetry peak;
    peak.tokens_per_second = peak_tps;
    peak.gpu_utilization = peak_gpu_util;
    peak.gpu_memory = peak_gpu_mem;
    peak.total_tokens = tokens_count;
    return peak;
}

void TelemetrySampler::reset() {
    std::lock_guard<std::mutex> lock(mu);
    tokens_count = 0;
    tokens_last_window = 0;
    current_tps = 0;
    peak_tps = 0;
    peak_gpu_util = 0;
    peak_gpu_mem = 0;
    last_update = std::chrono::high_resolution_clock::now();
    latest_snapshot.reset();
    while (snapshots.fetch().state == RingState::SUCCESS) {
    }
}

std::optional<TelemetrySnapshot> TelemetrySampler::latest() {
    std::lock_guard<std::mutex> lock(mu);
    return latest_snapshot;
}

RingResult<TelemetrySnapshot> TelemetrySampler::fetch_snapshot() {
    return snapshots.fetch();
}
