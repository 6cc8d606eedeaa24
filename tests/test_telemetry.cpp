//
// Created by Sanger Steel on 7/3/25.
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <sstream>
#include <thread>
#include "errors.hpp"
#include "logger.hpp"
#include "telemetry.hpp"

using Catch::Matchers::WithinAbs;

namespace {

class FakeProbe final : public HardwareProbe {
public:
    std::vector<GpuReading> query_gpus() override {
        calls.fetch_add(1);
        if (fail.load()) {
            throw TelemetryError("nvidia-smi went away");
        }
        GpuReading gpu;
        gpu.index = 0;
        gpu.name = "Fake GPU";
        gpu.utilization = utilization.load();
        gpu.memory_used = 2048;
        gpu.memory_total = 8192;
        gpu.power_draw = 100;
        return {gpu};
    }

    CpuReading query_cpu() override {
        CpuReading cpu;
        cpu.core_count = 2;
        cpu.per_core_utilization = {10, 30};
        cpu.utilization = 20;
        return cpu;
    }

    std::atomic<bool> fail = false;
    std::atomic<double> utilization = 50;
    std::atomic<int> calls = 0;
};

}

TEST_CASE( "parse nvidia-smi csv" ) {
    auto gpus = parse_gpu_csv(
        "0, 87, 10240, 24576, 71, 245.31, 1980, NVIDIA GeForce RTX 4090\n"
        "1, [N/A], 512, 16384, 40, [N/A], 1410, NVIDIA A100, 16GB\n"
    );
    REQUIRE(gpus.size() == 2);
    REQUIRE(gpus[0].index == 0);
    REQUIRE(gpus[0].utilization == 87);
    REQUIRE_THAT(gpus[0].power_draw, WithinAbs(245.31, 1e-9));
    REQUIRE(gpus[0].name == "NVIDIA GeForce RTX 4090");

    REQUIRE(gpus[1].utilization == 0);
    REQUIRE(gpus[1].power_draw == 0);
    REQUIRE(gpus[1].name == "NVIDIA A100, 16GB");
}

TEST_CASE( "parse nvidia-smi csv rejects garbage" ) {
    REQUIRE(parse_gpu_csv("").empty());
    REQUIRE_THROWS_AS(parse_gpu_csv("0, 87, 1024\n"), TelemetryError);
    REQUIRE_THROWS_AS(parse_gpu_csv("0, lots, 1, 2, 3, 4, 5, GPU\n"), TelemetryError);
}

TEST_CASE( "per-core utilization from /proc/stat" ) {
    std::istringstream before_text(
        "cpu  200 0 200 1600 0 0 0 0 0 0\n"
        "cpu0 100 0 100 800 0 0 0 0 0 0\n"
        "cpu1 100 0 100 800 0 0 0 0 0 0\n"
        "intr 12345\n"
    );
    std::istringstream after_text(
        "cpu  350 0 250 1800 0 0 0 0 0 0\n"
        "cpu0 200 0 100 900 0 0 0 0 0 0\n"
        "cpu1 150 0 150 900 0 0 0 0 0 0\n"
    );
    auto before = parse_proc_stat(before_text);
    auto after = parse_proc_stat(after_text);
    REQUIRE(before.size() == 2);

    auto usage = cpu_utilization(before, after);
    REQUIRE(usage.size() == 2);
    REQUIRE_THAT(usage[0], WithinAbs(50.0, 1e-9));
    REQUIRE_THAT(usage[1], WithinAbs(50.0, 1e-9));

    // First reading has no baseline
    REQUIRE(cpu_utilization({}, after) == std::vector<double>{0, 0});
}

TEST_CASE( "malformed /proc/stat line" ) {
    std::istringstream text("cpu0 1 2 three\n");
    REQUIRE_THROWS_AS(parse_proc_stat(text), TelemetryError);
}

TEST_CASE( "first cpu query measures a real window" ) {
    // Two cores: 50% busy, then fully busy, between the two reads
    std::vector<std::vector<CpuTimes>> readings{
        {CpuTimes{100, 0, 0, 100}, CpuTimes{0, 0, 0, 200}},
        {CpuTimes{150, 0, 0, 150}, CpuTimes{100, 0, 0, 200}},
        {CpuTimes{150, 0, 0, 250}, CpuTimes{100, 0, 0, 300}},
    };
    size_t reads = 0;
    SystemProbe probe([&] { return readings.at(reads++); }, std::chrono::milliseconds(1));

    auto first = probe.query_cpu();
    REQUIRE(reads == 2);
    REQUIRE(first.core_count == 2);
    REQUIRE_THAT(first.per_core_utilization[0], WithinAbs(50.0, 1e-9));
    REQUIRE_THAT(first.per_core_utilization[1], WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(first.utilization, WithinAbs(75.0, 1e-9));

    // Later queries measure against the previous reading without waiting
    auto second = probe.query_cpu();
    REQUIRE(reads == 3);
    REQUIRE_THAT(second.utilization, WithinAbs(0.0, 1e-9));
}

TEST_CASE( "system hardware reader needs a cpu times source" ) {
    REQUIRE_THROWS_AS(SystemProbe(nullptr), ConfigurationError);
}

TEST_CASE( "sampler needs a probe" ) {
    REQUIRE_THROWS_AS(TelemetrySampler(nullptr), ConfigurationError);
}

TEST_CASE( "synchronous sample averages accelerators" ) {
    auto probe = std::make_shared<FakeProbe>();
    TelemetrySampler sampler(probe);
    auto snapshot = sampler.sample();
    REQUIRE_FALSE(snapshot.empty());
    REQUIRE(snapshot.gpus.size() == 1);
    REQUIRE(snapshot.avg_gpu_utilization == 50);
    REQUIRE(snapshot.power_draw == 100);
    REQUIRE(snapshot.cpu.core_count == 2);
    REQUIRE(sampler.peaks().gpu_utilization == 50);
    REQUIRE(snapshot.to_json()["gpu_metrics"].size() == 1);
}

TEST_CASE( "failed hardware query yields an empty snapshot" ) {
    auto probe = std::make_shared<FakeProbe>();
    probe->fail = true;
    TelemetrySampler sampler(probe);
    auto before = Logger.telemetry_failures.load();
    auto snapshot = sampler.sample();
    REQUIRE(snapshot.empty());
    REQUIRE(Logger.telemetry_failures.load() == before + 1);
}

TEST_CASE( "start and stop are idempotent" ) {
    auto probe = std::make_shared<FakeProbe>();
    TelemetrySampler sampler(probe);
    sampler.stop();
    REQUIRE_FALSE(sampler.is_running());

    sampler.start(std::chrono::milliseconds(10));
    sampler.start(std::chrono::milliseconds(10));
    REQUIRE(sampler.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    sampler.stop();
    sampler.stop();
    REQUIRE_FALSE(sampler.is_running());

    auto calls = probe->calls.load();
    REQUIRE(calls > 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    REQUIRE(probe->calls.load() == calls);
    REQUIRE(sampler.latest().has_value());
}

TEST_CASE( "loop derives throughput and tracks peaks" ) {
    auto probe = std::make_shared<FakeProbe>();
    TelemetrySampler sampler(probe);
    sampler.start(std::chrono::milliseconds(20));
    for (int i = 0; i < 5; ++i) {
        sampler.record_tokens(100);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    probe->utilization = 95;
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    sampler.stop();

    auto peak = sampler.peaks();
    REQUIRE(peak.total_tokens == 500);
    REQUIRE(peak.tokens_per_second > 0);
    REQUIRE(peak.gpu_utilization == 95);
    REQUIRE(peak.gpu_memory == 2048);

    int drained = 0;
    while (sampler.fetch_snapshot().state == RingState::SUCCESS) {
        drained++;
    }
    REQUIRE(drained > 0);
}

TEST_CASE( "history bounds buffered snapshots" ) {
    auto probe = std::make_shared<FakeProbe>();
    TelemetrySampler sampler(probe, 3);
    sampler.start(std::chrono::milliseconds(5));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    sampler.stop();

    int drained = 0;
    while (sampler.fetch_snapshot().state == RingState::SUCCESS) {
        drained++;
    }
    REQUIRE(drained <= 3);
}

TEST_CASE( "reset zeroes counters and peaks" ) {
    auto probe = std::make_shared<FakeProbe>();
    TelemetrySampler sampler(probe);
    sampler.start(std::chrono::milliseconds(10));
    sampler.record_tokens(250);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    sampler.stop();
    REQUIRE(sampler.peaks().total_tokens == 250);

    sampler.reset();
    auto peak = sampler.peaks();
    REQUIRE(peak.total_tokens == 0);
    REQUIRE(peak.tokens_per_second == 0);
    REQUIRE(peak.gpu_utilization == 0);
    REQUIRE(peak.gpu_memory == 0);
    REQUIRE_FALSE(sampler.latest().has_value());
    REQUIRE(sampler.fetch_snapshot().state == RingState::EMPTY);
}
