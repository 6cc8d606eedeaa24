//
// Created by Sanger Steel on 5/20/25.
//

#include "result_types.hpp"
#include <format>

json BenchmarkResult::metrics_json() const {
    json j;
    j["tokens_per_second"] = tokens_per_second;
    j["peak_tps"] = peak_tokens_per_second;
    j["latency"] = latency_ms;
    j["p95_latency"] = p95_latency_ms;
    j["time_to_first_token"] = ttft_ms;
    j["inter_token_latency"] = inter_token_latency_ms;
    j["successful_requests"] = successful_requests;
    j["failed_requests"] = failed_requests;
    j["total_tokens"] = total_tokens;
    j["duration"] = duration_seconds;
    j["tokens_per_watt"] = tokens_per_watt;
    j["model_tokens_per_second"] = backend_tokens_per_second;
    j["stream"] = config.stream;
    j["batch_size"] = config.effective_batch_size();
    j["model_name"] = model_name;
    j["latencies"] = latencies_ms;
    j["peak_gpu_utilization"] = peaks.gpu_utilization;
    j["peak_gpu_memory"] = peaks.gpu_memory;
    j["gpu_metrics"] = final_snapshot.to_json()["gpu_metrics"];
    j["cpu_metrics"] = final_snapshot.cpu.to_json();
    return j;
}

json BenchmarkResult::to_json() const {
    json j;
    j["config"] = config.to_json();
    j["metrics"] = metrics_json();
    j["final_snapshot"] = final_snapshot.to_json();
    j["peaks"] = peaks.to_json();
    return j;
}

std::string BenchmarkResult::display() const {
    std::string str = "==========\nBENCHMARK RESULT\n";
    str += std::format("target: {} ({})\n", config.target, model_name);
    str += std::format("requests: {} ok, {} failed\n", successful_requests, failed_requests);
    str += std::format("tokens: {} in {:.2f}s\n", total_tokens, duration_seconds);
    str += std::format("throughput: {:.2f} tok/s (peak {:.2f})\n", tokens_per_second, peak_tokens_per_second);
    str += std::format("latency: mean {:.1f}ms, p95 {:.1f}ms\n", latency_ms, p95_latency_ms);
    str += std::format("ttft: {:.1f}ms, itl: {:.2f}ms\n", ttft_ms, inter_token_latency_ms);
    if (tokens_per_watt > 0) {
        str += std::format("tokens/watt: {:.3f}\n", tokens_per_watt);
    }
    str += "==========\n";
    return str;
}
