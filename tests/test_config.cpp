//
// Created by Sanger Steel on 7/7/25.
//

#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "errors.hpp"

TEST_CASE( "empty config keeps defaults" ) {
    auto config = parse_config(YAML::Load(""));
    REQUIRE_FALSE(config.log_level.has_value());
    REQUIRE(config.results_dir == "benchmarks");
    REQUIRE(config.autotune_dir == "autobenchmark_results");
    REQUIRE(config.request_timeout_s == CURLHandler::BenchmarkTimeoutSeconds);
    REQUIRE(config.telemetry.interval == ExecutorConstants::SamplingInterval);
    REQUIRE(config.backends.empty());
    REQUIRE(config.benchmark.total_requests == 10);
    REQUIRE(config.autotune.min_acceptable_tps == 12.0);
}

TEST_CASE( "full config" ) {
    auto config = parse_config(YAML::Load(R"(
log_level: warn
results_dir: /tmp/runs
request_timeout_s: 30
telemetry:
  interval_ms: 250
  history: 20
backends:
  - name: local
    protocol: ollama
    model: llama3
  - name: nim
    protocol: container
    base_url: http://gpu-box:8000/
    image: nvcr.io/nim/meta/llama3-8b-instruct:1.0
    api_key_env: NGC_API_KEY
benchmark:
  target: local
  prompt: Tell me a story
  total_requests: 40
  concurrency: 8
  stream: true
  max_tokens: 256
  temperature: 0.2
  context_size: 4096
autotune:
  min_acceptable_tps: 20
  near_best_band: 0.05
  concurrency_steps: [1, 4, 16]
)"));

    REQUIRE(config.log_level.value() == WARN);
    REQUIRE(config.results_dir == "/tmp/runs");
    REQUIRE(config.request_timeout_s == 30);
    REQUIRE(config.telemetry.interval == std::chrono::milliseconds(250));
    REQUIRE(config.telemetry.history == 20);

    REQUIRE(config.backends.size() == 2);
    REQUIRE(config.backends[0].protocol == Protocol::Generate);
    REQUIRE(config.backends[1].protocol == Protocol::Container);
    REQUIRE(config.backends[1].api_key_env == "NGC_API_KEY");

    REQUIRE(config.benchmark.target == "local");
    REQUIRE(config.benchmark.total_requests == 40);
    REQUIRE(config.benchmark.concurrency == 8);
    REQUIRE(config.benchmark.stream);
    REQUIRE(config.benchmark.max_tokens.value() == 256);
    REQUIRE(config.benchmark.sampling.temperature == 0.2f);
    REQUIRE(config.benchmark.context_size.value() == 4096);

    REQUIRE(config.autotune.min_acceptable_tps == 20);
    REQUIRE(config.autotune.near_best_band == 0.05);
    REQUIRE(config.autotune.concurrency_steps == std::vector<int>{1, 4, 16});
    // Untouched settings keep their defaults
    REQUIRE(config.autotune.batch_sizes == std::vector<int>{1, 2, 4, 8});

    StaticConnectionResolver resolver(config.backends);
    REQUIRE(resolver.resolve("nim").base_url == "http://gpu-box:8000");
    REQUIRE(resolver.resolve("nim").model == "meta/llama3-8b-instruct");
}

TEST_CASE( "auto context size and unbounded generation" ) {
    auto config = parse_config(YAML::Load(R"(
benchmark:
  max_tokens: ~
  context_size: Auto
)"));
    REQUIRE_FALSE(config.benchmark.max_tokens.has_value());
    REQUIRE_FALSE(config.benchmark.context_size.has_value());
}

TEST_CASE( "bad values are configuration errors" ) {
    REQUIRE_THROWS_AS(parse_config(YAML::Load("[1, 2, 3]")), ConfigurationError);
    REQUIRE_THROWS_AS(parse_config(YAML::Load("log_level: chatty")), ConfigurationError);
    REQUIRE_THROWS_AS(parse_config(YAML::Load("request_timeout_s: 0")), ConfigurationError);
    REQUIRE_THROWS_AS(parse_config(YAML::Load("telemetry: {interval_ms: -5}")), ConfigurationError);
    REQUIRE_THROWS_AS(parse_config(YAML::Load("benchmark: {concurrency: lots}")), ConfigurationError);
    REQUIRE_THROWS_AS(parse_config(YAML::Load("backends: [{name: x, protocol: grpc, model: m}]")), ConfigurationError);
    REQUIRE_THROWS_AS(parse_config(YAML::Load("autotune: {near_best_band: 2}")), ConfigurationError);
    REQUIRE_THROWS_AS(parse_config(YAML::Load("benchmark: {context_size: big}")), ConfigurationError);
}

TEST_CASE( "missing file is a configuration error" ) {
    REQUIRE_THROWS_AS(load_config("/nonexistent/tokenbench.yaml"), ConfigurationError);
}
