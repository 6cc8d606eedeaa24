//
// Created by Sanger Steel on 5/23/25.
//

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <thread>
#include <vector>
#include "connection.hpp"
#include "errors.hpp"
#include "latency_metrics.hpp"
#include "logger.hpp"
#include "request_parameters.hpp"
#include "ring_buffers.hpp"
#include "utils.hpp"

const std::string filename = "stdout";
LoggingContext Logger(filename, DEBUG);

using Catch::Matchers::WithinAbs;


TEST_CASE( "trim and lower" ) {
    std::string s = "  \tOllama \n";
    trim(s);
    REQUIRE(s == "Ollama");
    lower(s);
    REQUIRE(s == "ollama");
    REQUIRE(trim_copy("   ") == "");
}

TEST_CASE( "whitespace token estimate" ) {
    REQUIRE(count_whitespace_tokens("") == 0);
    REQUIRE(count_whitespace_tokens("   ") == 0);
    REQUIRE(count_whitespace_tokens("the quick  brown\nfox") == 4);
}

TEST_CASE( "split and join" ) {
    auto parts = split("a/b//c", '/');
    REQUIRE(parts == std::vector<std::string>{"a", "b", "", "c"});
    REQUIRE(join({"1", "2", "3"}) == "1, 2, 3");
    REQUIRE(join({}, "-") == "");
}

TEST_CASE( "filename_safe replaces separators" ) {
    REQUIRE(filename_safe("meta/llama3:8b instruct") == "meta_llama3_8b_instruct");
}

TEST_CASE( "p95 picks floor(0.95 n), clamped to the last element" ) {
    std::vector<double> latencies{100, 90, 80, 70, 60, 50, 40, 30, 20, 10};
    REQUIRE(p95_index(10) == 9);
    REQUIRE(p95(latencies) == 100);

    std::vector<double> twenty;
    for (int i = 1; i <= 20; ++i) {
        twenty.push_back(i);
    }
    REQUIRE(p95_index(20) == 19);
    REQUIRE(p95(twenty) == 20);

    REQUIRE(p95_index(1) == 0);
    REQUIRE(p95({}) == 0);
}

TEST_CASE( "throughput and means" ) {
    REQUIRE(throughput(100, 0) == 0);
    REQUIRE_THAT(throughput(100, 2.0), WithinAbs(50.0, 1e-9));
    REQUIRE(mean({}) == 0);
    REQUIRE_THAT(mean({1, 2, 3}), WithinAbs(2.0, 1e-9));

    auto t0 = std::chrono::high_resolution_clock::now();
    std::vector<time_point> stamps{t0, t0 + std::chrono::milliseconds(10), t0 + std::chrono::milliseconds(30)};
    REQUIRE_THAT(mean_interval_ms(stamps), WithinAbs(15.0, 1e-6));
    REQUIRE(mean_interval_ms({t0}) == 0);
}

TEST_CASE( "ring buffer reports FULL at capacity" ) {
    MPSCRingBuffer<int, 4> ring;
    REQUIRE(ring.is_empty());
    REQUIRE(ring.capacity() == 3);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(ring.push(i) == RingState::SUCCESS);
    }
    REQUIRE(ring.push(99) == RingState::FULL);
    REQUIRE(ring.size() == 3);

    auto first = ring.fetch();
    REQUIRE(first.state == RingState::SUCCESS);
    REQUIRE(first.content.value() == 0);
    REQUIRE(ring.push(3) == RingState::SUCCESS);
}

TEST_CASE( "ring buffer delivers every item from many producers" ) {
    MPSCRingBuffer<int, 64> ring;
    constexpr int producers = 4;
    constexpr int per_producer = 500;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&ring, p] {
            for (int i = 0; i < per_producer; ++i) {
                ring.push_blocking(p * per_producer + i);
            }
        });
    }

    long long sum = 0;
    int received = 0;
    while (received < producers * per_producer) {
        auto result = ring.fetch();
        if (result.state == RingState::SUCCESS) {
            sum += result.content.value();
            received++;
        }
    }
    for (auto& t: threads) {
        t.join();
    }
    long long n = producers * per_producer;
    REQUIRE(sum == n * (n - 1) / 2);
    REQUIRE(ring.is_empty());
}

TEST_CASE( "protocol names" ) {
    REQUIRE(protocol_from_string("ollama") == Protocol::Generate);
    REQUIRE(protocol_from_string("vllm") == Protocol::OpenAI);
    REQUIRE(protocol_from_string("nim") == Protocol::Container);
    REQUIRE_THROWS_AS(protocol_from_string("grpc"), ConfigurationError);
}

TEST_CASE( "model path from container image" ) {
    REQUIRE(model_path_from_image("nvcr.io/nim/meta/llama3-8b-instruct:1.0") == "meta/llama3-8b-instruct");
    REQUIRE(model_path_from_image("llama3:latest") == "llama3");
}

TEST_CASE( "static resolver" ) {
    StaticConnectionResolver resolver({
        BackendEntry{"local", Protocol::Generate, "http://localhost:11434/", "llama3", "", ""},
        BackendEntry{"nim", Protocol::Container, "http://gpu-box:8000", "", "nvcr.io/nim/meta/llama3-8b-instruct:1.0", ""},
    });

    auto local = resolver.resolve("local");
    REQUIRE(local.base_url == "http://localhost:11434");
    REQUIRE(local.model == "llama3");
    REQUIRE_FALSE(local.api_key.has_value());

    auto nim = resolver.resolve("nim");
    REQUIRE(nim.protocol == Protocol::Container);
    REQUIRE(nim.model == "meta/llama3-8b-instruct");

    REQUIRE_THROWS_AS(resolver.resolve("missing"), ConfigurationError);
    REQUIRE(resolver.targets().size() == 2);
}

TEST_CASE( "resolver rejects bad entries" ) {
    REQUIRE_THROWS_AS(StaticConnectionResolver({BackendEntry{"x", Protocol::OpenAI, "", "", "", ""}}),
                      ConfigurationError);
    REQUIRE_THROWS_AS(StaticConnectionResolver({
        BackendEntry{"x", Protocol::OpenAI, "", "m", "", ""},
        BackendEntry{"x", Protocol::OpenAI, "", "m", "", ""},
    }), ConfigurationError);
}

TEST_CASE( "benchmark config validation" ) {
    BenchmarkConfig config;
    config.target = "local";
    config.prompt = "hello";
    REQUIRE_NOTHROW(validate(config));

    SECTION( "concurrency bounds" ) {
        config.concurrency = 0;
        REQUIRE_THROWS_AS(validate(config), ConfigurationError);
        config.concurrency = BenchmarkLimits::MaxConcurrency + 1;
        REQUIRE_THROWS_AS(validate(config), ConfigurationError);
    }
    SECTION( "batch size bounds" ) {
        config.batch_size = 0;
        REQUIRE_THROWS_AS(validate(config), ConfigurationError);
        config.batch_size = BenchmarkLimits::MaxConcurrency;
        REQUIRE_NOTHROW(validate(config));
        config.batch_size = 100000;
        REQUIRE_THROWS_AS(validate(config), ConfigurationError);
    }
    SECTION( "empty prompt" ) {
        config.prompt = "";
        REQUIRE_THROWS_AS(validate(config), ConfigurationError);
    }
    SECTION( "no requests" ) {
        config.total_requests = 0;
        REQUIRE_THROWS_AS(validate(config), ConfigurationError);
    }
    SECTION( "streaming disables batching" ) {
        config.batch_size = 4;
        REQUIRE(config.effective_batch_size() == 4);
        config.stream = true;
        REQUIRE(config.effective_batch_size() == 1);
    }
}

TEST_CASE( "benchmark config survives json" ) {
    BenchmarkConfig config;
    config.name = "n";
    config.target = "local";
    config.prompt = "p";
    config.concurrency = 8;
    config.max_tokens = std::nullopt;
    auto back = config_from_json(config.to_json());
    REQUIRE(back.concurrency == 8);
    REQUIRE_FALSE(back.max_tokens.has_value());
    REQUIRE(back.prompt == "p");
}
