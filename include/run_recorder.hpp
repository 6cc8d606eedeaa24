//
// Created by Sanger Steel on 7/5/25.
//

#pragma once
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "result_types.hpp"

using json = nlohmann::json;

struct RunRecord {
    int id = 0;
    std::string name;
    std::string model_name;
    std::string status = "completed";
    std::string start_time;
    std::string end_time;
    json config;
    json metrics;

    json to_json() const;

    // Throws json::exception on a record missing required fields
    static RunRecord from_json(const json& j);
};

// Where finished runs go.
class ResultSink {
public:
    virtual ~ResultSink() = default;

    // Assigns the next id.
    virtual RunRecord record(const std::string& name, const BenchmarkResult& result) = 0;

    virtual std::optional<RunRecord> get(int id) = 0;

    // Most recent first
    virtual std::vector<RunRecord> history() = 0;
};

// One pretty-printed `benchmark_<id>.json` per run. Ids continue from the
// highest one already in the directory.
class RunRecorder final : public ResultSink {
public:
    explicit RunRecorder(std::filesystem::path directory);

    RunRecord record(const std::string& name, const BenchmarkResult& result) override;

    std::optional<RunRecord> get(int id) override;

    std::vector<RunRecord> history() override;

private:
    std::filesystem::path path_for(int id) const;

    std::filesystem::path directory;
    std::mutex mu;
    int next_id = 1;
};

// One `autobenchmark_<target>_<YYYYmmdd_HHMMSS>.json` per auto-tune session.
class AutoTuneArchive {
public:
    explicit AutoTuneArchive(std::filesystem::path directory);

    std::filesystem::path save(const json& session, const std::string& target,
                               std::chrono::system_clock::time_point at = std::chrono::system_clock::now());

    // Newest first. Unreadable files are logged and skipped.
    std::vector<json> list() const;

private:
    std::filesystem::path directory;
    std::mutex mu;
};

// Writes through a temporary file so readers never see a partial record.
void write_json_file(const std::filesystem::path& path, const json& j);
