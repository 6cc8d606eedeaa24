//
// Created by Sanger Steel on 7/5/25.
//

#include "run_recorder.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::string_view run_prefix = "benchmark_";
constexpr std::string_view session_prefix = "autobenchmark_";
constexpr std::string_view json_suffix = ".json";
constexpr size_t compact_timestamp_width = 15;  // YYYYmmdd_HHMMSS

std::optional<int> id_from_filename(const std::string& filename) {
    if (!filename.starts_with(run_prefix) || !filename.ends_with(json_suffix)) {
        return std::nullopt;
    }
    auto digits = filename.substr(run_prefix.size(), filename.size() - run_prefix.size() - json_suffix.size());
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoi(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error(std::format("cannot open {}", path.string()));
    }
    return json::parse(in);
}

void ensure_directory(const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw ConfigurationError(std::format("cannot create {}: {}", directory.string(), ec.message()));
    }
}

}

void write_json_file(const fs::path& path, const json& j) {
    auto tmp = path;
    tmp += ".tmp";
    try {
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out.is_open()) {
                throw std::runtime_error(std::format("cannot write {}", tmp.string()));
            }
            out << j.dump(2) << '\n';
            if (!out.good()) {
                throw std::runtime_error(std::format("short write to {}", tmp.string()));
            }
        }
        fs::rename(tmp, path);
    } catch (...) {
        // A failed write leaves neither a partial target nor a stray temp file
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
}

json RunRecord::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["model_name"] = model_name;
    j["status"] = status;
    j["start_time"] = start_time;
    j["end_time"] = end_time;
    j["config"] = config;
    j["metrics"] = metrics;
    return j;
}

RunRecord RunRecord::from_json(const json& j) {
    RunRecord record;
    j.at("id").get_to(record.id);
    record.name = j.value("name", "");
    record.model_name = j.value("model_name", "");
    record.status = j.value("status", "completed");
    record.start_time = j.value("start_time", "");
    record.end_time = j.value("end_time", "");
    record.config = j.value("config", json::object());
    record.metrics = j.value("metrics", json::object());
    return record;
}

RunRecorder::RunRecorder(fs::path directory) : directory(std::move(directory)) {
    ensure_directory(this->directory);
    std::error_code ec;
    for (const auto& entry: fs::directory_iterator(this->directory, ec)) {
        auto id = id_from_filename(entry.path().filename().string());
        if (id.has_value()) {
            next_id = std::max(next_id, id.value() + 1);
        }
    }
    Logger.debug("Run records in {}, next id {}", this->directory.string(), next_id);
}

fs::path RunRecorder::path_for(int id) const {
    return directory / std::format("{}{}{}", run_prefix, id, json_suffix);
}

RunRecord RunRecorder::record(const std::string& name, const BenchmarkResult& result) {
    auto end = std::chrono::system_clock::now();
    auto start = end - std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(result.duration_seconds));

    RunRecord record;
    record.name = name;
    record.model_name = result.model_name;
    record.start_time = iso_timestamp(start);
    record.end_time = iso_timestamp(end);
    record.config = result.config.to_json();
    record.metrics = result.metrics_json();
    record.metrics["historical"] = json::array({result.final_snapshot.to_json()});

    std::lock_guard<std::mutex> lock(mu);
    record.id = next_id++;
    write_json_file(path_for(record.id), record.to_json());
    Logger.info("Saved run {} to {}", record.id, path_for(record.id).string());
    return record;
}

std::optional<RunRecord> RunRecorder::get(int id) {
    std::lock_guard<std::mutex> lock(mu);
    auto path = path_for(id);
    if (!fs::exists(path)) {
        return std::nullopt;
    }
    return RunRecord::from_json(read_json_file(path));
}

std::vector<RunRecord> RunRecorder::history() {
    std::lock_guard<std::mutex> lock(mu);
    std::vector<RunRecord> records;
    std::error_code ec;
    for (const auto& entry: fs::directory_iterator(directory, ec)) {
        if (!id_from_filename(entry.path().filename().string()).has_value()) {
            continue;
        }
        try {
            records.emplace_back(RunRecord::from_json(read_json_file(entry.path())));
        } catch (const std::exception& e) {
            Logger.warn("Skipping unreadable run record {}: {}", entry.path().string(), e.what());
        }
    }
    std::sort(records.begin(), records.end(), [](const RunRecord& a, const RunRecord& b) {
        return a.id > b.id;
    });
    return records;
}

AutoTuneArchive::AutoTuneArchive(fs::path directory) : directory(std::move(directory)) {
    ensure_directory(this->directory);
}

fs::path AutoTuneArchive::save(const json& session, const std::string& target, std::chrono::system_clock::time_point at) {
    std::lock_guard<std::mutex> lock(mu);
    auto path = directory / std::format("{}{}_{}{}", session_prefix, filename_safe(target), compact_timestamp(at), json_suffix);
    write_json_file(path, session);
    Logger.info("Saved auto-tune session to {}", path.string());
    return path;
}

std::vector<json> AutoTuneArchive::list() const {
    // Keyed by the timestamp embedded in the filename
    std::vector<std::pair<std::string, json>> found;
    std::error_code ec;
    for (const auto& entry: fs::directory_iterator(directory, ec)) {
        auto filename = entry.path().filename().string();
        if (!filename.starts_with(session_prefix) || !filename.ends_with(json_suffix)) {
            continue;
        }
        try {
            auto session = read_json_file(entry.path());
            if (!session.is_object()) {
                throw std::runtime_error("not a JSON object");
            }
            if (!session.contains("tests") || !session["tests"].is_array()) {
                session["tests"] = json::array();
            }
            session["filename"] = filename;
            auto stem = entry.path().stem().string();
            auto stamp = stem.size() >= compact_timestamp_width ? stem.substr(stem.size() - compact_timestamp_width) : stem;
            found.emplace_back(stamp, std::move(session));
        } catch (const std::exception& e) {
            Logger.warn("Skipping unreadable auto-tune session {}: {}", filename, e.what());
        }
    }
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second["filename"].template get<std::string>() > b.second["filename"].template get<std::string>();
    });

    std::vector<json> sessions;
    sessions.reserve(found.size());
    for (auto& [_, session]: found) {
        sessions.emplace_back(std::move(session));
    }
    return sessions;
}
