//
// Created by Sanger Steel on 5/23/25.
//

#include "utils.hpp"
#include "latency_metrics.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <numeric>


// These trimming functions are from:
// https://stackoverflow.com/a/25385766/8825740
const char* ws = " \t\n\r\f\v";

inline std::string& rtrim(std::string& s, const char* t = ws) {
    s.erase(s.find_last_not_of(t) + 1);
    return s;
}

inline std::string& ltrim(std::string& s, const char* t = ws) {
    s.erase(0, s.find_first_not_of(t));
    return s;
}

std::string& trim(std::string& s) {
    return ltrim(rtrim(s, ws), ws);
}

std::string trim_copy(std::string_view s) {
    std::string copy(s);
    trim(copy);
    return copy;
}

void lower(std::string& to_lower) {
    for (auto& c: to_lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

long long count_whitespace_tokens(std::string_view text) {
    long long tokens = 0;
    bool in_word = false;
    for (char c: text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            tokens++;
        }
    }
    return tokens;
}

std::vector<std::string> split(const std::string& str, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = str.find(sep, start);
        if (pos == std::string::npos) {
            parts.emplace_back(str.substr(start));
            break;
        }
        parts.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& strings, const std::string& sep) {
    std::string output;
    size_t num_strings = strings.size();
    for (size_t i = 0; i < num_strings; ++i) {
        output += strings[i];
        if (i != num_strings - 1) {
            output += sep;
        }
    }
    return output;
}

std::string iso_timestamp(std::chrono::system_clock::time_point when) {
    auto truncated = std::chrono::floor<std::chrono::microseconds>(when);
    return std::format("{:%FT%T}", truncated);
}

std::string compact_timestamp(std::chrono::system_clock::time_point when) {
    auto truncated = std::chrono::floor<std::chrono::seconds>(when);
    return std::format("{:%Y%m%d_%H%M%S}", truncated);
}

std::string filename_safe(std::string_view name) {
    std::string out(name);
    for (auto& c: out) {
        if (c == '/' || c == ':' || c == ' ' || c == '\\') {
            c = '_';
        }
    }
    return out;
}

size_t p95_index(size_t n) {
    if (n == 0) {
        return 0;
    }
    auto idx = static_cast<size_t>(std::floor(0.95 * static_cast<double>(n)));
    return std::min(idx, n - 1);
}

double p95(std::vector<double> values) {
    if (values.empty()) {
        return 0;
    }
    std::sort(values.begin(), values.end());
    return values[p95_index(values.size())];
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double mean_interval_ms(const std::vector<time_point>& stamps) {
    if (stamps.size() < 2) {
        return 0;
    }
    double sum = 0;
    for (size_t i = 1; i < stamps.size(); ++i) {
        sum += ms_between(stamps[i - 1], stamps[i]);
    }
    return sum / static_cast<double>(stamps.size() - 1);
}

double throughput(long long tokens, double elapsed_seconds) {
    if (elapsed_seconds <= 0) {
        return 0;
    }
    return static_cast<double>(tokens) / elapsed_seconds;
}
