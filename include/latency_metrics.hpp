//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <chrono>
#include <cstddef>
#include <vector>

using time_point = std::chrono::time_point<std::chrono::high_resolution_clock>;

inline double ms_between(time_point start, time_point end) {
    return std::chrono::duration<double, std::milli>(end - start).count();
}

inline double seconds_between(time_point start, time_point end) {
    return std::chrono::duration<double>(end - start).count();
}

// Index of the 95th percentile in a sorted list of n values: floor(0.95 * n),
// clamped to the last element so small n never reads past the end.
size_t p95_index(size_t n);

// Sorts a copy. Returns 0 for an empty list.
double p95(std::vector<double> values);

double mean(const std::vector<double>& values);

// Mean of consecutive deltas in ms. Needs at least two timestamps, else 0.
double mean_interval_ms(const std::vector<time_point>& stamps);

// Total tokens over elapsed seconds; 0 when no time has elapsed.
double throughput(long long tokens, double elapsed_seconds);
