//
// Created by Sanger Steel on 5/23/25.
//

#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

std::string& trim(std::string& s);

std::string trim_copy(std::string_view s);

void lower(std::string& to_lower);

// Naive token estimate used when a backend does not report a count.
long long count_whitespace_tokens(std::string_view text);

std::vector<std::string> split(const std::string& str, char sep);

std::string join(const std::vector<std::string>& strings, const std::string& sep = ", ");

std::string iso_timestamp(std::chrono::system_clock::time_point when);

// e.g. 20250714_153012, used in archive filenames
std::string compact_timestamp(std::chrono::system_clock::time_point when);

// Replaces characters that are awkward in filenames (/, :, space) with '_'
std::string filename_safe(std::string_view name);
