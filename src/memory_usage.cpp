// SPDX-License-Identifier: MIT

// src/memory_usage.cpp
#include "src/memory_usage.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace chunk_pipe {

namespace {

// "VmRSS:\t   12345 kB" -> 12345 * 1024
std::optional<std::uint64_t> ParseKiBField(std::string_view line, std::string_view key) {
    if (!line.starts_with(key)) return std::nullopt;
    line.remove_prefix(key.size());
    auto digits = line.find_first_of("0123456789");
    if (digits == std::string_view::npos) return std::nullopt;
    line.remove_prefix(digits);

    std::uint64_t kib = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), kib);
    if (ec != std::errc{}) return std::nullopt;
    return kib * 1024;
}

}  // namespace

std::optional<MemoryUsage> MemoryUsage::Parse(std::string_view status) {
    MemoryUsage usage;
    bool have_rss = false;

    while (!status.empty()) {
        auto eol = status.find('\n');
        std::string_view line = status.substr(0, eol);
        status.remove_prefix(eol == std::string_view::npos ? status.size() : eol + 1);

        if (auto rss = ParseKiBField(line, "VmRSS:")) {
            usage.rss_bytes = *rss;
            have_rss = true;
        } else if (auto hwm = ParseKiBField(line, "VmHWM:")) {
            usage.peak_rss_bytes = *hwm;
        } else if (auto data = ParseKiBField(line, "VmData:")) {
            usage.data_bytes = *data;
        }
    }

    if (!have_rss) return std::nullopt;
    return usage;
}

std::optional<MemoryUsage> MemoryUsage::Sample(const std::string& status_path) {
    std::ifstream in(status_path);
    if (!in) return std::nullopt;
    std::ostringstream text;
    text << in.rdbuf();
    return Parse(text.str());
}

}  // namespace chunk_pipe
