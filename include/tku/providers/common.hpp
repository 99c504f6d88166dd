#pragma once

#include <tku/record.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace tku {

// Whole file as a string; nullopt if it cannot be opened
std::optional<std::string> read_text_file(const std::filesystem::path& path);

// Final '/'-separated segment of `path` ("" for a trailing slash)
std::string last_path_segment(const std::string& path);

// Stream a JSONL file line by line. Lines not containing `filter` are skipped
// without being parsed; `extract` turns the remaining ones into at most one
// record each. An unreadable file yields nothing.
template<typename F>
std::vector<UsageRecord> parse_jsonl_lines(const std::filesystem::path& path,
                                           const char* filter, F&& extract) {
    std::vector<UsageRecord> records;
    std::ifstream in(path);
    if (!in.is_open()) return records;

    std::string line;
    while (std::getline(in, line)) {
        if (line.find(filter) == std::string::npos) continue;
        std::optional<UsageRecord> r = extract(line);
        if (r) records.push_back(std::move(*r));
    }
    return records;
}

} // namespace tku
