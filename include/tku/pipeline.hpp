#pragma once

#include <tku/discovery.hpp>
#include <tku/record.hpp>
#include <tku/storage.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace tku {

// (completed, total) for the provider currently being scanned
using ProgressFn = std::function<void(size_t, size_t)>;

// Pure per-file parser. Must tolerate any file content; returns an empty
// list when nothing usable is found.
using ParseFn = std::function<std::vector<UsageRecord>(const std::filesystem::path&)>;

struct ScanStats {
    size_t total = 0;      // files discovered
    size_t cached = 0;     // fingerprint hits, not re-parsed
    size_t parsed = 0;     // files handed to the parser
    size_t records = 0;    // records produced by this run's parses
};

// Bring `storage` up to date for one provider:
//   1. sequentially split `files` into cache hits and misses
//   2. parse the misses on at most `workers` threads
//   3. sequentially insert the fresh results in discovery order
//   4. prune entries whose path was not discovered
// Progress is reported from the calling thread only and strictly increases
// from 1 to files.size(). A parser that throws yields no records for its
// file; the scan goes on.
ScanStats discover_and_parse_with(const std::string& provider,
                                  const std::vector<DiscoveredFile>& files,
                                  Storage& storage,
                                  const ProgressFn* progress,
                                  const ParseFn& parse,
                                  unsigned workers);

} // namespace tku
