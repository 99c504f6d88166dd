#include <tku/pipeline.hpp>
#include <tku/log.hpp>
#include <tku/worker_pool.hpp>

namespace tku {

static std::vector<UsageRecord> parse_guarded(const ParseFn& parse,
                                              const std::filesystem::path& path) {
    try {
        return parse(path);
    } catch (const std::exception& e) {
        log::warn("failed to parse %s: %s", path.c_str(), e.what());
    } catch (...) {
        log::warn("failed to parse %s: unknown exception", path.c_str());
    }
    return {};
}

ScanStats discover_and_parse_with(const std::string& provider,
                                  const std::vector<DiscoveredFile>& files,
                                  Storage& storage,
                                  const ProgressFn* progress,
                                  const ParseFn& parse,
                                  unsigned workers) {
    ScanStats stats;
    stats.total = files.size();

    std::vector<std::string> paths;
    paths.reserve(files.size());
    for (const auto& f : files) paths.push_back(f.path.string());

    // Phase 1: fingerprint check
    std::vector<const DiscoveredFile*> misses;
    for (size_t i = 0; i < files.size(); ++i) {
        if (storage.is_cached(provider, paths[i], files[i].mtime, files[i].size)) {
            ++stats.cached;
            if (progress) (*progress)(stats.cached, stats.total);
        } else {
            misses.push_back(&files[i]);
        }
    }

    // Phase 2: parse misses in parallel; storage is not touched here
    WorkerPool pool(workers);
    auto results = pool.parallel_map<std::vector<UsageRecord>>(misses.size(),
        [&](size_t i) { return parse_guarded(parse, misses[i]->path); });

    // Phase 3: commit in discovery order
    for (size_t i = 0; i < misses.size(); ++i) {
        const DiscoveredFile& f = *misses[i];
        ++stats.parsed;
        stats.records += results[i].size();
        if (progress) (*progress)(stats.cached + stats.parsed, stats.total);

        auto st = storage.insert(provider, f.path.string(), f.mtime, f.size,
                                 std::move(results[i]));
        if (st.is_err()) {
            log::warn("failed to cache %s: %s", f.path.c_str(),
                      st.error().message.c_str());
        }
    }

    auto st = storage.prune(provider, paths);
    if (st.is_err()) {
        log::warn("failed to prune %s cache: %s", provider.c_str(),
                  st.error().message.c_str());
    }

    log::debug("%s: %zu files, %zu cached, %zu parsed (%zu records)",
               provider.c_str(), stats.total, stats.cached, stats.parsed, stats.records);
    return stats;
}

} // namespace tku
