#pragma once

#include <tku/cost.hpp>
#include <tku/result.hpp>
#include <map>
#include <string>

namespace tku {

enum class CacheBackend { Blob, Sqlite };

// Upper bound on parser threads, from the config file or --workers
constexpr unsigned max_workers = 1024;

bool parse_cache_backend(const std::string& name, CacheBackend& out);
const char* cache_backend_name(CacheBackend b);

// Layered configuration: config file, then command-line overrides.
// Later layers override only the fields they explicitly set.
struct Config {
    CacheBackend backend = CacheBackend::Blob;
    std::string cache_dir;          // empty: default_cache_dir()
    unsigned workers = 0;           // 0: hardware concurrency
    std::string log_level;          // empty: leave logger alone
    std::string pricing_file;       // empty: <cache dir>/pricing.json
    std::map<std::string, ModelPricing> pricing_overrides;

    bool backend_set = false;
    bool workers_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    std::string effective_cache_dir() const;
    std::string effective_pricing_file() const;
    unsigned effective_workers() const;
};

// $XDG_CONFIG_HOME/tku/config.toml, else ~/.config/tku/config.toml.
// Empty when neither is resolvable.
std::string config_path();

// $XDG_CACHE_HOME/tku, else ~/.cache/tku. Empty when HOME is unset.
std::string default_cache_dir();

// Loads config_path() if it exists; defaults otherwise
Result<Config> load_user_config();

} // namespace tku
