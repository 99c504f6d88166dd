#include <tku/config.hpp>
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace tku {

bool parse_cache_backend(const std::string& name, CacheBackend& out) {
    if (name == "blob")   { out = CacheBackend::Blob;   return true; }
    if (name == "sqlite") { out = CacheBackend::Sqlite; return true; }
    return false;
}

const char* cache_backend_name(CacheBackend b) {
    switch (b) {
        case CacheBackend::Blob:   return "blob";
        case CacheBackend::Sqlite: return "sqlite";
    }
    return "unknown";
}

static Result<ModelPricing> parse_model_pricing(const std::string& model,
                                                const toml::table& tbl) {
    auto input = tbl["input"].value<double>();
    auto output = tbl["output"].value<double>();
    if (!input || !output) {
        return TkuError{TkuError::Config,
            "pricing for '" + model + "' needs numeric 'input' and 'output'",
            "rates are USD per token, e.g. input = 3e-6"};
    }

    ModelPricing p;
    p.input_cost_per_token = *input;
    p.output_cost_per_token = *output;
    if (auto v = tbl["cache_read"].value<double>()) {
        p.cache_read_input_token_cost = *v;
    }
    if (auto v = tbl["cache_creation"].value<double>()) {
        p.cache_creation_input_token_cost = *v;
    }
    return Result<ModelPricing>::ok(p);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        TkuError err{TkuError::Config,
            std::string("invalid TOML: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        return err;
    }

    Config cfg;

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["backend"].value<std::string>()) {
            if (!parse_cache_backend(*v, cfg.backend)) {
                return TkuError{TkuError::Config,
                    "unknown cache backend: " + *v,
                    "expected \"blob\" or \"sqlite\""};
            }
            cfg.backend_set = true;
        }
        if (auto v = (*cache)["dir"].value<std::string>()) {
            cfg.cache_dir = *v;
        }
    }

    // [scan] section
    if (auto scan = doc["scan"].as_table()) {
        if (auto v = (*scan)["workers"].value<int64_t>()) {
            if (*v < 0) {
                return TkuError{TkuError::Config,
                    "scan.workers must not be negative"};
            }
            if (*v > static_cast<int64_t>(max_workers)) {
                return TkuError{TkuError::Config,
                    "scan.workers is too large: " + std::to_string(*v),
                    "expected at most " + std::to_string(max_workers)};
            }
            cfg.workers = static_cast<unsigned>(*v);
            cfg.workers_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            cfg.log_level = *v;
        }
    }

    // [pricing] section, with [pricing.models.<name>] tables
    if (auto pricing = doc["pricing"].as_table()) {
        if (auto v = (*pricing)["file"].value<std::string>()) {
            cfg.pricing_file = *v;
        }
        if (auto models = (*pricing)["models"].as_table()) {
            for (const auto& [key, val] : *models) {
                std::string model(key.str());
                auto tbl = val.as_table();
                if (!tbl) {
                    return TkuError{TkuError::Config,
                        "pricing.models." + model + " must be a table"};
                }
                auto p = parse_model_pricing(model, *tbl);
                if (p.is_err()) return std::move(p).error();
                cfg.pricing_overrides[model] = p.value();
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TkuError{TkuError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        return std::move(r).error().at(path);
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.backend_set) {
        backend = other.backend;
        backend_set = true;
    }
    if (other.workers_set) {
        workers = other.workers;
        workers_set = true;
    }
    if (!other.cache_dir.empty()) cache_dir = other.cache_dir;
    if (!other.log_level.empty()) log_level = other.log_level;
    if (!other.pricing_file.empty()) pricing_file = other.pricing_file;

    for (const auto& [model, p] : other.pricing_overrides) {
        pricing_overrides[model] = p;
    }
}

std::string Config::effective_cache_dir() const {
    if (!cache_dir.empty()) return cache_dir;
    return default_cache_dir();
}

std::string Config::effective_pricing_file() const {
    if (!pricing_file.empty()) return pricing_file;
    std::string dir = effective_cache_dir();
    if (dir.empty()) return "";
    return (std::filesystem::path(dir) / "pricing.json").string();
}

unsigned Config::effective_workers() const {
    if (workers > 0) return workers;
    unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0) return 1;
    return hw > max_workers ? max_workers : hw;
}

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

std::string config_path() {
    std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) return xdg + "/tku/config.toml";
    std::string home = env_or_empty("HOME");
    if (home.empty()) return "";
    return home + "/.config/tku/config.toml";
}

std::string default_cache_dir() {
    std::string xdg = env_or_empty("XDG_CACHE_HOME");
    if (!xdg.empty()) return xdg + "/tku";
    std::string home = env_or_empty("HOME");
    if (home.empty()) return "";
    return home + "/.cache/tku";
}

Result<Config> load_user_config() {
    std::string path = config_path();
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Result<Config>::ok(Config{});
    }
    return Config::load(path);
}

} // namespace tku
