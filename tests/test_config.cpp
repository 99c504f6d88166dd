#include <catch2/catch.hpp>
#include <tku/config.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace tku;
namespace fs = std::filesystem;

// Sets an environment variable for the lifetime of the guard
struct EnvGuard {
    std::string name;
    std::string saved;
    bool had = false;

    EnvGuard(const char* n, const char* value) : name(n) {
        if (const char* old = std::getenv(n)) { saved = old; had = true; }
        if (value) setenv(n, value, 1); else unsetenv(n);
    }
    ~EnvGuard() {
        if (had) setenv(name.c_str(), saved.c_str(), 1); else unsetenv(name.c_str());
    }
};

// ===== Parsing =====

TEST_CASE("parse empty config gives defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(c.backend == CacheBackend::Blob);
    REQUIRE_FALSE(c.backend_set);
    REQUIRE(c.cache_dir.empty());
    REQUIRE(c.workers == 0);
    REQUIRE(c.pricing_overrides.empty());
}

TEST_CASE("parse config with cache, scan and log sections", "[config]") {
    auto r = Config::parse(R"(
[cache]
backend = "sqlite"
dir = "/tmp/tku-cache"

[scan]
workers = 3

[log]
level = "debug"
)");
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(c.backend == CacheBackend::Sqlite);
    REQUIRE(c.backend_set);
    REQUIRE(c.cache_dir == "/tmp/tku-cache");
    REQUIRE(c.workers == 3);
    REQUIRE(c.effective_workers() == 3);
    REQUIRE(c.log_level == "debug");
}

TEST_CASE("parse config with pricing overrides", "[config]") {
    auto r = Config::parse(R"(
[pricing]
file = "/opt/prices.json"

[pricing.models."my-model"]
input = 1e-6
output = 2e-6
cache_read = 1e-7

[pricing.models.other]
input = 0
output = 1
)");
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(c.pricing_file == "/opt/prices.json");
    REQUIRE(c.effective_pricing_file() == "/opt/prices.json");
    REQUIRE(c.pricing_overrides.size() == 2);

    const auto& p = c.pricing_overrides.at("my-model");
    REQUIRE(p.input_cost_per_token == Approx(1e-6));
    REQUIRE(p.output_cost_per_token == Approx(2e-6));
    REQUIRE(p.cache_read_input_token_cost.has_value());
    REQUIRE(*p.cache_read_input_token_cost == Approx(1e-7));
    REQUIRE_FALSE(p.cache_creation_input_token_cost.has_value());

    REQUIRE(c.pricing_overrides.at("other").output_cost_per_token == Approx(1.0));
}

TEST_CASE("parse rejects unknown backend", "[config]") {
    auto r = Config::parse("[cache]\nbackend = \"redis\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TkuError::Config);
    REQUIRE(r.error().message.find("redis") != std::string::npos);
}

TEST_CASE("parse rejects pricing without base rates", "[config]") {
    auto r = Config::parse("[pricing.models.m]\ninput = 1e-6\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TkuError::Config);
}

TEST_CASE("parse rejects negative worker count", "[config]") {
    auto r = Config::parse("[scan]\nworkers = -2\n");
    REQUIRE(r.is_err());
}

TEST_CASE("parse bounds the worker count", "[config]") {
    auto ok = Config::parse("[scan]\nworkers = 1024\n");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().effective_workers() == max_workers);

    auto r = Config::parse("[scan]\nworkers = 4000\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TkuError::Config);
    REQUIRE(r.error().message == "scan.workers is too large: 4000");
}

TEST_CASE("default worker count stays within bounds", "[config]") {
    Config c;
    REQUIRE(c.effective_workers() >= 1);
    REQUIRE(c.effective_workers() <= max_workers);
}

TEST_CASE("parse reports TOML syntax errors", "[config]") {
    auto r = Config::parse("[scan]\nworkers = 4\nbackend = @blob\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TkuError::Config);
    REQUIRE(r.error().line == 3);
}

// ===== Loading =====

TEST_CASE("load attaches the file and line to errors", "[config]") {
    std::string path = "/tmp/tku_test_config_" + std::to_string(getpid()) + ".toml";
    {
        std::ofstream f(path);
        f << "[cache]\nbackend = 42x\n";
    }
    auto r = Config::load(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().path == path);
    REQUIRE(r.error().line == 2);
    REQUIRE(r.error().format().find("in " + path + ":2") != std::string::npos);
    fs::remove(path);
}

TEST_CASE("load missing file is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/tku/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TkuError::IO);
}

TEST_CASE("load_user_config without a file gives defaults", "[config]") {
    std::string dir = "/tmp/tku_test_xdg_" + std::to_string(getpid());
    EnvGuard xdg("XDG_CONFIG_HOME", dir.c_str());
    auto r = load_user_config();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().backend == CacheBackend::Blob);
}

TEST_CASE("load_user_config reads XDG config file", "[config]") {
    std::string dir = "/tmp/tku_test_xdg_file_" + std::to_string(getpid());
    fs::create_directories(dir + "/tku");
    {
        std::ofstream f(dir + "/tku/config.toml");
        f << "[cache]\nbackend = \"sqlite\"\n";
    }
    EnvGuard xdg("XDG_CONFIG_HOME", dir.c_str());
    REQUIRE(config_path() == dir + "/tku/config.toml");
    auto r = load_user_config();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().backend == CacheBackend::Sqlite);
    fs::remove_all(dir);
}

// ===== Paths =====

TEST_CASE("default_cache_dir prefers XDG_CACHE_HOME", "[config]") {
    EnvGuard xdg("XDG_CACHE_HOME", "/var/cache/me");
    REQUIRE(default_cache_dir() == "/var/cache/me/tku");
}

TEST_CASE("default_cache_dir falls back to HOME", "[config]") {
    EnvGuard xdg("XDG_CACHE_HOME", nullptr);
    EnvGuard home("HOME", "/home/tester");
    REQUIRE(default_cache_dir() == "/home/tester/.cache/tku");
    Config c;
    REQUIRE(c.effective_cache_dir() == "/home/tester/.cache/tku");
    REQUIRE(c.effective_pricing_file() == "/home/tester/.cache/tku/pricing.json");
}

TEST_CASE("no HOME and no XDG means no default paths", "[config]") {
    EnvGuard xdg_cache("XDG_CACHE_HOME", nullptr);
    EnvGuard xdg_config("XDG_CONFIG_HOME", nullptr);
    EnvGuard home("HOME", nullptr);
    REQUIRE(default_cache_dir().empty());
    REQUIRE(config_path().empty());
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto base = Config::parse(R"(
[cache]
backend = "sqlite"
dir = "/a"
[scan]
workers = 2
[pricing.models.m]
input = 1
output = 2
)").value();

    Config cli;
    cli.workers = 8;
    cli.workers_set = true;
    base.merge(cli);

    REQUIRE(base.backend == CacheBackend::Sqlite);
    REQUIRE(base.cache_dir == "/a");
    REQUIRE(base.workers == 8);
    REQUIRE(base.pricing_overrides.count("m") == 1);

    Config other;
    other.backend = CacheBackend::Blob;
    other.backend_set = true;
    base.merge(other);
    REQUIRE(base.backend == CacheBackend::Blob);
}

TEST_CASE("cache backend names roundtrip", "[config]") {
    CacheBackend b;
    REQUIRE(parse_cache_backend("blob", b));
    REQUIRE(std::string(cache_backend_name(b)) == "blob");
    REQUIRE(parse_cache_backend("sqlite", b));
    REQUIRE(std::string(cache_backend_name(b)) == "sqlite");
    REQUIRE_FALSE(parse_cache_backend("SQLite3", b));
}
