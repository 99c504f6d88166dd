#include <catch2/catch.hpp>
#include <tku/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace tku::log;

// Run `fn` with stderr redirected into a pipe and return what it wrote
static std::string stderr_of(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved = dup(STDERR_FILENO);
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    dup2(fds[1], STDERR_FILENO);
    close(fds[1]);

    fn();

    std::fflush(stderr);
    dup2(saved, STDERR_FILENO);
    close(saved);

    std::string text;
    char chunk[512];
    ssize_t got;
    while ((got = read(fds[0], chunk, sizeof(chunk))) > 0) text.append(chunk, got);
    close(fds[0]);
    return text;
}

// Plain output at `lvl`; restores the default afterwards
struct LogScope {
    explicit LogScope(Level lvl) {
        set_level(lvl);
        set_color_enabled(false);
    }
    ~LogScope() { set_level(Info); }
};

// ===== Levels =====

TEST_CASE("parse_level accepts names case-insensitively", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("DEBUG", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("Warning", lvl));
    REQUIRE(lvl == Warn);
    REQUIRE(parse_level("trace", lvl));
    REQUIRE(lvl == Trace);
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    Level lvl = Error;
    REQUIRE_FALSE(parse_level("verbose", lvl));
    REQUIRE_FALSE(parse_level("", lvl));
    REQUIRE(lvl == Error);
}

TEST_CASE("level names", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("init_level uses the configured level", "[log]") {
    LogScope scope(Info);
    unsetenv("TKU_LOG");
    init_level("debug");
    REQUIRE(get_level() == Debug);
    init_level("");
    REQUIRE(get_level() == Debug);
}

TEST_CASE("init_level lets TKU_LOG override the config", "[log]") {
    LogScope scope(Info);
    setenv("TKU_LOG", "error", 1);
    init_level("trace");
    unsetenv("TKU_LOG");
    REQUIRE(get_level() == Error);
}

TEST_CASE("init_level reports and ignores unknown names", "[log]") {
    LogScope scope(Info);
    unsetenv("TKU_LOG");
    auto out = stderr_of([] { init_level("chatty"); });
    REQUIRE(get_level() == Info);
    REQUIRE(out == "warn: ignoring unknown log.level 'chatty'\n");
}

// ===== Output =====

TEST_CASE("Threshold filters messages", "[log]") {
    LogScope scope(Warn);

    SECTION("below is dropped") {
        REQUIRE(stderr_of([] { info("scanning %s", "claude"); }).empty());
        REQUIRE(stderr_of([] { debug("cache hit"); }).empty());
    }
    SECTION("at and above are printed") {
        REQUIRE(stderr_of([] { warn("failed to parse %s", "a.jsonl"); }) ==
                "warn: failed to parse a.jsonl\n");
        REQUIRE(stderr_of([] { error("disk full"); }) == "error: disk full\n");
    }
}

TEST_CASE("Color wraps only the level name", "[log]") {
    LogScope scope(Info);
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    auto out = stderr_of([] { info("%zu records", static_cast<size_t>(3)); });
    set_color_enabled(false);
    REQUIRE(out == "\033[32minfo\033[0m: 3 records\n");
}

TEST_CASE("Concurrent messages stay on separate lines", "[log]") {
    LogScope scope(Info);

    auto out = stderr_of([] {
        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([t] {
                for (int i = 0; i < 25; ++i) warn("worker %d line %d", t, i);
            });
        }
        for (auto& w : workers) w.join();
    });

    size_t lines = 0;
    for (char c : out) lines += c == '\n';
    REQUIRE(lines == 100);
    REQUIRE(out.find("warn: worker 3 line 24\n") != std::string::npos);
}
