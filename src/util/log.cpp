#include <tku/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <unistd.h>

namespace tku::log {

namespace {

struct LevelInfo {
    const char* name;
    const char* color;
};

const LevelInfo LEVELS[] = {
    {"trace", "\033[90m"},
    {"debug", "\033[36m"},
    {"info",  "\033[32m"},
    {"warn",  "\033[33m"},
    {"error", "\033[31m"},
};

const char* const RESET = "\033[0m";

// Workers log while the coordinating thread may be changing settings
std::atomic<int> s_level{Info};
std::once_flag s_color_once;
std::atomic<bool> s_color_enabled{false};
std::mutex s_emit_mutex;

void init_color() {
    std::call_once(s_color_once, [] {
        s_color_enabled = ::isatty(::fileno(stderr)) != 0;
    });
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load()) return;
    init_color();

    std::lock_guard<std::mutex> lock(s_emit_mutex);
    const LevelInfo& li = LEVELS[lvl];
    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s%s: ", li.color, li.name, RESET);
    } else {
        std::fprintf(stderr, "%s: ", li.name);
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

} // namespace

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return static_cast<Level>(s_level.load());
}

bool parse_level(const std::string& name, Level& out) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "warning") lower = "warn";
    for (int i = Trace; i <= Error; ++i) {
        if (lower == LEVELS[i].name) {
            out = static_cast<Level>(i);
            return true;
        }
    }
    return false;
}

void init_level(const std::string& configured) {
    std::string name = configured;
    const char* source = "log.level";
    if (const char* env = std::getenv("TKU_LOG")) {
        if (*env) {
            name = env;
            source = "TKU_LOG";
        }
    }
    if (name.empty()) return;

    Level lvl;
    if (parse_level(name, lvl)) {
        set_level(lvl);
    } else {
        warn("ignoring unknown %s '%s'", source, name.c_str());
    }
}

void set_color_enabled(bool enabled) {
    std::call_once(s_color_once, [] {});
    s_color_enabled = enabled;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Error) return "unknown";
    return LEVELS[lvl].name;
}

#define TKU_LOG_FN(fn, lvl) \
    void fn(const char* fmt, ...) { \
        va_list args; \
        va_start(args, fmt); \
        emit(lvl, fmt, args); \
        va_end(args); \
    }

TKU_LOG_FN(trace, Trace)
TKU_LOG_FN(debug, Debug)
TKU_LOG_FN(info, Info)
TKU_LOG_FN(warn, Warn)
TKU_LOG_FN(error, Error)

#undef TKU_LOG_FN

} // namespace tku::log
