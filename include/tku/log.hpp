#pragma once

#include <string>

#if defined(__GNUC__) || defined(__clang__)
#define TKU_PRINTF_FMT(i) __attribute__((format(printf, i, i + 1)))
#else
#define TKU_PRINTF_FMT(i)
#endif

namespace tku::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parses "trace".."error" (case-insensitive, "warning" accepted).
// Returns false if unknown and leaves `out` untouched.
bool parse_level(const std::string& name, Level& out);

// Level for this run: $TKU_LOG when set, else `configured` (the config
// file's log.level), else unchanged. An unknown name is reported and ignored.
void init_level(const std::string& configured);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// One line on stderr: "<level>: <message>". Safe to call from pool workers.
void trace(const char* fmt, ...) TKU_PRINTF_FMT(1);
void debug(const char* fmt, ...) TKU_PRINTF_FMT(1);
void info(const char* fmt, ...) TKU_PRINTF_FMT(1);
void warn(const char* fmt, ...) TKU_PRINTF_FMT(1);
void error(const char* fmt, ...) TKU_PRINTF_FMT(1);

const char* level_name(Level lvl);

} // namespace tku::log
