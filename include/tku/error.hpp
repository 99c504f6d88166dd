#pragma once

#include <string>

namespace tku {

// An error that reaches the driver. A malformed log file never becomes one:
// parsers absorb those and the file simply yields no records.
struct TkuError {
    enum Code {
        IO,          // reading or writing a file tku owns
        Parse,       // JSON, timestamp or price table syntax
        Config,      // configuration file or value
        Storage,     // cache backend
        InvalidArg   // command line
    };

    Code code;
    std::string message;
    std::string hint;
    std::string path;   // file the error is about, if any
    int line = 0;       // 1-based line within `path`, 0 when unknown

    TkuError() = default;
    TkuError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TkuError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Point the error at a file. A line already set by a lower layer is kept
    // unless `l` is given.
    TkuError& at(std::string p, int l = 0) {
        path = std::move(p);
        if (l > 0) line = l;
        return *this;
    }

    // "tku: config error: <message>" then optional "  in <path>:<line>" and
    // "  hint: <hint>" lines
    std::string format() const;

    // 2 for command-line mistakes, 1 for everything else
    int exit_code() const;

    static const char* code_name(Code c);
};

} // namespace tku
