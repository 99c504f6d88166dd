#include <tku/error.hpp>

namespace tku {

const char* TkuError::code_name(Code c) {
    switch (c) {
        case IO:         return "io";
        case Parse:      return "parse";
        case Config:     return "config";
        case Storage:    return "cache";
        case InvalidArg: return "usage";
    }
    return "internal";
}

int TkuError::exit_code() const {
    return code == InvalidArg ? 2 : 1;
}

std::string TkuError::format() const {
    std::string out = "tku: ";
    out += code_name(code);
    out += " error: ";
    out += message;

    if (!path.empty()) {
        out += "\n  in ";
        out += path;
        if (line > 0) out += ":" + std::to_string(line);
    }
    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }
    return out;
}

} // namespace tku
