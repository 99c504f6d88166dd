#pragma once

#include <tku/error.hpp>
#include <utility>
#include <variant>

namespace tku {

// Either a T or the TkuError explaining why there is none. Functions that
// only succeed or fail return Status.
template<typename T>
class Result {
    std::variant<T, TkuError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TkuError so TKU_TRY can return errors across Result<T> types
    Result(TkuError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TkuError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TkuError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TkuError& error() & { return std::get<TkuError>(data_); }
    const TkuError& error() const& { return std::get<TkuError>(data_); }
    TkuError&& error() && { return std::get<TkuError>(std::move(data_)); }

    // Value on success, `fallback` on error
    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Return early from a Result- or Status-returning function on error
#define TKU_TRY(expr) \
    do { \
        auto _tku_result = (expr); \
        if (_tku_result.is_err()) return std::move(_tku_result).error(); \
    } while(0)

} // namespace tku
