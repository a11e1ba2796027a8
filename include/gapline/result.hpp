#pragma once

#include <gapline/error.hpp>
#include <variant>

namespace gapline {

template<typename T>
class Result {
    std::variant<T, GapError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from GapError so GAPLINE_TRY can forward errors across Result<T> types
    Result(GapError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(GapError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<GapError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    GapError& error() & { return std::get<GapError>(data_); }
    const GapError& error() const& { return std::get<GapError>(data_); }
    GapError&& error() && { return std::get<GapError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define GAPLINE_TRY(expr) \
    do { \
        auto _gapline_result = (expr); \
        if (_gapline_result.is_err()) return std::move(_gapline_result).error(); \
    } while(0)

} // namespace gapline
