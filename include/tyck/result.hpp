#pragma once

#include <tyck/error.hpp>
#include <variant>
#include <utility>

namespace tyck {

// Value-or-error return used by every fallible construction step.
// Accessors and decisions on a built Options never return Result.
template<typename T>
class Result {
    std::variant<T, TyckError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TyckError so TYCK_TRY can return errors across Result<T> types
    Result(TyckError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TyckError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TyckError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TyckError& error() & { return std::get<TyckError>(data_); }
    const TyckError& error() const& { return std::get<TyckError>(data_); }
    TyckError&& error() && { return std::get<TyckError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TYCK_TRY(expr) \
    do { \
        auto _tyck_result = (expr); \
        if (_tyck_result.is_err()) return std::move(_tyck_result).error(); \
    } while(0)

} // namespace tyck
