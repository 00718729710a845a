#pragma once

#include <quilt/error.hpp>
#include <variant>
#include <functional>

namespace quilt {

template<typename T>
class Result {
    std::variant<T, QuiltError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from QuiltError so QUILT_TRY can return errors across Result<T> types
    Result(QuiltError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(QuiltError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<QuiltError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    QuiltError& error() & { return std::get<QuiltError>(data_); }
    const QuiltError& error() const& { return std::get<QuiltError>(data_); }
    QuiltError&& error() && { return std::get<QuiltError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    // Replace the error with f(error); values pass through untouched
    template<typename F>
    Result map_err(F&& f) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return Result::err(f(std::move(error())));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define QUILT_TRY(expr) \
    do { \
        auto _quilt_result = (expr); \
        if (_quilt_result.is_err()) return std::move(_quilt_result).error(); \
    } while(0)

} // namespace quilt
