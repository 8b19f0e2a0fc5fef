#pragma once

#include <pcomb/error.hpp>
#include <variant>
#include <functional>

namespace pcomb {

template<typename T>
class Result {
    std::variant<T, PcombError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PcombError so PCOMB_TRY can return errors across Result<T> types
    Result(PcombError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PcombError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PcombError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PcombError& error() & { return std::get<PcombError>(data_); }
    const PcombError& error() const& { return std::get<PcombError>(data_); }
    PcombError&& error() && { return std::get<PcombError>(std::move(data_)); }

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

    // Recovers from an error; f receives the error and returns a Result
    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }

    // Rewrites the error (e.g. to attach a file name); Ok passes through
    template<typename F>
    Result map_err(F&& f) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return Result::err(f(std::move(error())));
    }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PCOMB_TRY(expr) \
    do { \
        auto _pcomb_result = (expr); \
        if (_pcomb_result.is_err()) return std::move(_pcomb_result).error(); \
    } while(0)

} // namespace pcomb
