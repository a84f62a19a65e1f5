#pragma once

#include <ctext/error.hpp>
#include <variant>
#include <functional>

namespace ctext {

template<typename T>
class Result {
    std::variant<T, CtextError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CtextError so CTEXT_TRY can return errors across Result<T> types
    Result(CtextError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CtextError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CtextError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    CtextError& error() & { return std::get<CtextError>(data_); }
    const CtextError& error() const& { return std::get<CtextError>(data_); }
    CtextError&& error() && { return std::get<CtextError>(std::move(data_)); }

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

    // Attach a file name (and line, when known) to an error that has none.
    Result& with_location(const std::string& file, int line = 0) & {
        if (is_err() && error().file.empty()) {
            error().file = file;
            if (error().line == 0) error().line = line;
        }
        return *this;
    }
    Result&& with_location(const std::string& file, int line = 0) && {
        with_location(file, line);
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CTEXT_TRY(expr) \
    do { \
        auto _ctext_result = (expr); \
        if (_ctext_result.is_err()) return std::move(_ctext_result).error(); \
    } while(0)

} // namespace ctext
