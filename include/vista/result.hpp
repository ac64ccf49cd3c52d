#pragma once

#include <vista/error.hpp>
#include <future>
#include <variant>
#include <functional>

namespace vista {

template<typename T>
class Result {
    std::variant<T, VistaError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from VistaError so VISTA_TRY can return errors across Result<T> types
    Result(VistaError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(VistaError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<VistaError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    VistaError& error() & { return std::get<VistaError>(data_); }
    const VistaError& error() const& { return std::get<VistaError>(data_); }
    VistaError&& error() && { return std::get<VistaError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Every asynchronous repository operation resolves to one of these.
template<typename T>
using Future = std::shared_future<Result<T>>;

// A future that is already resolved, for calls that can answer immediately.
template<typename T>
Future<T> ready_future(Result<T> value) {
    std::promise<Result<T>> promise;
    promise.set_value(std::move(value));
    return promise.get_future().share();
}

#define VISTA_TRY(expr) \
    do { \
        auto _vista_result = (expr); \
        if (_vista_result.is_err()) return std::move(_vista_result).error(); \
    } while(0)

} // namespace vista
