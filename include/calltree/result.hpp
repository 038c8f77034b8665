#pragma once

#include <calltree/error.hpp>
#include <variant>

namespace calltree {

template<typename T>
class Result {
    std::variant<T, CalltreeError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CalltreeError so CALLTREE_TRY can return errors across Result<T> types
    Result(CalltreeError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CalltreeError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CalltreeError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CalltreeError& error() & { return std::get<CalltreeError>(data_); }
    const CalltreeError& error() const& { return std::get<CalltreeError>(data_); }
    CalltreeError&& error() && { return std::get<CalltreeError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define CALLTREE_TRY(expr) \
    do { \
        auto _calltree_result = (expr); \
        if (_calltree_result.is_err()) return std::move(_calltree_result).error(); \
    } while(0)

} // namespace calltree
