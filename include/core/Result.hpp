#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include "core/Error.hpp"

namespace geminiai {

/**
 * Tagged outcome of a public call: either a value or an Error, never both.
 */
template <typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(Error error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Throws std::logic_error when called on a failure
    const T& value() const {
        if (!value_) throw std::logic_error("Result holds an error: " + error_->describe());
        return *value_;
    }

    T& value() {
        if (!value_) throw std::logic_error("Result holds an error: " + error_->describe());
        return *value_;
    }

    // Throws std::logic_error when called on a success
    const Error& error() const {
        if (!error_) throw std::logic_error("Result holds a value");
        return *error_;
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<Error> error_;
};

template <>
class Result<void> {
public:
    static Result success() { return Result(); }

    static Result failure(Error error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        if (!error_) throw std::logic_error("Result holds no error");
        return *error_;
    }

private:
    Result() = default;

    std::optional<Error> error_;
};

/**
 * Runs fn at a public API boundary: ClientException becomes its Error, any
 * other exception becomes InternalError. fn returns T (or nothing for void).
 */
template <typename T, typename Fn>
Result<T> catchErrors(const std::string& operation, Fn&& fn) {
    try {
        if constexpr (std::is_void_v<T>) {
            fn();
            return Result<T>::success();
        } else {
            return Result<T>::success(fn());
        }
    } catch (const ClientException& e) {
        return Result<T>::failure(e.error());
    } catch (const std::exception& e) {
        return Result<T>::failure(Error{ErrorKind::InternalError,
                                        operation + " failed unexpectedly: " + e.what(), 0, ""});
    }
}

} // namespace geminiai
