#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace inkwell {

// Error carries a message and, optionally, the error that caused it.
// error_msg() renders the whole chain as "outer: inner: root".
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(std::move(cause))) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    std::string chain() const {
        std::string out = _message;
        for (const Error* e = cause(); e; e = e->cause()) {
            out += ": ";
            out += e->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<Error> _cause;
};

// Untyped failure, converts into any Result<T>.
struct Failure {
    Error error;
};

template<typename T>
class Result {
public:
    using value_type = T;

    Result(Failure f) : _error(std::move(f.error)) {}
    explicit Result(T value) : _value(std::move(value)) {}

    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> && std::is_convertible_v<U, T>>>
    Result(Result<U>&& other) {
        if (other) {
            _value.emplace(std::move(*other));
        } else {
            _error = other.error();
        }
    }

    bool has_value() const { return _value.has_value(); }
    explicit operator bool() const { return has_value(); }

    T& value() { return *_value; }
    const T& value() const { return *_value; }
    T& operator*() { return *_value; }
    const T& operator*() const { return *_value; }
    T* operator->() { return &*_value; }
    const T* operator->() const { return &*_value; }

    const Error& error() const { return _error; }

private:
    std::optional<T> _value;
    Error _error;
};

template<>
class Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(Failure f) : _ok(false), _error(std::move(f.error)) {}

    bool has_value() const { return _ok; }
    explicit operator bool() const { return _ok; }

    const Error& error() const { return _error; }

private:
    bool _ok = true;
    Error _error;
};

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Failure Err(std::string message) {
    return Failure{Error(std::move(message))};
}

template<typename T>
Result<T> Err(std::string message) {
    return Failure{Error(std::move(message))};
}

template<typename T, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Failure{Error(std::move(message), cause.error())};
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result.error().chain();
}

} // namespace inkwell
