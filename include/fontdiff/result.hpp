#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace fontdiff {

// Error - message plus an optional chain of causes
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(std::move(cause))) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
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

template<typename T>
class [[nodiscard]] Result {
public:
    Result(const Error& error) : _error(error) {}
    Result(Error&& error) : _error(std::move(error)) {}

    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Error> &&
                                         !std::is_same_v<std::decay_t<U>, Result<T>> &&
                                         std::is_constructible_v<T, U&&>>>
    Result(U&& value) : _value(std::forward<U>(value)) {}

    // Result<Derived> -> Result<Base>
    template<typename U, typename = std::enable_if_t<!std::is_same_v<U, T> &&
                                                     std::is_constructible_v<T, U&&>>>
    Result(Result<U>&& other) {
        if (other) {
            _value.emplace(std::move(*other));
        } else {
            _error = other.error();
        }
    }

    explicit operator bool() const { return _value.has_value(); }
    bool has_value() const { return _value.has_value(); }

    T& value() & { return *_value; }
    const T& value() const& { return *_value; }
    T&& value() && { return std::move(*_value); }

    T& operator*() & { return *_value; }
    const T& operator*() const& { return *_value; }
    T&& operator*() && { return std::move(*_value); }
    T* operator->() { return &*_value; }
    const T* operator->() const { return &*_value; }

    const Error& error() const { return _error; }

private:
    std::optional<T> _value;
    Error _error;
};

template<>
class [[nodiscard]] Result<void> {
public:
    Result() = default;
    Result(const Error& error) : _ok(false), _error(error) {}
    Result(Error&& error) : _ok(false), _error(std::move(error)) {}

    explicit operator bool() const { return _ok; }
    bool has_value() const { return _ok; }
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

template<typename T = void>
Result<T> Err(std::string message) {
    return Result<T>(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result.error().chain();
}

} // namespace fontdiff
