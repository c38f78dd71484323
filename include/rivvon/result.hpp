#pragma once

#include <expected>
#include <memory>
#include <string>
#include <utility>

namespace rivvon {

// Error categories used across the engine.
//   Construction - degenerate input (skippable, e.g. a path with < 2 points)
//   Resource     - tile source unreachable/corrupt, GPU allocation failure
//   State        - method called before its required setup, or after dispose
enum class ErrorKind {
    Generic,
    Construction,
    Resource,
    State,
};

class Error {
public:
    Error() = default;
    explicit Error(std::string message, ErrorKind kind = ErrorKind::Generic)
        : _message(std::move(message)), _kind(kind) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message))
        , _kind(cause.kind())
        , _cause(std::make_shared<Error>(cause)) {}
    Error(ErrorKind kind, std::string message, const Error& cause)
        : _message(std::move(message))
        , _kind(kind)
        , _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }
    ErrorKind kind() const { return _kind; }
    const Error* cause() const { return _cause.get(); }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string s = _message;
        for (const Error* c = cause(); c; c = c->cause()) {
            s += ": ";
            s += c->message();
        }
        return s;
    }

private:
    std::string _message;
    ErrorKind _kind = ErrorKind::Generic;
    std::shared_ptr<Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return std::unexpected(Error(message));
}

template<typename T = void>
Result<T> Err(ErrorKind kind, const std::string& message) {
    return std::unexpected(Error(message, kind));
}

template<typename T = void>
Result<T> Err(const std::string& message, const Error& cause) {
    return std::unexpected(Error(message, cause));
}

template<typename T = void, typename U>
Result<T> Err(const std::string& message, const Result<U>& prior) {
    return std::unexpected(Error(message, prior.error()));
}

template<typename T = void, typename U>
Result<T> Err(ErrorKind kind, const std::string& message, const Result<U>& prior) {
    return std::unexpected(Error(kind, message, prior.error()));
}

template<typename U>
std::string error_msg(const Result<U>& res) {
    return res ? std::string() : res.error().to_string();
}

template<typename U>
ErrorKind error_kind(const Result<U>& res) {
    return res ? ErrorKind::Generic : res.error().kind();
}

} // namespace rivvon

#define RIVVON_CHECK(expr, msg)                                                \
    do {                                                                       \
        if (auto _rivvon_res = (expr); !_rivvon_res) {                         \
            return ::rivvon::Err(msg, _rivvon_res);                            \
        }                                                                      \
    } while (0)
