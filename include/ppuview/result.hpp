#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace ppuview {

// Error with an optional chain of causes
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const noexcept { return _message; }
    const Error* cause() const noexcept { return _cause.get(); }

    // "outer: inner: innermost"
    std::string fullMessage() const {
        std::string msg = _message;
        for (const Error* c = cause(); c; c = c->cause()) {
            msg += ": ";
            msg += c->message();
        }
        return msg;
    }

private:
    std::string _message;
    std::shared_ptr<Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() {
    return {};
}

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
std::unexpected<Error> Err(std::string message) {
    return std::unexpected<Error>(Error(std::move(message)));
}

template<typename T, typename U>
std::unexpected<Error> Err(std::string message, const Result<U>& cause) {
    if (cause) {
        return std::unexpected<Error>(Error(std::move(message)));
    }
    return std::unexpected<Error>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().fullMessage();
}

} // namespace ppuview
