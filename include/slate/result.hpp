#pragma once

#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace slate {

// Error value carried by Result<T>. An error may wrap the error that caused
// it, so a failure deep in the store reads as a chain when logged:
//   "flush failed: sqlite step failed: database is locked"
class Error {
public:
    Error() = default;
    explicit Error(std::string message)
        : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message)),
          _cause(std::make_shared<Error>(std::move(cause))) {}

    const std::string& message() const { return _message; }
    const std::shared_ptr<Error>& cause() const { return _cause; }

    std::string to_string() const {
        std::string out = _message;
        for (auto c = _cause; c; c = c->_cause) {
            out += ": ";
            out += c->_message;
        }
        return out;
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

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    if (cause) {
        return std::unexpected(Error(std::move(message)));
    }
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename U>
std::string error_msg(const Result<U>& res) {
    if (res) return {};
    return res.error().to_string();
}

} // namespace slate
