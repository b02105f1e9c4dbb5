#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace gemtab {

// Error carries a message and an optional chain of causes.
// to_string() renders the whole chain: "outer: inner: root".
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message)),
          _cause(std::make_shared<Error>(std::move(cause))) {}

    const std::string& message() const noexcept { return _message; }
    const Error* cause() const noexcept { return _cause.get(); }

    std::string to_string() const {
        std::string out = _message;
        for (const Error* c = _cause.get(); c; c = c->_cause.get()) {
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
class [[nodiscard]] Result {
public:
    using ValueType = T;

    Result(T value) : _storage(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _storage(std::in_place_index<1>, std::move(error)) {}

    // Result<Derived> -> Result<Base>, Result<int> -> Result<long>, ...
    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> &&
                                         std::is_convertible_v<U, T>>>
    Result(Result<U> other) {
        if (other) {
            _storage.template emplace<0>(std::move(*other));
        } else {
            _storage.template emplace<1>(other.error());
        }
    }

    bool has_value() const noexcept { return _storage.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    T& value() & { return std::get<0>(_storage); }
    const T& value() const& { return std::get<0>(_storage); }
    T&& value() && { return std::get<0>(std::move(_storage)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_storage); }

private:
    std::variant<T, Error> _storage;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using ValueType = void;

    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const noexcept { return !_error.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
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
    if (cause) {
        return Result<T>(Error(std::move(message)));
    }
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) {
        return {};
    }
    return result.error().to_string();
}

} // namespace gemtab
