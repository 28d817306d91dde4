#pragma once

//=============================================================================
// Result<T>
//
// Value-or-error return type used by every fallible operation in cavern.
// Errors carry a message and an optional cause, so callers can wrap a
// failure with their own context:
//
//   if (auto res = loadFile(path); !res) {
//       return Err<void>("Failed to load config", res);
//   }
//=============================================================================

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace cavern {

class Error {
public:
    Error() = default;
    explicit Error(std::string message, std::shared_ptr<const Error> cause = nullptr)
        : _message(std::move(message)), _cause(std::move(cause)) {}

    const std::string& message() const noexcept { return _message; }
    const std::shared_ptr<const Error>& cause() const noexcept { return _cause; }

    // "outer: inner: innermost"
    std::string fullMessage() const {
        std::string out = _message;
        for (auto c = _cause; c; c = c->cause()) {
            out += ": ";
            out += c->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
class [[nodiscard]] Result {
public:
    using ValueType = T;

    Result(const T& value) : _data(std::in_place_index<0>, value) {}
    Result(T&& value) : _data(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _data(std::in_place_index<1>, std::move(error)) {}

    // Result<shared_ptr<Impl>> -> Result<shared_ptr<Interface>>
    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> && std::is_convertible_v<U, T>>>
    Result(Result<U>&& other)
        : _data(other ? Data(std::in_place_index<0>, T(std::move(*other)))
                      : Data(std::in_place_index<1>, other.error())) {}

    bool has_value() const noexcept { return _data.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    T& value() & { return std::get<0>(_data); }
    const T& value() const& { return std::get<0>(_data); }
    T&& value() && { return std::get<0>(std::move(_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_data); }

private:
    using Data = std::variant<T, Error>;
    Data _data;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using ValueType = void;

    Result() = default;
    Result(Error error) : _error(std::make_shared<Error>(std::move(error))) {}

    bool has_value() const noexcept { return !_error; }
    explicit operator bool() const noexcept { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::shared_ptr<Error> _error;
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
    auto inner = cause ? nullptr : std::make_shared<const Error>(cause.error());
    return Result<T>(Error(std::move(message), std::move(inner)));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().fullMessage();
}

} // namespace cavern
