#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mdtypst {

//=============================================================================
// Error - message with an optional chain of causes
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)), _cause(std::make_shared<Error>(cause)) {}

    const std::string& message() const { return _message; }
    const std::shared_ptr<Error>& cause() const { return _cause; }

    // "outer: inner: innermost"
    std::string to_string() const {
        std::string out = _message;
        for (auto c = _cause; c; c = c->_cause) {
            if (c->_message.empty()) continue;
            out += out.empty() ? "" : ": ";
            out += c->_message;
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<Error> _cause;
};

template<typename T>
struct OkValue {
    T value;
};

template<typename T>
class [[nodiscard]] Result {
public:
    using value_type = T;

    template<typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&>>>
    Result(OkValue<U>&& ok) : _data(std::in_place_index<0>, std::move(ok.value)) {}

    Result(Error error) : _data(std::in_place_index<1>, std::move(error)) {}

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

    template<typename U>
    T value_or(U&& fallback) const& {
        return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

    const Error& error() const { return std::get<1>(_data); }

private:
    std::variant<T, Error> _data;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(OkValue<std::monostate>&&) {}
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const noexcept { return !_error.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

//-----------------------------------------------------------------------------
// Constructors
//-----------------------------------------------------------------------------

inline OkValue<std::monostate> Ok() { return {}; }

template<typename T>
OkValue<std::decay_t<T>> Ok(T&& value) {
    return OkValue<std::decay_t<T>>{std::forward<T>(value)};
}

template<typename T = void>
Result<T> Err(std::string message) {
    return Result<T>(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    if (cause) return Result<T>(Error(std::move(message)));
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    return result ? std::string() : result.error().to_string();
}

} // namespace mdtypst
