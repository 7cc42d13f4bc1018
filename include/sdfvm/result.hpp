#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sdfvm {

//=============================================================================
// Error - message plus optional causing error
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message))
        , _cause(std::make_shared<Error>(std::move(cause))) {}

    const std::string& message() const noexcept { return _message; }
    const Error* cause() const noexcept { return _cause.get(); }

    // "outer: inner: innermost"
    std::string fullMessage() const {
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

//=============================================================================
// Result<T> - value or Error
//=============================================================================
template<typename T>
class [[nodiscard]] Result {
public:
    using value_type = T;

    Result(T value) : _state(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : _state(std::in_place_index<1>, std::move(error)) {}

    // Result<shared_ptr<Impl>> -> Result<shared_ptr<Interface>>
    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> &&
                                         std::is_convertible_v<U, T>>>
    Result(Result<U> other)
        : _state(other ? State(std::in_place_index<0>, T(std::move(*other)))
                       : State(std::in_place_index<1>, other.error())) {}

    bool has_value() const noexcept { return _state.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    T& value() & { return std::get<0>(_state); }
    const T& value() const& { return std::get<0>(_state); }
    T&& value() && { return std::get<0>(std::move(_state)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_state); }

private:
    using State = std::variant<T, Error>;
    State _state;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(Error error) : _error(std::make_shared<Error>(std::move(error))) {}

    bool has_value() const noexcept { return _error == nullptr; }
    explicit operator bool() const noexcept { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::shared_ptr<Error> _error;
};

//=============================================================================
// Constructors
//=============================================================================
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
    if (cause) return Result<T>(Error(std::move(message)));
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().fullMessage();
}

} // namespace sdfvm
