#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace guestdrop {

// Wrappers returned by Ok()/Err() so a single call site converts into any
// Result<T, E> without spelling out both template arguments.
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

struct OkUnit {};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, T> && std::is_convertible_v<U, T>>>
    Result(OkValue<U> ok) : data_(std::in_place_index<0>, static_cast<T>(std::move(ok.value))) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, E> && std::is_convertible_v<U, E>>>
    Result(ErrValue<U> err) : data_(std::in_place_index<1>, E(std::move(err.error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(OkUnit) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    template<typename U,
             typename = std::enable_if_t<!std::is_same_v<U, E> && std::is_convertible_v<U, E>>>
    Result(ErrValue<U> err) : error_(E(std::move(err.error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
OkValue<std::decay_t<T>> Ok(T&& value) { return OkValue<std::decay_t<T>>(std::forward<T>(value)); }

inline OkUnit Ok() { return {}; }

template<typename E>
ErrValue<std::decay_t<E>> Err(E&& error) { return ErrValue<std::decay_t<E>>(std::forward<E>(error)); }

} // namespace guestdrop
