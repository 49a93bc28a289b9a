#pragma once

#include "labsync/core/error.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace labsync {

/// Tagged success payload produced by Ok(value).
template<typename T>
struct Success {
    T value;
};

struct SuccessVoid {};

/// Tagged failure payload produced by Err(...).
template<typename E>
struct Failure {
    E error;
};

/**
 * @brief Either a value or the Error that prevented producing it
 *
 * Engine operations that can fail on remote, local-disk or configuration
 * grounds return Result rather than throwing. Callers test is_ok() before
 * touching value().
 */
template<typename T, typename E = Error>
class Result {
public:
    template<typename U>
    Result(Success<U> ok) : state_(std::in_place_index<0>, T(std::move(ok.value))) {}

    Result(Failure<E> failed) : state_(std::in_place_index<1>, std::move(failed.error)) {}

    bool is_ok() const { return state_.index() == 0; }
    bool is_error() const { return !is_ok(); }

    T& value() { return std::get<0>(state_); }
    const T& value() const { return std::get<0>(state_); }

    E& error() { return std::get<1>(state_); }
    const E& error() const { return std::get<1>(state_); }

    T value_or(T fallback) const {
        if (is_ok()) {
            return value();
        }
        return fallback;
    }

private:
    std::variant<T, E> state_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(SuccessVoid) {}
    Result(Failure<E> failed) : error_(std::move(failed.error)) {}

    bool is_ok() const { return !error_; }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

template<typename T>
Success<T> Ok(T value) { return Success<T>{std::move(value)}; }

inline SuccessVoid Ok() { return {}; }

template<typename E>
Failure<E> Err(E error) { return Failure<E>{std::move(error)}; }

inline Failure<Error> Err(ErrorKind kind, std::string message) {
    return Failure<Error>{Error(kind, std::move(message))};
}

} // namespace labsync
