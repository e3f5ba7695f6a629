#pragma once

#include <optional>
#include <utility>
#include <variant>

#include "AppError.h"

// Outcome of a fallible operation: either a value or an AppError.
//
// Default-constructible (QFutureWatcher stores results by value); a
// default-constructed Result holds a default T.
template<typename T>
class Result {
public:
    Result() = default;
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(AppError error) : m_data(std::in_place_index<1>, std::move(error)) {}

    bool isOk() const { return m_data.index() == 0; }
    bool isErr() const { return m_data.index() == 1; }
    explicit operator bool() const { return isOk(); }

    const T& value() const { return std::get<0>(m_data); }
    T& value() { return std::get<0>(m_data); }
    T takeValue() { return std::move(std::get<0>(m_data)); }

    const AppError& error() const { return std::get<1>(m_data); }

    T valueOr(T fallback) const { return isOk() ? value() : std::move(fallback); }

    // Maps the success value, passing errors through unchanged.
    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))>
    {
        if (isErr())
            return error();
        return f(value());
    }

private:
    std::variant<T, AppError> m_data;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(AppError error) : m_error(std::move(error)) {}

    static Result ok() { return Result(); }

    bool isOk() const { return !m_error.has_value(); }
    bool isErr() const { return m_error.has_value(); }
    explicit operator bool() const { return isOk(); }

    const AppError& error() const { return *m_error; }

private:
    std::optional<AppError> m_error;
};
