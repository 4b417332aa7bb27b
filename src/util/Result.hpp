/**
 * @file Result.hpp
 * @brief Value-or-error return type used instead of exceptions.
 *
 * Result<T> holds either a value or an Error. Errors carry a message and an
 * optional numeric code so callers can branch on a domain enum
 * (e.g. RecorderError) without parsing strings.
 */

#pragma once
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include "Types.hpp"

namespace mc {

struct Error {
    std::string message;
    i32 code{0};

    template <typename E>
        requires std::is_enum_v<E>
    bool is(E e) const {
        return code == static_cast<i32>(e);
    }
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message), 0});
    }
    template <typename E>
        requires std::is_enum_v<E>
    static Result err(E code, std::string message) {
        return Result(Error{std::move(message), static_cast<i32>(code)});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() {
        return std::get<T>(data_);
    }
    const T& value() const {
        return std::get<T>(data_);
    }
    T& operator*() {
        return value();
    }
    const T& operator*() const {
        return value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    T valueOr(T fallback) const {
        return isOk() ? value() : std::move(fallback);
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Error error) : data_(std::move(error)) {}

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message), 0});
    }
    template <typename E>
        requires std::is_enum_v<E>
    static Result err(E code, std::string message) {
        return Result(Error{std::move(message), static_cast<i32>(code)});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return *error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : error_(std::move(error)) {}

    std::optional<Error> error_;
};

} // namespace mc
