/**
 * @file Result.hpp
 * @brief Value-or-error return type.
 *
 * Operations that can fail return Result<T> instead of throwing. The error
 * side carries a human-readable message that ends up in logs and in
 * recording error events.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace evc {

struct Error {
    std::string message;
};

template <typename T>
class [[nodiscard]] Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message)});
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
        if (!isOk())
            throw std::runtime_error("Result::value() on error: " +
                                     error().message);
        return std::get<T>(data_);
    }
    const T& value() const {
        if (!isOk())
            throw std::runtime_error("Result::value() on error: " +
                                     error().message);
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

    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {
    }
    explicit Result(Error error) : data_(std::move(error)) {
    }

    std::variant<T, Error> data_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message)});
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
    explicit Result(Error error) : error_(std::move(error)) {
    }

    std::optional<Error> error_;
};

} // namespace evc
