#pragma once

#include "protocol/ErrorCode.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace walletgate::domain {

/**
 * @brief Результат операции: значение или код ошибки протокола
 *
 * Ожидаемые отказы (не найдено, нет прав, лимит) возвращаются через
 * Result, исключения для них не используются.
 */
template <typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result fail(protocol::ErrorCode code,
                       std::string message,
                       std::optional<std::chrono::seconds> retryAfter = std::nullopt) {
        Result r;
        r.error_ = code;
        r.message_ = std::move(message);
        r.retryAfter_ = retryAfter;
        return r;
    }

    /// Перенос ошибки из результата другого типа
    template <typename U>
    static Result failFrom(const Result<U>& other) {
        return fail(other.error(), other.message(), other.retryAfter());
    }

    bool isOk() const { return value_.has_value(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result has no value: " + message_);
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Result has no value: " + message_);
        }
        return *value_;
    }

    protocol::ErrorCode error() const { return error_; }
    const std::string& message() const { return message_; }
    std::optional<std::chrono::seconds> retryAfter() const { return retryAfter_; }

private:
    Result() = default;

    std::optional<T> value_;
    protocol::ErrorCode error_ = protocol::ErrorCode::NONE;
    std::string message_;
    std::optional<std::chrono::seconds> retryAfter_;
};

} // namespace walletgate::domain
