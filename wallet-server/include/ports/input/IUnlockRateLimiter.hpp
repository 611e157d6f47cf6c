#pragma once

#include "domain/RateLimitRecord.hpp"
#include "domain/Timestamp.hpp"
#include "protocol/ErrorCode.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace walletgate::ports::input {

/**
 * @brief Решение ограничителя: можно ли проверять пароль
 */
struct AttemptDecision {
    bool allowed = true;
    protocol::ErrorCode error = protocol::ErrorCode::NONE;  ///< TOO_MANY_ATTEMPTS или ACCOUNT_LOCKED
    std::chrono::seconds retryAfter{0};
    std::string message;
};

/**
 * @brief Защита разблокировки кошелька от перебора
 */
class IUnlockRateLimiter {
public:
    virtual ~IUnlockRateLimiter() = default;

    /// Отказ не расходует попытку
    virtual AttemptDecision checkAttempt(const std::string& source) = 0;

    virtual void recordFailure(const std::string& source) = 0;

    /// Полный сброс записи источника
    virtual void recordSuccess(const std::string& source) = 0;

    virtual size_t sweep(domain::TimePoint now) = 0;

    virtual std::optional<domain::RateLimitRecord> find(const std::string& source) const = 0;
};

} // namespace walletgate::ports::input
