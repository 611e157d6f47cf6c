#pragma once

#include "protocol/ErrorCode.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace walletgate::client {

/**
 * @brief Ошибка, которую вернул сервер кошелька (или сеть до него)
 *
 * Для TOO_MANY_ATTEMPTS / ACCOUNT_LOCKED retryAfter() говорит,
 * сколько ждать. Клиент сам такие запросы не повторяет.
 */
class WalletProtocolError : public std::runtime_error {
public:
    WalletProtocolError(protocol::ErrorCode code,
                        int httpStatus,
                        const std::string& message,
                        std::optional<std::chrono::seconds> retryAfter = std::nullopt)
        : std::runtime_error(message)
        , code_(code)
        , httpStatus_(httpStatus)
        , retryAfter_(retryAfter)
    {}

    protocol::ErrorCode code() const { return code_; }

    /// 0 если ответа не было вовсе
    int httpStatus() const { return httpStatus_; }

    std::optional<std::chrono::seconds> retryAfter() const { return retryAfter_; }

private:
    protocol::ErrorCode code_;
    int httpStatus_;
    std::optional<std::chrono::seconds> retryAfter_;
};

} // namespace walletgate::client
