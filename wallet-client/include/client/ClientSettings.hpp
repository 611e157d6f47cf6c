#pragma once

#include "protocol/ProtocolConstants.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace walletgate::client {

/**
 * @brief Параметры DApp клиента
 */
struct ClientSettings {
    std::string appName;
    std::string appUrl;
    std::string host = protocol::config::DEFAULT_HOST;
    uint16_t port = protocol::config::DEFAULT_PORT;

    /// Пауза между опросами /auth/status
    std::chrono::milliseconds pollInterval{500};

    /// Сколько connect() ждёт решения пользователя
    std::chrono::milliseconds requestTimeout{
        std::chrono::seconds(protocol::config::REQUEST_TIMEOUT_SECONDS)};

    std::chrono::milliseconds cacheTtl{
        std::chrono::seconds(protocol::config::CACHE_TTL_SECONDS)};

    /// Сколько ответов держит локальный кэш
    size_t cacheCapacity = 256;
};

} // namespace walletgate::client
