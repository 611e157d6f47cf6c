#pragma once

#include <cstdint>
#include <string>

namespace walletgate::protocol {

/**
 * @brief Константы протокола
 */
namespace config {
    constexpr const char* DEFAULT_HOST = "127.0.0.1";
    constexpr uint16_t DEFAULT_PORT = 8545;
    constexpr const char* API_VERSION = "v1";
    constexpr const char* PROTOCOL_VERSION = "1.0.0";
    constexpr int SESSION_TIMEOUT_MINUTES = 60;
    constexpr int REQUEST_TIMEOUT_SECONDS = 300;
    constexpr size_t MAX_SESSIONS = 10;
    constexpr int CACHE_TTL_SECONDS = 30;
}

/**
 * @brief Пути API
 *
 * "*" означает сегмент пути, который хэндлер читает через getPathParam(0).
 */
namespace endpoints {
    constexpr const char* WALLET_STATUS = "/api/v1/wallet/status";
    constexpr const char* WALLET_INFO = "/api/v1/wallet/info";
    constexpr const char* WALLET_UNLOCK = "/api/v1/wallet/unlock";
    constexpr const char* WALLET_LOCK = "/api/v1/wallet/lock";

    constexpr const char* AUTH_REQUEST = "/api/v1/auth/request";
    constexpr const char* AUTH_STATUS = "/api/v1/auth/status/*";
    constexpr const char* AUTH_APPROVE = "/api/v1/auth/approve/*";
    constexpr const char* AUTH_DENY = "/api/v1/auth/deny/*";
    constexpr const char* AUTH_PENDING = "/api/v1/auth/pending";
    constexpr const char* AUTH_REVOKE = "/api/v1/auth/revoke";

    constexpr const char* BALANCE = "/api/v1/balance/*";
    constexpr const char* TRANSACTION = "/api/v1/transaction";
    constexpr const char* SIGN_MESSAGE = "/api/v1/sign";
    constexpr const char* ADD_TOKEN = "/api/v1/tokens/add";
    constexpr const char* LIST_TOKENS = "/api/v1/tokens";

    constexpr const char* WEBSOCKET = "/ws/v1";

    /**
     * @brief Подставить значение вместо "*"
     */
    inline std::string withParam(const std::string& pattern, const std::string& value) {
        auto pos = pattern.find('*');
        if (pos == std::string::npos) {
            return pattern;
        }
        return pattern.substr(0, pos) + value + pattern.substr(pos + 1);
    }
}

} // namespace walletgate::protocol
