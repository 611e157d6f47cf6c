#pragma once

#include "protocol/ProtocolConstants.hpp"
#include "protocol/WalletType.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

namespace walletgate::settings {

/**
 * @brief Лимиты и таймауты протокола авторизации
 */
class ProtocolSettings {
public:
    ProtocolSettings() {
        if (const char* val = std::getenv("WALLETGATE_MAX_SESSIONS")) {
            maxSessions_ = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("WALLETGATE_MAX_PENDING_REQUESTS")) {
            maxPendingRequests_ = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("WALLETGATE_SESSION_TIMEOUT_MINUTES")) {
            sessionTimeout_ = std::chrono::minutes(std::stoi(val));
        }
        if (const char* val = std::getenv("WALLETGATE_SESSION_IDLE_MINUTES")) {
            sessionIdleTimeout_ = std::chrono::minutes(std::stoi(val));
        }
        if (const char* val = std::getenv("WALLETGATE_REQUEST_TIMEOUT_SECONDS")) {
            requestTimeout_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("WALLETGATE_CACHE_TTL_SECONDS")) {
            cacheTtl_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("WALLETGATE_CACHE_CAPACITY")) {
            cacheCapacity_ = static_cast<size_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("WALLETGATE_SWEEP_INTERVAL_SECONDS")) {
            sweepInterval_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("WALLETGATE_STARTUP_RETRIES")) {
            startupRetries_ = std::stoi(val);
        }
        if (const char* val = std::getenv("WALLETGATE_WALLET_TYPE")) {
            walletType_ = protocol::walletTypeFromString(val);
        }
        if (const char* val = std::getenv("WALLETGATE_LOCAL_ONLY_ADMIN")) {
            localOnlyAdmin_ = std::string(val) != "false" && std::string(val) != "0";
        }
    }

    size_t getMaxSessions() const { return maxSessions_; }
    size_t getMaxPendingRequests() const { return maxPendingRequests_; }
    std::chrono::minutes getSessionTimeout() const { return sessionTimeout_; }
    /// 0 означает, что простой сессии не ограничен
    std::chrono::minutes getSessionIdleTimeout() const { return sessionIdleTimeout_; }
    std::chrono::seconds getRequestTimeout() const { return requestTimeout_; }
    std::chrono::seconds getCacheTtl() const { return cacheTtl_; }
    size_t getCacheCapacity() const { return cacheCapacity_; }
    std::chrono::seconds getSweepInterval() const { return sweepInterval_; }
    int getStartupRetries() const { return startupRetries_; }
    protocol::WalletType getWalletType() const { return walletType_; }
    bool isLocalOnlyAdmin() const { return localOnlyAdmin_; }

    // Для тестов
    void setMaxSessions(size_t value) { maxSessions_ = value; }
    void setMaxPendingRequests(size_t value) { maxPendingRequests_ = value; }
    void setSessionTimeout(std::chrono::minutes value) { sessionTimeout_ = value; }
    void setSessionIdleTimeout(std::chrono::minutes value) { sessionIdleTimeout_ = value; }
    void setRequestTimeout(std::chrono::seconds value) { requestTimeout_ = value; }
    void setCacheCapacity(size_t value) { cacheCapacity_ = value; }
    void setSweepInterval(std::chrono::seconds value) { sweepInterval_ = value; }
    void setLocalOnlyAdmin(bool value) { localOnlyAdmin_ = value; }
    void setStartupRetries(int value) { startupRetries_ = value; }

private:
    size_t maxSessions_ = protocol::config::MAX_SESSIONS;
    size_t maxPendingRequests_ = protocol::config::MAX_SESSIONS;
    std::chrono::minutes sessionTimeout_{protocol::config::SESSION_TIMEOUT_MINUTES};
    std::chrono::minutes sessionIdleTimeout_{0};
    std::chrono::seconds requestTimeout_{protocol::config::REQUEST_TIMEOUT_SECONDS};
    std::chrono::seconds cacheTtl_{protocol::config::CACHE_TTL_SECONDS};
    size_t cacheCapacity_ = 1000;
    std::chrono::seconds sweepInterval_{60};
    int startupRetries_ = 3;
    protocol::WalletType walletType_ = protocol::WalletType::DESKTOP;
    bool localOnlyAdmin_ = true;
};

} // namespace walletgate::settings
