#pragma once

#include "protocol/RequestStatus.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace walletgate::client {

/// GET /wallet/status
struct WalletStatus {
    bool available = false;
    bool locked = true;
    std::string walletType;
    std::string network;
    std::string chainId;
    std::string version;

    static WalletStatus fromJson(const nlohmann::json& json) {
        WalletStatus status;
        status.available = json.value("available", false);
        status.locked = json.value("locked", true);
        status.walletType = json.value("wallet_type", "");
        status.network = json.value("network", "");
        status.chainId = json.value("chain_id", "");
        status.version = json.value("version", "");
        return status;
    }
};

/// GET /wallet/info
struct WalletInfo {
    std::string address;
    std::string truncatedAddress;
    bool locked = true;
    std::string chainId;
    std::string network;
    std::string walletType;
    std::string version;

    static WalletInfo fromJson(const nlohmann::json& json) {
        WalletInfo info;
        info.address = json.value("address", "");
        info.truncatedAddress = json.value("truncated_address", "");
        info.locked = json.value("locked", true);
        info.chainId = json.value("chain_id", "");
        info.network = json.value("network", "");
        info.walletType = json.value("wallet_type", "");
        info.version = json.value("version", "");
        return info;
    }
};

/**
 * @brief Ответ на POST /auth/request
 */
struct PendingAuthorization {
    std::string requestId;
    std::string appName;
    protocol::RequestStatus status = protocol::RequestStatus::PENDING;
};

/**
 * @brief Итог ожидания решения пользователя
 *
 * status = PENDING означает, что ожидание закончилось раньше решения:
 * по таймауту (timedOut) или через cancelWait() (cancelled).
 */
struct AuthorizationOutcome {
    std::string requestId;
    protocol::RequestStatus status = protocol::RequestStatus::PENDING;
    std::string sessionToken;
    std::vector<std::string> permissions;
    std::string expiresAt;
    bool timedOut = false;
    bool cancelled = false;

    bool approved() const { return status == protocol::RequestStatus::APPROVED; }
};

struct TransactionOutcome {
    bool success = false;
    std::string transactionHash;
    nlohmann::json result;
    std::vector<std::string> errors;

    static TransactionOutcome fromJson(const nlohmann::json& json) {
        TransactionOutcome outcome;
        outcome.success = json.value("success", false);
        outcome.transactionHash = json.value("transaction_hash", "");
        outcome.result = json.value("result", nlohmann::json());
        outcome.errors = json.value("errors", std::vector<std::string>{});
        return outcome;
    }
};

struct SignatureOutcome {
    std::string signature;
    std::string message;
    std::string address;
};

struct TokenInfo {
    std::string contractAddress;
    std::string tokenName;
    std::string tokenSymbol;
    int decimals = 8;

    nlohmann::json toJson() const {
        return {
            {"contract_address", contractAddress},
            {"token_name", tokenName},
            {"token_symbol", tokenSymbol},
            {"decimals", decimals}
        };
    }

    static TokenInfo fromJson(const nlohmann::json& json) {
        TokenInfo token;
        token.contractAddress = json.value("contract_address", "");
        token.tokenName = json.value("token_name", "");
        token.tokenSymbol = json.value("token_symbol", "");
        token.decimals = json.value("decimals", 8);
        return token;
    }
};

} // namespace walletgate::client
