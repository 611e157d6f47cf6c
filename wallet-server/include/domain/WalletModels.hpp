#pragma once

#include "protocol/WalletType.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace walletgate::domain {

/**
 * @brief Публичное состояние кошелька
 */
struct WalletState {
    bool available = true;
    bool locked = true;
    protocol::WalletType walletType = protocol::WalletType::DESKTOP;
    std::string network;
    std::string chainId;
    std::string address;

    /// "abcd1234...wxyz" для отображения
    std::string truncatedAddress() const {
        if (address.size() <= 16) {
            return address;
        }
        return address.substr(0, 8) + "..." + address.substr(address.size() - 8);
    }
};

/**
 * @brief Узел сети и идентификатор цепочки
 *
 * Оба значения необязательны при старте. Операции с цепочкой
 * требуют, чтобы были заданы оба.
 */
struct NetworkConfig {
    std::optional<std::string> networkUrl;
    std::optional<std::string> chainId;

    bool isComplete() const { return networkUrl.has_value() && chainId.has_value(); }
};

/**
 * @brief Вызов контракта
 */
struct TransactionRequest {
    std::string contract;
    std::string function;
    nlohmann::json kwargs = nlohmann::json::object();
    std::optional<int64_t> stampsSupplied;
};

struct TransactionResult {
    bool success = false;
    std::string transactionHash;
    nlohmann::json result;                  ///< Ответ цепочки как есть
    std::vector<std::string> errors;
};

struct SignatureResult {
    std::string signature;
    std::string message;
    std::string address;
};

/**
 * @brief Пользовательский токен, добавленный через /tokens/add
 */
struct TokenInfo {
    std::string contractAddress;
    std::string tokenName;
    std::string tokenSymbol;
    int decimals = 8;
};

} // namespace walletgate::domain
