#pragma once

#include "domain/Result.hpp"
#include "domain/WalletModels.hpp"

#include <string>
#include <vector>

namespace walletgate::ports::input {

/**
 * @brief Операции над кошельком, доступные через API
 *
 * Проверка сессии выполняется до вызова (middleware),
 * здесь только состояние кошелька и кэш.
 */
class IWalletService {
public:
    virtual ~IWalletService() = default;

    /// Состояние кошелька вместе с текущей сетью
    virtual domain::WalletState status() = 0;

    /**
     * @brief Задать или сменить сеть во время работы
     *
     * Пустая строка оставляет значение незаданным.
     */
    virtual void configureNetwork(const std::string& networkUrl, const std::string& chainId) = 0;
    virtual domain::NetworkConfig network() const = 0;

    /**
     * @brief Разблокировать кошелёк
     * @param source Ключ ограничителя попыток (IP вызывающего)
     * Ошибки: TOO_MANY_ATTEMPTS, ACCOUNT_LOCKED, UNAUTHORIZED (неверный пароль).
     */
    virtual domain::Result<domain::WalletState> unlock(const std::string& password, const std::string& source) = 0;

    /// Заблокировать и сбросить кэш ответов
    virtual domain::WalletState lock() = 0;

    /// Балансу, транзакции и подписи нужна заданная сеть, иначе NETWORK_ERROR
    virtual domain::Result<std::string> balance(const std::string& contract) = 0;
    virtual domain::Result<domain::TransactionResult> sendTransaction(const domain::TransactionRequest& request) = 0;
    virtual domain::Result<domain::SignatureResult> signMessage(const std::string& message) = 0;
    virtual domain::Result<domain::TokenInfo> addToken(const domain::TokenInfo& token) = 0;
    virtual std::vector<domain::TokenInfo> listTokens() = 0;
};

} // namespace walletgate::ports::input
