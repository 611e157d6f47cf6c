#pragma once

#include "domain/WalletModels.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace walletgate::ports::output {

/**
 * @brief Сбой связи с внешним клиентом цепочки
 */
class WalletBackendError : public std::runtime_error {
public:
    explicit WalletBackendError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Внешний кошелёк и клиент цепочки
 *
 * Хранение ключей, подпись и отправка транзакций живут за этим портом.
 * Сетевые методы бросают WalletBackendError.
 */
class IWalletBackend {
public:
    virtual ~IWalletBackend() = default;

    virtual domain::WalletState state() = 0;

    /// @return false если пароль неверный (кошелёк остаётся заблокированным)
    virtual bool unlock(const std::string& password) = 0;
    virtual void lock() = 0;

    virtual std::string getBalance(const std::string& contract) = 0;
    virtual domain::TransactionResult sendTransaction(const domain::TransactionRequest& request) = 0;
    virtual domain::SignatureResult signMessage(const std::string& message) = 0;

    virtual void addToken(const domain::TokenInfo& token) = 0;
    virtual std::vector<domain::TokenInfo> listTokens() = 0;
};

} // namespace walletgate::ports::output
