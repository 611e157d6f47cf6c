#pragma once

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

namespace walletgate::settings {

/**
 * @brief Параметры встроенного тестового кошелька
 *
 * Сеть не имеет значения по умолчанию: без WALLETGATE_NETWORK_URL и
 * WALLETGATE_CHAIN_ID сервер стартует, но операции с цепочкой
 * отвечают NETWORK_ERROR до WalletService::configureNetwork.
 */
class WalletSettings {
public:
    WalletSettings() {
        if (const char* val = std::getenv("WALLETGATE_NETWORK_URL")) {
            networkUrl_ = val;
        }
        if (const char* val = std::getenv("WALLETGATE_CHAIN_ID")) {
            chainId_ = val;
        }
        if (const char* val = std::getenv("WALLETGATE_WALLET_ADDRESS")) {
            address_ = val;
        }
        if (const char* val = std::getenv("WALLETGATE_WALLET_PASSWORD")) {
            password_ = val;
        }
    }

    const std::optional<std::string>& getNetworkUrl() const { return networkUrl_; }
    const std::optional<std::string>& getChainId() const { return chainId_; }
    std::string getAddress() const { return address_; }
    std::string getPassword() const { return password_; }

    void setNetwork(std::string networkUrl, std::string chainId) {
        networkUrl_ = std::move(networkUrl);
        chainId_ = std::move(chainId);
    }

private:
    std::optional<std::string> networkUrl_;
    std::optional<std::string> chainId_;
    std::string address_ = "7fa496ca2438e487cc45a8a27fd95b2efe373223f7b72868fbab205d686be48e";
    std::string password_ = "demo-password";
};

} // namespace walletgate::settings
