#pragma once

#include "ResponseCache.hpp"
#include "ports/input/IUnlockRateLimiter.hpp"
#include "ports/input/IWalletService.hpp"
#include "ports/output/INotificationBus.hpp"
#include "ports/output/IWalletBackend.hpp"
#include "settings/ProtocolSettings.hpp"
#include "settings/WalletSettings.hpp"

#include <iostream>
#include <memory>
#include <mutex>

namespace walletgate::application {

/**
 * @brief Операции над кошельком поверх внешнего клиента цепочки
 *
 * Балансы кэшируются на cacheTtl, успешная транзакция сбрасывает
 * все "balance:*" записи, блокировка кошелька сбрасывает кэш целиком.
 *
 * Сеть берётся из WalletSettings и может быть перенастроена через
 * configureNetwork. Пока не заданы и URL, и chain id, операции с
 * цепочкой отвечают NETWORK_ERROR "Network configuration not set".
 */
class WalletService : public ports::input::IWalletService {
public:
    WalletService(std::shared_ptr<settings::ProtocolSettings> settings,
                  std::shared_ptr<settings::WalletSettings> walletSettings,
                  std::shared_ptr<ports::output::IWalletBackend> backend,
                  std::shared_ptr<ports::input::IUnlockRateLimiter> limiter,
                  std::shared_ptr<ports::output::INotificationBus> bus,
                  std::shared_ptr<ResponseCache> cache)
        : settings_(std::move(settings))
        , backend_(std::move(backend))
        , limiter_(std::move(limiter))
        , bus_(std::move(bus))
        , cache_(std::move(cache))
    {
        network_.networkUrl = walletSettings->getNetworkUrl();
        network_.chainId = walletSettings->getChainId();
        std::cout << "[WalletService] Created, network: "
                  << (network_.isComplete() ? *network_.chainId : std::string("not configured")) << std::endl;
    }

    domain::WalletState status() override {
        auto state = backend_->state();
        state.walletType = settings_->getWalletType();

        auto current = network();
        state.network = current.networkUrl.value_or("");
        state.chainId = current.chainId.value_or("");
        return state;
    }

    void configureNetwork(const std::string& networkUrl, const std::string& chainId) override {
        {
            std::lock_guard<std::mutex> lock(networkMutex_);
            network_.networkUrl = networkUrl.empty() ? std::nullopt : std::optional<std::string>(networkUrl);
            network_.chainId = chainId.empty() ? std::nullopt : std::optional<std::string>(chainId);
        }
        // Балансы из прежней сети больше не верны
        cache_->clearMatching("balance:");
        std::cout << "[WalletService] Network configured: " << networkUrl << " (" << chainId << ")" << std::endl;
    }

    domain::NetworkConfig network() const override {
        std::lock_guard<std::mutex> lock(networkMutex_);
        return network_;
    }

    domain::Result<domain::WalletState> unlock(const std::string& password, const std::string& source) override {
        using R = domain::Result<domain::WalletState>;

        {
            // Проверка лимита, пароля и запись результата не должны перемежаться
            std::lock_guard<std::mutex> lock(unlockMutex_);

            auto decision = limiter_->checkAttempt(source);
            if (!decision.allowed) {
                std::cout << "[WalletService] Unlock rejected for " << source
                          << ": " << protocol::toString(decision.error) << std::endl;
                return R::fail(decision.error, decision.message, decision.retryAfter);
            }

            if (!backend_->unlock(password)) {
                limiter_->recordFailure(source);
                std::cout << "[WalletService] Invalid unlock password from " << source << std::endl;
                return R::fail(protocol::ErrorCode::UNAUTHORIZED, "Invalid password");
            }

            limiter_->recordSuccess(source);
        }

        std::cout << "[WalletService] Wallet unlocked" << std::endl;
        bus_->publish(domain::WalletLockChangedEvent(false));
        return R::ok(status());
    }

    domain::WalletState lock() override {
        backend_->lock();
        cache_->clear();
        std::cout << "[WalletService] Wallet locked" << std::endl;
        bus_->publish(domain::WalletLockChangedEvent(true));
        return status();
    }

    domain::Result<std::string> balance(const std::string& contract) override {
        using R = domain::Result<std::string>;

        if (backend_->state().locked) {
            return lockedError<std::string>();
        }
        if (!network().isComplete()) {
            return networkError<std::string>();
        }

        const std::string key = "balance:" + contract;
        if (auto cached = cache_->get(key, settings_->getCacheTtl())) {
            return R::ok(*cached);
        }

        try {
            auto value = backend_->getBalance(contract);
            cache_->set(key, value);
            return R::ok(value);
        } catch (const ports::output::WalletBackendError& e) {
            std::cerr << "[WalletService] Balance query failed: " << e.what() << std::endl;
            return R::fail(protocol::ErrorCode::NETWORK_ERROR, e.what());
        }
    }

    domain::Result<domain::TransactionResult> sendTransaction(const domain::TransactionRequest& request) override {
        using R = domain::Result<domain::TransactionResult>;

        if (backend_->state().locked) {
            return lockedError<domain::TransactionResult>();
        }
        if (!network().isComplete()) {
            return networkError<domain::TransactionResult>();
        }

        domain::TransactionResult result;
        try {
            result = backend_->sendTransaction(request);
        } catch (const ports::output::WalletBackendError& e) {
            std::cerr << "[WalletService] Transaction submit failed: " << e.what() << std::endl;
            return R::fail(protocol::ErrorCode::NETWORK_ERROR, e.what());
        }

        if (!result.success) {
            std::string message = "Transaction failed";
            for (const auto& error : result.errors) {
                message += (message == "Transaction failed" ? ": " : "; ") + error;
            }
            return R::fail(protocol::ErrorCode::TRANSACTION_FAILED, message);
        }

        size_t dropped = cache_->clearMatching("balance:");
        std::cout << "[WalletService] Transaction sent: " << result.transactionHash
                  << " (dropped " << dropped << " cached balances)" << std::endl;
        return R::ok(result);
    }

    domain::Result<domain::SignatureResult> signMessage(const std::string& message) override {
        using R = domain::Result<domain::SignatureResult>;

        if (backend_->state().locked) {
            return lockedError<domain::SignatureResult>();
        }
        if (!network().isComplete()) {
            return networkError<domain::SignatureResult>();
        }

        try {
            return R::ok(backend_->signMessage(message));
        } catch (const ports::output::WalletBackendError& e) {
            std::cerr << "[WalletService] Signing failed: " << e.what() << std::endl;
            return R::fail(protocol::ErrorCode::NETWORK_ERROR, e.what());
        }
    }

    domain::Result<domain::TokenInfo> addToken(const domain::TokenInfo& token) override {
        using R = domain::Result<domain::TokenInfo>;

        if (backend_->state().locked) {
            return lockedError<domain::TokenInfo>();
        }

        try {
            backend_->addToken(token);
        } catch (const ports::output::WalletBackendError& e) {
            return R::fail(protocol::ErrorCode::NETWORK_ERROR, e.what());
        }
        std::cout << "[WalletService] Token added: " << token.contractAddress << std::endl;
        return R::ok(token);
    }

    std::vector<domain::TokenInfo> listTokens() override {
        return backend_->listTokens();
    }

private:
    std::shared_ptr<settings::ProtocolSettings> settings_;
    std::shared_ptr<ports::output::IWalletBackend> backend_;
    std::shared_ptr<ports::input::IUnlockRateLimiter> limiter_;
    std::shared_ptr<ports::output::INotificationBus> bus_;
    std::shared_ptr<ResponseCache> cache_;
    std::mutex unlockMutex_;

    mutable std::mutex networkMutex_;
    domain::NetworkConfig network_;

    template <typename T>
    static domain::Result<T> lockedError() {
        return domain::Result<T>::fail(protocol::ErrorCode::WALLET_LOCKED, "Wallet is locked");
    }

    template <typename T>
    static domain::Result<T> networkError() {
        return domain::Result<T>::fail(protocol::ErrorCode::NETWORK_ERROR, "Network configuration not set");
    }
};

} // namespace walletgate::application
