/**
 * @file FakeWalletBackend.hpp
 * @brief Встроенный кошелёк для разработки и тестов
 *
 * Ключевые особенности:
 * 1. Никакой криптографии: подпись и хэш транзакции детерминированы
 *    по содержимому, но не проверяемы
 * 2. Пароль и адрес берутся из WalletSettings, сеть задаёт WalletService
 * 3. Баланс "currency" уменьшается на kwargs.amount при transfer,
 *    чтобы было видно сброс кэша балансов
 */
#pragma once

#include "ports/output/IWalletBackend.hpp"
#include "settings/WalletSettings.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>

namespace walletgate::adapters::secondary {

constexpr double FAKE_INITIAL_BALANCE = 1000.0;

class FakeWalletBackend : public ports::output::IWalletBackend {
public:
    explicit FakeWalletBackend(std::shared_ptr<settings::WalletSettings> settings)
        : settings_(std::move(settings))
    {
        balances_["currency"] = FAKE_INITIAL_BALANCE;
        std::cout << "[FakeWalletBackend] Wallet " << settings_->getAddress().substr(0, 8)
                  << "..." << std::endl;
    }

    domain::WalletState state() override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::WalletState state;
        state.available = true;
        state.locked = locked_;
        state.address = settings_->getAddress();
        return state;
    }

    bool unlock(const std::string& password) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (password != settings_->getPassword()) {
            return false;
        }
        locked_ = false;
        return true;
    }

    void lock() override {
        std::lock_guard<std::mutex> lock(mutex_);
        locked_ = true;
    }

    std::string getBalance(const std::string& contract) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = balances_.find(contract);
        return formatAmount(it == balances_.end() ? 0.0 : it->second);
    }

    domain::TransactionResult sendTransaction(const domain::TransactionRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::TransactionResult result;

        if (request.function == "transfer") {
            double amount = request.kwargs.value("amount", 0.0);
            double& balance = balances_[request.contract];
            if (amount <= 0.0 || amount > balance) {
                result.success = false;
                result.errors.push_back("Insufficient balance or invalid amount");
                return result;
            }
            balance -= amount;
        }

        ++nonce_;
        result.success = true;
        result.transactionHash = digestHex(request.contract + ":" + request.function + ":"
                                           + request.kwargs.dump() + ":" + std::to_string(nonce_), 4);
        result.result = nlohmann::json{{"status", 0}, {"nonce", nonce_}};
        return result;
    }

    domain::SignatureResult signMessage(const std::string& message) override {
        domain::SignatureResult result;
        result.message = message;
        result.address = settings_->getAddress();
        result.signature = digestHex(result.address + ":" + message, 8);
        return result;
    }

    void addToken(const domain::TokenInfo& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_[token.contractAddress] = token;
    }

    std::vector<domain::TokenInfo> listTokens() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::TokenInfo> result;
        for (const auto& [address, token] : tokens_) {
            result.push_back(token);
        }
        return result;
    }

private:
    std::shared_ptr<settings::WalletSettings> settings_;

    std::mutex mutex_;
    bool locked_ = true;
    uint64_t nonce_ = 0;
    std::map<std::string, double> balances_;
    std::map<std::string, domain::TokenInfo> tokens_;

    static std::string formatAmount(double value) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(8) << value;
        return ss.str();
    }

    /// FNV-1a с разными затравками, blocks * 16 hex символов
    static std::string digestHex(const std::string& data, int blocks) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (int block = 0; block < blocks; ++block) {
            uint64_t hash = 1469598103934665603ULL ^ static_cast<uint64_t>(block);
            for (unsigned char c : data) {
                hash ^= c;
                hash *= 1099511628211ULL;
            }
            ss << std::setw(16) << hash;
        }
        return ss.str();
    }
};

} // namespace walletgate::adapters::secondary
