#include "client/WalletClient.hpp"

#include <HttpClient.hpp>
#include <iostream>

namespace walletgate::client {

WalletClient::WalletClient(ClientSettings settings)
    : WalletClient(std::move(settings), std::make_shared<HttpClient>())
{}

WalletClient::WalletClient(ClientSettings settings, std::shared_ptr<IHttpClient> http)
    : async_(std::move(settings), std::move(http))
{}

WalletClient::~WalletClient() {
    closeRuntime();
}

boost::asio::io_context& WalletClient::runtime() {
    if (!io_) {
        io_ = std::make_unique<boost::asio::io_context>();
        async_.bindExecutor(io_->get_executor());
        ++generation_;
        std::cout << "[WalletClient] Runtime created (generation " << generation_ << ")" << std::endl;
    }
    return *io_;
}

void WalletClient::closeRuntime() {
    std::lock_guard<std::mutex> lock(callMutex_);
    if (io_) {
        io_->stop();
        io_.reset();
    }
}

bool WalletClient::checkWalletAvailable() {
    return runMember<bool>(&AsyncWalletClient::checkWalletAvailable);
}

WalletStatus WalletClient::getWalletStatus() {
    return runMember<WalletStatus>(&AsyncWalletClient::getWalletStatus);
}

PendingAuthorization WalletClient::requestAuthorization(const std::vector<protocol::Permission>& permissions,
                                                        std::optional<std::string> description) {
    return runSync<PendingAuthorization>([&]() {
        return async_.requestAuthorization(permissions, description);
    });
}

AuthorizationOutcome WalletClient::waitForAuthorization(const std::string& requestId,
                                                        std::chrono::milliseconds timeout) {
    return runSync<AuthorizationOutcome>([&]() {
        return async_.waitForAuthorization(requestId, timeout);
    });
}

bool WalletClient::connect(const std::vector<protocol::Permission>& permissions) {
    return runSync<bool>([&]() { return async_.connect(permissions); });
}

WalletInfo WalletClient::getWalletInfo() {
    return runMember<WalletInfo>(&AsyncWalletClient::getWalletInfo);
}

std::string WalletClient::getBalance(const std::string& contract) {
    return runSync<std::string>([&]() { return async_.getBalance(contract); });
}

TransactionOutcome WalletClient::sendTransaction(const std::string& contract,
                                                 const std::string& function,
                                                 const nlohmann::json& kwargs,
                                                 std::optional<int64_t> stampsSupplied) {
    return runSync<TransactionOutcome>([&]() {
        return async_.sendTransaction(contract, function, kwargs, stampsSupplied);
    });
}

SignatureOutcome WalletClient::signMessage(const std::string& message) {
    return runSync<SignatureOutcome>([&]() { return async_.signMessage(message); });
}

bool WalletClient::addToken(const TokenInfo& token) {
    return runSync<bool>([&]() { return async_.addToken(token); });
}

std::vector<TokenInfo> WalletClient::listTokens() {
    return runMember<std::vector<TokenInfo>>(&AsyncWalletClient::listTokens);
}

bool WalletClient::revoke() {
    return runMember<bool>(&AsyncWalletClient::revoke);
}

void WalletClient::disconnect() {
    runMember<void>(&AsyncWalletClient::disconnect);
}

void WalletClient::subscribeEvents(PushSubscription::EventCallback callback) {
    async_.subscribeEvents(std::move(callback));
}

} // namespace walletgate::client
