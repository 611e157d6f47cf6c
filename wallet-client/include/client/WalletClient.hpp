#pragma once

#include "client/AsyncWalletClient.hpp"

#include <boost/asio/io_context.hpp>
#include <future>
#include <memory>
#include <mutex>

namespace walletgate::client {

/**
 * @brief Синхронный фасад над AsyncWalletClient
 *
 * Владеет собственным io_context, который создаётся при первом вызове.
 * Каждый метод запускает асинхронную операцию и крутит этот io_context
 * до её завершения. После closeRuntime() следующий вызов создаёт
 * новый io_context, сессия и кэш при этом сохраняются.
 */
class WalletClient {
public:
    explicit WalletClient(ClientSettings settings);
    WalletClient(ClientSettings settings, std::shared_ptr<IHttpClient> http);
    ~WalletClient();

    WalletClient(const WalletClient&) = delete;
    WalletClient& operator=(const WalletClient&) = delete;

    bool checkWalletAvailable();
    WalletStatus getWalletStatus();

    PendingAuthorization requestAuthorization(const std::vector<protocol::Permission>& permissions,
                                              std::optional<std::string> description = std::nullopt);

    /// Таймаут возвращается как outcome.status == PENDING, а не исключением
    AuthorizationOutcome waitForAuthorization(const std::string& requestId,
                                              std::chrono::milliseconds timeout);

    bool connect(const std::vector<protocol::Permission>& permissions);

    WalletInfo getWalletInfo();
    std::string getBalance(const std::string& contract = "currency");
    TransactionOutcome sendTransaction(const std::string& contract,
                                       const std::string& function,
                                       const nlohmann::json& kwargs,
                                       std::optional<int64_t> stampsSupplied = std::nullopt);
    SignatureOutcome signMessage(const std::string& message);
    bool addToken(const TokenInfo& token);
    std::vector<TokenInfo> listTokens();
    bool revoke();
    void disconnect();

    void subscribeEvents(PushSubscription::EventCallback callback);

    bool isConnected() const { return async_.isConnected(); }
    std::shared_ptr<ResponseCache> cache() const { return async_.cache(); }

    /// Остановить и выбросить собственный io_context
    void closeRuntime();

    /// Сколько раз io_context создавался
    size_t runtimeGeneration() const { return generation_; }

private:
    boost::asio::io_context& runtime();

    template <typename T>
    T runMember(std::future<T> (AsyncWalletClient::*start)()) {
        return runSync<T>([this, start]() { return (async_.*start)(); });
    }

    template <typename T, typename Start>
    T runSync(Start&& start) {
        std::lock_guard<std::mutex> lock(callMutex_);
        auto& io = runtime();
        io.restart();
        std::future<T> future = start();
        io.run();
        return future.get();
    }

    AsyncWalletClient async_;
    std::unique_ptr<boost::asio::io_context> io_;
    size_t generation_ = 0;
    std::mutex callMutex_;
};

} // namespace walletgate::client
