#pragma once

#include "client/ClientModels.hpp"
#include "client/ClientSettings.hpp"
#include "client/PushSubscription.hpp"
#include "client/WalletProtocolError.hpp"
#include "ResponseCache.hpp"
#include "protocol/Permission.hpp"

#include <IHttpClient.hpp>
#include <SimpleResponse.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace walletgate::client {

/**
 * @brief Асинхронный клиент протокола для DApp
 *
 * Каждая операция выполняется на переданном executor и возвращает
 * std::future. Ожидание авторизации не блокирует executor: между
 * опросами стоит steady_timer.
 *
 * Клиент должен жить дольше всех своих незавершённых операций.
 */
class AsyncWalletClient {
public:
    AsyncWalletClient(ClientSettings settings,
                      std::shared_ptr<IHttpClient> http,
                      std::shared_ptr<ResponseCache> cache = nullptr);

    AsyncWalletClient(boost::asio::any_io_executor executor,
                      ClientSettings settings,
                      std::shared_ptr<IHttpClient> http,
                      std::shared_ptr<ResponseCache> cache = nullptr);

    ~AsyncWalletClient();

    /// Сменить executor для следующих операций
    void bindExecutor(boost::asio::any_io_executor executor);

    // ============================================
    // БЕЗ СЕССИИ
    // ============================================

    /// Сервер отвечает и кошелёк доступен. Никогда не бросает
    std::future<bool> checkWalletAvailable();

    std::future<WalletStatus> getWalletStatus();

    std::future<PendingAuthorization> requestAuthorization(
        const std::vector<protocol::Permission>& permissions,
        std::optional<std::string> description = std::nullopt);

    /**
     * @brief Опрашивать статус запроса до решения, таймаута или cancelWait()
     *
     * Таймаут и отмена возвращаются как обычный результат со status = PENDING.
     * Недоступность сервера во время ожидания не прерывает опрос.
     * При APPROVED клиент запоминает токен сессии.
     */
    std::future<AuthorizationOutcome> waitForAuthorization(const std::string& requestId,
                                                           std::chrono::milliseconds timeout);

    /// Завершить все текущие ожидания авторизации
    void cancelWait();

    /**
     * @brief Полный цикл подключения
     *
     * Проверка доступности, запрос, ожидание решения (requestTimeout),
     * затем загрузка wallet info в кэш. @return true если сессия получена
     */
    std::future<bool> connect(const std::vector<protocol::Permission>& permissions);

    // ============================================
    // ПО СЕССИИ
    // ============================================

    std::future<WalletInfo> getWalletInfo();
    std::future<std::string> getBalance(const std::string& contract = "currency");
    std::future<TransactionOutcome> sendTransaction(const std::string& contract,
                                                    const std::string& function,
                                                    const nlohmann::json& kwargs,
                                                    std::optional<int64_t> stampsSupplied = std::nullopt);
    std::future<SignatureOutcome> signMessage(const std::string& message);
    std::future<bool> addToken(const TokenInfo& token);
    std::future<std::vector<TokenInfo>> listTokens();

    /// Отозвать сессию на сервере и забыть токен
    std::future<bool> revoke();

    /// Забыть токен, очистить кэш, закрыть push подписку
    std::future<void> disconnect();

    /**
     * @brief Подписаться на push события
     * @throws boost::system::system_error если сервер недоступен
     */
    void subscribeEvents(PushSubscription::EventCallback callback);

    bool isConnected() const;
    std::string sessionToken() const;
    void setSessionToken(const std::string& token);

    std::shared_ptr<ResponseCache> cache() const { return cache_; }
    const ClientSettings& settings() const { return settings_; }

private:
    struct WaitOperation;
    using WaitCallback = std::function<void(std::exception_ptr, AuthorizationOutcome)>;

    template <typename F>
    auto submit(F&& fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        boost::asio::post(executor(), [task]() { (*task)(); });
        return future;
    }

    boost::asio::any_io_executor executor() const;

    // Синхронные шаги, выполняются на executor
    bool doCheckAvailable();
    PendingAuthorization doRequestAuthorization(const std::vector<protocol::Permission>& permissions,
                                                const std::optional<std::string>& description);
    WalletInfo doGetWalletInfo();

    void startWait(const std::string& requestId, std::chrono::milliseconds timeout, WaitCallback done);
    void poll(const std::shared_ptr<WaitOperation>& op);
    void finish(const std::shared_ptr<WaitOperation>& op, std::exception_ptr error, AuthorizationOutcome outcome);

    SimpleResponse call(const std::string& method, const std::string& path,
                        const std::string& body, bool withSession);
    nlohmann::json expectOk(const SimpleResponse& response);

    ClientSettings settings_;
    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<ResponseCache> cache_;

    mutable std::mutex mutex_;
    std::optional<boost::asio::any_io_executor> executor_;
    std::string sessionToken_;
    std::set<std::shared_ptr<WaitOperation>> waits_;
    std::unique_ptr<PushSubscription> push_;
};

} // namespace walletgate::client
