#include "client/AsyncWalletClient.hpp"
#include "protocol/ProtocolConstants.hpp"

#include <SimpleRequest.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>

namespace walletgate::client {

namespace net = boost::asio;
namespace endpoints = protocol::endpoints;
using protocol::ErrorCode;
using protocol::RequestStatus;

struct AsyncWalletClient::WaitOperation {
    WaitOperation(net::any_io_executor executor, std::string id,
                  std::chrono::steady_clock::time_point until, WaitCallback callback)
        : requestId(std::move(id))
        , deadline(until)
        , timer(std::move(executor))
        , done(std::move(callback))
    {}

    std::string requestId;
    std::chrono::steady_clock::time_point deadline;
    net::steady_timer timer;
    WaitCallback done;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> finished{false};
};

AsyncWalletClient::AsyncWalletClient(ClientSettings settings,
                                     std::shared_ptr<IHttpClient> http,
                                     std::shared_ptr<ResponseCache> cache)
    : settings_(std::move(settings))
    , http_(std::move(http))
    , cache_(cache ? std::move(cache) : std::make_shared<ResponseCache>(settings_.cacheCapacity))
{
    std::cout << "[AsyncWalletClient] Created for " << settings_.appName
              << ", target: " << settings_.host << ":" << settings_.port << std::endl;
}

AsyncWalletClient::AsyncWalletClient(net::any_io_executor executor,
                                     ClientSettings settings,
                                     std::shared_ptr<IHttpClient> http,
                                     std::shared_ptr<ResponseCache> cache)
    : AsyncWalletClient(std::move(settings), std::move(http), std::move(cache))
{
    executor_ = std::move(executor);
}

AsyncWalletClient::~AsyncWalletClient() {
    std::unique_ptr<PushSubscription> push;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        push = std::move(push_);
    }
    if (push) {
        push->close();
    }
}

void AsyncWalletClient::bindExecutor(net::any_io_executor executor) {
    std::lock_guard<std::mutex> lock(mutex_);
    executor_ = std::move(executor);
}

net::any_io_executor AsyncWalletClient::executor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!executor_) {
        throw std::logic_error("AsyncWalletClient: executor is not bound");
    }
    return *executor_;
}

bool AsyncWalletClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !sessionToken_.empty();
}

std::string AsyncWalletClient::sessionToken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessionToken_;
}

void AsyncWalletClient::setSessionToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessionToken_ = token;
}

// ============================================
// БЕЗ СЕССИИ
// ============================================

std::future<bool> AsyncWalletClient::checkWalletAvailable() {
    return submit([this]() { return doCheckAvailable(); });
}

std::future<WalletStatus> AsyncWalletClient::getWalletStatus() {
    return submit([this]() {
        return WalletStatus::fromJson(expectOk(call("GET", endpoints::WALLET_STATUS, "", false)));
    });
}

std::future<PendingAuthorization> AsyncWalletClient::requestAuthorization(
    const std::vector<protocol::Permission>& permissions,
    std::optional<std::string> description)
{
    return submit([this, permissions, description]() {
        return doRequestAuthorization(permissions, description);
    });
}

std::future<AuthorizationOutcome> AsyncWalletClient::waitForAuthorization(const std::string& requestId,
                                                                          std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<AuthorizationOutcome>>();
    auto future = promise->get_future();

    net::post(executor(), [this, requestId, timeout, promise]() {
        startWait(requestId, timeout, [promise](std::exception_ptr error, AuthorizationOutcome outcome) {
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(std::move(outcome));
            }
        });
    });
    return future;
}

void AsyncWalletClient::cancelWait() {
    std::set<std::shared_ptr<WaitOperation>> waits;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        waits = waits_;
    }
    for (const auto& op : waits) {
        op->cancelled = true;
        net::post(op->timer.get_executor(), [op]() { op->timer.cancel(); });
    }
}

std::future<bool> AsyncWalletClient::connect(const std::vector<protocol::Permission>& permissions) {
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();

    net::post(executor(), [this, permissions, promise]() {
        if (!doCheckAvailable()) {
            std::cerr << "[AsyncWalletClient] Wallet is not available at "
                      << settings_.host << ":" << settings_.port << std::endl;
            promise->set_value(false);
            return;
        }

        PendingAuthorization pending;
        try {
            pending = doRequestAuthorization(permissions, std::nullopt);
        } catch (const WalletProtocolError& e) {
            std::cerr << "[AsyncWalletClient] Authorization request failed: " << e.what() << std::endl;
            promise->set_value(false);
            return;
        }

        startWait(pending.requestId, settings_.requestTimeout,
                  [this, promise](std::exception_ptr error, AuthorizationOutcome outcome) {
            if (error || !outcome.approved()) {
                std::cout << "[AsyncWalletClient] Not connected: request "
                          << outcome.requestId << " is " << protocol::toString(outcome.status) << std::endl;
                promise->set_value(false);
                return;
            }

            try {
                doGetWalletInfo();
            } catch (const WalletProtocolError& e) {
                // Сессия уже есть, info подтянется при следующем вызове
                std::cerr << "[AsyncWalletClient] Wallet info prefetch failed: " << e.what() << std::endl;
            }
            std::cout << "[AsyncWalletClient] Connected" << std::endl;
            promise->set_value(true);
        });
    });
    return future;
}

// ============================================
// ПО СЕССИИ
// ============================================

std::future<WalletInfo> AsyncWalletClient::getWalletInfo() {
    return submit([this]() { return doGetWalletInfo(); });
}

std::future<std::string> AsyncWalletClient::getBalance(const std::string& contract) {
    return submit([this, contract]() {
        const std::string key = "balance:" + contract;
        if (auto cached = cache_->get(key, settings_.cacheTtl)) {
            return *cached;
        }

        auto json = expectOk(call("GET", endpoints::withParam(endpoints::BALANCE, contract), "", true));
        auto balance = json.at("balance").get<std::string>();
        cache_->set(key, balance);
        return balance;
    });
}

std::future<TransactionOutcome> AsyncWalletClient::sendTransaction(const std::string& contract,
                                                                   const std::string& function,
                                                                   const nlohmann::json& kwargs,
                                                                   std::optional<int64_t> stampsSupplied) {
    nlohmann::json body = {
        {"contract", contract},
        {"function", function},
        {"kwargs", kwargs.is_null() ? nlohmann::json::object() : kwargs}
    };
    if (stampsSupplied) {
        body["stamps_supplied"] = *stampsSupplied;
    }

    return submit([this, body]() {
        auto outcome = TransactionOutcome::fromJson(
            expectOk(call("POST", endpoints::TRANSACTION, body.dump(), true)));
        if (outcome.success) {
            cache_->clearMatching("balance:");
        }
        return outcome;
    });
}

std::future<SignatureOutcome> AsyncWalletClient::signMessage(const std::string& message) {
    nlohmann::json body = {{"message", message}};
    return submit([this, body]() {
        auto json = expectOk(call("POST", endpoints::SIGN_MESSAGE, body.dump(), true));
        SignatureOutcome outcome;
        outcome.signature = json.value("signature", "");
        outcome.message = json.value("message", "");
        outcome.address = json.value("address", "");
        return outcome;
    });
}

std::future<bool> AsyncWalletClient::addToken(const TokenInfo& token) {
    auto body = token.toJson();
    return submit([this, body]() {
        auto json = expectOk(call("POST", endpoints::ADD_TOKEN, body.dump(), true));
        return json.value("success", false);
    });
}

std::future<std::vector<TokenInfo>> AsyncWalletClient::listTokens() {
    return submit([this]() {
        auto json = expectOk(call("GET", endpoints::LIST_TOKENS, "", true));
        std::vector<TokenInfo> tokens;
        for (const auto& item : json.value("tokens", nlohmann::json::array())) {
            tokens.push_back(TokenInfo::fromJson(item));
        }
        return tokens;
    });
}

std::future<bool> AsyncWalletClient::revoke() {
    return submit([this]() {
        if (!isConnected()) {
            return false;
        }
        auto json = expectOk(call("POST", endpoints::AUTH_REVOKE, "", true));
        setSessionToken("");
        cache_->clear();
        return json.value("revoked", false);
    });
}

std::future<void> AsyncWalletClient::disconnect() {
    return submit([this]() {
        std::unique_ptr<PushSubscription> push;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessionToken_.clear();
            push = std::move(push_);
        }
        cache_->clear();
        if (push) {
            push->close();
        }
        std::cout << "[AsyncWalletClient] Disconnected" << std::endl;
    });
}

void AsyncWalletClient::subscribeEvents(PushSubscription::EventCallback callback) {
    auto push = std::make_unique<PushSubscription>(settings_.host, settings_.port, std::move(callback));
    push->open();

    std::unique_ptr<PushSubscription> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(push_);
        push_ = std::move(push);
    }
    if (previous) {
        previous->close();
    }
}

// ============================================
// ШАГИ
// ============================================

bool AsyncWalletClient::doCheckAvailable() {
    try {
        auto json = expectOk(call("GET", endpoints::WALLET_STATUS, "", false));
        return json.value("available", false);
    } catch (const WalletProtocolError&) {
        return false;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

PendingAuthorization AsyncWalletClient::doRequestAuthorization(
    const std::vector<protocol::Permission>& permissions,
    const std::optional<std::string>& description)
{
    nlohmann::json body = {
        {"app_name", settings_.appName},
        {"app_url", settings_.appUrl},
        {"permissions", nlohmann::json::array()}
    };
    for (auto permission : permissions) {
        body["permissions"].push_back(protocol::toString(permission));
    }
    if (description) {
        body["description"] = *description;
    }

    auto json = expectOk(call("POST", endpoints::AUTH_REQUEST, body.dump(), false));

    PendingAuthorization pending;
    pending.requestId = json.at("request_id").get<std::string>();
    pending.appName = json.value("app_name", settings_.appName);
    pending.status = protocol::requestStatusFromString(json.value("status", "pending"));
    std::cout << "[AsyncWalletClient] Authorization requested: " << pending.requestId << std::endl;
    return pending;
}

WalletInfo AsyncWalletClient::doGetWalletInfo() {
    if (auto cached = cache_->get("wallet_info", settings_.cacheTtl)) {
        return WalletInfo::fromJson(nlohmann::json::parse(*cached));
    }

    auto json = expectOk(call("GET", endpoints::WALLET_INFO, "", true));
    cache_->set("wallet_info", json.dump());
    return WalletInfo::fromJson(json);
}

// ============================================
// ОЖИДАНИЕ АВТОРИЗАЦИИ
// ============================================

void AsyncWalletClient::startWait(const std::string& requestId,
                                  std::chrono::milliseconds timeout,
                                  WaitCallback done) {
    auto op = std::make_shared<WaitOperation>(executor(), requestId,
                                              std::chrono::steady_clock::now() + timeout,
                                              std::move(done));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        waits_.insert(op);
    }
    poll(op);
}

void AsyncWalletClient::poll(const std::shared_ptr<WaitOperation>& op) {
    AuthorizationOutcome outcome;
    outcome.requestId = op->requestId;

    if (op->cancelled) {
        outcome.cancelled = true;
        finish(op, nullptr, outcome);
        return;
    }

    try {
        auto response = call("GET", endpoints::withParam(endpoints::AUTH_STATUS, op->requestId), "", false);
        auto json = expectOk(response);

        outcome.status = protocol::requestStatusFromString(json.value("status", "pending"));
        if (protocol::isFinalStatus(outcome.status)) {
            outcome.sessionToken = json.value("session_token", "");
            outcome.permissions = json.value("permissions", std::vector<std::string>{});
            outcome.expiresAt = json.value("expires_at", "");
            if (outcome.approved() && !outcome.sessionToken.empty()) {
                setSessionToken(outcome.sessionToken);
            }
            finish(op, nullptr, outcome);
            return;
        }

    } catch (const WalletProtocolError& e) {
        if (e.code() == ErrorCode::NOT_FOUND) {
            // Запрос вычищен сервером или его никогда не было
            outcome.status = RequestStatus::EXPIRED;
            finish(op, nullptr, outcome);
            return;
        }
        if (e.code() != ErrorCode::NETWORK_ERROR) {
            finish(op, std::current_exception(), outcome);
            return;
        }
        // Сервер недоступен: продолжаем опрос до дедлайна
    } catch (const std::exception&) {
        finish(op, std::current_exception(), outcome);
        return;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= op->deadline) {
        outcome.status = RequestStatus::PENDING;
        outcome.timedOut = true;
        finish(op, nullptr, outcome);
        return;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(op->deadline - now);
    op->timer.expires_after(std::min(settings_.pollInterval, remaining));
    op->timer.async_wait([this, op](const boost::system::error_code&) {
        // operation_aborted приходит от cancelWait(), poll() увидит флаг
        poll(op);
    });
}

void AsyncWalletClient::finish(const std::shared_ptr<WaitOperation>& op,
                               std::exception_ptr error,
                               AuthorizationOutcome outcome) {
    if (op->finished.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        waits_.erase(op);
    }
    op->done(error, std::move(outcome));
}

// ============================================
// HTTP
// ============================================

SimpleResponse AsyncWalletClient::call(const std::string& method,
                                       const std::string& path,
                                       const std::string& body,
                                       bool withSession) {
    std::map<std::string, std::string> headers;
    if (!body.empty()) {
        headers["Content-Type"] = "application/json";
    }
    if (withSession) {
        auto token = sessionToken();
        if (token.empty()) {
            throw WalletProtocolError(ErrorCode::UNAUTHORIZED, 0, "Not connected: no session token");
        }
        headers["Authorization"] = "Bearer " + token;
    }

    SimpleRequest request(method, path, body, settings_.host, settings_.port, headers);
    SimpleResponse response;
    if (!http_->send(request, response)) {
        throw WalletProtocolError(ErrorCode::NETWORK_ERROR, 0,
                                  "Wallet server unreachable at " + settings_.host + ":"
                                  + std::to_string(settings_.port));
    }
    return response;
}

nlohmann::json AsyncWalletClient::expectOk(const SimpleResponse& response) {
    int status = response.getStatus();
    if (status == 200) {
        return nlohmann::json::parse(response.getBody());
    }

    auto code = ErrorCode::INTERNAL_ERROR;
    std::string message = "Wallet server returned " + std::to_string(status);
    std::optional<std::chrono::seconds> retryAfter;

    auto json = nlohmann::json::parse(response.getBody(), nullptr, false);
    if (json.is_object()) {
        if (auto parsed = protocol::parseErrorCode(json.value("code", ""))) {
            code = *parsed;
        }
        message = json.value("error", message);
        if (json.contains("retry_after") && json["retry_after"].is_number_integer()) {
            retryAfter = std::chrono::seconds(json["retry_after"].get<int64_t>());
        }
    }

    if (code == ErrorCode::SESSION_EXPIRED) {
        setSessionToken("");
        cache_->clear();
    }
    throw WalletProtocolError(code, status, message, retryAfter);
}

} // namespace walletgate::client
