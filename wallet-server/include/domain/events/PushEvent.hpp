#pragma once

#include "domain/AuthorizationRequest.hpp"
#include "domain/Timestamp.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace walletgate::domain {

/**
 * @brief Публичное представление запроса авторизации
 *
 * Используется и в push событиях, и в ответе /auth/pending.
 * Токен сессии сюда не попадает.
 */
nlohmann::json describeRequest(const AuthorizationRequest& request);

/**
 * @brief Базовый класс событий push канала
 *
 * Сериализуется в {"type": ..., "timestamp": ..., ...}.
 */
struct PushEvent {
    std::string eventType;
    Timestamp timestamp;

    explicit PushEvent(const std::string& type) : eventType(type) {}

    virtual ~PushEvent() = default;

    virtual nlohmann::json toJson() const = 0;

    std::string serialize() const {
        return toJson().dump();
    }
};

/**
 * @brief Новый запрос ждёт решения в UI кошелька
 */
struct AuthorizationRequestedEvent : public PushEvent {
    AuthorizationRequest request;

    explicit AuthorizationRequestedEvent(AuthorizationRequest req)
        : PushEvent("authorization_request"), request(std::move(req)) {}

    nlohmann::json toJson() const override;
};

/**
 * @brief Запрос одобрен, отклонён или истёк
 */
struct RequestResolvedEvent : public PushEvent {
    AuthorizationRequest request;

    explicit RequestResolvedEvent(AuthorizationRequest req)
        : PushEvent("request_resolved"), request(std::move(req)) {}

    nlohmann::json toJson() const override;
};

/**
 * @brief Кошелёк заблокирован или разблокирован
 */
struct WalletLockChangedEvent : public PushEvent {
    bool locked;

    explicit WalletLockChangedEvent(bool isLocked)
        : PushEvent(isLocked ? "wallet_locked" : "wallet_unlocked"), locked(isLocked) {}

    nlohmann::json toJson() const override;
};

/**
 * @brief Приветствие при открытии канала
 */
struct ConnectedEvent : public PushEvent {
    std::string channelId;
    size_t pendingRequests;

    ConnectedEvent(std::string id, size_t pending)
        : PushEvent("connected"), channelId(std::move(id)), pendingRequests(pending) {}

    nlohmann::json toJson() const override;
};

} // namespace walletgate::domain
