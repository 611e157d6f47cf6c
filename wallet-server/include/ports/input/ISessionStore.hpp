#pragma once

#include "domain/AuthorizationRequest.hpp"
#include "domain/Result.hpp"
#include "domain/Session.hpp"
#include "protocol/Permission.hpp"

#include <optional>
#include <string>

namespace walletgate::ports::input {

/**
 * @brief Хранилище сессий
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /**
     * @brief Выпустить сессию для одобренного запроса
     * Ошибка: MAX_SESSIONS_EXCEEDED.
     */
    virtual domain::Result<domain::Session> issue(const domain::AuthorizationRequest& request) = 0;

    /**
     * @brief Проверить токен и (опционально) разрешение
     *
     * Ошибки: UNAUTHORIZED, SESSION_EXPIRED, FORBIDDEN.
     * При успехе обновляет lastActivity.
     */
    virtual domain::Result<domain::Session> validate(
        const std::string& token,
        std::optional<protocol::Permission> required) = 0;

    /// Идемпотентно. @return true если сессия существовала
    virtual bool revoke(const std::string& token) = 0;

    virtual size_t sweepExpired(domain::TimePoint now) = 0;

    virtual size_t activeCount() const = 0;

    /// Сбросить все сессии (остановка процесса)
    virtual void clear() = 0;
};

} // namespace walletgate::ports::input
