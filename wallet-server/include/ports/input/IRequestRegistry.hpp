#pragma once

#include "domain/AuthorizationRequest.hpp"
#include "domain/Result.hpp"
#include "domain/Session.hpp"

#include <optional>
#include <string>
#include <vector>

namespace walletgate::ports::input {

/**
 * @brief Реестр запросов авторизации
 */
class IRequestRegistry {
public:
    virtual ~IRequestRegistry() = default;

    /**
     * @brief Создать запрос
     *
     * Разрешения проверяются по списку известных и дедуплицируются.
     * Ошибки: INVALID_REQUEST, TOO_MANY_PENDING_REQUESTS.
     */
    virtual domain::Result<domain::AuthorizationRequest> create(
        const std::string& appName,
        const std::string& appUrl,
        const std::vector<std::string>& permissions,
        const std::optional<std::string>& description) = 0;

    /**
     * @brief Текущее состояние запроса
     *
     * Первое чтение итогового статуса (approved/denied/expired) забирает
     * запрос из реестра. Ошибка: NOT_FOUND.
     */
    virtual domain::Result<domain::AuthorizationRequest> getStatus(const std::string& requestId) = 0;

    /**
     * @brief Одобрить запрос и выпустить сессию
     * Ошибки: NOT_FOUND, INVALID_STATE, MAX_SESSIONS_EXCEEDED.
     */
    virtual domain::Result<domain::Session> approve(const std::string& requestId) = 0;

    /**
     * @brief Отклонить запрос
     * Ошибки: NOT_FOUND, INVALID_STATE.
     */
    virtual domain::Result<domain::AuthorizationRequest> deny(const std::string& requestId) = 0;

    /// Ожидающие запросы в порядке создания
    virtual std::vector<domain::AuthorizationRequest> listPending() = 0;

    /**
     * @brief Перевести просроченные pending в expired и вычистить старые
     * @return Количество удалённых из реестра запросов
     */
    virtual size_t sweepExpired(domain::TimePoint now) = 0;

    virtual size_t pendingCount() const = 0;
};

} // namespace walletgate::ports::input
