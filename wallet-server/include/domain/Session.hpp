#pragma once

#include "domain/Timestamp.hpp"
#include "protocol/Permission.hpp"

#include <string>

namespace walletgate::domain {

/**
 * @brief Сессия DApp
 *
 * Создаётся ровно один раз на одобренный запрос авторизации.
 * expiresAt абсолютный и не сдвигается, lastActivity обновляется
 * при каждом успешном вызове. Если задан idleTimeout, сессия без
 * обращений дольше него тоже считается истёкшей.
 */
struct Session {
    std::string token;                      ///< Непрозрачный bearer токен
    std::string appName;
    std::string appUrl;
    protocol::PermissionSet permissions;    ///< Подмножество прав запроса
    TimePoint createdAt;
    TimePoint expiresAt;
    TimePoint lastActivity;

    bool hasPermission(protocol::Permission permission) const {
        return permissions.count(permission) > 0;
    }

    bool isExpired(TimePoint now) const {
        return now >= expiresAt;
    }

    bool isExpired(TimePoint now, std::chrono::minutes idleTimeout) const {
        if (isExpired(now)) {
            return true;
        }
        return idleTimeout.count() > 0 && now - lastActivity >= idleTimeout;
    }
};

} // namespace walletgate::domain
