#pragma once

#include "domain/Session.hpp"
#include "domain/Timestamp.hpp"
#include "protocol/Permission.hpp"
#include "protocol/RequestStatus.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace walletgate::domain {

/**
 * @brief Запрос авторизации от DApp
 *
 * Жизненный цикл: pending -> approved | denied | expired.
 * Переход выполняется один раз, повторные действия отклоняются.
 */
struct AuthorizationRequest {
    std::string requestId;                  ///< Формат: "req-xxxxxxxx"
    std::string appName;
    std::string appUrl;
    protocol::PermissionSet permissions;    ///< Без дубликатов, может быть пустым
    std::optional<std::string> description;
    TimePoint createdAt;
    protocol::RequestStatus status = protocol::RequestStatus::PENDING;
    std::optional<TimePoint> resolvedAt;
    std::optional<Session> session;         ///< Только для approved
    uint64_t sequence = 0;                  ///< Порядок создания

    bool isPending() const {
        return status == protocol::RequestStatus::PENDING;
    }
};

} // namespace walletgate::domain
