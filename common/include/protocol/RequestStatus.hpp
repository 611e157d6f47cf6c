#pragma once

#include <stdexcept>
#include <string>

namespace walletgate::protocol {

/**
 * @brief Статус запроса авторизации
 *
 * Единственный допустимый переход: PENDING → {APPROVED | DENIED | EXPIRED}.
 */
enum class RequestStatus {
    PENDING,   ///< Ждёт решения пользователя
    APPROVED,  ///< Одобрен, сессия выдана
    DENIED,    ///< Отклонён пользователем
    EXPIRED    ///< Истёк без решения
};

inline std::string toString(RequestStatus status) {
    switch (status) {
        case RequestStatus::PENDING:  return "pending";
        case RequestStatus::APPROVED: return "approved";
        case RequestStatus::DENIED:   return "denied";
        case RequestStatus::EXPIRED:  return "expired";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline RequestStatus requestStatusFromString(const std::string& str) {
    if (str == "pending")  return RequestStatus::PENDING;
    if (str == "approved") return RequestStatus::APPROVED;
    if (str == "denied")   return RequestStatus::DENIED;
    if (str == "expired")  return RequestStatus::EXPIRED;
    throw std::invalid_argument("Unknown RequestStatus: " + str);
}

/**
 * @brief Финальный ли статус (запрос больше не изменится)
 */
inline bool isFinalStatus(RequestStatus status) {
    return status != RequestStatus::PENDING;
}

} // namespace walletgate::protocol
