#pragma once

#include "domain/Timestamp.hpp"

#include <optional>
#include <string>

namespace walletgate::domain {

/**
 * @brief Счётчик неудачных попыток разблокировки для одного источника
 */
struct RateLimitRecord {
    std::string sourceKey;                  ///< Обычно IP вызывающего
    int attempts = 0;
    TimePoint lastAttempt;
    std::optional<TimePoint> lockedUntil;

    bool isLocked(TimePoint now) const {
        return lockedUntil && now < *lockedUntil;
    }
};

} // namespace walletgate::domain
