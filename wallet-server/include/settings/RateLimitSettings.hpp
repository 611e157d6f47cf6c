#pragma once

#include <chrono>

namespace walletgate::settings {

/**
 * @brief Параметры защиты разблокировки
 *
 * Пауза перед попыткой n (n >= 2): min(2^(n-2), maxBackoff) секунд.
 * После maxAttempts неудач источник блокируется на lockout.
 */
class RateLimitSettings {
public:
    RateLimitSettings() = default;

    RateLimitSettings(int maxAttempts,
                      std::chrono::seconds maxBackoff,
                      std::chrono::seconds lockout,
                      std::chrono::seconds staleAfter)
        : maxAttempts_(maxAttempts)
        , maxBackoff_(maxBackoff)
        , lockout_(lockout)
        , staleAfter_(staleAfter)
    {}

    int getMaxAttempts() const { return maxAttempts_; }
    std::chrono::seconds getMaxBackoff() const { return maxBackoff_; }
    std::chrono::seconds getLockout() const { return lockout_; }
    std::chrono::seconds getStaleAfter() const { return staleAfter_; }

private:
    int maxAttempts_ = 5;
    std::chrono::seconds maxBackoff_{60};
    std::chrono::seconds lockout_{60};
    std::chrono::seconds staleAfter_{1800};
};

} // namespace walletgate::settings
