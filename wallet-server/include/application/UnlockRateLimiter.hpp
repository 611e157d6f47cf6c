#pragma once

#include "ports/input/IUnlockRateLimiter.hpp"
#include "settings/RateLimitSettings.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace walletgate::application {

/**
 * @brief Экспоненциальная пауза и блокировка для /wallet/unlock
 *
 * Попытка 1 свободна, перед попыткой n нужно выждать
 * min(2^(n-2), maxBackoff) секунд с предыдущей. После maxAttempts
 * неудач источник блокируется целиком. Попытки во время паузы или
 * блокировки не считаются и блокировку не продлевают.
 */
class UnlockRateLimiter : public ports::input::IUnlockRateLimiter {
public:
    UnlockRateLimiter(std::shared_ptr<settings::RateLimitSettings> settings,
                      domain::TimeSource now = domain::systemTime())
        : settings_(std::move(settings))
        , now_(std::move(now))
    {}

    ports::input::AttemptDecision checkAttempt(const std::string& source) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(source);
        if (it == records_.end()) {
            return {};
        }

        auto now = now_();
        auto& record = it->second;

        if (record.lockedUntil) {
            if (now < *record.lockedUntil) {
                return locked(domain::ceilSeconds(*record.lockedUntil - now));
            }
            // Блокировка истекла: начинаем с чистого листа
            records_.erase(it);
            return {};
        }

        auto delay = backoffAfter(record.attempts);
        auto elapsed = now - record.lastAttempt;
        if (elapsed < delay) {
            auto wait = domain::ceilSeconds(delay - elapsed);
            ports::input::AttemptDecision decision;
            decision.allowed = false;
            decision.error = protocol::ErrorCode::TOO_MANY_ATTEMPTS;
            decision.retryAfter = wait;
            decision.message = "Too many unlock attempts. Please wait "
                + std::to_string(wait.count()) + " seconds before trying again";
            return decision;
        }

        if (record.attempts >= settings_->getMaxAttempts()) {
            record.lockedUntil = now + settings_->getLockout();
            std::cout << "[UnlockRateLimiter] Source locked out: " << source << std::endl;
            return locked(settings_->getLockout());
        }

        return {};
    }

    void recordFailure(const std::string& source) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = now_();
        auto& record = records_[source];
        record.sourceKey = source;
        record.attempts += 1;
        record.lastAttempt = now;

        if (record.attempts >= settings_->getMaxAttempts()) {
            record.lockedUntil = now + settings_->getLockout();
            std::cout << "[UnlockRateLimiter] Source locked out after "
                      << record.attempts << " failures: " << source << std::endl;
        }
    }

    void recordSuccess(const std::string& source) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(source);
    }

    size_t sweep(domain::TimePoint now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            const auto& record = it->second;
            bool lockExpired = record.lockedUntil && now >= *record.lockedUntil;
            bool stale = now - record.lastAttempt > settings_->getStaleAfter()
                && !record.isLocked(now);
            if (lockExpired || stale) {
                it = records_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::optional<domain::RateLimitRecord> find(const std::string& source) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(source);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Для тестов и восстановления состояния
    void put(const domain::RateLimitRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[record.sourceKey] = record;
    }

private:
    std::shared_ptr<settings::RateLimitSettings> settings_;
    domain::TimeSource now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::RateLimitRecord> records_;

    /// Пауза после attempts неудач: 1, 2, 4, 8 ... не больше maxBackoff
    std::chrono::seconds backoffAfter(int attempts) const {
        if (attempts <= 0) {
            return std::chrono::seconds(0);
        }
        auto cap = settings_->getMaxBackoff();
        if (attempts - 1 >= 31) {
            return cap;
        }
        return std::min(std::chrono::seconds(1LL << (attempts - 1)), cap);
    }

    ports::input::AttemptDecision locked(std::chrono::seconds remaining) const {
        ports::input::AttemptDecision decision;
        decision.allowed = false;
        decision.error = protocol::ErrorCode::ACCOUNT_LOCKED;
        decision.retryAfter = remaining;
        decision.message = "Account locked due to too many failed attempts. Try again in "
            + std::to_string(remaining.count()) + " seconds";
        return decision;
    }
};

} // namespace walletgate::application
