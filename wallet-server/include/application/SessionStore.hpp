#pragma once

#include "ports/input/ISessionStore.hpp"
#include "settings/ProtocolSettings.hpp"
#include "utils/TokenGenerator.hpp"

#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace walletgate::application {

/**
 * @brief Хранилище активных сессий в памяти
 *
 * Одна блокировка на все операции: validate и revoke не могут
 * пересечься, отозванная сессия никогда не считается валидной.
 */
class SessionStore : public ports::input::ISessionStore {
public:
    SessionStore(std::shared_ptr<settings::ProtocolSettings> settings,
                 domain::TimeSource now = domain::systemTime())
        : settings_(std::move(settings))
        , now_(std::move(now))
    {
        std::cout << "[SessionStore] Created (max sessions: "
                  << settings_->getMaxSessions() << ")" << std::endl;
    }

    domain::Result<domain::Session> issue(const domain::AuthorizationRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = now_();
        dropExpiredLocked(now);

        if (sessions_.size() >= settings_->getMaxSessions()) {
            std::cout << "[SessionStore] Session limit reached for " << request.appName << std::endl;
            return domain::Result<domain::Session>::fail(
                protocol::ErrorCode::MAX_SESSIONS_EXCEEDED,
                "Maximum number of sessions (" + std::to_string(settings_->getMaxSessions()) + ") reached");
        }

        std::string token = utils::TokenGenerator::sessionToken();
        while (sessions_.count(token) > 0) {
            token = utils::TokenGenerator::sessionToken();
        }

        domain::Session session;
        session.token = token;
        session.appName = request.appName;
        session.appUrl = request.appUrl;
        session.permissions = request.permissions;
        session.createdAt = now;
        session.expiresAt = now + settings_->getSessionTimeout();
        session.lastActivity = now;

        sessions_.emplace(token, session);
        std::cout << "[SessionStore] Session issued for " << session.appName
                  << ": " << token.substr(0, 8) << "..." << std::endl;
        return domain::Result<domain::Session>::ok(session);
    }

    domain::Result<domain::Session> validate(
        const std::string& token,
        std::optional<protocol::Permission> required) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(token);
        if (token.empty() || it == sessions_.end()) {
            return domain::Result<domain::Session>::fail(
                protocol::ErrorCode::UNAUTHORIZED, "Invalid or missing session token");
        }

        auto now = now_();
        if (it->second.isExpired(now, settings_->getSessionIdleTimeout())) {
            sessions_.erase(it);
            return domain::Result<domain::Session>::fail(
                protocol::ErrorCode::SESSION_EXPIRED, "Session expired");
        }

        if (required && !it->second.hasPermission(*required)) {
            return domain::Result<domain::Session>::fail(
                protocol::ErrorCode::FORBIDDEN,
                "Permission '" + protocol::toString(*required) + "' not granted");
        }

        it->second.lastActivity = now;
        return domain::Result<domain::Session>::ok(it->second);
    }

    bool revoke(const std::string& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        bool existed = sessions_.erase(token) > 0;
        if (existed) {
            std::cout << "[SessionStore] Session revoked: " << token.substr(0, 8) << "..." << std::endl;
        }
        return existed;
    }

    size_t sweepExpired(domain::TimePoint now) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = dropExpiredLocked(now);
        if (removed > 0) {
            std::cout << "[SessionStore] Swept " << removed << " expired sessions" << std::endl;
        }
        return removed;
    }

    size_t activeCount() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
    }

private:
    std::shared_ptr<settings::ProtocolSettings> settings_;
    domain::TimeSource now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Session> sessions_;

    size_t dropExpiredLocked(domain::TimePoint now) {
        size_t removed = 0;
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.isExpired(now, settings_->getSessionIdleTimeout())) {
                it = sessions_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }
};

} // namespace walletgate::application
