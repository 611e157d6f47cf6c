#pragma once

#include "ports/input/IRequestRegistry.hpp"
#include "ports/input/ISessionStore.hpp"
#include "ports/output/INotificationBus.hpp"
#include "settings/ProtocolSettings.hpp"
#include "utils/TokenGenerator.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace walletgate::application {

/**
 * @brief Реестр запросов авторизации
 *
 * Все переходы pending -> approved/denied/expired выполняются под одной
 * блокировкой, поэтому два одновременных approve не пройдут оба.
 *
 * Разрешённый запрос остаётся в реестре, пока DApp не прочитает итоговый
 * статус (там лежит токен сессии), либо пока его не вычистит sweep
 * через тот же таймаут, что и для pending.
 *
 * Блокировки берутся в порядке: реестр, затем SessionStore.
 */
class RequestRegistry : public ports::input::IRequestRegistry {
public:
    RequestRegistry(std::shared_ptr<settings::ProtocolSettings> settings,
                    std::shared_ptr<ports::input::ISessionStore> sessions,
                    std::shared_ptr<ports::output::INotificationBus> bus,
                    domain::TimeSource now = domain::systemTime())
        : settings_(std::move(settings))
        , sessions_(std::move(sessions))
        , bus_(std::move(bus))
        , now_(std::move(now))
    {
        std::cout << "[RequestRegistry] Created (max pending: "
                  << settings_->getMaxPendingRequests() << ")" << std::endl;
    }

    domain::Result<domain::AuthorizationRequest> create(
        const std::string& appName,
        const std::string& appUrl,
        const std::vector<std::string>& permissions,
        const std::optional<std::string>& description) override
    {
        using R = domain::Result<domain::AuthorizationRequest>;

        if (appName.empty() || appName.size() > 100) {
            return R::fail(protocol::ErrorCode::INVALID_REQUEST, "app_name must be 1-100 characters");
        }
        if (appUrl.empty() || appUrl.size() > 500) {
            return R::fail(protocol::ErrorCode::INVALID_REQUEST, "app_url must be 1-500 characters");
        }
        if (description && description->size() > 500) {
            return R::fail(protocol::ErrorCode::INVALID_REQUEST, "description must be at most 500 characters");
        }

        protocol::PermissionSet granted;
        for (const auto& name : permissions) {
            auto permission = protocol::parsePermission(name);
            if (!permission) {
                return R::fail(protocol::ErrorCode::INVALID_REQUEST, "Unknown permission: " + name);
            }
            granted.insert(*permission);
        }

        domain::AuthorizationRequest request;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (countPendingLocked() >= settings_->getMaxPendingRequests()) {
                std::cout << "[RequestRegistry] Rejected request from " << appName
                          << ": too many pending requests" << std::endl;
                return R::fail(protocol::ErrorCode::TOO_MANY_PENDING_REQUESTS,
                               "Too many pending authorization requests");
            }

            request.requestId = utils::TokenGenerator::generateWithPrefix("req");
            while (requests_.count(request.requestId) > 0) {
                request.requestId = utils::TokenGenerator::generateWithPrefix("req");
            }
            request.appName = appName;
            request.appUrl = appUrl;
            request.permissions = std::move(granted);
            request.description = description;
            request.createdAt = now_();
            request.sequence = ++sequence_;

            requests_.emplace(request.requestId, request);
        }

        std::cout << "[RequestRegistry] Request created: " << request.requestId
                  << " (" << appName << ")" << std::endl;
        bus_->publish(domain::AuthorizationRequestedEvent(request));
        return R::ok(request);
    }

    domain::Result<domain::AuthorizationRequest> getStatus(const std::string& requestId) override {
        using R = domain::Result<domain::AuthorizationRequest>;

        domain::AuthorizationRequest snapshot;
        bool expiredNow = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = requests_.find(requestId);
            if (it == requests_.end()) {
                return R::fail(protocol::ErrorCode::NOT_FOUND, "Request not found");
            }

            expiredNow = expireIfStaleLocked(it->second, now_());
            snapshot = it->second;
            if (!snapshot.isPending()) {
                requests_.erase(it);
            }
        }

        if (expiredNow) {
            bus_->publish(domain::RequestResolvedEvent(snapshot));
        }
        return R::ok(snapshot);
    }

    domain::Result<domain::Session> approve(const std::string& requestId) override {
        using R = domain::Result<domain::Session>;

        domain::AuthorizationRequest snapshot;
        domain::Session session;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = requests_.find(requestId);
            if (it == requests_.end()) {
                return R::fail(protocol::ErrorCode::NOT_FOUND, "Request not found");
            }

            auto& request = it->second;
            auto now = now_();
            expireIfStaleLocked(request, now);
            if (!request.isPending()) {
                return R::fail(protocol::ErrorCode::INVALID_STATE,
                               "Request is already " + protocol::toString(request.status));
            }

            auto issued = sessions_->issue(request);
            if (!issued) {
                return issued;
            }

            session = issued.value();
            request.status = protocol::RequestStatus::APPROVED;
            request.resolvedAt = now;
            request.session = session;
            snapshot = request;
        }

        std::cout << "[RequestRegistry] Request approved: " << requestId << std::endl;
        bus_->publish(domain::RequestResolvedEvent(snapshot));
        return R::ok(session);
    }

    domain::Result<domain::AuthorizationRequest> deny(const std::string& requestId) override {
        using R = domain::Result<domain::AuthorizationRequest>;

        domain::AuthorizationRequest snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = requests_.find(requestId);
            if (it == requests_.end()) {
                return R::fail(protocol::ErrorCode::NOT_FOUND, "Request not found");
            }

            auto& request = it->second;
            auto now = now_();
            expireIfStaleLocked(request, now);
            if (!request.isPending()) {
                return R::fail(protocol::ErrorCode::INVALID_STATE,
                               "Request is already " + protocol::toString(request.status));
            }

            request.status = protocol::RequestStatus::DENIED;
            request.resolvedAt = now;
            snapshot = request;
        }

        std::cout << "[RequestRegistry] Request denied: " << requestId << std::endl;
        bus_->publish(domain::RequestResolvedEvent(snapshot));
        return R::ok(snapshot);
    }

    std::vector<domain::AuthorizationRequest> listPending() override {
        std::vector<domain::AuthorizationRequest> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = now_();
            for (const auto& [id, request] : requests_) {
                if (request.isPending() && !isStale(request, now)) {
                    result.push_back(request);
                }
            }
        }
        std::sort(result.begin(), result.end(),
                  [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
        return result;
    }

    size_t sweepExpired(domain::TimePoint now) override {
        std::vector<domain::AuthorizationRequest> expired;
        size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = requests_.begin(); it != requests_.end();) {
                auto& request = it->second;
                if (expireIfStaleLocked(request, now)) {
                    expired.push_back(request);
                    it = requests_.erase(it);
                    ++removed;
                } else if (!request.isPending() && request.resolvedAt
                           && now - *request.resolvedAt >= settings_->getRequestTimeout()) {
                    it = requests_.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }

        for (const auto& request : expired) {
            std::cout << "[RequestRegistry] Request expired: " << request.requestId << std::endl;
            bus_->publish(domain::RequestResolvedEvent(request));
        }
        return removed;
    }

    size_t pendingCount() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return countPendingLocked();
    }

private:
    std::shared_ptr<settings::ProtocolSettings> settings_;
    std::shared_ptr<ports::input::ISessionStore> sessions_;
    std::shared_ptr<ports::output::INotificationBus> bus_;
    domain::TimeSource now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::AuthorizationRequest> requests_;
    uint64_t sequence_ = 0;

    bool isStale(const domain::AuthorizationRequest& request, domain::TimePoint now) const {
        return now - request.createdAt >= settings_->getRequestTimeout();
    }

    /// pending старше таймаута -> expired. @return true если переход случился сейчас
    bool expireIfStaleLocked(domain::AuthorizationRequest& request, domain::TimePoint now) {
        if (!request.isPending() || !isStale(request, now)) {
            return false;
        }
        request.status = protocol::RequestStatus::EXPIRED;
        request.resolvedAt = now;
        return true;
    }

    size_t countPendingLocked() const {
        auto now = now_();
        return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(),
            [this, now](const auto& entry) {
                return entry.second.isPending() && !isStale(entry.second, now);
            }));
    }
};

} // namespace walletgate::application
