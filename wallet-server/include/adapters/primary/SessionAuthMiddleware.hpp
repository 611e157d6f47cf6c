#pragma once

#include "HttpErrors.hpp"
#include "ports/input/ISessionStore.hpp"

#include <IHttpHandler.hpp>
#include <memory>
#include <optional>

namespace walletgate::adapters::primary {

/**
 * @brief Проверка bearer токена сессии и разрешения
 *
 * При успехе кладёт в attributes "sessionToken" и "appName".
 * required = nullopt означает "любая живая сессия".
 */
class SessionAuthMiddleware : public IHttpHandler {
public:
    SessionAuthMiddleware(std::shared_ptr<ports::input::ISessionStore> sessions,
                          std::optional<protocol::Permission> required)
        : sessions_(std::move(sessions))
        , required_(required)
    {}

    void handle(IRequest& req, IResponse& res) override {
        std::string token = req.getBearerToken().value_or("");
        if (token.empty()) {
            sendError(res, protocol::ErrorCode::UNAUTHORIZED,
                      "Session token required. Request authorization via POST /api/v1/auth/request");
            return;
        }

        auto session = sessions_->validate(token, required_);
        if (!session) {
            sendFailure(res, session);
            return;
        }

        req.setAttribute("sessionToken", token);
        req.setAttribute("appName", session.value().appName);
        res.setStatus(0); // для middleware
    }

private:
    std::shared_ptr<ports::input::ISessionStore> sessions_;
    std::optional<protocol::Permission> required_;
};

} // namespace walletgate::adapters::primary
