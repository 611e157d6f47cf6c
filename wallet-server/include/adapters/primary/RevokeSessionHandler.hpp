#pragma once

#include "HttpErrors.hpp"
#include "ports/input/ISessionStore.hpp"

#include <IHttpHandler.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief POST /api/v1/auth/revoke
 *
 * Явный выход DApp. Идемпотентен: повторный вызов с тем же
 * токеном отвечает 200 с "revoked": false.
 */
class RevokeSessionHandler : public IHttpHandler {
public:
    explicit RevokeSessionHandler(std::shared_ptr<ports::input::ISessionStore> sessions)
        : sessions_(std::move(sessions)) {}

    void handle(IRequest& req, IResponse& res) override {
        std::string token = req.getBearerToken().value_or("");
        if (token.empty()) {
            sendError(res, protocol::ErrorCode::UNAUTHORIZED, "Session token required");
            return;
        }

        bool revoked = sessions_->revoke(token);
        sendJson(res, 200, {{"revoked", revoked}});
    }

private:
    std::shared_ptr<ports::input::ISessionStore> sessions_;
};

} // namespace walletgate::adapters::primary
