#pragma once

#include "HttpErrors.hpp"
#include "JsonMapping.hpp"
#include "ports/input/IRequestRegistry.hpp"

#include <IHttpHandler.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief POST /api/v1/auth/approve/{request_id}
 *
 * Только для UI кошелька (LocalOnlyMiddleware).
 *
 * Response:
 * {
 *   "session_token": "...",
 *   "expires_at": "2024-01-01T12:00:00Z",
 *   "permissions": ["wallet_info"],
 *   "status": "approved"
 * }
 */
class ApproveRequestHandler : public IHttpHandler {
public:
    explicit ApproveRequestHandler(std::shared_ptr<ports::input::IRequestRegistry> registry)
        : registry_(std::move(registry)) {}

    void handle(IRequest& req, IResponse& res) override {
        std::string requestId = req.getPathParam(0).value_or("");
        if (requestId.empty()) {
            sendError(res, protocol::ErrorCode::INVALID_REQUEST, "Request ID is required");
            return;
        }

        auto session = registry_->approve(requestId);
        if (!session) {
            sendFailure(res, session);
            return;
        }

        auto response = sessionToJson(session.value());
        response["status"] = "approved";
        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::input::IRequestRegistry> registry_;
};

} // namespace walletgate::adapters::primary
