#pragma once

#include "HttpErrors.hpp"
#include "dto/Requests.hpp"
#include "ports/input/IRequestRegistry.hpp"

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief Запрос авторизации от DApp
 *
 * POST /api/v1/auth/request
 * {
 *   "app_name": "My DApp",
 *   "app_url": "http://localhost:3000",
 *   "permissions": ["wallet_info", "balance"],
 *   "description": "optional"
 * }
 *
 * Response:
 * {
 *   "request_id": "req-...",
 *   "app_name": "My DApp",
 *   "status": "pending"
 * }
 */
class AuthRequestHandler : public IHttpHandler {
public:
    explicit AuthRequestHandler(std::shared_ptr<ports::input::IRequestRegistry> registry)
        : registry_(std::move(registry)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = dto::AuthorizationRequestBody::fromJson(nlohmann::json::parse(req.getBody()));

            auto created = registry_->create(body.appName, body.appUrl, body.permissions, body.description);
            if (!created) {
                sendFailure(res, created);
                return;
            }

            const auto& request = created.value();
            nlohmann::json response;
            response["request_id"] = request.requestId;
            response["app_name"] = request.appName;
            response["status"] = protocol::toString(request.status);
            response["permissions"] = protocol::toStrings(request.permissions);
            sendJson(res, 200, response);

        } catch (const nlohmann::json::exception&) {
            sendError(res, protocol::ErrorCode::INVALID_REQUEST, "Invalid JSON");
        } catch (const dto::ValidationError& e) {
            sendError(res, protocol::ErrorCode::INVALID_REQUEST, e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IRequestRegistry> registry_;
};

} // namespace walletgate::adapters::primary
