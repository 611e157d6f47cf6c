#pragma once

#include "HttpErrors.hpp"
#include "JsonMapping.hpp"
#include "ports/input/IRequestRegistry.hpp"

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief GET /api/v1/auth/status/{request_id}
 *
 * Роутер регистрирует с паттерном "/api/v1/auth/status/*".
 * Для approved в ответ добавляются токен сессии, срок и разрешения.
 * Итоговый статус отдаётся один раз, дальше запрос считается забранным.
 */
class AuthStatusHandler : public IHttpHandler {
public:
    explicit AuthStatusHandler(std::shared_ptr<ports::input::IRequestRegistry> registry)
        : registry_(std::move(registry)) {}

    void handle(IRequest& req, IResponse& res) override {
        std::string requestId = req.getPathParam(0).value_or("");
        if (requestId.empty()) {
            sendError(res, protocol::ErrorCode::INVALID_REQUEST, "Request ID is required");
            return;
        }

        auto status = registry_->getStatus(requestId);
        if (!status) {
            sendFailure(res, status);
            return;
        }

        const auto& request = status.value();
        nlohmann::json response;
        response["request_id"] = request.requestId;
        response["app_name"] = request.appName;
        response["status"] = protocol::toString(request.status);
        if (request.session) {
            response.update(sessionToJson(*request.session));
        }
        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::input::IRequestRegistry> registry_;
};

} // namespace walletgate::adapters::primary
