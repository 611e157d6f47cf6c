#pragma once

#include "HttpErrors.hpp"
#include "dto/Requests.hpp"
#include "ports/input/IWalletService.hpp"

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief Разблокировка кошелька
 *
 * POST /api/v1/wallet/unlock
 * {
 *   "password": "..."
 * }
 *
 * Response:
 * {
 *   "status": "unlocked",
 *   "locked": false
 * }
 *
 * Лимит попыток считается по IP вызывающего.
 */
class UnlockWalletHandler : public IHttpHandler {
public:
    explicit UnlockWalletHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = dto::UnlockRequest::fromJson(nlohmann::json::parse(req.getBody()));

            auto result = wallet_->unlock(body.password, req.getIp());
            if (!result) {
                sendFailure(res, result);
                return;
            }

            nlohmann::json response;
            response["status"] = "unlocked";
            response["locked"] = result.value().locked;
            sendJson(res, 200, response);

        } catch (const nlohmann::json::exception&) {
            sendError(res, protocol::ErrorCode::INVALID_REQUEST, "Invalid JSON");
        } catch (const dto::ValidationError& e) {
            sendError(res, protocol::ErrorCode::INVALID_REQUEST, e.what());
        }
    }

private:
    std::shared_ptr<ports::input::IWalletService> wallet_;
};

} // namespace walletgate::adapters::primary
