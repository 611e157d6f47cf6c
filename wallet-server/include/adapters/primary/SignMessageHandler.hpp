#pragma once

#include "HttpErrors.hpp"
#include "JsonMapping.hpp"
#include "dto/Requests.hpp"
#include "ports/input/IWalletService.hpp"

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief POST /api/v1/sign {"message": "..."}
 */
class SignMessageHandler : public IHttpHandler {
public:
    explicit SignMessageHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = dto::SignBody::fromJson(nlohmann::json::parse(req.getBody()));

            auto signature = wallet_->signMessage(body.message);
            if (!signature) {
                sendFailure(res, signature);
                return;
            }

            sendJson(res, 200, signatureToJson(signature.value()));

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
