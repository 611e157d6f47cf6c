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
 * @brief Регистрация пользовательского токена
 *
 * POST /api/v1/tokens/add
 * {
 *   "contract_address": "con_my_token",
 *   "token_name": "My Token",
 *   "token_symbol": "MTK",
 *   "decimals": 8
 * }
 */
class AddTokenHandler : public IHttpHandler {
public:
    explicit AddTokenHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto token = dto::AddTokenBody::fromJson(nlohmann::json::parse(req.getBody()));

            auto added = wallet_->addToken(token);
            if (!added) {
                sendFailure(res, added);
                return;
            }

            sendJson(res, 200, {{"success", true}, {"token", tokenToJson(added.value())}});

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
