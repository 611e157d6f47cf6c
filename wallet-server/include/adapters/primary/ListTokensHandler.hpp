#pragma once

#include "HttpErrors.hpp"
#include "JsonMapping.hpp"
#include "ports/input/IWalletService.hpp"

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief GET /api/v1/tokens
 */
class ListTokensHandler : public IHttpHandler {
public:
    explicit ListTokensHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json tokens = nlohmann::json::array();
        for (const auto& token : wallet_->listTokens()) {
            tokens.push_back(tokenToJson(token));
        }
        sendJson(res, 200, {{"tokens", tokens}});
    }

private:
    std::shared_ptr<ports::input::IWalletService> wallet_;
};

} // namespace walletgate::adapters::primary
