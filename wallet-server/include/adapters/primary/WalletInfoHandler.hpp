#pragma once

#include "HttpErrors.hpp"
#include "JsonMapping.hpp"
#include "ports/input/IWalletService.hpp"

#include <IHttpHandler.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief GET /api/v1/wallet/info
 *
 * За SessionAuthMiddleware(wallet_info).
 */
class WalletInfoHandler : public IHttpHandler {
public:
    explicit WalletInfoHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        sendJson(res, 200, infoToJson(wallet_->status()));
    }

private:
    std::shared_ptr<ports::input::IWalletService> wallet_;
};

} // namespace walletgate::adapters::primary
