#pragma once

#include "HttpErrors.hpp"
#include "ports/input/IWalletService.hpp"

#include <IHttpHandler.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief GET /api/v1/balance/{contract}
 *
 * Роутер регистрирует с паттерном "/api/v1/balance/*".
 * За SessionAuthMiddleware(balance), ответ кэшируется в WalletService.
 */
class BalanceHandler : public IHttpHandler {
public:
    explicit BalanceHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        std::string contract = req.getPathParam(0).value_or("");
        if (contract.empty() || contract.size() > 100) {
            sendError(res, protocol::ErrorCode::INVALID_REQUEST, "Contract must be 1-100 characters");
            return;
        }

        auto balance = wallet_->balance(contract);
        if (!balance) {
            sendFailure(res, balance);
            return;
        }

        sendJson(res, 200, {{"balance", balance.value()}, {"contract", contract}});
    }

private:
    std::shared_ptr<ports::input::IWalletService> wallet_;
};

} // namespace walletgate::adapters::primary
