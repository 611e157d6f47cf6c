#pragma once

#include "HttpErrors.hpp"
#include "JsonMapping.hpp"
#include "ports/input/IWalletService.hpp"

#include <IHttpHandler.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief GET /api/v1/wallet/status
 *
 * Без авторизации. Этот же путь использует проверка "уже запущен"
 * при старте сервера.
 */
class WalletStatusHandler : public IHttpHandler {
public:
    explicit WalletStatusHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        sendJson(res, 200, statusToJson(wallet_->status()));
    }

private:
    std::shared_ptr<ports::input::IWalletService> wallet_;
};

} // namespace walletgate::adapters::primary
