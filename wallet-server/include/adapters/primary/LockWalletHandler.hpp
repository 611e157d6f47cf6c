#pragma once

#include "HttpErrors.hpp"
#include "ports/input/IWalletService.hpp"

#include <IHttpHandler.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief POST /api/v1/wallet/lock
 *
 * Любая живая сессия может заблокировать кошелёк.
 */
class LockWalletHandler : public IHttpHandler {
public:
    explicit LockWalletHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto state = wallet_->lock();
        sendJson(res, 200, {{"status", "locked"}, {"locked", state.locked}});
    }

private:
    std::shared_ptr<ports::input::IWalletService> wallet_;
};

} // namespace walletgate::adapters::primary
