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
 * @brief Отправка транзакции
 *
 * POST /api/v1/transaction
 * {
 *   "contract": "currency",
 *   "function": "transfer",
 *   "kwargs": {"to": "...", "amount": 10},
 *   "stamps_supplied": 50
 * }
 *
 * Response:
 * {
 *   "success": true,
 *   "transaction_hash": "...",
 *   "result": {...},
 *   "errors": []
 * }
 */
class TransactionHandler : public IHttpHandler {
public:
    explicit TransactionHandler(std::shared_ptr<ports::input::IWalletService> wallet)
        : wallet_(std::move(wallet)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto request = dto::TransactionBody::fromJson(nlohmann::json::parse(req.getBody()));

            auto result = wallet_->sendTransaction(request);
            if (!result) {
                sendFailure(res, result);
                return;
            }

            sendJson(res, 200, transactionToJson(result.value()));

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
