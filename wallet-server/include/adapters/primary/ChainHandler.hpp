#pragma once

#include "HttpErrors.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>
#include <vector>

namespace walletgate::adapters::primary {

/**
 * @brief Цепочка middleware + хэндлер
 *
 * Middleware оставляет статус 0, чтобы цепочка продолжилась.
 * Первый ненулевой статус завершает обработку.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers) {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0) {
                return;
            }
        }

        // если в конце статус все равно = 0, то это ошибка бизнес логики
        std::cerr << "[ChainHandler] Error: middleware chain finished, but httpStatus is zero." << std::endl;
        sendError(res, protocol::ErrorCode::INTERNAL_ERROR, "Internal server error");
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace walletgate::adapters::primary
