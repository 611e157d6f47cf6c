#pragma once

#include "HttpErrors.hpp"
#include "ports/input/IRequestRegistry.hpp"

#include <IHttpHandler.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief POST /api/v1/auth/deny/{request_id}
 */
class DenyRequestHandler : public IHttpHandler {
public:
    explicit DenyRequestHandler(std::shared_ptr<ports::input::IRequestRegistry> registry)
        : registry_(std::move(registry)) {}

    void handle(IRequest& req, IResponse& res) override {
        std::string requestId = req.getPathParam(0).value_or("");
        if (requestId.empty()) {
            sendError(res, protocol::ErrorCode::INVALID_REQUEST, "Request ID is required");
            return;
        }

        auto denied = registry_->deny(requestId);
        if (!denied) {
            sendFailure(res, denied);
            return;
        }

        sendJson(res, 200, {{"request_id", requestId}, {"status", "denied"}});
    }

private:
    std::shared_ptr<ports::input::IRequestRegistry> registry_;
};

} // namespace walletgate::adapters::primary
