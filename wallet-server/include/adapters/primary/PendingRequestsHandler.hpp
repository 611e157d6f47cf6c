#pragma once

#include "HttpErrors.hpp"
#include "domain/events/PushEvent.hpp"
#include "ports/input/IRequestRegistry.hpp"

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace walletgate::adapters::primary {

/**
 * @brief GET /api/v1/auth/pending
 *
 * Очередь на одобрение для UI кошелька, в порядке поступления.
 */
class PendingRequestsHandler : public IHttpHandler {
public:
    explicit PendingRequestsHandler(std::shared_ptr<ports::input::IRequestRegistry> registry)
        : registry_(std::move(registry)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto pending = registry_->listPending();

        nlohmann::json requests = nlohmann::json::array();
        for (const auto& request : pending) {
            requests.push_back(domain::describeRequest(request));
        }

        nlohmann::json response;
        response["requests"] = requests;
        response["count"] = pending.size();
        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::input::IRequestRegistry> registry_;
};

} // namespace walletgate::adapters::primary
