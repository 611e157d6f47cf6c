#include "domain/events/PushEvent.hpp"

namespace walletgate::domain {

nlohmann::json describeRequest(const AuthorizationRequest& request) {
    nlohmann::json j;
    j["request_id"] = request.requestId;
    j["app_name"] = request.appName;
    j["app_url"] = request.appUrl;
    j["permissions"] = protocol::toStrings(request.permissions);
    j["description"] = request.description ? nlohmann::json(*request.description) : nlohmann::json(nullptr);
    j["created_at"] = Timestamp(request.createdAt).toString();
    j["status"] = protocol::toString(request.status);
    return j;
}

nlohmann::json AuthorizationRequestedEvent::toJson() const {
    nlohmann::json j;
    j["type"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["request"] = describeRequest(request);
    return j;
}

nlohmann::json RequestResolvedEvent::toJson() const {
    nlohmann::json j;
    j["type"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["request_id"] = request.requestId;
    j["status"] = protocol::toString(request.status);
    return j;
}

nlohmann::json WalletLockChangedEvent::toJson() const {
    nlohmann::json j;
    j["type"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["locked"] = locked;
    return j;
}

nlohmann::json ConnectedEvent::toJson() const {
    nlohmann::json j;
    j["type"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["channel_id"] = channelId;
    j["pending_requests"] = pendingRequests;
    return j;
}

} // namespace walletgate::domain
