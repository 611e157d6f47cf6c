#pragma once

#include <IHttpClient.hpp>
#include <SimpleResponse.hpp>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace walletgate::tests {

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

/**
 * @brief Действие для WillOnce/WillRepeatedly: ответить status + JSON
 */
inline std::function<bool(const IRequest&, IResponse&)> respond(int status, const nlohmann::json& body) {
    return [status, body](const IRequest&, IResponse& res) {
        // SimpleResponse нужно кастить для setStatus/setBody
        auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
        simpleRes.setStatus(status);
        simpleRes.setBody(body.dump());
        return true;
    };
}

/// Сервер недоступен
inline std::function<bool(const IRequest&, IResponse&)> unreachable() {
    return [](const IRequest&, IResponse&) { return false; };
}

} // namespace walletgate::tests
