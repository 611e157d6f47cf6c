/**
 * @file HttpRouterTest.cpp
 * @brief Тесты маршрутизации (method, path) -> handler
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "server/HttpRouter.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <stdexcept>

using namespace walletgate;
using namespace walletgate::server;
using json = nlohmann::json;

namespace {

class EchoParamHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        res.setResult(200, "application/json",
                      json{{"param", req.getPathParam(0).value_or("")}}.dump());
    }
};

class ThrowingHandler : public IHttpHandler {
public:
    void handle(IRequest&, IResponse&) override {
        throw std::runtime_error("boom");
    }
};

} // namespace

class HttpRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        router_.addHandler("GET", "/api/v1/balance/*", std::make_shared<EchoParamHandler>());
        router_.addHandler("GET", "/api/v1/wallet/status", std::make_shared<EchoParamHandler>());
        router_.addHandler("POST", "/api/v1/broken", std::make_shared<ThrowingHandler>());
    }

    SimpleRequest createRequest(const std::string& method, const std::string& path) {
        return SimpleRequest(method, path, "", "127.0.0.1", 8080, std::map<std::string, std::string>{});
    }

    HttpRouter router_;
};

TEST_F(HttpRouterTest, Matches_ExactPath) {
    EXPECT_TRUE(HttpRouter::matches("/api/v1/wallet/status", "/api/v1/wallet/status"));
    EXPECT_FALSE(HttpRouter::matches("/api/v1/wallet/status", "/api/v1/wallet/status/x"));
}

TEST_F(HttpRouterTest, Matches_WildcardIsSingleSegment) {
    EXPECT_TRUE(HttpRouter::matches("/api/v1/balance/*", "/api/v1/balance/currency"));
    EXPECT_FALSE(HttpRouter::matches("/api/v1/balance/*", "/api/v1/balance/"));
    EXPECT_FALSE(HttpRouter::matches("/api/v1/balance/*", "/api/v1/balance/a/b"));
    EXPECT_FALSE(HttpRouter::matches("/api/v1/balance/*", "/api/v1/balances/x"));
}

TEST_F(HttpRouterTest, Dispatch_WildcardRoute_ExposesPathParam) {
    auto req = createRequest("GET", "/api/v1/balance/con_token");
    SimpleResponse res;

    router_.dispatch(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    EXPECT_EQ(json::parse(res.getBody())["param"], "con_token");
}

TEST_F(HttpRouterTest, Dispatch_UnknownPath_Returns404) {
    auto req = createRequest("GET", "/api/v1/unknown");
    SimpleResponse res;

    router_.dispatch(req, res);

    EXPECT_EQ(res.getStatus(), 404);
    EXPECT_EQ(json::parse(res.getBody())["code"], "NOT_FOUND");
}

TEST_F(HttpRouterTest, Dispatch_WrongMethod_Returns405) {
    auto req = createRequest("POST", "/api/v1/wallet/status");
    SimpleResponse res;

    router_.dispatch(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

TEST_F(HttpRouterTest, Dispatch_HandlerThrows_Returns500) {
    auto req = createRequest("POST", "/api/v1/broken");
    SimpleResponse res;

    router_.dispatch(req, res);

    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(json::parse(res.getBody())["code"], "INTERNAL_ERROR");
}
