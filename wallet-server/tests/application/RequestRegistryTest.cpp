/**
 * @file RequestRegistryTest.cpp
 * @brief Unit-тесты для RequestRegistry
 */

#include <gtest/gtest.h>

#include "application/RequestRegistry.hpp"
#include "application/SessionStore.hpp"
#include "../mocks/ManualClock.hpp"
#include "../mocks/RecordingNotificationBus.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace walletgate;
using namespace walletgate::application;
using namespace walletgate::tests;
using protocol::ErrorCode;
using protocol::Permission;
using protocol::RequestStatus;

class RequestRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::ProtocolSettings>();
        settings_->setMaxPendingRequests(10);
        settings_->setMaxSessions(10);
        settings_->setRequestTimeout(std::chrono::seconds(300));
        settings_->setSessionTimeout(std::chrono::minutes(60));

        bus_ = std::make_shared<RecordingNotificationBus>();
        sessions_ = std::make_shared<SessionStore>(settings_, clock_.source());
        registry_ = std::make_shared<RequestRegistry>(settings_, sessions_, bus_, clock_.source());
    }

    std::string createRequest(const std::vector<std::string>& permissions = {"wallet_info", "balance"}) {
        auto created = registry_->create("Test DApp", "http://localhost:3000", permissions, std::nullopt);
        EXPECT_TRUE(created.isOk()) << created.message();
        return created.value().requestId;
    }

    ManualClock clock_;
    std::shared_ptr<settings::ProtocolSettings> settings_;
    std::shared_ptr<RecordingNotificationBus> bus_;
    std::shared_ptr<SessionStore> sessions_;
    std::shared_ptr<RequestRegistry> registry_;
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(RequestRegistryTest, Create_ReturnsPendingRequest) {
    auto created = registry_->create("Test DApp", "http://localhost:3000", {"wallet_info"},
                                     std::string("Connect to read the address"));

    ASSERT_TRUE(created.isOk());
    const auto& request = created.value();
    EXPECT_EQ(request.requestId.rfind("req-", 0), 0u);
    EXPECT_EQ(request.status, RequestStatus::PENDING);
    EXPECT_EQ(request.appName, "Test DApp");
    EXPECT_EQ(request.description.value_or(""), "Connect to read the address");
    EXPECT_EQ(registry_->pendingCount(), 1u);
}

TEST_F(RequestRegistryTest, Create_DuplicatePermissions_StoredOnce) {
    auto created = registry_->create("Test DApp", "http://localhost:3000",
                                     {"balance", "wallet_info", "balance", "balance"}, std::nullopt);

    ASSERT_TRUE(created.isOk());
    EXPECT_EQ(created.value().permissions.size(), 2u);
    EXPECT_EQ(created.value().permissions.count(Permission::BALANCE), 1u);
    EXPECT_EQ(created.value().permissions.count(Permission::WALLET_INFO), 1u);
}

TEST_F(RequestRegistryTest, Create_EmptyPermissions_Allowed) {
    auto created = registry_->create("Test DApp", "http://localhost:3000", {}, std::nullopt);

    ASSERT_TRUE(created.isOk());
    EXPECT_TRUE(created.value().permissions.empty());
}

TEST_F(RequestRegistryTest, Create_UnknownPermission_InvalidRequest) {
    auto created = registry_->create("Test DApp", "http://localhost:3000", {"wallet_info", "root"}, std::nullopt);

    ASSERT_FALSE(created.isOk());
    EXPECT_EQ(created.error(), ErrorCode::INVALID_REQUEST);
    EXPECT_NE(created.message().find("root"), std::string::npos);
    EXPECT_EQ(registry_->pendingCount(), 0u);
}

TEST_F(RequestRegistryTest, Create_FieldLimits_InvalidRequest) {
    EXPECT_EQ(registry_->create("", "http://x", {}, std::nullopt).error(), ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(registry_->create(std::string(101, 'a'), "http://x", {}, std::nullopt).error(),
              ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(registry_->create("App", "", {}, std::nullopt).error(), ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(registry_->create("App", "http://x", {}, std::string(501, 'd')).error(),
              ErrorCode::INVALID_REQUEST);

    EXPECT_TRUE(registry_->create(std::string(100, 'a'), std::string(500, 'u'), {}, std::string(500, 'd')).isOk());
}

TEST_F(RequestRegistryTest, Create_PublishesAuthorizationRequestEvent) {
    auto id = createRequest();

    auto events = bus_->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["type"], "authorization_request");
    EXPECT_EQ(events[0]["request"]["request_id"], id);
    EXPECT_EQ(events[0]["request"]["app_name"], "Test DApp");
    EXPECT_EQ(events[0]["request"]["status"], "pending");
}

// ============================================================================
// CAPACITY
// ============================================================================

TEST_F(RequestRegistryTest, Create_OverCapacity_TooManyPendingRequests) {
    for (int i = 0; i < 10; ++i) {
        createRequest();
    }

    auto created = registry_->create("One more", "http://localhost:3000", {}, std::nullopt);
    ASSERT_FALSE(created.isOk());
    EXPECT_EQ(created.error(), ErrorCode::TOO_MANY_PENDING_REQUESTS);
}

TEST_F(RequestRegistryTest, ConcurrentCreates_ExactlyCapacitySucceed) {
    constexpr int kThreads = 32;
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::atomic<int> other{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            auto created = registry_->create("DApp " + std::to_string(i), "http://localhost:3000",
                                             {"balance"}, std::nullopt);
            if (created.isOk()) {
                ++succeeded;
            } else if (created.error() == ErrorCode::TOO_MANY_PENDING_REQUESTS) {
                ++rejected;
            } else {
                ++other;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 10);
    EXPECT_EQ(rejected.load(), kThreads - 10);
    EXPECT_EQ(other.load(), 0);
    EXPECT_EQ(registry_->pendingCount(), 10u);
}

TEST_F(RequestRegistryTest, ExpiredRequests_FreeCapacity) {
    for (int i = 0; i < 10; ++i) {
        createRequest();
    }
    clock_.advance(std::chrono::seconds(301));

    EXPECT_EQ(registry_->pendingCount(), 0u);
    EXPECT_TRUE(registry_->create("Later", "http://localhost:3000", {}, std::nullopt).isOk());
}

// ============================================================================
// APPROVE / DENY
// ============================================================================

TEST_F(RequestRegistryTest, Approve_IssuesSessionWithRequestedPermissions) {
    auto id = createRequest({"wallet_info", "balance"});

    auto session = registry_->approve(id);

    ASSERT_TRUE(session.isOk());
    EXPECT_EQ(session.value().token.size(), 64u);
    EXPECT_EQ(session.value().permissions,
              (protocol::PermissionSet{Permission::WALLET_INFO, Permission::BALANCE}));
    EXPECT_EQ(session.value().expiresAt, clock_.now + std::chrono::minutes(60));
    EXPECT_EQ(sessions_->activeCount(), 1u);
}

TEST_F(RequestRegistryTest, Approve_Twice_InvalidState) {
    auto id = createRequest();
    ASSERT_TRUE(registry_->approve(id).isOk());

    auto second = registry_->approve(id);

    ASSERT_FALSE(second.isOk());
    EXPECT_EQ(second.error(), ErrorCode::INVALID_STATE);
    EXPECT_EQ(sessions_->activeCount(), 1u);
}

TEST_F(RequestRegistryTest, Deny_AfterApprove_InvalidState) {
    auto id = createRequest();
    ASSERT_TRUE(registry_->approve(id).isOk());

    EXPECT_EQ(registry_->deny(id).error(), ErrorCode::INVALID_STATE);
}

TEST_F(RequestRegistryTest, ConcurrentApproveAndDeny_ExactlyOneWins) {
    for (int round = 0; round < 20; ++round) {
        auto id = createRequest();
        std::atomic<int> wins{0};

        std::thread approver([&]() { if (registry_->approve(id).isOk()) ++wins; });
        std::thread denier([&]() { if (registry_->deny(id).isOk()) ++wins; });
        approver.join();
        denier.join();

        EXPECT_EQ(wins.load(), 1) << "round " << round;
        ASSERT_TRUE(registry_->getStatus(id).isOk());
        sessions_->clear();
    }
}

TEST_F(RequestRegistryTest, Approve_UnknownId_NotFound) {
    EXPECT_EQ(registry_->approve("req-missing").error(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(registry_->deny("req-missing").error(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(registry_->getStatus("req-missing").error(), ErrorCode::NOT_FOUND);
}

TEST_F(RequestRegistryTest, Approve_SessionLimitReached_RequestStaysPending) {
    settings_->setMaxSessions(1);
    auto first = createRequest();
    auto second = createRequest();
    ASSERT_TRUE(registry_->approve(first).isOk());

    auto rejected = registry_->approve(second);

    ASSERT_FALSE(rejected.isOk());
    EXPECT_EQ(rejected.error(), ErrorCode::MAX_SESSIONS_EXCEEDED);
    EXPECT_EQ(registry_->getStatus(second).value().status, RequestStatus::PENDING);
}

TEST_F(RequestRegistryTest, Resolve_PublishesRequestResolved) {
    auto approved = createRequest();
    auto denied = createRequest();

    registry_->approve(approved);
    registry_->deny(denied);

    EXPECT_EQ(bus_->countOf("request_resolved"), 2u);
    auto events = bus_->events();
    EXPECT_EQ(events.back()["request_id"], denied);
    EXPECT_EQ(events.back()["status"], "denied");
}

// ============================================================================
// STATUS
// ============================================================================

TEST_F(RequestRegistryTest, GetStatus_Approved_CarriesSessionOnce) {
    auto id = createRequest();
    auto session = registry_->approve(id);

    auto status = registry_->getStatus(id);
    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(status.value().status, RequestStatus::APPROVED);
    ASSERT_TRUE(status.value().session.has_value());
    EXPECT_EQ(status.value().session->token, session.value().token);

    // Итоговый статус забирается первым чтением
    EXPECT_EQ(registry_->getStatus(id).error(), ErrorCode::NOT_FOUND);
}

TEST_F(RequestRegistryTest, GetStatus_Pending_NotConsumed) {
    auto id = createRequest();

    EXPECT_EQ(registry_->getStatus(id).value().status, RequestStatus::PENDING);
    EXPECT_EQ(registry_->getStatus(id).value().status, RequestStatus::PENDING);
}

TEST_F(RequestRegistryTest, GetStatus_AfterTimeout_Expired) {
    auto id = createRequest();
    clock_.advance(std::chrono::seconds(300));

    auto status = registry_->getStatus(id);

    ASSERT_TRUE(status.isOk());
    EXPECT_EQ(status.value().status, RequestStatus::EXPIRED);
    EXPECT_EQ(bus_->countOf("request_resolved"), 1u);
}

TEST_F(RequestRegistryTest, Approve_AfterTimeout_InvalidState) {
    auto id = createRequest();
    clock_.advance(std::chrono::minutes(6));

    auto approved = registry_->approve(id);

    ASSERT_FALSE(approved.isOk());
    EXPECT_EQ(approved.error(), ErrorCode::INVALID_STATE);
    EXPECT_EQ(sessions_->activeCount(), 0u);
}

// ============================================================================
// LIST / SWEEP
// ============================================================================

TEST_F(RequestRegistryTest, ListPending_InCreationOrder) {
    auto first = createRequest();
    auto second = createRequest();
    auto third = createRequest();
    registry_->deny(second);

    auto pending = registry_->listPending();

    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].requestId, first);
    EXPECT_EQ(pending[1].requestId, third);
}

TEST_F(RequestRegistryTest, SweepExpired_RemovesStalePendingAndPublishes) {
    createRequest();
    createRequest();
    clock_.advance(std::chrono::seconds(200));
    auto fresh = createRequest();
    clock_.advance(std::chrono::seconds(150));

    auto removed = registry_->sweepExpired(clock_.now);

    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(registry_->pendingCount(), 1u);
    EXPECT_EQ(bus_->countOf("request_resolved"), 2u);
    EXPECT_EQ(registry_->getStatus(fresh).value().status, RequestStatus::PENDING);
}

TEST_F(RequestRegistryTest, SweepExpired_DropsUnreadResolvedRequests) {
    auto id = createRequest();
    registry_->deny(id);

    EXPECT_EQ(registry_->sweepExpired(clock_.now), 0u);
    clock_.advance(std::chrono::seconds(300));
    EXPECT_EQ(registry_->sweepExpired(clock_.now), 1u);
    EXPECT_EQ(registry_->getStatus(id).error(), ErrorCode::NOT_FOUND);
}
