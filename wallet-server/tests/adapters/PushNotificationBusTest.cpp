/**
 * @file PushNotificationBusTest.cpp
 * @brief Unit-тесты для PushNotificationBus
 */

#include <gtest/gtest.h>

#include "adapters/secondary/PushNotificationBus.hpp"
#include "../mocks/FakePushChannel.hpp"

#include <thread>
#include <vector>

using namespace walletgate;
using namespace walletgate::adapters::secondary;
using namespace walletgate::tests;

class PushNotificationBusTest : public ::testing::Test {
protected:
    PushNotificationBus bus_;
};

TEST_F(PushNotificationBusTest, Publish_ReachesEverySubscriber) {
    auto ui = std::make_shared<FakePushChannel>("ws-1");
    auto cli = std::make_shared<FakePushChannel>("ws-2");
    bus_.subscribe(ui);
    bus_.subscribe(cli);

    auto delivered = bus_.publish(domain::WalletLockChangedEvent(true));

    EXPECT_EQ(delivered, 2u);
    ASSERT_EQ(ui->messages.size(), 1u);
    auto json = nlohmann::json::parse(ui->messages[0]);
    EXPECT_EQ(json["type"], "wallet_locked");
    EXPECT_EQ(json["locked"], true);
}

TEST_F(PushNotificationBusTest, Publish_DropsDeadChannel) {
    auto alive = std::make_shared<FakePushChannel>("ws-alive");
    auto dead = std::make_shared<FakePushChannel>("ws-dead");
    dead->kill();
    bus_.subscribe(alive);
    bus_.subscribe(dead);

    EXPECT_EQ(bus_.publish(domain::WalletLockChangedEvent(false)), 1u);
    EXPECT_EQ(bus_.subscriberCount(), 1u);
    EXPECT_TRUE(dead->closed);

    // Второй раз мёртвому каналу ничего не шлём
    EXPECT_EQ(bus_.publish(domain::WalletLockChangedEvent(true)), 1u);
    EXPECT_EQ(alive->messages.size(), 2u);
}

TEST_F(PushNotificationBusTest, Unsubscribe_StopsDelivery) {
    auto channel = std::make_shared<FakePushChannel>("ws-1");
    bus_.subscribe(channel);
    bus_.unsubscribe("ws-1");

    EXPECT_EQ(bus_.publish(domain::WalletLockChangedEvent(true)), 0u);
    EXPECT_TRUE(channel->messages.empty());
}

TEST_F(PushNotificationBusTest, CloseAll_ClosesAndForgets) {
    auto a = std::make_shared<FakePushChannel>("ws-a");
    auto b = std::make_shared<FakePushChannel>("ws-b");
    bus_.subscribe(a);
    bus_.subscribe(b);

    bus_.closeAll();

    EXPECT_TRUE(a->closed);
    EXPECT_TRUE(b->closed);
    EXPECT_EQ(bus_.subscriberCount(), 0u);
}

TEST_F(PushNotificationBusTest, ConcurrentSubscribeAndPublish) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, i]() {
            for (int j = 0; j < 50; ++j) {
                auto id = "ws-" + std::to_string(i) + "-" + std::to_string(j);
                bus_.subscribe(std::make_shared<FakePushChannel>(id));
                bus_.publish(domain::WalletLockChangedEvent(j % 2 == 0));
                if (j % 2 == 0) {
                    bus_.unsubscribe(id);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bus_.subscriberCount(), 8u * 25u);
}
