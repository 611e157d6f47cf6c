/**
 * @file WalletServiceTest.cpp
 * @brief Unit-тесты для WalletService
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/UnlockRateLimiter.hpp"
#include "application/WalletService.hpp"
#include "../mocks/ManualClock.hpp"
#include "../mocks/MockWalletBackend.hpp"
#include "../mocks/RecordingNotificationBus.hpp"

using namespace walletgate;
using namespace walletgate::application;
using namespace walletgate::tests;
using protocol::ErrorCode;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class WalletServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::ProtocolSettings>();
        backend_ = std::make_shared<NiceMock<MockWalletBackend>>();
        limiter_ = std::make_shared<UnlockRateLimiter>(std::make_shared<settings::RateLimitSettings>(),
                                                       clock_.source());
        bus_ = std::make_shared<RecordingNotificationBus>();
        walletSettings_ = std::make_shared<settings::WalletSettings>();
        walletSettings_->setNetwork("https://testnet.xian.org", "xian-testnet-1");
        cache_ = std::make_shared<ResponseCache>();
        service_ = std::make_shared<WalletService>(settings_, walletSettings_, backend_, limiter_, bus_, cache_);

        ON_CALL(*backend_, state()).WillByDefault(Return(walletState(false)));
    }

    static domain::WalletState walletState(bool locked) {
        domain::WalletState state;
        state.locked = locked;
        state.network = "https://testnet.xian.org";
        state.chainId = "xian-testnet-1";
        state.address = "ab12cd34ef56ab12cd34ef56ab12cd34ef56ab12cd34ef56ab12cd34ef56ab12";
        return state;
    }

    ManualClock clock_;
    std::shared_ptr<settings::ProtocolSettings> settings_;
    std::shared_ptr<settings::WalletSettings> walletSettings_;
    std::shared_ptr<NiceMock<MockWalletBackend>> backend_;
    std::shared_ptr<UnlockRateLimiter> limiter_;
    std::shared_ptr<RecordingNotificationBus> bus_;
    std::shared_ptr<ResponseCache> cache_;
    std::shared_ptr<WalletService> service_;
};

// ============================================================================
// UNLOCK
// ============================================================================

TEST_F(WalletServiceTest, Unlock_WrongPassword_UnauthorizedAndCounted) {
    EXPECT_CALL(*backend_, unlock("wrong")).WillOnce(Return(false));

    auto result = service_->unlock("wrong", "127.0.0.1");

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error(), ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(result.message(), "Invalid password");
    ASSERT_TRUE(limiter_->find("127.0.0.1").has_value());
    EXPECT_EQ(limiter_->find("127.0.0.1")->attempts, 1);
}

TEST_F(WalletServiceTest, Unlock_RateLimited_BackendNotAsked) {
    EXPECT_CALL(*backend_, unlock(_)).Times(1).WillOnce(Return(false));

    service_->unlock("wrong", "127.0.0.1");
    auto second = service_->unlock("demo-password", "127.0.0.1");

    ASSERT_FALSE(second.isOk());
    EXPECT_EQ(second.error(), ErrorCode::TOO_MANY_ATTEMPTS);
    ASSERT_TRUE(second.retryAfter().has_value());
    EXPECT_EQ(*second.retryAfter(), std::chrono::seconds(1));
}

TEST_F(WalletServiceTest, Unlock_Success_ResetsLimiterAndPublishes) {
    EXPECT_CALL(*backend_, unlock("wrong")).WillOnce(Return(false));
    EXPECT_CALL(*backend_, unlock("demo-password")).WillOnce(Return(true));

    service_->unlock("wrong", "127.0.0.1");
    clock_.advance(std::chrono::seconds(1));
    auto result = service_->unlock("demo-password", "127.0.0.1");

    ASSERT_TRUE(result.isOk());
    EXPECT_FALSE(result.value().locked);
    EXPECT_FALSE(limiter_->find("127.0.0.1").has_value());
    EXPECT_EQ(bus_->countOf("wallet_unlocked"), 1u);
}

// ============================================================================
// LOCK / BALANCE
// ============================================================================

TEST_F(WalletServiceTest, Balance_WalletLocked_Rejected) {
    ON_CALL(*backend_, state()).WillByDefault(Return(walletState(true)));
    EXPECT_CALL(*backend_, getBalance(_)).Times(0);

    auto result = service_->balance("currency");

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error(), ErrorCode::WALLET_LOCKED);
}

TEST_F(WalletServiceTest, Balance_SecondReadServedFromCache) {
    EXPECT_CALL(*backend_, getBalance("currency")).Times(1).WillOnce(Return("1000.00000000"));

    EXPECT_EQ(service_->balance("currency").value(), "1000.00000000");
    EXPECT_EQ(service_->balance("currency").value(), "1000.00000000");
    EXPECT_EQ(cache_->size(), 1u);
}

TEST_F(WalletServiceTest, Balance_BackendDown_NetworkErrorKeepsCause) {
    EXPECT_CALL(*backend_, getBalance("currency"))
        .WillOnce(Throw(ports::output::WalletBackendError("connection refused: testnet.xian.org")));

    auto result = service_->balance("currency");

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error(), ErrorCode::NETWORK_ERROR);
    EXPECT_NE(result.message().find("connection refused"), std::string::npos);
}

TEST_F(WalletServiceTest, Lock_ClearsCacheAndPublishes) {
    cache_->set("balance:currency", "1000");
    cache_->set("wallet_info", "{}");

    service_->lock();

    EXPECT_EQ(cache_->size(), 0u);
    EXPECT_EQ(bus_->countOf("wallet_locked"), 1u);
}

// ============================================================================
// TRANSACTIONS
// ============================================================================

TEST_F(WalletServiceTest, SendTransaction_Success_DropsCachedBalances) {
    cache_->set("balance:currency", "1000");
    cache_->set("balance:con_token", "5");
    cache_->set("wallet_info", "{}");

    domain::TransactionResult sent;
    sent.success = true;
    sent.transactionHash = "abc123";
    EXPECT_CALL(*backend_, sendTransaction(_)).WillOnce(Return(sent));

    domain::TransactionRequest request;
    request.contract = "currency";
    request.function = "transfer";
    request.kwargs = {{"to", "bob"}, {"amount", 10}};
    auto result = service_->sendTransaction(request);

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().transactionHash, "abc123");
    EXPECT_EQ(cache_->size(), 1u);
    EXPECT_TRUE(cache_->get("wallet_info", std::chrono::seconds(30)).has_value());
}

TEST_F(WalletServiceTest, SendTransaction_Rejected_TransactionFailedWithErrors) {
    domain::TransactionResult failed;
    failed.success = false;
    failed.errors = {"Insufficient balance", "Stamps exhausted"};
    EXPECT_CALL(*backend_, sendTransaction(_)).WillOnce(Return(failed));

    auto result = service_->sendTransaction(domain::TransactionRequest{"currency", "transfer"});

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error(), ErrorCode::TRANSACTION_FAILED);
    EXPECT_EQ(result.message(), "Transaction failed: Insufficient balance; Stamps exhausted");
}

TEST_F(WalletServiceTest, SignMessage_WalletLocked_Rejected) {
    ON_CALL(*backend_, state()).WillByDefault(Return(walletState(true)));

    EXPECT_EQ(service_->signMessage("hello").error(), ErrorCode::WALLET_LOCKED);
}

TEST_F(WalletServiceTest, AddToken_PassesThrough) {
    domain::TokenInfo token{"con_my_token", "My Token", "MTK", 8};
    EXPECT_CALL(*backend_, addToken(_)).Times(1);

    auto result = service_->addToken(token);

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().contractAddress, "con_my_token");
}

// ============================================================================
// NETWORK
// ============================================================================

TEST_F(WalletServiceTest, Network_NotSet_ChainOperationsRejected) {
    service_->configureNetwork("", "");
    EXPECT_CALL(*backend_, getBalance(_)).Times(0);
    EXPECT_CALL(*backend_, sendTransaction(_)).Times(0);
    EXPECT_CALL(*backend_, signMessage(_)).Times(0);

    auto balance = service_->balance("currency");
    auto sent = service_->sendTransaction(domain::TransactionRequest{"currency", "transfer"});
    auto signature = service_->signMessage("hello");

    ASSERT_FALSE(balance.isOk());
    EXPECT_EQ(balance.error(), ErrorCode::NETWORK_ERROR);
    EXPECT_EQ(balance.message(), "Network configuration not set");
    EXPECT_EQ(sent.error(), ErrorCode::NETWORK_ERROR);
    EXPECT_EQ(sent.message(), "Network configuration not set");
    EXPECT_EQ(signature.error(), ErrorCode::NETWORK_ERROR);
    EXPECT_EQ(signature.message(), "Network configuration not set");
}

TEST_F(WalletServiceTest, Network_OnlyUrl_Rejected) {
    service_->configureNetwork("https://testnet.xian.org", "");

    auto result = service_->balance("currency");

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error(), ErrorCode::NETWORK_ERROR);
    EXPECT_FALSE(service_->network().isComplete());
}

TEST_F(WalletServiceTest, Network_OnlyChainId_Rejected) {
    service_->configureNetwork("", "xian-testnet-1");

    auto result = service_->signMessage("hello");

    ASSERT_FALSE(result.isOk());
    EXPECT_EQ(result.error(), ErrorCode::NETWORK_ERROR);
}

TEST_F(WalletServiceTest, Network_LockedCheckedFirst) {
    service_->configureNetwork("", "");
    ON_CALL(*backend_, state()).WillByDefault(Return(walletState(true)));

    EXPECT_EQ(service_->balance("currency").error(), ErrorCode::WALLET_LOCKED);
}

TEST_F(WalletServiceTest, Network_SettingsWithoutNetwork_StatusEmpty) {
    auto bare = std::make_shared<WalletService>(settings_, std::make_shared<settings::WalletSettings>(),
                                                backend_, limiter_, bus_, cache_);
    if (bare->network().isComplete()) {
        GTEST_SKIP() << "WALLETGATE_NETWORK_URL/WALLETGATE_CHAIN_ID заданы в окружении";
    }

    auto state = bare->status();

    EXPECT_EQ(state.network, "");
    EXPECT_EQ(state.chainId, "");
    EXPECT_EQ(bare->balance("currency").error(), ErrorCode::NETWORK_ERROR);
}

TEST_F(WalletServiceTest, Network_Complete_BalanceServedAndReported) {
    EXPECT_CALL(*backend_, getBalance("currency")).WillOnce(Return("42.0"));

    auto result = service_->balance("currency");
    auto state = service_->status();

    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value(), "42.0");
    EXPECT_EQ(state.network, "https://testnet.xian.org");
    EXPECT_EQ(state.chainId, "xian-testnet-1");
}

TEST_F(WalletServiceTest, Network_Reconfigured_StatusFollowsAndBalancesDropped) {
    cache_->set("balance:currency", "1000");
    cache_->set("wallet_info", "{}");

    service_->configureNetwork("https://mainnet.xian.org", "xian-network-2");

    auto state = service_->status();
    EXPECT_EQ(state.network, "https://mainnet.xian.org");
    EXPECT_EQ(state.chainId, "xian-network-2");
    EXPECT_FALSE(cache_->get("balance:currency", std::chrono::seconds(30)).has_value());
    EXPECT_TRUE(cache_->get("wallet_info", std::chrono::seconds(30)).has_value());
}

// ============================================================================
// CACHE CAPACITY
// ============================================================================

TEST_F(WalletServiceTest, Balance_ManyContracts_CacheStaysBounded) {
    cache_ = std::make_shared<ResponseCache>(8);
    service_ = std::make_shared<WalletService>(settings_, walletSettings_, backend_, limiter_, bus_, cache_);
    ON_CALL(*backend_, getBalance(_)).WillByDefault(Return("1"));

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(service_->balance("con_token_" + std::to_string(i)).isOk());
    }

    EXPECT_LE(cache_->size(), 8u);
}
