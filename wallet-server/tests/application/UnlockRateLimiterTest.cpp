/**
 * @file UnlockRateLimiterTest.cpp
 * @brief Unit-тесты для UnlockRateLimiter
 *
 * Время двигается вручную, тесты не спят.
 */

#include <gtest/gtest.h>

#include "application/UnlockRateLimiter.hpp"
#include "../mocks/ManualClock.hpp"

using namespace walletgate;
using namespace walletgate::application;
using namespace walletgate::tests;
using protocol::ErrorCode;

class UnlockRateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::RateLimitSettings>();
        limiter_ = std::make_shared<UnlockRateLimiter>(settings_, clock_.source());
    }

    /// Неудачная попытка, которой разрешили дойти до проверки пароля
    void failAllowedAttempt(const std::string& source = "127.0.0.1") {
        auto decision = limiter_->checkAttempt(source);
        ASSERT_TRUE(decision.allowed) << decision.message;
        limiter_->recordFailure(source);
    }

    ManualClock clock_;
    std::shared_ptr<settings::RateLimitSettings> settings_;
    std::shared_ptr<UnlockRateLimiter> limiter_;
};

// ============================================================================
// BACKOFF
// ============================================================================

TEST_F(UnlockRateLimiterTest, FirstAttempt_Allowed) {
    EXPECT_TRUE(limiter_->checkAttempt("127.0.0.1").allowed);
}

TEST_F(UnlockRateLimiterTest, ImmediateRetryAfterFailure_Rejected) {
    failAllowedAttempt();

    auto decision = limiter_->checkAttempt("127.0.0.1");

    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.error, ErrorCode::TOO_MANY_ATTEMPTS);
    EXPECT_EQ(decision.retryAfter, std::chrono::seconds(1));
    EXPECT_NE(decision.message.find("wait 1 seconds"), std::string::npos);
}

TEST_F(UnlockRateLimiterTest, BackoffDoubles_1_2_4_8) {
    failAllowedAttempt();
    clock_.advance(std::chrono::seconds(1));

    failAllowedAttempt();
    EXPECT_EQ(limiter_->checkAttempt("127.0.0.1").retryAfter, std::chrono::seconds(2));
    clock_.advance(std::chrono::seconds(2));

    failAllowedAttempt();
    EXPECT_EQ(limiter_->checkAttempt("127.0.0.1").retryAfter, std::chrono::seconds(4));
    clock_.advance(std::chrono::seconds(4));

    failAllowedAttempt();
    EXPECT_EQ(limiter_->checkAttempt("127.0.0.1").retryAfter, std::chrono::seconds(8));
}

TEST_F(UnlockRateLimiterTest, PartialWait_ReportsRemainingSeconds) {
    failAllowedAttempt();
    clock_.advance(std::chrono::seconds(1));
    failAllowedAttempt();
    clock_.advance(std::chrono::milliseconds(500));

    auto decision = limiter_->checkAttempt("127.0.0.1");

    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.retryAfter, std::chrono::seconds(2));
}

TEST_F(UnlockRateLimiterTest, RejectedAttempts_DoNotCount) {
    failAllowedAttempt();
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(limiter_->checkAttempt("127.0.0.1").allowed);
    }

    auto record = limiter_->find("127.0.0.1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->attempts, 1);
}

// ============================================================================
// LOCKOUT
// ============================================================================

TEST_F(UnlockRateLimiterTest, SixthAttempt_AccountLocked) {
    for (int i = 0; i < 5; ++i) {
        failAllowedAttempt();
        clock_.advance(std::chrono::seconds(1 << i));
    }

    auto decision = limiter_->checkAttempt("127.0.0.1");

    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.error, ErrorCode::ACCOUNT_LOCKED);
    EXPECT_GT(decision.retryAfter.count(), 0);
    EXPECT_LE(decision.retryAfter.count(), 60);
    EXPECT_NE(decision.message.find("Try again in"), std::string::npos);
}

TEST_F(UnlockRateLimiterTest, Lockout_IgnoresElapsedBackoff) {
    for (int i = 0; i < 5; ++i) {
        failAllowedAttempt();
        clock_.advance(std::chrono::seconds(1 << i));
    }
    clock_.advance(std::chrono::seconds(30));

    EXPECT_EQ(limiter_->checkAttempt("127.0.0.1").error, ErrorCode::ACCOUNT_LOCKED);
}

TEST_F(UnlockRateLimiterTest, Lockout_ExpiresAndResets) {
    for (int i = 0; i < 5; ++i) {
        failAllowedAttempt();
        clock_.advance(std::chrono::seconds(1 << i));
    }
    clock_.advance(std::chrono::seconds(60));

    EXPECT_TRUE(limiter_->checkAttempt("127.0.0.1").allowed);
    EXPECT_FALSE(limiter_->find("127.0.0.1").has_value());
}

TEST_F(UnlockRateLimiterTest, ManyAttemptsWithoutLock_WaitIsCapped) {
    domain::RateLimitRecord record;
    record.sourceKey = "10.0.0.7";
    record.attempts = 10;
    record.lastAttempt = clock_.now;
    limiter_->put(record);

    auto decision = limiter_->checkAttempt("10.0.0.7");

    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.error, ErrorCode::TOO_MANY_ATTEMPTS);
    EXPECT_LE(decision.retryAfter.count(), 60);

    clock_.advance(std::chrono::seconds(60));
    auto locked = limiter_->checkAttempt("10.0.0.7");
    EXPECT_EQ(locked.error, ErrorCode::ACCOUNT_LOCKED);
    EXPECT_LE(locked.retryAfter.count(), 60);
}

// ============================================================================
// RESET / SWEEP
// ============================================================================

TEST_F(UnlockRateLimiterTest, Success_ResetsRecord) {
    failAllowedAttempt();
    clock_.advance(std::chrono::seconds(1));
    ASSERT_TRUE(limiter_->checkAttempt("127.0.0.1").allowed);
    limiter_->recordSuccess("127.0.0.1");

    // Следующая неудача оценивается сразу, без паузы
    failAllowedAttempt();
    auto record = limiter_->find("127.0.0.1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->attempts, 1);
}

TEST_F(UnlockRateLimiterTest, Sources_AreIndependent) {
    failAllowedAttempt("127.0.0.1");

    EXPECT_FALSE(limiter_->checkAttempt("127.0.0.1").allowed);
    EXPECT_TRUE(limiter_->checkAttempt("192.168.1.5").allowed);
}

TEST_F(UnlockRateLimiterTest, Sweep_RemovesExpiredLocksAndStaleRecords) {
    for (int i = 0; i < 5; ++i) {
        failAllowedAttempt("locked");
        clock_.advance(std::chrono::seconds(1 << i));
    }
    failAllowedAttempt("stale");
    clock_.advance(std::chrono::seconds(61));
    failAllowedAttempt("fresh");

    EXPECT_EQ(limiter_->sweep(clock_.now), 1u);     // истёкшая блокировка
    EXPECT_TRUE(limiter_->find("stale").has_value());

    clock_.advance(std::chrono::seconds(1801));
    EXPECT_EQ(limiter_->sweep(clock_.now), 2u);     // stale и fresh устарели
    EXPECT_FALSE(limiter_->find("fresh").has_value());
}
