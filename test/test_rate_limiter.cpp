#include <gtest/gtest.h>

#include "fake_platform.hpp"
#include "sdmount_rate_limiter.hpp"

namespace sdmount {
namespace {

using fakes::FakeClock;

TEST(RateLimiter, FirstOperationNeverWaits)
{
    FakeClock clock;
    RateLimiter limiter;
    rate_limiter_init(&limiter, &clock, kDiagRateFloorMs);

    EXPECT_EQ(rate_limiter_throttle(&limiter), 0);
    EXPECT_EQ(clock.slept_us(), 0);
    EXPECT_TRUE(limiter.has_last_op);
}

TEST(RateLimiter, WaitsOutTheRemainderOfTheFloor)
{
    FakeClock clock;
    RateLimiter limiter;
    rate_limiter_init(&limiter, &clock, kDiagRateFloorMs);

    rate_limiter_throttle(&limiter);
    clock.advance_ms(100);
    const int64_t before = clock.now_us();
    EXPECT_EQ(rate_limiter_throttle(&limiter), 400000);
    EXPECT_EQ(clock.now_us() - before, 400000);
}

TEST(RateLimiter, BackToBackCallsWaitTheFullFloor)
{
    FakeClock clock;
    RateLimiter limiter;
    rate_limiter_init(&limiter, &clock, kLeanRateFloorMs);

    rate_limiter_throttle(&limiter);
    EXPECT_EQ(rate_limiter_throttle(&limiter), 250000);
    EXPECT_EQ(rate_limiter_throttle(&limiter), 250000);
    EXPECT_EQ(clock.slept_us(), 500000);
}

TEST(RateLimiter, NoWaitOnceTheFloorHasPassed)
{
    FakeClock clock;
    RateLimiter limiter;
    rate_limiter_init(&limiter, &clock, kDiagRateFloorMs);

    rate_limiter_throttle(&limiter);
    clock.advance_ms(500);
    EXPECT_EQ(rate_limiter_throttle(&limiter), 0);
    clock.advance_ms(2000);
    EXPECT_EQ(rate_limiter_throttle(&limiter), 0);
    EXPECT_EQ(clock.slept_us(), 0);
}

TEST(RateLimiter, ResetForgetsThePreviousOperation)
{
    FakeClock clock;
    RateLimiter limiter;
    rate_limiter_init(&limiter, &clock, kDiagRateFloorMs);

    rate_limiter_throttle(&limiter);
    rate_limiter_reset(&limiter);
    EXPECT_FALSE(limiter.has_last_op);
    EXPECT_EQ(rate_limiter_throttle(&limiter), 0);
}

TEST(RateLimiter, MissingClockIsANoOp)
{
    RateLimiter limiter;
    EXPECT_EQ(rate_limiter_throttle(&limiter), 0);
    EXPECT_EQ(rate_limiter_throttle(nullptr), 0);
}

}  // namespace
}  // namespace sdmount
