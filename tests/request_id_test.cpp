#include <gtest/gtest.h>
#include <rcon/request_id.hpp>
#include <rcon/types.hpp>

#include <limits>
#include <stdexcept>

using namespace rcon;

TEST(RequestIdCounterTest, StartsAtResetId) {
    RequestIdCounter counter;
    EXPECT_EQ(counter.Current(), protocol::RESET_ID);
    EXPECT_EQ(counter.GetCap(), protocol::DEFAULT_CAP);
}

TEST(RequestIdCounterTest, AdvanceAtCap_WrapsToResetId) {
    RequestIdCounter counter;
    counter.Set(protocol::DEFAULT_CAP);

    counter.Advance();
    EXPECT_EQ(counter.Current(), protocol::RESET_ID);
}

TEST(RequestIdCounterTest, HundredAdvancesFromResetId_ReturnToResetId) {
    RequestIdCounter counter(100);

    for (int i = 1; i < 100; ++i) {
        counter.Advance();
        EXPECT_EQ(counter.Current(), i + 1);
    }

    // The 100th advance takes the counter from 100 back to 1
    ASSERT_EQ(counter.Current(), 100);
    counter.Advance();
    EXPECT_EQ(counter.Current(), 1);
}

TEST(RequestIdCounterTest, FromAnyStartingId_CapMinusIdPlusOneAdvancesWrap) {
    const int32_t cap = 20;
    for (int32_t start = protocol::RESET_ID; start <= cap; ++start) {
        RequestIdCounter counter(cap);
        counter.Set(start);
        for (int32_t i = 0; i < cap - start + 1; ++i) {
            counter.Advance();
        }
        EXPECT_EQ(counter.Current(), protocol::RESET_ID) << "start=" << start;
    }
}

TEST(RequestIdCounterTest, CapOfOne_AlwaysReturnsResetId) {
    RequestIdCounter counter(1);
    counter.Advance();
    EXPECT_EQ(counter.Current(), 1);
    counter.Advance();
    EXPECT_EQ(counter.Current(), 1);
}

TEST(RequestIdCounterTest, MaximumCap_WrapsWithoutOverflow) {
    const int32_t max = std::numeric_limits<int32_t>::max();
    RequestIdCounter counter(max);
    counter.Set(max);

    counter.Advance();
    EXPECT_EQ(counter.Current(), protocol::RESET_ID);
}

TEST(RequestIdCounterTest, Reset_ReturnsToResetId) {
    RequestIdCounter counter;
    counter.Set(57);
    counter.Reset();
    EXPECT_EQ(counter.Current(), protocol::RESET_ID);
}

TEST(RequestIdCounterTest, Set_OutsideRange_Throws) {
    RequestIdCounter counter(50);

    EXPECT_THROW(counter.Set(0), std::invalid_argument);
    EXPECT_THROW(counter.Set(protocol::AUTH_FAILED_ID), std::invalid_argument);
    EXPECT_THROW(counter.Set(51), std::invalid_argument);
    EXPECT_EQ(counter.Current(), protocol::RESET_ID);

    EXPECT_NO_THROW(counter.Set(50));
    EXPECT_EQ(counter.Current(), 50);
}

TEST(RequestIdCounterTest, InvalidCap_Throws) {
    EXPECT_THROW(RequestIdCounter(0), std::invalid_argument);
    EXPECT_THROW(RequestIdCounter(-5), std::invalid_argument);

    RequestIdCounter counter;
    EXPECT_THROW(counter.SetCap(0), std::invalid_argument);
    EXPECT_EQ(counter.GetCap(), protocol::DEFAULT_CAP);
}

TEST(RequestIdCounterTest, SetCapBelowCurrent_WrapsToResetId) {
    RequestIdCounter counter;
    counter.Set(80);

    counter.SetCap(50);
    EXPECT_EQ(counter.GetCap(), 50);
    EXPECT_EQ(counter.Current(), protocol::RESET_ID);

    counter.Set(30);
    counter.SetCap(40);
    EXPECT_EQ(counter.Current(), 30);
}
