#include <gtest/gtest.h>
#include <vector>
#include "Strata/Core/Tick.hpp"

class TickTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TickTest, NewerThanLastRun)
{
    using Strata::Tick;

    Tick now(10);
    Tick changed(7);

    EXPECT_TRUE(changed.IsNewerThan(Tick(5), now));
    EXPECT_FALSE(changed.IsNewerThan(Tick(7), now));
    EXPECT_FALSE(changed.IsNewerThan(Tick(9), now));
}

// Comparisons are made relative to now, so they survive the counter wrapping
TEST_F(TickTest, WrappingCounter)
{
    using Strata::Tick;

    Tick lastRun(0xFFFFFFF0u);
    Tick changed(0xFFFFFFFAu);
    Tick now(5);

    EXPECT_TRUE(changed.IsNewerThan(lastRun, now));
    EXPECT_FALSE(lastRun.IsNewerThan(changed, now));
    EXPECT_EQ(now.RelativeTo(changed).Get(), 11u);
}

TEST_F(TickTest, CheckAgeClampsOldTicks)
{
    using Strata::Tick;

    Tick now(Tick::MAX_AGE + 100);
    Tick old(10);
    Tick recent(Tick::MAX_AGE + 50);

    EXPECT_TRUE(old.CheckAge(now));
    EXPECT_EQ(old.Get(), 100u);
    EXPECT_EQ(now.RelativeTo(old).Get(), Tick::MAX_AGE);

    EXPECT_FALSE(recent.CheckAge(now));
    EXPECT_EQ(recent.Get(), Tick::MAX_AGE + 50);
}

TEST_F(TickTest, CheckAllClampsEveryTick)
{
    using Strata::Tick;

    Tick now(Tick::MAX_AGE + 1000);
    std::vector<Tick> ticks{Tick(1), Tick(2), Tick(Tick::MAX_AGE + 999)};
    Tick::CheckAll(ticks, now);

    EXPECT_EQ(ticks[0].Get(), 1000u);
    EXPECT_EQ(ticks[1].Get(), 1000u);
    EXPECT_EQ(ticks[2].Get(), Tick::MAX_AGE + 999);
}

// A clamped tick still compares as older than a tick set after the last run
TEST_F(TickTest, ClampedTickStaysOlder)
{
    using Strata::Tick;

    Tick now(Tick::MAX_AGE + 1000);
    Tick ancient(3);
    ancient.CheckAge(now);

    Tick lastRun(Tick::MAX_AGE + 900);
    Tick changed(Tick::MAX_AGE + 950);

    EXPECT_FALSE(ancient.IsNewerThan(lastRun, now));
    EXPECT_TRUE(changed.IsNewerThan(lastRun, now));
}
