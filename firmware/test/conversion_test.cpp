#include <chrono>
#include <cstdint>
#include <limits>

#include <gtest/gtest.h>

#include "timebase.h"

typedef std::chrono::duration<uint64_t, std::nano> Nanos;
typedef std::chrono::duration<uint64_t, std::micro> Micros;

TEST(TicksToTest, MillisecondRate) {
    EXPECT_EQ((ticks_to<std::chrono::milliseconds, 1000>(1500).count()), 1500);
    EXPECT_EQ((ticks_to<std::chrono::microseconds, 1000>(1500).count()), 1500000);
    EXPECT_DOUBLE_EQ((ticks_to<std::chrono::duration<double>, 1000>(1500).count()), 1.5);
}

TEST(TicksToTest, ZeroIsZero) {
    EXPECT_EQ((ticks_to<std::chrono::seconds, 1000>(0).count()), 0);
    EXPECT_EQ((ticks_to<Nanos, 72000000>(0).count()), 0u);
    EXPECT_EQ((ticks_to<std::chrono::duration<double>, 32768>(0).count()), 0.0);
}

TEST(TicksToTest, CoarserUnitsRoundDown) {
    EXPECT_EQ((ticks_to<std::chrono::seconds, 1000>(1500).count()), 1);
    EXPECT_EQ((ticks_to<std::chrono::seconds, 1000>(1999).count()), 1);
    EXPECT_EQ((ticks_to<std::chrono::minutes, 1000>(90000).count()), 1);
    EXPECT_EQ((ticks_to<std::chrono::minutes, 1000>(119999).count()), 1);
    EXPECT_EQ((ticks_to<std::chrono::minutes, 1000>(120000).count()), 2);
}

TEST(TicksToTest, FinerThanATick) {
    // 1e9 / 32768 = 30517.578125
    EXPECT_EQ((ticks_to<Nanos, 32768>(1).count()), 30517u);
    EXPECT_EQ((ticks_to<Nanos, 32768>(3).count()), 91552u);
    EXPECT_EQ((ticks_to<Nanos, 32768>(32768).count()), 1000000000u);
    EXPECT_EQ((ticks_to<Micros, 72000000>(71).count()), 0u);
    EXPECT_EQ((ticks_to<Micros, 72000000>(72).count()), 1u);
}

// ticks * 1e9 doesn't fit in 64 bits here, the result does
TEST(TicksToTest, LargeCountsAreExact) {
    uint64_t const ticks = (uint64_t(1) << 40) + 12345;
    unsigned __int128 const expected = static_cast<unsigned __int128>(ticks) * 1000000000u / 72000000u;
    EXPECT_EQ((ticks_to<Nanos, 72000000>(ticks).count()), static_cast<uint64_t>(expected));
}

TEST(TicksToTest, FullWidthToMicroseconds) {
    uint64_t const ticks = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ((ticks_to<Micros, 72000000>(ticks).count()), ticks / 72);
}

TEST(TicksToTest, HighestFrequency) {
    uint32_t const ticks_per_second = std::numeric_limits<uint32_t>::max();
    uint64_t const ticks = uint64_t(ticks_per_second) * 3 + ticks_per_second / 2;
    unsigned __int128 const expected = static_cast<unsigned __int128>(ticks) * 1000000000u / ticks_per_second;
    EXPECT_EQ((ticks_to<Nanos, std::numeric_limits<uint32_t>::max()>(ticks).count()), static_cast<uint64_t>(expected));
}
