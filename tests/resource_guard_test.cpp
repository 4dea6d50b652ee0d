#include <gtest/gtest.h>

#include "resource_guard/resource_guard.hpp"

using resource_guard::ResourceGuard;

TEST(ResourceGuard, ReadsResidentSetSize)
{
    ResourceGuard guard(true, 1024.0 * 1024.0);
    EXPECT_GT(guard.currentUsageMB(), 0.0);
    EXPECT_FALSE(guard.overLimit());
}

TEST(ResourceGuard, DisabledNeverReportsPressure)
{
    ResourceGuard guard(false, 0.0);
    EXPECT_FALSE(guard.overLimit());
    EXPECT_FALSE(guard.enabled());
}

TEST(ResourceGuard, TinyLimitIsExceeded)
{
    ResourceGuard guard(true, 0.001);
    EXPECT_TRUE(guard.overLimit());
    guard.releaseMemory();
    EXPECT_TRUE(guard.overLimit());
    EXPECT_DOUBLE_EQ(guard.limitMB(), 0.001);
}
