#include <gtest/gtest.h>

#include "progress/progress.hpp"
#include "test_helpers.hpp"

using progress::ProgressTracker;
using test_helpers::TempDir;

TEST(Progress, SaveThenLoad)
{
    TempDir dir;
    ProgressTracker tracker(dir.path() / "resume" / "progress.json");
    ASSERT_TRUE(tracker.save(4, 10));

    auto record = tracker.load();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->completed, 4u);
    EXPECT_EQ(record->total, 10u);
    EXPECT_FALSE(record->timestamp.empty());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "resume" / "progress.json.tmp"));
}

TEST(Progress, MissingFileMeansNothingToResume)
{
    TempDir dir;
    ProgressTracker tracker(dir.path() / "progress.json");
    EXPECT_FALSE(tracker.load().has_value());
    EXPECT_TRUE(tracker.clear());
}

TEST(Progress, CorruptFileIsIgnored)
{
    TempDir dir;
    ProgressTracker tracker(dir.path() / "progress.json");

    test_helpers::writeFile(tracker.file(), "{\"completed\": 3, \"tot");
    EXPECT_FALSE(tracker.load().has_value());

    test_helpers::writeFile(tracker.file(), "{\"completed\": 12, \"total\": 5}");
    EXPECT_FALSE(tracker.load().has_value());

    test_helpers::writeFile(tracker.file(), "{\"completed\": \"three\", \"total\": 5}");
    EXPECT_FALSE(tracker.load().has_value());
}

TEST(Progress, ClearRemovesRecord)
{
    TempDir dir;
    ProgressTracker tracker(dir.path() / "progress.json");
    ASSERT_TRUE(tracker.save(1, 2));
    EXPECT_TRUE(tracker.clear());
    EXPECT_FALSE(std::filesystem::exists(tracker.file()));
    EXPECT_FALSE(tracker.load().has_value());
}
