#include <gtest/gtest.h>

#include <algorithm>

#include "batch/baseline_builder.hpp"
#include "test_helpers.hpp"

using batch::BaselineBuilder;
using batch::BuilderOptions;
using test_helpers::FakeExtractor;
using test_helpers::MemorySink;
using test_helpers::TempDir;

namespace
{
    baseline_store::StoreOptions fastOptions()
    {
        baseline_store::StoreOptions options;
        options.max_retries = 1;
        options.retry_base_delay = std::chrono::milliseconds(1);
        return options;
    }

    BuilderOptions builderOptions()
    {
        BuilderOptions options;
        options.memory_pause = std::chrono::milliseconds(0);
        return options;
    }

    struct Fixture
    {
        Fixture()
            : store(dir.path() / "baselines", codec::findCodec("gzip"), fastOptions()),
              detector(store, extractor, sink, settings::ReportSettings()),
              tracker(dir.path() / "resume" / "progress.json")
        {
        }

        std::vector<std::string> files(std::size_t count)
        {
            std::vector<std::string> paths;
            for (std::size_t i = 0; i < count; ++i)
            {
                std::string path = dir.file("book" + std::to_string(i) + ".xlsx");
                cells::WorkbookSnapshot snapshot;
                snapshot["Sheet1"]["A1"] = test_helpers::valueCell(static_cast<std::int64_t>(i));
                extractor.set(path, snapshot);
                paths.push_back(path);
            }
            return paths;
        }

        TempDir dir;
        session::MonitoringSession session;
        FakeExtractor extractor;
        MemorySink sink;
        baseline_store::BaselineStore store;
        detector::ChangeDetector detector;
        progress::ProgressTracker tracker;
    };
}

TEST(BaselineBuilder, CollectsSupportedFilesSorted)
{
    TempDir dir;
    test_helpers::writeFile(dir.path() / "b.xlsx", "x");
    test_helpers::writeFile(dir.path() / "a.XLSM", "x");
    test_helpers::writeFile(dir.path() / "nested" / "c.xlsx", "x");
    test_helpers::writeFile(dir.path() / "~$b.xlsx", "x");
    test_helpers::writeFile(dir.path() / "notes.txt", "x");
    TempDir single;
    test_helpers::writeFile(single.path() / "lone.xlsx", "x");

    auto files = batch::collectFiles({dir.path().string(), single.file("lone.xlsx"), dir.file("missing")},
                                     {".xlsx", ".xlsm"});
    ASSERT_EQ(files.size(), 4u);
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
    EXPECT_NE(std::find(files.begin(), files.end(), (dir.path() / "nested" / "c.xlsx").string()), files.end());
    EXPECT_NE(std::find(files.begin(), files.end(), single.file("lone.xlsx")), files.end());
}

TEST(BaselineBuilder, SeedsEveryFileAndClearsProgress)
{
    Fixture f;
    resource_guard::ResourceGuard guard(false, 0.0);
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, builderOptions());

    auto summary = builder.run(f.files(3));
    EXPECT_EQ(summary.status, errors::Status::Ok);
    EXPECT_TRUE(summary.completed);
    EXPECT_EQ(summary.seeded, 3u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(f.store.listKeys().size(), 3u);
    EXPECT_FALSE(f.tracker.load().has_value());
    EXPECT_TRUE(f.session.baselineCompleted());

    auto again = builder.run(f.files(3));
    EXPECT_EQ(again.seeded, 0u);
    EXPECT_EQ(again.skipped, 3u);
}

TEST(BaselineBuilder, EmptyListCompletesImmediately)
{
    Fixture f;
    resource_guard::ResourceGuard guard(false, 0.0);
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, builderOptions());
    auto summary = builder.run({});
    EXPECT_TRUE(summary.completed);
    EXPECT_TRUE(f.session.baselineCompleted());
}

TEST(BaselineBuilder, ResumesFromSavedIndex)
{
    Fixture f;
    auto files = f.files(3);
    ASSERT_TRUE(f.tracker.save(2, 3));

    resource_guard::ResourceGuard guard(false, 0.0);
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, builderOptions());
    auto summary = builder.run(files);

    EXPECT_EQ(summary.start_index, 2u);
    EXPECT_EQ(summary.seeded, 1u);
    EXPECT_EQ(f.extractor.extractCalls(), 1);
    EXPECT_TRUE(f.store.exists("book2.xlsx"));
    EXPECT_FALSE(f.store.exists("book0.xlsx"));
}

TEST(BaselineBuilder, MismatchedProgressStartsOver)
{
    Fixture f;
    auto files = f.files(3);
    ASSERT_TRUE(f.tracker.save(2, 7));

    resource_guard::ResourceGuard guard(false, 0.0);
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, builderOptions());
    auto summary = builder.run(files);
    EXPECT_EQ(summary.start_index, 0u);
    EXPECT_EQ(summary.seeded, 3u);
}

TEST(BaselineBuilder, ResumeCanBeDisabled)
{
    Fixture f;
    auto files = f.files(3);
    ASSERT_TRUE(f.tracker.save(2, 3));

    resource_guard::ResourceGuard guard(false, 0.0);
    BuilderOptions options = builderOptions();
    options.enable_resume = false;
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, options);
    EXPECT_EQ(builder.run(files).seeded, 3u);
}

TEST(BaselineBuilder, StopSavesProgress)
{
    Fixture f;
    auto files = f.files(3);
    f.session.requestStop();

    resource_guard::ResourceGuard guard(false, 0.0);
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, builderOptions());
    auto summary = builder.run(files);

    EXPECT_FALSE(summary.completed);
    EXPECT_FALSE(f.session.baselineCompleted());
    auto record = f.tracker.load();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->completed, 0u);
    EXPECT_EQ(record->total, 3u);
}

TEST(BaselineBuilder, MemoryPressureHaltsRun)
{
    Fixture f;
    auto files = f.files(3);
    resource_guard::ResourceGuard guard(true, 0.001);
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, builderOptions());

    auto summary = builder.run(files);
    EXPECT_EQ(summary.status, errors::Status::ResourceExhausted);
    EXPECT_FALSE(summary.completed);
    EXPECT_EQ(f.extractor.extractCalls(), 0);
    auto record = f.tracker.load();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->completed, 0u);
}

TEST(BaselineBuilder, FailedFilesAreCountedAndSkipped)
{
    Fixture f;
    auto files = f.files(3);
    f.extractor.fail(files[1], errors::Status::AccessDenied);

    resource_guard::ResourceGuard guard(false, 0.0);
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, builderOptions());
    auto summary = builder.run(files);
    EXPECT_TRUE(summary.completed);
    EXPECT_EQ(summary.seeded, 2u);
    EXPECT_EQ(summary.failed, 1u);
}

TEST(BaselineBuilder, ThrowingFileIsCountedAsFailed)
{
    Fixture f;
    auto files = f.files(3);
    f.extractor.breakAuthor(files[0]);

    resource_guard::ResourceGuard guard(false, 0.0);
    BaselineBuilder builder(f.session, f.detector, f.tracker, guard, builderOptions());
    auto summary = builder.run(files);
    EXPECT_TRUE(summary.completed);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.seeded, 2u);
    EXPECT_EQ(f.store.listKeys().size(), 2u);
}
