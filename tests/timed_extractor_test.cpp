#include <gtest/gtest.h>

#include <stdexcept>

#include "extractor/timed_extractor.hpp"
#include "test_helpers.hpp"

using extractor::TimedExtractor;
using session::MonitoringSession;
using test_helpers::FakeExtractor;

namespace
{
    class ObservingExtractor : public extractor::SpreadsheetExtractor
    {
    public:
        explicit ObservingExtractor(MonitoringSession &session) : session_(session) {}

        errors::Status extract(const std::string &, cells::WorkbookSnapshot &snapshot) override
        {
            auto marker = session_.currentProcessing();
            seen = marker ? marker->path : "";
            snapshot["S"]["A1"] = test_helpers::valueCell(std::int64_t(1));
            return errors::Status::Ok;
        }
        std::optional<std::string> lastAuthor(const std::string &) override { return std::string("carol"); }

        std::string seen;

    private:
        MonitoringSession &session_;
    };

    class ThrowingExtractor : public extractor::SpreadsheetExtractor
    {
    public:
        errors::Status extract(const std::string &, cells::WorkbookSnapshot &) override
        {
            throw std::runtime_error("zip bomb");
        }
        std::optional<std::string> lastAuthor(const std::string &) override { return std::nullopt; }
    };

    cells::WorkbookSnapshot oneCell()
    {
        cells::WorkbookSnapshot snapshot;
        snapshot["Sheet1"]["A1"] = test_helpers::valueCell(std::string("x"));
        return snapshot;
    }
}

TEST(TimedExtractor, PassesThroughFastReads)
{
    MonitoringSession session;
    auto fake = std::make_shared<FakeExtractor>();
    fake->set("/data/a.xlsx", oneCell(), std::string("dave"));
    TimedExtractor timed(fake, session, true, std::chrono::milliseconds(2000));

    cells::WorkbookSnapshot snapshot;
    EXPECT_EQ(timed.extract("/data/a.xlsx", snapshot), errors::Status::Ok);
    EXPECT_EQ(snapshot, oneCell());
    EXPECT_EQ(timed.lastAuthor("/data/a.xlsx"), std::optional<std::string>("dave"));
    EXPECT_FALSE(session.currentProcessing().has_value());
}

TEST(TimedExtractor, SlowReadTimesOut)
{
    MonitoringSession session;
    auto fake = std::make_shared<FakeExtractor>();
    fake->set("/data/slow.xlsx", oneCell());
    fake->setDelay(std::chrono::milliseconds(300));
    TimedExtractor timed(fake, session, true, std::chrono::milliseconds(30));

    cells::WorkbookSnapshot snapshot;
    EXPECT_EQ(timed.extract("/data/slow.xlsx", snapshot), errors::Status::Timeout);
    EXPECT_TRUE(snapshot.empty());
    EXPECT_FALSE(session.currentProcessing().has_value());
}

TEST(TimedExtractor, MarksFileWhileReading)
{
    MonitoringSession session;
    auto observer = std::make_shared<ObservingExtractor>(session);

    TimedExtractor untimed(observer, session, false, std::chrono::milliseconds(0));
    cells::WorkbookSnapshot snapshot;
    EXPECT_EQ(untimed.extract("/data/b.xlsx", snapshot), errors::Status::Ok);
    EXPECT_EQ(observer->seen, "/data/b.xlsx");
    EXPECT_FALSE(session.currentProcessing().has_value());

    TimedExtractor timed(observer, session, true, std::chrono::milliseconds(2000));
    EXPECT_EQ(timed.extract("/data/c.xlsx", snapshot), errors::Status::Ok);
    EXPECT_EQ(observer->seen, "/data/c.xlsx");
    EXPECT_FALSE(session.currentProcessing().has_value());
}

TEST(TimedExtractor, FailuresPropagate)
{
    MonitoringSession session;
    auto fake = std::make_shared<FakeExtractor>();
    fake->fail("/data/locked.xlsx", errors::Status::AccessDenied);
    TimedExtractor timed(fake, session, true, std::chrono::milliseconds(2000));

    cells::WorkbookSnapshot snapshot;
    EXPECT_EQ(timed.extract("/data/locked.xlsx", snapshot), errors::Status::AccessDenied);

    TimedExtractor throwing(std::make_shared<ThrowingExtractor>(), session, true, std::chrono::milliseconds(2000));
    EXPECT_EQ(throwing.extract("/data/bomb.xlsx", snapshot), errors::Status::Corrupt);
    EXPECT_FALSE(session.currentProcessing().has_value());
}
