#include <gtest/gtest.h>

#include "cells/cells.hpp"
#include "test_helpers.hpp"

using namespace cells;
using test_helpers::formulaCell;
using test_helpers::valueCell;

TEST(Cells, NumericValuesCompareByValue)
{
    EXPECT_TRUE(valuesEqual(CellValue(std::int64_t(1)), CellValue(1.0)));
    EXPECT_FALSE(valuesEqual(CellValue(std::int64_t(1)), CellValue(1.5)));
    EXPECT_FALSE(valuesEqual(CellValue(std::string("1")), CellValue(std::int64_t(1))));
    EXPECT_TRUE(valuesEqual(std::nullopt, std::nullopt));
    EXPECT_FALSE(valuesEqual(std::nullopt, CellValue(std::string(""))));
}

TEST(Cells, ValueToString)
{
    EXPECT_EQ(valueToString(CellValue(true)), "TRUE");
    EXPECT_EQ(valueToString(CellValue(false)), "FALSE");
    EXPECT_EQ(valueToString(CellValue(std::int64_t(42))), "42");
    EXPECT_EQ(valueToString(CellValue(std::string("text"))), "text");
    EXPECT_EQ(valueToString(std::nullopt), "");
}

TEST(Cells, EmptyRecord)
{
    CellRecord cell;
    EXPECT_TRUE(cell.empty());
    cell.formula = "=A1";
    EXPECT_FALSE(cell.empty());
}

TEST(Cells, SnapshotSurvivesJson)
{
    WorkbookSnapshot snapshot;
    snapshot["Sheet1"]["A1"] = valueCell(std::string("hello"));
    snapshot["Sheet1"]["B1"] = valueCell(std::int64_t(7));
    snapshot["Sheet1"]["C1"] = valueCell(2.25);
    snapshot["Sheet1"]["D1"] = valueCell(true);
    snapshot["Totals"]["A1"] = formulaCell("=SUM(Sheet1!B1:C1)", 9.25);

    WorkbookSnapshot back = snapshotFromJson(snapshotToJson(snapshot));
    EXPECT_EQ(back, snapshot);
    EXPECT_EQ(cellCount(back), 5u);
}

TEST(Cells, BaselineSurvivesJson)
{
    Baseline baseline;
    baseline.content_hash = "abc";
    baseline.last_author = "alice";
    baseline.cells["S"]["A1"] = valueCell(std::int64_t(1));
    baseline.timestamp = currentTimestamp();

    Baseline back = nlohmann::json(baseline).get<Baseline>();
    EXPECT_EQ(back.content_hash, "abc");
    ASSERT_TRUE(back.last_author.has_value());
    EXPECT_EQ(*back.last_author, "alice");
    EXPECT_EQ(back.cells, baseline.cells);
    EXPECT_EQ(back.timestamp, baseline.timestamp);
}

TEST(Cells, MalformedRecordThrows)
{
    nlohmann::json bad = nlohmann::json::array({1, 2});
    EXPECT_THROW(bad.get<CellRecord>(), InvalidRecord);
}

TEST(Cells, TimestampLooksIso)
{
    std::string ts = currentTimestamp();
    ASSERT_GE(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
}
