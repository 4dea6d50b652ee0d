#include <gtest/gtest.h>

#include "differ/differ.hpp"
#include "test_helpers.hpp"

using cells::CellValue;
using cells::WorkbookSnapshot;
using differ::ChangeKind;
using test_helpers::formulaCell;
using test_helpers::valueCell;

TEST(Differ, FingerprintIgnoresInsertionOrder)
{
    WorkbookSnapshot a;
    a["Sheet2"]["B2"] = valueCell(std::int64_t(2));
    a["Sheet1"]["A1"] = valueCell(std::string("x"));
    a["Sheet1"]["C3"] = formulaCell("=A1", std::string("x"));

    WorkbookSnapshot b;
    b["Sheet1"]["C3"] = formulaCell("=A1", std::string("x"));
    b["Sheet1"]["A1"] = valueCell(std::string("x"));
    b["Sheet2"]["B2"] = valueCell(std::int64_t(2));

    EXPECT_EQ(differ::fingerprint(a), differ::fingerprint(b));
    EXPECT_EQ(differ::fingerprint(a).size(), 64u);
}

TEST(Differ, FingerprintSeesValueChange)
{
    WorkbookSnapshot a;
    a["Sheet1"]["A1"] = valueCell(std::int64_t(1));
    WorkbookSnapshot b = a;
    b["Sheet1"]["A1"] = valueCell(std::int64_t(2));
    EXPECT_NE(differ::fingerprint(a), differ::fingerprint(b));
}

TEST(Differ, AddedCell)
{
    WorkbookSnapshot before;
    before["Sheet1"]["A1"] = valueCell(std::int64_t(1));
    WorkbookSnapshot after = before;
    after["Sheet1"]["B1"] = valueCell(std::int64_t(2));

    auto changes = differ::diff(before, after);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].worksheet, "Sheet1");
    EXPECT_EQ(changes[0].address, "B1");
    EXPECT_EQ(changes[0].kind, ChangeKind::Added);
    EXPECT_FALSE(changes[0].old_cell.has_value());
    ASSERT_TRUE(changes[0].new_cell.has_value());
}

TEST(Differ, DeletedCell)
{
    WorkbookSnapshot before;
    before["Sheet1"]["A1"] = valueCell(std::int64_t(1));
    before["Sheet1"]["A2"] = valueCell(std::int64_t(2));
    WorkbookSnapshot after;
    after["Sheet1"]["A1"] = valueCell(std::int64_t(1));

    auto changes = differ::diff(before, after);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].address, "A2");
    EXPECT_EQ(changes[0].kind, ChangeKind::Deleted);
}

TEST(Differ, ClassifiesEachKind)
{
    EXPECT_EQ(differ::classify(valueCell(std::int64_t(1)), valueCell(std::int64_t(2))),
              ChangeKind::DirectValueChanged);
    EXPECT_EQ(differ::classify(formulaCell("=A1", std::int64_t(1)), formulaCell("=A2", std::int64_t(1))),
              ChangeKind::FormulaChanged);
    EXPECT_EQ(differ::classify(valueCell(std::int64_t(5)), formulaCell("=A1", std::int64_t(5))),
              ChangeKind::FormulaChanged);
    EXPECT_EQ(differ::classify(formulaCell("=A1*2", std::int64_t(2)), formulaCell("=A1*2", std::int64_t(4))),
              ChangeKind::IndirectChanged);
    EXPECT_EQ(differ::classify(formulaCell("=[1]Sheet1!A1", std::int64_t(2)),
                               formulaCell("=[1]Sheet1!A1", std::int64_t(3))),
              ChangeKind::ExternalRefUpdated);
    EXPECT_FALSE(differ::classify(formulaCell("=A1", std::int64_t(3)), formulaCell("=A1", 3.0)).has_value());
    EXPECT_FALSE(differ::classify(std::nullopt, std::nullopt).has_value());
}

TEST(Differ, ExternalReferenceForms)
{
    EXPECT_TRUE(differ::isExternalReference("=[1]Sheet1!A1"));
    EXPECT_TRUE(differ::isExternalReference("='C:\\data\\[book.xlsx]Sheet1'!B2"));
    EXPECT_TRUE(differ::isExternalReference("='/mnt/share/[book.xlsx]Prices'!B2+1"));
    EXPECT_FALSE(differ::isExternalReference("=Sheet1!A1"));
    EXPECT_FALSE(differ::isExternalReference("='My Sheet'!A1"));
    EXPECT_FALSE(differ::isExternalReference("=SUM(A1:A3)"));
}

TEST(Differ, WorksheetOnOneSideOnly)
{
    WorkbookSnapshot before;
    before["Old"]["A1"] = valueCell(std::int64_t(1));
    WorkbookSnapshot after;
    after["New"]["A1"] = valueCell(std::int64_t(1));
    after["New"]["A2"] = valueCell(std::int64_t(2));

    auto changes = differ::diff(before, after);
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].worksheet, "New");
    EXPECT_EQ(changes[0].kind, ChangeKind::Added);
    EXPECT_EQ(changes[1].worksheet, "New");
    EXPECT_EQ(changes[2].worksheet, "Old");
    EXPECT_EQ(changes[2].kind, ChangeKind::Deleted);
}

TEST(Differ, IdenticalSnapshotsHaveNoChanges)
{
    WorkbookSnapshot snapshot;
    snapshot["Sheet1"]["A1"] = formulaCell("=B1", std::string("v"));
    snapshot["Sheet1"]["B1"] = valueCell(std::string("v"));
    EXPECT_TRUE(differ::diff(snapshot, snapshot).empty());
}

TEST(Differ, KindNames)
{
    EXPECT_STREQ(differ::toString(ChangeKind::Added), "ADDED");
    EXPECT_STREQ(differ::toString(ChangeKind::IndirectChanged), "INDIRECT_CHANGED");
    EXPECT_STREQ(differ::toString(ChangeKind::ExternalRefUpdated), "EXTERNAL_REF_UPDATED");
}
