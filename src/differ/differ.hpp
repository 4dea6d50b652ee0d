#ifndef DIFFER_HPP
#define DIFFER_HPP

#include <optional>
#include <string>
#include <vector>
#include "../cells/cells.hpp"

namespace differ
{
    enum class ChangeKind
    {
        Added,
        Deleted,
        FormulaChanged,
        DirectValueChanged,
        ExternalRefUpdated,
        IndirectChanged
    };

    const char *toString(ChangeKind kind);

    struct CellChange
    {
        std::string worksheet;
        std::string address;
        std::optional<cells::CellRecord> old_cell;
        std::optional<cells::CellRecord> new_cell;
        ChangeKind kind;
    };

    // SHA-256 (hex) over the canonical, key-sorted JSON rendering of the snapshot.
    // Independent of worksheet or cell insertion order.
    std::string fingerprint(const cells::WorkbookSnapshot &snapshot);

    // True if the formula points into another workbook: a bracketed numeric
    // index ("[1]Sheet1!A1") or a quoted external path ("'C:\x\[b.xlsx]S'!A1").
    bool isExternalReference(const std::string &formula);

    // Classifies a single address; std::nullopt when nothing changed.
    std::optional<ChangeKind> classify(const std::optional<cells::CellRecord> &oldCell,
                                       const std::optional<cells::CellRecord> &newCell);

    std::vector<CellChange> diffWorksheet(const std::string &worksheet,
                                          const cells::WorksheetMap &oldSheet,
                                          const cells::WorksheetMap &newSheet);

    // Worksheets present on one side only are compared against an empty sheet.
    std::vector<CellChange> diff(const cells::WorkbookSnapshot &oldSnapshot,
                                 const cells::WorkbookSnapshot &newSnapshot);
} // namespace differ

#endif // DIFFER_HPP
