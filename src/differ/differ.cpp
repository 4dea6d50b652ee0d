#include "differ.hpp"

#include <iomanip>
#include <regex>
#include <set>
#include <sstream>
#include <openssl/sha.h>

namespace differ
{
    const char *toString(ChangeKind kind)
    {
        switch (kind)
        {
        case ChangeKind::Added:
            return "ADDED";
        case ChangeKind::Deleted:
            return "DELETED";
        case ChangeKind::FormulaChanged:
            return "FORMULA_CHANGED";
        case ChangeKind::DirectValueChanged:
            return "DIRECT_VALUE_CHANGED";
        case ChangeKind::ExternalRefUpdated:
            return "EXTERNAL_REF_UPDATED";
        case ChangeKind::IndirectChanged:
            return "INDIRECT_CHANGED";
        }
        return "UNKNOWN";
    }

    std::string fingerprint(const cells::WorkbookSnapshot &snapshot)
    {
        // nlohmann::json objects keep keys sorted, so dump() is canonical.
        // Broken UTF-8 from a damaged workbook hashes as U+FFFD, same as after a baseline round trip.
        std::string content = cells::snapshotToJson(snapshot).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char *>(content.data()), content.size(), hash);
        std::ostringstream oss;
        for (unsigned char byte : hash)
        {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
        }
        return oss.str();
    }

    bool isExternalReference(const std::string &formula)
    {
        static const std::regex indexedBook(R"(\[\d+\][^!]*!)");
        static const std::regex quotedPath(R"('[^']*[\\/\[][^']*'!)");
        return std::regex_search(formula, indexedBook) || std::regex_search(formula, quotedPath);
    }

    std::optional<ChangeKind> classify(const std::optional<cells::CellRecord> &oldCell,
                                       const std::optional<cells::CellRecord> &newCell)
    {
        if (!oldCell && !newCell)
            return std::nullopt;
        if (!oldCell)
            return ChangeKind::Added;
        if (!newCell)
            return ChangeKind::Deleted;

        if (oldCell->formula != newCell->formula)
            return ChangeKind::FormulaChanged;

        if (cells::valuesEqual(oldCell->value, newCell->value))
            return std::nullopt;

        if (!oldCell->formula)
            return ChangeKind::DirectValueChanged;

        if (isExternalReference(*oldCell->formula))
            return ChangeKind::ExternalRefUpdated;
        return ChangeKind::IndirectChanged;
    }

    std::vector<CellChange> diffWorksheet(const std::string &worksheet,
                                          const cells::WorksheetMap &oldSheet,
                                          const cells::WorksheetMap &newSheet)
    {
        std::vector<CellChange> changes;

        // Both maps are ordered by address, so walk them together.
        auto oldIt = oldSheet.begin();
        auto newIt = newSheet.begin();
        while (oldIt != oldSheet.end() || newIt != newSheet.end())
        {
            std::optional<cells::CellRecord> oldCell;
            std::optional<cells::CellRecord> newCell;
            std::string address;

            if (newIt == newSheet.end() || (oldIt != oldSheet.end() && oldIt->first < newIt->first))
            {
                address = oldIt->first;
                oldCell = oldIt->second;
                ++oldIt;
            }
            else if (oldIt == oldSheet.end() || newIt->first < oldIt->first)
            {
                address = newIt->first;
                newCell = newIt->second;
                ++newIt;
            }
            else
            {
                address = oldIt->first;
                oldCell = oldIt->second;
                newCell = newIt->second;
                ++oldIt;
                ++newIt;
            }

            auto kind = classify(oldCell, newCell);
            if (kind)
                changes.push_back(CellChange{worksheet, address, oldCell, newCell, *kind});
        }
        return changes;
    }

    std::vector<CellChange> diff(const cells::WorkbookSnapshot &oldSnapshot,
                                 const cells::WorkbookSnapshot &newSnapshot)
    {
        static const cells::WorksheetMap emptySheet;

        std::set<std::string> worksheets;
        for (const auto &entry : oldSnapshot)
            worksheets.insert(entry.first);
        for (const auto &entry : newSnapshot)
            worksheets.insert(entry.first);

        std::vector<CellChange> changes;
        for (const auto &name : worksheets)
        {
            auto oldIt = oldSnapshot.find(name);
            auto newIt = newSnapshot.find(name);
            const cells::WorksheetMap &oldSheet = oldIt != oldSnapshot.end() ? oldIt->second : emptySheet;
            const cells::WorksheetMap &newSheet = newIt != newSnapshot.end() ? newIt->second : emptySheet;

            auto sheetChanges = diffWorksheet(name, oldSheet, newSheet);
            changes.insert(changes.end(), sheetChanges.begin(), sheetChanges.end());
        }
        return changes;
    }
} // namespace differ
