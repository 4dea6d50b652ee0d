#ifndef XLSX_EXTRACTOR_HPP
#define XLSX_EXTRACTOR_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "extractor.hpp"
#include "zip_archive.hpp"

namespace cache
{
    class LocalMirror;
}

namespace extractor
{
    // Office Open XML workbook reader (.xlsx / .xlsm). Formulas are reported
    // with a leading "=", values are the cached results Excel stored.
    class XlsxExtractor : public SpreadsheetExtractor
    {
    public:
        // The mirror may be null; files are then read in place. Shared so that a
        // read abandoned on timeout can still finish after its owner is gone.
        explicit XlsxExtractor(std::shared_ptr<cache::LocalMirror> mirror = nullptr);

        errors::Status extract(const std::string &path, cells::WorkbookSnapshot &snapshot) override;
        std::optional<std::string> lastAuthor(const std::string &path) override;

        // Parts of an already opened container, exposed for testing.
        static errors::Status readWorkbook(const ZipArchive &archive, cells::WorkbookSnapshot &snapshot);
        static std::optional<std::string> readLastAuthor(const ZipArchive &archive);

    private:
        std::string localPath(const std::string &path);

        std::shared_ptr<cache::LocalMirror> mirror_;
    };

    // "AB12" -> {"AB", 12}; false if the text is not an A1 address.
    bool splitAddress(const std::string &address, std::string &column, long &row);
    long columnIndex(const std::string &column);
    std::string columnName(long index);

    // Moves the relative references of a shared formula by the given offsets.
    std::string shiftFormula(const std::string &formula, long rowDelta, long colDelta);
} // namespace extractor

#endif // XLSX_EXTRACTOR_HPP
