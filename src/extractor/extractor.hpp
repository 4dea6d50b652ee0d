#ifndef EXTRACTOR_HPP
#define EXTRACTOR_HPP

#include <optional>
#include <string>
#include "../cells/cells.hpp"
#include "../errors/status.hpp"

namespace extractor
{
    // Reads every non-empty cell of a spreadsheet file.
    // Implementations must cope with files another process keeps open.
    class SpreadsheetExtractor
    {
    public:
        virtual ~SpreadsheetExtractor() = default;

        virtual errors::Status extract(const std::string &path, cells::WorkbookSnapshot &snapshot) = 0;
        virtual std::optional<std::string> lastAuthor(const std::string &path) = 0;
    };
} // namespace extractor

#endif // EXTRACTOR_HPP
