#ifndef CELLS_HPP
#define CELLS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace cells
{
    // Scalar cell value. Dates are carried as ISO-8601 strings.
    using CellValue = std::variant<bool, std::int64_t, double, std::string>;

    // Numeric values compare by value, so integer 1 equals floating 1.0.
    bool valuesEqual(const std::optional<CellValue> &a, const std::optional<CellValue> &b);
    std::string valueToString(const std::optional<CellValue> &value);

    struct CellRecord
    {
        std::optional<CellValue> value;
        std::optional<std::string> formula;

        bool empty() const { return !value && !formula; }
    };

    bool operator==(const CellRecord &a, const CellRecord &b);
    bool operator!=(const CellRecord &a, const CellRecord &b);

    // Address ("A1") -> cell. Absent address means empty cell.
    using WorksheetMap = std::map<std::string, CellRecord>;
    // Worksheet name -> cells.
    using WorkbookSnapshot = std::map<std::string, WorksheetMap>;

    struct Baseline
    {
        std::string content_hash;
        std::optional<std::string> last_author;
        WorkbookSnapshot cells;
        std::string timestamp;
    };

    // Thrown by from_json when a record has the wrong shape.
    class InvalidRecord : public std::runtime_error
    {
    public:
        explicit InvalidRecord(const std::string &what) : std::runtime_error(what) {}
    };

    void to_json(nlohmann::json &j, const CellRecord &cell);
    void from_json(const nlohmann::json &j, CellRecord &cell);
    void to_json(nlohmann::json &j, const Baseline &baseline);
    void from_json(const nlohmann::json &j, Baseline &baseline);

    nlohmann::json snapshotToJson(const WorkbookSnapshot &snapshot);
    WorkbookSnapshot snapshotFromJson(const nlohmann::json &j);

    std::size_t cellCount(const WorkbookSnapshot &snapshot);

    // Current local time as ISO-8601 with microseconds.
    std::string currentTimestamp();
} // namespace cells

#endif // CELLS_HPP
