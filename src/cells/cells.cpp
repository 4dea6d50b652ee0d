#include "cells.hpp"

#include <cmath>
#include <sstream>

#include "absl/time/clock.h"
#include "absl/time/time.h"

using json = nlohmann::json;

namespace cells
{
    namespace
    {
        bool asNumber(const CellValue &v, double &out)
        {
            if (const auto *i = std::get_if<std::int64_t>(&v))
            {
                out = static_cast<double>(*i);
                return true;
            }
            if (const auto *d = std::get_if<double>(&v))
            {
                out = *d;
                return true;
            }
            return false;
        }

        json valueToJson(const std::optional<CellValue> &value)
        {
            if (!value)
                return nullptr;
            return std::visit([](const auto &v)
                              { return json(v); },
                              *value);
        }

        std::optional<CellValue> valueFromJson(const json &j)
        {
            switch (j.type())
            {
            case json::value_t::null:
                return std::nullopt;
            case json::value_t::boolean:
                return CellValue(j.get<bool>());
            case json::value_t::number_integer:
            case json::value_t::number_unsigned:
                return CellValue(j.get<std::int64_t>());
            case json::value_t::number_float:
                return CellValue(j.get<double>());
            case json::value_t::string:
                return CellValue(j.get<std::string>());
            default:
                throw InvalidRecord("cell value must be a scalar");
            }
        }
    }

    bool valuesEqual(const std::optional<CellValue> &a, const std::optional<CellValue> &b)
    {
        if (!a || !b)
            return !a && !b;
        double da = 0.0;
        double db = 0.0;
        if (asNumber(*a, da) && asNumber(*b, db))
            return da == db;
        return *a == *b;
    }

    std::string valueToString(const std::optional<CellValue> &value)
    {
        if (!value)
            return "";
        if (const auto *b = std::get_if<bool>(&*value))
            return *b ? "TRUE" : "FALSE";
        if (const auto *i = std::get_if<std::int64_t>(&*value))
            return std::to_string(*i);
        if (const auto *d = std::get_if<double>(&*value))
        {
            std::ostringstream oss;
            oss.precision(15);
            oss << *d;
            return oss.str();
        }
        return std::get<std::string>(*value);
    }

    bool operator==(const CellRecord &a, const CellRecord &b)
    {
        return a.formula == b.formula && valuesEqual(a.value, b.value);
    }

    bool operator!=(const CellRecord &a, const CellRecord &b)
    {
        return !(a == b);
    }

    void to_json(json &j, const CellRecord &cell)
    {
        j = json{
            {"formula", cell.formula ? json(*cell.formula) : json(nullptr)},
            {"value", valueToJson(cell.value)}};
    }

    void from_json(const json &j, CellRecord &cell)
    {
        if (!j.is_object())
            throw InvalidRecord("cell record must be an object");

        cell.formula.reset();
        if (j.contains("formula") && !j["formula"].is_null())
        {
            if (!j["formula"].is_string())
                throw InvalidRecord("cell formula must be a string");
            cell.formula = j["formula"].get<std::string>();
        }
        cell.value = j.contains("value") ? valueFromJson(j["value"]) : std::nullopt;

        if (cell.empty())
            throw InvalidRecord("cell record has neither value nor formula");
    }

    json snapshotToJson(const WorkbookSnapshot &snapshot)
    {
        json j = json::object();
        for (const auto &[sheet, cellsOfSheet] : snapshot)
        {
            json sheetJson = json::object();
            for (const auto &[address, cell] : cellsOfSheet)
                sheetJson[address] = cell;
            j[sheet] = std::move(sheetJson);
        }
        return j;
    }

    WorkbookSnapshot snapshotFromJson(const json &j)
    {
        if (!j.is_object())
            throw InvalidRecord("cells must be an object");

        WorkbookSnapshot snapshot;
        for (const auto &[sheet, sheetJson] : j.items())
        {
            if (!sheetJson.is_object())
                throw InvalidRecord("worksheet '" + sheet + "' must be an object");
            WorksheetMap &target = snapshot[sheet];
            for (const auto &[address, cellJson] : sheetJson.items())
            {
                if (address.empty())
                    throw InvalidRecord("empty cell address in worksheet '" + sheet + "'");
                target[address] = cellJson.get<CellRecord>();
            }
        }
        return snapshot;
    }

    void to_json(json &j, const Baseline &baseline)
    {
        j = json{
            {"content_hash", baseline.content_hash},
            {"last_author", baseline.last_author ? json(*baseline.last_author) : json(nullptr)},
            {"cells", snapshotToJson(baseline.cells)},
            {"timestamp", baseline.timestamp}};
    }

    void from_json(const json &j, Baseline &baseline)
    {
        if (!j.is_object())
            throw InvalidRecord("baseline must be an object");
        if (!j.contains("content_hash") || !j["content_hash"].is_string())
            throw InvalidRecord("baseline content_hash missing or not a string");
        if (!j.contains("cells"))
            throw InvalidRecord("baseline cells missing");

        baseline.content_hash = j["content_hash"].get<std::string>();
        baseline.last_author.reset();
        if (j.contains("last_author") && !j["last_author"].is_null())
        {
            if (!j["last_author"].is_string())
                throw InvalidRecord("baseline last_author must be a string");
            baseline.last_author = j["last_author"].get<std::string>();
        }
        baseline.cells = snapshotFromJson(j["cells"]);
        baseline.timestamp.clear();
        if (j.contains("timestamp") && j["timestamp"].is_string())
            baseline.timestamp = j["timestamp"].get<std::string>();
    }

    std::size_t cellCount(const WorkbookSnapshot &snapshot)
    {
        std::size_t count = 0;
        for (const auto &entry : snapshot)
            count += entry.second.size();
        return count;
    }

    std::string currentTimestamp()
    {
        return absl::FormatTime("%Y-%m-%dT%H:%M:%E6S", absl::Now(), absl::LocalTimeZone());
    }
} // namespace cells
