#include "audit_sink.hpp"
#include "../logger/Mylogger.hpp"
#include "../settings/settings.hpp"

#include <filesystem>
#include <zlib.h>

#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace audit
{
    AuditRecord makeRecord(const differ::CellChange &change, const std::string &filename,
                           const std::optional<std::string> &author)
    {
        AuditRecord record;
        record.timestamp = absl::FormatTime("%Y-%m-%d %H:%M:%S", absl::Now(), absl::LocalTimeZone());
        record.filename = filename;
        record.worksheet = change.worksheet;
        record.address = change.address;
        if (change.old_cell)
        {
            record.old_value = cells::valueToString(change.old_cell->value);
            record.old_formula = change.old_cell->formula.value_or("");
        }
        if (change.new_cell)
        {
            record.new_value = cells::valueToString(change.new_cell->value);
            record.new_formula = change.new_cell->formula.value_or("");
        }
        record.last_author = author.value_or("Unknown");
        record.change_kind = differ::toString(change.kind);
        return record;
    }

    std::string escapeCsv(const std::string &field)
    {
        if (field.find_first_of(",\"\r\n") == std::string::npos)
            return field;
        std::string quoted = "\"";
        for (char ch : field)
        {
            if (ch == '"')
                quoted += '"';
            quoted += ch;
        }
        quoted += '"';
        return quoted;
    }

    const char *CsvAuditSink::header()
    {
        return "Timestamp,Filename,Worksheet,Cell,Old_Value,Old_Formula,New_Value,New_Formula,Last_Author,Change_Type";
    }

    std::string CsvAuditSink::formatRow(const std::vector<std::string> &fields)
    {
        std::string row;
        for (std::size_t i = 0; i < fields.size(); ++i)
        {
            if (i > 0)
                row += ',';
            row += escapeCsv(fields[i]);
        }
        row += "\r\n";
        return row;
    }

    CsvAuditSink::CsvAuditSink(const std::string &filePattern) : filePattern_(filePattern) {}

    std::string CsvAuditSink::currentFile() const
    {
        return settings::expandDate(filePattern_);
    }

    bool CsvAuditSink::write(const std::vector<AuditRecord> &records)
    {
        if (records.empty())
            return true;

        std::lock_guard<std::mutex> lock(mutex_);
        const std::string path = currentFile();

        std::error_code ec;
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent, ec);
        bool isNew = !std::filesystem::exists(path, ec) || std::filesystem::file_size(path, ec) == 0;

        gzFile file = gzopen(path.c_str(), "ab");
        if (!file)
        {
            MyLogger::error("Unable to open audit log: " + path);
            return false;
        }

        std::string buffer;
        if (isNew)
            buffer += std::string(header()) + "\r\n";
        for (const auto &r : records)
        {
            buffer += formatRow({r.timestamp, r.filename, r.worksheet, r.address, r.old_value, r.old_formula,
                                 r.new_value, r.new_formula, r.last_author, r.change_kind});
        }

        int written = gzwrite(file, buffer.data(), static_cast<unsigned>(buffer.size()));
        int closed = gzclose(file);
        if (written != static_cast<int>(buffer.size()) || closed != Z_OK)
        {
            MyLogger::error("Error writing audit log: " + path);
            return false;
        }
        MyLogger::debug("Appended " + std::to_string(records.size()) + " rows to " + path);
        return true;
    }
} // namespace audit
