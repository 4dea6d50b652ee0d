#ifndef AUDIT_SINK_HPP
#define AUDIT_SINK_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../differ/differ.hpp"

namespace audit
{
    // One row of the audit trail.
    struct AuditRecord
    {
        std::string timestamp;
        std::string filename;
        std::string worksheet;
        std::string address;
        std::string old_value;
        std::string old_formula;
        std::string new_value;
        std::string new_formula;
        std::string last_author;
        std::string change_kind;
    };

    AuditRecord makeRecord(const differ::CellChange &change, const std::string &filename,
                           const std::optional<std::string> &author);

    // Append-only destination for change records.
    class AuditSink
    {
    public:
        virtual ~AuditSink() = default;

        // Appends every record or reports failure; partial batches are not retried.
        virtual bool write(const std::vector<AuditRecord> &records) = 0;
    };

    // gzip-compressed CSV. Every write appends one gzip member, so the file
    // stays readable after a crash between writes.
    class CsvAuditSink : public AuditSink
    {
    public:
        // A "%Y%m%d" token in the pattern is replaced with the date of each write.
        explicit CsvAuditSink(const std::string &filePattern);

        bool write(const std::vector<AuditRecord> &records) override;

        std::string currentFile() const;

        static const char *header();
        static std::string formatRow(const std::vector<std::string> &fields);

    private:
        std::string filePattern_;
        std::mutex mutex_;
    };

    // Quotes a field when it holds a comma, quote or line break.
    std::string escapeCsv(const std::string &field);
} // namespace audit

#endif // AUDIT_SINK_HPP
