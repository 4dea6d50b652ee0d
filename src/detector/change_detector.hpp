#ifndef CHANGE_DETECTOR_HPP
#define CHANGE_DETECTOR_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../audit/audit_sink.hpp"
#include "../baseline_store/baseline_store.hpp"
#include "../differ/differ.hpp"
#include "../errors/status.hpp"
#include "../extractor/extractor.hpp"
#include "../settings/settings.hpp"

namespace detector
{
    struct CycleResult
    {
        errors::Status status = errors::Status::Ok;
        bool changes_found = false; // at least one reportable change was emitted
        std::size_t change_count = 0;
    };

    struct SeedResult
    {
        errors::Status status = errors::Status::Ok;
        bool written = false; // false with Ok: baseline already matched
    };

    // Baseline key of a monitored file: its file name.
    std::string fileKeyFor(const std::string &path);

    // Load baseline, extract, diff, emit, persist. Holds no state between cycles,
    // so one instance serves every file. Cycles and seeds of the same file key
    // run one at a time; different files never wait on each other.
    class ChangeDetector
    {
    public:
        ChangeDetector(baseline_store::BaselineStore &store, extractor::SpreadsheetExtractor &extractor,
                       audit::AuditSink &sink, const settings::ReportSettings &policy);

        CycleResult runCycle(const std::string &path);

        // Records the current content of a newly seen file.
        SeedResult seed(const std::string &path);

        // Kinds the policy lets through to the audit sink.
        bool isReportable(differ::ChangeKind kind) const;
        bool isWhitelisted(const std::optional<std::string> &author) const;

        ChangeDetector(const ChangeDetector &) = delete;
        ChangeDetector &operator=(const ChangeDetector &) = delete;

    private:
        std::shared_ptr<std::mutex> lockFor(const std::string &key);

        std::vector<differ::CellChange> reportable(const std::vector<differ::CellChange> &changes,
                                                   const std::optional<std::string> &author) const;

        baseline_store::BaselineStore &store_;
        extractor::SpreadsheetExtractor &extractor_;
        audit::AuditSink &sink_;
        settings::ReportSettings policy_;

        std::mutex locksMutex_;
        std::map<std::string, std::shared_ptr<std::mutex>> fileLocks_;
    };
} // namespace detector

#endif // CHANGE_DETECTOR_HPP
