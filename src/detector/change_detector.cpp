#include "change_detector.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace detector
{
    namespace
    {
        std::string lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return s;
        }

        std::string describe(const differ::CellChange &change)
        {
            std::string text = "[" + std::string(differ::toString(change.kind)) + "] " + change.worksheet + "!" +
                               change.address + ": ";
            text += change.old_cell ? cells::valueToString(change.old_cell->value) : std::string("(empty)");
            if (change.old_cell && change.old_cell->formula)
                text += " {" + *change.old_cell->formula + "}";
            text += " -> ";
            text += change.new_cell ? cells::valueToString(change.new_cell->value) : std::string("(empty)");
            if (change.new_cell && change.new_cell->formula)
                text += " {" + *change.new_cell->formula + "}";
            return text;
        }
    }

    std::string fileKeyFor(const std::string &path)
    {
        return std::filesystem::path(path).filename().string();
    }

    ChangeDetector::ChangeDetector(baseline_store::BaselineStore &store, extractor::SpreadsheetExtractor &extractor,
                                   audit::AuditSink &sink, const settings::ReportSettings &policy)
        : store_(store), extractor_(extractor), sink_(sink), policy_(policy)
    {
    }

    std::shared_ptr<std::mutex> ChangeDetector::lockFor(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(locksMutex_);
        auto &entry = fileLocks_[key];
        if (!entry)
            entry = std::make_shared<std::mutex>();
        return entry;
    }

    bool ChangeDetector::isReportable(differ::ChangeKind kind) const
    {
        if (kind == differ::ChangeKind::IndirectChanged)
            return policy_.report_indirect_changes;
        return true;
    }

    bool ChangeDetector::isWhitelisted(const std::optional<std::string> &author) const
    {
        if (!author)
            return false;
        std::string who = lower(*author);
        for (const auto &user : policy_.whitelist_users)
        {
            if (lower(user) == who)
                return true;
        }
        return false;
    }

    std::vector<differ::CellChange> ChangeDetector::reportable(const std::vector<differ::CellChange> &changes,
                                                               const std::optional<std::string> &author) const
    {
        std::vector<differ::CellChange> result;
        if (isWhitelisted(author) && !policy_.log_whitelist_user_change)
            return result;
        for (const auto &change : changes)
        {
            if (isReportable(change.kind))
                result.push_back(change);
        }
        return result;
    }

    CycleResult ChangeDetector::runCycle(const std::string &path)
    {
        CycleResult result;
        const std::string key = fileKeyFor(path);
        auto fileLock = lockFor(key);
        std::lock_guard<std::mutex> guard(*fileLock);

        cells::Baseline baseline;
        result.status = store_.load(key, baseline);
        if (result.status == errors::Status::NotFound)
        {
            MyLogger::info("No baseline for " + key + ", skipping comparison");
            return result;
        }
        if (result.status != errors::Status::Ok)
        {
            MyLogger::warning(std::string("Baseline for ") + key + " unusable: " + errors::toString(result.status));
            return result;
        }

        cells::WorkbookSnapshot current;
        result.status = extractor_.extract(path, current);
        if (result.status != errors::Status::Ok)
        {
            MyLogger::warning(std::string("Cycle abandoned for ") + key + ": " + errors::toString(result.status));
            return result;
        }

        const std::string currentHash = differ::fingerprint(current);
        if (currentHash == differ::fingerprint(baseline.cells))
        {
            MyLogger::debug("No content change: " + key);
            if (policy_.refresh_author_on_unchanged)
            {
                auto author = extractor_.lastAuthor(path);
                if (author && author != baseline.last_author)
                {
                    baseline.last_author = author;
                    if (!store_.save(key, baseline))
                        MyLogger::warning("Could not refresh author for " + key);
                }
            }
            return result;
        }

        auto changes = differ::diff(baseline.cells, current);
        auto author = extractor_.lastAuthor(path);
        if (!author)
            author = baseline.last_author;

        auto toEmit = reportable(changes, author);
        if (toEmit.empty() && !changes.empty() && isWhitelisted(author))
            MyLogger::info("Changes in " + key + " by whitelisted user " + *author + " not logged");

        if (!toEmit.empty())
        {
            MyLogger::info("Changes detected in " + key + " (" + std::to_string(toEmit.size()) + " cells, by " +
                           author.value_or("Unknown") + ")");
            std::vector<audit::AuditRecord> records;
            records.reserve(toEmit.size());
            for (const auto &change : toEmit)
            {
                MyLogger::info("  " + describe(change));
                records.push_back(audit::makeRecord(change, key, author));
            }
            // Keeping the old baseline lets the next cycle report the same changes again.
            if (!sink_.write(records))
            {
                MyLogger::error("Audit write failed for " + key + ", baseline left unchanged");
                result.status = errors::Status::PersistFailure;
                return result;
            }
        }

        cells::Baseline updated;
        updated.content_hash = currentHash;
        updated.last_author = author;
        updated.cells = std::move(current);
        if (!store_.save(key, updated))
        {
            MyLogger::error("Changes emitted but baseline not saved for " + key);
            result.status = errors::Status::PersistFailure;
        }

        result.changes_found = !toEmit.empty();
        result.change_count = toEmit.size();
        return result;
    }

    SeedResult ChangeDetector::seed(const std::string &path)
    {
        SeedResult result;
        const std::string key = fileKeyFor(path);
        auto fileLock = lockFor(key);
        std::lock_guard<std::mutex> guard(*fileLock);

        cells::WorkbookSnapshot snapshot;
        result.status = extractor_.extract(path, snapshot);
        if (result.status != errors::Status::Ok)
        {
            MyLogger::warning(std::string("Cannot create baseline for ") + key + ": " + errors::toString(result.status));
            return result;
        }

        const std::string hash = differ::fingerprint(snapshot);
        cells::Baseline existing;
        if (store_.load(key, existing) == errors::Status::Ok && existing.content_hash == hash)
        {
            MyLogger::debug("Baseline already current: " + key);
            return result;
        }

        cells::Baseline baseline;
        baseline.content_hash = hash;
        baseline.last_author = extractor_.lastAuthor(path);
        std::size_t count = cells::cellCount(snapshot);
        baseline.cells = std::move(snapshot);
        if (!store_.save(key, baseline))
        {
            result.status = errors::Status::PersistFailure;
            return result;
        }

        result.written = true;
        MyLogger::info("Baseline created: " + key + " (" + std::to_string(count) + " cells)");
        return result;
    }
} // namespace detector
