#include "baseline_builder.hpp"
#include "../dispatcher/event_dispatcher.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <set>

namespace fs = std::filesystem;

namespace batch
{
    std::vector<std::string> collectFiles(const std::vector<std::string> &folders,
                                          const std::vector<std::string> &extensions)
    {
        std::set<std::string> files;
        for (const auto &folder : folders)
        {
            std::error_code ec;
            if (fs::is_regular_file(folder, ec))
            {
                if (dispatcher::isSupportedFile(folder, extensions))
                    files.insert(folder);
                continue;
            }
            if (!fs::is_directory(folder, ec))
            {
                MyLogger::warning("Watch folder not found: " + folder);
                continue;
            }

            for (auto it = fs::recursive_directory_iterator(folder, fs::directory_options::skip_permission_denied, ec);
                 !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            {
                if (it->is_regular_file(ec) && dispatcher::isSupportedFile(it->path().string(), extensions))
                    files.insert(it->path().string());
            }
            if (ec)
                MyLogger::warning("Error while scanning " + folder + ": " + ec.message());
        }
        return std::vector<std::string>(files.begin(), files.end());
    }

    BaselineBuilder::BaselineBuilder(session::MonitoringSession &session, detector::ChangeDetector &detector,
                                     progress::ProgressTracker &tracker, const resource_guard::ResourceGuard &guard,
                                     BuilderOptions options)
        : session_(session), detector_(detector), tracker_(tracker), guard_(guard), options_(options)
    {
    }

    bool BaselineBuilder::waitForMemory()
    {
        if (!guard_.overLimit())
            return true;

        guard_.releaseMemory();
        if (!guard_.overLimit())
            return true;

        MyLogger::warning("Memory still high, pausing " + std::to_string(options_.memory_pause.count()) + " ms");
        session_.waitForStop(options_.memory_pause);
        return !guard_.overLimit();
    }

    BatchSummary BaselineBuilder::run(const std::vector<std::string> &files)
    {
        BatchSummary summary;
        const std::size_t total = files.size();

        if (total == 0)
        {
            MyLogger::info("No files need a baseline");
            summary.completed = true;
            session_.setBaselineCompleted(true);
            return summary;
        }

        if (options_.enable_resume)
        {
            auto previous = tracker_.load();
            if (previous && previous->total == total && previous->completed < total)
            {
                summary.start_index = previous->completed;
                MyLogger::info("Resuming baseline scan at " + std::to_string(summary.start_index + 1) + "/" +
                               std::to_string(total) + " (saved " + previous->timestamp + ")");
            }
            else if (previous)
            {
                MyLogger::info("Saved progress does not match the current file list, starting over");
            }
        }

        MyLogger::info("Building baselines for " + std::to_string(total - summary.start_index) + " files");
        auto started = std::chrono::steady_clock::now();

        for (std::size_t i = summary.start_index; i < total; ++i)
        {
            if (session_.stopRequested())
            {
                MyLogger::info("Stop requested, baseline scan interrupted");
                tracker_.save(i, total);
                return summary;
            }

            if (!waitForMemory())
            {
                MyLogger::error("Memory above " + std::to_string(static_cast<long>(guard_.limitMB())) +
                                " MB, baseline scan halted at " + std::to_string(i) + "/" + std::to_string(total));
                tracker_.save(i, total);
                summary.status = errors::Status::ResourceExhausted;
                return summary;
            }

            const std::string &path = files[i];
            MyLogger::info("[" + std::to_string(i + 1) + "/" + std::to_string(total) + "] " + path + " (memory " +
                           std::to_string(static_cast<long>(guard_.currentUsageMB())) + " MB)");

            {
                // The snapshot lives inside seed() and is gone before the next file.
                detector::SeedResult result;
                try
                {
                    result = detector_.seed(path);
                }
                catch (const std::exception &e)
                {
                    MyLogger::error("Baseline failed for " + path + ": " + e.what());
                    result.status = errors::Status::Corrupt;
                }
                if (result.status != errors::Status::Ok)
                    ++summary.failed;
                else if (result.written)
                    ++summary.seeded;
                else
                    ++summary.skipped;
            }

            tracker_.save(i + 1, total);
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started);
        MyLogger::info("Baseline scan finished in " + std::to_string(elapsed.count()) + "s: " +
                       std::to_string(summary.seeded) + " created, " + std::to_string(summary.skipped) +
                       " unchanged, " + std::to_string(summary.failed) + " failed");

        tracker_.clear();
        summary.completed = true;
        session_.setBaselineCompleted(true);
        return summary;
    }
} // namespace batch
