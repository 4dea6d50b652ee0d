#ifndef BASELINE_BUILDER_HPP
#define BASELINE_BUILDER_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "../detector/change_detector.hpp"
#include "../errors/status.hpp"
#include "../progress/progress.hpp"
#include "../resource_guard/resource_guard.hpp"
#include "../session/session.hpp"

namespace batch
{
    struct BatchSummary
    {
        errors::Status status = errors::Status::Ok; // ResourceExhausted when memory stopped the run
        bool completed = false;
        std::size_t start_index = 0;
        std::size_t seeded = 0;
        std::size_t skipped = 0;
        std::size_t failed = 0;
    };

    struct BuilderOptions
    {
        bool enable_resume = true;
        std::chrono::milliseconds memory_pause{10000};
    };

    // Every supported file below the folders, sorted so a saved index stays meaningful.
    // A folder entry that is itself a file is taken as is.
    std::vector<std::string> collectFiles(const std::vector<std::string> &folders,
                                          const std::vector<std::string> &extensions);

    // Initial baseline scan over many files, resumable and memory-aware.
    class BaselineBuilder
    {
    public:
        BaselineBuilder(session::MonitoringSession &session, detector::ChangeDetector &detector,
                        progress::ProgressTracker &tracker, const resource_guard::ResourceGuard &guard,
                        BuilderOptions options);

        BatchSummary run(const std::vector<std::string> &files);

    private:
        // False when memory stays above the limit after a release and a pause.
        bool waitForMemory();

        session::MonitoringSession &session_;
        detector::ChangeDetector &detector_;
        progress::ProgressTracker &tracker_;
        const resource_guard::ResourceGuard &guard_;
        BuilderOptions options_;
    };
} // namespace batch

#endif // BASELINE_BUILDER_HPP
