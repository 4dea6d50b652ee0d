#ifndef POLLING_SCHEDULER_HPP
#define POLLING_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../detector/change_detector.hpp"
#include "../settings/settings.hpp"

namespace scheduler
{
    enum class PollMode
    {
        Dense,
        Sparse
    };

    const char *toString(PollMode mode);

    struct PollingPolicy
    {
        std::uintmax_t size_threshold_bytes = 10ull * 1024 * 1024;
        std::chrono::milliseconds dense_interval{5000};
        std::chrono::milliseconds dense_duration{15000};
        std::chrono::milliseconds sparse_interval{15000};
        unsigned int worker_threads = 2;
        unsigned int max_failed_ticks = 10;

        static PollingPolicy fromSettings(const settings::PollingSettings &s);
    };

    struct TaskInfo
    {
        std::string path;
        PollMode mode;
        std::chrono::milliseconds interval;
        std::chrono::milliseconds remaining; // Dense only
        unsigned int ticks;
        unsigned int failures;
        std::uint64_t generation;
    };

    // Runs one detector cycle for a path.
    using Probe = std::function<detector::CycleResult(const std::string &path)>;

    // Keeps watching recently edited files. One task per path; the task table is
    // guarded by a single mutex that is never held while a probe runs.
    //
    // Threaded mode: a timer thread hands due ticks to a worker pool.
    // Manual mode: no threads; every runPendingTicks() call runs one tick of each
    // live task as if its interval had elapsed.
    class PollingScheduler
    {
    public:
        PollingScheduler(Probe probe, PollingPolicy policy, bool manual = false);
        ~PollingScheduler();

        PollingScheduler(const PollingScheduler &) = delete;
        PollingScheduler &operator=(const PollingScheduler &) = delete;

        // Starts (or restarts) observation; the size picks the mode.
        PollMode start(const std::string &path);
        PollMode start(const std::string &path, std::uintmax_t sizeBytes);

        void cancel(const std::string &path);

        // Cancels every pending tick and empties the table. Waits for ticks
        // already inside a cycle to finish it.
        void stopAll();

        // stopAll() and joins the threads; the scheduler accepts no work afterwards.
        void shutdown();

        std::size_t runPendingTicks();

        bool hasTask(const std::string &path) const;
        std::size_t taskCount() const;
        std::optional<TaskInfo> taskInfo(const std::string &path) const;

        PollMode modeFor(std::uintmax_t sizeBytes) const;

    private:
        using Clock = std::chrono::steady_clock;

        struct Task
        {
            PollMode mode;
            std::chrono::milliseconds interval;
            std::chrono::milliseconds budget;
            std::chrono::milliseconds remaining;
            Clock::time_point due;
            unsigned int ticks = 0;
            unsigned int failures = 0;
            std::uint64_t generation = 0;
            std::shared_ptr<std::atomic<bool>> cancelled;
        };

        struct Job
        {
            std::string path;
            std::uint64_t generation;
            std::shared_ptr<std::atomic<bool>> cancelled;
        };

        void timerLoop();
        void workerLoop();
        void executeTick(const Job &job);
        // Caller holds mutex_.
        void applyOutcome(std::map<std::string, Task>::iterator it, const detector::CycleResult &result);

        Probe probe_;
        PollingPolicy policy_;
        bool manual_;

        mutable std::mutex mutex_;
        std::condition_variable timerCv_;
        std::condition_variable workCv_;
        std::condition_variable idleCv_;

        std::map<std::string, Task> tasks_;
        std::set<std::string> inFlight_;
        std::deque<Job> queue_;
        std::uint64_t nextGeneration_;
        bool shutdown_;

        std::thread timerThread_;
        std::vector<std::thread> workers_;
    };
} // namespace scheduler

#endif // POLLING_SCHEDULER_HPP
