#ifndef SESSION_HPP
#define SESSION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace session
{
    // Context shared by every component of one monitoring run: stop signal,
    // the "currently processing" marker and the batch-completed flag.
    class MonitoringSession
    {
    public:
        MonitoringSession();

        void requestStop();
        bool stopRequested() const;

        // Sleeps for at most `duration`; returns early (true) if a stop is requested.
        bool waitForStop(std::chrono::milliseconds duration);

        void beginProcessing(const std::string &path);
        void endProcessing(const std::string &path);

        struct ProcessingMarker
        {
            std::string path;
            std::chrono::steady_clock::time_point started;
        };
        std::optional<ProcessingMarker> currentProcessing() const;

        void setBaselineCompleted(bool completed);
        bool baselineCompleted() const;

    private:
        std::atomic<bool> stop_;
        std::atomic<bool> baselineCompleted_;
        mutable std::mutex mutex_;
        std::condition_variable stopCv_;
        std::optional<ProcessingMarker> processing_;
    };

    // Reports and clears a processing marker that has been held longer than
    // the extraction timeout.
    class StallWatchdog
    {
    public:
        StallWatchdog(MonitoringSession &session, std::chrono::seconds timeout,
                      std::chrono::milliseconds checkInterval = std::chrono::seconds(10));
        ~StallWatchdog();

        void start();
        void stop();

        // Runs one check; returns true if a stalled marker was reported and cleared.
        bool checkOnce();

    private:
        void run();

        MonitoringSession &session_;
        std::chrono::seconds timeout_;
        std::chrono::milliseconds checkInterval_;
        std::atomic<bool> running_;
        std::mutex mutex_;
        std::condition_variable cv_;
        std::thread thread_;
    };
} // namespace session

#endif // SESSION_HPP
