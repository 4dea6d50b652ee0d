#ifndef EVENT_DISPATCHER_HPP
#define EVENT_DISPATCHER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <vector>

#include "../baseline_store/baseline_store.hpp"
#include "../detector/change_detector.hpp"
#include "../scheduler/polling_scheduler.hpp"
#include "../session/session.hpp"
#include "../settings/settings.hpp"
#include "../watcher/watcher.hpp"

namespace dispatcher
{
    // Turns raw file events into seeding, immediate comparison and polling.
    class EventDispatcher
    {
    public:
        using Clock = std::chrono::steady_clock;

        EventDispatcher(session::MonitoringSession &session, detector::ChangeDetector &detector,
                        scheduler::PollingScheduler &scheduler, baseline_store::BaselineStore &store,
                        const settings::Settings &settings);

        // Supported extension, not a lock file, not hidden.
        bool isSupported(const std::string &path) const;

        void handle(const watcher::FileEvent &event);
        void handle(const watcher::FileEvent &event, Clock::time_point now);

        // Drains the watcher queue until the session stops.
        void process_events(std::queue<watcher::FileEvent> &eventQueue, std::set<watcher::FileEvent> &pending,
                            std::mutex &mtx, std::condition_variable &cv);

        std::uint64_t eventCount() const { return eventCounter_; }

    private:
        void onCreated(const std::string &path);
        void onModified(const std::string &path, Clock::time_point now);
        void onMoved(const std::string &oldPath, const std::string &newPath, Clock::time_point now);

        // True and remembered when the path is outside its debounce window.
        bool accept(const std::string &path, Clock::time_point now);

        session::MonitoringSession &session_;
        detector::ChangeDetector &detector_;
        scheduler::PollingScheduler &scheduler_;
        baseline_store::BaselineStore &store_;

        std::vector<std::string> extensions_;
        std::chrono::milliseconds debounce_;
        std::chrono::milliseconds createSettle_;

        std::mutex debounceMutex_;
        std::map<std::string, Clock::time_point> lastAccepted_;
        std::atomic<std::uint64_t> eventCounter_;
    };

    // Lock and temp files editors leave next to a workbook ("~$book.xlsx", ".~lock.book.xlsx#").
    bool isLockFile(const std::string &fileName);

    // Extension in the list (case-insensitive, with the dot), not a lock file, not hidden.
    bool isSupportedFile(const std::string &path, const std::vector<std::string> &extensions);
} // namespace dispatcher

#endif // EVENT_DISPATCHER_HPP
