#ifndef MONITOR_APP_HPP
#define MONITOR_APP_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <set>
#include <thread>

#include "../audit/audit_sink.hpp"
#include "../baseline_store/baseline_store.hpp"
#include "../batch/baseline_builder.hpp"
#include "../cache/cache.hpp"
#include "../detector/change_detector.hpp"
#include "../dispatcher/event_dispatcher.hpp"
#include "../extractor/timed_extractor.hpp"
#include "../progress/progress.hpp"
#include "../resource_guard/resource_guard.hpp"
#include "../scheduler/polling_scheduler.hpp"
#include "../session/session.hpp"
#include "../settings/settings.hpp"
#include "../watcher/watcher.hpp"

// Wires every component of one monitoring run together.
class MonitorApp
{
public:
    explicit MonitorApp(const settings::Settings &settings);
    ~MonitorApp();

    void initialize();
    void start();
    void stop();

    session::MonitoringSession &session() { return session_; }

private:
    void runInitialScan();

    settings::Settings settings_;
    session::MonitoringSession session_;

    std::unique_ptr<baseline_store::BaselineStore> store_;
    std::shared_ptr<cache::LocalMirror> mirror_;
    std::unique_ptr<extractor::TimedExtractor> extractor_;
    std::unique_ptr<audit::CsvAuditSink> sink_;
    std::unique_ptr<detector::ChangeDetector> detector_;
    std::unique_ptr<scheduler::PollingScheduler> scheduler_;
    std::unique_ptr<dispatcher::EventDispatcher> dispatcher_;
    std::unique_ptr<progress::ProgressTracker> tracker_;
    std::unique_ptr<resource_guard::ResourceGuard> guard_;
    std::unique_ptr<batch::BaselineBuilder> builder_;
    std::unique_ptr<session::StallWatchdog> watchdog_;

    std::queue<watcher::FileEvent> eventQueue_;
    std::set<watcher::FileEvent> pendingEvents_;
    std::mutex eventMutex_;
    std::condition_variable eventCv_;

    std::thread watcherThread_;
    std::thread processThread_;
    std::thread batchThread_;
    bool started_;
};

#endif // MONITOR_APP_HPP
