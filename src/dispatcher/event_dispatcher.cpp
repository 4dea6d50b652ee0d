#include "event_dispatcher.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dispatcher
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
    }

    bool isLockFile(const std::string &fileName)
    {
        if (fileName.compare(0, 2, "~$") == 0)
            return true;
        return fileName.compare(0, 7, ".~lock.") == 0 && !fileName.empty() && fileName.back() == '#';
    }

    bool isSupportedFile(const std::string &path, const std::vector<std::string> &extensions)
    {
        fs::path p(path);
        std::string name = p.filename().string();
        if (name.empty() || isLockFile(name) || name[0] == '.')
            return false;
        std::string ext = lower(p.extension().string());
        for (const auto &allowed : extensions)
        {
            if (lower(allowed) == ext)
                return true;
        }
        return false;
    }

    EventDispatcher::EventDispatcher(session::MonitoringSession &session, detector::ChangeDetector &detector,
                                     scheduler::PollingScheduler &scheduler, baseline_store::BaselineStore &store,
                                     const settings::Settings &settings)
        : session_(session),
          detector_(detector),
          scheduler_(scheduler),
          store_(store),
          extensions_(settings.supported_extensions),
          debounce_(settings.debounce_interval_ms),
          createSettle_(settings.create_settle_ms),
          eventCounter_(0)
    {
    }

    bool EventDispatcher::isSupported(const std::string &path) const
    {
        return isSupportedFile(path, extensions_);
    }

    bool EventDispatcher::accept(const std::string &path, Clock::time_point now)
    {
        std::lock_guard<std::mutex> lock(debounceMutex_);
        auto it = lastAccepted_.find(path);
        if (it != lastAccepted_.end() && now - it->second < debounce_)
            return false;
        lastAccepted_[path] = now;
        return true;
    }

    void EventDispatcher::handle(const watcher::FileEvent &event)
    {
        handle(event, Clock::now());
    }

    void EventDispatcher::handle(const watcher::FileEvent &event, Clock::time_point now)
    {
        if (!isSupported(event.path))
            return;

        switch (event.kind)
        {
        case watcher::EventKind::Created:
            onCreated(event.path);
            break;
        case watcher::EventKind::Modified:
            onModified(event.path, now);
            break;
        case watcher::EventKind::MovedTo:
            if (event.old_path)
                onMoved(*event.old_path, event.path, now);
            else
                onCreated(event.path);
            break;
        }
    }

    void EventDispatcher::onCreated(const std::string &path)
    {
        // An editor may create and rename in one go; give the rename a moment to land.
        if (createSettle_.count() > 0 && session_.waitForStop(createSettle_))
            return;

        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            MyLogger::debug("File vanished before it could be processed: " + path);
            return;
        }

        MyLogger::info("New file found: " + path);
        auto result = detector_.seed(path);
        if (result.status != errors::Status::Ok)
            MyLogger::warning(std::string("Baseline not created for ") + path + ": " + errors::toString(result.status));
    }

    void EventDispatcher::onModified(const std::string &path, Clock::time_point now)
    {
        if (!accept(path, now))
        {
            MyLogger::debug("Debounced: " + path);
            return;
        }

        std::uint64_t number = ++eventCounter_;
        MyLogger::info("Change event #" + std::to_string(number) + ": " + path);

        auto result = detector_.runCycle(path);
        if (result.changes_found)
            MyLogger::info("Event #" + std::to_string(number) + " found " + std::to_string(result.change_count) +
                           " changes, polling for follow-up saves");
        else
            MyLogger::info("Event #" + std::to_string(number) + " found no changes yet, polling");

        // Started regardless: the file may still be mid-write.
        scheduler_.start(path);
    }

    void EventDispatcher::onMoved(const std::string &oldPath, const std::string &newPath, Clock::time_point now)
    {
        const std::string oldKey = detector::fileKeyFor(oldPath);
        const std::string newKey = detector::fileKeyFor(newPath);
        MyLogger::info("File renamed: " + oldPath + " -> " + newPath);

        {
            std::lock_guard<std::mutex> lock(debounceMutex_);
            auto it = lastAccepted_.find(oldPath);
            if (it != lastAccepted_.end())
            {
                lastAccepted_[newPath] = it->second;
                lastAccepted_.erase(it);
            }
        }

        if (scheduler_.hasTask(oldPath))
        {
            scheduler_.cancel(oldPath);
            scheduler_.start(newPath);
        }

        if (oldKey != newKey && store_.exists(oldKey))
        {
            auto status = store_.rename(oldKey, newKey);
            if (status != errors::Status::Ok)
                MyLogger::error(std::string("Baseline rename failed: ") + errors::toString(status));
            return;
        }

        if (store_.exists(newKey))
        {
            // Saved through a temp file renamed over the workbook: compare, do not re-seed.
            onModified(newPath, now);
            return;
        }

        auto result = detector_.seed(newPath);
        if (result.status != errors::Status::Ok)
            MyLogger::warning(std::string("Baseline not created for ") + newPath + ": " + errors::toString(result.status));
    }

    void EventDispatcher::process_events(std::queue<watcher::FileEvent> &eventQueue,
                                         std::set<watcher::FileEvent> &pending, std::mutex &mtx,
                                         std::condition_variable &cv)
    {
        while (!session_.stopRequested())
        {
            watcher::FileEvent event;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv.wait_for(lock, std::chrono::milliseconds(500), [&]()
                            { return !eventQueue.empty() || session_.stopRequested(); });
                if (eventQueue.empty())
                    continue;
                event = eventQueue.front();
                eventQueue.pop();
                pending.erase(event);
            }

            MyLogger::debug(std::string("Processing ") + watcher::toString(event.kind) + " event: " + event.path);
            try
            {
                handle(event);
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Event for " + event.path + " abandoned: " + e.what());
            }
        }
    }
} // namespace dispatcher
