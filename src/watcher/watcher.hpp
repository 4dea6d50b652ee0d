#ifndef WATCHER_HPP
#define WATCHER_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace session
{
    class MonitoringSession;
}

namespace watcher
{
    enum class EventKind
    {
        Created,
        Modified,
        MovedTo
    };

    const char *toString(EventKind kind);

    struct FileEvent
    {
        EventKind kind;
        std::string path;
        std::optional<std::string> old_path; // MovedTo only, when the source was watched

        bool operator<(const FileEvent &other) const
        {
            return std::tie(kind, path, old_path) < std::tie(other.kind, other.path, other.old_path);
        }
    };

    // Watches every root recursively with inotify and queues file events.
    // `pending` mirrors the queue so an event already waiting is not queued twice.
    // Blocks until the session is asked to stop.
    void watch_directories(
        const std::vector<std::string> &roots,
        std::queue<FileEvent> &eventQueue,
        std::set<FileEvent> &pending,
        std::mutex &mtx,
        std::condition_variable &cv,
        session::MonitoringSession &session);
} // namespace watcher

#endif // WATCHER_HPP
