#include "watcher.hpp"
#include "../logger/Mylogger.hpp"
#include "../session/session.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <limits.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <unordered_map>

namespace fs = std::filesystem;

namespace watcher
{
    namespace
    {
        // A MOVED_FROM whose MOVED_TO never arrives (moved out of the tree) is forgotten after this.
        constexpr std::chrono::seconds MOVE_COOKIE_TTL{5};

        struct PendingMove
        {
            std::string path;
            std::chrono::steady_clock::time_point seen;
        };

        void push_event(const FileEvent &event, std::queue<FileEvent> &eventQueue, std::set<FileEvent> &pending,
                        std::condition_variable &cv)
        {
            if (pending.find(event) != pending.end())
                return;
            eventQueue.push(event);
            pending.insert(event);
            cv.notify_one();
        }
    }

    const char *toString(EventKind kind)
    {
        switch (kind)
        {
        case EventKind::Created:
            return "created";
        case EventKind::Modified:
            return "modified";
        case EventKind::MovedTo:
            return "moved";
        }
        return "unknown";
    }

    void watch_directories(
        const std::vector<std::string> &roots,
        std::queue<FileEvent> &eventQueue,
        std::set<FileEvent> &pending,
        std::mutex &mtx,
        std::condition_variable &cv,
        session::MonitoringSession &session)
    {
        int inotify_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotify_fd == -1)
        {
            MyLogger::error(std::string("inotify_init1 failed: ") + std::strerror(errno));
            return;
        }

        // Map watch descriptor to directory path.
        std::unordered_map<int, std::string> wd_to_path;
        // Source path of a file move, keyed by the inotify cookie.
        std::unordered_map<uint32_t, PendingMove> move_cookie_map;

        auto add_watch = [&](const std::string &path)
        {
            int wd = inotify_add_watch(inotify_fd, path.c_str(),
                                       IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_FROM | IN_MOVED_TO);
            if (wd == -1)
            {
                MyLogger::warning("Cannot watch " + path + ": " + std::strerror(errno));
                return;
            }
            wd_to_path[wd] = path;
        };

        auto add_tree = [&](const std::string &root)
        {
            add_watch(root);
            std::error_code ec;
            for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
                 !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            {
                if (it->is_directory(ec))
                    add_watch(it->path().string());
            }
            if (ec)
                MyLogger::warning("Error while walking " + root + ": " + ec.message());
        };

        for (const auto &root : roots)
        {
            std::error_code ec;
            if (!fs::is_directory(root, ec))
            {
                MyLogger::error("Watch folder does not exist: " + root);
                continue;
            }
            add_tree(root);
            MyLogger::info("Watching " + root);
        }

        if (wd_to_path.empty())
        {
            MyLogger::error("Nothing to watch");
            close(inotify_fd);
            return;
        }

        const size_t buf_len = 10 * (sizeof(struct inotify_event) + NAME_MAX + 1);
        alignas(struct inotify_event) char buffer[buf_len];

        while (!session.stopRequested())
        {
            ssize_t length = read(inotify_fd, buffer, buf_len);
            if (length < 0)
            {
                if (errno == EAGAIN || errno == EINTR)
                {
                    session.waitForStop(std::chrono::milliseconds(100));
                    continue;
                }
                MyLogger::error(std::string("inotify read failed: ") + std::strerror(errno));
                break;
            }

            auto now = std::chrono::steady_clock::now();
            for (auto it = move_cookie_map.begin(); it != move_cookie_map.end();)
            {
                if (now - it->second.seen > MOVE_COOKIE_TTL)
                    it = move_cookie_map.erase(it);
                else
                    ++it;
            }

            for (char *ptr = buffer; ptr < buffer + length;)
            {
                struct inotify_event *event = reinterpret_cast<struct inotify_event *>(ptr);
                ptr += sizeof(struct inotify_event) + event->len;

                if (event->mask & IN_Q_OVERFLOW)
                {
                    MyLogger::warning("inotify queue overflowed, some events were lost");
                    continue;
                }
                auto dirIt = wd_to_path.find(event->wd);
                if (dirIt == wd_to_path.end())
                    continue;

                std::string name = (event->len > 0) ? event->name : "";
                std::string pathStr = (fs::path(dirIt->second) / name).string();

                if (event->mask & IN_ISDIR)
                {
                    if (event->mask & IN_MOVED_FROM)
                    {
                        move_cookie_map[event->cookie] = PendingMove{pathStr, now};
                    }
                    else if (event->mask & IN_MOVED_TO)
                    {
                        auto moved = move_cookie_map.find(event->cookie);
                        if (moved != move_cookie_map.end())
                        {
                            // Rewrite the watch paths of the moved subtree.
                            const std::string old_path = moved->second.path;
                            for (auto &entry : wd_to_path)
                            {
                                if (entry.second == old_path)
                                    entry.second = pathStr;
                                else if (entry.second.size() > old_path.size() &&
                                         entry.second.compare(0, old_path.size(), old_path) == 0 &&
                                         entry.second[old_path.size()] == fs::path::preferred_separator)
                                    entry.second = pathStr + entry.second.substr(old_path.size());
                            }
                            move_cookie_map.erase(moved);
                        }
                        else
                        {
                            add_tree(pathStr);
                        }
                    }
                    else if (event->mask & IN_CREATE)
                    {
                        add_tree(pathStr);
                    }
                    continue;
                }

                std::lock_guard<std::mutex> lock(mtx);
                if (event->mask & IN_CREATE)
                {
                    push_event(FileEvent{EventKind::Created, pathStr, std::nullopt}, eventQueue, pending, cv);
                }
                else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE))
                {
                    push_event(FileEvent{EventKind::Modified, pathStr, std::nullopt}, eventQueue, pending, cv);
                }
                else if (event->mask & IN_MOVED_FROM)
                {
                    move_cookie_map[event->cookie] = PendingMove{pathStr, now};
                }
                else if (event->mask & IN_MOVED_TO)
                {
                    std::optional<std::string> old_path;
                    auto moved = move_cookie_map.find(event->cookie);
                    if (event->cookie != 0 && moved != move_cookie_map.end())
                    {
                        old_path = moved->second.path;
                        move_cookie_map.erase(moved);
                    }
                    push_event(FileEvent{EventKind::MovedTo, pathStr, old_path}, eventQueue, pending, cv);
                }
            }
        }

        close(inotify_fd);
        cv.notify_all();
        MyLogger::info("File watcher stopped");
    }
} // namespace watcher
