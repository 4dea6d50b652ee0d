#include "polling_scheduler.hpp"
#include "../logger/Mylogger.hpp"

#include <filesystem>

namespace scheduler
{
    const char *toString(PollMode mode)
    {
        return mode == PollMode::Dense ? "dense" : "sparse";
    }

    PollingPolicy PollingPolicy::fromSettings(const settings::PollingSettings &s)
    {
        PollingPolicy p;
        p.size_threshold_bytes = static_cast<std::uintmax_t>(s.size_threshold_mb * 1024.0 * 1024.0);
        p.dense_interval = std::chrono::seconds(s.dense_interval_sec);
        p.dense_duration = std::chrono::seconds(s.dense_duration_sec);
        p.sparse_interval = std::chrono::seconds(s.sparse_interval_sec);
        p.worker_threads = s.worker_threads;
        p.max_failed_ticks = s.max_failed_ticks;
        return p;
    }

    PollingScheduler::PollingScheduler(Probe probe, PollingPolicy policy, bool manual)
        : probe_(std::move(probe)), policy_(policy), manual_(manual), nextGeneration_(1), shutdown_(false)
    {
        if (manual_)
            return;

        timerThread_ = std::thread(&PollingScheduler::timerLoop, this);
        unsigned int workers = policy_.worker_threads > 0 ? policy_.worker_threads : 1;
        for (unsigned int i = 0; i < workers; ++i)
            workers_.emplace_back(&PollingScheduler::workerLoop, this);
        MyLogger::debug("Polling scheduler started with " + std::to_string(workers) + " workers");
    }

    PollingScheduler::~PollingScheduler()
    {
        shutdown();
    }

    PollMode PollingScheduler::modeFor(std::uintmax_t sizeBytes) const
    {
        return sizeBytes < policy_.size_threshold_bytes ? PollMode::Dense : PollMode::Sparse;
    }

    PollMode PollingScheduler::start(const std::string &path)
    {
        std::error_code ec;
        std::uintmax_t size = std::filesystem::file_size(path, ec);
        if (ec)
            size = 0;
        return start(path, size);
    }

    PollMode PollingScheduler::start(const std::string &path, std::uintmax_t sizeBytes)
    {
        Task task;
        task.mode = modeFor(sizeBytes);
        if (task.mode == PollMode::Dense)
        {
            task.interval = policy_.dense_interval;
            task.budget = policy_.dense_duration;
        }
        else
        {
            task.interval = policy_.sparse_interval;
            task.budget = std::chrono::milliseconds(0);
        }
        task.remaining = task.budget;
        task.due = Clock::now() + task.interval;
        task.cancelled = std::make_shared<std::atomic<bool>>(false);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_)
                return task.mode;

            auto it = tasks_.find(path);
            if (it != tasks_.end())
            {
                it->second.cancelled->store(true);
                tasks_.erase(it);
                MyLogger::debug("Restarting polling window: " + path);
            }
            task.generation = nextGeneration_++;
            tasks_[path] = task;
        }
        timerCv_.notify_one();

        MyLogger::info(std::string("Polling ") + toString(task.mode) + " every " +
                       std::to_string(task.interval.count() / 1000) + "s: " + path);
        return task.mode;
    }

    void PollingScheduler::cancel(const std::string &path)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tasks_.find(path);
            if (it == tasks_.end())
                return;
            it->second.cancelled->store(true);
            tasks_.erase(it);
        }
        timerCv_.notify_one();
    }

    void PollingScheduler::stopAll()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (auto &entry : tasks_)
            entry.second.cancelled->store(true);
        std::size_t cancelled = tasks_.size();
        tasks_.clear();
        for (const auto &job : queue_)
            inFlight_.erase(job.path);
        queue_.clear();
        timerCv_.notify_one();

        idleCv_.wait(lock, [this]()
                     { return inFlight_.empty(); });
        if (cancelled > 0)
            MyLogger::info("Stopped " + std::to_string(cancelled) + " polling tasks");
    }

    void PollingScheduler::shutdown()
    {
        stopAll();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_)
                return;
            shutdown_ = true;
        }
        timerCv_.notify_all();
        workCv_.notify_all();
        if (timerThread_.joinable())
            timerThread_.join();
        for (auto &worker : workers_)
        {
            if (worker.joinable())
                worker.join();
        }
        workers_.clear();
    }

    void PollingScheduler::timerLoop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!shutdown_)
        {
            auto now = Clock::now();
            auto next = Clock::time_point::max();
            for (auto &entry : tasks_)
            {
                // A path never has two cycles running at once.
                if (inFlight_.count(entry.first))
                    continue;
                if (entry.second.due <= now)
                {
                    inFlight_.insert(entry.first);
                    queue_.push_back(Job{entry.first, entry.second.generation, entry.second.cancelled});
                    workCv_.notify_one();
                }
                else if (entry.second.due < next)
                {
                    next = entry.second.due;
                }
            }

            if (next == Clock::time_point::max())
                timerCv_.wait(lock);
            else
                timerCv_.wait_until(lock, next);
        }
    }

    void PollingScheduler::workerLoop()
    {
        for (;;)
        {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                workCv_.wait(lock, [this]()
                             { return shutdown_ || !queue_.empty(); });
                if (queue_.empty())
                    return;
                job = queue_.front();
                queue_.pop_front();
            }
            executeTick(job);
        }
    }

    void PollingScheduler::executeTick(const Job &job)
    {
        detector::CycleResult result;
        bool ran = false;
        if (!job.cancelled->load())
        {
            ran = true;
            try
            {
                result = probe_(job.path);
            }
            catch (const std::exception &e)
            {
                MyLogger::error("Polling tick failed for " + job.path + ": " + e.what());
                result.status = errors::Status::Corrupt;
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            inFlight_.erase(job.path);
            auto it = tasks_.find(job.path);
            if (ran && it != tasks_.end() && it->second.generation == job.generation && !job.cancelled->load())
                applyOutcome(it, result);
        }
        idleCv_.notify_all();
        timerCv_.notify_one();
    }

    void PollingScheduler::applyOutcome(std::map<std::string, Task>::iterator it, const detector::CycleResult &result)
    {
        Task &task = it->second;
        const std::string &path = it->first;
        ++task.ticks;

        bool failed = result.status != errors::Status::Ok && result.status != errors::Status::NotFound;
        if (failed)
        {
            ++task.failures;
            if (task.failures >= policy_.max_failed_ticks)
            {
                MyLogger::warning("Giving up polling after " + std::to_string(task.failures) +
                                  " failed reads: " + path);
                tasks_.erase(it);
                return;
            }
            task.due = Clock::now() + task.interval;
            return;
        }
        task.failures = 0;

        if (result.changes_found)
        {
            if (task.mode == PollMode::Dense)
                task.remaining = task.budget;
            task.due = Clock::now() + task.interval;
            MyLogger::debug("Activity seen, polling window extended: " + path);
            return;
        }

        if (task.mode == PollMode::Sparse)
        {
            MyLogger::info("No further activity, polling ended: " + path);
            tasks_.erase(it);
            return;
        }

        task.remaining -= task.interval;
        if (task.remaining <= std::chrono::milliseconds(0))
        {
            MyLogger::info("Polling window elapsed: " + path);
            tasks_.erase(it);
            return;
        }
        task.due = Clock::now() + task.interval;
    }

    std::size_t PollingScheduler::runPendingTicks()
    {
        if (!manual_)
        {
            MyLogger::warning("runPendingTicks() ignored outside manual mode");
            return 0;
        }

        std::vector<Job> jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &entry : tasks_)
            {
                if (inFlight_.count(entry.first))
                    continue;
                inFlight_.insert(entry.first);
                jobs.push_back(Job{entry.first, entry.second.generation, entry.second.cancelled});
            }
        }
        for (const auto &job : jobs)
            executeTick(job);
        return jobs.size();
    }

    bool PollingScheduler::hasTask(const std::string &path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.count(path) > 0;
    }

    std::size_t PollingScheduler::taskCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    std::optional<TaskInfo> PollingScheduler::taskInfo(const std::string &path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(path);
        if (it == tasks_.end())
            return std::nullopt;
        const Task &t = it->second;
        return TaskInfo{path, t.mode, t.interval, t.remaining, t.ticks, t.failures, t.generation};
    }
} // namespace scheduler
