#include "session.hpp"
#include "../logger/Mylogger.hpp"

namespace session
{
    MonitoringSession::MonitoringSession()
        : stop_(false), baselineCompleted_(false)
    {
    }

    void MonitoringSession::requestStop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        stopCv_.notify_all();
    }

    bool MonitoringSession::stopRequested() const
    {
        return stop_;
    }

    bool MonitoringSession::waitForStop(std::chrono::milliseconds duration)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return stopCv_.wait_for(lock, duration, [this]()
                                { return stop_.load(); });
    }

    void MonitoringSession::beginProcessing(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        processing_ = ProcessingMarker{path, std::chrono::steady_clock::now()};
    }

    void MonitoringSession::endProcessing(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Another file may have taken over the marker in the meantime.
        if (processing_ && processing_->path == path)
            processing_.reset();
    }

    std::optional<MonitoringSession::ProcessingMarker> MonitoringSession::currentProcessing() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return processing_;
    }

    void MonitoringSession::setBaselineCompleted(bool completed)
    {
        baselineCompleted_ = completed;
    }

    bool MonitoringSession::baselineCompleted() const
    {
        return baselineCompleted_;
    }

    // ---------------------------
    // StallWatchdog
    // ---------------------------

    StallWatchdog::StallWatchdog(MonitoringSession &session, std::chrono::seconds timeout,
                                 std::chrono::milliseconds checkInterval)
        : session_(session), timeout_(timeout), checkInterval_(checkInterval), running_(false)
    {
    }

    StallWatchdog::~StallWatchdog()
    {
        stop();
    }

    void StallWatchdog::start()
    {
        if (running_)
            return;
        running_ = true;
        thread_ = std::thread(&StallWatchdog::run, this);
    }

    void StallWatchdog::stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();
        if (thread_.joinable())
            thread_.join();
    }

    bool StallWatchdog::checkOnce()
    {
        auto marker = session_.currentProcessing();
        if (!marker)
            return false;
        auto elapsed = std::chrono::steady_clock::now() - marker->started;
        if (elapsed <= timeout_)
            return false;

        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
        MyLogger::warning("File processing timed out: " + marker->path + " (" + std::to_string(seconds) +
                          "s > " + std::to_string(timeout_.count()) + "s)");
        session_.endProcessing(marker->path);
        return true;
    }

    void StallWatchdog::run()
    {
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, checkInterval_, [this]()
                             { return !running_.load(); });
                if (!running_)
                    break;
            }
            if (session_.stopRequested())
                break;
            checkOnce();
        }
    }
} // namespace session
