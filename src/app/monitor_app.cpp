#include "monitor_app.hpp"
#include "../codec/codec.hpp"
#include "../extractor/xlsx_extractor.hpp"
#include "../logger/Mylogger.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    const codec::Codec *codecOrDefault(const std::string &name, const std::string &purpose)
    {
        const codec::Codec *c = codec::findCodec(name);
        if (!c)
        {
            MyLogger::error("Unknown " + purpose + " codec '" + name + "', using gzip");
            c = codec::findCodec("gzip");
        }
        return c;
    }
}

MonitorApp::MonitorApp(const settings::Settings &settings)
    : settings_(settings), started_(false)
{
}

MonitorApp::~MonitorApp()
{
    stop();
}

void MonitorApp::initialize()
{
    baseline_store::StoreOptions storeOptions;
    storeOptions.max_retries = settings_.baseline.max_retries;
    storeOptions.retry_base_delay = std::chrono::milliseconds(settings_.baseline.retry_base_delay_ms);

    store_ = std::make_unique<baseline_store::BaselineStore>(
        settings_.baseline_folder, codecOrDefault(settings_.baseline.codec, "baseline"), storeOptions);

    std::size_t recovered = store_->recover();
    if (recovered > 0)
        MyLogger::warning("Cleaned up " + std::to_string(recovered) + " leftovers of interrupted saves");

    if (settings_.baseline.archive_after_days > 0)
    {
        store_->archiveInactive(std::chrono::hours(24 * settings_.baseline.archive_after_days),
                                codecOrDefault(settings_.baseline.archive_codec, "archive"));
    }

    mirror_ = std::make_shared<cache::LocalMirror>(settings_.cache_folder, settings_.use_local_cache);
    auto xlsx = std::make_shared<extractor::XlsxExtractor>(mirror_);
    extractor_ = std::make_unique<extractor::TimedExtractor>(
        xlsx, session_, settings_.enable_timeout, std::chrono::seconds(settings_.file_timeout_seconds));

    sink_ = std::make_unique<audit::CsvAuditSink>(settings_.csv_log_file);
    detector_ = std::make_unique<detector::ChangeDetector>(*store_, *extractor_, *sink_, settings_.report);

    detector::ChangeDetector *detector = detector_.get();
    scheduler_ = std::make_unique<scheduler::PollingScheduler>(
        [detector](const std::string &path)
        { return detector->runCycle(path); },
        scheduler::PollingPolicy::fromSettings(settings_.polling));

    dispatcher_ = std::make_unique<dispatcher::EventDispatcher>(session_, *detector_, *scheduler_, *store_, settings_);

    tracker_ = std::make_unique<progress::ProgressTracker>(settings_.progress_file);
    guard_ = std::make_unique<resource_guard::ResourceGuard>(settings_.enable_memory_monitor, settings_.memory_limit_mb);

    batch::BuilderOptions builderOptions;
    builderOptions.enable_resume = settings_.enable_resume;
    builderOptions.memory_pause = std::chrono::seconds(settings_.memory_pause_seconds);
    builder_ = std::make_unique<batch::BaselineBuilder>(session_, *detector_, *tracker_, *guard_, builderOptions);

    if (settings_.enable_timeout)
        watchdog_ = std::make_unique<session::StallWatchdog>(session_, std::chrono::seconds(settings_.file_timeout_seconds));

    MyLogger::info("Baselines stored in: " + fs::absolute(settings_.baseline_folder).string());
    MyLogger::info("Audit log: " + sink_->currentFile());
    if (settings_.use_local_cache)
        MyLogger::info("Local cache: " + fs::absolute(settings_.cache_folder).string());
}

void MonitorApp::runInitialScan()
{
    auto files = batch::collectFiles(settings_.watch_folders, settings_.supported_extensions);
    auto summary = builder_->run(files);
    if (summary.status != errors::Status::Ok)
        MyLogger::error(std::string("Baseline scan stopped: ") + errors::toString(summary.status));
}

void MonitorApp::start()
{
    if (!store_ || !dispatcher_)
    {
        throw std::runtime_error("MonitorApp not initialized properly");
    }
    if (settings_.watch_folders.empty())
    {
        throw std::runtime_error("No watch_folders configured");
    }

    if (watchdog_)
        watchdog_->start();

    if (settings_.scan_all_on_start)
    {
        batchThread_ = std::thread(&MonitorApp::runInitialScan, this);
    }
    else
    {
        session_.setBaselineCompleted(true);
    }

    processThread_ = std::thread([this]()
                                 { dispatcher_->process_events(eventQueue_, pendingEvents_, eventMutex_, eventCv_); });
    watcherThread_ = std::thread([this]()
                                 { watcher::watch_directories(settings_.watch_folders, eventQueue_, pendingEvents_,
                                                              eventMutex_, eventCv_, session_); });
    started_ = true;
    MyLogger::info("Monitoring " + std::to_string(settings_.watch_folders.size()) + " folders");
}

void MonitorApp::stop()
{
    if (!started_)
        return;
    started_ = false;

    MyLogger::info("Stopping monitor...");
    session_.requestStop();
    eventCv_.notify_all();

    if (watcherThread_.joinable())
        watcherThread_.join();
    if (processThread_.joinable())
        processThread_.join();
    if (batchThread_.joinable())
        batchThread_.join();

    // In-flight cycles finish; nothing new is scheduled.
    if (scheduler_)
        scheduler_->shutdown();
    if (watchdog_)
        watchdog_->stop();
    MyLogger::info("Monitor stopped");
}
