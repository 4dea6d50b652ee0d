#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace settings
{
    struct PollingSettings
    {
        double size_threshold_mb = 10.0;
        unsigned int dense_interval_sec = 5;
        unsigned int dense_duration_sec = 15;
        unsigned int sparse_interval_sec = 15;
        unsigned int worker_threads = 2;
        unsigned int max_failed_ticks = 10; // consecutive failed reads before a task gives up
    };

    struct BaselineSettings
    {
        std::string codec = "gzip";
        std::string archive_codec = "zlib";
        unsigned int archive_after_days = 0; // 0 disables archiving
        unsigned int max_retries = 5;
        unsigned int retry_base_delay_ms = 200;
    };

    struct ReportSettings
    {
        bool report_indirect_changes = true;
        bool refresh_author_on_unchanged = false;
        std::vector<std::string> whitelist_users;
        bool log_whitelist_user_change = true;
    };

    struct Settings
    {
        std::vector<std::string> watch_folders;
        std::string baseline_folder = "baselines";
        std::string log_file;
        std::string log_level = "info";
        std::string csv_log_file = "logs/excel_change_log_%Y%m%d.csv.gz";

        bool use_local_cache = true;
        std::string cache_folder = "cache";
        std::vector<std::string> supported_extensions{".xlsx", ".xlsm"};

        unsigned int debounce_interval_ms = 2000;
        unsigned int create_settle_ms = 100;

        bool enable_timeout = true;
        unsigned int file_timeout_seconds = 120;

        bool enable_memory_monitor = true;
        double memory_limit_mb = 2048.0;
        unsigned int memory_pause_seconds = 10;

        bool enable_resume = true;
        std::string progress_file = "resume/baseline_progress.json";
        bool scan_all_on_start = true;

        PollingSettings polling;
        BaselineSettings baseline;
        ReportSettings report;
    };

    // Builds Settings from a parsed config file; missing keys keep their defaults.
    Settings fromJson(const nlohmann::json &j);

    // Replaces a %Y%m%d token in path with today's local date.
    std::string expandDate(const std::string &path);
} // namespace settings

#endif // SETTINGS_HPP
