#include "settings.hpp"
#include "../load_config/load_config.hpp"

#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace settings
{
    namespace
    {
        unsigned int get_unsigned(const std::string &key, const json &j, unsigned int fallback)
        {
            int value = ConfigReader::get_config_value(key, j, static_cast<int>(fallback));
            if (value < 0)
            {
                MyLogger::error("Negative value not allowed for key '" + key + "', using default");
                return fallback;
            }
            return static_cast<unsigned int>(value);
        }
    }

    Settings fromJson(const json &j)
    {
        Settings s;

        s.watch_folders = ConfigReader::get_config_strings("watch_folders", j, s.watch_folders);
        s.baseline_folder = ConfigReader::get_config_string("baseline_folder", j, s.baseline_folder);
        s.log_file = ConfigReader::get_config_string("log_file", j, s.log_file);
        s.log_level = ConfigReader::get_config_string("log_level", j, s.log_level);
        s.csv_log_file = ConfigReader::get_config_string("csv_log_file", j, s.csv_log_file);

        s.use_local_cache = ConfigReader::get_config_bool("use_local_cache", j, s.use_local_cache);
        s.cache_folder = ConfigReader::get_config_string("cache_folder", j, s.cache_folder);
        s.supported_extensions = ConfigReader::get_config_strings("supported_extensions", j, s.supported_extensions);

        s.debounce_interval_ms = get_unsigned("debounce_interval_ms", j, s.debounce_interval_ms);
        s.create_settle_ms = get_unsigned("create_settle_ms", j, s.create_settle_ms);

        s.enable_timeout = ConfigReader::get_config_bool("enable_timeout", j, s.enable_timeout);
        s.file_timeout_seconds = get_unsigned("file_timeout_seconds", j, s.file_timeout_seconds);

        s.enable_memory_monitor = ConfigReader::get_config_bool("enable_memory_monitor", j, s.enable_memory_monitor);
        s.memory_limit_mb = ConfigReader::get_config_double("memory_limit_mb", j, s.memory_limit_mb);
        s.memory_pause_seconds = get_unsigned("memory_pause_seconds", j, s.memory_pause_seconds);

        s.enable_resume = ConfigReader::get_config_bool("enable_resume", j, s.enable_resume);
        s.progress_file = ConfigReader::get_config_string("progress_file", j, s.progress_file);
        s.scan_all_on_start = ConfigReader::get_config_bool("scan_all_on_start", j, s.scan_all_on_start);

        if (j.contains("polling") && j["polling"].is_object())
        {
            const json &p = j["polling"];
            s.polling.size_threshold_mb = ConfigReader::get_config_double("size_threshold_mb", p, s.polling.size_threshold_mb);
            s.polling.dense_interval_sec = get_unsigned("dense_interval_sec", p, s.polling.dense_interval_sec);
            s.polling.dense_duration_sec = get_unsigned("dense_duration_sec", p, s.polling.dense_duration_sec);
            s.polling.sparse_interval_sec = get_unsigned("sparse_interval_sec", p, s.polling.sparse_interval_sec);
            s.polling.worker_threads = get_unsigned("worker_threads", p, s.polling.worker_threads);
            s.polling.max_failed_ticks = get_unsigned("max_failed_ticks", p, s.polling.max_failed_ticks);
        }

        if (j.contains("baseline") && j["baseline"].is_object())
        {
            const json &b = j["baseline"];
            s.baseline.codec = ConfigReader::get_config_string("codec", b, s.baseline.codec);
            s.baseline.archive_codec = ConfigReader::get_config_string("archive_codec", b, s.baseline.archive_codec);
            s.baseline.archive_after_days = get_unsigned("archive_after_days", b, s.baseline.archive_after_days);
            s.baseline.max_retries = get_unsigned("max_retries", b, s.baseline.max_retries);
            s.baseline.retry_base_delay_ms = get_unsigned("retry_base_delay_ms", b, s.baseline.retry_base_delay_ms);
        }

        if (j.contains("report") && j["report"].is_object())
        {
            const json &r = j["report"];
            s.report.report_indirect_changes = ConfigReader::get_config_bool("report_indirect_changes", r, s.report.report_indirect_changes);
            s.report.refresh_author_on_unchanged = ConfigReader::get_config_bool("refresh_author_on_unchanged", r, s.report.refresh_author_on_unchanged);
            s.report.whitelist_users = ConfigReader::get_config_strings("whitelist_users", r, s.report.whitelist_users);
            s.report.log_whitelist_user_change = ConfigReader::get_config_bool("log_whitelist_user_change", r, s.report.log_whitelist_user_change);
        }

        if (s.polling.dense_interval_sec == 0 || s.polling.sparse_interval_sec == 0)
        {
            MyLogger::warning("Polling intervals must be positive, falling back to defaults");
            s.polling.dense_interval_sec = PollingSettings().dense_interval_sec;
            s.polling.sparse_interval_sec = PollingSettings().sparse_interval_sec;
        }
        if (s.polling.worker_threads == 0)
            s.polling.worker_threads = 1;
        if (s.polling.max_failed_ticks == 0)
            s.polling.max_failed_ticks = 1;
        if (s.baseline.max_retries == 0)
            s.baseline.max_retries = 1;

        return s;
    }

    std::string expandDate(const std::string &path)
    {
        static const std::string token = "%Y%m%d";
        auto pos = path.find(token);
        if (pos == std::string::npos)
            return path;
        std::string today = absl::FormatTime("%Y%m%d", absl::Now(), absl::LocalTimeZone());
        std::string result = path;
        result.replace(pos, token.size(), today);
        return result;
    }
} // namespace settings
