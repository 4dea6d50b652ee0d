#include "progress.hpp"
#include "../cells/cells.hpp"
#include "../logger/Mylogger.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace progress
{
    ProgressTracker::ProgressTracker(const std::filesystem::path &file) : file_(file) {}

    bool ProgressTracker::save(std::size_t completed, std::size_t total)
    {
        json j;
        j["timestamp"] = cells::currentTimestamp();
        j["completed"] = completed;
        j["total"] = total;

        std::error_code ec;
        if (file_.has_parent_path())
            std::filesystem::create_directories(file_.parent_path(), ec);

        // Written beside the record and renamed over it so a crash never leaves half a file.
        std::filesystem::path temp = file_;
        temp += ".tmp";
        {
            std::ofstream out(temp, std::ios::trunc);
            if (!out.is_open())
            {
                MyLogger::error("Unable to write progress file: " + temp.string());
                return false;
            }
            out << j.dump(4);
            if (!out.good())
            {
                MyLogger::error("Error writing progress file: " + temp.string());
                return false;
            }
        }
        std::filesystem::rename(temp, file_, ec);
        if (ec)
        {
            MyLogger::error("Error replacing progress file: " + ec.message());
            std::filesystem::remove(temp, ec);
            return false;
        }
        return true;
    }

    std::optional<ProgressRecord> ProgressTracker::load() const
    {
        std::ifstream in(file_);
        if (!in.is_open())
            return std::nullopt;

        try
        {
            json j = json::parse(in);
            ProgressRecord record;
            record.completed = j.at("completed").get<std::size_t>();
            record.total = j.at("total").get<std::size_t>();
            record.timestamp = j.value("timestamp", "");
            if (record.completed > record.total)
            {
                MyLogger::warning("Progress file has completed > total, ignoring: " + file_.string());
                return std::nullopt;
            }
            return record;
        }
        catch (const json::exception &e)
        {
            MyLogger::warning("Progress file is corrupt, starting over: " + std::string(e.what()));
            return std::nullopt;
        }
    }

    bool ProgressTracker::clear()
    {
        std::error_code ec;
        bool removed = std::filesystem::remove(file_, ec);
        if (ec)
        {
            MyLogger::warning("Could not delete progress file: " + ec.message());
            return false;
        }
        if (removed)
            MyLogger::debug("Progress file cleared: " + file_.string());
        return true;
    }
} // namespace progress
