#include "baseline_store.hpp"
#include "../logger/Mylogger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "absl/time/clock.h"
#include "absl/time/time.h"

using json = nlohmann::json;

namespace baseline_store
{
    namespace
    {
        const std::string ARTIFACT_INFIX = ".baseline.json.";
        const std::string TEMP_PREFIX = "baseline_temp_";
        const std::string TEMP_SUFFIX = ".tmp";
        const std::string BACKUP_INFIX = ".backup_";

        errors::Status readWholeFile(const fs::path &path, std::string &out)
        {
            std::error_code ec;
            if (!fs::exists(path, ec))
                return errors::Status::NotFound;

            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                MyLogger::warning("Baseline file is locked or unreadable: " + path.string() + " (" +
                                  std::strerror(errno) + ")");
                return errno == ENOENT ? errors::Status::NotFound : errors::Status::AccessDenied;
            }
            std::ostringstream oss;
            oss << file.rdbuf();
            if (file.bad())
                return errors::Status::AccessDenied;
            out = oss.str();
            return errors::Status::Ok;
        }

        // Writes and fsyncs; the data is on disk when this returns true.
        bool writeDurable(const fs::path &path, const std::string &data)
        {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0)
            {
                MyLogger::error("Unable to open for writing: " + path.string() + " (" + std::strerror(errno) + ")");
                return false;
            }
            const char *ptr = data.data();
            std::size_t remaining = data.size();
            while (remaining > 0)
            {
                ssize_t written = ::write(fd, ptr, remaining);
                if (written < 0)
                {
                    if (errno == EINTR)
                        continue;
                    MyLogger::error("Write failed: " + path.string() + " (" + std::strerror(errno) + ")");
                    ::close(fd);
                    return false;
                }
                ptr += written;
                remaining -= static_cast<std::size_t>(written);
            }
            if (::fsync(fd) != 0)
            {
                MyLogger::error("fsync failed: " + path.string() + " (" + std::strerror(errno) + ")");
                ::close(fd);
                return false;
            }
            return ::close(fd) == 0;
        }

        void removeQuietly(const fs::path &path)
        {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec)
                MyLogger::warning("Could not remove " + path.string() + ": " + ec.message());
        }

        bool startsWith(const std::string &s, const std::string &prefix)
        {
            return s.compare(0, prefix.size(), prefix) == 0;
        }

        bool endsWith(const std::string &s, const std::string &suffix)
        {
            return s.size() >= suffix.size() &&
                   s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }
    }

    bool isValidKey(const std::string &fileKey)
    {
        return !fileKey.empty() && fileKey != "." && fileKey != ".." &&
               fileKey.find('/') == std::string::npos && fileKey.find('\0') == std::string::npos;
    }

    BaselineStore::BaselineStore(const fs::path &directory, const codec::Codec *defaultCodec,
                                 StoreOptions options)
        : directory_(directory),
          defaultCodec_(defaultCodec ? defaultCodec : codec::knownCodecs().front()),
          options_(options),
          counter_(0)
    {
        if (options_.max_retries == 0)
            options_.max_retries = 1;
        std::error_code ec;
        fs::create_directories(directory_, ec);
        if (ec)
            MyLogger::error("Error creating baseline directory '" + directory_.string() + "': " + ec.message());
    }

    fs::path BaselineStore::artifactPath(const std::string &fileKey, const codec::Codec &c) const
    {
        return directory_ / (fileKey + ARTIFACT_INFIX + c.extension());
    }

    errors::Status BaselineStore::decodeArtifact(const fs::path &path, const codec::Codec &c,
                                                 cells::Baseline &out) const
    {
        std::string raw;
        auto status = readWholeFile(path, raw);
        if (status != errors::Status::Ok)
            return status;

        std::string text;
        if (!c.decompress(raw, text))
        {
            MyLogger::error("Baseline artifact cannot be decompressed with " + c.name() + ": " + path.string());
            return errors::Status::Corrupt;
        }

        try
        {
            out = json::parse(text).get<cells::Baseline>();
        }
        catch (const json::exception &e)
        {
            MyLogger::error("Baseline artifact is not valid JSON: " + path.string() + ": " + e.what());
            return errors::Status::Corrupt;
        }
        catch (const cells::InvalidRecord &e)
        {
            MyLogger::error("Baseline artifact has an invalid shape: " + path.string() + ": " + e.what());
            return errors::Status::Corrupt;
        }
        return errors::Status::Ok;
    }

    errors::Status BaselineStore::load(const std::string &fileKey, cells::Baseline &out) const
    {
        if (!isValidKey(fileKey))
            return errors::Status::NotFound;

        for (const codec::Codec *c : codec::knownCodecs())
        {
            fs::path path = artifactPath(fileKey, *c);
            std::error_code ec;
            if (!fs::exists(path, ec))
                continue;
            return decodeArtifact(path, *c, out);
        }

        // A crash between "delete original" and "move temp into place" leaves only the backup.
        std::string newestBackup;
        const codec::Codec *backupCodec = nullptr;
        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(directory_, ec))
        {
            std::string name = entry.path().filename().string();
            for (const codec::Codec *c : codec::knownCodecs())
            {
                std::string prefix = fileKey + ARTIFACT_INFIX + c->extension() + BACKUP_INFIX;
                if (startsWith(name, prefix) && name > newestBackup)
                {
                    newestBackup = name;
                    backupCodec = c;
                }
            }
        }
        if (backupCodec)
        {
            MyLogger::warning("Baseline for " + fileKey + " found only as backup: " + newestBackup);
            return decodeArtifact(directory_ / newestBackup, *backupCodec, out);
        }
        return errors::Status::NotFound;
    }

    bool BaselineStore::exists(const std::string &fileKey) const
    {
        if (!isValidKey(fileKey))
            return false;
        for (const codec::Codec *c : codec::knownCodecs())
        {
            std::error_code ec;
            if (fs::exists(artifactPath(fileKey, *c), ec))
                return true;
        }
        return false;
    }

    std::string BaselineStore::uniqueSuffix(unsigned int attempt)
    {
        std::ostringstream oss;
        oss << absl::FormatTime("%Y%m%d_%H%M%S_%E6f", absl::Now(), absl::LocalTimeZone())
            << "_" << std::hash<std::thread::id>()(std::this_thread::get_id()) % 100000
            << "_" << counter_.fetch_add(1)
            << "_" << attempt;
        return oss.str();
    }

    void BaselineStore::fault(SaveStage stage)
    {
        if (faultHook_)
            faultHook_(stage);
    }

    bool BaselineStore::save(const std::string &fileKey, const cells::Baseline &baseline)
    {
        return saveWith(fileKey, baseline, *defaultCodec_, false);
    }

    bool BaselineStore::saveWith(const std::string &fileKey, const cells::Baseline &baseline,
                                 const codec::Codec &c, bool keepTimestamp)
    {
        if (!isValidKey(fileKey))
        {
            MyLogger::error("Refusing to save baseline under invalid key: '" + fileKey + "'");
            return false;
        }

        const fs::path target = artifactPath(fileKey, c);

        for (unsigned int attempt = 0; attempt < options_.max_retries; ++attempt)
        {
            const std::string suffix = uniqueSuffix(attempt);
            const fs::path temp = directory_ / (TEMP_PREFIX + fileKey + "_" + suffix + TEMP_SUFFIX);
            fs::path backup;

            try
            {
                fs::create_directories(directory_);

                cells::Baseline stamped = baseline;
                if (!keepTimestamp || stamped.timestamp.empty())
                    stamped.timestamp = cells::currentTimestamp();

                std::string compressed;
                if (!c.compress(json(stamped).dump(-1, ' ', false, json::error_handler_t::replace), compressed))
                    throw std::runtime_error("compression with " + c.name() + " failed");
                if (!writeDurable(temp, compressed))
                    throw std::runtime_error("could not write temp file " + temp.string());
                fault(SaveStage::TempWritten);

                // The temp file is only trusted after it decodes cleanly.
                cells::Baseline verified;
                auto status = decodeArtifact(temp, c, verified);
                if (status != errors::Status::Ok)
                    throw std::runtime_error(std::string("temp file verification failed: ") + errors::toString(status));
                if (verified.content_hash != stamped.content_hash)
                    throw std::runtime_error("temp file verification failed: content hash mismatch");

                if (fs::exists(target))
                {
                    backup = target;
                    backup += BACKUP_INFIX + suffix;
                    fs::copy_file(target, backup, fs::copy_options::overwrite_existing);
                    fs::remove(target);
                    fault(SaveStage::BackupCreated);
                }

                fault(SaveStage::BeforeMove);
                fs::rename(temp, target);

                if (!backup.empty())
                    removeQuietly(backup);

                removeStaleArtifacts(fileKey, c);
                MyLogger::debug("Baseline saved: " + target.filename().string() + " (attempt " +
                                std::to_string(attempt + 1) + "/" + std::to_string(options_.max_retries) + ")");
                return true;
            }
            catch (const std::exception &e)
            {
                MyLogger::warning("Baseline save failed for " + fileKey + " (attempt " + std::to_string(attempt + 1) +
                                  "/" + std::to_string(options_.max_retries) + "): " + e.what());

                std::error_code ec;
                if (fs::exists(temp, ec))
                    removeQuietly(temp);

                if (!backup.empty() && fs::exists(backup, ec))
                {
                    fs::remove(target, ec);
                    fs::rename(backup, target, ec);
                    if (ec)
                        MyLogger::error("Could not restore backup " + backup.string() + ": " + ec.message());
                    else
                        MyLogger::info("Restored previous baseline from backup: " + target.filename().string());
                }

                if (attempt + 1 < options_.max_retries)
                {
                    auto delay = options_.retry_base_delay * (1u << std::min(attempt, 16u));
                    MyLogger::info("Retrying baseline save in " + std::to_string(delay.count()) + " ms");
                    std::this_thread::sleep_for(delay);
                }
            }
        }

        MyLogger::error("All attempts failed, baseline not saved: " + target.string());
        return false;
    }

    void BaselineStore::removeStaleArtifacts(const std::string &fileKey, const codec::Codec &keep)
    {
        for (const codec::Codec *c : codec::knownCodecs())
        {
            if (c->extension() == keep.extension())
                continue;
            fs::path stale = artifactPath(fileKey, *c);
            std::error_code ec;
            if (fs::exists(stale, ec))
            {
                removeQuietly(stale);
                MyLogger::debug("Removed stale " + c->name() + " artifact: " + stale.filename().string());
            }
        }
    }

    errors::Status BaselineStore::migrate(const std::string &fileKey, const codec::Codec *targetCodec)
    {
        if (!targetCodec)
            return errors::Status::NotFound;

        cells::Baseline baseline;
        auto status = load(fileKey, baseline);
        if (status != errors::Status::Ok)
            return status;

        if (!saveWith(fileKey, baseline, *targetCodec, true))
            return errors::Status::PersistFailure;

        MyLogger::info("Baseline migrated to " + targetCodec->name() + ": " + fileKey);
        return errors::Status::Ok;
    }

    errors::Status BaselineStore::rename(const std::string &oldKey, const std::string &newKey)
    {
        if (!isValidKey(oldKey) || !isValidKey(newKey))
            return errors::Status::NotFound;

        for (const codec::Codec *c : codec::knownCodecs())
        {
            fs::path source = artifactPath(oldKey, *c);
            std::error_code ec;
            if (!fs::exists(source, ec))
                continue;

            fs::path destination = artifactPath(newKey, *c);
            fs::rename(source, destination, ec);
            if (ec)
            {
                MyLogger::error("Failed to rename baseline " + source.filename().string() + " -> " +
                                destination.filename().string() + ": " + ec.message());
                return errors::Status::AccessDenied;
            }
            removeStaleArtifacts(newKey, *c);
            MyLogger::info("Baseline renamed: " + source.filename().string() + " -> " + destination.filename().string());
            return errors::Status::Ok;
        }
        return errors::Status::NotFound;
    }

    bool BaselineStore::remove(const std::string &fileKey)
    {
        if (!isValidKey(fileKey))
            return false;
        bool removed = false;
        for (const codec::Codec *c : codec::knownCodecs())
        {
            std::error_code ec;
            if (fs::remove(artifactPath(fileKey, *c), ec))
                removed = true;
            else if (ec)
                MyLogger::warning("Could not remove baseline for " + fileKey + ": " + ec.message());
        }
        return removed;
    }

    std::size_t BaselineStore::purge()
    {
        std::size_t count = 0;
        for (const auto &key : listKeys())
        {
            if (remove(key))
                ++count;
        }
        MyLogger::warning("Purged " + std::to_string(count) + " baselines from " + directory_.string());
        return count;
    }

    std::size_t BaselineStore::recover()
    {
        std::size_t fixed = 0;
        std::error_code ec;
        std::vector<fs::path> entries;
        for (const auto &entry : fs::directory_iterator(directory_, ec))
        {
            if (entry.is_regular_file(ec))
                entries.push_back(entry.path());
        }
        // Newest backup first, so it wins when several exist for one artifact.
        std::sort(entries.begin(), entries.end(), std::greater<fs::path>());

        for (const auto &path : entries)
        {
            std::string name = path.filename().string();
            if (startsWith(name, TEMP_PREFIX) && endsWith(name, TEMP_SUFFIX))
            {
                removeQuietly(path);
                MyLogger::info("Removed leftover temp file: " + name);
                ++fixed;
                continue;
            }

            auto pos = name.find(BACKUP_INFIX);
            if (pos == std::string::npos || name.find(ARTIFACT_INFIX) == std::string::npos)
                continue;

            fs::path original = directory_ / name.substr(0, pos);
            if (!fs::exists(original, ec))
            {
                fs::rename(path, original, ec);
                if (ec)
                    MyLogger::error("Could not restore backup " + name + ": " + ec.message());
                else
                    MyLogger::warning("Restored baseline from backup left by an interrupted save: " +
                                      original.filename().string());
            }
            else
            {
                removeQuietly(path);
            }
            ++fixed;
        }
        return fixed;
    }

    std::vector<std::string> BaselineStore::listKeys() const
    {
        std::set<std::string> keys;
        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(directory_, ec))
        {
            std::string name = entry.path().filename().string();
            if (name.find(BACKUP_INFIX) != std::string::npos || startsWith(name, TEMP_PREFIX))
                continue;
            for (const codec::Codec *c : codec::knownCodecs())
            {
                std::string suffix = ARTIFACT_INFIX + c->extension();
                if (endsWith(name, suffix) && name.size() > suffix.size())
                {
                    keys.insert(name.substr(0, name.size() - suffix.size()));
                    break;
                }
            }
        }
        return std::vector<std::string>(keys.begin(), keys.end());
    }

    std::size_t BaselineStore::archiveInactive(std::chrono::hours olderThan, const codec::Codec *archiveCodec)
    {
        if (!archiveCodec)
            return 0;

        std::size_t archived = 0;
        const auto now = fs::file_time_type::clock::now();
        for (const auto &key : listKeys())
        {
            if (fs::exists(artifactPath(key, *archiveCodec)))
                continue;
            for (const codec::Codec *c : codec::knownCodecs())
            {
                fs::path path = artifactPath(key, *c);
                std::error_code ec;
                auto mtime = fs::last_write_time(path, ec);
                if (ec)
                    continue;
                if (now - mtime >= olderThan && migrate(key, archiveCodec) == errors::Status::Ok)
                    ++archived;
                break;
            }
        }
        if (archived > 0)
            MyLogger::info("Archived " + std::to_string(archived) + " inactive baselines as " + archiveCodec->name());
        return archived;
    }
} // namespace baseline_store
