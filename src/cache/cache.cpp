#include "cache.hpp"
#include "../logger/Mylogger.hpp"

#include <iomanip>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <openssl/md5.h>

namespace fs = std::filesystem;

namespace cache
{
    class LocalMirror::Impl
    {
    public:
        Impl(const fs::path &cacheFolder, bool enabled)
            : folder_(cacheFolder), enabled_(enabled), copies_(0)
        {
            if (!enabled_)
                return;
            std::error_code ec;
            fs::create_directories(folder_, ec);
            if (ec)
            {
                MyLogger::warning("Cache folder unavailable, reading files in place: " + ec.message());
                enabled_ = false;
            }
        }

        std::string nameFor(const std::string &networkPath) const
        {
            unsigned char digest[MD5_DIGEST_LENGTH];
            MD5(reinterpret_cast<const unsigned char *>(networkPath.data()), networkPath.size(), digest);
            std::ostringstream oss;
            for (int i = 0; i < 8; ++i)
                oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
            return oss.str() + "_" + fs::path(networkPath).filename().string();
        }

        std::string ensure(const std::string &networkPath)
        {
            if (!enabled_)
                return networkPath;

            const std::string name = nameFor(networkPath);
            fs::path cached = folder_ / name;
            std::error_code ec;

            // Two workers never write the same cache file; other files copy in parallel.
            auto fileLock = lockFor(name);
            std::lock_guard<std::mutex> lock(*fileLock);

            auto sourceTime = fs::last_write_time(networkPath, ec);
            if (ec)
            {
                MyLogger::warning("Cannot stat " + networkPath + ", reading in place: " + ec.message());
                return networkPath;
            }

            if (fs::exists(cached, ec))
            {
                auto cachedTime = fs::last_write_time(cached, ec);
                if (!ec && cachedTime >= sourceTime)
                    return cached.string();
            }

            fs::path temp = cached;
            temp += ".part";
            fs::copy_file(networkPath, temp, fs::copy_options::overwrite_existing, ec);
            if (!ec)
                fs::last_write_time(temp, sourceTime, ec);
            if (!ec)
                fs::rename(temp, cached, ec);
            if (ec)
            {
                MyLogger::warning("Cache copy failed for " + networkPath + ", reading in place: " + ec.message());
                std::error_code ignored;
                fs::remove(temp, ignored);
                return networkPath;
            }

            {
                std::lock_guard<std::mutex> countLock(mutex_);
                ++copies_;
            }
            MyLogger::debug("Cached " + networkPath + " -> " + cached.string());
            return cached.string();
        }

        std::size_t copies() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return copies_;
        }

    private:
        std::shared_ptr<std::mutex> lockFor(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto &entry = fileLocks_[name];
            if (!entry)
                entry = std::make_shared<std::mutex>();
            return entry;
        }

        fs::path folder_;
        bool enabled_;
        std::size_t copies_;
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<std::mutex>> fileLocks_;
    };

    LocalMirror::LocalMirror(const fs::path &cacheFolder, bool enabled)
        : impl_(new Impl(cacheFolder, enabled))
    {
    }

    LocalMirror::~LocalMirror()
    {
        delete impl_;
    }

    std::string LocalMirror::ensureLocalCopy(const std::string &networkPath)
    {
        return impl_->ensure(networkPath);
    }

    std::string LocalMirror::cacheNameFor(const std::string &networkPath) const
    {
        return impl_->nameFor(networkPath);
    }

    std::size_t LocalMirror::copiesMade() const
    {
        return impl_->copies();
    }
} // namespace cache
