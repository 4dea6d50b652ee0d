#ifndef CACHE_HPP
#define CACHE_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace cache
{
    // Local copies of spreadsheets living on slow network shares.
    class LocalMirror
    {
    public:
        // A disabled mirror hands every path back unchanged.
        LocalMirror(const std::filesystem::path &cacheFolder, bool enabled);
        ~LocalMirror();

        LocalMirror(const LocalMirror &) = delete;
        LocalMirror &operator=(const LocalMirror &) = delete;

        // Returns a local copy no older than the source, refreshing it when stale.
        // Any failure falls back to networkPath itself.
        std::string ensureLocalCopy(const std::string &networkPath);

        // Cache file name: first 16 hex digits of md5(path) + "_" + basename.
        std::string cacheNameFor(const std::string &networkPath) const;

        std::size_t copiesMade() const;

    private:
        class Impl;
        Impl *impl_;
    };
} // namespace cache

#endif // CACHE_HPP
