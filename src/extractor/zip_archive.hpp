#ifndef ZIP_ARCHIVE_HPP
#define ZIP_ARCHIVE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "../errors/status.hpp"

namespace extractor
{
    // Read-only view of a zip container held in memory. Supports the stored and
    // deflate methods, which is all an Office document uses.
    class ZipArchive
    {
    public:
        // NotFound / AccessDenied for the file itself, Corrupt for a bad container.
        errors::Status open(const std::string &path);
        errors::Status openBuffer(std::string data);

        bool contains(const std::string &name) const;
        std::vector<std::string> names() const;

        errors::Status read(const std::string &name, std::string &out) const;

    private:
        struct Entry
        {
            std::uint16_t method = 0;
            std::uint32_t compressedSize = 0;
            std::uint32_t uncompressedSize = 0;
            std::uint32_t localHeaderOffset = 0;
        };

        errors::Status parseCentralDirectory();

        std::string data_;
        std::map<std::string, Entry> entries_;
    };
} // namespace extractor

#endif // ZIP_ARCHIVE_HPP
