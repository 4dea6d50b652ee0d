#include "zip_archive.hpp"
#include "../logger/Mylogger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <zlib.h>

namespace extractor
{
    namespace
    {
        constexpr std::uint32_t LOCAL_HEADER_SIG = 0x04034b50;
        constexpr std::uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
        constexpr std::uint32_t END_OF_CENTRAL_DIR_SIG = 0x06054b50;
        constexpr std::size_t END_OF_CENTRAL_DIR_SIZE = 22;

        std::uint16_t readU16(const std::string &data, std::size_t pos)
        {
            return static_cast<std::uint16_t>(static_cast<unsigned char>(data[pos]) |
                                              (static_cast<unsigned char>(data[pos + 1]) << 8));
        }

        std::uint32_t readU32(const std::string &data, std::size_t pos)
        {
            return static_cast<std::uint32_t>(readU16(data, pos)) |
                   (static_cast<std::uint32_t>(readU16(data, pos + 2)) << 16);
        }

        // Raw deflate stream, as stored inside zip entries.
        bool inflateRaw(const char *input, std::size_t size, std::size_t expected, std::string &out)
        {
            if (expected == 0)
            {
                out.clear();
                return true;
            }

            z_stream stream;
            std::memset(&stream, 0, sizeof(stream));
            if (inflateInit2(&stream, -MAX_WBITS) != Z_OK)
                return false;

            out.assign(expected, '\0');
            stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input));
            stream.avail_in = static_cast<uInt>(size);
            stream.next_out = reinterpret_cast<Bytef *>(&out[0]);
            stream.avail_out = static_cast<uInt>(expected);

            int ret = inflate(&stream, Z_FINISH);
            std::size_t produced = expected - stream.avail_out;
            inflateEnd(&stream);
            if (ret != Z_STREAM_END || produced != expected)
                return false;
            return true;
        }
    }

    errors::Status ZipArchive::open(const std::string &path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            return errors::Status::NotFound;

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            MyLogger::warning("Cannot open " + path + ": " + std::strerror(errno));
            return errors::Status::AccessDenied;
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        if (file.bad())
            return errors::Status::AccessDenied;
        return openBuffer(oss.str());
    }

    errors::Status ZipArchive::openBuffer(std::string data)
    {
        data_ = std::move(data);
        entries_.clear();
        return parseCentralDirectory();
    }

    errors::Status ZipArchive::parseCentralDirectory()
    {
        if (data_.size() < END_OF_CENTRAL_DIR_SIZE)
            return errors::Status::Corrupt;

        // The end record sits in the last 22 bytes plus an optional comment of up to 64 KiB.
        std::size_t eocd = std::string::npos;
        std::size_t lowest = data_.size() > END_OF_CENTRAL_DIR_SIZE + 0xFFFF
                                 ? data_.size() - END_OF_CENTRAL_DIR_SIZE - 0xFFFF
                                 : 0;
        for (std::size_t pos = data_.size() - END_OF_CENTRAL_DIR_SIZE + 1; pos-- > lowest;)
        {
            if (readU32(data_, pos) == END_OF_CENTRAL_DIR_SIG)
            {
                eocd = pos;
                break;
            }
        }
        if (eocd == std::string::npos)
            return errors::Status::Corrupt;

        std::uint16_t count = readU16(data_, eocd + 10);
        std::uint32_t cdOffset = readU32(data_, eocd + 16);
        if (cdOffset == 0xFFFFFFFF || cdOffset >= data_.size())
            return errors::Status::Corrupt;

        std::size_t pos = cdOffset;
        for (std::uint16_t i = 0; i < count; ++i)
        {
            if (pos + 46 > data_.size() || readU32(data_, pos) != CENTRAL_HEADER_SIG)
                return errors::Status::Corrupt;

            Entry entry;
            entry.method = readU16(data_, pos + 10);
            entry.compressedSize = readU32(data_, pos + 20);
            entry.uncompressedSize = readU32(data_, pos + 24);
            std::uint16_t nameLen = readU16(data_, pos + 28);
            std::uint16_t extraLen = readU16(data_, pos + 30);
            std::uint16_t commentLen = readU16(data_, pos + 32);
            entry.localHeaderOffset = readU32(data_, pos + 42);

            if (pos + 46 + nameLen > data_.size())
                return errors::Status::Corrupt;
            entries_[data_.substr(pos + 46, nameLen)] = entry;
            pos += 46 + nameLen + extraLen + commentLen;
        }
        return errors::Status::Ok;
    }

    bool ZipArchive::contains(const std::string &name) const
    {
        return entries_.count(name) > 0;
    }

    std::vector<std::string> ZipArchive::names() const
    {
        std::vector<std::string> result;
        for (const auto &entry : entries_)
            result.push_back(entry.first);
        return result;
    }

    errors::Status ZipArchive::read(const std::string &name, std::string &out) const
    {
        auto it = entries_.find(name);
        if (it == entries_.end())
            return errors::Status::NotFound;
        const Entry &entry = it->second;

        std::size_t header = entry.localHeaderOffset;
        if (header + 30 > data_.size() || readU32(data_, header) != LOCAL_HEADER_SIG)
            return errors::Status::Corrupt;

        std::size_t start = header + 30 + readU16(data_, header + 26) + readU16(data_, header + 28);
        if (start + entry.compressedSize > data_.size())
            return errors::Status::Corrupt;

        const char *payload = data_.data() + start;
        switch (entry.method)
        {
        case 0:
            out.assign(payload, entry.compressedSize);
            return errors::Status::Ok;
        case 8:
            if (!inflateRaw(payload, entry.compressedSize, entry.uncompressedSize, out))
            {
                MyLogger::warning("Zip entry failed to inflate: " + name);
                return errors::Status::Corrupt;
            }
            return errors::Status::Ok;
        default:
            MyLogger::warning("Unsupported zip compression method " + std::to_string(entry.method) + " for " + name);
            return errors::Status::Corrupt;
        }
    }
} // namespace extractor
