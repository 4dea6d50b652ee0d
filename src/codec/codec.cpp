#include "codec.hpp"
#include "../logger/Mylogger.hpp"

#include <cstring>
#include <snappy.h>
#include <zlib.h>

namespace codec
{
    namespace
    {
        constexpr std::size_t CHUNK_SIZE = 64 * 1024;

        // windowBits: 15 = zlib stream, 15 + 16 = gzip container.
        bool deflateString(const std::string &input, std::string &output, int level, int windowBits)
        {
            z_stream stream;
            std::memset(&stream, 0, sizeof(stream));
            if (deflateInit2(&stream, level, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
            {
                MyLogger::error("deflateInit2 failed");
                return false;
            }

            stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
            stream.avail_in = static_cast<uInt>(input.size());

            std::string result;
            char buffer[CHUNK_SIZE];
            int ret = Z_OK;
            do
            {
                stream.next_out = reinterpret_cast<Bytef *>(buffer);
                stream.avail_out = CHUNK_SIZE;
                ret = deflate(&stream, Z_FINISH);
                if (ret == Z_STREAM_ERROR)
                {
                    deflateEnd(&stream);
                    MyLogger::error("deflate failed");
                    return false;
                }
                result.append(buffer, CHUNK_SIZE - stream.avail_out);
            } while (ret != Z_STREAM_END);

            deflateEnd(&stream);
            output.swap(result);
            return true;
        }

        // windowBits 15 + 32 detects zlib and gzip headers automatically.
        bool inflateString(const std::string &input, std::string &output, int windowBits)
        {
            z_stream stream;
            std::memset(&stream, 0, sizeof(stream));
            if (inflateInit2(&stream, windowBits) != Z_OK)
            {
                MyLogger::error("inflateInit2 failed");
                return false;
            }

            stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
            stream.avail_in = static_cast<uInt>(input.size());

            std::string result;
            char buffer[CHUNK_SIZE];
            int ret = Z_OK;
            do
            {
                stream.next_out = reinterpret_cast<Bytef *>(buffer);
                stream.avail_out = CHUNK_SIZE;
                ret = inflate(&stream, Z_NO_FLUSH);
                if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR)
                {
                    inflateEnd(&stream);
                    return false;
                }
                result.append(buffer, CHUNK_SIZE - stream.avail_out);
                if (ret == Z_BUF_ERROR && stream.avail_in == 0)
                {
                    // Truncated input.
                    inflateEnd(&stream);
                    return false;
                }
            } while (ret != Z_STREAM_END);

            inflateEnd(&stream);
            output.swap(result);
            return true;
        }
    }

    bool GzipCodec::compress(const std::string &input, std::string &output) const
    {
        return deflateString(input, output, 6, 15 + 16);
    }

    bool GzipCodec::decompress(const std::string &input, std::string &output) const
    {
        return inflateString(input, output, 15 + 32);
    }

    bool SnappyCodec::compress(const std::string &input, std::string &output) const
    {
        output.clear();
        snappy::Compress(input.data(), input.size(), &output);
        return true;
    }

    bool SnappyCodec::decompress(const std::string &input, std::string &output) const
    {
        output.clear();
        return snappy::Uncompress(input.data(), input.size(), &output);
    }

    bool ZlibArchiveCodec::compress(const std::string &input, std::string &output) const
    {
        return deflateString(input, output, Z_BEST_COMPRESSION, 15);
    }

    bool ZlibArchiveCodec::decompress(const std::string &input, std::string &output) const
    {
        return inflateString(input, output, 15);
    }

    const std::vector<const Codec *> &knownCodecs()
    {
        static const GzipCodec gzip;
        static const SnappyCodec snappy;
        static const ZlibArchiveCodec zlib;
        static const std::vector<const Codec *> codecs{&gzip, &snappy, &zlib};
        return codecs;
    }

    const Codec *findCodec(const std::string &nameOrExtension)
    {
        for (const Codec *c : knownCodecs())
        {
            if (c->name() == nameOrExtension || c->extension() == nameOrExtension)
                return c;
        }
        return nullptr;
    }
} // namespace codec
