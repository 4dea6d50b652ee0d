#ifndef CODEC_HPP
#define CODEC_HPP

#include <string>
#include <vector>

namespace codec
{
    // Compression codec for baseline artifacts. The codec is identified on disk
    // by the artifact's extension.
    class Codec
    {
    public:
        virtual ~Codec() = default;

        virtual std::string name() const = 0;
        virtual std::string extension() const = 0;

        virtual bool compress(const std::string &input, std::string &output) const = 0;
        virtual bool decompress(const std::string &input, std::string &output) const = 0;
    };

    // gzip container, zlib level 6. Default codec.
    class GzipCodec : public Codec
    {
    public:
        std::string name() const override { return "gzip"; }
        std::string extension() const override { return "gz"; }
        bool compress(const std::string &input, std::string &output) const override;
        bool decompress(const std::string &input, std::string &output) const override;
    };

    // Snappy: fast, low ratio.
    class SnappyCodec : public Codec
    {
    public:
        std::string name() const override { return "snappy"; }
        std::string extension() const override { return "sz"; }
        bool compress(const std::string &input, std::string &output) const override;
        bool decompress(const std::string &input, std::string &output) const override;
    };

    // zlib stream at best compression, used for archiving inactive baselines.
    class ZlibArchiveCodec : public Codec
    {
    public:
        std::string name() const override { return "zlib"; }
        std::string extension() const override { return "zz"; }
        bool compress(const std::string &input, std::string &output) const override;
        bool decompress(const std::string &input, std::string &output) const override;
    };

    // Every codec the store has ever written, in load priority order.
    const std::vector<const Codec *> &knownCodecs();

    // Lookup by name ("gzip") or extension ("gz"); nullptr if unknown.
    const Codec *findCodec(const std::string &nameOrExtension);
} // namespace codec

#endif // CODEC_HPP
