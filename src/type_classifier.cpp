#include "core/type_classifier.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace
{
    bool hasBytes(const uint8_t *data, size_t size, size_t offset, const char *pattern, size_t length)
    {
        return size >= offset + length && std::memcmp(data + offset, pattern, length) == 0;
    }

    bool hasBytes(const uint8_t *data, size_t size, size_t offset, const char *pattern)
    {
        return hasBytes(data, size, offset, pattern, std::strlen(pattern));
    }

    bool containsBytes(const uint8_t *data, size_t size, const char *pattern)
    {
        size_t length = std::strlen(pattern);
        if (size < length)
            return false;
        for (size_t i = 0; i + length <= size; ++i)
        {
            if (std::memcmp(data + i, pattern, length) == 0)
                return true;
        }
        return false;
    }

    uint32_t readBE32(const uint8_t *p)
    {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    uint16_t readBE16(const uint8_t *p)
    {
        return static_cast<uint16_t>((p[0] << 8) | p[1]);
    }

    uint32_t readLE32(const uint8_t *p)
    {
        return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
    }

    uint16_t readLE16(const uint8_t *p)
    {
        return static_cast<uint16_t>(p[0] | (p[1] << 8));
    }

    bool isFtyp(const uint8_t *data, size_t size)
    {
        return hasBytes(data, size, 4, "ftyp");
    }

    std::string majorBrand(const uint8_t *data, size_t size)
    {
        if (size < 12)
            return "";
        return std::string(reinterpret_cast<const char *>(data + 8), 4);
    }

    bool isAudioBrand(const std::string &brand)
    {
        return brand == "M4A " || brand == "M4B " || brand == "M4P " || brand == "F4A ";
    }

    // Still-image HEIF/AVIF brands share the ftyp box but have no decoder here
    bool isImageBrand(const std::string &brand)
    {
        return brand == "heic" || brand == "heix" || brand == "heim" || brand == "heis" ||
               brand == "mif1" || brand == "msf1" || brand == "avif" || brand == "avis";
    }

    bool isMpegAudioFrame(const uint8_t *data, size_t size)
    {
        if (size < 4 || data[0] != 0xFF || (data[1] & 0xE0) != 0xE0)
            return false;
        int version = (data[1] >> 3) & 0x03;
        int layer = (data[1] >> 1) & 0x03;
        int bitrate_index = (data[2] >> 4) & 0x0F;
        int sample_rate_index = (data[2] >> 2) & 0x03;
        return version != 1 && layer != 0 && bitrate_index != 0x0F && bitrate_index != 0 &&
               sample_rate_index != 3;
    }

    bool isAdts(const uint8_t *data, size_t size)
    {
        // 12-bit sync, layer bits must be zero
        if (size < 7 || data[0] != 0xFF || (data[1] & 0xF6) != 0xF0)
            return false;
        int sample_rate_index = (data[2] >> 2) & 0x0F;
        return sample_rate_index < 13;
    }

    bool isMpegTs(const uint8_t *data, size_t size)
    {
        if (size < 189 || data[0] != 0x47 || data[188] != 0x47)
            return false;
        return size < 377 || data[376] == 0x47;
    }

    bool isBmp(const uint8_t *data, size_t size)
    {
        if (!hasBytes(data, size, 0, "BM") || size < 26)
            return false;
        uint32_t dib_size = readLE32(data + 14);
        return dib_size == 12 || dib_size == 40 || dib_size == 52 || dib_size == 56 ||
               dib_size == 64 || dib_size == 108 || dib_size == 124;
    }

    bool isRawTiff(const uint8_t *data, size_t size)
    {
        // Canon CR2: TIFF header followed by "CR" and a major version
        if (hasBytes(data, size, 0, "II*\0", 4) && hasBytes(data, size, 8, "CR"))
            return true;
        // Olympus ORF
        if (hasBytes(data, size, 0, "IIRO") || hasBytes(data, size, 0, "IIRS") || hasBytes(data, size, 0, "MMOR"))
            return true;
        // Panasonic RW2
        if (hasBytes(data, size, 0, "IIU\0", 4))
            return true;
        return false;
    }

    bool setDimensions(uint64_t w, uint64_t h, int &width, int &height)
    {
        if (w == 0 || h == 0 || w > 0x7FFFFFFF || h > 0x7FFFFFFF)
            return false;
        width = static_cast<int>(w);
        height = static_cast<int>(h);
        return true;
    }

    // ImageWidth (256) and ImageLength (257) from the first IFD
    bool readTiffDimensions(const uint8_t *data, size_t size, int &width, int &height)
    {
        if (size < 8)
            return false;
        bool little = data[0] == 'I';
        auto read16 = [little](const uint8_t *p)
        { return little ? readLE16(p) : readBE16(p); };
        auto read32 = [little](const uint8_t *p)
        { return little ? readLE32(p) : readBE32(p); };

        if (read16(data + 2) != 42)
            return false;
        uint32_t ifd = read32(data + 4);
        if (ifd < 8 || static_cast<uint64_t>(ifd) + 2 > size)
            return false;

        uint16_t entries = read16(data + ifd);
        uint64_t w = 0, h = 0;
        for (uint16_t i = 0; i < entries; ++i)
        {
            uint64_t entry = static_cast<uint64_t>(ifd) + 2 + static_cast<uint64_t>(i) * 12;
            if (entry + 12 > size)
                return false;
            const uint8_t *p = data + entry;
            uint16_t tag = read16(p);
            uint16_t type = read16(p + 2);
            if (tag != 256 && tag != 257)
                continue;
            uint64_t value;
            if (type == 3)
                value = read16(p + 8);
            else if (type == 4)
                value = read32(p + 8);
            else
                return false;
            if (tag == 256)
                w = value;
            else
                h = value;
            if (w != 0 && h != 0)
                break;
        }
        return setDimensions(w, h, width, height);
    }

    // SIZ marker segment of a raw codestream
    bool readJ2kCodestreamDimensions(const uint8_t *data, size_t size, int &width, int &height)
    {
        if (size < 24 || !hasBytes(data, size, 0, "\xff\x4f\xff\x51", 4))
            return false;
        uint32_t xsiz = readBE32(data + 8);
        uint32_t ysiz = readBE32(data + 12);
        uint32_t xosiz = readBE32(data + 16);
        uint32_t yosiz = readBE32(data + 20);
        if (xosiz >= xsiz || yosiz >= ysiz)
            return false;
        return setDimensions(xsiz - xosiz, ysiz - yosiz, width, height);
    }

    // Walks a box sequence; payload receives the contents of the first box of the given type
    bool findBox(const uint8_t *data, size_t size, const char *type, const uint8_t *&payload, size_t &payload_size)
    {
        size_t pos = 0;
        while (pos + 8 <= size)
        {
            uint64_t length = readBE32(data + pos);
            size_t header = 8;
            if (length == 1)
            {
                if (pos + 16 > size)
                    return false;
                length = (static_cast<uint64_t>(readBE32(data + pos + 8)) << 32) | readBE32(data + pos + 12);
                header = 16;
            }
            else if (length == 0)
            {
                length = size - pos;
            }
            if (length < header || length > size - pos)
                length = size - pos;
            if (length < header)
                return false;

            if (std::memcmp(data + pos + 4, type, 4) == 0)
            {
                payload = data + pos + header;
                payload_size = static_cast<size_t>(length) - header;
                return true;
            }
            pos += static_cast<size_t>(length);
        }
        return false;
    }

    bool readJp2Dimensions(const uint8_t *data, size_t size, int &width, int &height)
    {
        if (readJ2kCodestreamDimensions(data, size, width, height))
            return true;

        const uint8_t *header = nullptr;
        size_t header_size = 0;
        const uint8_t *ihdr = nullptr;
        size_t ihdr_size = 0;
        if (findBox(data, size, "jp2h", header, header_size) && findBox(header, header_size, "ihdr", ihdr, ihdr_size) &&
            ihdr_size >= 8)
            return setDimensions(readBE32(ihdr + 4), readBE32(ihdr), width, height);

        const uint8_t *codestream = nullptr;
        size_t codestream_size = 0;
        if (findBox(data, size, "jp2c", codestream, codestream_size))
            return readJ2kCodestreamDimensions(codestream, codestream_size, width, height);
        return false;
    }

    std::vector<MediaSignature> buildSignatureTable()
    {
        std::vector<MediaSignature> table;

        // Camera RAW variants share the TIFF layout, so they precede plain TIFF
        table.push_back({"Fujifilm RAF", MediaKind::IMAGE, "raw", "libraw",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "FUJIFILMCCD-RAW"); }});
        table.push_back({"Camera RAW (TIFF based)", MediaKind::IMAGE, "raw", "libraw", isRawTiff});

        table.push_back({"JPEG", MediaKind::IMAGE, "jpeg", "opencv",
                         [](const uint8_t *d, size_t s)
                         { return s >= 3 && d[0] == 0xFF && d[1] == 0xD8 && d[2] == 0xFF; }});
        table.push_back({"PNG", MediaKind::IMAGE, "png", "opencv",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "\x89PNG\r\n\x1a\n", 8); }});
        table.push_back({"GIF", MediaKind::IMAGE, "gif", "gif",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "GIF87a") || hasBytes(d, s, 0, "GIF89a"); }});
        table.push_back({"BMP", MediaKind::IMAGE, "bmp", "opencv", isBmp});
        table.push_back({"WebP", MediaKind::IMAGE, "webp", "opencv",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "RIFF") && hasBytes(d, s, 8, "WEBP"); }});
        table.push_back({"TIFF", MediaKind::IMAGE, "tiff", "opencv",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "II*\0", 4) || hasBytes(d, s, 0, "MM\0*", 4); }});
        table.push_back({"JPEG 2000", MediaKind::IMAGE, "jp2", "opencv",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "\x00\x00\x00\x0cjP  \r\n\x87\n", 12) ||
                                  hasBytes(d, s, 0, "\xff\x4f\xff\x51", 4); }});

        table.push_back({"MPEG-4 audio", MediaKind::AUDIO, "m4a", "mov",
                         [](const uint8_t *d, size_t s)
                         { return isFtyp(d, s) && isAudioBrand(majorBrand(d, s)); }});
        table.push_back({"QuickTime", MediaKind::VIDEO, "mov", "mov",
                         [](const uint8_t *d, size_t s)
                         { return isFtyp(d, s) && majorBrand(d, s) == "qt  "; }});
        table.push_back({"ISO base media", MediaKind::VIDEO, "mp4", "mov",
                         [](const uint8_t *d, size_t s)
                         { return isFtyp(d, s) && !isImageBrand(majorBrand(d, s)); }});
        table.push_back({"WebM", MediaKind::VIDEO, "webm", "matroska",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "\x1a\x45\xdf\xa3", 4) && containsBytes(d, std::min<size_t>(s, 64), "webm"); }});
        table.push_back({"Matroska", MediaKind::VIDEO, "matroska", "matroska",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "\x1a\x45\xdf\xa3", 4); }});
        table.push_back({"AVI", MediaKind::VIDEO, "avi", "avi",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "RIFF") && hasBytes(d, s, 8, "AVI "); }});
        table.push_back({"FLV", MediaKind::VIDEO, "flv", "flv",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "FLV\x01", 4); }});
        table.push_back({"ASF", MediaKind::VIDEO, "asf", "asf",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "\x30\x26\xb2\x75\x8e\x66\xcf\x11", 8); }});
        table.push_back({"MPEG program stream", MediaKind::VIDEO, "mpeg", "mpeg",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "\x00\x00\x01\xba", 4); }});
        table.push_back({"MPEG transport stream", MediaKind::VIDEO, "mpegts", "mpegts", isMpegTs});

        table.push_back({"WAVE", MediaKind::AUDIO, "wav", "wav",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "RIFF") && hasBytes(d, s, 8, "WAVE"); }});
        table.push_back({"FLAC", MediaKind::AUDIO, "flac", "flac",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "fLaC"); }});
        table.push_back({"Ogg", MediaKind::AUDIO, "ogg", "ogg",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "OggS"); }});
        table.push_back({"AIFF", MediaKind::AUDIO, "aiff", "aiff",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "FORM") && (hasBytes(d, s, 8, "AIFF") || hasBytes(d, s, 8, "AIFC")); }});
        table.push_back({"MP3 (ID3)", MediaKind::AUDIO, "mp3", "mp3",
                         [](const uint8_t *d, size_t s)
                         { return hasBytes(d, s, 0, "ID3"); }});
        // ADTS sync is a subset of the MPEG audio sync pattern
        table.push_back({"AAC (ADTS)", MediaKind::AUDIO, "aac", "aac", isAdts});
        table.push_back({"MP3", MediaKind::AUDIO, "mp3", "mp3", isMpegAudioFrame});

        return table;
    }
}

const std::vector<MediaSignature> &TypeClassifier::getSignatures()
{
    static const std::vector<MediaSignature> signatures = buildSignatureTable();
    return signatures;
}

ClassificationResult TypeClassifier::classify(const uint8_t *data, size_t size, uint64_t total_size)
{
    ClassificationResult result;
    result.record.size_bytes = total_size;

    if (size < MIN_SIGNATURE_BYTES || data == nullptr)
    {
        result.failure_kind = FailureKind::TRUNCATED;
        result.error_message = "File too short to carry a media signature (" + std::to_string(size) + " bytes)";
        return result;
    }

    for (const auto &signature : getSignatures())
    {
        if (!signature.matches(data, size))
            continue;

        result.success = true;
        result.failure_kind = FailureKind::NONE;
        result.record.kind = signature.kind;
        result.record.container = signature.container;
        result.record.backend = signature.backend;

        if (signature.kind == MediaKind::IMAGE)
        {
            int width = 0, height = 0;
            if (readImageDimensions(data, size, signature.container, width, height))
            {
                result.record.width = width;
                result.record.height = height;
            }
        }

        Logger::debug("Classified content as " + signature.name + " (" + MediaKinds::getName(signature.kind) + ")");
        return result;
    }

    result.failure_kind = FailureKind::UNSUPPORTED_FORMAT;
    result.error_message = "No known media signature matches the file content";
    return result;
}

ClassificationResult TypeClassifier::classifyDescriptor(int fd)
{
    ClassificationResult result;

    struct stat st;
    if (fstat(fd, &st) != 0)
    {
        result.failure_kind = FailureKind::DECODE_ERROR;
        result.error_message = "fstat failed: " + std::string(std::strerror(errno));
        return result;
    }
    if (!S_ISREG(st.st_mode))
    {
        result.failure_kind = FailureKind::UNSUPPORTED_FORMAT;
        result.error_message = "Not a regular file";
        return result;
    }

    std::vector<uint8_t> prefix(PREFIX_BYTES);
    size_t filled = 0;
    while (filled < prefix.size())
    {
        ssize_t n = pread(fd, prefix.data() + filled, prefix.size() - filled, static_cast<off_t>(filled));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            result.failure_kind = FailureKind::DECODE_ERROR;
            result.error_message = "read failed: " + std::string(std::strerror(errno));
            return result;
        }
        if (n == 0)
            break;
        filled += static_cast<size_t>(n);
    }

    return classify(prefix.data(), filled, static_cast<uint64_t>(st.st_size));
}

ClassificationResult TypeClassifier::classifyFile(const std::string &file_path)
{
    int fd = open(file_path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0)
    {
        ClassificationResult result;
        result.failure_kind = FailureKind::DECODE_ERROR;
        result.error_message = "Could not open " + file_path + ": " + std::strerror(errno);
        return result;
    }

    ClassificationResult result = classifyDescriptor(fd);
    close(fd);
    result.record.source_path = file_path;
    return result;
}

bool TypeClassifier::readImageDimensions(const uint8_t *data, size_t size, const std::string &container,
                                         int &width, int &height)
{
    width = 0;
    height = 0;

    if (container == "png")
    {
        if (size < 24 || !hasBytes(data, size, 12, "IHDR"))
            return false;
        uint32_t w = readBE32(data + 16);
        uint32_t h = readBE32(data + 20);
        if (w == 0 || h == 0 || w > 0x7FFFFFFF || h > 0x7FFFFFFF)
            return false;
        width = static_cast<int>(w);
        height = static_cast<int>(h);
        return true;
    }

    if (container == "gif")
    {
        if (size < 10)
            return false;
        width = readLE16(data + 6);
        height = readLE16(data + 8);
        return width > 0 && height > 0;
    }

    if (container == "bmp")
    {
        if (size < 26)
            return false;
        uint32_t dib_size = readLE32(data + 14);
        if (dib_size == 12)
        {
            width = readLE16(data + 18);
            height = readLE16(data + 20);
        }
        else
        {
            int32_t w = static_cast<int32_t>(readLE32(data + 18));
            int32_t h = static_cast<int32_t>(readLE32(data + 22));
            if (w <= 0 || h == 0 || h == INT32_MIN)
                return false;
            width = w;
            height = h < 0 ? -h : h;
        }
        return width > 0 && height > 0;
    }

    if (container == "jpeg")
    {
        // Walk marker segments up to the first SOFn
        size_t pos = 2;
        while (pos + 4 <= size)
        {
            if (data[pos] != 0xFF)
                return false;
            uint8_t marker = data[pos + 1];
            if (marker == 0xFF)
            {
                ++pos;
                continue;
            }
            if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7))
            {
                pos += 2;
                continue;
            }
            uint16_t length = readBE16(data + pos + 2);
            if (length < 2)
                return false;
            bool is_sof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
            if (is_sof)
            {
                if (pos + 9 > size)
                    return false;
                height = readBE16(data + pos + 5);
                width = readBE16(data + pos + 7);
                return width > 0 && height > 0;
            }
            if (marker == 0xDA || marker == 0xD9)
                return false;
            pos += 2 + length;
        }
        return false;
    }

    if (container == "webp")
    {
        if (size < 30)
            return false;
        if (hasBytes(data, size, 12, "VP8 "))
        {
            width = readLE16(data + 26) & 0x3FFF;
            height = readLE16(data + 28) & 0x3FFF;
        }
        else if (hasBytes(data, size, 12, "VP8L") && size >= 25)
        {
            uint32_t bits = readLE32(data + 21);
            width = static_cast<int>((bits & 0x3FFF) + 1);
            height = static_cast<int>(((bits >> 14) & 0x3FFF) + 1);
        }
        else if (hasBytes(data, size, 12, "VP8X"))
        {
            width = static_cast<int>((data[24] | (data[25] << 8) | (data[26] << 16)) + 1);
            height = static_cast<int>((data[27] | (data[28] << 8) | (data[29] << 16)) + 1);
        }
        return width > 0 && height > 0;
    }

    if (container == "tiff")
        return readTiffDimensions(data, size, width, height);

    if (container == "jp2")
        return readJp2Dimensions(data, size, width, height);

    return false;
}
