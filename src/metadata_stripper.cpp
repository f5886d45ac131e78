#include "core/metadata_stripper.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <functional>
#include <set>
#include <sys/stat.h>
#include <unistd.h>

namespace
{
    using ReadAt = std::function<bool(uint64_t offset, uint8_t *dst, size_t size)>;
    using WriteAt = std::function<bool(uint64_t offset, const uint8_t *src, size_t size)>;

    constexpr int MAX_BOX_DEPTH = 16;
    constexpr uint64_t MAX_IN_MEMORY_BOX = 512ULL * 1024 * 1024;
    constexpr size_t COPY_CHUNK = 1 << 20;

    const std::set<std::string> REMOVED_BOXES = {"udta", "meta", "uuid", "free", "skip", "wide"};
    const std::set<std::string> CONTAINER_BOXES = {"moov", "trak", "mdia", "minf", "stbl", "edts", "dinf", "mvex"};
    const std::set<std::string> TIMESTAMPED_BOXES = {"mvhd", "tkhd", "mdhd"};
    const std::set<std::string> FRAGMENT_BOXES = {"moof", "mfra", "sidx", "styp", "ssix", "prft"};

    const std::set<std::string> PNG_KEPT_CHUNKS = {"IHDR", "PLTE", "tRNS", "IDAT", "IEND"};

    uint32_t readBE32(const uint8_t *p)
    {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    uint64_t readBE64(const uint8_t *p)
    {
        return (static_cast<uint64_t>(readBE32(p)) << 32) | readBE32(p + 4);
    }

    void writeBE32(uint8_t *p, uint32_t v)
    {
        p[0] = static_cast<uint8_t>(v >> 24);
        p[1] = static_cast<uint8_t>(v >> 16);
        p[2] = static_cast<uint8_t>(v >> 8);
        p[3] = static_cast<uint8_t>(v);
    }

    void writeBE64(uint8_t *p, uint64_t v)
    {
        writeBE32(p, static_cast<uint32_t>(v >> 32));
        writeBE32(p + 4, static_cast<uint32_t>(v));
    }

    // ---------------------------------------------------------------------
    // ISO base media file format
    // ---------------------------------------------------------------------

    struct BoxHeader
    {
        uint64_t offset = 0;
        uint64_t size = 0;
        uint32_t header_size = 0;
        std::string type;
    };

    struct OffsetTable
    {
        size_t position; // First entry, relative to the rebuilt box buffer
        uint32_t count;
        bool wide; // co64
    };

    struct TopLevelBox
    {
        BoxHeader header;
        std::vector<uint8_t> rebuilt;
        std::vector<OffsetTable> tables;
        uint64_t new_offset = 0;
        bool is_mdat = false;
    };

    bool parseBoxHeader(const uint8_t *p, size_t available, uint64_t remaining, BoxHeader &header)
    {
        if (available < 8 || remaining < 8)
            return false;

        uint32_t size32 = readBE32(p);
        header.type.assign(reinterpret_cast<const char *>(p + 4), 4);
        for (char c : header.type)
        {
            if (static_cast<unsigned char>(c) < 0x20)
                return false;
        }

        if (size32 == 1)
        {
            if (available < 16 || remaining < 16)
                return false;
            header.size = readBE64(p + 8);
            header.header_size = 16;
        }
        else if (size32 == 0)
        {
            header.size = remaining;
            header.header_size = 8;
        }
        else
        {
            header.size = size32;
            header.header_size = 8;
        }

        return header.size >= header.header_size && header.size <= remaining;
    }

    uint32_t canonicalHeaderSize(uint64_t payload_size)
    {
        return payload_size + 8 <= 0xFFFFFFFFULL ? 8 : 16;
    }

    void appendBoxHeader(std::vector<uint8_t> &out, const std::string &type, uint64_t payload_size)
    {
        size_t pos = out.size();
        if (canonicalHeaderSize(payload_size) == 8)
        {
            out.resize(pos + 8);
            writeBE32(out.data() + pos, static_cast<uint32_t>(payload_size + 8));
            std::memcpy(out.data() + pos + 4, type.data(), 4);
        }
        else
        {
            out.resize(pos + 16);
            writeBE32(out.data() + pos, 1);
            std::memcpy(out.data() + pos + 4, type.data(), 4);
            writeBE64(out.data() + pos + 8, payload_size + 16);
        }
    }

    bool zeroTimestamps(uint8_t *payload, uint64_t payload_size)
    {
        if (payload_size < 4)
            return false;
        uint8_t version = payload[0];
        size_t span = version == 1 ? 16 : 8;
        if (payload_size < 4 + span)
            return false;
        std::memset(payload + 4, 0, span);
        return true;
    }

    bool timestampsAreZero(const uint8_t *payload, uint64_t payload_size)
    {
        if (payload_size < 4)
            return false;
        size_t span = payload[0] == 1 ? 16 : 8;
        if (payload_size < 4 + span)
            return false;
        for (size_t i = 0; i < span; ++i)
        {
            if (payload[4 + i] != 0)
                return false;
        }
        return true;
    }

    bool rebuildChildren(const uint8_t *data, uint64_t size, int depth, std::vector<uint8_t> &out,
                         std::vector<OffsetTable> &tables, std::string &error)
    {
        if (depth > MAX_BOX_DEPTH)
        {
            error = "box nesting deeper than " + std::to_string(MAX_BOX_DEPTH);
            return false;
        }

        uint64_t pos = 0;
        while (pos < size)
        {
            BoxHeader header;
            if (!parseBoxHeader(data + pos, static_cast<size_t>(std::min<uint64_t>(size - pos, 16)), size - pos, header))
            {
                error = "malformed box header at depth " + std::to_string(depth);
                return false;
            }

            const uint8_t *payload = data + pos + header.header_size;
            uint64_t payload_size = header.size - header.header_size;

            if (REMOVED_BOXES.count(header.type))
            {
                Logger::trace("Dropping '" + header.type + "' box (" + std::to_string(header.size) + " bytes)");
            }
            else if (CONTAINER_BOXES.count(header.type))
            {
                size_t header_pos = out.size();
                appendBoxHeader(out, header.type, 0);
                size_t child_start = out.size();
                if (!rebuildChildren(payload, payload_size, depth + 1, out, tables, error))
                    return false;
                uint64_t new_payload = out.size() - child_start;
                if (new_payload + 8 > 0xFFFFFFFFULL)
                {
                    error = "container box '" + header.type + "' exceeds 4 GiB";
                    return false;
                }
                writeBE32(out.data() + header_pos, static_cast<uint32_t>(new_payload + 8));
            }
            else
            {
                appendBoxHeader(out, header.type, payload_size);
                size_t start = out.size();
                out.insert(out.end(), payload, payload + payload_size);

                if (TIMESTAMPED_BOXES.count(header.type) && !zeroTimestamps(out.data() + start, payload_size))
                {
                    error = "truncated '" + header.type + "' box";
                    return false;
                }

                if (header.type == "stco" || header.type == "co64")
                {
                    bool wide = header.type == "co64";
                    if (payload_size < 8)
                    {
                        error = "truncated chunk offset table";
                        return false;
                    }
                    uint32_t count = readBE32(payload + 4);
                    uint64_t needed = 8 + static_cast<uint64_t>(count) * (wide ? 8 : 4);
                    if (needed > payload_size)
                    {
                        error = "chunk offset table overruns its box";
                        return false;
                    }
                    tables.push_back({start + 8, count, wide});
                }
            }

            pos += header.size;
        }
        return true;
    }

    bool scanTopLevel(const ReadAt &read, uint64_t file_size, std::vector<TopLevelBox> &boxes, std::string &error)
    {
        uint64_t pos = 0;
        while (pos < file_size)
        {
            uint8_t raw[16];
            size_t available = static_cast<size_t>(std::min<uint64_t>(16, file_size - pos));
            if (!read(pos, raw, available))
            {
                error = "read failed at offset " + std::to_string(pos);
                return false;
            }

            TopLevelBox box;
            if (!parseBoxHeader(raw, available, file_size - pos, box.header))
            {
                error = "malformed top-level box at offset " + std::to_string(pos);
                return false;
            }
            box.header.offset = pos;
            box.is_mdat = box.header.type == "mdat";
            pos += box.header.size;
            boxes.push_back(std::move(box));
        }
        return true;
    }

    bool loadBox(const ReadAt &read, const BoxHeader &header, std::vector<uint8_t> &bytes, std::string &error)
    {
        if (header.size > MAX_IN_MEMORY_BOX)
        {
            error = "'" + header.type + "' box too large to rewrite (" + std::to_string(header.size) + " bytes)";
            return false;
        }
        bytes.resize(static_cast<size_t>(header.size));
        if (!read(header.offset, bytes.data(), bytes.size()))
        {
            error = "read failed for '" + header.type + "' box";
            return false;
        }
        return true;
    }

    StageResult stripIsoBmffStream(const ReadAt &read, const WriteAt &write, uint64_t file_size, uint64_t &new_size)
    {
        std::string error;
        std::vector<TopLevelBox> boxes;
        if (!scanTopLevel(read, file_size, boxes, error))
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, error);

        if (boxes.empty() || boxes.front().header.type != "ftyp")
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "ISO media file does not start with ftyp");

        std::vector<TopLevelBox> kept;
        int moov_count = 0;
        for (auto &box : boxes)
        {
            const std::string &type = box.header.type;
            if (FRAGMENT_BOXES.count(type))
                return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "fragmented ISO media ('" + type + "') is not rewritten");

            if (type != "ftyp" && type != "moov" && type != "mdat")
            {
                Logger::trace("Dropping top-level '" + type + "' box");
                continue;
            }

            if (!box.is_mdat)
            {
                std::vector<uint8_t> bytes;
                if (!loadBox(read, box.header, bytes, error))
                    return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, error);
                if (!rebuildChildren(bytes.data(), bytes.size(), 0, box.rebuilt, box.tables, error))
                    return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, error);
                if (type == "moov")
                    ++moov_count;
            }
            kept.push_back(std::move(box));
        }

        if (moov_count != 1)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "expected exactly one moov box, found " + std::to_string(moov_count));

        // Layout of the rewritten file
        uint64_t offset = 0;
        for (auto &box : kept)
        {
            box.new_offset = offset;
            if (box.is_mdat)
            {
                uint64_t payload = box.header.size - box.header.header_size;
                offset += canonicalHeaderSize(payload) + payload;
            }
            else
            {
                offset += box.rebuilt.size();
            }
        }
        new_size = offset;

        // Chunk offsets follow the media data they point into
        for (auto &box : kept)
        {
            for (const auto &table : box.tables)
            {
                size_t entry_size = table.wide ? 8 : 4;
                for (uint32_t i = 0; i < table.count; ++i)
                {
                    uint8_t *entry = box.rebuilt.data() + table.position + static_cast<size_t>(i) * entry_size;
                    uint64_t old_value = table.wide ? readBE64(entry) : readBE32(entry);

                    bool relocated = false;
                    for (const auto &media : kept)
                    {
                        if (!media.is_mdat)
                            continue;
                        uint64_t old_start = media.header.offset + media.header.header_size;
                        uint64_t payload = media.header.size - media.header.header_size;
                        if (old_value < old_start || old_value > old_start + payload)
                            continue;
                        uint64_t new_start = media.new_offset + canonicalHeaderSize(payload);
                        uint64_t new_value = old_value - old_start + new_start;
                        if (table.wide)
                            writeBE64(entry, new_value);
                        else if (new_value > 0xFFFFFFFFULL)
                            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "relocated chunk offset overflows stco");
                        else
                            writeBE32(entry, static_cast<uint32_t>(new_value));
                        relocated = true;
                        break;
                    }
                    if (!relocated)
                        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED,
                                                 "chunk offset " + std::to_string(old_value) + " points outside media data");
                }
            }
        }

        // Every box moves towards the start of the file, so a forward copy never
        // overwrites bytes that have not been read yet
        std::vector<uint8_t> buffer;
        for (const auto &box : kept)
        {
            if (!box.is_mdat)
            {
                if (!write(box.new_offset, box.rebuilt.data(), box.rebuilt.size()))
                    return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "write failed");
                continue;
            }

            uint64_t payload = box.header.size - box.header.header_size;
            std::vector<uint8_t> header;
            appendBoxHeader(header, "mdat", payload);
            if (!write(box.new_offset, header.data(), header.size()))
                return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "write failed");

            uint64_t src = box.header.offset + box.header.header_size;
            uint64_t dst = box.new_offset + header.size();
            buffer.resize(COPY_CHUNK);
            for (uint64_t done = 0; done < payload;)
            {
                size_t n = static_cast<size_t>(std::min<uint64_t>(COPY_CHUNK, payload - done));
                if (!read(src + done, buffer.data(), n) || !write(dst + done, buffer.data(), n))
                    return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "media data copy failed");
                done += n;
            }
        }

        return StageResult::ok();
    }

    bool verifyChildren(const uint8_t *data, uint64_t size, int depth, std::vector<uint64_t> &offsets,
                        std::string &error)
    {
        if (depth > MAX_BOX_DEPTH)
        {
            error = "box nesting too deep";
            return false;
        }

        uint64_t pos = 0;
        while (pos < size)
        {
            BoxHeader header;
            if (!parseBoxHeader(data + pos, static_cast<size_t>(std::min<uint64_t>(size - pos, 16)), size - pos, header))
            {
                error = "malformed box header";
                return false;
            }
            const uint8_t *payload = data + pos + header.header_size;
            uint64_t payload_size = header.size - header.header_size;

            if (REMOVED_BOXES.count(header.type))
            {
                error = "metadata box '" + header.type + "' still present";
                return false;
            }
            if (CONTAINER_BOXES.count(header.type))
            {
                if (!verifyChildren(payload, payload_size, depth + 1, offsets, error))
                    return false;
            }
            else if (TIMESTAMPED_BOXES.count(header.type) && !timestampsAreZero(payload, payload_size))
            {
                error = "'" + header.type + "' still carries timestamps";
                return false;
            }
            else if (header.type == "stco" || header.type == "co64")
            {
                bool wide = header.type == "co64";
                if (payload_size < 8)
                {
                    error = "truncated chunk offset table";
                    return false;
                }
                uint32_t count = readBE32(payload + 4);
                size_t entry = wide ? 8 : 4;
                if (8 + static_cast<uint64_t>(count) * entry > payload_size)
                {
                    error = "chunk offset table overruns its box";
                    return false;
                }
                for (uint32_t i = 0; i < count; ++i)
                {
                    const uint8_t *p = payload + 8 + static_cast<size_t>(i) * entry;
                    uint64_t value = wide ? readBE64(p) : readBE32(p);
                    offsets.push_back(value);
                }
            }
            pos += header.size;
        }
        return true;
    }

    StageResult verifyIsoBmffStream(const ReadAt &read, uint64_t file_size)
    {
        std::string error;
        std::vector<TopLevelBox> boxes;
        if (!scanTopLevel(read, file_size, boxes, error))
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, error);

        if (boxes.empty() || boxes.front().header.type != "ftyp")
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "ISO media file does not start with ftyp");

        std::vector<uint64_t> offsets;
        int moov_count = 0;
        for (const auto &box : boxes)
        {
            const std::string &type = box.header.type;
            if (type != "ftyp" && type != "moov" && type != "mdat")
                return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "unexpected top-level box '" + type + "'");
            if (type != "moov")
                continue;

            ++moov_count;
            std::vector<uint8_t> bytes;
            if (!loadBox(read, box.header, bytes, error) ||
                !verifyChildren(bytes.data() + box.header.header_size, bytes.size() - box.header.header_size, 1, offsets, error))
                return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, error);
        }
        if (moov_count != 1)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "expected exactly one moov box");

        for (uint64_t offset : offsets)
        {
            bool inside = false;
            for (const auto &box : boxes)
            {
                uint64_t start = box.header.offset + box.header.header_size;
                if (box.is_mdat && offset >= start && offset <= box.header.offset + box.header.size)
                {
                    inside = true;
                    break;
                }
            }
            if (!inside)
                return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "chunk offset points outside media data");
        }
        return StageResult::ok();
    }

    ReadAt bufferReader(const std::vector<uint8_t> &data)
    {
        return [&data](uint64_t offset, uint8_t *dst, size_t size)
        {
            if (offset + size > data.size())
                return false;
            std::memcpy(dst, data.data() + offset, size);
            return true;
        };
    }

    ReadAt descriptorReader(int fd)
    {
        return [fd](uint64_t offset, uint8_t *dst, size_t size)
        {
            size_t done = 0;
            while (done < size)
            {
                ssize_t n = pread(fd, dst + done, size - done, static_cast<off_t>(offset + done));
                if (n < 0 && errno == EINTR)
                    continue;
                if (n <= 0)
                    return false;
                done += static_cast<size_t>(n);
            }
            return true;
        };
    }

    WriteAt descriptorWriter(int fd)
    {
        return [fd](uint64_t offset, const uint8_t *src, size_t size)
        {
            size_t done = 0;
            while (done < size)
            {
                ssize_t n = pwrite(fd, src + done, size - done, static_cast<off_t>(offset + done));
                if (n < 0 && errno == EINTR)
                    continue;
                if (n <= 0)
                    return false;
                done += static_cast<size_t>(n);
            }
            return true;
        };
    }

    bool isJfif(const uint8_t *payload, size_t size)
    {
        return size >= 14 && std::memcmp(payload, "JFIF\0", 5) == 0;
    }

    // Markers whose segments carry image data or decoding tables
    bool isJpegStructuralMarker(uint8_t marker)
    {
        return (marker >= 0xC0 && marker <= 0xCF) || marker == 0xDB || marker == 0xDD || marker == 0xDA || marker == 0xDC;
    }
}

uint32_t MetadataStripper::crc32(const uint8_t *data, size_t size, uint32_t crc)
{
    static const std::array<uint32_t, 256> table = []
    {
        std::array<uint32_t, 256> t{};
        for (uint32_t n = 0; n < 256; ++n)
        {
            uint32_t c = n;
            for (int k = 0; k < 8; ++k)
                c = (c & 1) ? 0xEDB88320U ^ (c >> 1) : c >> 1;
            t[n] = c;
        }
        return t;
    }();

    crc = ~crc;
    for (size_t i = 0; i < size; ++i)
        crc = table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    return ~crc;
}

StripFormat MetadataStripper::formatForContainer(const std::string &container)
{
    if (container == "png")
        return StripFormat::PNG;
    if (container == "jpeg")
        return StripFormat::JPEG;
    if (container == "mp4" || container == "ipod" || container == "mov")
        return StripFormat::ISO_BMFF;
    return StripFormat::UNKNOWN;
}

StageResult MetadataStripper::stripPng(const std::vector<uint8_t> &in, std::vector<uint8_t> &out)
{
    static const uint8_t signature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (in.size() < 8 || std::memcmp(in.data(), signature, 8) != 0)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "missing PNG signature");

    out.assign(in.begin(), in.begin() + 8);
    size_t pos = 8;
    bool first = true;
    bool ended = false;

    while (pos < in.size())
    {
        if (in.size() - pos < 12)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "truncated PNG chunk header");

        uint32_t length = readBE32(in.data() + pos);
        if (length > 0x7FFFFFFFU || in.size() - pos - 12 < length)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "PNG chunk overruns file");

        std::string type(reinterpret_cast<const char *>(in.data() + pos + 4), 4);
        uint32_t stored_crc = readBE32(in.data() + pos + 8 + length);
        if (crc32(in.data() + pos + 4, 4 + length) != stored_crc)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "CRC mismatch in PNG chunk '" + type + "'");

        if (first && type != "IHDR")
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "PNG does not start with IHDR");
        first = false;

        if (PNG_KEPT_CHUNKS.count(type))
            out.insert(out.end(), in.begin() + pos, in.begin() + pos + 12 + length);
        else
            Logger::trace("Dropping PNG chunk '" + type + "'");

        pos += 12 + length;
        if (type == "IEND")
        {
            ended = true;
            break;
        }
    }

    if (!ended)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "PNG has no IEND chunk");
    if (pos < in.size())
        Logger::debug("Discarding " + std::to_string(in.size() - pos) + " bytes after PNG IEND");

    return StageResult::ok();
}

StageResult MetadataStripper::stripJpeg(const std::vector<uint8_t> &in, std::vector<uint8_t> &out)
{
    if (in.size() < 4 || in[0] != 0xFF || in[1] != 0xD8)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "missing JPEG SOI marker");

    out.clear();
    out.push_back(0xFF);
    out.push_back(0xD8);

    size_t pos = 2;
    bool jfif_written = false;

    while (pos + 1 < in.size())
    {
        if (in[pos] != 0xFF)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "expected JPEG marker at offset " + std::to_string(pos));
        while (pos + 1 < in.size() && in[pos + 1] == 0xFF)
            ++pos;
        if (pos + 1 >= in.size())
            break;

        uint8_t marker = in[pos + 1];
        pos += 2;

        if (marker == 0xD9)
        {
            out.push_back(0xFF);
            out.push_back(0xD9);
            if (pos < in.size())
                Logger::debug("Discarding " + std::to_string(in.size() - pos) + " bytes after JPEG EOI");
            return StageResult::ok();
        }
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7))
        {
            out.push_back(0xFF);
            out.push_back(marker);
            continue;
        }

        if (pos + 2 > in.size())
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "truncated JPEG segment");
        size_t length = (static_cast<size_t>(in[pos]) << 8) | in[pos + 1];
        if (length < 2 || pos + length > in.size())
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "JPEG segment overruns file");

        const uint8_t *payload = in.data() + pos + 2;
        size_t payload_size = length - 2;

        if (marker == 0xE0)
        {
            // Re-emit a minimal JFIF header without thumbnail
            if (!jfif_written && isJfif(payload, payload_size))
            {
                const uint8_t header[] = {0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00};
                out.insert(out.end(), header, header + sizeof(header));
                out.insert(out.end(), payload + 5, payload + 12);
                out.push_back(0x00);
                out.push_back(0x00);
                jfif_written = true;
            }
        }
        else if (isJpegStructuralMarker(marker))
        {
            out.push_back(0xFF);
            out.push_back(marker);
            out.insert(out.end(), in.begin() + pos, in.begin() + pos + length);
        }
        else
        {
            Logger::trace("Dropping JPEG segment with marker " + std::to_string(marker) + " (" + std::to_string(length) + " bytes)");
        }

        pos += length;

        if (marker == 0xDA)
        {
            // Entropy-coded data runs until the next non-RST marker
            size_t i = pos;
            while (i < in.size())
            {
                if (in[i] == 0xFF)
                {
                    if (i + 1 >= in.size())
                        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "truncated JPEG scan");
                    uint8_t next = in[i + 1];
                    if (next == 0x00 || (next >= 0xD0 && next <= 0xD7))
                    {
                        i += 2;
                        continue;
                    }
                    break;
                }
                ++i;
            }
            out.insert(out.end(), in.begin() + pos, in.begin() + i);
            pos = i;
        }
    }

    return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "JPEG has no EOI marker");
}

StageResult MetadataStripper::stripIsoBmff(const std::vector<uint8_t> &in, std::vector<uint8_t> &out)
{
    out.clear();
    WriteAt writer = [&out](uint64_t offset, const uint8_t *src, size_t size)
    {
        if (out.size() < offset + size)
            out.resize(static_cast<size_t>(offset + size));
        std::memcpy(out.data() + offset, src, size);
        return true;
    };

    uint64_t new_size = 0;
    StageResult result = stripIsoBmffStream(bufferReader(in), writer, in.size(), new_size);
    if (result.success)
        out.resize(static_cast<size_t>(new_size));
    return result;
}

StageResult MetadataStripper::strip(std::vector<uint8_t> &data, StripFormat format)
{
    std::vector<uint8_t> stripped;
    StageResult result;
    switch (format)
    {
    case StripFormat::PNG:
        result = stripPng(data, stripped);
        break;
    case StripFormat::JPEG:
        result = stripJpeg(data, stripped);
        break;
    case StripFormat::ISO_BMFF:
        result = stripIsoBmff(data, stripped);
        break;
    default:
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "no metadata stripper for this format");
    }

    if (!result.success)
        return result;

    StageResult verified = verify(stripped, format);
    if (!verified.success)
        return verified;

    data.swap(stripped);
    return StageResult::ok();
}

StageResult MetadataStripper::stripDescriptor(int fd, StripFormat format, uint64_t max_bytes)
{
    struct stat st;
    if (fstat(fd, &st) != 0)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "fstat failed: " + std::string(std::strerror(errno)));

    uint64_t file_size = static_cast<uint64_t>(st.st_size);
    if (file_size > max_bytes)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "output exceeds " + std::to_string(max_bytes) + " bytes");

    if (format == StripFormat::ISO_BMFF)
    {
        // Media data is moved in place instead of being loaded
        uint64_t new_size = 0;
        StageResult result = stripIsoBmffStream(descriptorReader(fd), descriptorWriter(fd), file_size, new_size);
        if (!result.success)
            return result;
        if (ftruncate(fd, static_cast<off_t>(new_size)) != 0)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "ftruncate failed: " + std::string(std::strerror(errno)));
        return verifyIsoBmffStream(descriptorReader(fd), new_size);
    }

    std::vector<uint8_t> data(static_cast<size_t>(file_size));
    if (!descriptorReader(fd)(0, data.data(), data.size()))
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "could not read encoded output");

    StageResult result = strip(data, format);
    if (!result.success)
        return result;

    if (!descriptorWriter(fd)(0, data.data(), data.size()))
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "could not write stripped output");
    if (ftruncate(fd, static_cast<off_t>(data.size())) != 0)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "ftruncate failed: " + std::string(std::strerror(errno)));

    return StageResult::ok();
}

StageResult MetadataStripper::verify(const std::vector<uint8_t> &data, StripFormat format)
{
    switch (format)
    {
    case StripFormat::PNG:
        return verifyPng(data);
    case StripFormat::JPEG:
        return verifyJpeg(data);
    case StripFormat::ISO_BMFF:
        return verifyIsoBmff(data);
    default:
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "no verifier for this format");
    }
}

StageResult MetadataStripper::verifyPng(const std::vector<uint8_t> &data)
{
    if (data.size() < 8)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "PNG too short");

    size_t pos = 8;
    while (pos + 12 <= data.size())
    {
        uint32_t length = readBE32(data.data() + pos);
        if (data.size() - pos - 12 < length)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "PNG chunk overruns file");
        std::string type(reinterpret_cast<const char *>(data.data() + pos + 4), 4);
        if (!PNG_KEPT_CHUNKS.count(type))
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "ancillary PNG chunk '" + type + "' still present");
        pos += 12 + length;
        if (type == "IEND")
            break;
    }

    if (pos != data.size())
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "PNG does not end at IEND");
    return StageResult::ok();
}

StageResult MetadataStripper::verifyJpeg(const std::vector<uint8_t> &data)
{
    std::vector<uint8_t> again;
    StageResult result = stripJpeg(data, again);
    if (!result.success)
        return result;
    if (again != data)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED, "JPEG still carries removable segments");
    return StageResult::ok();
}

StageResult MetadataStripper::verifyIsoBmff(const std::vector<uint8_t> &data)
{
    return verifyIsoBmffStream(bufferReader(data), data.size());
}
