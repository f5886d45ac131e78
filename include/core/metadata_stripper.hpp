#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/sanitization_types.hpp"

/**
 * @brief Byte formats the stripper understands
 */
enum class StripFormat
{
    PNG,
    JPEG,
    ISO_BMFF,
    UNKNOWN
};

/**
 * @brief Removes every metadata structure from a freshly encoded output
 *
 * Works on the final bytes, after the encoder and muxer, so metadata an encoder
 * re-introduces is removed as well. Stripping is idempotent and fails closed:
 * anything it cannot parse is reported as METADATA_STRIP_FAILED.
 */
class MetadataStripper
{
public:
    /**
     * @brief Map a plan container name ("png", "jpeg", "mp4", "ipod") to a strip format
     */
    static StripFormat formatForContainer(const std::string &container);

    /**
     * @brief Strip a buffer in place and verify the result
     * @param data Encoded file bytes, replaced by the stripped bytes on success
     * @param format Byte format of data
     * @return StageResult, METADATA_STRIP_FAILED on any parse or verify error
     */
    static StageResult strip(std::vector<uint8_t> &data, StripFormat format);

    /**
     * @brief Strip a file through an open read-write descriptor
     *
     * The descriptor contents are replaced and truncated to the stripped size.
     */
    static StageResult stripDescriptor(int fd, StripFormat format, uint64_t max_bytes);

    /**
     * @brief Check that a buffer carries no forbidden structure
     */
    static StageResult verify(const std::vector<uint8_t> &data, StripFormat format);

    static StageResult stripPng(const std::vector<uint8_t> &in, std::vector<uint8_t> &out);
    static StageResult stripJpeg(const std::vector<uint8_t> &in, std::vector<uint8_t> &out);
    static StageResult stripIsoBmff(const std::vector<uint8_t> &in, std::vector<uint8_t> &out);

    /**
     * @brief CRC-32 as used by PNG chunks (ISO 3309)
     */
    static uint32_t crc32(const uint8_t *data, size_t size, uint32_t crc = 0);

private:
    static StageResult verifyPng(const std::vector<uint8_t> &data);
    static StageResult verifyJpeg(const std::vector<uint8_t> &data);
    static StageResult verifyIsoBmff(const std::vector<uint8_t> &data);
};
