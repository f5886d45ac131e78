#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/sanitization_types.hpp"

/**
 * @brief Classification outcome for one input
 */
struct ClassificationResult
{
    bool success;
    FailureKind failure_kind;
    std::string error_message;
    MediaRecord record;

    ClassificationResult() : success(false), failure_kind(FailureKind::UNSUPPORTED_FORMAT) {}
};

/**
 * @brief Content signature entry of the classifier lookup table
 */
struct MediaSignature
{
    std::string name;      // Human readable format name
    MediaKind kind;        // Media kind the signature implies
    std::string container; // Container/codec hint stored in the MediaRecord
    std::string backend;   // FFmpeg demuxer name, "opencv" or "libraw"
    std::function<bool(const uint8_t *, size_t)> matches;
};

/**
 * @brief Determines the media kind of a file from its leading bytes
 *
 * Only the bytes are inspected; the file name never influences the result.
 * Classification is a pure function of the prefix.
 */
class TypeClassifier
{
public:
    static constexpr size_t PREFIX_BYTES = 4096;
    static constexpr size_t MIN_SIGNATURE_BYTES = 12;

    /**
     * @brief Classify a byte prefix
     * @param data First bytes of the file
     * @param size Number of bytes available in data
     * @param total_size Size of the whole file in bytes
     * @return ClassificationResult with a populated MediaRecord on success,
     *         TRUNCATED when fewer than MIN_SIGNATURE_BYTES are available,
     *         UNSUPPORTED_FORMAT when no signature matches
     */
    static ClassificationResult classify(const uint8_t *data, size_t size, uint64_t total_size);

    /**
     * @brief Read the prefix of an already opened descriptor and classify it
     * @param fd Readable descriptor positioned anywhere; it is read with pread
     */
    static ClassificationResult classifyDescriptor(int fd);

    /**
     * @brief Open a file without following symlinks and classify it
     * @param file_path Path to the file
     */
    static ClassificationResult classifyFile(const std::string &file_path);

    /**
     * @brief Extract pixel dimensions from an image header
     *
     * Covers png, gif, bmp, jpeg (first SOFn), webp, tiff (first IFD) and
     * jp2 (ihdr box or SIZ marker).
     * @param container Container hint produced by classify()
     * @return true when width and height were found
     */
    static bool readImageDimensions(const uint8_t *data, size_t size, const std::string &container,
                                    int &width, int &height);

    /**
     * @brief Signature table in match order (specific before generic)
     */
    static const std::vector<MediaSignature> &getSignatures();
};
