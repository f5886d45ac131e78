#ifndef MEDIA_RECONSTRUCTOR_HPP
#define MEDIA_RECONSTRUCTOR_HPP

#include "core/sanitization_types.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Everything a reconstructor may touch for one job
 *
 * Only the two descriptors are available; the worker has no path access.
 */
struct ReconstructionContext
{
    int input_fd;
    int output_fd;
    MediaRecord record;
    ReconstructionPlan plan;
    uint64_t max_output_bytes;
    std::vector<std::string> warnings; // Non-fatal observations for the processing log

    ReconstructionContext() : input_fd(-1), output_fd(-1), max_output_bytes(0) {}
};

/**
 * @brief Rebuilds one media kind from decoded primitives
 *
 * One implementation per media kind, selected once from the classifier's
 * kind. reconstruct() decodes the input and encodes the target into the
 * output descriptor; strip() then removes whatever metadata the encoder or
 * muxer introduced.
 */
class MediaReconstructor
{
public:
    virtual ~MediaReconstructor() = default;

    virtual MediaKind getKind() const = 0;
    virtual std::string getName() const = 0;

    /**
     * @brief Decode the input strictly as data and encode the plan's target
     * @return DecodeError, EncodeError or ResourceExceeded on failure
     */
    virtual StageResult reconstruct(ReconstructionContext &context) = 0;

    /**
     * @brief Strip the encoded output in place
     * @return MetadataStripFailed when the output cannot be proven clean
     */
    virtual StageResult strip(ReconstructionContext &context);

    /**
     * @brief Run reconstruct() then strip(), converting library exceptions to failures
     */
    StageResult run(ReconstructionContext &context);

    /**
     * @brief Reconstructor for a media kind
     * @return nullptr for MediaKind::UNKNOWN
     */
    static std::unique_ptr<MediaReconstructor> create(MediaKind kind);
};

#endif // MEDIA_RECONSTRUCTOR_HPP
