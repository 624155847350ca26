#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/artifact_store.hpp"
#include "core/image_codec.hpp"
#include "core/scrub_result.hpp"

/**
 * @brief Strips all ancillary metadata from an image by re-encoding its pixels
 *
 * scrub() validates the input, decodes it, rebuilds a pixel-only image,
 * encodes it in the input's container format into a temp file beside the
 * output and renames that file onto the output path. Every outcome,
 * including failures, is returned as a ScrubResult; nothing is thrown.
 *
 * Instances hold no per-call state, so one instance can serve concurrent
 * calls.
 */
class ImageScrubber
{
public:
    explicit ImageScrubber(std::shared_ptr<ArtifactStore> store = nullptr);

    ScrubResult scrub(const std::filesystem::path &input_path,
                      const std::filesystem::path &output_path) const;

    /**
     * @brief Extension gate: true for .jpg, .jpeg, .png, .webp in any case
     */
    static bool canHandle(const std::filesystem::path &path);

    static const std::vector<std::string> &getSupportedExtensions();

private:
    ScrubResult transform(const std::filesystem::path &input_path,
                          const std::filesystem::path &output_path,
                          const std::filesystem::path &output_dir) const;

    static ScrubResult reject(const std::filesystem::path &input_path, ErrorCategory category,
                              const std::string &error, const std::string &fix_hint);
    static ScrubResult outputFailure(const std::filesystem::path &input_path, const IoStatus &status);
    static ScrubResult decodeFailure(const std::filesystem::path &input_path, const DecodeOutcome &outcome);
    static ScrubResult processingFailure(const std::filesystem::path &input_path,
                                         const std::string &error_type, const std::string &message);

    std::shared_ptr<ArtifactStore> store_;
};
