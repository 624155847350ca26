#include "core/image_scrubber.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <utility>

namespace
{
    const std::vector<std::string> SUPPORTED_EXTENSIONS = {".jpg", ".jpeg", ".png", ".webp"};

    std::string supportedFormatsHint()
    {
        std::string hint = "Supported formats: ";
        for (size_t i = 0; i < SUPPORTED_EXTENSIONS.size(); ++i)
        {
            if (i > 0)
                hint += ", ";
            hint += SUPPORTED_EXTENSIONS[i];
        }
        return hint;
    }
}

ImageScrubber::ImageScrubber(std::shared_ptr<ArtifactStore> store)
    : store_(store ? std::move(store) : std::make_shared<PosixArtifactStore>())
{
}

bool ImageScrubber::canHandle(const std::filesystem::path &path)
{
    const std::string extension = FileUtils::getFileExtension(path.string());
    return std::find(SUPPORTED_EXTENSIONS.begin(), SUPPORTED_EXTENSIONS.end(), extension) !=
           SUPPORTED_EXTENSIONS.end();
}

const std::vector<std::string> &ImageScrubber::getSupportedExtensions()
{
    return SUPPORTED_EXTENSIONS;
}

ScrubResult ImageScrubber::scrub(const std::filesystem::path &input_path,
                                 const std::filesystem::path &output_path) const
{
    try
    {
        // ---- input validation ----
        if (!FileUtils::exists(input_path.string()))
        {
            return reject(input_path, ErrorCategory::INPUT_ERROR,
                          "File not found", "Verify the input file path");
        }

        if (!canHandle(input_path))
        {
            return reject(input_path, ErrorCategory::INPUT_ERROR,
                          "Unsupported image format", supportedFormatsHint());
        }

        if (!FileUtils::isReadable(input_path.string()))
        {
            return reject(input_path, ErrorCategory::PERMISSION_ERROR,
                          "Cannot read input file", "Check file permissions");
        }

        // ---- output directory ----
        const std::filesystem::path output_dir =
            output_path.has_parent_path() ? output_path.parent_path() : std::filesystem::path(".");

        std::error_code ec;
        if (!FileUtils::ensureDirectory(output_dir.string(), ec) ||
            !FileUtils::isWritableDirectory(output_dir.string()))
        {
            return reject(input_path, ErrorCategory::PERMISSION_ERROR,
                          "Cannot write to output directory", "Choose a writable output location");
        }

        return transform(input_path, output_path, output_dir);
    }
    catch (const std::exception &e)
    {
        Logger::error("Unexpected failure while scrubbing " + input_path.string() + ": " + e.what());
        return processingFailure(input_path, ImageCodec::exceptionTypeName(e), e.what());
    }
}

ScrubResult ImageScrubber::transform(const std::filesystem::path &input_path,
                                     const std::filesystem::path &output_path,
                                     const std::filesystem::path &output_dir) const
{
    // Staged beside the output so the final rename never crosses a filesystem
    TempArtifact temp(*store_);
    IoStatus io = temp.create(output_dir, output_path.extension().string());
    if (!io.ok())
        return outputFailure(input_path, io);

    DecodeOutcome decoded = ImageCodec::decode(input_path.string());
    if (!decoded.ok())
        return decodeFailure(input_path, decoded);

    // Pixel-only copy: nothing from the source container survives
    DecodedImage clean = ImageCodec::rebuildFromPixels(decoded.image);
    decoded.image.pixels.release();

    EncodeOutcome encoded = ImageCodec::encode(clean);
    if (!encoded.success)
        return processingFailure(input_path, encoded.error_type, encoded.message);

    io = temp.write(encoded.data);
    if (!io.ok())
        return outputFailure(input_path, io);

    io = temp.commitTo(output_path);
    if (!io.ok())
        return outputFailure(input_path, io);

    Logger::info("Scrubbed " + input_path.string() + " -> " + output_path.string() + " (" +
                 ContainerInspector::formatName(clean.format) + " " + std::to_string(clean.width()) + "x" +
                 std::to_string(clean.height()) + ", " + std::to_string(encoded.data.size()) + " bytes)");

    return ScrubResult::success(input_path, output_path);
}

ScrubResult ImageScrubber::reject(const std::filesystem::path &input_path, ErrorCategory category,
                                  const std::string &error, const std::string &fix_hint)
{
    Logger::warn("Rejected " + input_path.string() + ": " + error + " [" + toString(category) + "]");
    return ScrubResult::failure(input_path, category, error, fix_hint);
}

ScrubResult ImageScrubber::outputFailure(const std::filesystem::path &input_path, const IoStatus &status)
{
    std::string error;
    std::string hint;
    switch (status.error_code)
    {
    case ENOSPC:
        error = "No space left on device";
        hint = "Free disk space";
        break;
    case EROFS:
        error = "Filesystem is read-only";
        hint = "Choose a writable output directory";
        break;
    default:
        error = "I/O error: " + status.message;
        hint = "Check disk health and permissions";
        break;
    }

    Logger::error("Output failure during " + status.operation + " for " + input_path.string() + ": " +
                  status.message);
    return ScrubResult::failure(input_path, ErrorCategory::OUTPUT_ERROR, error, hint);
}

ScrubResult ImageScrubber::decodeFailure(const std::filesystem::path &input_path, const DecodeOutcome &outcome)
{
    switch (outcome.status)
    {
    case DecodeStatus::UNIDENTIFIED:
    case DecodeStatus::CORRUPT:
        Logger::warn("Invalid image " + input_path.string() + ": " + outcome.message);
        return ScrubResult::failure(input_path, ErrorCategory::INPUT_ERROR,
                                    "Invalid or corrupted image file", "Upload a valid JPG, PNG, or WebP image");
    case DecodeStatus::UNKNOWN_FORMAT:
        Logger::error("Decoded " + input_path.string() + " but could not name its container");
        return ScrubResult::failure(input_path, ErrorCategory::PROCESSING_ERROR,
                                    "Unknown image format", "Image may be corrupted or malformed");
    default:
        return processingFailure(input_path, outcome.error_type, outcome.message);
    }
}

ScrubResult ImageScrubber::processingFailure(const std::filesystem::path &input_path,
                                             const std::string &error_type, const std::string &message)
{
    Logger::error("Processing failed for " + input_path.string() + ": " + error_type + ": " + message);
    return ScrubResult::failure(input_path, ErrorCategory::PROCESSING_ERROR,
                                "Processing failed: " + error_type + ": " + message,
                                "Image may be corrupted or malformed");
}
