#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/container_inspector.hpp"

/**
 * @brief Decoded pixel buffer with its colour mode and source container
 *
 * Lives for the duration of one scrub call only.
 */
struct DecodedImage
{
    cv::Mat pixels;                           // Channel order as OpenCV decodes it (BGR/BGRA)
    std::string mode;                         // "L", "LA", "RGB", "RGBA", with ";16" for 16-bit
    ImageFormat format = ImageFormat::UNKNOWN; // Container detected from the file signature

    int width() const { return pixels.cols; }
    int height() const { return pixels.rows; }
};

enum class DecodeStatus
{
    OK,
    UNIDENTIFIED,   // No decoder recognises the data
    CORRUPT,        // Recognised container, but truncated or undecodable
    UNKNOWN_FORMAT, // Decoded, but the container could not be named
    READ_FAILED,    // Input bytes could not be read
    FAILED          // Decoder raised an unexpected error
};

struct DecodeOutcome
{
    DecodeStatus status = DecodeStatus::FAILED;
    DecodedImage image;
    std::string error_type; // Exception type name for FAILED/READ_FAILED
    std::string message;

    bool ok() const { return status == DecodeStatus::OK; }
};

struct EncodeOutcome
{
    bool success = false;
    std::vector<uint8_t> data;
    std::string error_type;
    std::string message;
};

/**
 * @brief OpenCV imgcodecs wrapper for pixel-only decode and re-encode
 *
 * Decoding uses IMREAD_UNCHANGED so bit depth and alpha survive and EXIF
 * orientation is not applied to the pixels. Nothing but the pixel matrix is
 * carried from decode to encode.
 */
class ImageCodec
{
public:
    static constexpr int JPEG_QUALITY = 95;
    static constexpr int WEBP_QUALITY = 95;
    static constexpr int PNG_COMPRESSION = 9;

    static DecodeOutcome decode(const std::string &file_path);
    static DecodeOutcome decode(const std::vector<uint8_t> &bytes);

    /**
     * @brief Copy mode, dimensions and pixel values into a freshly allocated image
     */
    static DecodedImage rebuildFromPixels(const DecodedImage &source);

    /**
     * @brief Encode an image in its own container format
     */
    static EncodeOutcome encode(const DecodedImage &image);

    /**
     * @brief imencode parameters for a container format
     *
     * JPEG: quality 95 with optimised Huffman tables. PNG: maximum zlib
     * effort. WEBP: quality 95. Anything else: encoder defaults.
     */
    static std::vector<int> encodeParameters(ImageFormat format);

    static std::string describeMode(const cv::Mat &pixels);

    // Demangled dynamic type of an exception, e.g. "std::bad_alloc"
    static std::string exceptionTypeName(const std::exception &e);
};
