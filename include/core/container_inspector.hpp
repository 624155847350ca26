#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Image container formats recognised from their file signature
 *
 * JPEG, PNG and WEBP are the supported scrub formats. The others are
 * recognised so that a decodable file in one of them is still re-encoded in
 * its own container. PBM and PAM stay UNKNOWN.
 */
enum class ImageFormat
{
    UNKNOWN,
    JPEG,
    PNG,
    WEBP,
    BMP,
    TIFF,
    PPM,
    PGM,
    SUN_RASTER
};

/**
 * @brief Kind of ancillary metadata carried by a container block
 */
enum class MetadataKind
{
    EXIF,
    XMP,
    ICC,
    IPTC,
    COMMENT,
    TEXT
};

/**
 * @brief One metadata-bearing block inside an image container
 */
struct MetadataBlock
{
    MetadataKind kind;
    size_t offset; // Offset of the enclosing segment/chunk
    size_t size;   // Size of the enclosing segment/chunk including headers
    std::string label; // Marker or chunk name, e.g. "APP1", "eXIf", "XMP "
};

/**
 * @brief Signature sniffing and metadata block enumeration
 *
 * Walks JPEG segments, PNG chunks and RIFF/WEBP chunks without decoding any
 * pixel data. Malformed structure ends the walk; blocks found up to that
 * point are still returned.
 */
class ContainerInspector
{
public:
    static ImageFormat detectFormat(const std::vector<uint8_t> &bytes);

    /**
     * @brief Detect the container format from the first bytes of a file
     * @return std::nullopt if the file cannot be opened
     */
    static std::optional<ImageFormat> detectFileFormat(const std::string &file_path);

    static std::vector<MetadataBlock> findMetadataBlocks(const std::vector<uint8_t> &bytes);

    /**
     * @brief Check that the container is not cut short
     *
     * JPEG needs an EOI marker after the first SOS, PNG needs its IEND chunk
     * and WEBP needs the whole RIFF payload. Other formats are not checked.
     */
    static bool isComplete(const std::vector<uint8_t> &bytes);

    /**
     * @brief Read a whole file and enumerate its metadata blocks
     * @return std::nullopt if the file cannot be read
     */
    static std::optional<std::vector<MetadataBlock>> inspectFile(const std::string &file_path);

    static std::string formatName(ImageFormat format);
    static std::string kindName(MetadataKind kind);

    /**
     * @brief Extension handed to the encoder for a format (".jpg", ".png", ...)
     * @return Empty string for UNKNOWN
     */
    static std::string encoderExtension(ImageFormat format);

private:
    static void scanJpeg(const std::vector<uint8_t> &bytes, std::vector<MetadataBlock> &out);
    static void scanPng(const std::vector<uint8_t> &bytes, std::vector<MetadataBlock> &out);
    static void scanWebp(const std::vector<uint8_t> &bytes, std::vector<MetadataBlock> &out);
};
