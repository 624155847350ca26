#include "core/container_inspector.hpp"
#include "core/file_utils.hpp"
#include <cctype>
#include <cstring>
#include <fstream>

namespace
{
    const uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    // Identifiers include their trailing NUL
    const char EXIF_ID[] = "Exif\0";
    const char XMP_ID[] = "http://ns.adobe.com/xap/1.0/";
    const char XMP_EXT_ID[] = "http://ns.adobe.com/xmp/extension/";
    const char ICC_ID[] = "ICC_PROFILE";
    const char PHOTOSHOP_ID[] = "Photoshop 3.0";
    const char PNG_XMP_KEYWORD[] = "XML:com.adobe.xmp";

    bool matches(const std::vector<uint8_t> &bytes, size_t offset, size_t limit,
                 const void *signature, size_t length)
    {
        if (offset > limit || limit - offset < length || limit > bytes.size())
            return false;
        return std::memcmp(bytes.data() + offset, signature, length) == 0;
    }

    uint16_t readU16BE(const std::vector<uint8_t> &bytes, size_t pos)
    {
        return static_cast<uint16_t>((bytes[pos] << 8) | bytes[pos + 1]);
    }

    uint32_t readU32BE(const std::vector<uint8_t> &bytes, size_t pos)
    {
        return (static_cast<uint32_t>(bytes[pos]) << 24) | (static_cast<uint32_t>(bytes[pos + 1]) << 16) |
               (static_cast<uint32_t>(bytes[pos + 2]) << 8) | static_cast<uint32_t>(bytes[pos + 3]);
    }

    uint32_t readU32LE(const std::vector<uint8_t> &bytes, size_t pos)
    {
        return static_cast<uint32_t>(bytes[pos]) | (static_cast<uint32_t>(bytes[pos + 1]) << 8) |
               (static_cast<uint32_t>(bytes[pos + 2]) << 16) | (static_cast<uint32_t>(bytes[pos + 3]) << 24);
    }

    std::string fourcc(const std::vector<uint8_t> &bytes, size_t pos)
    {
        return std::string(reinterpret_cast<const char *>(bytes.data() + pos), 4);
    }

    std::string jpegMarkerName(uint8_t marker)
    {
        if (marker == 0xFE)
            return "COM";
        return "APP" + std::to_string(marker - 0xE0);
    }
}

ImageFormat ContainerInspector::detectFormat(const std::vector<uint8_t> &bytes)
{
    const size_t size = bytes.size();
    if (matches(bytes, 0, size, "\xFF\xD8\xFF", 3))
        return ImageFormat::JPEG;
    if (matches(bytes, 0, size, PNG_SIGNATURE, sizeof(PNG_SIGNATURE)))
        return ImageFormat::PNG;
    if (matches(bytes, 0, size, "RIFF", 4) && matches(bytes, 8, size, "WEBP", 4))
        return ImageFormat::WEBP;
    if (matches(bytes, 0, size, "BM", 2))
        return ImageFormat::BMP;
    if (matches(bytes, 0, size, "II*\0", 4) || matches(bytes, 0, size, "MM\0*", 4))
        return ImageFormat::TIFF;
    if (matches(bytes, 0, size, "\x59\xA6\x6A\x95", 4))
        return ImageFormat::SUN_RASTER;
    if (size >= 3 && bytes[0] == 'P' && std::isspace(bytes[2]))
    {
        if (bytes[1] == '3' || bytes[1] == '6')
            return ImageFormat::PPM;
        if (bytes[1] == '2' || bytes[1] == '5')
            return ImageFormat::PGM;
    }
    return ImageFormat::UNKNOWN;
}

std::optional<ImageFormat> ContainerInspector::detectFileFormat(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    std::vector<uint8_t> header(16);
    file.read(reinterpret_cast<char *>(header.data()), static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(file.gcount()));
    return detectFormat(header);
}

std::vector<MetadataBlock> ContainerInspector::findMetadataBlocks(const std::vector<uint8_t> &bytes)
{
    std::vector<MetadataBlock> blocks;
    switch (detectFormat(bytes))
    {
    case ImageFormat::JPEG:
        scanJpeg(bytes, blocks);
        break;
    case ImageFormat::PNG:
        scanPng(bytes, blocks);
        break;
    case ImageFormat::WEBP:
        scanWebp(bytes, blocks);
        break;
    default:
        break;
    }
    return blocks;
}

bool ContainerInspector::isComplete(const std::vector<uint8_t> &bytes)
{
    const size_t size = bytes.size();
    switch (detectFormat(bytes))
    {
    case ImageFormat::JPEG:
    {
        size_t pos = 2;
        while (pos + 4 <= size && bytes[pos] == 0xFF)
        {
            const uint8_t marker = bytes[pos + 1];
            if (marker == 0xFF)
            {
                ++pos;
                continue;
            }
            if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8))
            {
                pos += 2;
                continue;
            }
            if (marker == 0xD9)
                return false; // EOI before any scan
            if (marker == 0xDA)
            {
                // An embedded thumbnail has its own EOI, so only look past the main scan
                for (size_t i = size - 1; i > pos + 1; --i)
                {
                    if (bytes[i] == 0xD9 && bytes[i - 1] == 0xFF)
                        return true;
                }
                return false;
            }
            pos += 2 + readU16BE(bytes, pos + 2);
        }
        return false;
    }
    case ImageFormat::PNG:
    {
        size_t pos = sizeof(PNG_SIGNATURE);
        while (pos + 12 <= size)
        {
            const uint32_t length = readU32BE(bytes, pos);
            if (length > size - pos - 12)
                return false;
            if (fourcc(bytes, pos + 4) == "IEND")
                return true;
            pos += 12 + static_cast<size_t>(length);
        }
        return false;
    }
    case ImageFormat::WEBP:
        return size >= 12 && static_cast<uint64_t>(readU32LE(bytes, 4)) + 8 <= size;
    default:
        return true;
    }
}

std::optional<std::vector<MetadataBlock>> ContainerInspector::inspectFile(const std::string &file_path)
{
    auto bytes = FileUtils::readFileBytes(file_path);
    if (!bytes)
        return std::nullopt;
    return findMetadataBlocks(*bytes);
}

void ContainerInspector::scanJpeg(const std::vector<uint8_t> &bytes, std::vector<MetadataBlock> &out)
{
    const size_t size = bytes.size();
    size_t pos = 2; // past SOI

    while (pos + 4 <= size)
    {
        if (bytes[pos] != 0xFF)
            break;

        const uint8_t marker = bytes[pos + 1];
        if (marker == 0xFF)
        {
            ++pos; // fill byte
            continue;
        }
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8))
        {
            pos += 2; // standalone markers carry no length
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA)
            break; // entropy-coded data follows, no more header segments

        const uint16_t length = readU16BE(bytes, pos + 2);
        if (length < 2 || pos + 2 + length > size)
            break;

        const size_t payload = pos + 4;
        const size_t end = pos + 2 + length;
        const size_t segment_size = 2 + static_cast<size_t>(length);

        if (marker == 0xE1)
        {
            if (matches(bytes, payload, end, EXIF_ID, sizeof(EXIF_ID)))
                out.push_back({MetadataKind::EXIF, pos, segment_size, jpegMarkerName(marker)});
            else if (matches(bytes, payload, end, XMP_ID, sizeof(XMP_ID)) ||
                     matches(bytes, payload, end, XMP_EXT_ID, sizeof(XMP_EXT_ID)))
                out.push_back({MetadataKind::XMP, pos, segment_size, jpegMarkerName(marker)});
        }
        else if (marker == 0xE2 && matches(bytes, payload, end, ICC_ID, sizeof(ICC_ID)))
        {
            out.push_back({MetadataKind::ICC, pos, segment_size, jpegMarkerName(marker)});
        }
        else if (marker == 0xED && matches(bytes, payload, end, PHOTOSHOP_ID, sizeof(PHOTOSHOP_ID)))
        {
            out.push_back({MetadataKind::IPTC, pos, segment_size, jpegMarkerName(marker)});
        }
        else if (marker == 0xFE)
        {
            out.push_back({MetadataKind::COMMENT, pos, segment_size, jpegMarkerName(marker)});
        }

        pos = end;
    }
}

void ContainerInspector::scanPng(const std::vector<uint8_t> &bytes, std::vector<MetadataBlock> &out)
{
    const size_t size = bytes.size();
    size_t pos = sizeof(PNG_SIGNATURE);

    while (pos + 12 <= size)
    {
        const uint32_t length = readU32BE(bytes, pos);
        if (length > size - pos - 12)
            break;

        const std::string type = fourcc(bytes, pos + 4);
        const size_t data = pos + 8;
        const size_t end = data + length;
        const size_t chunk_size = 12 + static_cast<size_t>(length);

        if (type == "eXIf")
        {
            out.push_back({MetadataKind::EXIF, pos, chunk_size, type});
        }
        else if (type == "iCCP")
        {
            out.push_back({MetadataKind::ICC, pos, chunk_size, type});
        }
        else if (type == "iTXt")
        {
            const bool is_xmp = matches(bytes, data, end, PNG_XMP_KEYWORD, sizeof(PNG_XMP_KEYWORD));
            out.push_back({is_xmp ? MetadataKind::XMP : MetadataKind::TEXT, pos, chunk_size, type});
        }
        else if (type == "tEXt" || type == "zTXt")
        {
            // ImageMagick stores raw EXIF/IPTC as hex text under these keywords
            MetadataKind kind = MetadataKind::TEXT;
            if (matches(bytes, data, end, "Raw profile type exif", 21))
                kind = MetadataKind::EXIF;
            else if (matches(bytes, data, end, "Raw profile type iptc", 21))
                kind = MetadataKind::IPTC;
            out.push_back({kind, pos, chunk_size, type});
        }
        else if (type == "tIME")
        {
            out.push_back({MetadataKind::TEXT, pos, chunk_size, type});
        }
        else if (type == "IEND")
        {
            break;
        }

        pos = end + 4; // skip CRC
    }
}

void ContainerInspector::scanWebp(const std::vector<uint8_t> &bytes, std::vector<MetadataBlock> &out)
{
    const size_t size = bytes.size();
    size_t pos = 12; // past "RIFF" <size> "WEBP"

    while (pos + 8 <= size)
    {
        const std::string type = fourcc(bytes, pos);
        const uint32_t length = readU32LE(bytes, pos + 4);
        if (length > size - pos - 8)
            break;

        const size_t chunk_size = 8 + static_cast<size_t>(length);
        if (type == "EXIF")
            out.push_back({MetadataKind::EXIF, pos, chunk_size, type});
        else if (type == "XMP ")
            out.push_back({MetadataKind::XMP, pos, chunk_size, type});
        else if (type == "ICCP")
            out.push_back({MetadataKind::ICC, pos, chunk_size, type});

        pos += chunk_size + (length & 1); // chunks are padded to even size
    }
}

std::string ContainerInspector::formatName(ImageFormat format)
{
    switch (format)
    {
    case ImageFormat::JPEG:
        return "JPEG";
    case ImageFormat::PNG:
        return "PNG";
    case ImageFormat::WEBP:
        return "WEBP";
    case ImageFormat::BMP:
        return "BMP";
    case ImageFormat::TIFF:
        return "TIFF";
    case ImageFormat::PPM:
        return "PPM";
    case ImageFormat::PGM:
        return "PGM";
    case ImageFormat::SUN_RASTER:
        return "SUN_RASTER";
    case ImageFormat::UNKNOWN:
        break;
    }
    return "UNKNOWN";
}

std::string ContainerInspector::kindName(MetadataKind kind)
{
    switch (kind)
    {
    case MetadataKind::EXIF:
        return "EXIF";
    case MetadataKind::XMP:
        return "XMP";
    case MetadataKind::ICC:
        return "ICC";
    case MetadataKind::IPTC:
        return "IPTC";
    case MetadataKind::COMMENT:
        return "COMMENT";
    case MetadataKind::TEXT:
        return "TEXT";
    }
    return "TEXT";
}

std::string ContainerInspector::encoderExtension(ImageFormat format)
{
    switch (format)
    {
    case ImageFormat::JPEG:
        return ".jpg";
    case ImageFormat::PNG:
        return ".png";
    case ImageFormat::WEBP:
        return ".webp";
    case ImageFormat::BMP:
        return ".bmp";
    case ImageFormat::TIFF:
        return ".tiff";
    case ImageFormat::PPM:
        return ".ppm";
    case ImageFormat::PGM:
        return ".pgm";
    case ImageFormat::SUN_RASTER:
        return ".sr";
    case ImageFormat::UNKNOWN:
        break;
    }
    return "";
}
