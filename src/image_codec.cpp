#include "core/image_codec.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cxxabi.h>
#include <cstdlib>
#include <typeinfo>
#include <opencv2/imgcodecs.hpp>

DecodeOutcome ImageCodec::decode(const std::string &file_path)
{
    auto bytes = FileUtils::readFileBytes(file_path);
    if (!bytes)
    {
        DecodeOutcome outcome;
        outcome.status = DecodeStatus::READ_FAILED;
        outcome.error_type = "std::ios_base::failure";
        outcome.message = "Cannot read " + file_path;
        return outcome;
    }
    return decode(*bytes);
}

DecodeOutcome ImageCodec::decode(const std::vector<uint8_t> &bytes)
{
    DecodeOutcome outcome;
    const ImageFormat format = ContainerInspector::detectFormat(bytes);

    if (bytes.empty())
    {
        outcome.status = DecodeStatus::UNIDENTIFIED;
        outcome.message = "Empty input";
        return outcome;
    }

    if (format != ImageFormat::UNKNOWN && !ContainerInspector::isComplete(bytes))
    {
        outcome.status = DecodeStatus::CORRUPT;
        outcome.message = ContainerInspector::formatName(format) + " data is truncated";
        return outcome;
    }

    try
    {
        cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t *>(bytes.data()));
        cv::Mat pixels = cv::imdecode(encoded, cv::IMREAD_UNCHANGED);

        if (pixels.empty())
        {
            outcome.status = format == ImageFormat::UNKNOWN ? DecodeStatus::UNIDENTIFIED : DecodeStatus::CORRUPT;
            outcome.message = "Decoder rejected the data";
            return outcome;
        }

        outcome.image.pixels = pixels;
        outcome.image.mode = describeMode(pixels);
        outcome.image.format = format;
        outcome.status = format == ImageFormat::UNKNOWN ? DecodeStatus::UNKNOWN_FORMAT : DecodeStatus::OK;

        Logger::debug("Decoded " + ContainerInspector::formatName(format) + " " + std::to_string(pixels.cols) +
                      "x" + std::to_string(pixels.rows) + " mode " + outcome.image.mode);
        return outcome;
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during decode: " + std::string(e.what()));
        outcome.status = DecodeStatus::FAILED;
        outcome.error_type = "cv::Exception";
        outcome.message = e.err.empty() ? e.what() : e.err;
        return outcome;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error during decode: " + std::string(e.what()));
        outcome.status = DecodeStatus::FAILED;
        outcome.error_type = exceptionTypeName(e);
        outcome.message = e.what();
        return outcome;
    }
}

DecodedImage ImageCodec::rebuildFromPixels(const DecodedImage &source)
{
    DecodedImage clean;
    clean.format = source.format;
    clean.mode = source.mode;
    clean.pixels.create(source.pixels.rows, source.pixels.cols, source.pixels.type());
    source.pixels.copyTo(clean.pixels);
    return clean;
}

EncodeOutcome ImageCodec::encode(const DecodedImage &image)
{
    EncodeOutcome outcome;
    const std::string extension = ContainerInspector::encoderExtension(image.format);
    if (extension.empty())
    {
        outcome.error_type = "std::invalid_argument";
        outcome.message = "No encoder for format " + ContainerInspector::formatName(image.format);
        return outcome;
    }

    const std::vector<int> params = encodeParameters(image.format);
    Logger::debug("Encoding " + ContainerInspector::formatName(image.format) + " with " +
                  std::to_string(params.size() / 2) + " encoder parameter(s)");

    try
    {
        std::vector<uchar> buffer;
        if (!cv::imencode(extension, image.pixels, buffer, params))
        {
            outcome.error_type = "cv::Exception";
            outcome.message = "imencode(" + extension + ") failed for mode " + image.mode;
            return outcome;
        }
        outcome.data.assign(buffer.begin(), buffer.end());
        outcome.success = true;
        return outcome;
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during encode: " + std::string(e.what()));
        outcome.error_type = "cv::Exception";
        outcome.message = e.err.empty() ? e.what() : e.err;
        return outcome;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error during encode: " + std::string(e.what()));
        outcome.error_type = exceptionTypeName(e);
        outcome.message = e.what();
        return outcome;
    }
}

std::vector<int> ImageCodec::encodeParameters(ImageFormat format)
{
    switch (format)
    {
    case ImageFormat::JPEG:
        return {cv::IMWRITE_JPEG_QUALITY, JPEG_QUALITY, cv::IMWRITE_JPEG_OPTIMIZE, 1};
    case ImageFormat::PNG:
        return {cv::IMWRITE_PNG_COMPRESSION, PNG_COMPRESSION, cv::IMWRITE_PNG_STRATEGY, cv::IMWRITE_PNG_STRATEGY_DEFAULT};
    case ImageFormat::WEBP:
        return {cv::IMWRITE_WEBP_QUALITY, WEBP_QUALITY};
    default:
        return {};
    }
}

std::string ImageCodec::describeMode(const cv::Mat &pixels)
{
    std::string mode;
    switch (pixels.channels())
    {
    case 1:
        mode = "L";
        break;
    case 2:
        mode = "LA";
        break;
    case 3:
        mode = "RGB";
        break;
    case 4:
        mode = "RGBA";
        break;
    default:
        mode = std::to_string(pixels.channels()) + "ch";
        break;
    }

    switch (pixels.depth())
    {
    case CV_8U:
        break;
    case CV_16U:
        mode += ";16";
        break;
    case CV_32F:
        mode += ";F";
        break;
    default:
        mode += ";" + std::to_string(pixels.elemSize1() * 8);
        break;
    }
    return mode;
}

std::string ImageCodec::exceptionTypeName(const std::exception &e)
{
    const char *mangled = typeid(e).name();
    int status = 0;
    char *demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (demangled)
    {
        std::string name(demangled);
        free(demangled);
        return name;
    }
    return mangled;
}
