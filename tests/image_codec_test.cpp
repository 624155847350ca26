#include "test_base.hpp"
#include "core/image_codec.hpp"
#include <new>
#include <stdexcept>

class ImageCodecTest : public TestBase
{
protected:
    static double psnr(const cv::Mat &a, const cv::Mat &b) { return cv::PSNR(a, b); }
};

TEST_F(ImageCodecTest, DecodeKeepsDimensionsAndFormat)
{
    cv::Mat source = TestImages::gradient(40, 30);

    auto jpeg = ImageCodec::decode(TestImages::jpegWithMetadata(source));
    ASSERT_TRUE(jpeg.ok()) << jpeg.message;
    EXPECT_EQ(jpeg.image.format, ImageFormat::JPEG);
    EXPECT_EQ(jpeg.image.width(), 40);
    EXPECT_EQ(jpeg.image.height(), 30);
    EXPECT_EQ(jpeg.image.mode, "RGB");

    auto png = ImageCodec::decode(TestImages::encode(".png", TestImages::gradient(40, 30, 4)));
    ASSERT_TRUE(png.ok()) << png.message;
    EXPECT_EQ(png.image.format, ImageFormat::PNG);
    EXPECT_EQ(png.image.mode, "RGBA");
}

TEST_F(ImageCodecTest, DecodeDoesNotApplyExifOrientation)
{
    // Orientation 6 would swap width and height if it were applied
    cv::Mat source = TestImages::gradient(40, 20);
    auto decoded = ImageCodec::decode(TestImages::jpegWithMetadata(source));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.image.width(), 40);
    EXPECT_EQ(decoded.image.height(), 20);
}

TEST_F(ImageCodecTest, DecodeClassifiesBadData)
{
    std::string text = "plain text, not pixels";
    EXPECT_EQ(ImageCodec::decode(std::vector<uint8_t>(text.begin(), text.end())).status, DecodeStatus::UNIDENTIFIED);
    EXPECT_EQ(ImageCodec::decode(std::vector<uint8_t>{}).status, DecodeStatus::UNIDENTIFIED);

    auto truncated = TestImages::encode(".png", TestImages::gradient(32, 32));
    truncated.resize(truncated.size() / 2);
    EXPECT_EQ(ImageCodec::decode(truncated).status, DecodeStatus::CORRUPT);

    auto header_only = TestImages::encode(".jpg", TestImages::gradient(32, 32));
    header_only.resize(20);
    EXPECT_EQ(ImageCodec::decode(header_only).status, DecodeStatus::CORRUPT);
}

TEST_F(ImageCodecTest, DecodableButUnnamedContainer)
{
    auto outcome = ImageCodec::decode(TestImages::pbm(16, 3));
    EXPECT_EQ(outcome.status, DecodeStatus::UNKNOWN_FORMAT);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.image.width(), 16);
}

TEST_F(ImageCodecTest, DecodeMissingFileReportsReadFailure)
{
    auto outcome = ImageCodec::decode(path("missing.png").string());
    EXPECT_EQ(outcome.status, DecodeStatus::READ_FAILED);
    EXPECT_FALSE(outcome.error_type.empty());
}

TEST_F(ImageCodecTest, RebuildCopiesPixelsIntoNewBuffer)
{
    auto decoded = ImageCodec::decode(TestImages::encode(".png", TestImages::gradient(16, 8)));
    ASSERT_TRUE(decoded.ok());

    DecodedImage clean = ImageCodec::rebuildFromPixels(decoded.image);
    EXPECT_NE(clean.pixels.data, decoded.image.pixels.data);
    EXPECT_EQ(clean.pixels.type(), decoded.image.pixels.type());
    EXPECT_EQ(clean.mode, decoded.image.mode);
    EXPECT_EQ(clean.format, ImageFormat::PNG);
    EXPECT_EQ(cv::norm(clean.pixels, decoded.image.pixels, cv::NORM_INF), 0.0);
}

TEST_F(ImageCodecTest, EncodeRoundTripsPngExactly)
{
    cv::Mat source = TestImages::gradient(50, 40, 4);
    auto decoded = ImageCodec::decode(TestImages::pngWithMetadata(source));
    ASSERT_TRUE(decoded.ok());

    auto encoded = ImageCodec::encode(ImageCodec::rebuildFromPixels(decoded.image));
    ASSERT_TRUE(encoded.success) << encoded.message;
    EXPECT_EQ(ContainerInspector::detectFormat(encoded.data), ImageFormat::PNG);
    EXPECT_TRUE(ContainerInspector::findMetadataBlocks(encoded.data).empty());

    auto again = ImageCodec::decode(encoded.data);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(cv::norm(again.image.pixels, source, cv::NORM_INF), 0.0);
}

TEST_F(ImageCodecTest, EncodeJpegStaysCloseToSource)
{
    cv::Mat source = TestImages::gradient(64, 64);
    auto decoded = ImageCodec::decode(TestImages::jpegWithMetadata(source));
    ASSERT_TRUE(decoded.ok());

    auto encoded = ImageCodec::encode(decoded.image);
    ASSERT_TRUE(encoded.success) << encoded.message;
    EXPECT_EQ(ContainerInspector::detectFormat(encoded.data), ImageFormat::JPEG);
    EXPECT_TRUE(ContainerInspector::findMetadataBlocks(encoded.data).empty());

    auto again = ImageCodec::decode(encoded.data);
    ASSERT_TRUE(again.ok());
    EXPECT_GT(psnr(again.image.pixels, source), 30.0);
}

TEST_F(ImageCodecTest, EncodeUnknownFormatFails)
{
    DecodedImage image;
    image.pixels = TestImages::gradient(4, 4);
    image.mode = "RGB";
    image.format = ImageFormat::UNKNOWN;

    auto encoded = ImageCodec::encode(image);
    EXPECT_FALSE(encoded.success);
    EXPECT_TRUE(encoded.data.empty());
    EXPECT_FALSE(encoded.message.empty());
}

TEST_F(ImageCodecTest, EncodeParameters)
{
    auto jpeg = ImageCodec::encodeParameters(ImageFormat::JPEG);
    ASSERT_EQ(jpeg.size(), 4u);
    EXPECT_EQ(jpeg[0], cv::IMWRITE_JPEG_QUALITY);
    EXPECT_EQ(jpeg[1], 95);

    auto webp = ImageCodec::encodeParameters(ImageFormat::WEBP);
    ASSERT_EQ(webp.size(), 2u);
    EXPECT_EQ(webp[1], 95);

    EXPECT_TRUE(ImageCodec::encodeParameters(ImageFormat::BMP).empty());
}

TEST_F(ImageCodecTest, DescribeMode)
{
    EXPECT_EQ(ImageCodec::describeMode(cv::Mat(2, 2, CV_8UC1)), "L");
    EXPECT_EQ(ImageCodec::describeMode(cv::Mat(2, 2, CV_8UC3)), "RGB");
    EXPECT_EQ(ImageCodec::describeMode(cv::Mat(2, 2, CV_16UC4)), "RGBA;16");
    EXPECT_EQ(ImageCodec::describeMode(cv::Mat(2, 2, CV_32FC1)), "L;F");
}

TEST_F(ImageCodecTest, ExceptionTypeNameIsDemangled)
{
    EXPECT_EQ(ImageCodec::exceptionTypeName(std::runtime_error("x")), "std::runtime_error");
    EXPECT_EQ(ImageCodec::exceptionTypeName(std::bad_alloc()), "std::bad_alloc");
}
