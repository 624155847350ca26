#include "test_base.hpp"
#include "core/container_inspector.hpp"

class ContainerInspectorTest : public TestBase
{
protected:
    static bool hasKind(const std::vector<MetadataBlock> &blocks, MetadataKind kind)
    {
        for (const auto &block : blocks)
        {
            if (block.kind == kind)
                return true;
        }
        return false;
    }
};

TEST_F(ContainerInspectorTest, DetectsFormatsFromSignature)
{
    cv::Mat image = TestImages::gradient(16, 16);

    EXPECT_EQ(ContainerInspector::detectFormat(TestImages::encode(".jpg", image)), ImageFormat::JPEG);
    EXPECT_EQ(ContainerInspector::detectFormat(TestImages::encode(".png", image)), ImageFormat::PNG);
    EXPECT_EQ(ContainerInspector::detectFormat(TestImages::encode(".webp", image)), ImageFormat::WEBP);
    EXPECT_EQ(ContainerInspector::detectFormat(TestImages::encode(".bmp", image)), ImageFormat::BMP);

    EXPECT_EQ(ContainerInspector::detectFormat({}), ImageFormat::UNKNOWN);
    EXPECT_EQ(ContainerInspector::detectFormat(TestImages::ppm(2, 2)), ImageFormat::PPM);
    EXPECT_EQ(ContainerInspector::detectFormat(TestImages::encode(".pgm", TestImages::gradient(4, 4, 1))),
              ImageFormat::PGM);
    EXPECT_EQ(ContainerInspector::detectFormat(TestImages::encode(".sr", image)), ImageFormat::SUN_RASTER);
    EXPECT_EQ(ContainerInspector::detectFormat(TestImages::pbm(8, 2)), ImageFormat::UNKNOWN);

    std::string text = "this is not an image";
    EXPECT_EQ(ContainerInspector::detectFormat(std::vector<uint8_t>(text.begin(), text.end())), ImageFormat::UNKNOWN);
}

TEST_F(ContainerInspectorTest, DetectFileFormat)
{
    writeBytes(path("actually_png.jpg"), TestImages::encode(".png", TestImages::gradient(8, 8)));

    auto format = ContainerInspector::detectFileFormat(path("actually_png.jpg").string());
    ASSERT_TRUE(format.has_value());
    EXPECT_EQ(*format, ImageFormat::PNG);

    EXPECT_FALSE(ContainerInspector::detectFileFormat(path("missing.png").string()).has_value());
}

TEST_F(ContainerInspectorTest, FindsJpegMetadataSegments)
{
    auto jpeg = TestImages::jpegWithMetadata(TestImages::gradient(32, 24));
    auto blocks = ContainerInspector::findMetadataBlocks(jpeg);

    EXPECT_TRUE(hasKind(blocks, MetadataKind::EXIF));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::XMP));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::ICC));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::IPTC));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::COMMENT));
    EXPECT_EQ(blocks.size(), 5u);

    // First spliced segment sits right after SOI
    EXPECT_EQ(blocks[0].offset, 2u);
    EXPECT_EQ(blocks[0].label, "APP1");
}

TEST_F(ContainerInspectorTest, PlainEncoderOutputHasNoMetadata)
{
    cv::Mat image = TestImages::gradient(32, 24);

    // JFIF APP0 is structural, not metadata
    EXPECT_TRUE(ContainerInspector::findMetadataBlocks(TestImages::encode(".jpg", image)).empty());
    EXPECT_TRUE(ContainerInspector::findMetadataBlocks(TestImages::encode(".png", image)).empty());
    EXPECT_TRUE(ContainerInspector::findMetadataBlocks(TestImages::encode(".webp", image)).empty());
}

TEST_F(ContainerInspectorTest, FindsPngMetadataChunks)
{
    auto png = TestImages::pngWithMetadata(TestImages::gradient(20, 10));
    auto blocks = ContainerInspector::findMetadataBlocks(png);

    EXPECT_TRUE(hasKind(blocks, MetadataKind::EXIF));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::XMP));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::TEXT));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::ICC));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::IPTC));
    EXPECT_EQ(blocks.size(), 6u);
    EXPECT_EQ(blocks[0].label, "eXIf");
    EXPECT_EQ(blocks[0].offset, 33u);
    EXPECT_EQ(blocks[1].label, "iCCP");
    EXPECT_EQ(blocks[3].label, "zTXt");
}

TEST_F(ContainerInspectorTest, FindsWebpMetadataChunks)
{
    auto webp = TestImages::webpWithMetadata(TestImages::gradient(20, 10));
    auto blocks = ContainerInspector::findMetadataBlocks(webp);

    EXPECT_TRUE(hasKind(blocks, MetadataKind::EXIF));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::XMP));
    EXPECT_TRUE(hasKind(blocks, MetadataKind::ICC));
    EXPECT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].label, "ICCP");
}

TEST_F(ContainerInspectorTest, InspectFileReadsFromDisk)
{
    writeBytes(path("meta.jpg"), TestImages::jpegWithMetadata(TestImages::gradient(16, 16)));

    auto blocks = ContainerInspector::inspectFile(path("meta.jpg").string());
    ASSERT_TRUE(blocks.has_value());
    EXPECT_EQ(blocks->size(), 5u);

    EXPECT_FALSE(ContainerInspector::inspectFile(path("missing.jpg").string()).has_value());
}

TEST_F(ContainerInspectorTest, CompleteFilesPass)
{
    cv::Mat image = TestImages::gradient(64, 48);
    EXPECT_TRUE(ContainerInspector::isComplete(TestImages::encode(".jpg", image)));
    EXPECT_TRUE(ContainerInspector::isComplete(TestImages::jpegWithMetadata(image)));
    EXPECT_TRUE(ContainerInspector::isComplete(TestImages::encode(".png", image)));
    EXPECT_TRUE(ContainerInspector::isComplete(TestImages::webpWithMetadata(image)));
}

TEST_F(ContainerInspectorTest, TruncatedFilesAreIncomplete)
{
    cv::Mat image = TestImages::gradient(64, 48);

    auto jpeg = TestImages::encode(".jpg", image);
    jpeg.resize(jpeg.size() / 2);
    EXPECT_FALSE(ContainerInspector::isComplete(jpeg));

    auto png = TestImages::encode(".png", image);
    png.resize(png.size() - 12); // drop IEND
    EXPECT_FALSE(ContainerInspector::isComplete(png));

    auto webp = TestImages::encode(".webp", image);
    webp.resize(webp.size() - 10);
    EXPECT_FALSE(ContainerInspector::isComplete(webp));
}

TEST_F(ContainerInspectorTest, MalformedLengthsStopTheWalk)
{
    // APP1 claims more bytes than the buffer holds
    std::vector<uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xE1, 0xFF, 0xF0, 'E', 'x', 'i', 'f', 0, 0};
    EXPECT_TRUE(ContainerInspector::findMetadataBlocks(jpeg).empty());
    EXPECT_FALSE(ContainerInspector::isComplete(jpeg));

    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A,
                                0x7F, 0xFF, 0xFF, 0xFF, 'e', 'X', 'I', 'f'};
    EXPECT_TRUE(ContainerInspector::findMetadataBlocks(png).empty());
}

TEST_F(ContainerInspectorTest, EncoderExtensions)
{
    EXPECT_EQ(ContainerInspector::encoderExtension(ImageFormat::JPEG), ".jpg");
    EXPECT_EQ(ContainerInspector::encoderExtension(ImageFormat::PNG), ".png");
    EXPECT_EQ(ContainerInspector::encoderExtension(ImageFormat::WEBP), ".webp");
    EXPECT_EQ(ContainerInspector::encoderExtension(ImageFormat::PPM), ".ppm");
    EXPECT_EQ(ContainerInspector::encoderExtension(ImageFormat::PGM), ".pgm");
    EXPECT_EQ(ContainerInspector::encoderExtension(ImageFormat::SUN_RASTER), ".sr");
    EXPECT_EQ(ContainerInspector::encoderExtension(ImageFormat::UNKNOWN), "");
    EXPECT_EQ(ContainerInspector::formatName(ImageFormat::UNKNOWN), "UNKNOWN");
}
