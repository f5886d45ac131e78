#include <gtest/gtest.h>
#include "core/metadata_stripper.hpp"
#include "core/external_library_wrappers.hpp"
#include "test_media.hpp"
#include <fcntl.h>

class MetadataStripperTest : public MediaTestBase
{
protected:
    static void be32(std::vector<uint8_t> &out, uint32_t v)
    {
        for (int shift = 24; shift >= 0; shift -= 8)
            out.push_back(static_cast<uint8_t>(v >> shift));
    }

    static std::vector<uint8_t> box(const std::string &type, const std::vector<uint8_t> &payload)
    {
        std::vector<uint8_t> out;
        be32(out, static_cast<uint32_t>(payload.size() + 8));
        out.insert(out.end(), type.begin(), type.end());
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    static std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts)
    {
        std::vector<uint8_t> out;
        for (const auto &part : parts)
            out.insert(out.end(), part.begin(), part.end());
        return out;
    }

    // Version 0 full box with creation and modification times set
    static std::vector<uint8_t> timestamped(const std::string &type)
    {
        std::vector<uint8_t> payload = {0, 0, 0, 0};
        be32(payload, 0xD5A1B2C3);
        be32(payload, 0xD5A1B2C4);
        payload.resize(payload.size() + 16, 0x11);
        return box(type, payload);
    }

    static std::vector<uint8_t> stco(uint32_t offset)
    {
        std::vector<uint8_t> payload = {0, 0, 0, 0};
        be32(payload, 1);
        be32(payload, offset);
        return box("stco", payload);
    }

    static std::vector<uint8_t> text(const std::string &s)
    {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    /**
     * @brief ftyp, free, moov (with udta and a GPS tag), mdat; the single
     *        chunk offset points at the first mdat payload byte
     */
    static std::vector<uint8_t> makeIsoFile()
    {
        std::vector<uint8_t> ftyp = box("ftyp", text(std::string("isom\0\0\x02\0isomiso2", 16)));
        std::vector<uint8_t> free = box("free", std::vector<uint8_t>(32, 0));
        std::vector<uint8_t> mdat_payload = text("MEDIA-PAYLOAD-BYTES");

        auto build_moov = [&](uint32_t chunk_offset)
        {
            std::vector<uint8_t> stbl = box("stbl", stco(chunk_offset));
            std::vector<uint8_t> minf = box("minf", stbl);
            std::vector<uint8_t> mdia = box("mdia", concat({timestamped("mdhd"), minf}));
            std::vector<uint8_t> trak = box("trak", concat({timestamped("tkhd"), mdia}));
            std::vector<uint8_t> udta = box("udta", box("\xA9xyz", text("+48.8584+002.2945/")));
            return box("moov", concat({timestamped("mvhd"), trak, udta}));
        };

        // Sizes do not depend on the offset value
        size_t moov_size = build_moov(0).size();
        uint32_t mdat_start = static_cast<uint32_t>(ftyp.size() + free.size() + moov_size + 8);
        return concat({ftyp, free, build_moov(mdat_start), box("mdat", mdat_payload)});
    }

    static uint32_t readBE32(const std::vector<uint8_t> &data, size_t pos)
    {
        return (static_cast<uint32_t>(data[pos]) << 24) | (static_cast<uint32_t>(data[pos + 1]) << 16) |
               (static_cast<uint32_t>(data[pos + 2]) << 8) | data[pos + 3];
    }

    static size_t find(const std::vector<uint8_t> &data, const std::string &needle)
    {
        auto it = std::search(data.begin(), data.end(), needle.begin(), needle.end());
        return it == data.end() ? std::string::npos : static_cast<size_t>(it - data.begin());
    }

    static std::vector<uint8_t> pngWithText(const std::string &keyword, const std::string &value)
    {
        std::vector<uint8_t> png = TestMedia::makePng(16, 16);
        png.resize(png.size() - 12); // Drop IEND
        std::vector<uint8_t> body(keyword.begin(), keyword.end());
        body.push_back(0);
        body.insert(body.end(), value.begin(), value.end());
        TestMedia::appendPngChunk(png, "tEXt", body);
        TestMedia::appendPngChunk(png, "eXIf", text(std::string("MM\0*GPSDATA", 11)));
        TestMedia::appendPngChunk(png, "IEND", {});
        return png;
    }
};

TEST_F(MetadataStripperTest, PngAncillaryChunksAreRemoved)
{
    std::vector<uint8_t> png = pngWithText("Author", "Jane Example");
    std::vector<uint8_t> trailing = text("<?php evil(); ?>");
    png.insert(png.end(), trailing.begin(), trailing.end());
    ASSERT_TRUE(TestMedia::contains(png, "Jane Example"));

    StageResult result = MetadataStripper::strip(png, StripFormat::PNG);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_FALSE(TestMedia::contains(png, "tEXt"));
    EXPECT_FALSE(TestMedia::contains(png, "Jane Example"));
    EXPECT_FALSE(TestMedia::contains(png, "GPSDATA"));
    EXPECT_FALSE(TestMedia::contains(png, "evil"));

    cv::Mat decoded = cv::imdecode(png, cv::IMREAD_COLOR);
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.cols, 16);
}

TEST_F(MetadataStripperTest, PngStripIsIdempotent)
{
    std::vector<uint8_t> png = pngWithText("Comment", "x");
    ASSERT_TRUE(MetadataStripper::strip(png, StripFormat::PNG).success);
    std::vector<uint8_t> once = png;
    ASSERT_TRUE(MetadataStripper::strip(png, StripFormat::PNG).success);
    EXPECT_EQ(png, once);
    EXPECT_TRUE(MetadataStripper::verify(png, StripFormat::PNG).success);
}

TEST_F(MetadataStripperTest, PngCrcMismatchFailsClosed)
{
    std::vector<uint8_t> png = pngWithText("Author", "someone");
    size_t pos = find(png, "someone");
    ASSERT_NE(pos, std::string::npos);
    png[pos] ^= 0x20;

    std::vector<uint8_t> original = png;
    StageResult result = MetadataStripper::strip(png, StripFormat::PNG);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::METADATA_STRIP_FAILED);
    EXPECT_EQ(png, original);
}

TEST_F(MetadataStripperTest, VerifyRejectsAncillaryPngChunk)
{
    std::vector<uint8_t> png = pngWithText("Author", "x");
    EXPECT_FALSE(MetadataStripper::verify(png, StripFormat::PNG).success);
}

TEST_F(MetadataStripperTest, JpegExifAndTrailerAreRemoved)
{
    std::vector<uint8_t> jpeg = TestMedia::makeJpegWithExif(32, 24, "GPS:51.5007,-0.1246");
    std::vector<uint8_t> trailing = text("<script>alert(1)</script>");
    jpeg.insert(jpeg.end(), trailing.begin(), trailing.end());

    StageResult result = MetadataStripper::strip(jpeg, StripFormat::JPEG);
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_FALSE(TestMedia::contains(jpeg, "Exif"));
    EXPECT_FALSE(TestMedia::contains(jpeg, "GPS:51.5007"));
    EXPECT_FALSE(TestMedia::contains(jpeg, "<script>"));
    ASSERT_GE(jpeg.size(), 4u);
    EXPECT_EQ(jpeg[jpeg.size() - 2], 0xFF);
    EXPECT_EQ(jpeg[jpeg.size() - 1], 0xD9);

    cv::Mat decoded = cv::imdecode(jpeg, cv::IMREAD_COLOR);
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.cols, 32);
    EXPECT_EQ(decoded.rows, 24);

    std::vector<uint8_t> once = jpeg;
    ASSERT_TRUE(MetadataStripper::strip(jpeg, StripFormat::JPEG).success);
    EXPECT_EQ(jpeg, once);
}

TEST_F(MetadataStripperTest, JpegWithoutEoiFails)
{
    std::vector<uint8_t> jpeg = TestMedia::makeJpeg(16, 16);
    jpeg.resize(jpeg.size() - 2);
    StageResult result = MetadataStripper::strip(jpeg, StripFormat::JPEG);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::METADATA_STRIP_FAILED);
}

TEST_F(MetadataStripperTest, IsoBmffMetadataBoxesRemovedAndOffsetsRelocated)
{
    std::vector<uint8_t> file = makeIsoFile();
    ASSERT_NE(find(file, "udta"), std::string::npos);

    StageResult result = MetadataStripper::strip(file, StripFormat::ISO_BMFF);
    ASSERT_TRUE(result.success) << result.error_message;

    EXPECT_EQ(find(file, "udta"), std::string::npos);
    EXPECT_EQ(find(file, "free"), std::string::npos);
    EXPECT_EQ(find(file, "+48.8584"), std::string::npos);
    EXPECT_EQ(readBE32(file, 4), 0x66747970U); // ftyp stays first

    // The chunk offset still points at the media payload
    size_t stco_pos = find(file, "stco");
    ASSERT_NE(stco_pos, std::string::npos);
    uint32_t offset = readBE32(file, stco_pos + 4 + 8);
    ASSERT_LT(offset, file.size());
    EXPECT_EQ(std::string(file.begin() + offset, file.begin() + offset + 5), "MEDIA");

    // mvhd creation and modification times are zeroed
    size_t mvhd_pos = find(file, "mvhd");
    ASSERT_NE(mvhd_pos, std::string::npos);
    EXPECT_EQ(readBE32(file, mvhd_pos + 8), 0u);
    EXPECT_EQ(readBE32(file, mvhd_pos + 12), 0u);

    std::vector<uint8_t> once = file;
    ASSERT_TRUE(MetadataStripper::strip(file, StripFormat::ISO_BMFF).success);
    EXPECT_EQ(file, once);
}

TEST_F(MetadataStripperTest, IsoBmffWithoutMoovFails)
{
    std::vector<uint8_t> file = concat({box("ftyp", text(std::string("isom\0\0\0\0", 8))), box("mdat", text("data"))});
    StageResult result = MetadataStripper::strip(file, StripFormat::ISO_BMFF);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::METADATA_STRIP_FAILED);
}

TEST_F(MetadataStripperTest, FragmentedIsoBmffIsRejected)
{
    std::vector<uint8_t> file = concat({box("ftyp", text(std::string("isom\0\0\0\0", 8))), box("moov", timestamped("mvhd")),
                                        box("moof", std::vector<uint8_t>(8, 0)), box("mdat", text("data"))});
    EXPECT_FALSE(MetadataStripper::strip(file, StripFormat::ISO_BMFF).success);
}

TEST_F(MetadataStripperTest, DescriptorStripTruncatesFile)
{
    fs::path path = test_dir_ / "out.mp4";
    TestMedia::writeFile(path, makeIsoFile());
    uint64_t before = fs::file_size(path);

    FileDescriptorRAII fd(open(path.c_str(), O_RDWR | O_CLOEXEC));
    ASSERT_TRUE(fd.valid());
    StageResult result = MetadataStripper::stripDescriptor(fd.get(), StripFormat::ISO_BMFF, 1 << 20);
    ASSERT_TRUE(result.success) << result.error_message;

    std::vector<uint8_t> after = TestMedia::readFile(path);
    EXPECT_LT(after.size(), before);
    EXPECT_EQ(find(after, "udta"), std::string::npos);
    EXPECT_TRUE(MetadataStripper::verify(after, StripFormat::ISO_BMFF).success);
}

TEST_F(MetadataStripperTest, DescriptorOverLimitIsResourceExceeded)
{
    fs::path path = test_dir_ / "big.png";
    TestMedia::writeFile(path, TestMedia::makePng(64, 64));

    FileDescriptorRAII fd(open(path.c_str(), O_RDWR | O_CLOEXEC));
    ASSERT_TRUE(fd.valid());
    StageResult result = MetadataStripper::stripDescriptor(fd.get(), StripFormat::PNG, 16);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure_kind, FailureKind::RESOURCE_EXCEEDED);
}

TEST_F(MetadataStripperTest, ContainerNamesMapToFormats)
{
    EXPECT_EQ(MetadataStripper::formatForContainer("png"), StripFormat::PNG);
    EXPECT_EQ(MetadataStripper::formatForContainer("jpeg"), StripFormat::JPEG);
    EXPECT_EQ(MetadataStripper::formatForContainer("ipod"), StripFormat::ISO_BMFF);
    EXPECT_EQ(MetadataStripper::formatForContainer("mp4"), StripFormat::ISO_BMFF);
    EXPECT_EQ(MetadataStripper::formatForContainer("matroska"), StripFormat::UNKNOWN);

    std::vector<uint8_t> data = {1, 2, 3};
    EXPECT_FALSE(MetadataStripper::strip(data, StripFormat::UNKNOWN).success);
}
