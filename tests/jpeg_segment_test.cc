#include "metasplice/jpeg_segment.h"

#include "test_images.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace metasplice {
namespace {

    static std::vector<std::byte> exif_app1(uint16_t width)
    {
        std::vector<std::byte> seg;
        EXPECT_EQ(make_jpeg_app1(kJpegExifSignature, test::make_tiff(width, 1),
                                 &seg),
                  CodecStatus::Ok);
        return seg;
    }


    TEST(JpegSegment, FramesApp1)
    {
        std::vector<std::byte> seg;
        ASSERT_EQ(make_jpeg_app1(kJpegXmpSignature, test::bytes_of("<x/>"), &seg),
                  CodecStatus::Ok);
        ASSERT_EQ(seg.size(), 4U + kJpegXmpSignature.size() + 4U);
        EXPECT_EQ(seg[0], std::byte { 0xFF });
        EXPECT_EQ(seg[1], std::byte { 0xE1 });
        const uint32_t len = (static_cast<uint32_t>(seg[2]) << 8)
                             | static_cast<uint32_t>(seg[3]);
        EXPECT_EQ(len, seg.size() - 2U);
    }


    TEST(JpegSegment, OversizedBodyFails)
    {
        const std::vector<std::byte> exact(kJpegMaxSegmentBody
                                               - kJpegXmpSignature.size(),
                                           std::byte { 'a' });
        std::vector<std::byte> seg;
        EXPECT_EQ(make_jpeg_app1(kJpegXmpSignature, exact, &seg),
                  CodecStatus::Ok);
        EXPECT_EQ(seg.size(), kJpegMaxSegmentBody + 4U);

        const std::vector<std::byte> over(exact.size() + 1, std::byte { 'a' });
        EXPECT_EQ(make_jpeg_app1(kJpegXmpSignature, over, &seg),
                  CodecStatus::ResourceLimitExceeded);
        EXPECT_TRUE(seg.empty());
    }


    TEST(JpegSegment, ExifInsertedAfterApp0)
    {
        const std::vector<std::byte> jpeg = test::make_jpeg(4, 4);
        ImageContainer c;
        ASSERT_EQ(scan_container(jpeg, &c), CodecStatus::Ok);

        std::vector<BlockEdit> edits;
        ASSERT_EQ(plan_jpeg_app1_upsert(c, ContainerBlockKind::Exif,
                                        exif_app1(4), &edits),
                  CodecStatus::Ok);
        ASSERT_EQ(edits.size(), 1U);
        EXPECT_EQ(edits[0].kind, BlockEditKind::InsertBefore);
        EXPECT_EQ(edits[0].block_index, 2U);

        std::vector<std::byte> out;
        ASSERT_EQ(splice_container(jpeg, c, edits, &out), CodecStatus::Ok);
        ImageContainer c2;
        ASSERT_EQ(scan_container(out, &c2), CodecStatus::Ok);
        EXPECT_EQ(c2.blocks[1].id, 0xFFE0U);
        EXPECT_EQ(c2.blocks[2].kind, ContainerBlockKind::Exif);
    }


    TEST(JpegSegment, XmpInsertedAfterApp1Run)
    {
        std::vector<std::vector<std::byte>> segs;
        segs.push_back(test::make_jpeg_exif_segment(test::make_tiff(1, 1)));
        const std::vector<std::byte> jpeg = test::make_jpeg(4, 4, segs);
        ImageContainer c;
        ASSERT_EQ(scan_container(jpeg, &c), CodecStatus::Ok);

        std::vector<std::byte> seg;
        ASSERT_EQ(make_jpeg_app1(kJpegXmpSignature, test::bytes_of("<x/>"), &seg),
                  CodecStatus::Ok);
        std::vector<BlockEdit> edits;
        ASSERT_EQ(plan_jpeg_app1_upsert(c, ContainerBlockKind::Xmp,
                                        std::move(seg), &edits),
                  CodecStatus::Ok);
        ASSERT_EQ(edits.size(), 1U);
        EXPECT_EQ(edits[0].block_index, 3U);
    }


    TEST(JpegSegment, ReplacesFirstAndDropsDuplicates)
    {
        std::vector<std::vector<std::byte>> segs;
        segs.push_back(test::make_jpeg_exif_segment(test::make_tiff(1, 1)));
        segs.push_back(test::make_jpeg_exif_segment(test::make_tiff(2, 2)));
        const std::vector<std::byte> jpeg = test::make_jpeg(4, 4, segs, false);
        ImageContainer c;
        ASSERT_EQ(scan_container(jpeg, &c), CodecStatus::Ok);

        std::vector<BlockEdit> edits;
        ASSERT_EQ(plan_jpeg_app1_upsert(c, ContainerBlockKind::Exif,
                                        exif_app1(9), &edits),
                  CodecStatus::Ok);
        ASSERT_EQ(edits.size(), 2U);
        EXPECT_EQ(edits[0].kind, BlockEditKind::Replace);
        EXPECT_EQ(edits[0].block_index, 1U);
        EXPECT_EQ(edits[1].kind, BlockEditKind::Remove);
        EXPECT_EQ(edits[1].block_index, 2U);

        std::vector<std::byte> out;
        ASSERT_EQ(splice_container(jpeg, c, edits, &out), CodecStatus::Ok);
        ImageContainer c2;
        ASSERT_EQ(scan_container(out, &c2), CodecStatus::Ok);
        EXPECT_EQ(c2.blocks.size(), c.blocks.size() - 1U);
    }


    TEST(JpegSegment, RequiresJpegContainer)
    {
        const std::vector<std::byte> png = test::make_png(1, 1);
        ImageContainer c;
        ASSERT_EQ(scan_container(png, &c), CodecStatus::Ok);
        std::vector<BlockEdit> edits;
        EXPECT_EQ(plan_jpeg_app1_upsert(c, ContainerBlockKind::Exif,
                                        exif_app1(1), &edits),
                  CodecStatus::UnsupportedOperation);
    }

}  // namespace
}  // namespace metasplice
