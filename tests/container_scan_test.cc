#include "metasplice/container_scan.h"

#include "test_images.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace metasplice {
namespace {

    using test::append_u32be;
    using test::bytes_of;

    static void expect_blocks_tile(std::span<const std::byte> bytes,
                                   const ImageContainer& c)
    {
        uint64_t offset = 0;
        for (const ContainerBlockRef& b : c.blocks) {
            EXPECT_EQ(b.outer_offset, offset);
            EXPECT_GE(b.data_offset, b.outer_offset);
            EXPECT_LE(b.data_offset + b.data_size, b.outer_offset + b.outer_size);
            offset += b.outer_size;
        }
        EXPECT_EQ(offset, bytes.size());
    }


    TEST(ContainerScan, SniffsEachFormatWithDimensions)
    {
        const std::vector<std::byte> jpeg = test::make_jpeg(10, 12);
        SniffResult r                     = sniff_container(jpeg);
        EXPECT_EQ(r.status, CodecStatus::Ok);
        EXPECT_EQ(r.format, ContainerFormat::Jpeg);
        ASSERT_TRUE(r.has_dimensions);
        EXPECT_EQ(r.width, 10U);
        EXPECT_EQ(r.height, 12U);

        const std::vector<std::byte> png = test::make_png(640, 480);
        r                                = sniff_container(png);
        EXPECT_EQ(r.format, ContainerFormat::Png);
        EXPECT_EQ(r.width, 640U);
        EXPECT_EQ(r.height, 480U);

        const std::vector<std::byte> tiff = test::make_tiff(33, 44, false);
        r                                 = sniff_container(tiff);
        EXPECT_EQ(r.format, ContainerFormat::Tiff);
        EXPECT_EQ(r.width, 33U);
        EXPECT_EQ(r.height, 44U);

        const std::vector<std::byte> webp = test::make_webp(300, 200);
        r                                 = sniff_container(webp);
        EXPECT_EQ(r.format, ContainerFormat::Webp);
        EXPECT_EQ(r.width, 300U);
        EXPECT_EQ(r.height, 200U);
    }


    TEST(ContainerScan, RejectsUnknownMagic)
    {
        const std::vector<std::byte> gif = bytes_of("GIF89a\x01\x00\x01\x00");
        const SniffResult r              = sniff_container(gif);
        EXPECT_EQ(r.status, CodecStatus::UnrecognizedFormat);
        EXPECT_EQ(r.format, ContainerFormat::Unknown);

        ImageContainer c;
        EXPECT_EQ(scan_container(gif, &c), CodecStatus::UnrecognizedFormat);
        EXPECT_TRUE(c.blocks.empty());

        EXPECT_EQ(sniff_container({}).status, CodecStatus::UnrecognizedFormat);
    }


    TEST(ContainerScan, ClassifiesJpegSegments)
    {
        test::TiffBuilder tiff;
        tiff.add_ascii(&tiff.ifd0, 0x010E, "hello");
        std::vector<std::vector<std::byte>> segs;
        segs.push_back(test::make_jpeg_exif_segment(tiff.build()));
        segs.push_back(test::make_jpeg_xmp_segment("<x:xmpmeta/>"));
        const std::vector<std::byte> jpeg = test::make_jpeg(8, 8, segs);

        ImageContainer c;
        ASSERT_EQ(scan_container(jpeg, &c), CodecStatus::Ok);
        expect_blocks_tile(jpeg, c);

        const int64_t exif = find_block(c, ContainerBlockKind::Exif);
        const int64_t xmp  = find_block(c, ContainerBlockKind::Xmp);
        ASSERT_GE(exif, 0);
        ASSERT_GE(xmp, 0);
        EXPECT_LT(exif, xmp);

        const std::span<const std::byte> tiff_bytes
            = block_data(jpeg, c.blocks[static_cast<size_t>(exif)]);
        EXPECT_EQ(test::string_of(tiff_bytes.first(4)),
                  std::string_view("MM\0*", 4));
        EXPECT_EQ(test::string_of(
                      block_data(jpeg, c.blocks[static_cast<size_t>(xmp)])),
                  "<x:xmpmeta/>");

        EXPECT_GE(find_block(c, ContainerBlockKind::ImageHeader), 0);
        EXPECT_GE(find_block(c, ContainerBlockKind::ImageData), 0);
        EXPECT_EQ(find_block(c, ContainerBlockKind::Text), -1);
    }


    TEST(ContainerScan, JpegSegmentPastEndIsMalformed)
    {
        std::vector<std::byte> jpeg = test::make_jpeg(4, 4);
        jpeg.resize(8);
        ImageContainer c;
        EXPECT_EQ(scan_container(jpeg, &c), CodecStatus::MalformedContainer);
    }


    TEST(ContainerScan, ClassifiesPngChunks)
    {
        std::vector<std::vector<std::byte>> before;
        before.push_back(test::make_text_chunk("Title", "x"));
        std::vector<std::byte> itxt = bytes_of(kPngXmpKeyword);
        itxt.resize(itxt.size() + 5, std::byte { 0 });
        test::append_bytes(&itxt, "<x/>");
        before.push_back(test::make_png_chunk(fourcc('i', 'T', 'X', 't'), itxt));
        std::vector<std::byte> png = test::make_png(2, 3, before);
        test::append_bytes(&png, "trailer");

        ImageContainer c;
        ASSERT_EQ(scan_container(png, &c), CodecStatus::Ok);
        expect_blocks_tile(png, c);
        ASSERT_EQ(c.blocks.size(), 8U);
        EXPECT_EQ(c.blocks[0].kind, ContainerBlockKind::Signature);
        EXPECT_EQ(c.blocks[1].kind, ContainerBlockKind::ImageHeader);
        EXPECT_EQ(c.blocks[2].kind, ContainerBlockKind::Text);
        EXPECT_EQ(c.blocks[3].kind, ContainerBlockKind::Xmp);
        EXPECT_EQ(c.blocks[4].kind, ContainerBlockKind::ImageData);
        EXPECT_EQ(c.blocks[5].kind, ContainerBlockKind::ImageData);
        EXPECT_EQ(c.blocks[6].kind, ContainerBlockKind::End);
        EXPECT_EQ(c.blocks[7].kind, ContainerBlockKind::Trailer);
    }


    TEST(ContainerScan, PngFramingErrors)
    {
        std::vector<std::byte> png = test::make_png(1, 1);
        ImageContainer c;

        std::vector<std::byte> no_iend(png.begin(), png.end() - 12);
        EXPECT_EQ(scan_container(no_iend, &c), CodecStatus::MalformedContainer);

        std::vector<std::byte> huge = bytes_of("\x89PNG\r\n\x1a\n");
        append_u32be(&huge, 0x80000000U);
        test::append_bytes(&huge, "IHDR");
        EXPECT_EQ(scan_container(huge, &c), CodecStatus::ResourceLimitExceeded);

        std::vector<std::byte> cut(png.begin(), png.begin() + 20);
        EXPECT_EQ(scan_container(cut, &c), CodecStatus::MalformedContainer);
    }


    TEST(ContainerScan, WebpMetadataChunks)
    {
        const std::vector<std::byte> tiff = test::make_tiff(1, 1);
        const std::vector<std::byte> webp = test::make_webp(5, 6, tiff,
                                                            "<x:xmpmeta/>");
        ImageContainer c;
        ASSERT_EQ(scan_container(webp, &c), CodecStatus::Ok);
        expect_blocks_tile(webp, c);

        const int64_t exif = find_block(c, ContainerBlockKind::Exif);
        ASSERT_GE(exif, 0);
        EXPECT_EQ(block_data(webp, c.blocks[static_cast<size_t>(exif)]).size(),
                  tiff.size());
        EXPECT_GE(find_block(c, ContainerBlockKind::Xmp), 0);
        EXPECT_EQ(c.width, 5U);
        EXPECT_EQ(c.height, 6U);
    }


    TEST(ContainerScan, TiffIsOneExifBlock)
    {
        const std::vector<std::byte> tiff = test::make_tiff(7, 9);
        ImageContainer c;
        ASSERT_EQ(scan_container(tiff, &c), CodecStatus::Ok);
        ASSERT_EQ(c.blocks.size(), 1U);
        EXPECT_EQ(c.blocks[0].kind, ContainerBlockKind::Exif);
        EXPECT_EQ(c.blocks[0].data_size, tiff.size());
        EXPECT_EQ(container_format_name(c.format), "TIFF");
    }

}  // namespace
}  // namespace metasplice
