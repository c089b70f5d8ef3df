#include "metasplice/png_chunk.h"

#include "metasplice/container_payload.h"

#include "test_images.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace metasplice {
namespace {

    static constexpr uint32_t kText = fourcc('t', 'E', 'X', 't');
    static constexpr uint32_t kZtxt = fourcc('z', 'T', 'X', 't');
    static constexpr uint32_t kItxt = fourcc('i', 'T', 'X', 't');

    static std::vector<std::byte> text_chunk(uint32_t type,
                                             std::string_view keyword,
                                             std::string_view text,
                                             bool compressed       = false,
                                             std::string_view lang = {})
    {
        PngTextChunk c;
        c.type       = type;
        c.keyword    = std::string(keyword);
        c.text       = std::string(text);
        c.compressed = compressed;
        c.language   = std::string(lang);
        std::vector<std::byte> data;
        EXPECT_EQ(encode_png_text_chunk(c, &data), CodecStatus::Ok);
        return test::make_png_chunk(type, data);
    }


    static MetaField text_field(std::string_view key, std::string_view value)
    {
        MetaField f;
        f.ns = MetaNamespace::PngText;
        f.key.assign(key.data(), key.size());
        f.value.assign(value.data(), value.size());
        return f;
    }


    /// Applies \p updates and re-decodes the resulting PNG.
    static std::vector<std::byte> apply_updates(
        const std::vector<std::byte>& png, const std::vector<MetaField>& updates)
    {
        ImageContainer c;
        EXPECT_EQ(scan_container(png, &c), CodecStatus::Ok);
        std::vector<BlockEdit> edits;
        std::string failed;
        EXPECT_EQ(plan_png_text_update(png, c, updates, &edits, &failed),
                  CodecStatus::Ok);
        std::vector<std::byte> out;
        EXPECT_EQ(splice_container(png, c, edits, &out), CodecStatus::Ok);
        return out;
    }


    static FieldMap read_text(const std::vector<std::byte>& png,
                              ImageContainer* c)
    {
        FieldMap fields(MetaNamespace::PngText);
        EXPECT_EQ(scan_container(png, c), CodecStatus::Ok);
        EXPECT_EQ(validate_png_chunks(png, *c, PngLimits {}), CodecStatus::Ok);
        EXPECT_EQ(decode_png_text(png, *c, PngTextOptions {}, &fields),
                  CodecStatus::Ok);
        return fields;
    }


    TEST(PngTextChunk, DecodesEachType)
    {
        PngTextChunk out;
        std::vector<std::byte> data
            = test::bytes_of(std::string_view("Title\0caf\xE9", 10));
        ASSERT_EQ(decode_png_text_chunk(kText, data, PngTextOptions {}, &out),
                  CodecStatus::Ok);
        EXPECT_EQ(out.keyword, "Title");
        EXPECT_EQ(out.text, "caf\xC3\xA9");

        PngTextChunk z;
        z.type    = kZtxt;
        z.keyword = "Comment";
        z.text    = "compressed comment";
        ASSERT_EQ(encode_png_text_chunk(z, &data), CodecStatus::Ok);
        ASSERT_EQ(decode_png_text_chunk(kZtxt, data, PngTextOptions {}, &out),
                  CodecStatus::Ok);
        EXPECT_TRUE(out.compressed);
        EXPECT_EQ(out.text, "compressed comment");

        PngTextChunk i;
        i.type               = kItxt;
        i.keyword            = "Author";
        i.text               = "\xE5\xB1\xB1\xE7\x94\xB0";
        i.compressed         = true;
        i.language           = "ja";
        i.translated_keyword = "\xE8\x91\x97\xE8\x80\x85";
        ASSERT_EQ(encode_png_text_chunk(i, &data), CodecStatus::Ok);
        ASSERT_EQ(decode_png_text_chunk(kItxt, data, PngTextOptions {}, &out),
                  CodecStatus::Ok);
        EXPECT_EQ(out.text, i.text);
        EXPECT_EQ(out.language, "ja");
        EXPECT_EQ(out.translated_keyword, i.translated_keyword);

        PngTextOptions header_only;
        header_only.decompress = false;
        ASSERT_EQ(decode_png_text_chunk(kItxt, data, header_only, &out),
                  CodecStatus::Ok);
        EXPECT_TRUE(out.compressed);
        EXPECT_TRUE(out.text.empty());
    }


    TEST(PngTextChunk, RejectsMalformedPayloads)
    {
        PngTextChunk out;
        const PngTextOptions opts;
        EXPECT_EQ(decode_png_text_chunk(kText, test::bytes_of("no separator"),
                                        opts, &out),
                  CodecStatus::MalformedContainer);
        EXPECT_EQ(decode_png_text_chunk(
                      kText, test::bytes_of(std::string_view("\0text", 5)),
                      opts, &out),
                  CodecStatus::MalformedContainer);

        std::string long_key(80, 'k');
        long_key.push_back('\0');
        EXPECT_EQ(decode_png_text_chunk(kText, test::bytes_of(long_key), opts,
                                        &out),
                  CodecStatus::MalformedContainer);

        EXPECT_EQ(decode_png_text_chunk(
                      kZtxt, test::bytes_of(std::string_view("k\0\x01xx", 5)),
                      opts, &out),
                  CodecStatus::MalformedContainer);
        EXPECT_EQ(decode_png_text_chunk(
                      kItxt, test::bytes_of(std::string_view("k\0\x02\0\0\0t", 7)),
                      opts, &out),
                  CodecStatus::MalformedContainer);
        EXPECT_EQ(decode_png_text_chunk(
                      kItxt, test::bytes_of(std::string_view("k\0\0\0en", 6)),
                      opts, &out),
                  CodecStatus::MalformedContainer);
        EXPECT_EQ(decode_png_text_chunk(
                      kZtxt, test::bytes_of(std::string_view("k\0\0garbage", 10)),
                      opts, &out),
                  CodecStatus::MalformedContainer);
    }


    TEST(PngTextChunk, InflateLimitApplies)
    {
        PngTextChunk z;
        z.type    = kZtxt;
        z.keyword = "Big";
        z.text    = std::string(100000, 'a');
        std::vector<std::byte> data;
        ASSERT_EQ(encode_png_text_chunk(z, &data), CodecStatus::Ok);

        PngTextOptions opts;
        opts.limits.max_inflate_bytes = 1000;
        PngTextChunk out;
        EXPECT_EQ(decode_png_text_chunk(kZtxt, data, opts, &out),
                  CodecStatus::ResourceLimitExceeded);
    }


    TEST(PngText, DecodesAllButXmp)
    {
        std::vector<std::vector<std::byte>> before;
        before.push_back(test::make_text_chunk("Title", "first"));
        before.push_back(text_chunk(kItxt, kPngXmpKeyword, "<x:xmpmeta/>"));
        before.push_back(text_chunk(kZtxt, "Comment", "zipped", true));
        std::vector<std::vector<std::byte>> after;
        after.push_back(test::make_text_chunk("Title", "second"));
        after.push_back(text_chunk(kItxt, "Author", "\xC3\x85sa"));
        const std::vector<std::byte> png = test::make_png(1, 1, before, after);

        ImageContainer c;
        const FieldMap fields = read_text(png, &c);
        ASSERT_EQ(fields.size(), 3U);
        EXPECT_EQ(fields.find("Title")->value, "first");
        EXPECT_EQ(fields.find("Title")->type_hint, TypeHint::Latin1);
        EXPECT_EQ(fields.find("Comment")->value, "zipped");
        EXPECT_EQ(fields.find("Author")->value, "\xC3\x85sa");
        EXPECT_EQ(fields.find("Author")->type_hint, TypeHint::Utf8);
        EXPECT_FALSE(fields.contains(kPngXmpKeyword));
    }


    TEST(PngChunks, ValidationCatchesCrcAndSize)
    {
        std::vector<std::vector<std::byte>> before;
        before.push_back(test::make_text_chunk("Title", "abcdef"));
        std::vector<std::byte> png = test::make_png(1, 1, before);

        ImageContainer c;
        ASSERT_EQ(scan_container(png, &c), CodecStatus::Ok);
        EXPECT_EQ(validate_png_chunks(png, c, PngLimits {}), CodecStatus::Ok);

        PngLimits tiny;
        tiny.max_chunk_bytes = 8;
        EXPECT_EQ(validate_png_chunks(png, c, tiny), CodecStatus::ChunkTooLarge);

        const ContainerBlockRef& text = c.blocks[2];
        png[static_cast<size_t>(text.data_offset)] = std::byte { 'X' };
        EXPECT_EQ(validate_png_chunks(png, c, PngLimits {}),
                  CodecStatus::ChunkCrcMismatch);

        const PngChunkView view = png_chunk_at(png, text);
        EXPECT_EQ(view.type, kText);
        EXPECT_EQ(view.data.size(), 12U);
    }


    TEST(PngKeyword, Validation)
    {
        EXPECT_EQ(validate_png_keyword("Title"), CodecStatus::Ok);
        EXPECT_EQ(validate_png_keyword("Creation Time"), CodecStatus::Ok);
        EXPECT_EQ(validate_png_keyword("Caf\xC3\xA9"), CodecStatus::Ok);
        EXPECT_EQ(validate_png_keyword(std::string(79, 'k')), CodecStatus::Ok);

        EXPECT_EQ(validate_png_keyword(""), CodecStatus::InvalidFieldValue);
        EXPECT_EQ(validate_png_keyword(std::string(80, 'k')),
                  CodecStatus::InvalidFieldValue);
        EXPECT_EQ(validate_png_keyword(" lead"), CodecStatus::InvalidFieldValue);
        EXPECT_EQ(validate_png_keyword("trail "), CodecStatus::InvalidFieldValue);
        EXPECT_EQ(validate_png_keyword("two  spaces"),
                  CodecStatus::InvalidFieldValue);
        EXPECT_EQ(validate_png_keyword("tab\there"),
                  CodecStatus::InvalidFieldValue);
        EXPECT_EQ(validate_png_keyword("\xE2\x9C\x93"),
                  CodecStatus::InvalidFieldValue);
    }


    TEST(PngTextUpdate, ReplacesRemovesAndAppends)
    {
        std::vector<std::vector<std::byte>> before;
        before.push_back(test::make_text_chunk("Title", "old"));
        before.push_back(test::make_text_chunk("Keep", "me"));
        std::vector<std::vector<std::byte>> after;
        after.push_back(test::make_text_chunk("Title", "older"));
        const std::vector<std::byte> png = test::make_png(1, 1, before, after);

        const std::vector<MetaField> updates = {
            text_field("Title", "new"),
            text_field("Added", "fresh"),
        };
        const std::vector<std::byte> out = apply_updates(png, updates);

        ImageContainer c;
        const FieldMap fields = read_text(out, &c);
        EXPECT_EQ(fields.find("Title")->value, "new");
        EXPECT_EQ(fields.find("Keep")->value, "me");
        EXPECT_EQ(fields.find("Added")->value, "fresh");

        // Title stays where it was; the duplicate is gone; Added sits before IEND.
        ASSERT_EQ(c.blocks.size(), 8U);
        EXPECT_EQ(c.blocks[2].id, kText);
        EXPECT_TRUE(test::contains(block_data(out, c.blocks[2]), "Title"));
        EXPECT_EQ(c.blocks[4].kind, ContainerBlockKind::ImageData);
        EXPECT_EQ(c.blocks[5].kind, ContainerBlockKind::ImageData);
        EXPECT_TRUE(test::contains(block_data(out, c.blocks[6]), "Added"));
        EXPECT_EQ(c.blocks[7].kind, ContainerBlockKind::End);
    }


    TEST(PngTextUpdate, KeepsChunkTypeWherePossible)
    {
        std::vector<std::vector<std::byte>> before;
        before.push_back(text_chunk(kZtxt, "Zipped", "a", true));
        before.push_back(text_chunk(kItxt, "Intl", "b", true, "de"));
        before.push_back(test::make_text_chunk("Plain", "c"));
        const std::vector<std::byte> png = test::make_png(1, 1, before);

        const std::vector<MetaField> updates = {
            text_field("Zipped", "still latin-1 \xC3\xA9"),
            text_field("Intl", "neu"),
            text_field("Plain", "snow \xE2\x98\x83"),
            text_field("Fresh", "\xE2\x98\x83"),
        };
        const std::vector<std::byte> out = apply_updates(png, updates);

        ImageContainer c;
        const FieldMap fields = read_text(out, &c);
        EXPECT_EQ(fields.find("Zipped")->value, "still latin-1 \xC3\xA9");
        EXPECT_EQ(fields.find("Intl")->value, "neu");
        EXPECT_EQ(fields.find("Plain")->value, "snow \xE2\x98\x83");
        EXPECT_EQ(fields.find("Fresh")->value, "\xE2\x98\x83");

        EXPECT_EQ(c.blocks[2].id, kZtxt);
        EXPECT_EQ(c.blocks[3].id, kItxt);
        EXPECT_EQ(c.blocks[4].id, kItxt);

        PngTextChunk intl;
        ASSERT_EQ(decode_png_text_chunk(kItxt, block_data(out, c.blocks[3]),
                                        PngTextOptions {}, &intl),
                  CodecStatus::Ok);
        EXPECT_TRUE(intl.compressed);
        EXPECT_EQ(intl.language, "de");

        const int64_t last_text = static_cast<int64_t>(c.blocks.size()) - 2;
        EXPECT_EQ(c.blocks[static_cast<size_t>(last_text)].id, kItxt);
    }


    TEST(PngTextUpdate, RejectsBadKeysAndValues)
    {
        const std::vector<std::byte> png = test::make_png(1, 1);
        ImageContainer c;
        ASSERT_EQ(scan_container(png, &c), CodecStatus::Ok);

        const std::vector<std::pair<std::string, std::string>> cases = {
            { "", "x" },
            { " padded", "x" },
            { std::string(kPngXmpKeyword), "<x/>" },
            { "Nul", std::string("a\0b", 3) },
            { "BadUtf8", "\xC3" },
        };
        for (const auto& [key, value] : cases) {
            const std::vector<MetaField> updates = {
                text_field("Good", "fine"),
                text_field(key, value),
            };
            std::vector<BlockEdit> edits;
            std::string failed;
            EXPECT_EQ(plan_png_text_update(png, c, updates, &edits, &failed),
                      CodecStatus::InvalidFieldValue)
                << key;
            EXPECT_EQ(failed, key);
            EXPECT_TRUE(edits.empty());
        }
    }


    TEST(PngChunkUpsert, InsertsBeforeImageData)
    {
        const std::vector<std::byte> png = test::make_png(1, 1);
        ImageContainer c;
        ASSERT_EQ(scan_container(png, &c), CodecStatus::Ok);

        std::vector<BlockEdit> edits;
        ASSERT_EQ(plan_png_chunk_upsert(
                      c, ContainerBlockKind::Exif,
                      test::make_png_chunk(fourcc('e', 'X', 'I', 'f'),
                                           test::make_tiff(1, 1)),
                      &edits),
                  CodecStatus::Ok);
        ASSERT_EQ(edits.size(), 1U);
        EXPECT_EQ(edits[0].kind, BlockEditKind::InsertBefore);
        EXPECT_EQ(edits[0].block_index, 2U);

        std::vector<std::byte> out;
        ASSERT_EQ(splice_container(png, c, edits, &out), CodecStatus::Ok);
        ImageContainer c2;
        ASSERT_EQ(scan_container(out, &c2), CodecStatus::Ok);
        EXPECT_EQ(c2.blocks[2].kind, ContainerBlockKind::Exif);

        edits.clear();
        ASSERT_EQ(plan_png_chunk_upsert(
                      c2, ContainerBlockKind::Exif,
                      test::make_png_chunk(fourcc('e', 'X', 'I', 'f'),
                                           test::make_tiff(2, 2)),
                      &edits),
                  CodecStatus::Ok);
        ASSERT_EQ(edits.size(), 1U);
        EXPECT_EQ(edits[0].kind, BlockEditKind::Replace);
        EXPECT_EQ(edits[0].block_index, 2U);
    }

}  // namespace
}  // namespace metasplice
