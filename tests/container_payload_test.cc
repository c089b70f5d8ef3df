#include "metasplice/container_payload.h"

#include "test_images.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace metasplice {
namespace {

    TEST(ContainerPayload, DeflateThenInflate)
    {
        std::string text;
        for (int i = 0; i < 5000; ++i) {
            text.append("repeated metadata text ");
        }
        const std::vector<std::byte> in = test::bytes_of(text);

        std::vector<std::byte> packed;
        ASSERT_EQ(deflate_zlib(in, &packed), CodecStatus::Ok);
        EXPECT_LT(packed.size(), in.size());

        std::vector<std::byte> unpacked;
        ASSERT_EQ(inflate_zlib(packed, PayloadLimits {}, &unpacked),
                  CodecStatus::Ok);
        EXPECT_EQ(unpacked, in);
    }


    TEST(ContainerPayload, InflateEnforcesOutputLimit)
    {
        const std::vector<std::byte> zeros(1 << 20, std::byte { 0 });
        std::vector<std::byte> packed;
        ASSERT_EQ(deflate_zlib(zeros, &packed), CodecStatus::Ok);

        PayloadLimits limits;
        limits.max_output_bytes = 4096;
        std::vector<std::byte> out;
        EXPECT_EQ(inflate_zlib(packed, limits, &out),
                  CodecStatus::ResourceLimitExceeded);
        EXPECT_TRUE(out.empty());
    }


    TEST(ContainerPayload, InflateRejectsDamagedStreams)
    {
        std::vector<std::byte> packed;
        ASSERT_EQ(deflate_zlib(test::bytes_of("hello hello hello"), &packed),
                  CodecStatus::Ok);

        std::vector<std::byte> out;
        const std::vector<std::byte> cut(packed.begin(), packed.end() - 6);
        EXPECT_EQ(inflate_zlib(cut, PayloadLimits {}, &out),
                  CodecStatus::MalformedContainer);
        EXPECT_EQ(inflate_zlib(test::bytes_of("not zlib at all"),
                               PayloadLimits {}, &out),
                  CodecStatus::MalformedContainer);
        EXPECT_EQ(inflate_zlib({}, PayloadLimits {}, &out),
                  CodecStatus::MalformedContainer);
    }


    TEST(ContainerPayload, Crc32MatchesKnownValues)
    {
        // PNG IEND chunk CRC.
        EXPECT_EQ(crc32_of(test::bytes_of("IEND")), 0xAE426082U);
        EXPECT_EQ(crc32_of(test::bytes_of("123456789")), 0xCBF43926U);
        EXPECT_EQ(crc32_of(test::bytes_of("1234"), test::bytes_of("56789")),
                  0xCBF43926U);
    }

}  // namespace
}  // namespace metasplice
