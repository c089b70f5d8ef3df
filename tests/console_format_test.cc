#include "metasplice/console_format.h"

#include <gtest/gtest.h>

#include <string>

namespace metasplice {

TEST(ConsoleFormat, PassesPrintableUtf8)
{
    std::string out;
    EXPECT_FALSE(append_console_escaped("Caf\xC3\xA9 \xE2\x98\x83", 0, &out));
    EXPECT_EQ(out, "Caf\xC3\xA9 \xE2\x98\x83");
}


TEST(ConsoleFormat, EscapesControls)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped("a\nb\tc\x1B[0m", 0, &out));
    EXPECT_EQ(out, "a\\nb\\tc\\x1B[0m");

    out.clear();
    EXPECT_FALSE(append_console_escaped("say \"hi\" \\", 0, &out));
    EXPECT_EQ(out, "say \\\"hi\\\" \\\\");

    out.clear();
    EXPECT_TRUE(append_console_escaped("\xC2\x85", 0, &out));
    EXPECT_EQ(out, "\\u{85}");

    out.clear();
    EXPECT_TRUE(append_console_escaped("bad\xFF", 0, &out));
    EXPECT_EQ(out, "bad\\xFF");
}


TEST(ConsoleFormat, Truncates)
{
    std::string out = "k=";
    EXPECT_TRUE(append_console_escaped("abcdefgh", 4, &out));
    EXPECT_EQ(out, "k=abcd...");
}

}  // namespace metasplice
