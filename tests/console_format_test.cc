#include "photoclean/console_format.h"

#include <gtest/gtest.h>

#include <string>

namespace photoclean {
namespace {

    TEST(ConsoleFormat, PlainAsciiPassesThrough)
    {
        std::string out = "name: ";
        EXPECT_FALSE(append_console_escaped_ascii("IMG_0001.jpg", 0, &out));
        EXPECT_EQ(out, "name: IMG_0001.jpg");
    }


    TEST(ConsoleFormat, ControlAndNonAsciiAreEscaped)
    {
        std::string out;
        EXPECT_TRUE(append_console_escaped_ascii("a\nb\tc\x1b[0m", 0, &out));
        EXPECT_EQ(out, "a\\nb\\tc\\x1B[0m");

        out.clear();
        EXPECT_TRUE(append_console_escaped_ascii("caf\xC3\xA9.png", 0, &out));
        EXPECT_EQ(out, "caf\\xC3\\xA9.png");

        out.clear();
        append_console_escaped_ascii("C:\\dir", 0, &out);
        EXPECT_EQ(out, "C:\\\\dir");
    }


    TEST(ConsoleFormat, TruncatesLongNames)
    {
        std::string out;
        EXPECT_TRUE(append_console_escaped_ascii("abcdefgh", 3, &out));
        EXPECT_EQ(out, "abc...");

        out.clear();
        EXPECT_FALSE(append_console_escaped_ascii("abc", 3, &out));
        EXPECT_EQ(out, "abc");
    }


    TEST(ConsoleFormat, ByteSizes)
    {
        std::string out;
        append_byte_size(0, &out);
        EXPECT_EQ(out, "0 B");

        out.clear();
        append_byte_size(1023, &out);
        EXPECT_EQ(out, "1023 B");

        out.clear();
        append_byte_size(1536, &out);
        EXPECT_EQ(out, "1.5 KiB");

        out.clear();
        append_byte_size(12ULL * 1024 * 1024, &out);
        EXPECT_EQ(out, "12.0 MiB");

        out.clear();
        append_byte_size(3ULL << 40, &out);
        EXPECT_EQ(out, "3.0 TiB");

        out.clear();
        append_byte_size(2048ULL << 40, &out);
        EXPECT_EQ(out, "2048.0 TiB");
    }

}  // namespace
}  // namespace photoclean
