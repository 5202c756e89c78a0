#include <gtest/gtest.h>
#include "disk_triage/utils.hpp"

namespace disk_triage {
namespace {

bool is_valid_utf8(const std::string& text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[pos]);
        std::size_t length = 1;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
        } else if (lead >= 0x80) {
            return false;
        }
        if (pos + length > text.size()) {
            return false;
        }
        for (std::size_t i = 1; i < length; ++i) {
            if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) {
                return false;
            }
        }
        pos += length;
    }
    return true;
}

TEST(FormatHumanSizeTest, BytesBelowOneKilobyteAreIntegers) {
    EXPECT_EQ(format_human_size(0), "0 B");
    EXPECT_EQ(format_human_size(1), "1 B");
    EXPECT_EQ(format_human_size(1023), "1023 B");
}

TEST(FormatHumanSizeTest, BinaryUnitsUseTwoDecimals) {
    EXPECT_EQ(format_human_size(1024), "1.00 KB");
    EXPECT_EQ(format_human_size(1536), "1.50 KB");
    EXPECT_EQ(format_human_size(1048576), "1.00 MB");
    EXPECT_EQ(format_human_size(1073741824LL), "1.00 GB");
}

TEST(FormatHumanSizeTest, GigabytesIsTheLargestUnit) {
    EXPECT_EQ(format_human_size(2048LL * 1073741824LL), "2048.00 GB");
}

TEST(FormatHumanSizeTest, NegativeSizesRenderAsZero) {
    EXPECT_EQ(format_human_size(-1), "0 B");
    EXPECT_EQ(format_human_size(-4096), "0 B");
}

TEST(JsonEscapeTest, EscapesQuotesBackslashesAndControls) {
    EXPECT_EQ(json_escape("a\"b"), "a\\\"b");
    EXPECT_EQ(json_escape("C:\\dir"), "C:\\\\dir");
    EXPECT_EQ(json_escape("line\nnext\t"), "line\\nnext\\t");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
}

TEST(JsonEscapeTest, KeepsUtf8BytesIntact) {
    EXPECT_EQ(json_escape("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(json_escape("\xE2\x82\xAC \xF0\x9F\x93\x81"), "\xE2\x82\xAC \xF0\x9F\x93\x81");
}

TEST(JsonEscapeTest, EscapesBytesThatAreNotUtf8) {
    const std::string escaped = json_escape("bad\xffname");
    EXPECT_EQ(escaped, "bad\\u00FFname");
    EXPECT_TRUE(is_valid_utf8(escaped));
}

TEST(JsonEscapeTest, EscapesTruncatedAndOverlongSequences) {
    EXPECT_EQ(json_escape("end\xC3"), "end\\u00C3");
    EXPECT_EQ(json_escape("\xC0\xAF"), "\\u00C0\\u00AF");
    EXPECT_EQ(json_escape("\xED\xA0\x80"), "\\u00ED\\u00A0\\u0080");
    EXPECT_TRUE(is_valid_utf8(json_escape("\xE2\x82x\x80")));
}

}  // namespace
}  // namespace disk_triage
