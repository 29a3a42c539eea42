#include "openchunk/console_format.h"

#include <gtest/gtest.h>

#include <span>
#include <string>
#include <string_view>

namespace openchunk {
namespace {

    static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

    static std::span<const std::byte> as_span(std::string_view s)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(s.data()), s.size());
    }


    static std::string lossy(std::string_view s, bool* replaced = nullptr)
    {
        std::string out;
        const bool r = append_utf8_lossy(as_span(s), &out);
        if (replaced) {
            *replaced = r;
        }
        return out;
    }


    static std::string repeat_replacement(uint32_t n)
    {
        std::string out;
        for (uint32_t i = 0; i < n; ++i) {
            out.append(kReplacement);
        }
        return out;
    }

}  // namespace

TEST(ConsoleFormat, Utf8LossyKeepsValidText)
{
    bool replaced = true;
    EXPECT_EQ(lossy("plain ascii", &replaced), "plain ascii");
    EXPECT_FALSE(replaced);

    // U+00E9, U+20AC, U+1F600
    const std::string_view mixed = "\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_EQ(lossy(mixed, &replaced), mixed);
    EXPECT_FALSE(replaced);
}


TEST(ConsoleFormat, Utf8LossyReplacesInvalidLeads)
{
    bool replaced = false;
    EXPECT_EQ(lossy("a\x80z", &replaced), "a" + std::string(kReplacement) + "z");
    EXPECT_TRUE(replaced);
    EXPECT_EQ(lossy("\xC0\xAF"), repeat_replacement(2));
    EXPECT_EQ(lossy("\xF5\xFF"), repeat_replacement(2));
}


TEST(ConsoleFormat, Utf8LossyMaximalSubparts)
{
    // Truncated 3-byte sequence followed by ASCII: one replacement.
    EXPECT_EQ(lossy("\xE2\x82z"), std::string(kReplacement) + "z");
    // Truncated at end of input.
    EXPECT_EQ(lossy("ab\xF0\x9F\x98"), "ab" + std::string(kReplacement));
    // Overlong 3-byte form: E0 80 is not a valid prefix.
    EXPECT_EQ(lossy("\xE0\x80\x80"), repeat_replacement(3));
    // UTF-16 surrogate U+D800.
    EXPECT_EQ(lossy("\xED\xA0\x80"), repeat_replacement(3));
    // Above U+10FFFF.
    EXPECT_EQ(lossy("\xF4\x90\x80\x80"), repeat_replacement(4));
    // Invalid byte inside a sequence is reconsidered as a lead.
    EXPECT_EQ(lossy("\xE2\xC3\xA9"), std::string(kReplacement) + "\xC3\xA9");
}


TEST(ConsoleFormat, EscapesControlAndNonAscii)
{
    std::string out;
    const bool escaped = append_console_escaped(as_span("a\nb\t\"c\"\\\x01\xFF"),
                                                0, &out);
    EXPECT_TRUE(escaped);
    EXPECT_EQ(out, "a\\nb\\t\\\"c\\\"\\\\\\x01\\xFF");

    out.clear();
    EXPECT_FALSE(append_console_escaped(as_span("safe text"), 0, &out));
    EXPECT_EQ(out, "safe text");
}


TEST(ConsoleFormat, EscapeTruncates)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped(as_span("abcdef"), 3, &out));
    EXPECT_EQ(out, "abc...");
}


TEST(ConsoleFormat, HexBytes)
{
    const std::byte raw[] = {
        std::byte { 0x00 },
        std::byte { 0x1F },
        std::byte { 0xAB },
        std::byte { 0xFF },
    };
    std::string out;
    append_hex_bytes(raw, 0, &out);
    EXPECT_EQ(out, "00 1F AB FF");

    out.clear();
    append_hex_bytes(raw, 2, &out);
    EXPECT_EQ(out, "00 1F...");

    out.clear();
    append_hex_bytes({}, 0, &out);
    EXPECT_TRUE(out.empty());
}

}  // namespace openchunk
