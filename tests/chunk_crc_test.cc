#include "openchunk/chunk_crc.h"

#include <gtest/gtest.h>

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace openchunk {
namespace {

    static std::span<const std::byte> as_span(std::string_view s)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(s.data()), s.size());
    }

}  // namespace

TEST(ChunkCrc, CheckValue)
{
    EXPECT_EQ(crc32_bytes(as_span("123456789")), 0xCBF43926U);
    EXPECT_EQ(crc32_bytes({}), 0U);
}


TEST(ChunkCrc, IncrementalMatchesOneShot)
{
    const std::string_view text = "RuStThis is where your secret message will be!";
    uint32_t crc = kCrc32Init;
    for (size_t i = 0; i < text.size(); i += 5) {
        crc = crc32_update(crc, as_span(text.substr(i, 5)));
    }
    EXPECT_EQ(crc, crc32_bytes(as_span(text)));
    EXPECT_EQ(crc, 2882656334U);
}


TEST(ChunkCrc, ChunkCrcCoversTagThenPayload)
{
    std::optional<TypeTag> tag;
    ASSERT_EQ(TypeTag::from_string("IEND", &tag).status, TypeTagStatus::Ok);
    EXPECT_EQ(chunk_crc(*tag, {}), 0xAE426082U);
    EXPECT_EQ(chunk_crc(*tag, as_span("x")), crc32_bytes(as_span("IENDx")));
}

}  // namespace openchunk
