#include "openchunk/chunk_crc.h"

#include <zlib.h>

namespace openchunk {

uint32_t
crc32_update(uint32_t crc, std::span<const std::byte> bytes) noexcept
{
    // zlib takes uInt lengths; feed large buffers in pieces.
    static constexpr size_t kMaxPiece = 1U << 30;

    uLong v    = static_cast<uLong>(crc);
    size_t off = 0;
    while (off < bytes.size()) {
        const size_t remaining = bytes.size() - off;
        const size_t n = (remaining < kMaxPiece) ? remaining : kMaxPiece;
        v = ::crc32(v, reinterpret_cast<const Bytef*>(bytes.data() + off),
                    static_cast<uInt>(n));
        off += n;
    }
    return static_cast<uint32_t>(v & 0xFFFFFFFFUL);
}


uint32_t
crc32_bytes(std::span<const std::byte> bytes) noexcept
{
    return crc32_update(kCrc32Init, bytes);
}


uint32_t
chunk_crc(const TypeTag& tag, std::span<const std::byte> payload) noexcept
{
    const std::array<std::byte, kTypeTagSize> tag_bytes = tag.bytes();
    const uint32_t crc = crc32_update(kCrc32Init, tag_bytes);
    return crc32_update(crc, payload);
}

}  // namespace openchunk
