#include "openchunk/chunk.h"
#include "openchunk/chunk_crc.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

namespace openchunk {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
verify_parsed(std::span<const std::byte> bytes, const ChunkParseResult& res,
              const Chunk& chunk)
{
    if (res.consumed != serialized_size(chunk) || res.consumed > bytes.size()) {
        fuzz_trap();
    }
    if (chunk.crc() != chunk_crc(chunk.chunk_type(), chunk.data())) {
        fuzz_trap();
    }

    // The accepted prefix must re-encode byte for byte.
    const std::vector<std::byte> again = chunk.serialize();
    if (again.size() != res.consumed
        || std::memcmp(again.data(), bytes.data(), again.size()) != 0) {
        fuzz_trap();
    }

    std::optional<Chunk> reparsed;
    const ChunkParseResult res2 = parse_chunk(again, &reparsed);
    if (res2.status != ChunkStatus::Ok || !reparsed || *reparsed != chunk) {
        fuzz_trap();
    }
}

}  // namespace openchunk

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace openchunk;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    ChunkDecodeOptions options;
    options.limits.max_payload_bytes = 1U << 20;

    std::optional<Chunk> chunk;
    const ChunkParseResult res = parse_chunk(bytes, &chunk, options);
    if (res.status == ChunkStatus::Ok) {
        if (!chunk) {
            fuzz_trap();
        }
        verify_parsed(bytes, res, *chunk);
    } else if (chunk || res.consumed != 0U) {
        fuzz_trap();
    }
    return 0;
}
