#pragma once

#include "openchunk/type_tag.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

/**
 * \file chunk.h
 * \brief Length-prefixed, type-tagged, CRC-verified chunks (PNG layout).
 *
 * Wire layout, all integers big-endian:
 *
 *     length (4) | type tag (4) | payload (length) | crc32(tag ++ payload) (4)
 */

namespace openchunk {

/// Bytes of framing around the payload (length + tag + crc).
static constexpr uint32_t kChunkOverheadSize = 12;

/// Chunk parse result status.
enum class ChunkStatus : uint8_t {
    Ok,
    /// Input ends before the declared chunk does; \ref ChunkParseResult::needed
    /// reports the required size.
    Truncated,
    /// The type tag failed validation; see \ref ChunkParseResult::tag_status.
    InvalidTag,
    /// The trailing CRC does not match the tag and payload.
    ChecksumMismatch,
    /// The declared length exceeds \ref ChunkDecodeLimits::max_payload_bytes.
    LimitExceeded,
};

/// Resource limits applied while parsing to bound hostile inputs.
struct ChunkDecodeLimits final {
    /// Maximum accepted payload length (0 = unlimited).
    uint32_t max_payload_bytes = 0;
};

/// Decoder options for \ref parse_chunk.
struct ChunkDecodeOptions final {
    ChunkDecodeLimits limits;
};

struct ChunkParseResult final {
    ChunkStatus status = ChunkStatus::Ok;
    /// Bytes occupied by the parsed chunk (0 unless status is Ok).
    uint64_t consumed = 0;
    /// Bytes the chunk requires, as far as could be determined.
    uint64_t needed = 0;

    TypeTagStatus tag_status = TypeTagStatus::Ok;
    uint32_t tag_offset      = 0;

    uint32_t stored_crc   = 0;
    uint32_t computed_crc = 0;
};

/// Chunk serialization result status.
enum class ChunkWriteStatus : uint8_t {
    Ok,
    /// Output buffer was too small; \ref ChunkWriteResult::needed reports required size.
    OutputTruncated,
    /// Payload length does not fit the 32-bit length field.
    PayloadTooLarge,
};

struct ChunkWriteResult final {
    ChunkWriteStatus status = ChunkWriteStatus::Ok;
    uint64_t written        = 0;
    uint64_t needed         = 0;
};

/**
 * \brief An immutable chunk: type tag, owned payload and its CRC.
 *
 * The CRC is computed on construction and cannot be set independently, so
 * `crc() == chunk_crc(chunk_type(), data())` holds for every instance.
 */
class Chunk final {
public:
    Chunk(TypeTag tag, std::vector<std::byte> payload);

    /// Payload length in bytes.
    uint32_t length() const noexcept;
    const TypeTag& chunk_type() const noexcept;
    std::span<const std::byte> data() const noexcept;
    uint32_t crc() const noexcept;

    /// Payload decoded as UTF-8, invalid sequences replaced with U+FFFD.
    /// For display only.
    std::string data_as_string() const;
    /// Returns a copy of the payload.
    std::vector<std::byte> as_bytes() const;

    /// Returns the wire encoding (empty if the payload exceeds 4 GiB - 1).
    std::vector<std::byte> serialize() const;

    friend bool operator==(const Chunk& a, const Chunk& b) noexcept
    {
        return a.crc_ == b.crc_ && a.tag_ == b.tag_
               && a.payload_ == b.payload_;
    }
    friend bool operator!=(const Chunk& a, const Chunk& b) noexcept
    {
        return !(a == b);
    }

private:
    TypeTag tag_;
    std::vector<std::byte> payload_;
    uint32_t crc_ = 0;
};

/**
 * \brief Parses one chunk from the start of \p bytes.
 *
 * Checks run in wire order: length field, declared size against the
 * available bytes, type tag, then the CRC. On success \p out holds the chunk
 * and \ref ChunkParseResult::consumed its encoded size; trailing bytes are
 * left untouched. On any failure \p out is left empty.
 */
ChunkParseResult
parse_chunk(std::span<const std::byte> bytes, std::optional<Chunk>* out,
            const ChunkDecodeOptions& options = ChunkDecodeOptions {});

/// Encoded size of \p chunk (payload + \ref kChunkOverheadSize).
uint64_t
serialized_size(const Chunk& chunk) noexcept;

/**
 * \brief Writes the wire encoding of \p chunk into \p out.
 *
 * Nothing is written unless the whole chunk fits; on OutputTruncated
 * \ref ChunkWriteResult::needed reports the required size.
 */
ChunkWriteResult
write_chunk(const Chunk& chunk, std::span<std::byte> out) noexcept;

/// Returns a stable lowercase name for \p status.
const char*
chunk_status_name(ChunkStatus status) noexcept;

/// Returns a stable lowercase name for \p status.
const char*
chunk_write_status_name(ChunkWriteStatus status) noexcept;

}  // namespace openchunk
