#include "openchunk/chunk.h"

#include "openchunk/chunk_crc.h"
#include "openchunk/console_format.h"

#include <cstring>
#include <utility>

namespace openchunk {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
        return true;
    }


    static void write_u32be(std::byte* out, uint32_t v) noexcept
    {
        out[0] = std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) };
        out[1] = std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) };
        out[2] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
        out[3] = std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) };
    }

}  // namespace

Chunk::Chunk(TypeTag tag, std::vector<std::byte> payload)
    : tag_(std::move(tag))
    , payload_(std::move(payload))
{
    crc_ = chunk_crc(tag_, payload_);
}


uint32_t
Chunk::length() const noexcept
{
    return (payload_.size() > 0xFFFFFFFFULL)
               ? 0xFFFFFFFFU
               : static_cast<uint32_t>(payload_.size());
}


const TypeTag&
Chunk::chunk_type() const noexcept
{
    return tag_;
}


std::span<const std::byte>
Chunk::data() const noexcept
{
    return payload_;
}


uint32_t
Chunk::crc() const noexcept
{
    return crc_;
}


std::string
Chunk::data_as_string() const
{
    std::string s;
    (void)append_utf8_lossy(payload_, &s);
    return s;
}


std::vector<std::byte>
Chunk::as_bytes() const
{
    return payload_;
}


std::vector<std::byte>
Chunk::serialize() const
{
    std::vector<std::byte> out;
    if (payload_.size() > 0xFFFFFFFFULL) {
        return out;
    }
    out.resize(static_cast<size_t>(serialized_size(*this)));
    const ChunkWriteResult res = write_chunk(*this, out);
    if (res.status != ChunkWriteStatus::Ok) {
        out.clear();
    }
    return out;
}


ChunkParseResult
parse_chunk(std::span<const std::byte> bytes, std::optional<Chunk>* out,
            const ChunkDecodeOptions& options)
{
    ChunkParseResult res;
    if (out) {
        out->reset();
    }

    uint32_t len = 0;
    if (!read_u32be(bytes, 0, &len)) {
        res.status = ChunkStatus::Truncated;
        res.needed = 4;
        return res;
    }

    const uint64_t data_size  = static_cast<uint64_t>(len);
    const uint64_t chunk_size = kChunkOverheadSize + data_size;
    res.needed                = chunk_size;

    const uint32_t max_payload = options.limits.max_payload_bytes;
    if (max_payload != 0U && len > max_payload) {
        res.status = ChunkStatus::LimitExceeded;
        return res;
    }
    if (chunk_size > bytes.size()) {
        res.status = ChunkStatus::Truncated;
        return res;
    }

    std::optional<TypeTag> tag;
    const TypeTagResult tag_res = TypeTag::from_bytes(bytes.subspan(4, 4),
                                                      &tag);
    if (tag_res.status != TypeTagStatus::Ok) {
        res.status     = ChunkStatus::InvalidTag;
        res.tag_status = tag_res.status;
        res.tag_offset = tag_res.offset;
        return res;
    }

    const std::span<const std::byte> payload
        = bytes.subspan(8, static_cast<size_t>(data_size));
    Chunk chunk(std::move(*tag),
                std::vector<std::byte>(payload.begin(), payload.end()));

    uint32_t stored_crc = 0;
    (void)read_u32be(bytes, 8 + data_size, &stored_crc);
    res.stored_crc   = stored_crc;
    res.computed_crc = chunk.crc();
    if (stored_crc != chunk.crc()) {
        res.status = ChunkStatus::ChecksumMismatch;
        return res;
    }

    res.consumed = chunk_size;
    if (out) {
        out->emplace(std::move(chunk));
    }
    return res;
}


uint64_t
serialized_size(const Chunk& chunk) noexcept
{
    return kChunkOverheadSize + static_cast<uint64_t>(chunk.data().size());
}


ChunkWriteResult
write_chunk(const Chunk& chunk, std::span<std::byte> out) noexcept
{
    ChunkWriteResult res;
    const std::span<const std::byte> payload = chunk.data();
    if (payload.size() > 0xFFFFFFFFULL) {
        res.status = ChunkWriteStatus::PayloadTooLarge;
        return res;
    }

    res.needed = serialized_size(chunk);
    if (res.needed > out.size()) {
        res.status = ChunkWriteStatus::OutputTruncated;
        return res;
    }

    std::byte* p = out.data();
    write_u32be(p, static_cast<uint32_t>(payload.size()));
    const std::array<std::byte, kTypeTagSize> tag = chunk.chunk_type().bytes();
    std::memcpy(p + 4, tag.data(), tag.size());
    if (!payload.empty()) {
        std::memcpy(p + 8, payload.data(), payload.size());
    }
    write_u32be(p + 8 + payload.size(), chunk.crc());

    res.written = res.needed;
    return res;
}


const char*
chunk_status_name(ChunkStatus status) noexcept
{
    switch (status) {
    case ChunkStatus::Ok: return "ok";
    case ChunkStatus::Truncated: return "truncated";
    case ChunkStatus::InvalidTag: return "invalid_tag";
    case ChunkStatus::ChecksumMismatch: return "checksum_mismatch";
    case ChunkStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


const char*
chunk_write_status_name(ChunkWriteStatus status) noexcept
{
    switch (status) {
    case ChunkWriteStatus::Ok: return "ok";
    case ChunkWriteStatus::OutputTruncated: return "output_truncated";
    case ChunkWriteStatus::PayloadTooLarge: return "payload_too_large";
    }
    return "unknown";
}

}  // namespace openchunk
