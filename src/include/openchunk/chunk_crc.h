#pragma once

#include "openchunk/type_tag.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file chunk_crc.h
 * \brief CRC-32 (ISO-HDLC / PNG) over chunk tag and payload bytes.
 */

namespace openchunk {

/// Initial running value for \ref crc32_update.
static constexpr uint32_t kCrc32Init = 0;

/**
 * \brief Feeds \p bytes into a running CRC-32 and returns the new value.
 *
 * Polynomial 0x04C11DB7 (reflected), init/xorout 0xFFFFFFFF. The pre/post
 * inversion is applied internally, so the returned value is always the
 * final CRC of everything fed so far; start from \ref kCrc32Init.
 */
uint32_t
crc32_update(uint32_t crc, std::span<const std::byte> bytes) noexcept;

/// CRC-32 of a single buffer.
uint32_t
crc32_bytes(std::span<const std::byte> bytes) noexcept;

/// CRC-32 of `tag.bytes() ++ payload`, the value stored in a chunk trailer.
uint32_t
chunk_crc(const TypeTag& tag, std::span<const std::byte> payload) noexcept;

}  // namespace openchunk
