#pragma once

#include "openchunk/chunk.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for OpenChunk read/write tools and bindings.
 */

namespace openchunk {

/**
 * \brief Storage-agnostic resource limits for untrusted chunk input.
 *
 * The library itself defaults to no limits; front ends start from this
 * policy so that a hostile length field cannot drive a huge allocation.
 */
struct ChunkResourcePolicy final {
    /// Optional input file cap (0 = unlimited).
    uint64_t max_file_bytes = 512ULL * 1024ULL * 1024ULL;

    /// Chunk decode budgets. PNG caps chunk lengths at 2^31 - 1.
    ChunkDecodeLimits decode_limits = { 0x7FFFFFFFU };

    /// Payload bytes rendered by console dumps (0 = unlimited).
    uint32_t max_display_bytes = 256;
};

inline void
apply_resource_policy(const ChunkResourcePolicy& policy,
                      ChunkDecodeOptions* decode) noexcept
{
    if (decode) {
        decode->limits = policy.decode_limits;
    }
}

}  // namespace openchunk
