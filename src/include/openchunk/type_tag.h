#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/**
 * \file type_tag.h
 * \brief Validated 4-byte chunk type tags and their case-bit classification.
 */

namespace openchunk {

/// Size of a chunk type tag in bytes.
static constexpr uint32_t kTypeTagSize = 4;

/// Type tag validation status.
enum class TypeTagStatus : uint8_t {
    Ok,
    /// Input was not exactly \ref kTypeTagSize bytes.
    WrongLength,
    /// A byte is not an ASCII letter; \ref TypeTagResult::offset reports it.
    InvalidByte,
};

struct TypeTagResult final {
    TypeTagStatus status = TypeTagStatus::Ok;
    /// Index of the first rejected byte (only meaningful for InvalidByte).
    uint32_t offset = 0;
};

/// Returns true for `A-Z` and `a-z`.
static constexpr bool
is_valid_tag_byte(uint8_t b) noexcept
{
    return (b >= 65U && b <= 90U) || (b >= 97U && b <= 122U);
}

/**
 * \brief A 4-byte chunk type identifier.
 *
 * Every byte is an ASCII letter. The case of each byte carries one property
 * bit (uppercase = bit 5 clear):
 * - byte 0: critical (uppercase) vs. ancillary
 * - byte 1: public (uppercase) vs. private
 * - byte 2: reserved bit, must be uppercase in a conforming tag
 * - byte 3: safe to copy (lowercase) vs. unsafe
 *
 * Instances are only produced by \ref from_bytes / \ref from_string.
 */
class TypeTag final {
public:
    /// Validates \p bytes and stores the tag in \p out (reset on failure).
    static TypeTagResult from_bytes(std::span<const std::byte> bytes,
                                    std::optional<TypeTag>* out) noexcept;
    /// Same as \ref from_bytes for a 4-character ASCII string.
    static TypeTagResult from_string(std::string_view text,
                                     std::optional<TypeTag>* out) noexcept;

    /// Returns a copy of the tag bytes.
    std::array<std::byte, kTypeTagSize> bytes() const noexcept;
    /// Packs the tag bytes big-endian (wire order).
    uint32_t fourcc() const noexcept;

    bool is_critical() const noexcept;
    bool is_public() const noexcept;
    bool is_reserved_bit_valid() const noexcept;
    /// Alias of \ref is_reserved_bit_valid.
    bool is_valid() const noexcept;
    bool is_safe_to_copy() const noexcept;

    /// Returns the tag as a 4-character string.
    std::string to_string() const;

    friend bool operator==(const TypeTag& a, const TypeTag& b) noexcept
    {
        return a.bytes_ == b.bytes_;
    }
    friend bool operator!=(const TypeTag& a, const TypeTag& b) noexcept
    {
        return !(a == b);
    }

private:
    explicit TypeTag(const std::array<std::byte, kTypeTagSize>& bytes) noexcept;

    std::array<std::byte, kTypeTagSize> bytes_;
};

/// Returns a stable lowercase name for \p status.
const char*
type_tag_status_name(TypeTagStatus status) noexcept;

}  // namespace openchunk
