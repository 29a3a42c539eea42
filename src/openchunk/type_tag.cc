#include "openchunk/type_tag.h"

namespace openchunk {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static constexpr bool is_upper(std::byte b) noexcept
    {
        return u8(b) >= 'A' && u8(b) <= 'Z';
    }


    static constexpr bool is_lower(std::byte b) noexcept
    {
        return u8(b) >= 'a' && u8(b) <= 'z';
    }

}  // namespace

TypeTag::TypeTag(const std::array<std::byte, kTypeTagSize>& bytes) noexcept
    : bytes_(bytes)
{
}


TypeTagResult
TypeTag::from_bytes(std::span<const std::byte> bytes,
                    std::optional<TypeTag>* out) noexcept
{
    TypeTagResult res;
    if (out) {
        out->reset();
    }

    if (bytes.size() != kTypeTagSize) {
        res.status = TypeTagStatus::WrongLength;
        return res;
    }

    std::array<std::byte, kTypeTagSize> tag {};
    for (uint32_t i = 0; i < kTypeTagSize; ++i) {
        if (!is_valid_tag_byte(u8(bytes[i]))) {
            res.status = TypeTagStatus::InvalidByte;
            res.offset = i;
            return res;
        }
        tag[i] = bytes[i];
    }

    if (out) {
        *out = TypeTag(tag);
    }
    return res;
}


TypeTagResult
TypeTag::from_string(std::string_view text,
                     std::optional<TypeTag>* out) noexcept
{
    const std::span<const std::byte> bytes(
        reinterpret_cast<const std::byte*>(text.data()), text.size());
    return from_bytes(bytes, out);
}


std::array<std::byte, kTypeTagSize>
TypeTag::bytes() const noexcept
{
    return bytes_;
}


uint32_t
TypeTag::fourcc() const noexcept
{
    return (static_cast<uint32_t>(u8(bytes_[0])) << 24)
           | (static_cast<uint32_t>(u8(bytes_[1])) << 16)
           | (static_cast<uint32_t>(u8(bytes_[2])) << 8)
           | (static_cast<uint32_t>(u8(bytes_[3])) << 0);
}


bool
TypeTag::is_critical() const noexcept
{
    return is_upper(bytes_[0]);
}


bool
TypeTag::is_public() const noexcept
{
    return is_upper(bytes_[1]);
}


bool
TypeTag::is_reserved_bit_valid() const noexcept
{
    return is_upper(bytes_[2]);
}


bool
TypeTag::is_valid() const noexcept
{
    return is_reserved_bit_valid();
}


bool
TypeTag::is_safe_to_copy() const noexcept
{
    return is_lower(bytes_[3]);
}


std::string
TypeTag::to_string() const
{
    std::string s;
    s.reserve(kTypeTagSize);
    for (uint32_t i = 0; i < kTypeTagSize; ++i) {
        s.push_back(static_cast<char>(u8(bytes_[i])));
    }
    return s;
}


const char*
type_tag_status_name(TypeTagStatus status) noexcept
{
    switch (status) {
    case TypeTagStatus::Ok: return "ok";
    case TypeTagStatus::WrongLength: return "wrong_length";
    case TypeTagStatus::InvalidByte: return "invalid_byte";
    }
    return "unknown";
}

}  // namespace openchunk
