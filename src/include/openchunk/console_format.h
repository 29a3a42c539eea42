#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace openchunk {

// Appends the UTF-8 decoding of `bytes` into `out`, replacing every maximal
// invalid subsequence with U+FFFD (EF BF BD). Never fails.
//
// Rejected: stray continuation bytes, C0/C1/F5..FF leads, overlong forms,
// UTF-16 surrogates (ED A0..BF), code points above U+10FFFF and sequences
// cut short by the end of input.
//
// Returns true when at least one replacement was emitted.
bool
append_utf8_lossy(std::span<const std::byte> bytes, std::string* out);

// Appends an ASCII-only, terminal-safe representation of `bytes` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`, backslash and double quote
// - Truncates to `max_bytes` input bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped(std::span<const std::byte> bytes, uint32_t max_bytes,
                       std::string* out);

// Appends uppercase hex bytes into `out`, space separated (no "0x" prefix).
// Truncates to `max_bytes` (0 = unlimited) and appends "..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out);

}  // namespace openchunk
