#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace metasplice {

// Appends a terminal-safe representation of the UTF-8 text `s` into `out`.
//
// Behavior:
// - Passes valid multi-byte UTF-8 sequences through
// - Escapes `\n`, `\r`, `\t`, `\\` and `"`
// - Escapes other control characters (C0, DEL, C1) and invalid bytes as
//   `\xNN` / `\u{NN}`
// - Truncates to `max_bytes` input bytes (0 = unlimited) and appends "..."
//
// Returns true when control characters, invalid bytes or truncation were
// found.
bool
append_console_escaped(std::string_view s, uint32_t max_bytes,
                       std::string* out) noexcept;

}  // namespace metasplice
