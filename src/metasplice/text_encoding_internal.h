#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace metasplice::text_internal {

bool
is_ascii(std::string_view s) noexcept;

bool
is_valid_utf8(std::string_view s) noexcept;

void
append_utf8_codepoint(uint32_t cp, std::string* out) noexcept;

/// Decodes one UTF-8 sequence at \p *pos and advances it.
bool
next_utf8_codepoint(std::string_view s, size_t* pos, uint32_t* cp) noexcept;

/// Every byte maps to U+0000..U+00FF.
void
latin1_to_utf8(std::span<const std::byte> bytes, std::string* out) noexcept;

/// Fails when \p s is not valid UTF-8 or has codepoints above U+00FF.
bool
utf8_to_latin1(std::string_view s, std::string* out) noexcept;

/// Unpaired surrogates decode as U+FFFD. A trailing odd byte is ignored.
void
utf16_to_utf8(std::span<const std::byte> bytes, bool little_endian,
              std::string* out) noexcept;

/// Fails when \p s is not valid UTF-8.
bool
utf8_to_utf16(std::string_view s, bool little_endian,
              std::vector<std::byte>* out) noexcept;

/// Valid UTF-8 passes through; anything else is treated as Latin-1.
void
bytes_to_utf8_lossless(std::span<const std::byte> bytes,
                       std::string* out) noexcept;

/// Drops trailing NUL characters.
std::string_view
trim_trailing_nul(std::string_view s) noexcept;

/// Drops trailing NUL and ASCII space characters.
std::string_view
trim_trailing_nul_space(std::string_view s) noexcept;

}  // namespace metasplice::text_internal
