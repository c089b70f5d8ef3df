#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

namespace metasplice::byte_io {

inline uint8_t
u8(std::byte b) noexcept
{
    return static_cast<uint8_t>(b);
}


inline bool
in_range(std::span<const std::byte> bytes, uint64_t offset,
         uint64_t size) noexcept
{
    const uint64_t n = static_cast<uint64_t>(bytes.size());
    return offset <= n && size <= n - offset;
}


inline bool
match(std::span<const std::byte> bytes, uint64_t offset,
      std::string_view lit) noexcept
{
    if (!in_range(bytes, offset, lit.size())) {
        return false;
    }
    return lit.empty()
           || std::memcmp(bytes.data() + offset, lit.data(), lit.size()) == 0;
}


inline bool
read_u16be(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!out || !in_range(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>((uint16_t(u8(bytes[offset + 0])) << 8)
                                 | uint16_t(u8(bytes[offset + 1])));
    return true;
}


inline bool
read_u16le(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!out || !in_range(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>(uint16_t(u8(bytes[offset + 0]))
                                 | (uint16_t(u8(bytes[offset + 1])) << 8));
    return true;
}


inline bool
read_u32be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!out || !in_range(bytes, offset, 4)) {
        return false;
    }
    *out = (uint32_t(u8(bytes[offset + 0])) << 24)
           | (uint32_t(u8(bytes[offset + 1])) << 16)
           | (uint32_t(u8(bytes[offset + 2])) << 8)
           | (uint32_t(u8(bytes[offset + 3])) << 0);
    return true;
}


inline bool
read_u32le(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!out || !in_range(bytes, offset, 4)) {
        return false;
    }
    *out = (uint32_t(u8(bytes[offset + 0])) << 0)
           | (uint32_t(u8(bytes[offset + 1])) << 8)
           | (uint32_t(u8(bytes[offset + 2])) << 16)
           | (uint32_t(u8(bytes[offset + 3])) << 24);
    return true;
}


inline void
append_u16be(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_u32be(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_text(std::vector<std::byte>* out, std::string_view s)
{
    for (char c : s) {
        out->push_back(std::byte { static_cast<uint8_t>(c) });
    }
}


inline void
append_span(std::vector<std::byte>* out, std::span<const std::byte> s)
{
    out->insert(out->end(), s.begin(), s.end());
}


inline std::string_view
as_chars(std::span<const std::byte> s) noexcept
{
    return std::string_view(reinterpret_cast<const char*>(s.data()),
                            s.size());
}


inline std::span<const std::byte>
as_bytes(std::string_view s) noexcept
{
    return std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(s.data()), s.size());
}

}  // namespace metasplice::byte_io
