#include "text_encoding_internal.h"

namespace metasplice::text_internal {
namespace {

    static uint16_t load_u16(std::span<const std::byte> bytes, size_t i,
                             bool little_endian) noexcept
    {
        const uint16_t b0 = static_cast<uint8_t>(bytes[i]);
        const uint16_t b1 = static_cast<uint8_t>(bytes[i + 1U]);
        return little_endian ? static_cast<uint16_t>(b0 | (b1 << 8U))
                             : static_cast<uint16_t>((b0 << 8U) | b1);
    }


    static void store_u16(std::vector<std::byte>* out, uint16_t v,
                          bool little_endian)
    {
        const std::byte hi { static_cast<uint8_t>((v >> 8U) & 0xFFU) };
        const std::byte lo { static_cast<uint8_t>(v & 0xFFU) };
        if (little_endian) {
            out->push_back(lo);
            out->push_back(hi);
        } else {
            out->push_back(hi);
            out->push_back(lo);
        }
    }

}  // namespace

bool
is_ascii(std::string_view s) noexcept
{
    for (char c : s) {
        if (static_cast<unsigned char>(c) >= 0x80U) {
            return false;
        }
    }
    return true;
}


bool
next_utf8_codepoint(std::string_view s, size_t* pos, uint32_t* cp) noexcept
{
    if (!pos || !cp || *pos >= s.size()) {
        return false;
    }
    const size_t i   = *pos;
    const uint8_t b0 = static_cast<uint8_t>(s[i]);
    uint32_t v       = 0U;
    size_t len       = 0U;

    if (b0 <= 0x7FU) {
        v   = b0;
        len = 1U;
    } else if (b0 >= 0xC2U && b0 <= 0xDFU) {
        v   = static_cast<uint32_t>(b0 & 0x1FU);
        len = 2U;
    } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
        v   = static_cast<uint32_t>(b0 & 0x0FU);
        len = 3U;
    } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
        v   = static_cast<uint32_t>(b0 & 0x07U);
        len = 4U;
    } else {
        return false;
    }
    if (i + len > s.size()) {
        return false;
    }
    if (len > 1U) {
        const uint8_t b1 = static_cast<uint8_t>(s[i + 1U]);
        if ((b0 == 0xE0U && b1 < 0xA0U) || (b0 == 0xEDU && b1 >= 0xA0U)
            || (b0 == 0xF0U && b1 < 0x90U) || (b0 == 0xF4U && b1 >= 0x90U)) {
            return false;
        }
    }
    for (size_t j = 1U; j < len; ++j) {
        const uint8_t bj = static_cast<uint8_t>(s[i + j]);
        if ((bj & 0xC0U) != 0x80U) {
            return false;
        }
        v = (v << 6U) | static_cast<uint32_t>(bj & 0x3FU);
    }
    *cp  = v;
    *pos = i + len;
    return true;
}


bool
is_valid_utf8(std::string_view s) noexcept
{
    size_t pos  = 0;
    uint32_t cp = 0;
    while (pos < s.size()) {
        if (!next_utf8_codepoint(s, &pos, &cp)) {
            return false;
        }
    }
    return true;
}


void
append_utf8_codepoint(uint32_t cp, std::string* out) noexcept
{
    if (!out) {
        return;
    }
    if (cp <= 0x7FU) {
        out->push_back(static_cast<char>(cp));
        return;
    }
    if (cp <= 0x7FFU) {
        out->push_back(static_cast<char>(0xC0U | ((cp >> 6) & 0x1FU)));
        out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        return;
    }
    if (cp <= 0xFFFFU) {
        out->push_back(static_cast<char>(0xE0U | ((cp >> 12) & 0x0FU)));
        out->push_back(static_cast<char>(0x80U | ((cp >> 6) & 0x3FU)));
        out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
        return;
    }
    out->push_back(static_cast<char>(0xF0U | ((cp >> 18) & 0x07U)));
    out->push_back(static_cast<char>(0x80U | ((cp >> 12) & 0x3FU)));
    out->push_back(static_cast<char>(0x80U | ((cp >> 6) & 0x3FU)));
    out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
}


void
latin1_to_utf8(std::span<const std::byte> bytes, std::string* out) noexcept
{
    if (!out) {
        return;
    }
    out->clear();
    out->reserve(bytes.size());
    for (std::byte b : bytes) {
        append_utf8_codepoint(static_cast<uint8_t>(b), out);
    }
}


bool
utf8_to_latin1(std::string_view s, std::string* out) noexcept
{
    if (!out) {
        return false;
    }
    out->clear();
    out->reserve(s.size());
    size_t pos  = 0;
    uint32_t cp = 0;
    while (pos < s.size()) {
        if (!next_utf8_codepoint(s, &pos, &cp) || cp > 0xFFU) {
            return false;
        }
        out->push_back(static_cast<char>(cp));
    }
    return true;
}


void
utf16_to_utf8(std::span<const std::byte> bytes, bool little_endian,
              std::string* out) noexcept
{
    if (!out) {
        return;
    }
    out->clear();
    out->reserve(bytes.size());
    size_t i = 0U;
    while (i + 1U < bytes.size()) {
        const uint16_t u0 = load_u16(bytes, i, little_endian);
        i += 2U;
        if (u0 >= 0xD800U && u0 <= 0xDBFFU && i + 1U < bytes.size()) {
            const uint16_t u1 = load_u16(bytes, i, little_endian);
            if (u1 >= 0xDC00U && u1 <= 0xDFFFU) {
                i += 2U;
                append_utf8_codepoint(
                    0x10000U
                        + (((static_cast<uint32_t>(u0) - 0xD800U) << 10U)
                           | (static_cast<uint32_t>(u1) - 0xDC00U)),
                    out);
                continue;
            }
        }
        if (u0 >= 0xD800U && u0 <= 0xDFFFU) {
            append_utf8_codepoint(0xFFFDU, out);
            continue;
        }
        append_utf8_codepoint(u0, out);
    }
}


bool
utf8_to_utf16(std::string_view s, bool little_endian,
              std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return false;
    }
    out->clear();
    out->reserve(s.size() * 2U);
    size_t pos  = 0;
    uint32_t cp = 0;
    while (pos < s.size()) {
        if (!next_utf8_codepoint(s, &pos, &cp)) {
            return false;
        }
        if (cp >= 0x10000U) {
            const uint32_t v = cp - 0x10000U;
            store_u16(out, static_cast<uint16_t>(0xD800U + (v >> 10U)),
                      little_endian);
            store_u16(out, static_cast<uint16_t>(0xDC00U + (v & 0x3FFU)),
                      little_endian);
        } else {
            store_u16(out, static_cast<uint16_t>(cp), little_endian);
        }
    }
    return true;
}


void
bytes_to_utf8_lossless(std::span<const std::byte> bytes,
                       std::string* out) noexcept
{
    if (!out) {
        return;
    }
    const std::string_view s(reinterpret_cast<const char*>(bytes.data()),
                             bytes.size());
    if (is_valid_utf8(s)) {
        out->assign(s.data(), s.size());
        return;
    }
    latin1_to_utf8(bytes, out);
}


std::string_view
trim_trailing_nul(std::string_view s) noexcept
{
    while (!s.empty() && s.back() == '\0') {
        s.remove_suffix(1);
    }
    return s;
}


std::string_view
trim_trailing_nul_space(std::string_view s) noexcept
{
    while (!s.empty() && (s.back() == '\0' || s.back() == ' ')) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace metasplice::text_internal
