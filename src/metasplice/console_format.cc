#include "metasplice/console_format.h"

#include "text_encoding_internal.h"

#include <cstdio>

namespace metasplice {

bool
append_console_escaped(std::string_view s, uint32_t max_bytes,
                       std::string* out) noexcept
{
    bool dangerous   = false;
    const size_t n   = (max_bytes == 0U || s.size() < max_bytes)
                           ? s.size()
                           : static_cast<size_t>(max_bytes);
    const std::string_view head = s.substr(0, n);

    out->reserve(out->size() + n);
    size_t i = 0;
    while (i < head.size()) {
        const unsigned char c = static_cast<unsigned char>(head[i]);
        if (c == '\\' || c == '"') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            i += 1;
            continue;
        }
        if (c == '\n' || c == '\r' || c == '\t') {
            out->append(c == '\n' ? "\\n" : (c == '\r' ? "\\r" : "\\t"));
            dangerous = true;
            i += 1;
            continue;
        }
        if (c < 0x20U || c == 0x7FU) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            dangerous = true;
            i += 1;
            continue;
        }
        if (c < 0x80U) {
            out->push_back(static_cast<char>(c));
            i += 1;
            continue;
        }

        size_t next = i;
        uint32_t cp = 0;
        if (!text_internal::next_utf8_codepoint(head, &next, &cp)) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            dangerous = true;
            i += 1;
            continue;
        }
        if (cp >= 0x80U && cp <= 0x9FU) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "\\u{%02X}",
                          static_cast<unsigned>(cp));
            out->append(buf);
            dangerous = true;
        } else {
            out->append(head.substr(i, next - i));
        }
        i = next;
    }
    if (n < s.size()) {
        out->append("...");
        dangerous = true;
    }
    return dangerous;
}

}  // namespace metasplice
