#include "metasplice/datetime_format.h"

#include <cstdio>

namespace metasplice {
namespace {

    static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

    static bool parse_fixed(std::string_view s, size_t pos, size_t n,
                            uint32_t* out) noexcept
    {
        if (pos + n > s.size()) {
            return false;
        }
        uint32_t v = 0;
        for (size_t i = 0; i < n; ++i) {
            const char c = s[pos + i];
            if (!is_digit(c)) {
                return false;
            }
            v = v * 10U + static_cast<uint32_t>(c - '0');
        }
        *out = v;
        return true;
    }


    static bool is_leap_year(uint32_t y) noexcept
    {
        return (y % 4U == 0U && y % 100U != 0U) || y % 400U == 0U;
    }


    static uint32_t days_in_month(uint32_t y, uint32_t m) noexcept
    {
        static constexpr uint8_t kDays[12] = { 31, 28, 31, 30, 31, 30,
                                               31, 31, 30, 31, 30, 31 };
        if (m == 2 && is_leap_year(y)) {
            return 29;
        }
        return kDays[m - 1];
    }


    static std::string_view trim_ascii_ws(std::string_view s) noexcept
    {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
            s.remove_prefix(1);
        }
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
            s.remove_suffix(1);
        }
        return s;
    }


    static bool parse_zone(std::string_view s, size_t pos,
                           DateTimeValue* out) noexcept
    {
        if (pos == s.size()) {
            return true;
        }
        if (s[pos] == 'Z' && pos + 1 == s.size()) {
            out->has_zone     = true;
            out->zone_minutes = 0;
            return true;
        }
        if (s[pos] != '+' && s[pos] != '-') {
            return false;
        }
        uint32_t hh = 0;
        uint32_t mm = 0;
        if (!parse_fixed(s, pos + 1, 2, &hh)) {
            return false;
        }
        size_t p = pos + 3;
        if (p < s.size() && s[p] == ':') {
            p += 1;
        }
        if (!parse_fixed(s, p, 2, &mm) || p + 2 != s.size()) {
            return false;
        }
        if (hh > 14 || mm > 59) {
            return false;
        }
        const int total   = static_cast<int>(hh * 60U + mm);
        out->has_zone     = true;
        out->zone_minutes = static_cast<int16_t>(s[pos] == '-' ? -total
                                                               : total);
        return true;
    }

}  // namespace

CodecStatus
parse_datetime(std::string_view text, DateTimeValue* out) noexcept
{
    if (!out) {
        return CodecStatus::InvalidFieldValue;
    }
    *out = DateTimeValue {};

    const std::string_view s = trim_ascii_ws(text);

    // YYYY?MM?DD with a single separator style.
    if (s.size() < 10) {
        return CodecStatus::InvalidFieldValue;
    }
    const char dsep = s[4];
    if ((dsep != ':' && dsep != '-') || s[7] != dsep) {
        return CodecStatus::InvalidFieldValue;
    }
    uint32_t y  = 0;
    uint32_t mo = 0;
    uint32_t d  = 0;
    if (!parse_fixed(s, 0, 4, &y) || !parse_fixed(s, 5, 2, &mo)
        || !parse_fixed(s, 8, 2, &d)) {
        return CodecStatus::InvalidFieldValue;
    }
    if (y == 0 || mo < 1 || mo > 12 || d < 1 || d > days_in_month(y, mo)) {
        return CodecStatus::InvalidFieldValue;
    }
    out->year  = static_cast<uint16_t>(y);
    out->month = static_cast<uint8_t>(mo);
    out->day   = static_cast<uint8_t>(d);

    if (s.size() == 10) {
        return CodecStatus::Ok;
    }

    // The EXIF form is strict: a space separator and all three time fields.
    const char tsep = s[10];
    if (tsep != ' ' && (tsep != 'T' || dsep != '-')) {
        return CodecStatus::InvalidFieldValue;
    }

    uint32_t hh = 0;
    uint32_t mi = 0;
    uint32_t ss = 0;
    if (!parse_fixed(s, 11, 2, &hh) || s.size() < 16 || s[13] != ':'
        || !parse_fixed(s, 14, 2, &mi)) {
        return CodecStatus::InvalidFieldValue;
    }
    size_t pos = 16;
    if (pos < s.size() && s[pos] == ':') {
        if (!parse_fixed(s, pos + 1, 2, &ss)) {
            return CodecStatus::InvalidFieldValue;
        }
        pos += 3;
        if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
            size_t end = pos + 1;
            while (end < s.size() && is_digit(s[end])) {
                end += 1;
            }
            if (end == pos + 1) {
                return CodecStatus::InvalidFieldValue;
            }
            out->fraction.assign(s.data() + pos + 1, end - pos - 1);
            pos = end;
        }
    } else if (dsep == ':') {
        return CodecStatus::InvalidFieldValue;
    }
    if (hh > 23 || mi > 59 || ss > 59) {
        return CodecStatus::InvalidFieldValue;
    }
    out->hour   = static_cast<uint8_t>(hh);
    out->minute = static_cast<uint8_t>(mi);
    out->second = static_cast<uint8_t>(ss);

    if (dsep == ':' && pos != s.size()) {
        return CodecStatus::InvalidFieldValue;
    }
    if (!parse_zone(s, pos, out)) {
        return CodecStatus::InvalidFieldValue;
    }
    return CodecStatus::Ok;
}


std::string
format_exif_datetime(const DateTimeValue& v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04u:%02u:%02u %02u:%02u:%02u",
                  static_cast<unsigned>(v.year), static_cast<unsigned>(v.month),
                  static_cast<unsigned>(v.day), static_cast<unsigned>(v.hour),
                  static_cast<unsigned>(v.minute),
                  static_cast<unsigned>(v.second));
    return std::string(buf);
}


std::string
format_xmp_datetime(const DateTimeValue& v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02uT%02u:%02u:%02u",
                  static_cast<unsigned>(v.year), static_cast<unsigned>(v.month),
                  static_cast<unsigned>(v.day), static_cast<unsigned>(v.hour),
                  static_cast<unsigned>(v.minute),
                  static_cast<unsigned>(v.second));
    std::string out(buf);
    if (!v.fraction.empty()) {
        out.push_back('.');
        out.append(v.fraction);
    }
    if (v.has_zone) {
        if (v.zone_minutes == 0) {
            out.push_back('Z');
        } else {
            const int m = v.zone_minutes < 0 ? -v.zone_minutes : v.zone_minutes;
            std::snprintf(buf, sizeof(buf), "%c%02d:%02d",
                          v.zone_minutes < 0 ? '-' : '+', m / 60, m % 60);
            out.append(buf);
        }
    }
    return out;
}


CodecStatus
normalize_exif_datetime(std::string_view text, std::string* out) noexcept
{
    DateTimeValue v;
    const CodecStatus st = parse_datetime(text, &v);
    if (st != CodecStatus::Ok) {
        return st;
    }
    if (out) {
        *out = format_exif_datetime(v);
    }
    return CodecStatus::Ok;
}


CodecStatus
normalize_xmp_datetime(std::string_view text, std::string* out) noexcept
{
    DateTimeValue v;
    const CodecStatus st = parse_datetime(text, &v);
    if (st != CodecStatus::Ok) {
        return st;
    }
    if (out) {
        *out = format_xmp_datetime(v);
    }
    return CodecStatus::Ok;
}

}  // namespace metasplice
