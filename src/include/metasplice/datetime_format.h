#pragma once

#include "metasplice/codec_status.h"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file datetime_format.h
 * \brief Parsing and normalization of timestamps for EXIF and XMP.
 */

namespace metasplice {

/// A calendar-validated timestamp with optional fraction and zone.
struct DateTimeValue final {
    uint16_t year  = 0;
    uint8_t month  = 1;
    uint8_t day    = 1;
    uint8_t hour   = 0;
    uint8_t minute = 0;
    uint8_t second = 0;

    /// Fractional second digits as written (without the dot).
    std::string fraction;

    bool has_zone = false;
    /// Zone offset east of UTC, in minutes. 0 with has_zone means "Z".
    int16_t zone_minutes = 0;
};

/**
 * \brief Parses EXIF or ISO 8601 style timestamps.
 *
 * Accepted forms:
 * - `YYYY:MM:DD HH:MM:SS` (EXIF)
 * - `YYYY-MM-DD[T| ]HH:MM[:SS[.fff]][Z|+hh:mm|-hh:mm]`
 * - `YYYY-MM-DD` and `YYYY:MM:DD` (midnight)
 *
 * Returns \ref CodecStatus::InvalidFieldValue for anything else, including
 * out-of-range calendar values.
 */
CodecStatus
parse_datetime(std::string_view text, DateTimeValue* out) noexcept;

/// `YYYY:MM:DD HH:MM:SS`; the fraction and zone are dropped.
std::string
format_exif_datetime(const DateTimeValue& value);

/// `YYYY-MM-DDTHH:MM:SS[.fff][Z|+hh:mm]`.
std::string
format_xmp_datetime(const DateTimeValue& value);

/// Parses \p text and stores its EXIF form in \p out.
CodecStatus
normalize_exif_datetime(std::string_view text, std::string* out) noexcept;

/// Parses \p text and stores its XMP form in \p out.
CodecStatus
normalize_xmp_datetime(std::string_view text, std::string* out) noexcept;

}  // namespace metasplice
