#pragma once

#include "metasplice/exif_tiff_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file exif_tiff_encode.h
 * \brief In-place or append-only rewriting of EXIF fields in a TIFF stream.
 */

namespace metasplice {

/// Encoder options for \ref update_exif_tiff.
struct ExifEncodeOptions final {
    /// Byte order used when a TIFF header has to be synthesized.
    bool synthesize_little_endian = false;
    ExifLimits limits;
};

struct ExifEncodeResult final {
    CodecStatus status = CodecStatus::Ok;
    /// Key that caused the failure, if the failure is tied to one field.
    std::string failed_key;
    /// True when every value was patched into existing storage.
    bool patched_in_place = false;
};

/**
 * \brief Applies recognized EXIF field updates to a TIFF stream.
 *
 * \p tiff_bytes may be empty, in which case a minimal TIFF header with IFD0
 * (and an Exif IFD for `user_comment`) is synthesized.
 *
 * The original bytes are kept as a prefix of \p out, so unknown tags,
 * thumbnails and out-of-line data stay valid. When every requested tag exists
 * with the same type and its new value fits the old storage, values are
 * patched in place (unused bytes zeroed). Otherwise the affected IFD is
 * re-serialized at the end of the stream with entries sorted by tag and its
 * entry point (header offset or Exif IFD pointer) is updated.
 *
 * An IFD that already sits at the end of the stream with nothing but its own
 * values after it (typically one appended by an earlier update) is replaced
 * rather than left behind, so repeated updates do not grow the stream without
 * bound. Any other superseded IFD stays in place, unreferenced.
 *
 * Failures:
 * - \ref CodecStatus::UnsupportedOperation for keys without an EXIF mapping
 * - \ref CodecStatus::InvalidFieldValue for embedded NULs or bad datetimes
 * - decode failures of the existing stream (\ref parse_tiff_structure)
 */
ExifEncodeResult
update_exif_tiff(std::span<const std::byte> tiff_bytes,
                 std::span<const MetaField> updates,
                 const ExifEncodeOptions& options,
                 std::vector<std::byte>* out) noexcept;

}  // namespace metasplice
