#pragma once

#include "metasplice/codec_status.h"
#include "metasplice/meta_field.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file exif_tiff_decode.h
 * \brief TIFF header and IFD structure parser plus EXIF field decoder.
 */

namespace metasplice {

/// TIFF field types (TIFF 6.0 + EXIF 2.3).
enum class TiffType : uint16_t {
    Byte      = 1,
    Ascii     = 2,
    Short     = 3,
    Long      = 4,
    Rational  = 5,
    SByte     = 6,
    Undefined = 7,
    SShort    = 8,
    SLong     = 9,
    SRational = 10,
    Float     = 11,
    Double    = 12,
    Ifd       = 13,
};

/// Size in bytes of one element of TIFF type \p type (0 = unknown type).
uint32_t
tiff_type_size(uint16_t type) noexcept;

/// Logical IFD kinds reachable from a TIFF header.
enum class IfdKind : uint8_t {
    Ifd0,
    /// IFD chained from IFD0 (thumbnail or second page).
    Ifd1,
    Exif,
    Gps,
    Interop,
};

/// Returns "ifd0", "ifd1", "exififd", "gpsifd" or "interopifd".
std::string_view
ifd_kind_name(IfdKind kind) noexcept;

/**
 * \brief One 12-byte IFD entry.
 *
 * When the encoded value is 4 bytes or less it lives in \ref value_or_offset
 * (left-aligned) and \ref value_offset points at that field. Otherwise
 * \ref value_offset is the decoded out-of-line offset, validated to lie
 * within the TIFF stream.
 */
struct IfdEntry final {
    uint16_t tag   = 0;
    uint16_t type  = 0;
    uint32_t count = 0;
    std::array<std::byte, 4> value_or_offset {};

    /// Offset of the entry itself within the TIFF stream.
    uint64_t entry_offset = 0;
    /// Offset of the value bytes within the TIFF stream.
    uint64_t value_offset = 0;
    /// count * tiff_type_size(type); 0 for unknown types.
    uint64_t value_size = 0;
    bool inline_value   = true;
};

struct IfdDirectory final {
    IfdKind kind    = IfdKind::Ifd0;
    uint64_t offset = 0;
    uint32_t next   = 0;
    std::vector<IfdEntry> entries;
};

/// Parsed TIFF header plus every reachable IFD in traversal order.
struct TiffStructure final {
    bool little_endian   = false;
    uint32_t ifd0_offset = 0;
    std::vector<IfdDirectory> ifds;
};

/// A field with a friendly name that both the decoder and encoder handle.
struct ExifFieldSpec final {
    std::string_view key;
    IfdKind ifd   = IfdKind::Ifd0;
    uint16_t tag  = 0;
    TiffType type = TiffType::Ascii;
};

/// The recognized fields: description, artist, copyright, software, datetime
/// and user_comment.
std::span<const ExifFieldSpec>
exif_field_specs() noexcept;

/// Returns the recognized field named \p key, or nullptr.
const ExifFieldSpec*
find_exif_field(std::string_view key) noexcept;

/// Returns the recognized field stored at \p tag in an IFD of \p kind, or nullptr.
const ExifFieldSpec*
find_exif_field(IfdKind kind, uint16_t tag) noexcept;

/// Resource limits applied during decode to bound hostile inputs.
struct ExifLimits final {
    uint32_t max_ifds            = 128;
    uint32_t max_entries_per_ifd = 4096;
    uint32_t max_total_entries   = 200000;
    uint64_t max_value_bytes     = 16ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_exif_tiff.
struct ExifDecodeOptions final {
    /// If true, tags without a known name surface as `Tag0xNNNN`.
    bool include_unnamed_tags = true;
    /// Arrays with more elements than this are skipped (binary blobs).
    uint32_t max_array_elements = 64;
    ExifLimits limits;
};

/**
 * \brief Parses the TIFF header and walks IFD0, its chain and sub-IFDs.
 *
 * Returns:
 * - \ref CodecStatus::TruncatedIfd when an entry table runs past the end
 * - \ref CodecStatus::OffsetOutOfBounds for IFD or value offsets outside
 *   \p tiff_bytes
 * - \ref CodecStatus::MalformedContainer for a bad byte order or magic
 * - \ref CodecStatus::UnsupportedOperation for BigTIFF
 * - \ref CodecStatus::ResourceLimitExceeded when \p limits are hit
 *
 * Bounds are checked before limits, so a hostile entry count reports
 * \ref CodecStatus::TruncatedIfd.
 */
CodecStatus
parse_tiff_structure(std::span<const std::byte> tiff_bytes,
                     const ExifLimits& limits, TiffStructure* out) noexcept;

/// Returns the entry for \p tag in the first IFD of \p kind, or nullptr.
const IfdEntry*
find_ifd_entry(const TiffStructure& tiff, IfdKind kind, uint16_t tag) noexcept;

/**
 * \brief Decodes a TIFF stream into EXIF fields.
 *
 * The recognized fields surface under friendly names (`description`,
 * `artist`, `copyright`, `software`, `datetime`, `user_comment`). Other
 * text and numeric tags of IFD0, the Exif IFD and the GPS IFD surface under
 * their tag names. Fields are appended to \p out; existing keys are kept.
 */
CodecStatus
decode_exif_tiff(std::span<const std::byte> tiff_bytes,
                 const ExifDecodeOptions& options, FieldMap* out) noexcept;

/**
 * \brief Decodes an EXIF UserComment value honoring its 8-byte charset prefix.
 *
 * Handles `ASCII`, `UNICODE` (BOM, else \p tiff_little_endian), `JIS` and the
 * undefined (all-NUL) prefix. Values without a known prefix are decoded as
 * UTF-8 when valid, else Latin-1. Trailing NULs are trimmed; trailing spaces
 * only when no charset is declared.
 */
void
decode_user_comment(std::span<const std::byte> value, bool tiff_little_endian,
                    std::string* out) noexcept;

}  // namespace metasplice
