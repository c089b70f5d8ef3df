#pragma once

#include <cstdint>
#include <string_view>

/**
 * \file codec_status.h
 * \brief Status codes shared by every metasplice codec.
 */

namespace metasplice {

/**
 * \brief Terminal outcome of a codec operation.
 *
 * Every non-Ok value aborts the current request. Nothing is retried and no
 * partially mutated output is returned alongside a failure.
 */
enum class CodecStatus : uint8_t {
    Ok,
    /// The leading bytes do not match any supported container signature.
    UnrecognizedFormat,
    /// Container framing is broken (segment/chunk length past end, no IEND).
    MalformedContainer,
    /// An IFD entry table extends past the end of the TIFF stream.
    TruncatedIfd,
    /// An IFD or value offset points outside the TIFF stream.
    OffsetOutOfBounds,
    /// A recognized tag is stored with a type that cannot carry its value.
    UnsupportedTagType,
    /// A PNG chunk CRC does not match its type and data.
    ChunkCrcMismatch,
    /// A PNG chunk exceeds the configured maximum chunk size.
    ChunkTooLarge,
    /// A requested value or key cannot be encoded (bad date, embedded NUL).
    InvalidFieldValue,
    /// The (format, namespace, key) combination is not writable or readable.
    UnsupportedOperation,
    /// A declared length, count or decoded size exceeds a resource limit.
    ResourceLimitExceeded,
};

/// Returns a stable ASCII name for \p status (e.g. "TruncatedIfd").
std::string_view
codec_status_name(CodecStatus status) noexcept;

/// Keeps the first failure: \p in is stored only while \p out is still Ok.
void
merge_status(CodecStatus* out, CodecStatus in) noexcept;

}  // namespace metasplice
