#pragma once

#include "metasplice/codec_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file container_scan.h
 * \brief Format sniffing and block-level segmentation of image containers.
 */

namespace metasplice {

/// Supported container formats.
enum class ContainerFormat : uint8_t {
    Unknown,
    Jpeg,
    Png,
    Tiff,
    Webp,
};

/// Returns "JPEG", "PNG", "TIFF", "WEBP" or "UNKNOWN".
std::string_view
container_format_name(ContainerFormat format) noexcept;

/// Logical role of a block within its container.
enum class ContainerBlockKind : uint8_t {
    Unknown,
    /// File signature (JPEG SOI, PNG signature, RIFF/WEBP header).
    Signature,
    /// Frame/image header (JPEG SOFn, PNG IHDR, WebP VP8X).
    ImageHeader,
    /// TIFF stream (JPEG APP1 Exif, PNG eXIf, WebP EXIF, whole TIFF file).
    Exif,
    /// XMP packet (JPEG APP1 XMP, PNG iTXt XML:com.adobe.xmp, WebP XMP).
    Xmp,
    /// PNG tEXt, zTXt or iTXt.
    Text,
    /// Compressed image data (JPEG SOS to end, PNG IDAT, WebP bitstream).
    ImageData,
    /// End marker (PNG IEND).
    End,
    /// Any other segment or chunk. Copied through verbatim.
    Other,
    /// Bytes after the logical end of the container.
    Trailer,
};

/**
 * \brief Byte range of one block within the container.
 *
 * Offsets are relative to the start of the full file byte buffer.
 */
struct ContainerBlockRef final {
    ContainerBlockKind kind = ContainerBlockKind::Unknown;

    // Container-specific identifier:
    // - JPEG: marker (0xFFxx), 0 for the scan data block
    // - PNG/WebP: chunk type (FourCC)
    uint32_t id = 0;

    // The whole block including framing (marker, length, CRC, padding).
    uint64_t outer_offset = 0;
    uint64_t outer_size   = 0;

    // The payload inside the block (after signatures and prefix fields).
    uint64_t data_offset = 0;
    uint64_t data_size   = 0;
};

/**
 * \brief Segmented view of one image buffer.
 *
 * \ref blocks tile the buffer: they are ordered, contiguous and cover every
 * byte, so concatenating them reproduces the input exactly.
 */
struct ImageContainer final {
    ContainerFormat format = ContainerFormat::Unknown;
    std::vector<ContainerBlockRef> blocks;

    bool has_dimensions = false;
    uint32_t width      = 0;
    uint32_t height     = 0;
};

struct SniffResult final {
    CodecStatus status     = CodecStatus::Ok;
    ContainerFormat format = ContainerFormat::Unknown;

    bool has_dimensions = false;
    uint32_t width      = 0;
    uint32_t height     = 0;
};

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/// Reserved PNG iTXt keyword that carries an XMP packet.
inline constexpr std::string_view kPngXmpKeyword = "XML:com.adobe.xmp";

/// JPEG APP1 signature that prefixes an XMP packet (including the NUL).
inline constexpr std::string_view kJpegXmpSignature
    = std::string_view("http://ns.adobe.com/xap/1.0/\0", 29);

/// JPEG APP1 signature that prefixes a TIFF stream (including padding).
inline constexpr std::string_view kJpegExifSignature
    = std::string_view("Exif\0\0", 6);

/**
 * \brief Classifies \p bytes by magic prefix.
 *
 * Dimensions are reported when the header carrying them can be parsed
 * cheaply; a damaged header leaves \ref SniffResult::has_dimensions unset but
 * does not fail the sniff. Returns \ref CodecStatus::UnrecognizedFormat when
 * no signature matches.
 */
SniffResult
sniff_container(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Sniffs \p bytes and splits them into blocks.
 *
 * Returns \ref CodecStatus::MalformedContainer when the framing is broken and
 * \ref CodecStatus::ResourceLimitExceeded for PNG chunk lengths above
 * 2^31-1.
 */
CodecStatus
scan_container(std::span<const std::byte> bytes, ImageContainer* out) noexcept;

/// Returns the payload bytes of \p block.
std::span<const std::byte>
block_data(std::span<const std::byte> bytes,
           const ContainerBlockRef& block) noexcept;

/// Returns the index of the first block of \p kind, or -1.
int64_t
find_block(const ImageContainer& container, ContainerBlockKind kind) noexcept;

}  // namespace metasplice
