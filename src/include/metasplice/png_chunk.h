#pragma once

#include "metasplice/codec_status.h"
#include "metasplice/container_scan.h"
#include "metasplice/container_splice.h"
#include "metasplice/meta_field.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file png_chunk.h
 * \brief PNG chunk validation plus tEXt/zTXt/iTXt decoding and rewriting.
 */

namespace metasplice {

/// Resource limits for PNG chunk processing.
struct PngLimits final {
    /// Chunks with more data bytes fail with ChunkTooLarge (0 = unlimited).
    uint32_t max_chunk_bytes = 64U * 1024U * 1024U;
    /// Cap on the inflated size of one zTXt/iTXt payload (0 = unlimited).
    uint64_t max_inflate_bytes = 16ULL * 1024ULL * 1024ULL;
};

/// Decoder/encoder options for PNG text chunks.
struct PngTextOptions final {
    /// If true, zTXt and compressed iTXt payloads are inflated on read.
    bool decompress = true;
    PngLimits limits;
};

/// A raw chunk: type, data and the CRC stored after it.
struct PngChunkView final {
    uint32_t type = 0;
    std::span<const std::byte> data;
    uint32_t crc = 0;
};

/// A decoded text chunk. All strings are UTF-8.
struct PngTextChunk final {
    uint32_t type = 0;
    std::string keyword;
    std::string text;
    bool compressed = false;
    std::string language;
    std::string translated_keyword;
};

/// Returns the chunk stored in \p block of a scanned PNG.
PngChunkView
png_chunk_at(std::span<const std::byte> bytes,
             const ContainerBlockRef& block) noexcept;

/**
 * \brief Checks every chunk of a scanned PNG.
 *
 * Returns \ref CodecStatus::ChunkTooLarge for chunks above
 * \ref PngLimits::max_chunk_bytes, then \ref CodecStatus::ChunkCrcMismatch
 * when a stored CRC does not match CRC-32(type ++ data).
 */
CodecStatus
validate_png_chunks(std::span<const std::byte> bytes,
                    const ImageContainer& container,
                    const PngLimits& limits) noexcept;

/// Decodes a tEXt, zTXt or iTXt chunk payload.
CodecStatus
decode_png_text_chunk(uint32_t type, std::span<const std::byte> data,
                      const PngTextOptions& options,
                      PngTextChunk* out) noexcept;

/**
 * \brief Decodes all text chunks except the reserved XMP iTXt into \p out.
 *
 * The first chunk wins when a keyword repeats.
 */
CodecStatus
decode_png_text(std::span<const std::byte> bytes,
                const ImageContainer& container, const PngTextOptions& options,
                FieldMap* out) noexcept;

/// Returns Ok for 1..79 printable Latin-1 characters without leading,
/// trailing or consecutive spaces; otherwise InvalidFieldValue.
CodecStatus
validate_png_keyword(std::string_view keyword_utf8) noexcept;

/// Serializes the payload of a text chunk of type \p chunk.type.
CodecStatus
encode_png_text_chunk(const PngTextChunk& chunk,
                      std::vector<std::byte>* out) noexcept;

/// Frames \p data as a chunk: length, type, data, CRC-32.
void
build_png_chunk(uint32_t type, std::span<const std::byte> data,
                std::vector<std::byte>* out);

/**
 * \brief Plans the edits that set \p updates as PNG text chunks.
 *
 * Existing chunks with a matching keyword are rewritten in place keeping
 * their type where the value still fits it (a tEXt receiving non-Latin-1
 * text becomes iTXt, a zTXt becomes a compressed iTXt). Later duplicates are
 * removed. New keywords become tEXt (or iTXt for non-Latin-1 values) right
 * before IEND.
 *
 * \p failed_key receives the offending key on failure.
 */
CodecStatus
plan_png_text_update(std::span<const std::byte> bytes,
                     const ImageContainer& container,
                     std::span<const MetaField> updates,
                     std::vector<BlockEdit>* edits,
                     std::string* failed_key) noexcept;

/**
 * \brief Plans replacing the first block of \p kind with \p chunk.
 *
 * Other blocks of the same kind are removed. Without an existing block the
 * chunk is inserted before the first IDAT.
 */
CodecStatus
plan_png_chunk_upsert(const ImageContainer& container, ContainerBlockKind kind,
                      std::vector<std::byte> chunk,
                      std::vector<BlockEdit>* edits) noexcept;

}  // namespace metasplice
