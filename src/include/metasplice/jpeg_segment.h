#pragma once

#include "metasplice/codec_status.h"
#include "metasplice/container_scan.h"
#include "metasplice/container_splice.h"

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file jpeg_segment.h
 * \brief Building and placing JPEG APP1 segments (Exif and XMP).
 */

namespace metasplice {

/// Largest APP1 body (signature + payload) that fits the 16-bit length field.
inline constexpr size_t kJpegMaxSegmentBody = 65533;

/**
 * \brief Frames `signature ++ payload` as an APP1 segment.
 *
 * Returns \ref CodecStatus::ResourceLimitExceeded when the body does not fit
 * one segment.
 */
CodecStatus
make_jpeg_app1(std::string_view signature, std::span<const std::byte> payload,
               std::vector<std::byte>* out);

/**
 * \brief Plans replacing the first \p kind segment with \p segment.
 *
 * Later segments of the same kind are removed. Without an existing segment
 * an Exif APP1 goes right after SOI and any APP0 segments, an XMP APP1 after
 * the leading APP0/APP1 run.
 */
CodecStatus
plan_jpeg_app1_upsert(const ImageContainer& container, ContainerBlockKind kind,
                      std::vector<std::byte> segment,
                      std::vector<BlockEdit>* edits) noexcept;

}  // namespace metasplice
