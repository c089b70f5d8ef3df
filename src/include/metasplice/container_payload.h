#pragma once

#include "metasplice/codec_status.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file container_payload.h
 * \brief zlib helpers for compressed metadata payloads and chunk checksums.
 */

namespace metasplice {

/// Resource limits applied while inflating compressed payloads.
struct PayloadLimits final {
    /// Caps the inflated size (0 = unlimited).
    uint64_t max_output_bytes = 64ULL * 1024ULL * 1024ULL;
};

/**
 * \brief Inflates a zlib stream into \p out.
 *
 * Returns:
 * - \ref CodecStatus::ResourceLimitExceeded when the output would exceed
 *   \ref PayloadLimits::max_output_bytes
 * - \ref CodecStatus::MalformedContainer for truncated or corrupt streams
 */
CodecStatus
inflate_zlib(std::span<const std::byte> in, const PayloadLimits& limits,
             std::vector<std::byte>* out) noexcept;

/// Deflates \p in into a zlib stream using the default compression level.
CodecStatus
deflate_zlib(std::span<const std::byte> in, std::vector<std::byte>* out) noexcept;

/// CRC-32 (ISO 3309) over \p a followed by \p b.
uint32_t
crc32_of(std::span<const std::byte> a,
         std::span<const std::byte> b = {}) noexcept;

}  // namespace metasplice
