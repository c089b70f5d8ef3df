#pragma once

#include "metasplice/exif_tiff_decode.h"
#include "metasplice/exif_tiff_encode.h"
#include "metasplice/png_chunk.h"
#include "metasplice/xmp_decode.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for metadata reads and writes on untrusted input.
 */

namespace metasplice {

/**
 * \brief Storage-agnostic resource limits for one request.
 *
 * Defaults bound every length taken from the input, so hostile chunk or IFD
 * sizes fail with \ref CodecStatus::ResourceLimitExceeded (or
 * \ref CodecStatus::ChunkTooLarge for PNG chunks) before allocation.
 */
struct ResourcePolicy final {
    /// Caps the input buffer size (0 = unlimited).
    uint64_t max_file_bytes = 0;

    ExifLimits exif_limits;
    PngLimits png_limits;
    XmpLimits xmp_limits;
};

inline void
apply_resource_policy(const ResourcePolicy& policy, ExifDecodeOptions* exif,
                      ExifEncodeOptions* exif_encode) noexcept
{
    if (exif) {
        exif->limits = policy.exif_limits;
    }
    if (exif_encode) {
        exif_encode->limits = policy.exif_limits;
    }
}

inline void
apply_resource_policy(const ResourcePolicy& policy,
                      PngTextOptions* png) noexcept
{
    if (png) {
        png->limits = policy.png_limits;
    }
}

inline void
apply_resource_policy(const ResourcePolicy& policy,
                      XmpDecodeOptions* xmp) noexcept
{
    if (xmp) {
        xmp->limits = policy.xmp_limits;
    }
}

}  // namespace metasplice
