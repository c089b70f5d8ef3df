#pragma once

#include "metasplice/codec_status.h"
#include "metasplice/xmp_packet.h"

#include <cstddef>
#include <span>

/**
 * \file xmp_decode.h
 * \brief Decoder for XMP packets (RDF/XML) into an \ref XmpPacket.
 */

namespace metasplice {

/// Decoder options for \ref decode_xmp_packet.
struct XmpDecodeOptions final {
    /// If true, decodes attributes on `rdf:Description` as XMP properties.
    bool decode_description_attributes = true;
    XmpLimits limits;
};

/**
 * \brief Parses \p xmp_bytes and appends its top-level properties to \p out.
 *
 * Every property of every `rdf:Description` is kept in document order; the
 * first occurrence wins when a property repeats. Returns
 * \ref CodecStatus::MalformedContainer for XML that does not parse (DTDs
 * are rejected) and \ref CodecStatus::ResourceLimitExceeded when a limit in
 * \ref XmpLimits is hit.
 */
CodecStatus
decode_xmp_packet(std::span<const std::byte> xmp_bytes,
                  const XmpDecodeOptions& options, XmpPacket* out) noexcept;

}  // namespace metasplice
