#pragma once

#include "metasplice/codec_status.h"
#include "metasplice/xmp_packet.h"

#include <cstddef>
#include <string_view>
#include <vector>

/**
 * \file xmp_encode.h
 * \brief Deterministic serialization of an \ref XmpPacket.
 */

namespace metasplice {

/// `id` attribute of the xpacket header.
inline constexpr std::string_view kXmpPacketId = "W5M0MpCehiHzreSzNTczkc9d";

/**
 * \brief Serializes \p packet as a complete `<?xpacket?>` wrapped packet.
 *
 * The output holds one `rdf:Description` with every namespace declared by
 * the packet, sorted by prefix, and the properties in packet order. Decoded
 * properties that were not updated are copied from their source markup.
 * Identical packets always serialize to identical bytes.
 *
 * Returns \ref CodecStatus::ResourceLimitExceeded when the output exceeds
 * \ref XmpLimits::max_packet_bytes.
 */
CodecStatus
encode_xmp_packet(const XmpPacket& packet, const XmpLimits& limits,
                  std::vector<std::byte>* out);

}  // namespace metasplice
