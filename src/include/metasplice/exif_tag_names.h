#pragma once

#include <cstdint>
#include <string_view>

/**
 * \file exif_tag_names.h
 * \brief Human-readable names for common EXIF/TIFF tags.
 */

namespace metasplice {

enum class IfdKind : uint8_t;

/**
 * \brief Returns the EXIF/TIFF tag name for \p tag in an IFD of \p kind.
 *
 * \return An empty view for unknown tags.
 */
std::string_view
exif_tag_name(IfdKind kind, uint16_t tag) noexcept;

}  // namespace metasplice
