#pragma once

#include "metasplice/container_splice.h"
#include "metasplice/metadata_request.h"

#include <span>
#include <string>
#include <vector>

namespace metasplice::codecs_internal {

/// What a write codec sees of the request.
struct WriteContext final {
    std::span<const std::byte> bytes;
    const ImageContainer* container = nullptr;
    const WriteOptions* options     = nullptr;
};

/// Plans block edits for \p updates. \p failed_key names the failing field.
using WriteCodecFn = CodecStatus (*)(const WriteContext& ctx,
                                     std::span<const MetaField> updates,
                                     std::vector<BlockEdit>* edits,
                                     std::string* failed_key);

/// One row of the (format, namespace) dispatch table.
struct WriteRouteEntry final {
    ContainerFormat format = ContainerFormat::Unknown;
    /// Namespace the request asked for.
    MetaNamespace requested = MetaNamespace::Xmp;
    /// Namespace actually written (differs for the TIFF XMP fallback).
    MetaNamespace applied = MetaNamespace::Xmp;
    WriteCodecFn write    = nullptr;
};

/// Returns the namespace \p route selects for \p format.
MetaNamespace
route_namespace(ContainerFormat format, WriteRoute route) noexcept;

/// Returns the table row for (format, ns), or nullptr when unsupported.
const WriteRouteEntry*
find_write_route(ContainerFormat format, MetaNamespace ns) noexcept;

/// Decodes the first EXIF block. \p found reports whether one exists.
CodecStatus
read_exif(std::span<const std::byte> bytes, const ImageContainer& container,
          const ReadOptions& options, bool* found, FieldMap* out) noexcept;

/// Decodes every PNG text chunk except the XMP one.
CodecStatus
read_png_text(std::span<const std::byte> bytes,
              const ImageContainer& container, const ReadOptions& options,
              bool* found, FieldMap* out) noexcept;

/// Decodes the XMP packet (JPEG APP1, PNG iTXt, WebP chunk or TIFF tag 700).
CodecStatus
read_xmp(std::span<const std::byte> bytes, const ImageContainer& container,
         const ReadOptions& options, bool* found, FieldMap* out) noexcept;

}  // namespace metasplice::codecs_internal
