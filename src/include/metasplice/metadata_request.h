#pragma once

#include "metasplice/codec_status.h"
#include "metasplice/container_scan.h"
#include "metasplice/meta_field.h"
#include "metasplice/resource_policy.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file metadata_request.h
 * \brief Read and write requests over a whole image buffer.
 *
 * Each request owns its buffers and shares no mutable state, so any number
 * of requests may run concurrently.
 */

namespace metasplice {

/// Which metadata family a write targets.
enum class WriteRoute : uint8_t {
    /// XMP for JPEG and PNG, EXIF for TIFF.
    Default,
    Xmp,
    Exif,
    PngText,
};

/// Returns "default", "xmp", "exif" or "png-text".
std::string_view
write_route_name(WriteRoute route) noexcept;

/// Parses a name produced by \ref write_route_name.
bool
parse_write_route(std::string_view name, WriteRoute* out) noexcept;

/// Progress of a request. A failure reports the stage it stopped in.
enum class RequestStage : uint8_t {
    Detect,
    Dispatch,
    Codec,
    Reassemble,
    Done,
};

std::string_view
request_stage_name(RequestStage stage) noexcept;

/// Where and why a request failed.
struct CodecFailure final {
    CodecStatus status = CodecStatus::Ok;
    RequestStage stage = RequestStage::Detect;
    /// Set once the failing codec is known.
    bool has_namespace = false;
    MetaNamespace ns   = MetaNamespace::Exif;
    /// Key that caused the failure, if the failure is tied to one field.
    std::string key;
};

struct ReadOptions final {
    ResourcePolicy policy;
    /// If true, EXIF tags without a name surface as `Tag0xNNNN`.
    bool include_unnamed_exif_tags = true;
};

struct WriteOptions final {
    WriteRoute route = WriteRoute::Default;
    ResourcePolicy policy;
    /// Byte order for EXIF streams created from scratch.
    bool synthesize_little_endian = false;
};

struct ReadResult final {
    CodecStatus status = CodecStatus::Ok;
    CodecFailure failure;
    ContainerFormat format = ContainerFormat::Unknown;

    bool has_dimensions = false;
    uint32_t width      = 0;
    uint32_t height     = 0;

    /// True when the container carries the namespace, even if it is empty.
    bool has_exif     = false;
    bool has_png_text = false;
    bool has_xmp      = false;

    FieldMap exif { MetaNamespace::Exif };
    FieldMap png_text { MetaNamespace::PngText };
    FieldMap xmp { MetaNamespace::Xmp };
};

struct WriteResult final {
    CodecStatus status = CodecStatus::Ok;
    CodecFailure failure;
    ContainerFormat format = ContainerFormat::Unknown;
    /// Namespace the updates were written to.
    MetaNamespace ns = MetaNamespace::Xmp;
    /// The rewritten image. Empty unless \ref status is Ok.
    std::vector<std::byte> image_bytes;
    /// The applied keys with their requested values.
    FieldMap updated;
};

/**
 * \brief Detects the container and decodes every namespace it carries.
 *
 * PNG chunk CRCs are verified. Any codec failure fails the whole read.
 */
ReadResult
read_metadata(std::span<const std::byte> bytes,
              const ReadOptions& options = ReadOptions {}) noexcept;

/**
 * \brief Applies \p updates to one metadata namespace of the image.
 *
 * The namespace is chosen by (format, route). TIFF has no XMP writer: XMP
 * requests fall back to EXIF and keys without an EXIF field fail with
 * \ref CodecStatus::UnsupportedOperation. A repeated key keeps its last
 * value. All updates are applied before one reassembly pass; any failure
 * returns no image bytes.
 */
WriteResult
write_metadata(std::span<const std::byte> bytes,
               std::span<const MetaField> updates,
               const WriteOptions& options = WriteOptions {}) noexcept;

}  // namespace metasplice
