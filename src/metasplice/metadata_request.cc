#include "metasplice/metadata_request.h"

#include "metasplice/container_splice.h"
#include "metasplice/png_chunk.h"

#include "metadata_codecs_internal.h"

#include <utility>

namespace metasplice {
namespace {

    static void fail(CodecFailure* failure, CodecStatus status,
                     RequestStage stage) noexcept
    {
        failure->status = status;
        failure->stage  = stage;
    }


    static void fail(CodecFailure* failure, CodecStatus status,
                     RequestStage stage, MetaNamespace ns,
                     std::string key = {}) noexcept
    {
        fail(failure, status, stage);
        failure->has_namespace = true;
        failure->ns            = ns;
        failure->key           = std::move(key);
    }


    /// Sniffs, scans and (for PNG) verifies the chunk stream.
    static CodecStatus detect(std::span<const std::byte> bytes,
                              const ResourcePolicy& policy,
                              ImageContainer* container) noexcept
    {
        if (policy.max_file_bytes != 0U && bytes.size() > policy.max_file_bytes) {
            return CodecStatus::ResourceLimitExceeded;
        }
        const CodecStatus st = scan_container(bytes, container);
        if (st != CodecStatus::Ok) {
            return st;
        }
        if (container->format == ContainerFormat::Png) {
            return validate_png_chunks(bytes, *container, policy.png_limits);
        }
        return CodecStatus::Ok;
    }

}  // namespace

std::string_view
write_route_name(WriteRoute route) noexcept
{
    switch (route) {
    case WriteRoute::Default: return "default";
    case WriteRoute::Xmp: return "xmp";
    case WriteRoute::Exif: return "exif";
    case WriteRoute::PngText: return "png-text";
    }
    return "default";
}


bool
parse_write_route(std::string_view name, WriteRoute* out) noexcept
{
    static constexpr WriteRoute kRoutes[] = {
        WriteRoute::Default,
        WriteRoute::Xmp,
        WriteRoute::Exif,
        WriteRoute::PngText,
    };
    for (WriteRoute r : kRoutes) {
        if (write_route_name(r) == name) {
            *out = r;
            return true;
        }
    }
    return false;
}


std::string_view
request_stage_name(RequestStage stage) noexcept
{
    switch (stage) {
    case RequestStage::Detect: return "detect";
    case RequestStage::Dispatch: return "dispatch";
    case RequestStage::Codec: return "codec";
    case RequestStage::Reassemble: return "reassemble";
    case RequestStage::Done: return "done";
    }
    return "unknown";
}


ReadResult
read_metadata(std::span<const std::byte> bytes,
              const ReadOptions& options) noexcept
{
    ReadResult result;

    ImageContainer container;
    CodecStatus st = detect(bytes, options.policy, &container);
    result.format  = container.format;
    if (st != CodecStatus::Ok) {
        fail(&result.failure, st, RequestStage::Detect);
        result.status = st;
        return result;
    }
    result.has_dimensions = container.has_dimensions;
    result.width          = container.width;
    result.height         = container.height;

    st = codecs_internal::read_exif(bytes, container, options,
                                    &result.has_exif, &result.exif);
    if (st != CodecStatus::Ok) {
        fail(&result.failure, st, RequestStage::Codec, MetaNamespace::Exif);
        result.status = st;
        return result;
    }
    if (container.format == ContainerFormat::Png) {
        st = codecs_internal::read_png_text(bytes, container, options,
                                            &result.has_png_text,
                                            &result.png_text);
        if (st != CodecStatus::Ok) {
            fail(&result.failure, st, RequestStage::Codec,
                 MetaNamespace::PngText);
            result.status = st;
            return result;
        }
    }
    st = codecs_internal::read_xmp(bytes, container, options, &result.has_xmp,
                                   &result.xmp);
    if (st != CodecStatus::Ok) {
        fail(&result.failure, st, RequestStage::Codec, MetaNamespace::Xmp);
        result.status = st;
        return result;
    }

    result.failure.stage = RequestStage::Done;
    return result;
}


WriteResult
write_metadata(std::span<const std::byte> bytes,
               std::span<const MetaField> updates,
               const WriteOptions& options) noexcept
{
    WriteResult result;

    ImageContainer container;
    CodecStatus st = detect(bytes, options.policy, &container);
    result.format  = container.format;
    if (st != CodecStatus::Ok) {
        fail(&result.failure, st, RequestStage::Detect);
        result.status = st;
        return result;
    }

    const MetaNamespace requested
        = codecs_internal::route_namespace(container.format, options.route);
    const codecs_internal::WriteRouteEntry* route
        = codecs_internal::find_write_route(container.format, requested);
    if (!route) {
        fail(&result.failure, CodecStatus::UnsupportedOperation,
             RequestStage::Dispatch, requested);
        result.status = CodecStatus::UnsupportedOperation;
        return result;
    }
    result.ns = route->applied;

    // Repeated keys keep their first position and their last value.
    FieldMap merged(route->applied);
    for (const MetaField& f : updates) {
        (void)merged.set(f.key, f.value, f.type_hint);
    }

    if (merged.empty()) {
        result.image_bytes.assign(bytes.begin(), bytes.end());
        result.updated       = std::move(merged);
        result.failure.stage = RequestStage::Done;
        return result;
    }

    codecs_internal::WriteContext ctx;
    ctx.bytes     = bytes;
    ctx.container = &container;
    ctx.options   = &options;

    std::vector<BlockEdit> edits;
    std::string failed_key;
    st = route->write(ctx, merged.entries(), &edits, &failed_key);
    if (st != CodecStatus::Ok) {
        fail(&result.failure, st, RequestStage::Codec, route->applied,
             std::move(failed_key));
        result.status = st;
        return result;
    }

    st = splice_container(bytes, container, edits, &result.image_bytes);
    if (st != CodecStatus::Ok) {
        result.image_bytes.clear();
        fail(&result.failure, st, RequestStage::Reassemble, route->applied);
        result.status = st;
        return result;
    }

    result.updated       = std::move(merged);
    result.failure.stage = RequestStage::Done;
    return result;
}

}  // namespace metasplice
