#include "metadata_codecs_internal.h"

#include "metasplice/exif_tiff_decode.h"
#include "metasplice/exif_tiff_encode.h"
#include "metasplice/jpeg_segment.h"
#include "metasplice/png_chunk.h"
#include "metasplice/xmp_decode.h"
#include "metasplice/xmp_encode.h"

#include "byte_io_internal.h"

#include <utility>

namespace metasplice::codecs_internal {
namespace {

    static constexpr uint32_t kPngExifType = fourcc('e', 'X', 'I', 'f');
    static constexpr uint32_t kPngItxtType = fourcc('i', 'T', 'X', 't');
    /// TIFF IFD0 tag carrying an XMP packet (XMLPacket).
    static constexpr uint16_t kTiffXmpTag = 0x02BC;

    static std::span<const std::byte>
    first_block_data(std::span<const std::byte> bytes,
                     const ImageContainer& container, ContainerBlockKind kind,
                     bool* found) noexcept
    {
        const int64_t i = find_block(container, kind);
        if (found) {
            *found = (i >= 0);
        }
        if (i < 0) {
            return {};
        }
        return block_data(bytes, container.blocks[static_cast<size_t>(i)]);
    }


    static CodecStatus encode_exif(const WriteContext& ctx,
                                   std::span<const MetaField> updates,
                                   std::vector<std::byte>* tiff,
                                   std::string* failed_key) noexcept
    {
        ExifEncodeOptions options;
        options.synthesize_little_endian = ctx.options->synthesize_little_endian;
        apply_resource_policy(ctx.options->policy, nullptr, &options);

        const std::span<const std::byte> existing = first_block_data(
            ctx.bytes, *ctx.container, ContainerBlockKind::Exif, nullptr);
        ExifEncodeResult r = update_exif_tiff(existing, updates, options, tiff);
        if (r.status != CodecStatus::Ok && failed_key) {
            *failed_key = std::move(r.failed_key);
        }
        return r.status;
    }


    static CodecStatus write_jpeg_exif(const WriteContext& ctx,
                                       std::span<const MetaField> updates,
                                       std::vector<BlockEdit>* edits,
                                       std::string* failed_key) noexcept
    {
        std::vector<std::byte> tiff;
        CodecStatus st = encode_exif(ctx, updates, &tiff, failed_key);
        if (st != CodecStatus::Ok) {
            return st;
        }
        std::vector<std::byte> segment;
        st = make_jpeg_app1(kJpegExifSignature, tiff, &segment);
        if (st != CodecStatus::Ok) {
            return st;
        }
        return plan_jpeg_app1_upsert(*ctx.container, ContainerBlockKind::Exif,
                                     std::move(segment), edits);
    }


    static CodecStatus write_png_exif(const WriteContext& ctx,
                                      std::span<const MetaField> updates,
                                      std::vector<BlockEdit>* edits,
                                      std::string* failed_key) noexcept
    {
        std::vector<std::byte> tiff;
        const CodecStatus st = encode_exif(ctx, updates, &tiff, failed_key);
        if (st != CodecStatus::Ok) {
            return st;
        }
        std::vector<std::byte> chunk;
        build_png_chunk(kPngExifType, tiff, &chunk);
        return plan_png_chunk_upsert(*ctx.container, ContainerBlockKind::Exif,
                                     std::move(chunk), edits);
    }


    /// A TIFF file is a single Exif block; the whole file is rewritten.
    static CodecStatus write_tiff_exif(const WriteContext& ctx,
                                       std::span<const MetaField> updates,
                                       std::vector<BlockEdit>* edits,
                                       std::string* failed_key) noexcept
    {
        const int64_t index = find_block(*ctx.container,
                                         ContainerBlockKind::Exif);
        if (index < 0) {
            return CodecStatus::MalformedContainer;
        }
        BlockEdit edit;
        edit.kind            = BlockEditKind::Replace;
        edit.block_index     = static_cast<uint32_t>(index);
        const CodecStatus st = encode_exif(ctx, updates, &edit.bytes,
                                           failed_key);
        if (st != CodecStatus::Ok) {
            return st;
        }
        edits->push_back(std::move(edit));
        return CodecStatus::Ok;
    }


    /// Returns the raw packet stored in \p block (inflating PNG iTXt).
    static CodecStatus xmp_block_bytes(std::span<const std::byte> bytes,
                                       ContainerFormat format,
                                       const ContainerBlockRef& block,
                                       const ResourcePolicy& policy,
                                       std::string* storage,
                                       std::span<const std::byte>* out) noexcept
    {
        const std::span<const std::byte> data = block_data(bytes, block);
        if (format != ContainerFormat::Png) {
            *out = data;
            return CodecStatus::Ok;
        }
        PngTextOptions options;
        apply_resource_policy(policy, &options);
        PngTextChunk chunk;
        const CodecStatus st = decode_png_text_chunk(block.id, data, options,
                                                     &chunk);
        if (st != CodecStatus::Ok) {
            return st;
        }
        *storage = std::move(chunk.text);
        *out     = byte_io::as_bytes(*storage);
        return CodecStatus::Ok;
    }


    /// Loads the existing packet of a JPEG or PNG, if any.
    static CodecStatus load_xmp_packet(const WriteContext& ctx,
                                       XmpPacket* packet) noexcept
    {
        const int64_t index = find_block(*ctx.container,
                                         ContainerBlockKind::Xmp);
        if (index < 0) {
            return CodecStatus::Ok;
        }
        std::string storage;
        std::span<const std::byte> xml;
        const CodecStatus st = xmp_block_bytes(
            ctx.bytes, ctx.container->format,
            ctx.container->blocks[static_cast<size_t>(index)],
            ctx.options->policy, &storage, &xml);
        if (st != CodecStatus::Ok) {
            return st;
        }
        XmpDecodeOptions options;
        apply_resource_policy(ctx.options->policy, &options);
        return decode_xmp_packet(xml, options, packet);
    }


    static CodecStatus encode_xmp(const WriteContext& ctx,
                                  std::span<const MetaField> updates,
                                  std::vector<std::byte>* xml,
                                  std::string* failed_key) noexcept
    {
        XmpPacket packet;
        CodecStatus st = load_xmp_packet(ctx, &packet);
        if (st != CodecStatus::Ok) {
            return st;
        }
        st = apply_xmp_updates(updates, &packet, failed_key);
        if (st != CodecStatus::Ok) {
            return st;
        }
        return encode_xmp_packet(packet, ctx.options->policy.xmp_limits, xml);
    }


    static CodecStatus write_jpeg_xmp(const WriteContext& ctx,
                                      std::span<const MetaField> updates,
                                      std::vector<BlockEdit>* edits,
                                      std::string* failed_key) noexcept
    {
        std::vector<std::byte> xml;
        CodecStatus st = encode_xmp(ctx, updates, &xml, failed_key);
        if (st != CodecStatus::Ok) {
            return st;
        }
        std::vector<std::byte> segment;
        st = make_jpeg_app1(kJpegXmpSignature, xml, &segment);
        if (st != CodecStatus::Ok) {
            return st;
        }
        return plan_jpeg_app1_upsert(*ctx.container, ContainerBlockKind::Xmp,
                                     std::move(segment), edits);
    }


    static CodecStatus write_png_xmp(const WriteContext& ctx,
                                     std::span<const MetaField> updates,
                                     std::vector<BlockEdit>* edits,
                                     std::string* failed_key) noexcept
    {
        std::vector<std::byte> xml;
        CodecStatus st = encode_xmp(ctx, updates, &xml, failed_key);
        if (st != CodecStatus::Ok) {
            return st;
        }
        PngTextChunk itxt;
        itxt.type    = kPngItxtType;
        itxt.keyword = std::string(kPngXmpKeyword);
        itxt.text    = std::string(byte_io::as_chars(xml));

        std::vector<std::byte> data;
        st = encode_png_text_chunk(itxt, &data);
        if (st != CodecStatus::Ok) {
            return st;
        }
        std::vector<std::byte> chunk;
        build_png_chunk(kPngItxtType, data, &chunk);
        return plan_png_chunk_upsert(*ctx.container, ContainerBlockKind::Xmp,
                                     std::move(chunk), edits);
    }


    static CodecStatus write_png_text(const WriteContext& ctx,
                                      std::span<const MetaField> updates,
                                      std::vector<BlockEdit>* edits,
                                      std::string* failed_key) noexcept
    {
        return plan_png_text_update(ctx.bytes, *ctx.container, updates, edits,
                                    failed_key);
    }


    static constexpr WriteRouteEntry kWriteRoutes[] = {
        { ContainerFormat::Jpeg, MetaNamespace::Xmp, MetaNamespace::Xmp,
          &write_jpeg_xmp },
        { ContainerFormat::Jpeg, MetaNamespace::Exif, MetaNamespace::Exif,
          &write_jpeg_exif },
        { ContainerFormat::Png, MetaNamespace::Xmp, MetaNamespace::Xmp,
          &write_png_xmp },
        { ContainerFormat::Png, MetaNamespace::Exif, MetaNamespace::Exif,
          &write_png_exif },
        { ContainerFormat::Png, MetaNamespace::PngText, MetaNamespace::PngText,
          &write_png_text },
        { ContainerFormat::Tiff, MetaNamespace::Exif, MetaNamespace::Exif,
          &write_tiff_exif },
        { ContainerFormat::Tiff, MetaNamespace::Xmp, MetaNamespace::Exif,
          &write_tiff_exif },
    };

}  // namespace

MetaNamespace
route_namespace(ContainerFormat format, WriteRoute route) noexcept
{
    switch (route) {
    case WriteRoute::Xmp: return MetaNamespace::Xmp;
    case WriteRoute::Exif: return MetaNamespace::Exif;
    case WriteRoute::PngText: return MetaNamespace::PngText;
    case WriteRoute::Default: break;
    }
    return format == ContainerFormat::Tiff ? MetaNamespace::Exif
                                           : MetaNamespace::Xmp;
}


const WriteRouteEntry*
find_write_route(ContainerFormat format, MetaNamespace ns) noexcept
{
    for (const WriteRouteEntry& e : kWriteRoutes) {
        if (e.format == format && e.requested == ns) {
            return &e;
        }
    }
    return nullptr;
}


CodecStatus
read_exif(std::span<const std::byte> bytes, const ImageContainer& container,
          const ReadOptions& options, bool* found, FieldMap* out) noexcept
{
    const std::span<const std::byte> tiff
        = first_block_data(bytes, container, ContainerBlockKind::Exif, found);
    if (!*found) {
        return CodecStatus::Ok;
    }
    ExifDecodeOptions decode;
    decode.include_unnamed_tags = options.include_unnamed_exif_tags;
    apply_resource_policy(options.policy, &decode, nullptr);
    return decode_exif_tiff(tiff, decode, out);
}


CodecStatus
read_png_text(std::span<const std::byte> bytes,
              const ImageContainer& container, const ReadOptions& options,
              bool* found, FieldMap* out) noexcept
{
    *found = (find_block(container, ContainerBlockKind::Text) >= 0);
    if (!*found) {
        return CodecStatus::Ok;
    }
    PngTextOptions decode;
    apply_resource_policy(options.policy, &decode);
    return decode_png_text(bytes, container, decode, out);
}


CodecStatus
read_xmp(std::span<const std::byte> bytes, const ImageContainer& container,
         const ReadOptions& options, bool* found, FieldMap* out) noexcept
{
    *found = false;
    std::string storage;
    std::span<const std::byte> xml;

    if (container.format == ContainerFormat::Tiff) {
        TiffStructure tiff;
        const CodecStatus st = parse_tiff_structure(
            bytes, options.policy.exif_limits, &tiff);
        if (st != CodecStatus::Ok) {
            return st;
        }
        const IfdEntry* e = find_ifd_entry(tiff, IfdKind::Ifd0, kTiffXmpTag);
        if (!e || e->value_size == 0) {
            return CodecStatus::Ok;
        }
        xml = bytes.subspan(static_cast<size_t>(e->value_offset),
                            static_cast<size_t>(e->value_size));
    } else {
        const int64_t index = find_block(container, ContainerBlockKind::Xmp);
        if (index < 0) {
            return CodecStatus::Ok;
        }
        const CodecStatus st = xmp_block_bytes(
            bytes, container.format,
            container.blocks[static_cast<size_t>(index)], options.policy,
            &storage, &xml);
        if (st != CodecStatus::Ok) {
            return st;
        }
    }

    *found = true;
    XmpDecodeOptions decode;
    apply_resource_policy(options.policy, &decode);
    XmpPacket packet;
    const CodecStatus st = decode_xmp_packet(xml, decode, &packet);
    if (st != CodecStatus::Ok) {
        return st;
    }
    collect_xmp_fields(packet, out);
    return CodecStatus::Ok;
}

}  // namespace metasplice::codecs_internal
