#include "metasplice/container_scan.h"

#include "byte_io_internal.h"

#include <array>

namespace metasplice {
namespace {

    using byte_io::match;
    using byte_io::read_u16be;
    using byte_io::read_u16le;
    using byte_io::read_u32be;
    using byte_io::read_u32le;
    using byte_io::u8;

    static constexpr std::array<uint8_t, 8> kPngSignature = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
    };

    static constexpr uint32_t kMaxPngChunkLength = 0x7FFFFFFFU;

    static bool is_png_signature(std::span<const std::byte> bytes) noexcept
    {
        if (bytes.size() < kPngSignature.size()) {
            return false;
        }
        for (size_t i = 0; i < kPngSignature.size(); ++i) {
            if (u8(bytes[i]) != kPngSignature[i]) {
                return false;
            }
        }
        return true;
    }


    static ContainerFormat detect_format(std::span<const std::byte> bytes) noexcept
    {
        if (bytes.size() >= 2 && u8(bytes[0]) == 0xFF && u8(bytes[1]) == 0xD8) {
            return ContainerFormat::Jpeg;
        }
        if (is_png_signature(bytes)) {
            return ContainerFormat::Png;
        }
        if (match(bytes, 0, std::string_view("II*\0", 4))
            || match(bytes, 0, std::string_view("MM\0*", 4))) {
            return ContainerFormat::Tiff;
        }
        if (match(bytes, 0, "RIFF") && match(bytes, 8, "WEBP")) {
            return ContainerFormat::Webp;
        }
        return ContainerFormat::Unknown;
    }


    static void push_block(ImageContainer* out, ContainerBlockKind kind,
                           uint32_t id, uint64_t outer_offset,
                           uint64_t outer_size, uint64_t data_offset,
                           uint64_t data_size)
    {
        ContainerBlockRef block;
        block.kind         = kind;
        block.id           = id;
        block.outer_offset = outer_offset;
        block.outer_size   = outer_size;
        block.data_offset  = data_offset;
        block.data_size    = data_size;
        out->blocks.push_back(block);
    }


    static void set_dimensions(ImageContainer* out, uint32_t w,
                               uint32_t h) noexcept
    {
        if (out->has_dimensions || w == 0 || h == 0) {
            return;
        }
        out->has_dimensions = true;
        out->width          = w;
        out->height         = h;
    }


    static bool is_jpeg_sof(uint16_t marker) noexcept
    {
        if (marker < 0xFFC0 || marker > 0xFFCF) {
            return false;
        }
        return marker != 0xFFC4 && marker != 0xFFC8 && marker != 0xFFCC;
    }


    static CodecStatus scan_jpeg(std::span<const std::byte> bytes,
                                 ImageContainer* out) noexcept
    {
        push_block(out, ContainerBlockKind::Signature, 0xFFD8, 0, 2, 2, 0);

        uint64_t offset = 2;
        while (offset < bytes.size()) {
            if (u8(bytes[offset]) != 0xFF) {
                return CodecStatus::MalformedContainer;
            }
            const uint64_t seg_off = offset;
            while (offset < bytes.size() && u8(bytes[offset]) == 0xFF) {
                offset += 1;
            }
            if (offset >= bytes.size()) {
                return CodecStatus::MalformedContainer;
            }
            const uint16_t marker = static_cast<uint16_t>(
                0xFF00U | static_cast<uint16_t>(u8(bytes[offset])));
            offset += 1;

            if (marker == 0xFFD9) {
                push_block(out, ContainerBlockKind::End, marker, seg_off,
                           offset - seg_off, offset, 0);
                if (offset < bytes.size()) {
                    push_block(out, ContainerBlockKind::Trailer, 0, offset,
                               bytes.size() - offset, offset,
                               bytes.size() - offset);
                }
                return CodecStatus::Ok;
            }
            if (marker == 0xFFDA) {
                // Start of Scan: everything from here on is image data.
                push_block(out, ContainerBlockKind::ImageData, marker, seg_off,
                           bytes.size() - seg_off, offset,
                           bytes.size() - offset);
                return CodecStatus::Ok;
            }
            if ((marker >= 0xFFD0 && marker <= 0xFFD7) || marker == 0xFF01
                || marker == 0xFF00) {
                push_block(out, ContainerBlockKind::Other, marker, seg_off,
                           offset - seg_off, offset, 0);
                continue;
            }

            uint16_t seg_len = 0;
            if (!read_u16be(bytes, offset, &seg_len) || seg_len < 2) {
                return CodecStatus::MalformedContainer;
            }
            const uint64_t payload_off  = offset + 2;
            const uint64_t payload_size = static_cast<uint64_t>(seg_len) - 2;
            if (!byte_io::in_range(bytes, payload_off, payload_size)) {
                return CodecStatus::MalformedContainer;
            }
            const uint64_t seg_size = payload_off + payload_size - seg_off;

            ContainerBlockKind kind = ContainerBlockKind::Other;
            uint64_t data_off       = payload_off;
            uint64_t data_size      = payload_size;
            if (marker == 0xFFE1
                && payload_size >= kJpegExifSignature.size() + 8
                && match(bytes, payload_off, std::string_view("Exif\0", 5))) {
                kind      = ContainerBlockKind::Exif;
                data_off  = payload_off + kJpegExifSignature.size();
                data_size = payload_size - kJpegExifSignature.size();
            } else if (marker == 0xFFE1
                       && match(bytes, payload_off, kJpegXmpSignature)) {
                kind      = ContainerBlockKind::Xmp;
                data_off  = payload_off + kJpegXmpSignature.size();
                data_size = payload_size - kJpegXmpSignature.size();
            } else if (is_jpeg_sof(marker)) {
                kind = ContainerBlockKind::ImageHeader;
                // precision(1) + height(2) + width(2)
                uint16_t h = 0;
                uint16_t w = 0;
                if (payload_size >= 5
                    && read_u16be(bytes, payload_off + 1, &h)
                    && read_u16be(bytes, payload_off + 3, &w)) {
                    set_dimensions(out, w, h);
                }
            }
            push_block(out, kind, marker, seg_off, seg_size, data_off,
                       data_size);
            offset = payload_off + payload_size;
        }
        return CodecStatus::Ok;
    }


    static bool png_itxt_is_xmp(std::span<const std::byte> bytes,
                                uint64_t data_off, uint64_t data_size) noexcept
    {
        if (data_size < kPngXmpKeyword.size() + 1) {
            return false;
        }
        return match(bytes, data_off, kPngXmpKeyword)
               && u8(bytes[data_off + kPngXmpKeyword.size()]) == 0;
    }


    static ContainerBlockKind png_chunk_kind(std::span<const std::byte> bytes,
                                             uint32_t type, uint64_t data_off,
                                             uint64_t data_size) noexcept
    {
        switch (type) {
        case fourcc('I', 'H', 'D', 'R'): return ContainerBlockKind::ImageHeader;
        case fourcc('I', 'D', 'A', 'T'): return ContainerBlockKind::ImageData;
        case fourcc('I', 'E', 'N', 'D'): return ContainerBlockKind::End;
        case fourcc('e', 'X', 'I', 'f'): return ContainerBlockKind::Exif;
        case fourcc('t', 'E', 'X', 't'):
        case fourcc('z', 'T', 'X', 't'): return ContainerBlockKind::Text;
        case fourcc('i', 'T', 'X', 't'):
            return png_itxt_is_xmp(bytes, data_off, data_size)
                       ? ContainerBlockKind::Xmp
                       : ContainerBlockKind::Text;
        default: break;
        }
        return ContainerBlockKind::Other;
    }


    static CodecStatus scan_png(std::span<const std::byte> bytes,
                                ImageContainer* out) noexcept
    {
        push_block(out, ContainerBlockKind::Signature, 0, 0,
                   kPngSignature.size(), kPngSignature.size(), 0);

        uint64_t offset = kPngSignature.size();
        bool seen_iend  = false;
        while (offset < bytes.size()) {
            uint32_t len  = 0;
            uint32_t type = 0;
            if (!read_u32be(bytes, offset, &len)
                || !read_u32be(bytes, offset + 4, &type)) {
                return CodecStatus::MalformedContainer;
            }
            if (len > kMaxPngChunkLength) {
                return CodecStatus::ResourceLimitExceeded;
            }
            const uint64_t data_off  = offset + 8;
            const uint64_t data_size = len;
            if (!byte_io::in_range(bytes, data_off, data_size + 4)) {
                return CodecStatus::MalformedContainer;
            }

            const bool first = (out->blocks.size() == 1);
            if (first != (type == fourcc('I', 'H', 'D', 'R'))) {
                return CodecStatus::MalformedContainer;
            }

            const ContainerBlockKind kind = png_chunk_kind(bytes, type,
                                                           data_off, data_size);
            push_block(out, kind, type, offset, 12 + data_size, data_off,
                       data_size);

            if (kind == ContainerBlockKind::ImageHeader) {
                uint32_t w = 0;
                uint32_t h = 0;
                if (data_size >= 8 && read_u32be(bytes, data_off, &w)
                    && read_u32be(bytes, data_off + 4, &h)) {
                    set_dimensions(out, w, h);
                }
            }

            offset = data_off + data_size + 4;
            if (kind == ContainerBlockKind::End) {
                seen_iend = true;
                break;
            }
        }

        if (!seen_iend) {
            return CodecStatus::MalformedContainer;
        }
        if (offset < bytes.size()) {
            push_block(out, ContainerBlockKind::Trailer, 0, offset,
                       bytes.size() - offset, offset, bytes.size() - offset);
        }
        return CodecStatus::Ok;
    }


    static uint32_t read_u24le_at(std::span<const std::byte> bytes,
                                  uint64_t off) noexcept
    {
        return static_cast<uint32_t>(u8(bytes[off]))
               | (static_cast<uint32_t>(u8(bytes[off + 1])) << 8)
               | (static_cast<uint32_t>(u8(bytes[off + 2])) << 16);
    }


    static void webp_dimensions(std::span<const std::byte> bytes, uint32_t type,
                                uint64_t data_off, uint64_t data_size,
                                ImageContainer* out) noexcept
    {
        if (type == fourcc('V', 'P', '8', 'X') && data_size >= 10) {
            set_dimensions(out, read_u24le_at(bytes, data_off + 4) + 1U,
                           read_u24le_at(bytes, data_off + 7) + 1U);
            return;
        }
        if (type == fourcc('V', 'P', '8', ' ') && data_size >= 10) {
            // frame tag(3) + start code 9D 01 2A + 14-bit width/height.
            if (u8(bytes[data_off + 3]) != 0x9D
                || u8(bytes[data_off + 4]) != 0x01
                || u8(bytes[data_off + 5]) != 0x2A) {
                return;
            }
            uint16_t w = 0;
            uint16_t h = 0;
            (void)read_u16le(bytes, data_off + 6, &w);
            (void)read_u16le(bytes, data_off + 8, &h);
            set_dimensions(out, w & 0x3FFFU, h & 0x3FFFU);
            return;
        }
        if (type == fourcc('V', 'P', '8', 'L') && data_size >= 5) {
            if (u8(bytes[data_off]) != 0x2F) {
                return;
            }
            uint32_t bits = 0;
            (void)read_u32le(bytes, data_off + 1, &bits);
            set_dimensions(out, (bits & 0x3FFFU) + 1U,
                           ((bits >> 14) & 0x3FFFU) + 1U);
        }
    }


    static CodecStatus scan_webp(std::span<const std::byte> bytes,
                                 ImageContainer* out) noexcept
    {
        uint32_t riff_size = 0;
        if (bytes.size() < 12 || !read_u32le(bytes, 4, &riff_size)) {
            return CodecStatus::MalformedContainer;
        }
        push_block(out, ContainerBlockKind::Signature, fourcc('R', 'I', 'F', 'F'),
                   0, 12, 12, 0);

        const uint64_t file_end = (riff_size + 8ULL < bytes.size())
                                      ? (riff_size + 8ULL)
                                      : static_cast<uint64_t>(bytes.size());

        uint64_t offset = 12;
        while (offset + 8 <= file_end) {
            uint32_t type    = 0;
            uint32_t size_le = 0;
            if (!read_u32be(bytes, offset, &type)
                || !read_u32le(bytes, offset + 4, &size_le)) {
                return CodecStatus::MalformedContainer;
            }
            const uint64_t data_off  = offset + 8;
            uint64_t data_size       = size_le;
            uint64_t next            = data_off + data_size;
            if (next > file_end) {
                return CodecStatus::MalformedContainer;
            }
            if ((data_size & 1U) != 0U && next < file_end) {
                next += 1;
            }

            ContainerBlockKind kind = ContainerBlockKind::Other;
            uint64_t payload_off    = data_off;
            if (type == fourcc('E', 'X', 'I', 'F')) {
                kind = ContainerBlockKind::Exif;
                if (data_size >= kJpegExifSignature.size()
                    && match(bytes, data_off, kJpegExifSignature)) {
                    payload_off = data_off + kJpegExifSignature.size();
                    data_size -= kJpegExifSignature.size();
                }
            } else if (type == fourcc('X', 'M', 'P', ' ')) {
                kind = ContainerBlockKind::Xmp;
            } else if (type == fourcc('V', 'P', '8', 'X')) {
                kind = ContainerBlockKind::ImageHeader;
            } else if (type == fourcc('V', 'P', '8', ' ')
                       || type == fourcc('V', 'P', '8', 'L')) {
                kind = ContainerBlockKind::ImageData;
            }
            webp_dimensions(bytes, type, data_off, size_le, out);

            push_block(out, kind, type, offset, next - offset, payload_off,
                       data_size);
            offset = next;
        }

        if (offset < bytes.size()) {
            push_block(out, ContainerBlockKind::Trailer, 0, offset,
                       bytes.size() - offset, offset, bytes.size() - offset);
        }
        return CodecStatus::Ok;
    }


    static void tiff_dimensions(std::span<const std::byte> bytes,
                                ImageContainer* out) noexcept
    {
        const bool le = (u8(bytes[0]) == 'I');
        auto rd16     = [&](uint64_t off, uint16_t* v) noexcept {
            return le ? read_u16le(bytes, off, v) : read_u16be(bytes, off, v);
        };
        auto rd32 = [&](uint64_t off, uint32_t* v) noexcept {
            return le ? read_u32le(bytes, off, v) : read_u32be(bytes, off, v);
        };

        uint32_t ifd0  = 0;
        uint16_t count = 0;
        if (!rd32(4, &ifd0) || !rd16(ifd0, &count)) {
            return;
        }
        uint32_t w = 0;
        uint32_t h = 0;
        for (uint32_t i = 0; i < count; ++i) {
            const uint64_t e = static_cast<uint64_t>(ifd0) + 2 + 12ULL * i;
            uint16_t tag     = 0;
            uint16_t type    = 0;
            if (!rd16(e, &tag) || !rd16(e + 2, &type)) {
                return;
            }
            if (tag != 0x0100 && tag != 0x0101) {
                continue;
            }
            uint32_t v = 0;
            if (type == 3) {
                uint16_t s = 0;
                if (!rd16(e + 8, &s)) {
                    return;
                }
                v = s;
            } else if (type == 4) {
                if (!rd32(e + 8, &v)) {
                    return;
                }
            } else {
                continue;
            }
            (tag == 0x0100 ? w : h) = v;
        }
        set_dimensions(out, w, h);
    }


    static CodecStatus scan_tiff(std::span<const std::byte> bytes,
                                 ImageContainer* out) noexcept
    {
        push_block(out, ContainerBlockKind::Exif, 0, 0, bytes.size(), 0,
                   bytes.size());
        tiff_dimensions(bytes, out);
        return CodecStatus::Ok;
    }

}  // namespace

std::string_view
container_format_name(ContainerFormat format) noexcept
{
    switch (format) {
    case ContainerFormat::Unknown: return "UNKNOWN";
    case ContainerFormat::Jpeg: return "JPEG";
    case ContainerFormat::Png: return "PNG";
    case ContainerFormat::Tiff: return "TIFF";
    case ContainerFormat::Webp: return "WEBP";
    }
    return "UNKNOWN";
}


CodecStatus
scan_container(std::span<const std::byte> bytes, ImageContainer* out) noexcept
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }
    *out        = ImageContainer {};
    out->format = detect_format(bytes);

    CodecStatus status = CodecStatus::UnrecognizedFormat;
    switch (out->format) {
    case ContainerFormat::Jpeg: status = scan_jpeg(bytes, out); break;
    case ContainerFormat::Png: status = scan_png(bytes, out); break;
    case ContainerFormat::Tiff: status = scan_tiff(bytes, out); break;
    case ContainerFormat::Webp: status = scan_webp(bytes, out); break;
    case ContainerFormat::Unknown: break;
    }
    if (status != CodecStatus::Ok) {
        out->blocks.clear();
    }
    return status;
}


SniffResult
sniff_container(std::span<const std::byte> bytes) noexcept
{
    SniffResult res;
    ImageContainer container;
    const CodecStatus status = scan_container(bytes, &container);
    res.format               = container.format;
    if (container.format == ContainerFormat::Unknown) {
        res.status = status;
        return res;
    }
    res.has_dimensions = container.has_dimensions;
    res.width          = container.width;
    res.height         = container.height;
    return res;
}


std::span<const std::byte>
block_data(std::span<const std::byte> bytes,
           const ContainerBlockRef& block) noexcept
{
    if (!byte_io::in_range(bytes, block.data_offset, block.data_size)) {
        return {};
    }
    return bytes.subspan(static_cast<size_t>(block.data_offset),
                         static_cast<size_t>(block.data_size));
}


int64_t
find_block(const ImageContainer& container, ContainerBlockKind kind) noexcept
{
    for (size_t i = 0; i < container.blocks.size(); ++i) {
        if (container.blocks[i].kind == kind) {
            return static_cast<int64_t>(i);
        }
    }
    return -1;
}

}  // namespace metasplice
