#pragma once

#include "metasplice/container_scan.h"
#include "metasplice/png_chunk.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Builders for small synthetic images used across the unit tests.

namespace metasplice::test {

inline void
append_u16be(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_u16le(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
}


inline void
append_u32be(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_u32le(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
}


inline void
append_bytes(std::vector<std::byte>* out, std::string_view s)
{
    for (char c : s) {
        out->push_back(std::byte { static_cast<uint8_t>(c) });
    }
}


inline std::vector<std::byte>
bytes_of(std::string_view s)
{
    std::vector<std::byte> out;
    append_bytes(&out, s);
    return out;
}


inline std::string
string_of(std::span<const std::byte> bytes)
{
    return std::string(reinterpret_cast<const char*>(bytes.data()),
                       bytes.size());
}


inline bool
contains(std::span<const std::byte> haystack, std::string_view needle)
{
    return string_of(haystack).find(needle) != std::string::npos;
}


inline void
append_jpeg_segment(std::vector<std::byte>* out, uint16_t marker,
                    std::span<const std::byte> payload)
{
    append_u16be(out, marker);
    append_u16be(out, static_cast<uint16_t>(payload.size() + 2));
    out->insert(out->end(), payload.begin(), payload.end());
}


/// SOI, optional JFIF APP0, optional extra segments, SOF0, SOS, scan data,
/// EOI.
inline std::vector<std::byte>
make_jpeg(uint16_t width, uint16_t height,
          std::span<const std::vector<std::byte>> app_segments = {},
          bool with_jfif = true)
{
    std::vector<std::byte> jpeg;
    append_u16be(&jpeg, 0xFFD8);
    if (with_jfif) {
        std::vector<std::byte> jfif = bytes_of(std::string_view("JFIF\0", 5));
        append_bytes(&jfif, std::string_view("\x01\x01\x00\x00\x01\x00\x01\x00\x00",
                                             9));
        append_jpeg_segment(&jpeg, 0xFFE0, jfif);
    }
    for (const std::vector<std::byte>& seg : app_segments) {
        jpeg.insert(jpeg.end(), seg.begin(), seg.end());
    }

    std::vector<std::byte> sof;
    sof.push_back(std::byte { 8 });
    append_u16be(&sof, height);
    append_u16be(&sof, width);
    sof.push_back(std::byte { 1 });
    sof.push_back(std::byte { 1 });
    sof.push_back(std::byte { 0x11 });
    sof.push_back(std::byte { 0 });
    append_jpeg_segment(&jpeg, 0xFFC0, sof);

    std::vector<std::byte> sos;
    sos.push_back(std::byte { 1 });
    sos.push_back(std::byte { 1 });
    sos.push_back(std::byte { 0 });
    sos.push_back(std::byte { 0 });
    sos.push_back(std::byte { 63 });
    sos.push_back(std::byte { 0 });
    append_jpeg_segment(&jpeg, 0xFFDA, sos);
    append_bytes(&jpeg, std::string_view("\x12\x34\xFF\x00\x56\x78", 6));
    append_u16be(&jpeg, 0xFFD9);
    return jpeg;
}


/// An APP1 segment carrying `Exif\0\0` and \p tiff.
inline std::vector<std::byte>
make_jpeg_exif_segment(std::span<const std::byte> tiff)
{
    std::vector<std::byte> payload = bytes_of(kJpegExifSignature);
    payload.insert(payload.end(), tiff.begin(), tiff.end());
    std::vector<std::byte> seg;
    append_jpeg_segment(&seg, 0xFFE1, payload);
    return seg;
}


/// An APP1 segment carrying the XMP signature and \p xml.
inline std::vector<std::byte>
make_jpeg_xmp_segment(std::string_view xml)
{
    std::vector<std::byte> payload = bytes_of(kJpegXmpSignature);
    append_bytes(&payload, xml);
    std::vector<std::byte> seg;
    append_jpeg_segment(&seg, 0xFFE1, payload);
    return seg;
}


inline std::vector<std::byte>
make_png_chunk(uint32_t type, std::span<const std::byte> data)
{
    std::vector<std::byte> chunk;
    build_png_chunk(type, data, &chunk);
    return chunk;
}


/// Signature, IHDR, \p before_idat chunks, two IDAT chunks, \p after_idat
/// chunks, IEND.
inline std::vector<std::byte>
make_png(uint32_t width, uint32_t height,
         std::span<const std::vector<std::byte>> before_idat = {},
         std::span<const std::vector<std::byte>> after_idat  = {})
{
    std::vector<std::byte> png = bytes_of("\x89PNG\r\n\x1a\n");

    std::vector<std::byte> ihdr;
    append_u32be(&ihdr, width);
    append_u32be(&ihdr, height);
    append_bytes(&ihdr, std::string_view("\x08\x02\x00\x00\x00", 5));
    const std::vector<std::byte> ihdr_chunk
        = make_png_chunk(fourcc('I', 'H', 'D', 'R'), ihdr);
    png.insert(png.end(), ihdr_chunk.begin(), ihdr_chunk.end());

    for (const std::vector<std::byte>& c : before_idat) {
        png.insert(png.end(), c.begin(), c.end());
    }
    const std::vector<std::byte> idat1
        = make_png_chunk(fourcc('I', 'D', 'A', 'T'), bytes_of("pixels-1"));
    const std::vector<std::byte> idat2
        = make_png_chunk(fourcc('I', 'D', 'A', 'T'), bytes_of("pixels-2"));
    png.insert(png.end(), idat1.begin(), idat1.end());
    png.insert(png.end(), idat2.begin(), idat2.end());
    for (const std::vector<std::byte>& c : after_idat) {
        png.insert(png.end(), c.begin(), c.end());
    }
    const std::vector<std::byte> iend
        = make_png_chunk(fourcc('I', 'E', 'N', 'D'), {});
    png.insert(png.end(), iend.begin(), iend.end());
    return png;
}


inline std::vector<std::byte>
make_text_chunk(std::string_view keyword, std::string_view latin1_text)
{
    std::vector<std::byte> data = bytes_of(keyword);
    data.push_back(std::byte { 0 });
    append_bytes(&data, latin1_text);
    return make_png_chunk(fourcc('t', 'E', 'X', 't'), data);
}


/// One IFD entry for \ref TiffBuilder. \p value is in file byte order.
struct TiffTestEntry final {
    uint16_t tag   = 0;
    uint16_t type  = 0;
    uint32_t count = 0;
    std::vector<std::byte> value;
};

/**
 * Lays out a classic TIFF stream: header, IFD0 at offset 8, optional Exif
 * IFD, out-of-line values after each IFD, then \ref trailing bytes.
 */
struct TiffBuilder final {
    bool little_endian = false;
    std::vector<TiffTestEntry> ifd0;
    std::vector<TiffTestEntry> exif_ifd;
    std::vector<std::byte> trailing;

    void put_u16(std::vector<std::byte>* out, uint16_t v) const
    {
        little_endian ? append_u16le(out, v) : append_u16be(out, v);
    }

    void put_u32(std::vector<std::byte>* out, uint32_t v) const
    {
        little_endian ? append_u32le(out, v) : append_u32be(out, v);
    }

    std::vector<std::byte> u16_value(uint16_t v) const
    {
        std::vector<std::byte> out;
        put_u16(&out, v);
        return out;
    }

    void add_ascii(std::vector<TiffTestEntry>* ifd, uint16_t tag,
                   std::string_view text) const
    {
        TiffTestEntry e;
        e.tag   = tag;
        e.type  = 2;
        e.value = bytes_of(text);
        e.value.push_back(std::byte { 0 });
        e.count = static_cast<uint32_t>(e.value.size());
        ifd->push_back(std::move(e));
    }

    void add_short(std::vector<TiffTestEntry>* ifd, uint16_t tag,
                   uint16_t v) const
    {
        TiffTestEntry e;
        e.tag   = tag;
        e.type  = 3;
        e.count = 1;
        e.value = u16_value(v);
        ifd->push_back(std::move(e));
    }

    static uint32_t ifd_size(size_t entries)
    {
        return static_cast<uint32_t>(2 + entries * 12 + 4);
    }

    static uint32_t values_size(const std::vector<TiffTestEntry>& ifd)
    {
        uint32_t n = 0;
        for (const TiffTestEntry& e : ifd) {
            if (e.value.size() > 4) {
                n += static_cast<uint32_t>((e.value.size() + 1) & ~size_t(1));
            }
        }
        return n;
    }

    void write_ifd(std::vector<std::byte>* out,
                   const std::vector<TiffTestEntry>& ifd,
                   uint32_t values_offset) const
    {
        put_u16(out, static_cast<uint16_t>(ifd.size()));
        std::vector<std::byte> values;
        for (const TiffTestEntry& e : ifd) {
            put_u16(out, e.tag);
            put_u16(out, e.type);
            put_u32(out, e.count);
            if (e.value.size() <= 4) {
                std::vector<std::byte> inline_value = e.value;
                inline_value.resize(4, std::byte { 0 });
                out->insert(out->end(), inline_value.begin(),
                            inline_value.end());
            } else {
                put_u32(out, values_offset
                                 + static_cast<uint32_t>(values.size()));
                values.insert(values.end(), e.value.begin(), e.value.end());
                if (values.size() % 2 != 0) {
                    values.push_back(std::byte { 0 });
                }
            }
        }
        put_u32(out, 0);
        out->insert(out->end(), values.begin(), values.end());
    }

    std::vector<std::byte> build() const
    {
        std::vector<TiffTestEntry> root = ifd0;
        const size_t root_count = root.size() + (exif_ifd.empty() ? 0 : 1);
        const uint32_t exif_off = 8 + ifd_size(root_count) + values_size(root);
        if (!exif_ifd.empty()) {
            TiffTestEntry ptr;
            ptr.tag   = 0x8769;
            ptr.type  = 4;
            ptr.count = 1;
            put_u32(&ptr.value, exif_off);
            root.push_back(std::move(ptr));
        }

        std::vector<std::byte> out;
        append_bytes(&out, little_endian ? std::string_view("II*\0", 4)
                                         : std::string_view("MM\0*", 4));
        put_u32(&out, 8);
        write_ifd(&out, root, 8 + ifd_size(root.size()));
        if (!exif_ifd.empty()) {
            write_ifd(&out, exif_ifd, exif_off + ifd_size(exif_ifd.size()));
        }
        out.insert(out.end(), trailing.begin(), trailing.end());
        return out;
    }
};


/// A TIFF image with dimensions in IFD0 and a few pixel bytes.
inline std::vector<std::byte>
make_tiff(uint16_t width, uint16_t height, bool little_endian = true)
{
    TiffBuilder b;
    b.little_endian = little_endian;
    b.add_short(&b.ifd0, 0x0100, width);
    b.add_short(&b.ifd0, 0x0101, height);
    b.trailing = bytes_of("pixeldata");
    return b.build();
}


inline void
append_riff_chunk(std::vector<std::byte>* out, uint32_t type,
                  std::span<const std::byte> data)
{
    append_u32be(out, type);
    append_u32le(out, static_cast<uint32_t>(data.size()));
    out->insert(out->end(), data.begin(), data.end());
    if (data.size() % 2 != 0) {
        out->push_back(std::byte { 0 });
    }
}


/// RIFF/WEBP with a VP8X header, optional EXIF/XMP chunks and a VP8L chunk.
inline std::vector<std::byte>
make_webp(uint32_t width, uint32_t height, std::span<const std::byte> tiff = {},
          std::string_view xml = {})
{
    std::vector<std::byte> body = bytes_of("WEBP");
    std::vector<std::byte> vp8x;
    uint8_t flags = 0;
    if (!tiff.empty()) {
        flags |= 0x08;
    }
    if (!xml.empty()) {
        flags |= 0x04;
    }
    vp8x.push_back(std::byte { flags });
    append_bytes(&vp8x, std::string_view("\0\0\0", 3));
    for (uint32_t v : { width - 1U, height - 1U }) {
        vp8x.push_back(std::byte { static_cast<uint8_t>(v & 0xFF) });
        vp8x.push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        vp8x.push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    }
    append_riff_chunk(&body, fourcc('V', 'P', '8', 'X'), vp8x);
    append_riff_chunk(&body, fourcc('V', 'P', '8', 'L'),
                      bytes_of(std::string_view("\x2F\x00\x00\x00\x00", 5)));
    if (!tiff.empty()) {
        append_riff_chunk(&body, fourcc('E', 'X', 'I', 'F'), tiff);
    }
    if (!xml.empty()) {
        append_riff_chunk(&body, fourcc('X', 'M', 'P', ' '), bytes_of(xml));
    }

    std::vector<std::byte> webp = bytes_of("RIFF");
    append_u32le(&webp, static_cast<uint32_t>(body.size()));
    webp.insert(webp.end(), body.begin(), body.end());
    return webp;
}

}  // namespace metasplice::test
