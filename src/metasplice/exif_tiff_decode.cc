#include "metasplice/exif_tiff_decode.h"

#include "metasplice/exif_tag_names.h"

#include "byte_io_internal.h"
#include "text_encoding_internal.h"

#include <cstdio>
#include <cstring>

namespace metasplice {
namespace {

    using byte_io::u8;

    static constexpr ExifFieldSpec kExifFields[] = {
        { "description", IfdKind::Ifd0, 0x010E, TiffType::Ascii },
        { "artist", IfdKind::Ifd0, 0x013B, TiffType::Ascii },
        { "copyright", IfdKind::Ifd0, 0x8298, TiffType::Ascii },
        { "software", IfdKind::Ifd0, 0x0131, TiffType::Ascii },
        { "datetime", IfdKind::Ifd0, 0x0132, TiffType::Ascii },
        { "user_comment", IfdKind::Exif, 0x9286, TiffType::Undefined },
    };

    struct TiffConfig final {
        bool le = true;
    };

    static bool read_tiff_u16(const TiffConfig& cfg,
                              std::span<const std::byte> bytes, uint64_t offset,
                              uint16_t* out) noexcept
    {
        if (cfg.le) {
            return byte_io::read_u16le(bytes, offset, out);
        }
        return byte_io::read_u16be(bytes, offset, out);
    }

    static bool read_tiff_u32(const TiffConfig& cfg,
                              std::span<const std::byte> bytes, uint64_t offset,
                              uint32_t* out) noexcept
    {
        if (cfg.le) {
            return byte_io::read_u32le(bytes, offset, out);
        }
        return byte_io::read_u32be(bytes, offset, out);
    }

    struct IfdTask final {
        IfdKind kind    = IfdKind::Ifd0;
        uint64_t offset = 0;
    };

    static bool is_pointer_tag(IfdKind kind, uint16_t tag) noexcept
    {
        if (kind == IfdKind::Ifd0 || kind == IfdKind::Ifd1) {
            return tag == 0x8769 || tag == 0x8825;
        }
        if (kind == IfdKind::Exif) {
            return tag == 0xA005;
        }
        return false;
    }


    static bool pointer_target(IfdKind kind, uint16_t tag,
                               IfdKind* out) noexcept
    {
        if (kind != IfdKind::Ifd0 && kind != IfdKind::Exif) {
            return false;
        }
        switch (tag) {
        case 0x8769: *out = IfdKind::Exif; return kind == IfdKind::Ifd0;
        case 0x8825: *out = IfdKind::Gps; return kind == IfdKind::Ifd0;
        case 0xA005: *out = IfdKind::Interop; return kind == IfdKind::Exif;
        default: break;
        }
        return false;
    }


    static bool is_text_type(uint16_t type) noexcept
    {
        return type == static_cast<uint16_t>(TiffType::Ascii)
               || type == static_cast<uint16_t>(TiffType::Byte)
               || type == static_cast<uint16_t>(TiffType::Undefined);
    }


    static std::span<const std::byte> entry_bytes(
        std::span<const std::byte> tiff, const IfdEntry& e) noexcept
    {
        return tiff.subspan(static_cast<size_t>(e.value_offset),
                            static_cast<size_t>(e.value_size));
    }


    static void decode_ascii_value(std::span<const std::byte> raw,
                                   std::string* out) noexcept
    {
        size_t n = 0;
        while (n < raw.size() && u8(raw[n]) != 0) {
            n += 1;
        }
        text_internal::bytes_to_utf8_lossless(raw.first(n), out);
    }


    static bool is_printable_ascii(std::span<const std::byte> raw) noexcept
    {
        const std::string_view s = text_internal::trim_trailing_nul_space(
            byte_io::as_chars(raw));
        if (s.empty()) {
            return false;
        }
        for (char c : s) {
            const unsigned char uc = static_cast<unsigned char>(c);
            if (uc < 0x20U || uc >= 0x7FU) {
                return false;
            }
        }
        return true;
    }


    static void append_sep(std::string* out) noexcept
    {
        if (!out->empty()) {
            out->push_back(' ');
        }
    }


    static bool format_numeric_value(const TiffConfig& cfg,
                                     std::span<const std::byte> tiff,
                                     const IfdEntry& e,
                                     std::string* out) noexcept
    {
        out->clear();
        char buf[64];
        const uint32_t elem = tiff_type_size(e.type);
        for (uint32_t i = 0; i < e.count; ++i) {
            const uint64_t off = e.value_offset + static_cast<uint64_t>(i) * elem;
            uint16_t v16       = 0;
            uint32_t v32       = 0;
            uint32_t d32       = 0;
            buf[0]             = '\0';
            switch (static_cast<TiffType>(e.type)) {
            case TiffType::Byte:
                std::snprintf(buf, sizeof(buf), "%u",
                              static_cast<unsigned>(u8(tiff[off])));
                break;
            case TiffType::SByte:
                std::snprintf(buf, sizeof(buf), "%d",
                              static_cast<int>(static_cast<int8_t>(u8(tiff[off]))));
                break;
            case TiffType::Short:
                (void)read_tiff_u16(cfg, tiff, off, &v16);
                std::snprintf(buf, sizeof(buf), "%u", static_cast<unsigned>(v16));
                break;
            case TiffType::SShort:
                (void)read_tiff_u16(cfg, tiff, off, &v16);
                std::snprintf(buf, sizeof(buf), "%d",
                              static_cast<int>(static_cast<int16_t>(v16)));
                break;
            case TiffType::Long:
            case TiffType::Ifd:
                (void)read_tiff_u32(cfg, tiff, off, &v32);
                std::snprintf(buf, sizeof(buf), "%lu",
                              static_cast<unsigned long>(v32));
                break;
            case TiffType::SLong:
                (void)read_tiff_u32(cfg, tiff, off, &v32);
                std::snprintf(buf, sizeof(buf), "%ld",
                              static_cast<long>(static_cast<int32_t>(v32)));
                break;
            case TiffType::Rational:
                (void)read_tiff_u32(cfg, tiff, off, &v32);
                (void)read_tiff_u32(cfg, tiff, off + 4, &d32);
                std::snprintf(buf, sizeof(buf), "%lu/%lu",
                              static_cast<unsigned long>(v32),
                              static_cast<unsigned long>(d32));
                break;
            case TiffType::SRational:
                (void)read_tiff_u32(cfg, tiff, off, &v32);
                (void)read_tiff_u32(cfg, tiff, off + 4, &d32);
                std::snprintf(buf, sizeof(buf), "%ld/%ld",
                              static_cast<long>(static_cast<int32_t>(v32)),
                              static_cast<long>(static_cast<int32_t>(d32)));
                break;
            case TiffType::Float: {
                (void)read_tiff_u32(cfg, tiff, off, &v32);
                float f = 0.0f;
                std::memcpy(&f, &v32, sizeof(f));
                std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(f));
                break;
            }
            case TiffType::Double: {
                uint32_t lo = 0;
                uint32_t hi = 0;
                (void)read_tiff_u32(cfg, tiff, off, cfg.le ? &lo : &hi);
                (void)read_tiff_u32(cfg, tiff, off + 4, cfg.le ? &hi : &lo);
                const uint64_t bits = (static_cast<uint64_t>(hi) << 32) | lo;
                double d            = 0.0;
                std::memcpy(&d, &bits, sizeof(d));
                std::snprintf(buf, sizeof(buf), "%g", d);
                break;
            }
            default: return false;
            }
            append_sep(out);
            out->append(buf);
        }
        return !out->empty();
    }


    static TypeHint numeric_hint(uint16_t type) noexcept
    {
        if (type == static_cast<uint16_t>(TiffType::Rational)
            || type == static_cast<uint16_t>(TiffType::SRational)) {
            return TypeHint::Rational;
        }
        return TypeHint::None;
    }


    static CodecStatus decode_recognized(const TiffConfig& cfg,
                                         std::span<const std::byte> tiff,
                                         const ExifFieldSpec& spec,
                                         const IfdEntry& e,
                                         FieldMap* out) noexcept
    {
        if (!is_text_type(e.type)) {
            return CodecStatus::UnsupportedTagType;
        }
        std::string value;
        TypeHint hint = TypeHint::Ascii;
        if (spec.tag == 0x9286) {
            decode_user_comment(entry_bytes(tiff, e), cfg.le, &value);
            hint = TypeHint::Undefined;
        } else {
            decode_ascii_value(entry_bytes(tiff, e), &value);
            if (spec.tag == 0x0132) {
                hint = TypeHint::DateTime;
            }
        }
        (void)out->insert_if_absent(spec.key, value, hint);
        return CodecStatus::Ok;
    }


    static void decode_other(const TiffConfig& cfg,
                             std::span<const std::byte> tiff, IfdKind kind,
                             const IfdEntry& e,
                             const ExifDecodeOptions& options,
                             FieldMap* out) noexcept
    {
        if (e.value_size == 0 || is_pointer_tag(kind, e.tag)) {
            return;
        }

        std::string_view name = exif_tag_name(kind, e.tag);
        char name_buf[16];
        if (name.empty()) {
            if (!options.include_unnamed_tags) {
                return;
            }
            std::snprintf(name_buf, sizeof(name_buf), "Tag0x%04X",
                          static_cast<unsigned>(e.tag));
            name = name_buf;
        }

        std::string value;
        const std::span<const std::byte> raw = entry_bytes(tiff, e);

        // Windows XP* tags carry UTF-16LE text in BYTE arrays.
        if (kind == IfdKind::Ifd0 && e.tag >= 0x9C9B && e.tag <= 0x9C9F) {
            text_internal::utf16_to_utf8(raw, true, &value);
            const std::string_view trimmed = text_internal::trim_trailing_nul(
                value);
            value.resize(trimmed.size());
            (void)out->insert_if_absent(name, value, TypeHint::Utf16);
            return;
        }

        switch (static_cast<TiffType>(e.type)) {
        case TiffType::Ascii:
            decode_ascii_value(raw, &value);
            (void)out->insert_if_absent(name, value, TypeHint::Ascii);
            return;
        case TiffType::Undefined:
            if (raw.size() > 256 || !is_printable_ascii(raw)) {
                return;
            }
            decode_ascii_value(raw, &value);
            (void)out->insert_if_absent(name, value, TypeHint::Undefined);
            return;
        default: break;
        }

        if (e.count > options.max_array_elements) {
            return;
        }
        if (format_numeric_value(cfg, tiff, e, &value)) {
            (void)out->insert_if_absent(name, value, numeric_hint(e.type));
        }
    }

}  // namespace

uint32_t
tiff_type_size(uint16_t type) noexcept
{
    switch (type) {
    case 1:    // BYTE
    case 2:    // ASCII
    case 6:    // SBYTE
    case 7:    // UNDEFINED
    case 129:  // UTF-8 (EXIF 3.0)
        return 1;
    case 3:  // SHORT
    case 8:  // SSHORT
        return 2;
    case 4:   // LONG
    case 9:   // SLONG
    case 11:  // FLOAT
    case 13:  // IFD
        return 4;
    case 5:   // RATIONAL
    case 10:  // SRATIONAL
    case 12:  // DOUBLE
        return 8;
    default: return 0;
    }
}


std::string_view
ifd_kind_name(IfdKind kind) noexcept
{
    switch (kind) {
    case IfdKind::Ifd0: return "ifd0";
    case IfdKind::Ifd1: return "ifd1";
    case IfdKind::Exif: return "exififd";
    case IfdKind::Gps: return "gpsifd";
    case IfdKind::Interop: return "interopifd";
    }
    return "ifd";
}


std::span<const ExifFieldSpec>
exif_field_specs() noexcept
{
    return std::span<const ExifFieldSpec>(kExifFields);
}


const ExifFieldSpec*
find_exif_field(std::string_view key) noexcept
{
    for (const ExifFieldSpec& f : kExifFields) {
        if (f.key == key) {
            return &f;
        }
    }
    return nullptr;
}


const ExifFieldSpec*
find_exif_field(IfdKind kind, uint16_t tag) noexcept
{
    for (const ExifFieldSpec& f : kExifFields) {
        if (f.ifd == kind && f.tag == tag) {
            return &f;
        }
    }
    return nullptr;
}


CodecStatus
parse_tiff_structure(std::span<const std::byte> tiff_bytes,
                     const ExifLimits& limits, TiffStructure* out) noexcept
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }
    *out = TiffStructure {};

    if (tiff_bytes.size() < 8) {
        return CodecStatus::MalformedContainer;
    }

    TiffConfig cfg;
    const uint8_t b0 = u8(tiff_bytes[0]);
    const uint8_t b1 = u8(tiff_bytes[1]);
    if (b0 == 0x49 && b1 == 0x49) {
        cfg.le = true;
    } else if (b0 == 0x4D && b1 == 0x4D) {
        cfg.le = false;
    } else {
        return CodecStatus::MalformedContainer;
    }
    out->little_endian = cfg.le;

    uint16_t version = 0;
    uint32_t ifd0    = 0;
    if (!read_tiff_u16(cfg, tiff_bytes, 2, &version)
        || !read_tiff_u32(cfg, tiff_bytes, 4, &ifd0)) {
        return CodecStatus::MalformedContainer;
    }
    if (version == 43) {
        return CodecStatus::UnsupportedOperation;
    }
    if (version != 42) {
        return CodecStatus::MalformedContainer;
    }
    out->ifd0_offset = ifd0;

    std::vector<IfdTask> tasks;
    std::vector<uint64_t> visited;
    if (ifd0 != 0) {
        tasks.push_back(IfdTask { IfdKind::Ifd0, ifd0 });
    }

    uint64_t total_entries = 0;
    for (size_t ti = 0; ti < tasks.size(); ++ti) {
        const IfdTask task = tasks[ti];

        if (!byte_io::in_range(tiff_bytes, task.offset, 2)) {
            return CodecStatus::OffsetOutOfBounds;
        }
        bool seen = false;
        for (uint64_t v : visited) {
            if (v == task.offset) {
                seen = true;
                break;
            }
        }
        if (seen) {
            continue;
        }
        visited.push_back(task.offset);

        if (out->ifds.size() >= limits.max_ifds) {
            return CodecStatus::ResourceLimitExceeded;
        }

        uint16_t count = 0;
        (void)read_tiff_u16(cfg, tiff_bytes, task.offset, &count);
        const uint64_t entries_off = task.offset + 2;
        const uint64_t table_size  = 12ULL * count;
        if (!byte_io::in_range(tiff_bytes, entries_off, table_size)) {
            return CodecStatus::TruncatedIfd;
        }
        if (count > limits.max_entries_per_ifd) {
            return CodecStatus::ResourceLimitExceeded;
        }
        total_entries += count;
        if (total_entries > limits.max_total_entries) {
            return CodecStatus::ResourceLimitExceeded;
        }

        IfdDirectory dir;
        dir.kind   = task.kind;
        dir.offset = task.offset;
        dir.entries.reserve(count);

        for (uint32_t i = 0; i < count; ++i) {
            const uint64_t eoff = entries_off + 12ULL * i;
            IfdEntry e;
            e.entry_offset = eoff;
            (void)read_tiff_u16(cfg, tiff_bytes, eoff + 0, &e.tag);
            (void)read_tiff_u16(cfg, tiff_bytes, eoff + 2, &e.type);
            (void)read_tiff_u32(cfg, tiff_bytes, eoff + 4, &e.count);
            for (size_t k = 0; k < 4; ++k) {
                e.value_or_offset[k] = tiff_bytes[eoff + 8 + k];
            }

            const uint32_t elem = tiff_type_size(e.type);
            e.value_size        = static_cast<uint64_t>(e.count) * elem;
            e.value_offset      = eoff + 8;
            e.inline_value      = (e.value_size <= 4);
            if (!e.inline_value) {
                uint32_t voff = 0;
                (void)read_tiff_u32(cfg, tiff_bytes, eoff + 8, &voff);
                if (!byte_io::in_range(tiff_bytes, voff, e.value_size)) {
                    return CodecStatus::OffsetOutOfBounds;
                }
                if (e.value_size > limits.max_value_bytes) {
                    return CodecStatus::ResourceLimitExceeded;
                }
                e.value_offset = voff;
            }

            IfdKind child = IfdKind::Ifd0;
            if (pointer_target(task.kind, e.tag, &child) && e.count == 1
                && (e.type == static_cast<uint16_t>(TiffType::Long)
                    || e.type == static_cast<uint16_t>(TiffType::Ifd))) {
                uint32_t child_off = 0;
                (void)read_tiff_u32(cfg, tiff_bytes, eoff + 8, &child_off);
                if (child_off != 0) {
                    tasks.push_back(IfdTask { child, child_off });
                }
            }
            dir.entries.push_back(e);
        }

        uint32_t next = 0;
        if (read_tiff_u32(cfg, tiff_bytes, entries_off + table_size, &next)) {
            dir.next = next;
        }
        if (next != 0
            && (task.kind == IfdKind::Ifd0 || task.kind == IfdKind::Ifd1)) {
            tasks.push_back(IfdTask { IfdKind::Ifd1, next });
        }
        out->ifds.push_back(std::move(dir));
    }
    return CodecStatus::Ok;
}


const IfdEntry*
find_ifd_entry(const TiffStructure& tiff, IfdKind kind, uint16_t tag) noexcept
{
    for (const IfdDirectory& dir : tiff.ifds) {
        if (dir.kind != kind) {
            continue;
        }
        for (const IfdEntry& e : dir.entries) {
            if (e.tag == tag) {
                return &e;
            }
        }
        return nullptr;
    }
    return nullptr;
}


void
decode_user_comment(std::span<const std::byte> value, bool tiff_little_endian,
                    std::string* out) noexcept
{
    if (!out) {
        return;
    }
    out->clear();

    std::span<const std::byte> body = value;
    bool utf16                      = false;
    // Only comments without a declared charset are space padded.
    bool trim_spaces = true;
    if (value.size() >= 8) {
        if (byte_io::match(value, 0, std::string_view("ASCII\0\0\0", 8))
            || byte_io::match(value, 0, std::string_view("JIS\0\0\0\0\0", 8))) {
            body        = value.subspan(8);
            trim_spaces = false;
        } else if (byte_io::match(value, 0,
                                  std::string_view("\0\0\0\0\0\0\0\0", 8))) {
            body = value.subspan(8);
        } else if (byte_io::match(value, 0,
                                  std::string_view("UNICODE\0", 8))) {
            body        = value.subspan(8);
            utf16       = true;
            trim_spaces = false;
        }
    }

    if (utf16) {
        bool le = tiff_little_endian;
        if (body.size() >= 2) {
            const uint8_t c0 = u8(body[0]);
            const uint8_t c1 = u8(body[1]);
            if (c0 == 0xFE && c1 == 0xFF) {
                le   = false;
                body = body.subspan(2);
            } else if (c0 == 0xFF && c1 == 0xFE) {
                le   = true;
                body = body.subspan(2);
            }
        }
        text_internal::utf16_to_utf8(body, le, out);
    } else {
        text_internal::bytes_to_utf8_lossless(body, out);
    }

    const std::string_view trimmed
        = trim_spaces ? text_internal::trim_trailing_nul_space(*out)
                      : text_internal::trim_trailing_nul(*out);
    out->resize(trimmed.size());
}


CodecStatus
decode_exif_tiff(std::span<const std::byte> tiff_bytes,
                 const ExifDecodeOptions& options, FieldMap* out) noexcept
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }

    TiffStructure tiff;
    const CodecStatus status = parse_tiff_structure(tiff_bytes, options.limits,
                                                    &tiff);
    if (status != CodecStatus::Ok) {
        return status;
    }

    TiffConfig cfg;
    cfg.le = tiff.little_endian;
    for (const IfdDirectory& dir : tiff.ifds) {
        if (dir.kind == IfdKind::Ifd1 || dir.kind == IfdKind::Interop) {
            continue;
        }
        for (const IfdEntry& e : dir.entries) {
            const ExifFieldSpec* spec = find_exif_field(dir.kind, e.tag);
            if (spec) {
                const CodecStatus st = decode_recognized(cfg, tiff_bytes, *spec,
                                                         e, out);
                if (st != CodecStatus::Ok) {
                    return st;
                }
                continue;
            }
            decode_other(cfg, tiff_bytes, dir.kind, e, options, out);
        }
    }
    return CodecStatus::Ok;
}

}  // namespace metasplice
