#include "metasplice/exif_tiff_encode.h"

#include "metasplice/datetime_format.h"

#include "byte_io_internal.h"
#include "text_encoding_internal.h"

#include <algorithm>
#include <cstring>

namespace metasplice {
namespace {

    static constexpr uint16_t kExifIfdPointerTag = 0x8769;

    /// A value ready to be stored: raw bytes already in TIFF byte order.
    struct PendingValue final {
        uint16_t tag   = 0;
        uint16_t type  = 0;
        uint32_t count = 0;
        std::vector<std::byte> bytes;
    };

    struct TiffWriter final {
        bool le                     = false;
        std::vector<std::byte>* out = nullptr;

        void put_u16(uint64_t off, uint16_t v) noexcept
        {
            std::byte* p = out->data() + off;
            if (le) {
                p[0] = std::byte { static_cast<uint8_t>(v & 0xFF) };
                p[1] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
            } else {
                p[0] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
                p[1] = std::byte { static_cast<uint8_t>(v & 0xFF) };
            }
        }

        void put_u32(uint64_t off, uint32_t v) noexcept
        {
            std::byte* p = out->data() + off;
            for (uint32_t i = 0; i < 4; ++i) {
                const uint32_t shift = le ? (8U * i) : (8U * (3U - i));
                p[i] = std::byte { static_cast<uint8_t>((v >> shift) & 0xFF) };
            }
        }

        void put_bytes(uint64_t off, std::span<const std::byte> src) noexcept
        {
            if (!src.empty()) {
                std::memcpy(out->data() + off, src.data(), src.size());
            }
        }

        void zero(uint64_t off, uint64_t n) noexcept
        {
            if (n != 0) {
                std::memset(out->data() + off, 0, static_cast<size_t>(n));
            }
        }

        uint64_t grow(uint64_t n)
        {
            const uint64_t at = out->size();
            out->resize(static_cast<size_t>(at + n));
            return at;
        }

        void align_even()
        {
            if ((out->size() & 1U) != 0U) {
                out->push_back(std::byte { 0 });
            }
        }
    };

    static bool contains_nul(std::string_view s) noexcept
    {
        return s.find('\0') != std::string_view::npos;
    }


    static void u32_bytes(bool le, uint32_t v, std::vector<std::byte>* out)
    {
        out->clear();
        for (uint32_t i = 0; i < 4; ++i) {
            const uint32_t shift = le ? (8U * i) : (8U * (3U - i));
            out->push_back(std::byte { static_cast<uint8_t>((v >> shift) & 0xFF) });
        }
    }


    static CodecStatus encode_field(const ExifFieldSpec& spec,
                                    std::string_view value, bool le,
                                    PendingValue* out) noexcept
    {
        if (contains_nul(value)) {
            return CodecStatus::InvalidFieldValue;
        }
        out->tag  = spec.tag;
        out->type = static_cast<uint16_t>(spec.type);
        out->bytes.clear();

        if (spec.type == TiffType::Undefined) {
            // UserComment: 8-byte charset prefix + payload, no terminator.
            if (text_internal::is_ascii(value)) {
                byte_io::append_text(&out->bytes,
                                     std::string_view("ASCII\0\0\0", 8));
                byte_io::append_text(&out->bytes, value);
            } else {
                std::vector<std::byte> utf16;
                if (!text_internal::utf8_to_utf16(value, le, &utf16)) {
                    return CodecStatus::InvalidFieldValue;
                }
                byte_io::append_text(&out->bytes,
                                     std::string_view("UNICODE\0", 8));
                byte_io::append_span(&out->bytes, utf16);
            }
        } else {
            std::string normalized;
            if (spec.tag == 0x0132) {
                const CodecStatus st = normalize_exif_datetime(value,
                                                               &normalized);
                if (st != CodecStatus::Ok) {
                    return st;
                }
                value = normalized;
            } else if (!text_internal::is_valid_utf8(value)) {
                return CodecStatus::InvalidFieldValue;
            }
            byte_io::append_text(&out->bytes, value);
            out->bytes.push_back(std::byte { 0 });
        }

        if (out->bytes.size() > 0xFFFFFFFFULL) {
            return CodecStatus::ResourceLimitExceeded;
        }
        out->count = static_cast<uint32_t>(out->bytes.size());
        return CodecStatus::Ok;
    }


    static const IfdDirectory* find_dir(const TiffStructure& tiff,
                                        IfdKind kind) noexcept
    {
        for (const IfdDirectory& dir : tiff.ifds) {
            if (dir.kind == kind) {
                return &dir;
            }
        }
        return nullptr;
    }


    static const IfdEntry* find_entry(const IfdDirectory& dir,
                                      uint16_t tag) noexcept
    {
        for (const IfdEntry& e : dir.entries) {
            if (e.tag == tag) {
                return &e;
            }
        }
        return nullptr;
    }


    static bool fits_in_place(const IfdDirectory& dir,
                              std::span<const PendingValue> updates) noexcept
    {
        for (const PendingValue& p : updates) {
            const IfdEntry* e = find_entry(dir, p.tag);
            if (!e || e->type != p.type) {
                return false;
            }
            const uint64_t n = p.bytes.size();
            if (n > 4 && (e->inline_value || e->value_size < n)) {
                return false;
            }
        }
        return true;
    }


    static void patch_in_place(TiffWriter* w, const IfdDirectory& dir,
                               std::span<const PendingValue> updates) noexcept
    {
        for (const PendingValue& p : updates) {
            const IfdEntry* e = find_entry(dir, p.tag);
            const uint64_t n  = p.bytes.size();
            w->put_u32(e->entry_offset + 4, p.count);
            if (n <= 4) {
                if (!e->inline_value) {
                    w->zero(e->value_offset, e->value_size);
                }
                w->zero(e->entry_offset + 8, 4);
                w->put_bytes(e->entry_offset + 8, p.bytes);
            } else {
                w->zero(e->value_offset, e->value_size);
                w->put_bytes(e->value_offset, p.bytes);
            }
        }
    }


    struct OutEntry final {
        uint16_t tag   = 0;
        uint16_t type  = 0;
        uint32_t count = 0;
        std::array<std::byte, 4> raw {};
        const PendingValue* pending = nullptr;
    };

    struct Extent final {
        uint64_t begin = 0;
        uint64_t end   = 0;
    };

    /**
     * True when the bytes from \p dir to \p stream_size hold nothing but
     * \p dir's table and its out-of-line values, as left behind by
     * \ref append_ifd, and no other IFD reaches into that range.
     */
    static bool owns_stream_tail(const TiffStructure& tiff,
                                 const IfdDirectory& dir,
                                 std::span<const std::byte> stream) noexcept
    {
        const uint64_t start = dir.offset;
        for (const IfdDirectory& other : tiff.ifds) {
            if (&other == &dir) {
                continue;
            }
            if (other.offset >= start) {
                return false;
            }
            for (const IfdEntry& e : other.entries) {
                if (!e.inline_value && e.value_offset + e.value_size > start) {
                    return false;
                }
            }
        }

        std::vector<Extent> extents;
        extents.push_back(
            Extent { start, start + 2 + 12ULL * dir.entries.size() + 4 });
        for (const IfdEntry& e : dir.entries) {
            if (e.inline_value || e.value_size == 0) {
                continue;
            }
            if (e.value_offset < start) {
                if (e.value_offset + e.value_size > start) {
                    return false;
                }
                continue;
            }
            extents.push_back(
                Extent { e.value_offset, e.value_offset + e.value_size });
        }
        std::sort(extents.begin(), extents.end(),
                  [](const Extent& a, const Extent& b) {
                      return a.begin < b.begin;
                  });

        // Only a single alignment byte may sit between two extents.
        uint64_t covered = start;
        for (const Extent& x : extents) {
            if (x.begin > covered + 1) {
                return false;
            }
            if (x.begin == covered + 1 && stream[covered] != std::byte { 0 }) {
                return false;
            }
            covered = std::max(covered, x.end);
        }
        return covered == stream.size();
    }


    /**
     * Serializes a merged copy of \p old_dir plus \p updates at the end.
     *
     * With \p reclaim_tail the stream is first cut back to \p old_dir, so a
     * directory this function appended earlier is replaced rather than
     * orphaned. Kept values stored in the reclaimed range are rewritten.
     */
    static CodecStatus append_ifd(TiffWriter* w, const IfdDirectory* old_dir,
                                  bool reclaim_tail,
                                  std::span<const PendingValue> updates,
                                  uint32_t* new_offset)
    {
        std::vector<OutEntry> entries;
        std::vector<PendingValue> moved;
        if (old_dir) {
            moved.reserve(old_dir->entries.size());
            for (const IfdEntry& e : old_dir->entries) {
                bool replaced = false;
                for (const PendingValue& p : updates) {
                    if (p.tag == e.tag) {
                        replaced = true;
                        break;
                    }
                }
                if (replaced) {
                    continue;
                }
                OutEntry oe;
                oe.tag   = e.tag;
                oe.type  = e.type;
                oe.count = e.count;
                oe.raw   = e.value_or_offset;
                if (reclaim_tail && !e.inline_value
                    && e.value_offset >= old_dir->offset) {
                    PendingValue copy;
                    copy.tag   = e.tag;
                    copy.type  = e.type;
                    copy.count = e.count;
                    const std::byte* src = w->out->data() + e.value_offset;
                    copy.bytes.assign(src,
                                      src + static_cast<size_t>(e.value_size));
                    moved.push_back(std::move(copy));
                    oe.pending = &moved.back();
                }
                entries.push_back(oe);
            }
            if (reclaim_tail) {
                w->out->resize(static_cast<size_t>(old_dir->offset));
            }
        }
        for (const PendingValue& p : updates) {
            OutEntry oe;
            oe.tag     = p.tag;
            oe.type    = p.type;
            oe.count   = p.count;
            oe.pending = &p;
            entries.push_back(oe);
        }
        std::stable_sort(entries.begin(), entries.end(),
                         [](const OutEntry& a, const OutEntry& b) {
                             return a.tag < b.tag;
                         });
        if (entries.size() > 0xFFFFU) {
            return CodecStatus::ResourceLimitExceeded;
        }

        w->align_even();
        const uint64_t ifd_off  = w->out->size();
        const uint64_t ifd_size = 2 + 12ULL * entries.size() + 4;
        (void)w->grow(ifd_size);

        w->put_u16(ifd_off, static_cast<uint16_t>(entries.size()));
        for (size_t i = 0; i < entries.size(); ++i) {
            const OutEntry& oe  = entries[i];
            const uint64_t eoff = ifd_off + 2 + 12ULL * i;
            w->put_u16(eoff + 0, oe.tag);
            w->put_u16(eoff + 2, oe.type);
            w->put_u32(eoff + 4, oe.count);
            if (!oe.pending) {
                w->put_bytes(eoff + 8, oe.raw);
                continue;
            }
            const std::vector<std::byte>& v = oe.pending->bytes;
            if (v.size() <= 4) {
                w->put_bytes(eoff + 8, v);
                continue;
            }
            w->align_even();
            const uint64_t voff = w->grow(v.size());
            if (voff > 0xFFFFFFFFULL) {
                return CodecStatus::ResourceLimitExceeded;
            }
            w->put_bytes(voff, v);
            w->put_u32(eoff + 8, static_cast<uint32_t>(voff));
        }
        w->put_u32(ifd_off + ifd_size - 4, old_dir ? old_dir->next : 0U);

        if (w->out->size() > 0xFFFFFFFFULL) {
            return CodecStatus::ResourceLimitExceeded;
        }
        *new_offset = static_cast<uint32_t>(ifd_off);
        return CodecStatus::Ok;
    }


    static void synthesize_header(bool le, std::vector<std::byte>* out)
    {
        out->clear();
        if (le) {
            byte_io::append_text(out, std::string_view("II*\0", 4));
        } else {
            byte_io::append_text(out, std::string_view("MM\0*", 4));
        }
        // IFD0 offset is filled in once IFD0 is written.
        byte_io::append_u32be(out, 0);
    }

}  // namespace

ExifEncodeResult
update_exif_tiff(std::span<const std::byte> tiff_bytes,
                 std::span<const MetaField> updates,
                 const ExifEncodeOptions& options,
                 std::vector<std::byte>* out) noexcept
{
    ExifEncodeResult result;
    if (!out) {
        result.status = CodecStatus::UnsupportedOperation;
        return result;
    }
    out->clear();

    if (tiff_bytes.empty()) {
        synthesize_header(options.synthesize_little_endian, out);
    } else {
        out->assign(tiff_bytes.begin(), tiff_bytes.end());
    }

    TiffStructure tiff;
    result.status = parse_tiff_structure(
        std::span<const std::byte>(out->data(), out->size()), options.limits,
        &tiff);
    if (result.status != CodecStatus::Ok) {
        out->clear();
        return result;
    }

    std::vector<PendingValue> ifd0_updates;
    std::vector<PendingValue> exif_updates;
    for (const MetaField& f : updates) {
        const ExifFieldSpec* spec = find_exif_field(f.key);
        if (!spec) {
            result.status     = CodecStatus::UnsupportedOperation;
            result.failed_key = f.key;
            out->clear();
            return result;
        }
        PendingValue p;
        const CodecStatus st = encode_field(*spec, f.value, tiff.little_endian,
                                            &p);
        if (st != CodecStatus::Ok) {
            result.status     = st;
            result.failed_key = f.key;
            out->clear();
            return result;
        }
        std::vector<PendingValue>& group = (spec->ifd == IfdKind::Exif)
                                               ? exif_updates
                                               : ifd0_updates;
        bool merged = false;
        for (PendingValue& existing : group) {
            if (existing.tag == p.tag) {
                existing = std::move(p);
                merged   = true;
                break;
            }
        }
        if (!merged) {
            group.push_back(std::move(p));
        }
    }

    TiffWriter w;
    w.le  = tiff.little_endian;
    w.out = out;

    const IfdDirectory* ifd0 = find_dir(tiff, IfdKind::Ifd0);
    const IfdDirectory* exif = find_dir(tiff, IfdKind::Exif);
    bool all_in_place        = true;

    if (!exif_updates.empty()) {
        if (exif && fits_in_place(*exif, exif_updates)) {
            patch_in_place(&w, *exif, exif_updates);
        } else {
            all_in_place      = false;
            uint32_t exif_off = 0;
            const bool reclaim = exif && owns_stream_tail(tiff, *exif, *out);
            result.status = append_ifd(&w, exif, reclaim, exif_updates,
                                       &exif_off);
            if (result.status != CodecStatus::Ok) {
                out->clear();
                return result;
            }
            PendingValue ptr;
            ptr.tag   = kExifIfdPointerTag;
            ptr.type  = static_cast<uint16_t>(TiffType::Long);
            ptr.count = 1;
            u32_bytes(tiff.little_endian, exif_off, &ptr.bytes);
            ifd0_updates.push_back(std::move(ptr));
        }
    }

    if (!ifd0_updates.empty()) {
        const IfdEntry* ptr = ifd0 ? find_entry(*ifd0, kExifIfdPointerTag)
                                   : nullptr;
        if (ptr && ptr->type == static_cast<uint16_t>(TiffType::Ifd)) {
            // Keep the pointer's original type so it can be patched in place.
            for (PendingValue& p : ifd0_updates) {
                if (p.tag == kExifIfdPointerTag) {
                    p.type = ptr->type;
                }
            }
        }
        if (ifd0 && fits_in_place(*ifd0, ifd0_updates)) {
            patch_in_place(&w, *ifd0, ifd0_updates);
        } else {
            all_in_place      = false;
            uint32_t ifd0_off = 0;
            const bool reclaim = ifd0 && owns_stream_tail(tiff, *ifd0, *out);
            result.status = append_ifd(&w, ifd0, reclaim, ifd0_updates,
                                       &ifd0_off);
            if (result.status != CodecStatus::Ok) {
                out->clear();
                return result;
            }
            w.put_u32(4, ifd0_off);
        }
    }

    result.patched_in_place = all_in_place;
    return result;
}

}  // namespace metasplice
