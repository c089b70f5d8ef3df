#include "metasplice/png_chunk.h"

#include "metasplice/container_payload.h"

#include "byte_io_internal.h"
#include "text_encoding_internal.h"

#include <utility>

namespace metasplice {
namespace {

    using byte_io::u8;

    static constexpr uint32_t kTextType  = fourcc('t', 'E', 'X', 't');
    static constexpr uint32_t kZtxtType  = fourcc('z', 'T', 'X', 't');
    static constexpr uint32_t kItxtType  = fourcc('i', 'T', 'X', 't');
    static constexpr uint32_t kMaxKeyLen = 79;

    /// Splits `field\0rest`; fails when no NUL is present.
    static bool split_nul(std::span<const std::byte> data,
                          std::span<const std::byte>* field,
                          std::span<const std::byte>* rest) noexcept
    {
        for (size_t i = 0; i < data.size(); ++i) {
            if (u8(data[i]) == 0) {
                *field = data.first(i);
                *rest  = data.subspan(i + 1);
                return true;
            }
        }
        return false;
    }


    static CodecStatus inflate_text(std::span<const std::byte> compressed,
                                    const PngLimits& limits,
                                    std::vector<std::byte>* out) noexcept
    {
        PayloadLimits payload;
        payload.max_output_bytes = limits.max_inflate_bytes;
        return inflate_zlib(compressed, payload, out);
    }


    static bool keyword_of(std::span<const std::byte> data,
                           std::string* out) noexcept
    {
        std::span<const std::byte> key;
        std::span<const std::byte> rest;
        if (!split_nul(data, &key, &rest)) {
            return false;
        }
        text_internal::latin1_to_utf8(key, out);
        return true;
    }


    static bool is_text_block(const ContainerBlockRef& b) noexcept
    {
        return b.kind == ContainerBlockKind::Text
               && (b.id == kTextType || b.id == kZtxtType
                   || b.id == kItxtType);
    }


    static CodecStatus rebuild_text_chunk(std::span<const std::byte> bytes,
                                          const ContainerBlockRef& block,
                                          std::string_view keyword,
                                          std::string_view value,
                                          std::vector<std::byte>* out) noexcept
    {
        std::string latin1;
        const bool fits_latin1 = text_internal::utf8_to_latin1(value, &latin1);

        PngTextChunk chunk;
        chunk.keyword = std::string(keyword);
        chunk.text    = std::string(value);

        if (block.id == kTextType) {
            chunk.type = fits_latin1 ? kTextType : kItxtType;
        } else if (block.id == kZtxtType) {
            chunk.type       = fits_latin1 ? kZtxtType : kItxtType;
            chunk.compressed = true;
        } else {
            // Keep the iTXt header fields (compression, language tags).
            PngTextOptions header_only;
            header_only.decompress = false;
            PngTextChunk old;
            const CodecStatus st   = decode_png_text_chunk(
                block.id, block_data(bytes, block), header_only, &old);
            if (st != CodecStatus::Ok) {
                return st;
            }
            chunk.type               = kItxtType;
            chunk.compressed         = old.compressed;
            chunk.language           = old.language;
            chunk.translated_keyword = old.translated_keyword;
        }

        std::vector<std::byte> data;
        const CodecStatus st = encode_png_text_chunk(chunk, &data);
        if (st != CodecStatus::Ok) {
            return st;
        }
        build_png_chunk(chunk.type, data, out);
        return CodecStatus::Ok;
    }


    static CodecStatus new_text_chunk(std::string_view keyword,
                                      std::string_view value,
                                      std::vector<std::byte>* out) noexcept
    {
        std::string latin1;
        PngTextChunk chunk;
        chunk.type    = text_internal::utf8_to_latin1(value, &latin1)
                            ? kTextType
                            : kItxtType;
        chunk.keyword = std::string(keyword);
        chunk.text    = std::string(value);

        std::vector<std::byte> data;
        const CodecStatus st = encode_png_text_chunk(chunk, &data);
        if (st != CodecStatus::Ok) {
            return st;
        }
        build_png_chunk(chunk.type, data, out);
        return CodecStatus::Ok;
    }


    static uint32_t find_index(const ImageContainer& c,
                               ContainerBlockKind kind) noexcept
    {
        const int64_t i = find_block(c, kind);
        return i < 0 ? static_cast<uint32_t>(c.blocks.size())
                     : static_cast<uint32_t>(i);
    }

}  // namespace

PngChunkView
png_chunk_at(std::span<const std::byte> bytes,
             const ContainerBlockRef& block) noexcept
{
    PngChunkView view;
    view.type = block.id;
    view.data = block_data(bytes, block);
    (void)byte_io::read_u32be(bytes, block.data_offset + block.data_size,
                              &view.crc);
    return view;
}


CodecStatus
validate_png_chunks(std::span<const std::byte> bytes,
                    const ImageContainer& container,
                    const PngLimits& limits) noexcept
{
    if (container.format != ContainerFormat::Png) {
        return CodecStatus::UnsupportedOperation;
    }
    for (const ContainerBlockRef& b : container.blocks) {
        if (b.kind == ContainerBlockKind::Signature
            || b.kind == ContainerBlockKind::Trailer) {
            continue;
        }
        if (limits.max_chunk_bytes != 0U && b.data_size > limits.max_chunk_bytes) {
            return CodecStatus::ChunkTooLarge;
        }
        const PngChunkView chunk = png_chunk_at(bytes, b);
        const std::span<const std::byte> type_bytes
            = bytes.subspan(static_cast<size_t>(b.outer_offset + 4), 4);
        if (crc32_of(type_bytes, chunk.data) != chunk.crc) {
            return CodecStatus::ChunkCrcMismatch;
        }
    }
    return CodecStatus::Ok;
}


CodecStatus
decode_png_text_chunk(uint32_t type, std::span<const std::byte> data,
                      const PngTextOptions& options, PngTextChunk* out) noexcept
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }
    *out      = PngTextChunk {};
    out->type = type;

    std::span<const std::byte> key;
    std::span<const std::byte> rest;
    if (!split_nul(data, &key, &rest) || key.empty()
        || key.size() > kMaxKeyLen) {
        return CodecStatus::MalformedContainer;
    }
    text_internal::latin1_to_utf8(key, &out->keyword);

    if (type == kTextType) {
        text_internal::latin1_to_utf8(rest, &out->text);
        return CodecStatus::Ok;
    }

    std::vector<std::byte> inflated;
    if (type == kZtxtType) {
        if (rest.empty() || u8(rest[0]) != 0) {
            return CodecStatus::MalformedContainer;
        }
        out->compressed = true;
        if (!options.decompress) {
            return CodecStatus::Ok;
        }
        const CodecStatus st = inflate_text(rest.subspan(1), options.limits,
                                            &inflated);
        if (st != CodecStatus::Ok) {
            return st;
        }
        text_internal::latin1_to_utf8(inflated, &out->text);
        return CodecStatus::Ok;
    }

    if (type != kItxtType) {
        return CodecStatus::UnsupportedOperation;
    }

    // compression flag(1) + method(1) + language\0 + translated keyword\0.
    if (rest.size() < 2) {
        return CodecStatus::MalformedContainer;
    }
    const uint8_t flag   = u8(rest[0]);
    const uint8_t method = u8(rest[1]);
    if (flag > 1 || (flag == 1 && method != 0)) {
        return CodecStatus::MalformedContainer;
    }
    out->compressed = (flag == 1);

    std::span<const std::byte> lang;
    std::span<const std::byte> translated;
    std::span<const std::byte> after_lang;
    std::span<const std::byte> text;
    if (!split_nul(rest.subspan(2), &lang, &after_lang)
        || !split_nul(after_lang, &translated, &text)) {
        return CodecStatus::MalformedContainer;
    }
    text_internal::bytes_to_utf8_lossless(lang, &out->language);
    text_internal::bytes_to_utf8_lossless(translated, &out->translated_keyword);

    if (out->compressed) {
        if (!options.decompress) {
            return CodecStatus::Ok;
        }
        const CodecStatus st = inflate_text(text, options.limits, &inflated);
        if (st != CodecStatus::Ok) {
            return st;
        }
        text = inflated;
    }
    text_internal::bytes_to_utf8_lossless(text, &out->text);
    return CodecStatus::Ok;
}


CodecStatus
decode_png_text(std::span<const std::byte> bytes,
                const ImageContainer& container, const PngTextOptions& options,
                FieldMap* out) noexcept
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }
    for (const ContainerBlockRef& b : container.blocks) {
        if (!is_text_block(b)) {
            continue;
        }
        PngTextChunk chunk;
        const CodecStatus st = decode_png_text_chunk(
            b.id, block_data(bytes, b), options, &chunk);
        if (st != CodecStatus::Ok) {
            return st;
        }
        if (chunk.keyword == kPngXmpKeyword) {
            continue;
        }
        TypeHint hint = TypeHint::Latin1;
        if (b.id == kItxtType) {
            hint = TypeHint::Utf8;
        }
        (void)out->insert_if_absent(chunk.keyword, chunk.text, hint);
    }
    return CodecStatus::Ok;
}


CodecStatus
validate_png_keyword(std::string_view keyword_utf8) noexcept
{
    std::string latin1;
    if (!text_internal::utf8_to_latin1(keyword_utf8, &latin1)) {
        return CodecStatus::InvalidFieldValue;
    }
    if (latin1.empty() || latin1.size() > kMaxKeyLen) {
        return CodecStatus::InvalidFieldValue;
    }
    if (latin1.front() == ' ' || latin1.back() == ' ') {
        return CodecStatus::InvalidFieldValue;
    }
    for (size_t i = 0; i < latin1.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(latin1[i]);
        if (c < 0x20U || (c >= 0x7FU && c <= 0xA0U)) {
            return CodecStatus::InvalidFieldValue;
        }
        if (c == ' ' && i > 0 && latin1[i - 1] == ' ') {
            return CodecStatus::InvalidFieldValue;
        }
    }
    return CodecStatus::Ok;
}


CodecStatus
encode_png_text_chunk(const PngTextChunk& chunk,
                      std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }
    out->clear();

    std::string key_latin1;
    if (!text_internal::utf8_to_latin1(chunk.keyword, &key_latin1)) {
        return CodecStatus::InvalidFieldValue;
    }
    byte_io::append_text(out, key_latin1);
    out->push_back(std::byte { 0 });

    if (chunk.type == kTextType || chunk.type == kZtxtType) {
        std::string text_latin1;
        if (!text_internal::utf8_to_latin1(chunk.text, &text_latin1)) {
            return CodecStatus::InvalidFieldValue;
        }
        if (chunk.type == kTextType) {
            byte_io::append_text(out, text_latin1);
            return CodecStatus::Ok;
        }
        std::vector<std::byte> deflated;
        const CodecStatus st = deflate_zlib(byte_io::as_bytes(text_latin1),
                                            &deflated);
        if (st != CodecStatus::Ok) {
            return st;
        }
        out->push_back(std::byte { 0 });
        byte_io::append_span(out, deflated);
        return CodecStatus::Ok;
    }

    if (chunk.type != kItxtType) {
        return CodecStatus::UnsupportedOperation;
    }
    out->push_back(std::byte { static_cast<uint8_t>(chunk.compressed ? 1 : 0) });
    out->push_back(std::byte { 0 });
    byte_io::append_text(out, chunk.language);
    out->push_back(std::byte { 0 });
    byte_io::append_text(out, chunk.translated_keyword);
    out->push_back(std::byte { 0 });
    if (!chunk.compressed) {
        byte_io::append_text(out, chunk.text);
        return CodecStatus::Ok;
    }
    std::vector<std::byte> deflated;
    const CodecStatus st = deflate_zlib(byte_io::as_bytes(chunk.text),
                                        &deflated);
    if (st != CodecStatus::Ok) {
        return st;
    }
    byte_io::append_span(out, deflated);
    return CodecStatus::Ok;
}


void
build_png_chunk(uint32_t type, std::span<const std::byte> data,
                std::vector<std::byte>* out)
{
    out->clear();
    out->reserve(data.size() + 12);
    byte_io::append_u32be(out, static_cast<uint32_t>(data.size()));
    byte_io::append_u32be(out, type);
    byte_io::append_span(out, data);
    const std::span<const std::byte> type_bytes(out->data() + 4, 4);
    byte_io::append_u32be(out, crc32_of(type_bytes, data));
}


CodecStatus
plan_png_text_update(std::span<const std::byte> bytes,
                     const ImageContainer& container,
                     std::span<const MetaField> updates,
                     std::vector<BlockEdit>* edits,
                     std::string* failed_key) noexcept
{
    if (!edits) {
        return CodecStatus::UnsupportedOperation;
    }

    auto fail = [&](const MetaField& f, CodecStatus st) noexcept {
        if (failed_key) {
            *failed_key = f.key;
        }
        return st;
    };

    for (const MetaField& f : updates) {
        if (validate_png_keyword(f.key) != CodecStatus::Ok
            || f.key == kPngXmpKeyword) {
            return fail(f, CodecStatus::InvalidFieldValue);
        }
        if (f.value.find('\0') != std::string::npos
            || !text_internal::is_valid_utf8(f.value)) {
            return fail(f, CodecStatus::InvalidFieldValue);
        }
    }

    const uint32_t iend = find_index(container, ContainerBlockKind::End);
    std::string keyword;
    for (const MetaField& f : updates) {
        bool replaced = false;
        for (size_t i = 0; i < container.blocks.size(); ++i) {
            const ContainerBlockRef& b = container.blocks[i];
            if (!is_text_block(b)) {
                continue;
            }
            if (!keyword_of(block_data(bytes, b), &keyword)) {
                return fail(f, CodecStatus::MalformedContainer);
            }
            if (keyword != f.key) {
                continue;
            }
            BlockEdit edit;
            edit.block_index = static_cast<uint32_t>(i);
            if (replaced) {
                edit.kind = BlockEditKind::Remove;
            } else {
                edit.kind            = BlockEditKind::Replace;
                const CodecStatus st = rebuild_text_chunk(bytes, b, f.key,
                                                          f.value, &edit.bytes);
                if (st != CodecStatus::Ok) {
                    return fail(f, st);
                }
                replaced = true;
            }
            edits->push_back(std::move(edit));
        }
        if (replaced) {
            continue;
        }
        BlockEdit edit;
        edit.kind            = BlockEditKind::InsertBefore;
        edit.block_index     = iend;
        const CodecStatus st = new_text_chunk(f.key, f.value, &edit.bytes);
        if (st != CodecStatus::Ok) {
            return fail(f, st);
        }
        edits->push_back(std::move(edit));
    }
    return CodecStatus::Ok;
}


CodecStatus
plan_png_chunk_upsert(const ImageContainer& container, ContainerBlockKind kind,
                      std::vector<std::byte> chunk,
                      std::vector<BlockEdit>* edits) noexcept
{
    if (!edits) {
        return CodecStatus::UnsupportedOperation;
    }
    bool placed = false;
    for (size_t i = 0; i < container.blocks.size(); ++i) {
        if (container.blocks[i].kind != kind) {
            continue;
        }
        BlockEdit edit;
        edit.block_index = static_cast<uint32_t>(i);
        if (placed) {
            edit.kind = BlockEditKind::Remove;
        } else {
            edit.kind  = BlockEditKind::Replace;
            edit.bytes = std::move(chunk);
            placed     = true;
        }
        edits->push_back(std::move(edit));
    }
    if (!placed) {
        uint32_t at = find_index(container, ContainerBlockKind::ImageData);
        if (at >= container.blocks.size()) {
            at = find_index(container, ContainerBlockKind::End);
        }
        BlockEdit edit;
        edit.kind        = BlockEditKind::InsertBefore;
        edit.block_index = at;
        edit.bytes       = std::move(chunk);
        edits->push_back(std::move(edit));
    }
    return CodecStatus::Ok;
}

}  // namespace metasplice
