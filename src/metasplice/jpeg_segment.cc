#include "metasplice/jpeg_segment.h"

#include "byte_io_internal.h"

#include <utility>

namespace metasplice {
namespace {

    static constexpr uint32_t kSoi  = 0xFFD8;
    static constexpr uint32_t kApp0 = 0xFFE0;
    static constexpr uint32_t kApp1 = 0xFFE1;

    static uint32_t insert_index(const ImageContainer& c,
                                 ContainerBlockKind kind) noexcept
    {
        uint32_t i = 0;
        if (!c.blocks.empty() && c.blocks[0].id == kSoi) {
            i = 1;
        }
        while (i < c.blocks.size()) {
            const uint32_t id = c.blocks[i].id;
            const bool skip   = (id == kApp0)
                              || (kind == ContainerBlockKind::Xmp
                                  && id == kApp1);
            if (!skip) {
                break;
            }
            i += 1;
        }
        return i;
    }

}  // namespace

CodecStatus
make_jpeg_app1(std::string_view signature, std::span<const std::byte> payload,
               std::vector<std::byte>* out)
{
    out->clear();
    const size_t body = signature.size() + payload.size();
    if (body > kJpegMaxSegmentBody) {
        return CodecStatus::ResourceLimitExceeded;
    }
    out->reserve(body + 4);
    byte_io::append_u16be(out, static_cast<uint16_t>(kApp1));
    byte_io::append_u16be(out, static_cast<uint16_t>(body + 2));
    byte_io::append_text(out, signature);
    byte_io::append_span(out, payload);
    return CodecStatus::Ok;
}


CodecStatus
plan_jpeg_app1_upsert(const ImageContainer& container, ContainerBlockKind kind,
                      std::vector<std::byte> segment,
                      std::vector<BlockEdit>* edits) noexcept
{
    if (!edits || container.format != ContainerFormat::Jpeg) {
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
            edit.bytes = std::move(segment);
            placed     = true;
        }
        edits->push_back(std::move(edit));
    }
    if (!placed) {
        BlockEdit edit;
        edit.kind        = BlockEditKind::InsertBefore;
        edit.block_index = insert_index(container, kind);
        edit.bytes       = std::move(segment);
        edits->push_back(std::move(edit));
    }
    return CodecStatus::Ok;
}

}  // namespace metasplice
