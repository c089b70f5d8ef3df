#include "metasplice/container_splice.h"

namespace metasplice {

CodecStatus
splice_container(std::span<const std::byte> bytes,
                 const ImageContainer& container,
                 std::span<const BlockEdit> edits,
                 std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return CodecStatus::UnsupportedOperation;
    }
    out->clear();

    const size_t block_count = container.blocks.size();
    std::vector<const BlockEdit*> replace(block_count, nullptr);
    std::vector<bool> touched(block_count, false);
    uint64_t extra = 0;
    for (const BlockEdit& e : edits) {
        if (e.kind == BlockEditKind::InsertBefore) {
            if (e.block_index > block_count) {
                return CodecStatus::UnsupportedOperation;
            }
            extra += e.bytes.size();
            continue;
        }
        if (e.block_index >= block_count || touched[e.block_index]) {
            return CodecStatus::UnsupportedOperation;
        }
        touched[e.block_index] = true;
        if (e.kind == BlockEditKind::Replace) {
            replace[e.block_index] = &e;
            extra += e.bytes.size();
        }
    }

    out->reserve(static_cast<size_t>(bytes.size() + extra));
    for (size_t i = 0; i <= block_count; ++i) {
        for (const BlockEdit& e : edits) {
            if (e.kind == BlockEditKind::InsertBefore && e.block_index == i) {
                out->insert(out->end(), e.bytes.begin(), e.bytes.end());
            }
        }
        if (i == block_count) {
            break;
        }
        if (replace[i]) {
            out->insert(out->end(), replace[i]->bytes.begin(),
                        replace[i]->bytes.end());
            continue;
        }
        if (touched[i]) {
            continue;
        }
        const ContainerBlockRef& b = container.blocks[i];
        if (b.outer_offset > bytes.size()
            || b.outer_size > bytes.size() - b.outer_offset) {
            out->clear();
            return CodecStatus::MalformedContainer;
        }
        const auto first = bytes.begin()
                           + static_cast<std::ptrdiff_t>(b.outer_offset);
        out->insert(out->end(), first,
                    first + static_cast<std::ptrdiff_t>(b.outer_size));
    }
    return CodecStatus::Ok;
}

}  // namespace metasplice
