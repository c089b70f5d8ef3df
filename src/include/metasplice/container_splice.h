#pragma once

#include "metasplice/codec_status.h"
#include "metasplice/container_scan.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file container_splice.h
 * \brief Single-pass reassembly of a container from its blocks plus edits.
 */

namespace metasplice {

enum class BlockEditKind : uint8_t {
    /// Emit \ref BlockEdit::bytes instead of the block.
    Replace,
    /// Emit \ref BlockEdit::bytes before the block (index == size appends).
    InsertBefore,
    /// Drop the block.
    Remove,
};

/// One planned change to the block list of an \ref ImageContainer.
struct BlockEdit final {
    BlockEditKind kind   = BlockEditKind::Replace;
    uint32_t block_index = 0;
    std::vector<std::byte> bytes;
};

/**
 * \brief Rebuilds the file from \p container blocks with \p edits applied.
 *
 * Blocks without an edit are copied verbatim. Several inserts before the same
 * block keep their relative order. A block may carry at most one Replace or
 * Remove edit; conflicting edits and out-of-range indices return
 * \ref CodecStatus::UnsupportedOperation and leave \p out empty.
 */
CodecStatus
splice_container(std::span<const std::byte> bytes,
                 const ImageContainer& container,
                 std::span<const BlockEdit> edits,
                 std::vector<std::byte>* out) noexcept;

}  // namespace metasplice
