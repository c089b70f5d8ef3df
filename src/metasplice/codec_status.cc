#include "metasplice/codec_status.h"

namespace metasplice {

std::string_view
codec_status_name(CodecStatus status) noexcept
{
    switch (status) {
    case CodecStatus::Ok: return "Ok";
    case CodecStatus::UnrecognizedFormat: return "UnrecognizedFormat";
    case CodecStatus::MalformedContainer: return "MalformedContainer";
    case CodecStatus::TruncatedIfd: return "TruncatedIfd";
    case CodecStatus::OffsetOutOfBounds: return "OffsetOutOfBounds";
    case CodecStatus::UnsupportedTagType: return "UnsupportedTagType";
    case CodecStatus::ChunkCrcMismatch: return "ChunkCrcMismatch";
    case CodecStatus::ChunkTooLarge: return "ChunkTooLarge";
    case CodecStatus::InvalidFieldValue: return "InvalidFieldValue";
    case CodecStatus::UnsupportedOperation: return "UnsupportedOperation";
    case CodecStatus::ResourceLimitExceeded: return "ResourceLimitExceeded";
    }
    return "Unknown";
}


void
merge_status(CodecStatus* out, CodecStatus in) noexcept
{
    if (!out || in == CodecStatus::Ok) {
        return;
    }
    if (*out == CodecStatus::Ok) {
        *out = in;
    }
}

}  // namespace metasplice
