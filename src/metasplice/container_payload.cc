#include "metasplice/container_payload.h"

#include <array>

#include <zlib.h>

namespace metasplice {
namespace {

    static uint32_t safe_u32(uint64_t v) noexcept
    {
        return (v > 0xFFFFFFFFULL) ? 0xFFFFFFFFU : static_cast<uint32_t>(v);
    }

}  // namespace

CodecStatus
inflate_zlib(std::span<const std::byte> in, const PayloadLimits& limits,
             std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return CodecStatus::MalformedContainer;
    }
    out->clear();

    z_stream strm {};
    strm.zalloc = Z_NULL;
    strm.zfree  = Z_NULL;
    strm.opaque = Z_NULL;

    int ret = inflateInit(&strm);
    if (ret != Z_OK) {
        return CodecStatus::MalformedContainer;
    }

    std::array<std::byte, 32768> buf {};

    uint64_t in_off        = 0;
    const uint64_t max_out = limits.max_output_bytes;

    bool output_full = false;
    for (;;) {
        if (strm.avail_in == 0 && !(output_full && in_off >= in.size())) {
            if (in_off >= in.size()) {
                (void)inflateEnd(&strm);
                out->clear();
                return CodecStatus::MalformedContainer;
            }
            const uint32_t chunk = safe_u32(static_cast<uint64_t>(in.size())
                                            - in_off);
            strm.next_in  = reinterpret_cast<Bytef*>(const_cast<std::byte*>(
                in.data() + static_cast<size_t>(in_off)));
            strm.avail_in = static_cast<uInt>(chunk);
            in_off += chunk;
        }

        strm.next_out  = reinterpret_cast<Bytef*>(buf.data());
        strm.avail_out = static_cast<uInt>(buf.size());

        ret                   = inflate(&strm, Z_NO_FLUSH);
        const size_t produced = buf.size() - strm.avail_out;
        // A full buffer may leave output pending after the input is consumed.
        output_full = (strm.avail_out == 0);

        if (max_out != 0U && out->size() + produced > max_out) {
            (void)inflateEnd(&strm);
            out->clear();
            return CodecStatus::ResourceLimitExceeded;
        }
        out->insert(out->end(), buf.begin(),
                    buf.begin() + static_cast<std::ptrdiff_t>(produced));

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret != Z_OK) {
            (void)inflateEnd(&strm);
            out->clear();
            return CodecStatus::MalformedContainer;
        }
    }

    (void)inflateEnd(&strm);
    return CodecStatus::Ok;
}


CodecStatus
deflate_zlib(std::span<const std::byte> in, std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return CodecStatus::InvalidFieldValue;
    }
    out->clear();
    if (in.size() > 0xFFFFFFFFULL) {
        return CodecStatus::ResourceLimitExceeded;
    }

    uLongf dest_len = compressBound(static_cast<uLong>(in.size()));
    out->resize(static_cast<size_t>(dest_len));
    const int ret = compress2(reinterpret_cast<Bytef*>(out->data()), &dest_len,
                              reinterpret_cast<const Bytef*>(in.data()),
                              static_cast<uLong>(in.size()),
                              Z_DEFAULT_COMPRESSION);
    if (ret != Z_OK) {
        out->clear();
        return ret == Z_MEM_ERROR ? CodecStatus::ResourceLimitExceeded
                                  : CodecStatus::InvalidFieldValue;
    }
    out->resize(static_cast<size_t>(dest_len));
    return CodecStatus::Ok;
}


uint32_t
crc32_of(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    uLong crc = crc32(0L, Z_NULL, 0);
    if (!a.empty()) {
        crc = crc32(crc, reinterpret_cast<const Bytef*>(a.data()),
                    static_cast<uInt>(a.size()));
    }
    if (!b.empty()) {
        crc = crc32(crc, reinterpret_cast<const Bytef*>(b.data()),
                    static_cast<uInt>(b.size()));
    }
    return static_cast<uint32_t>(crc);
}

}  // namespace metasplice
