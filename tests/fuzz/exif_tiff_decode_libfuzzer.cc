#include "metasplice/exif_tiff_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace metasplice;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    ExifDecodeOptions options;
    options.include_unnamed_tags       = true;
    options.limits.max_ifds            = 64;
    options.limits.max_entries_per_ifd = 512;
    options.limits.max_total_entries   = 4096;
    options.limits.max_value_bytes     = 1ULL * 1024ULL * 1024ULL;

    FieldMap fields(MetaNamespace::Exif);
    (void)decode_exif_tiff(bytes, options, &fields);
    return 0;
}
