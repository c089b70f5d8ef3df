#include "metasplice/container_payload.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace metasplice;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    PayloadLimits limits;
    limits.max_output_bytes = 1ULL * 1024ULL * 1024ULL;

    std::vector<std::byte> out;
    (void)inflate_zlib(bytes, limits, &out);
    (void)crc32_of(bytes, out);
    return 0;
}
