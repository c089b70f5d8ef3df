#include "metasplice/container_scan.h"
#include "metasplice/metadata_request.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace metasplice {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}

}  // namespace metasplice

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace metasplice;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    ReadOptions read_options;
    read_options.policy.max_file_bytes = 4ULL * 1024ULL * 1024ULL;
    (void)read_metadata(bytes, read_options);

    MetaField update;
    update.key   = "description";
    update.value = "fuzz";
    const MetaField updates[] = { update };

    WriteOptions write_options;
    write_options.policy = read_options.policy;
    for (WriteRoute route : { WriteRoute::Default, WriteRoute::Exif }) {
        write_options.route = route;
        const WriteResult w = write_metadata(bytes, updates, write_options);
        if (w.status != CodecStatus::Ok) {
            continue;
        }
        // A successful write must produce a container that scans again.
        ImageContainer container;
        if (scan_container(w.image_bytes, &container) != CodecStatus::Ok) {
            fuzz_trap();
        }
    }
    return 0;
}
