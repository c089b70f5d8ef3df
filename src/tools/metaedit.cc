#include "metasplice/build_info.h"
#include "metasplice/codec_status.h"
#include "metasplice/console_format.h"
#include "metasplice/container_scan.h"
#include "metasplice/meta_field.h"
#include "metasplice/metadata_request.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace metasplice {
namespace {

    enum class ReadFileStatus : uint8_t {
        Ok,
        OpenFailed,
        IoFailed,
        TooLarge,
    };

    static ReadFileStatus read_file_bytes(const char* path,
                                          std::vector<std::byte>* out,
                                          uint64_t max_file_bytes,
                                          uint64_t* out_size)
    {
        out->clear();
        if (out_size) {
            *out_size = 0;
        }
        std::FILE* f = std::fopen(path, "rb");
        if (!f) {
            return ReadFileStatus::OpenFailed;
        }

        if (std::fseek(f, 0, SEEK_END) != 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }
        const long end = std::ftell(f);
        if (end < 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }
        if (std::fseek(f, 0, SEEK_SET) != 0) {
            std::fclose(f);
            return ReadFileStatus::IoFailed;
        }

        const uint64_t size_u64 = static_cast<uint64_t>(end);
        if (out_size) {
            *out_size = size_u64;
        }
        if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
            std::fclose(f);
            return ReadFileStatus::TooLarge;
        }

        const size_t size = static_cast<size_t>(size_u64);
        out->resize(size);
        if (size != 0) {
            const size_t read = std::fread(out->data(), 1, size, f);
            if (read != size) {
                std::fclose(f);
                out->clear();
                return ReadFileStatus::IoFailed;
            }
        }
        std::fclose(f);
        return ReadFileStatus::Ok;
    }


    /// Writes to `<path>.tmp` and renames over \p path.
    static bool write_file_bytes(const std::string& path,
                                 const std::vector<std::byte>& bytes)
    {
        const std::string tmp = path + ".tmp";
        std::FILE* f          = std::fopen(tmp.c_str(), "wb");
        if (!f) {
            return false;
        }
        const size_t written = bytes.empty()
                                   ? 0
                                   : std::fwrite(bytes.data(), 1, bytes.size(),
                                                 f);
        const bool closed    = (std::fclose(f) == 0);
        if (written != bytes.size() || !closed
            || std::rename(tmp.c_str(), path.c_str()) != 0) {
            std::remove(tmp.c_str());
            return false;
        }
        return true;
    }


    static bool read_input(const char* tool, const char* path,
                           uint64_t max_file_bytes,
                           std::vector<std::byte>* bytes)
    {
        uint64_t file_size      = 0;
        const ReadFileStatus st = read_file_bytes(path, bytes, max_file_bytes,
                                                  &file_size);
        if (st == ReadFileStatus::Ok) {
            return true;
        }
        if (st == ReadFileStatus::TooLarge) {
            std::fprintf(
                stderr,
                "%s: refusing to read `%s` (size=%llu > --max-file-bytes=%llu)\n",
                tool, path, static_cast<unsigned long long>(file_size),
                static_cast<unsigned long long>(max_file_bytes));
        } else if (st == ReadFileStatus::OpenFailed) {
            std::fprintf(stderr, "%s: failed to open `%s`\n", tool, path);
        } else {
            std::fprintf(stderr, "%s: failed to read `%s`\n", tool, path);
        }
        return false;
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static void print_failure(const char* path, const CodecFailure& failure)
    {
        std::string key;
        (void)append_console_escaped(failure.key, 128, &key);
        std::string where(request_stage_name(failure.stage));
        if (failure.has_namespace) {
            where.push_back('/');
            where.append(meta_namespace_name(failure.ns));
        }
        const std::string status(codec_status_name(failure.status));
        if (key.empty()) {
            std::fprintf(stderr, "metaedit: %s: %s (%s)\n", path,
                         status.c_str(), where.c_str());
        } else {
            std::fprintf(stderr, "metaedit: %s: %s (%s, key \"%s\")\n", path,
                         status.c_str(), where.c_str(), key.c_str());
        }
    }


    static void print_fields(std::string_view title, const FieldMap& fields,
                             uint32_t max_bytes)
    {
        const std::string name(title);
        std::printf("[%s] %zu\n", name.c_str(), fields.size());
        std::string key;
        std::string value;
        for (const MetaField& f : fields.entries()) {
            key.clear();
            value.clear();
            (void)append_console_escaped(f.key, max_bytes, &key);
            (void)append_console_escaped(f.value, max_bytes, &value);
            std::printf("  %s = \"%s\"\n", key.c_str(), value.c_str());
        }
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }


    static void usage(const char* argv0)
    {
        std::printf("usage: %s read [options] <file>\n", argv0);
        std::printf("       %s set [options] <file> key=value [key=value...]\n",
                    argv0);
        std::printf("options:\n");
        std::printf("  --version            print build info and exit\n");
        std::printf(
            "  --route=R            write route: default, xmp, exif, png-text\n");
        std::printf(
            "  -o PATH              write the result to PATH (default: in place)\n");
        std::printf(
            "  --max-bytes N        max bytes to print per key/value (default: 1024)\n");
        std::printf(
            "  --max-file-bytes N   refuse to read files larger than N bytes (default: 536870912; 0=unlimited)\n");
    }


    static int run_read(const char* path, uint64_t max_file_bytes,
                        uint32_t max_bytes)
    {
        std::vector<std::byte> bytes;
        if (!read_input("metaedit", path, max_file_bytes, &bytes)) {
            return 1;
        }

        ReadOptions options;
        options.policy.max_file_bytes = max_file_bytes;
        const ReadResult r            = read_metadata(bytes, options);
        if (r.status != CodecStatus::Ok) {
            print_failure(path, r.failure);
            return 1;
        }

        const std::string format(container_format_name(r.format));
        std::printf("== %s\n", path);
        std::printf("format=%s", format.c_str());
        if (r.has_dimensions) {
            std::printf(" width=%u height=%u", static_cast<unsigned>(r.width),
                        static_cast<unsigned>(r.height));
        }
        std::printf("\n");
        if (r.has_exif) {
            print_fields("exif", r.exif, max_bytes);
        }
        if (r.has_png_text) {
            print_fields("png_text", r.png_text, max_bytes);
        }
        if (r.has_xmp) {
            print_fields("xmp", r.xmp, max_bytes);
        }
        return 0;
    }


    static int run_set(const char* path, const std::string& out_path,
                       std::vector<MetaField> updates, WriteRoute route,
                       uint64_t max_file_bytes, uint32_t max_bytes)
    {
        std::vector<std::byte> bytes;
        if (!read_input("metaedit", path, max_file_bytes, &bytes)) {
            return 1;
        }

        WriteOptions options;
        options.route                 = route;
        options.policy.max_file_bytes = max_file_bytes;
        const WriteResult r = write_metadata(bytes, updates, options);
        if (r.status != CodecStatus::Ok) {
            print_failure(path, r.failure);
            return 1;
        }

        const std::string target = out_path.empty() ? std::string(path)
                                                    : out_path;
        if (!write_file_bytes(target, r.image_bytes)) {
            std::fprintf(stderr, "metaedit: failed to write `%s`\n",
                         target.c_str());
            return 1;
        }
        print_fields(meta_namespace_name(r.ns), r.updated, max_bytes);
        return 0;
    }

}  // namespace
}  // namespace metasplice

int
main(int argc, char** argv)
{
    using namespace metasplice;

    WriteRoute route        = WriteRoute::Default;
    std::string out_path;
    uint32_t max_bytes      = 1024;
    uint64_t max_file_bytes = 512ULL * 1024ULL * 1024ULL;

    std::vector<const char*> positional;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strncmp(arg, "--route=", 8) == 0) {
            if (!parse_write_route(arg + 8, &route)) {
                std::fprintf(stderr, "invalid --route value\n");
                return 2;
            }
            continue;
        }
        if (std::strcmp(arg, "-o") == 0 && i + 1 < argc) {
            out_path = argv[i + 1];
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v) || v > UINT32_MAX) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            max_bytes = static_cast<uint32_t>(v);
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            max_file_bytes = v;
            i += 1;
            continue;
        }
        positional.push_back(arg);
    }

    if (positional.size() < 2) {
        usage(argv[0]);
        return 2;
    }
    const std::string_view command(positional[0]);
    const char* path = positional[1];

    if (command == "read") {
        if (positional.size() != 2) {
            usage(argv[0]);
            return 2;
        }
        return run_read(path, max_file_bytes, max_bytes);
    }
    if (command != "set" || positional.size() < 3) {
        usage(argv[0]);
        return 2;
    }

    std::vector<MetaField> updates;
    for (size_t i = 2; i < positional.size(); ++i) {
        const std::string_view kv(positional[i]);
        const size_t eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            std::fprintf(stderr, "metaedit: expected key=value, got `%s`\n",
                         positional[i]);
            return 2;
        }
        MetaField f;
        f.key.assign(kv.substr(0, eq));
        f.value.assign(kv.substr(eq + 1));
        updates.push_back(std::move(f));
    }
    return run_set(path, out_path, std::move(updates), route, max_file_bytes,
                   max_bytes);
}
