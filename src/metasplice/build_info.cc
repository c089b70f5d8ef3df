#include "metasplice/build_info.h"

#include "metasplice/build_info_generated.h"

#include <string>

#include <expat.h>
#include <zlib.h>

namespace metasplice {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(METASPLICE_BUILD_LINKAGE_STATIC) && METASPLICE_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(METASPLICE_BUILD_LINKAGE_SHARED) && METASPLICE_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static BuildInfo make_build_info() noexcept
    {
        BuildInfo bi;
        bi.version               = METASPLICE_BUILDINFO_VERSION;
        bi.build_timestamp_utc   = METASPLICE_BUILDINFO_BUILD_TIMESTAMP_UTC;
        bi.build_type            = METASPLICE_BUILDINFO_BUILD_TYPE;
        bi.cmake_generator       = METASPLICE_BUILDINFO_CMAKE_GENERATOR;
        bi.system_name           = METASPLICE_BUILDINFO_SYSTEM_NAME;
        bi.system_processor      = METASPLICE_BUILDINFO_SYSTEM_PROCESSOR;
        bi.cxx_compiler_id       = METASPLICE_BUILDINFO_CXX_COMPILER_ID;
        bi.cxx_compiler_version  = METASPLICE_BUILDINFO_CXX_COMPILER_VERSION;
        bi.cxx_compiler          = METASPLICE_BUILDINFO_CXX_COMPILER;
        bi.linkage_static        = linkage_static();
        bi.linkage_shared        = linkage_shared();
        bi.zlib_runtime_version  = zlibVersion();
        bi.expat_runtime_version = XML_ExpatVersion();
        return bi;
    }


    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    static const BuildInfo kBuildInfo = make_build_info();
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(128);
        line1->append("metasplice v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type);
        line1->append(" [zlib-");
        line1->append(bi.zlib_runtime_version);
        line1->append(",");
        line1->append(bi.expat_runtime_version);
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->append("-");
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->append("/");
        line2->append(bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace metasplice
