#include "openchunk/build_info.h"

#include "openchunk/build_info_generated.h"

#include <zlib.h>

namespace openchunk {
namespace {

    static constexpr bool linkage_static() noexcept
    {
#if defined(OPENCHUNK_BUILD_LINKAGE_STATIC) && OPENCHUNK_BUILD_LINKAGE_STATIC
        return true;
#else
        return false;
#endif
    }

    static constexpr bool linkage_shared() noexcept
    {
#if defined(OPENCHUNK_BUILD_LINKAGE_SHARED) && OPENCHUNK_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/OPENCHUNK_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/OPENCHUNK_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/OPENCHUNK_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/OPENCHUNK_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/OPENCHUNK_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/OPENCHUNK_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/OPENCHUNK_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/OPENCHUNK_BUILDINFO_CXX_COMPILER_VERSION,
        /*linkage_static=*/linkage_static(),
        /*linkage_shared=*/linkage_shared(),
        /*zlib_compiled_version=*/ZLIB_VERSION,
    };

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
    return kBuildInfo;
}


std::string_view
zlib_runtime_version() noexcept
{
    const char* v = ::zlibVersion();
    return v ? std::string_view(v) : std::string_view();
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2)
{
    if (line1) {
        line1->clear();
        line1->append("OpenChunk v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type);
        line1->append(" [zlib ");
        line1->append(bi.zlib_compiled_version);
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
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
format_build_info_lines(std::string* line1, std::string* line2)
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace openchunk
