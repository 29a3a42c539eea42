#include "openchunk/build_info.h"

#include <gtest/gtest.h>

#include <zlib.h>

#include <string>
#include <string_view>

namespace openchunk {

TEST(BuildInfo, LinkedBuildHasVersion)
{
    const BuildInfo& bi = build_info();
    EXPECT_FALSE(bi.version.empty());
    EXPECT_FALSE(bi.zlib_compiled_version.empty());
    EXPECT_FALSE(zlib_runtime_version().empty());
    EXPECT_NE(bi.linkage_static, bi.linkage_shared);
}


TEST(BuildInfo, FormatsHeaderLines)
{
    BuildInfo bi;
    bi.version              = "1.2.3";
    bi.build_type           = "Release";
    bi.system_name          = "Linux";
    bi.system_processor     = "x86_64";
    bi.cxx_compiler_id      = "GNU";
    bi.cxx_compiler_version = "13.2.0";
    bi.linkage_static       = true;
    bi.zlib_compiled_version = "1.3";

    std::string line1;
    std::string line2;
    format_build_info_lines(bi, &line1, &line2);
    EXPECT_EQ(line1, "OpenChunk v1.2.3 Release [zlib 1.3] static");
    EXPECT_EQ(line2, "built with GNU-13.2.0 for Linux/x86_64");

    bi.build_timestamp_utc = "2026-01-02T03:04:05Z";
    format_build_info_lines(bi, nullptr, &line2);
    EXPECT_EQ(line2,
              "built with GNU-13.2.0 for Linux/x86_64 (2026-01-02T03:04:05Z)");
}


// zlib.h defines a `zlib_version` macro; the field must stay reachable with
// that header in scope.
TEST(BuildInfo, ZlibCompiledVersionMatchesHeader)
{
    const BuildInfo& bi = build_info();
    ASSERT_FALSE(bi.zlib_compiled_version.empty());
    EXPECT_EQ(bi.zlib_compiled_version, std::string_view(ZLIB_VERSION));

    std::string line1;
    format_build_info_lines(&line1, nullptr);
    EXPECT_NE(line1.find(std::string("[zlib ") + ZLIB_VERSION + "]"),
              std::string::npos);
}

}  // namespace openchunk
