#include "livephoto/build_info.h"

#include "livephoto/build_info_generated.h"

#include <expat.h>

#include <string>

namespace livephoto {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/LIVEPHOTO_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/LIVEPHOTO_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/LIVEPHOTO_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/LIVEPHOTO_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/LIVEPHOTO_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/LIVEPHOTO_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/LIVEPHOTO_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/LIVEPHOTO_BUILDINFO_CXX_COMPILER_VERSION,
        /*expat_version=*/LIVEPHOTO_BUILDINFO_EXPAT_VERSION,
    };


    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        if (!out) {
            return;
        }
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


std::string_view
expat_runtime_version() noexcept
{
    const XML_LChar* v = XML_ExpatVersion();
    return v ? std::string_view(v) : std::string_view {};
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(96);
        line1->append("livephoto v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);
        line1->append(" [expat");
        if (!bi.expat_version.empty()) {
            line1->append(" ");
            append_sv(line1, bi.expat_version);
        }
        line1->append("]");
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace livephoto
