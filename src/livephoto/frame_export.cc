#include "livephoto/frame_export.h"

#include <array>
#include <cctype>
#include <cstdio>

#include <sys/wait.h>

namespace livephoto {
namespace {

    static bool iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i]))
                != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }


    static std::vector<std::string>
    ffmpeg_prologue(const FrameExportOptions& options)
    {
        return {
            options.ffmpeg_path,
            "-hide_banner",
            "-loglevel",
            options.loglevel.empty() ? std::string("error") : options.loglevel,
        };
    }

}  // namespace

std::string
shell_quote(std::string_view arg)
{
    std::string out;
    out.reserve(arg.size() + 2);
    out.push_back('\'');
    for (const char ch : arg) {
        if (ch == '\'') {
            out.append("'\\''");
            continue;
        }
        out.push_back(ch);
    }
    out.push_back('\'');
    return out;
}


std::string
join_command(const std::vector<std::string>& args)
{
    std::string cmd;
    for (const std::string& arg : args) {
        if (!cmd.empty()) {
            cmd.push_back(' ');
        }
        cmd.append(shell_quote(arg));
    }
    return cmd;
}


FrameExportResult
run_command(const std::vector<std::string>& args)
{
    FrameExportResult result;
    result.command = join_command(args);

    const std::string shell_line = result.command + " 2>&1";
    FILE* pipe                   = ::popen(shell_line.c_str(), "r");
    if (!pipe) {
        result.status = FrameExportStatus::LaunchFailed;
        return result;
    }

    std::array<char, 4096> buffer {};
    for (;;) {
        const size_t n = std::fread(buffer.data(), 1, buffer.size(), pipe);
        if (n == 0) {
            break;
        }
        result.diagnostics.append(buffer.data(), n);
    }
    const bool read_error = std::ferror(pipe) != 0;

    const int rc = ::pclose(pipe);
    if (rc == -1) {
        result.status = FrameExportStatus::LaunchFailed;
        return result;
    }
    if (WIFEXITED(rc)) {
        result.exit_code = WEXITSTATUS(rc);
    } else if (WIFSIGNALED(rc)) {
        result.exit_code = 128 + WTERMSIG(rc);
    } else {
        result.exit_code = rc;
    }

    if (result.exit_code != 0) {
        result.status = FrameExportStatus::DecodeFailed;
    } else if (read_error) {
        result.status = FrameExportStatus::IoError;
    }
    return result;
}


FrameExportResult
split_frames(const FrameSource& source, std::string_view pattern_path,
             std::string_view format, const FrameExportOptions& options)
{
    std::vector<std::string> args = ffmpeg_prologue(options);
    args.emplace_back("-skip_initial_bytes");
    args.emplace_back(std::to_string(source.video_offset));
    args.emplace_back("-i");
    args.emplace_back(source.path);
    args.emplace_back("-f");
    args.emplace_back("image2");
    if (iequals(format, "webp")) {
        // The default webp encoder in ffmpeg is the animated one.
        args.emplace_back("-c:v");
        args.emplace_back("libwebp");
    }
    args.emplace_back("-y");
    args.emplace_back(pattern_path);
    return run_command(args);
}


FrameExportResult
extract_first_frame(std::string_view video_path, std::string_view dest_path,
                    const FrameExportOptions& options)
{
    std::vector<std::string> args = ffmpeg_prologue(options);
    args.emplace_back("-i");
    args.emplace_back(video_path);
    args.emplace_back("-frames:v");
    args.emplace_back("1");
    args.emplace_back("-update");
    args.emplace_back("1");
    args.emplace_back("-f");
    args.emplace_back("image2");
    args.emplace_back("-c:v");
    args.emplace_back("mjpeg");
    args.emplace_back("-y");
    args.emplace_back(dest_path);
    return run_command(args);
}


const char*
frame_export_status_name(FrameExportStatus status) noexcept
{
    switch (status) {
    case FrameExportStatus::Ok: return "ok";
    case FrameExportStatus::LaunchFailed: return "launch_failed";
    case FrameExportStatus::DecodeFailed: return "decode_failed";
    case FrameExportStatus::IoError: return "io_error";
    }
    return "unknown";
}

}  // namespace livephoto
