#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file frame_export.h
 * \brief Drives an external `ffmpeg` to turn the embedded video into images.
 *
 * The video is never decoded in-process. `ffmpeg` reads the container file
 * directly and skips the still image with `-skip_initial_bytes`.
 */

namespace livephoto {

enum class FrameExportStatus : uint8_t {
    Ok,
    /// The shell could not be started.
    LaunchFailed,
    /// The command exited non-zero (including "command not found").
    DecodeFailed,
    IoError,
};

struct FrameExportOptions final {
    std::string ffmpeg_path = "ffmpeg";
    std::string loglevel    = "error";
};

/// Byte range of a video embedded in a larger file.
struct FrameSource final {
    std::string path;
    uint64_t video_offset = 0;
    uint64_t file_size    = 0;
};

struct FrameExportResult final {
    FrameExportStatus status = FrameExportStatus::Ok;
    /// Exit code of the command (valid after it ran).
    int exit_code = 0;
    /// Command line as passed to the shell.
    std::string command;
    /// Combined stdout/stderr of the command.
    std::string diagnostics;
};

/// Wraps \p arg in single quotes for `/bin/sh`.
std::string
shell_quote(std::string_view arg);

/// Quotes and joins \p args into one shell command line.
std::string
join_command(const std::vector<std::string>& args);

/// Runs \p args through the shell and captures its combined output.
FrameExportResult
run_command(const std::vector<std::string>& args);

/**
 * \brief Writes every frame of \p source to \p pattern_path.
 *
 * \p pattern_path contains a printf-style `%d` that ffmpeg replaces by the
 * 1-based frame number. `webp` output selects the still-image `libwebp`
 * encoder.
 */
FrameExportResult
split_frames(const FrameSource& source, std::string_view pattern_path,
             std::string_view format,
             const FrameExportOptions& options = FrameExportOptions {});

/// Encodes the first frame of \p video_path as a JPEG at \p dest_path.
FrameExportResult
extract_first_frame(std::string_view video_path, std::string_view dest_path,
                    const FrameExportOptions& options = FrameExportOptions {});

const char*
frame_export_status_name(FrameExportStatus status) noexcept;

}  // namespace livephoto
