#pragma once

#include "livephoto/frame_export.h"
#include "livephoto/naming.h"
#include "livephoto/offset_resolver.h"
#include "livephoto/stream_copy.h"
#include "livephoto/tag_store.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file live_photo.h
 * \brief A still image with an MP4 video appended to it.
 */

namespace livephoto {

/// Top-level status of container operations.
enum class LiveStatus : uint8_t {
    Ok,
    /// The file is not a readable image with a locatable video.
    NotLiveLikeFile,
    OffsetNotFound,
    StreamError,
    TagError,
    DecodeError,
    IoError,
};

struct LivePhotoOptions final {
    /// Output directory for default names (empty: beside the file).
    std::string dest_dir;
    /// Write the (cleared) tags into exported images and frames.
    bool export_metadata = true;
    StreamCopyOptions copy;
    TagStoreLimits tag_limits;
};

struct LiveOpenResult final {
    LiveStatus status            = LiveStatus::Ok;
    TagStatus tag_status         = TagStatus::Ok;
    ResolveStatus resolve_status = ResolveStatus::Ok;
    std::string message;
};

struct ExportResult final {
    LiveStatus status          = LiveStatus::Ok;
    StreamStatus stream_status = StreamStatus::Ok;
    TagStatus tag_status       = TagStatus::Ok;
    uint64_t bytes             = 0;
    /// Set whenever the output file was created, even on `TagError`.
    std::string output_path;
    std::string message;
};

/// States of the offset repair decision.
enum class RepairState : uint8_t {
    TrustExisting,
    Validate,
    Scan,
    Persist,
    Failed,
};

struct RepairOptions final {
    /// Always rescan, ignoring the current offset.
    bool force = false;
    /// When non-zero, trusted as the video size (reverse offset).
    uint64_t manual_video_size = 0;
};

struct RepairResult final {
    LiveStatus status    = LiveStatus::Ok;
    TagStatus tag_status = TagStatus::Ok;
    /// Every state entered, in order.
    std::vector<RepairState> states;
    int64_t reverse_offset = -1;
    int64_t video_offset   = -1;
    std::string message;
};

struct SplitFramesResult final {
    LiveStatus status = LiveStatus::Ok;
    FrameExportResult exporter;
    uint32_t frames = 0;
    /// Frames whose tag write failed (the frames themselves are kept).
    uint32_t tag_failures = 0;
    std::string message;
};

/**
 * \brief Combined image + video file.
 *
 * A `LivePhoto` only exists for files whose video offset was resolved:
 * `0 <= video_offset() <= file_size()` always holds. Tags that mark the
 * file as a motion photo are removed from the in-memory snapshot at load,
 * so exported images are plain images. Each export opens the source file
 * again.
 */
class LivePhoto final {
    struct ConstructToken final {
        explicit ConstructToken() = default;
    };

public:
    /// Only \ref open creates instances.
    explicit LivePhoto(ConstructToken) {}

    /**
     * \brief Loads \p path and resolves its video offset.
     *
     * The offset tag is trusted without probing the file. Every failure is
     * reported as `NotLiveLikeFile` with the underlying detail.
     */
    static LiveOpenResult open(std::string_view path,
                               const LivePhotoOptions& options,
                               std::unique_ptr<LivePhoto>* out);

    /// Copies the still image (`[0, video_offset)`) to \p dest.
    ExportResult export_main_image(std::string_view dest = {}) const;

    /// Copies the video (`[video_offset, EOF)`) to \p dest.
    ExportResult export_video(std::string_view dest = {}) const;

    /**
     * \brief Recomputes the offset and rewrites both tag dialects in place.
     *
     * On success the file holds a consistent tag set and \ref video_offset
     * refers to the rewritten file.
     */
    RepairResult repair(const RepairOptions& options = RepairOptions {});

    FrameSource frame_source() const;

    /**
     * \brief Splits the video into numbered frames under \p dest_dir.
     *
     * \p format defaults to the image extension and \p dest_dir to the
     * container's destination directory. JPEG frames receive the tag
     * snapshot when metadata export is enabled. Frame files that were
     * already present and that the decoder left untouched are not counted.
     */
    SplitFramesResult split_frames(const FrameExportOptions& options,
                                   std::string_view format   = {},
                                   std::string_view dest_dir = {}) const;

    const std::string& path() const noexcept { return path_; }
    const PathParts& parts() const noexcept { return parts_; }
    const std::string& dest_dir() const noexcept { return dest_dir_; }
    int64_t video_offset() const noexcept { return video_offset_; }
    uint64_t file_size() const noexcept { return file_size_; }
    OffsetSource offset_source() const noexcept { return offset_source_; }
    const TagSnapshot& tags() const noexcept { return store_.snapshot(); }

    bool export_metadata() const noexcept { return export_metadata_; }
    void set_export_metadata(bool enabled) noexcept
    {
        export_metadata_ = enabled;
    }

private:
    ExportResult write_image_tags(ExportResult result) const;

    std::string path_;
    PathParts parts_;
    std::string dest_dir_;
    int64_t video_offset_       = 0;
    uint64_t file_size_         = 0;
    OffsetSource offset_source_ = OffsetSource::None;
    bool export_metadata_       = true;
    StreamCopyOptions copy_;
    TagStoreLimits tag_limits_;
    TagStore store_;
};

const char*
live_status_name(LiveStatus status) noexcept;

const char*
repair_state_name(RepairState state) noexcept;

}  // namespace livephoto
