#pragma once

#include "livephoto/frame_export.h"
#include "livephoto/live_photo.h"
#include "livephoto/stream_copy.h"
#include "livephoto/tag_store.h"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file live_maker.h
 * \brief Builds a motion photo from a still image and a video.
 */

namespace livephoto {

struct LiveMakerOptions final {
    /// Keep the image's own tags (the motion photo tags are always written).
    bool export_metadata = true;
    StreamCopyOptions copy;
    TagStoreLimits tag_limits;
    /// Used only when no image is given.
    FrameExportOptions frames;
};

struct MakeResult final {
    LiveStatus status          = LiveStatus::Ok;
    StreamStatus stream_status = StreamStatus::Ok;
    TagStatus tag_status       = TagStatus::Ok;
    FrameExportResult exporter;
    /// Bytes of video appended (the reverse offset written to the tags).
    uint64_t video_size = 0;
    std::string dest_path;
    std::string message;
};

/**
 * \brief Writes `image + video` to a destination and tags it.
 *
 * Without an image the first video frame is extracted with ffmpeg and used
 * as the still. A half-written destination is left in place on failure.
 * \ref make can be called again; it overwrites the destination.
 */
class LiveMaker final {
public:
    /// Empty \p image_path selects the first video frame; empty
    /// \p dest_path selects \ref maker_dest_path.
    LiveMaker(std::string_view video_path, std::string_view image_path = {},
              std::string_view dest_path       = {},
              const LiveMakerOptions& options = LiveMakerOptions {});

    MakeResult make() const;

    const std::string& video_path() const noexcept { return video_path_; }
    const std::string& image_path() const noexcept { return image_path_; }
    const std::string& dest_path() const noexcept { return dest_path_; }

private:
    MakeResult write_still(MakeResult result) const;
    MakeResult append_video(MakeResult result) const;
    MakeResult write_tags(MakeResult result) const;

    std::string video_path_;
    std::string image_path_;
    std::string dest_path_;
    LiveMakerOptions options_;
};

}  // namespace livephoto
