#include "livephoto/live_maker.h"

#include "livephoto/motion_tags.h"
#include "livephoto/naming.h"

#include <utility>

namespace livephoto {
namespace {

    static MakeResult io_failure(MakeResult result, StreamStatus status,
                                 const char* what)
    {
        result.status        = LiveStatus::IoError;
        result.stream_status = status;
        result.message       = what;
        result.message.append(": ");
        result.message.append(stream_status_name(status));
        return result;
    }

}  // namespace

LiveMaker::LiveMaker(std::string_view video_path, std::string_view image_path,
                     std::string_view dest_path,
                     const LiveMakerOptions& options)
    : video_path_(video_path)
    , image_path_(image_path)
    , dest_path_(dest_path.empty() ? maker_dest_path(image_path, video_path)
                                   : std::string(dest_path))
    , options_(options)
{
}


MakeResult
LiveMaker::write_still(MakeResult result) const
{
    if (image_path_.empty()) {
        result.exporter = extract_first_frame(video_path_, dest_path_,
                                              options_.frames);
        if (result.exporter.status != FrameExportStatus::Ok) {
            result.status  = LiveStatus::DecodeError;
            result.message = "command `" + result.exporter.command
                             + "' failed with "
                             + std::to_string(result.exporter.exit_code);
            if (!result.exporter.diagnostics.empty()) {
                result.message += " - `" + result.exporter.diagnostics + "'";
            }
        }
        return result;
    }

    FileHandle src;
    if (src.open(image_path_.c_str(), FileMode::Read) != FileStatus::Ok) {
        return io_failure(std::move(result), StreamStatus::OpenFailed,
                          "cannot open image");
    }
    FileHandle dst;
    if (dst.open(dest_path_.c_str(), FileMode::Create) != FileStatus::Ok) {
        return io_failure(std::move(result), StreamStatus::OpenFailed,
                          "cannot create destination");
    }
    const StreamCopyResult copied = copy_all(src, dst, options_.copy);
    if (copied.status != StreamStatus::Ok) {
        return io_failure(std::move(result), copied.status,
                          "image copy failed");
    }
    if (!dst.close()) {
        return io_failure(std::move(result), StreamStatus::WriteFailed,
                          "image copy failed");
    }
    return result;
}


MakeResult
LiveMaker::append_video(MakeResult result) const
{
    FileHandle src;
    if (src.open(video_path_.c_str(), FileMode::Read) != FileStatus::Ok) {
        return io_failure(std::move(result), StreamStatus::OpenFailed,
                          "cannot open video");
    }
    FileHandle dst;
    if (dst.open(dest_path_.c_str(), FileMode::Append) != FileStatus::Ok) {
        return io_failure(std::move(result), StreamStatus::OpenFailed,
                          "cannot append to destination");
    }
    const StreamCopyResult copied = copy_all(src, dst, options_.copy);
    result.video_size             = copied.copied;
    if (copied.status != StreamStatus::Ok) {
        return io_failure(std::move(result), copied.status,
                          "video copy failed");
    }
    if (!dst.close()) {
        return io_failure(std::move(result), StreamStatus::WriteFailed,
                          "video copy failed");
    }
    return result;
}


MakeResult
LiveMaker::write_tags(MakeResult result) const
{
    TagStore store;
    result.tag_status = store.open(dest_path_.c_str(), options_.tag_limits);
    if (result.tag_status != TagStatus::Ok) {
        result.status  = LiveStatus::TagError;
        result.message = std::string("cannot read tags: ")
                         + tag_status_name(result.tag_status);
        return result;
    }

    TagSnapshot staged = store.snapshot();
    if (!options_.export_metadata) {
        staged.clear();
    }
    const PathParts parts = split_path(dest_path_);
    stage_motion_photo_tags(staged, result.video_size,
                            image_mime_for_extension(parts.extension));

    result.tag_status = store.replace_snapshot(staged);
    if (result.tag_status == TagStatus::Ok) {
        result.tag_status = store.save(dest_path_.c_str(), options_.copy);
    }
    if (result.tag_status != TagStatus::Ok) {
        result.status  = LiveStatus::TagError;
        result.message = std::string("cannot write tags: ")
                         + tag_status_name(result.tag_status);
    }
    return result;
}


MakeResult
LiveMaker::make() const
{
    MakeResult result;
    result.dest_path = dest_path_;

    result = write_still(std::move(result));
    if (result.status != LiveStatus::Ok) {
        return result;
    }
    result = append_video(std::move(result));
    if (result.status != LiveStatus::Ok) {
        return result;
    }
    return write_tags(std::move(result));
}

}  // namespace livephoto
