#include "livephoto/live_photo.h"

#include "livephoto/motion_tags.h"

#include <cctype>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <dirent.h>

namespace livephoto {
namespace {

    static bool is_jpeg_format(std::string_view format) noexcept
    {
        std::string lower(format);
        for (char& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return lower == "jpg" || lower == "jpeg";
    }


    static std::string describe_command_failure(const FrameExportResult& r)
    {
        std::string msg("command `");
        msg.append(r.command);
        msg.append("' failed with ");
        msg.append(std::to_string(r.exit_code));
        if (!r.diagnostics.empty()) {
            msg.append(" - `");
            msg.append(r.diagnostics);
            msg.append("'");
        }
        return msg;
    }


    static ExportResult copy_failure(ExportResult result, StreamStatus status,
                                     const char* what)
    {
        result.status        = LiveStatus::StreamError;
        result.stream_status = status;
        result.message       = what;
        result.message.append(": ");
        result.message.append(stream_status_name(status));
        return result;
    }


    static std::map<std::string, FileStamp>
    directory_stamps(const std::string& dir)
    {
        std::map<std::string, FileStamp> stamps;
        DIR* d = ::opendir(dir.empty() ? "." : dir.c_str());
        if (!d) {
            return stamps;
        }
        while (const struct dirent* entry = ::readdir(d)) {
            const std::string path = join_path(dir, entry->d_name);
            FileStamp stamp;
            if (file_stamp(path.c_str(), &stamp) == FileStatus::Ok) {
                stamps.emplace(path, stamp);
            }
        }
        (void)::closedir(d);
        return stamps;
    }

}  // namespace

LiveOpenResult
LivePhoto::open(std::string_view path, const LivePhotoOptions& options,
                std::unique_ptr<LivePhoto>* out)
{
    LiveOpenResult result;
    if (!out) {
        result.status  = LiveStatus::NotLiveLikeFile;
        result.message = "no output";
        return result;
    }
    out->reset();

    auto photo = std::make_unique<LivePhoto>(ConstructToken {});
    photo->path_.assign(path);
    photo->parts_           = split_path(path);
    photo->dest_dir_        = options.dest_dir.empty() ? photo->parts_.directory
                                                       : options.dest_dir;
    photo->export_metadata_ = options.export_metadata;
    photo->copy_            = options.copy;
    photo->tag_limits_      = options.tag_limits;

    result.tag_status = photo->store_.open(photo->path_.c_str(),
                                           options.tag_limits);
    if (result.tag_status != TagStatus::Ok) {
        result.status  = LiveStatus::NotLiveLikeFile;
        result.message = "cannot read tags: ";
        result.message.append(tag_status_name(result.tag_status));
        return result;
    }

    FileHandle file;
    if (file.open(photo->path_.c_str(), FileMode::Read) != FileStatus::Ok) {
        result.status         = LiveStatus::NotLiveLikeFile;
        result.resolve_status = ResolveStatus::IoError;
        result.message        = "cannot open file";
        return result;
    }

    const ResolveResult resolved
        = resolve_video_offset(file, photo->store_.snapshot(), options.copy);
    result.resolve_status = resolved.status;
    if (resolved.status != ResolveStatus::Ok) {
        result.status  = LiveStatus::NotLiveLikeFile;
        result.message = "video offset not found: ";
        result.message.append(resolve_status_name(resolved.status));
        return result;
    }
    if (resolved.video_offset < 0
        || static_cast<uint64_t>(resolved.video_offset) > resolved.file_size) {
        result.status         = LiveStatus::NotLiveLikeFile;
        result.resolve_status = ResolveStatus::NotFound;
        result.message        = "video offset out of range";
        return result;
    }
    photo->video_offset_  = resolved.video_offset;
    photo->file_size_     = resolved.file_size;
    photo->offset_source_ = resolved.source;

    TagSnapshot plain = photo->store_.snapshot();
    (void)clear_motion_photo_tags(plain);
    result.tag_status = photo->store_.replace_snapshot(plain);
    if (result.tag_status != TagStatus::Ok) {
        result.status  = LiveStatus::NotLiveLikeFile;
        result.message = "cannot stage tags: ";
        result.message.append(tag_status_name(result.tag_status));
        return result;
    }

    *out = std::move(photo);
    return result;
}


ExportResult
LivePhoto::write_image_tags(ExportResult result) const
{
    // Without metadata export the image still loses the copied XMP packet,
    // so it cannot pass for a motion photo.
    TagStore store = store_;
    if (!export_metadata_) {
        store.clear_all();
    }
    result.tag_status = store.save(result.output_path.c_str(), copy_);
    if (result.tag_status != TagStatus::Ok) {
        result.status  = LiveStatus::TagError;
        result.message = "cannot write tags: ";
        result.message.append(tag_status_name(result.tag_status));
    }
    return result;
}


ExportResult
LivePhoto::export_main_image(std::string_view dest) const
{
    ExportResult result;
    result.output_path = dest.empty()
                             ? join_path(dest_dir_, main_image_name(parts_))
                             : std::string(dest);

    FileHandle src;
    if (src.open(path_.c_str(), FileMode::Read) != FileStatus::Ok) {
        return copy_failure(std::move(result), StreamStatus::OpenFailed,
                            "cannot open source");
    }
    FileHandle dst;
    if (dst.open(result.output_path.c_str(), FileMode::Create)
        != FileStatus::Ok) {
        return copy_failure(std::move(result), StreamStatus::OpenFailed,
                            "cannot create image");
    }

    const StreamCopyResult copied = copy_n(
        src, dst, static_cast<uint64_t>(video_offset_), copy_);
    result.bytes = copied.copied;
    if (copied.status != StreamStatus::Ok) {
        return copy_failure(std::move(result), copied.status,
                            "image copy failed");
    }
    if (!dst.close()) {
        return copy_failure(std::move(result), StreamStatus::WriteFailed,
                            "image copy failed");
    }

    return write_image_tags(std::move(result));
}


ExportResult
LivePhoto::export_video(std::string_view dest) const
{
    ExportResult result;
    result.output_path = dest.empty() ? join_path(dest_dir_, video_name(parts_))
                                      : std::string(dest);

    FileHandle src;
    if (src.open(path_.c_str(), FileMode::Read) != FileStatus::Ok) {
        return copy_failure(std::move(result), StreamStatus::OpenFailed,
                            "cannot open source");
    }
    FileHandle dst;
    if (dst.open(result.output_path.c_str(), FileMode::Create)
        != FileStatus::Ok) {
        return copy_failure(std::move(result), StreamStatus::OpenFailed,
                            "cannot create video");
    }

    const StreamCopyResult copied = copy_from_offset(
        src, dst, static_cast<uint64_t>(video_offset_), copy_);
    result.bytes = copied.copied;
    if (copied.status != StreamStatus::Ok) {
        return copy_failure(std::move(result), copied.status,
                            "video copy failed");
    }
    if (!dst.close()) {
        return copy_failure(std::move(result), StreamStatus::WriteFailed,
                            "video copy failed");
    }
    return result;
}


RepairResult
LivePhoto::repair(const RepairOptions& options)
{
    RepairResult result;
    result.states.push_back(RepairState::TrustExisting);

    auto fail = [&result](LiveStatus status, std::string message) {
        result.states.push_back(RepairState::Failed);
        result.status  = status;
        result.message = std::move(message);
        return result;
    };

    FileHandle file;
    uint64_t size = 0;
    if (file.open(path_.c_str(), FileMode::Read) != FileStatus::Ok
        || file.size(&size) != FileStatus::Ok) {
        return fail(LiveStatus::IoError, "cannot open file");
    }

    bool need_scan = false;
    if (options.manual_video_size > 0) {
        if (options.manual_video_size > size) {
            return fail(LiveStatus::OffsetNotFound,
                        "video size exceeds the file size");
        }
        result.reverse_offset = static_cast<int64_t>(
            options.manual_video_size);
    } else if (options.force) {
        need_scan = true;
    } else {
        result.states.push_back(RepairState::Validate);
        if (probe_marker(file, video_offset_)) {
            result.reverse_offset = static_cast<int64_t>(size)
                                    - video_offset_;
        } else {
            need_scan = true;
        }
    }

    if (need_scan) {
        result.states.push_back(RepairState::Scan);
        const ResolveResult scanned = scan_video_offset(file, copy_);
        if (scanned.status == ResolveStatus::IoError) {
            return fail(LiveStatus::IoError, "scan failed");
        }
        if (scanned.status != ResolveStatus::Ok) {
            return fail(LiveStatus::OffsetNotFound, "no video marker found");
        }
        result.reverse_offset = static_cast<int64_t>(size)
                                - scanned.video_offset;
    }
    if (result.reverse_offset < 0) {
        return fail(LiveStatus::OffsetNotFound, "negative reverse offset");
    }
    (void)file.close();

    result.states.push_back(RepairState::Persist);

    TagStore store;
    result.tag_status = store.open(path_.c_str(), tag_limits_);
    if (result.tag_status != TagStatus::Ok) {
        return fail(LiveStatus::TagError, "cannot read tags");
    }
    TagSnapshot staged = store.snapshot();
    stage_motion_photo_tags(staged,
                            static_cast<uint64_t>(result.reverse_offset),
                            image_mime_for_extension(parts_.extension));
    result.tag_status = store.replace_snapshot(staged);
    if (result.tag_status == TagStatus::Ok) {
        result.tag_status = store.save(path_.c_str(), copy_);
    }
    if (result.tag_status != TagStatus::Ok) {
        return fail(LiveStatus::TagError,
                    std::string("cannot write tags: ")
                        + tag_status_name(result.tag_status));
    }

    uint64_t new_size = 0;
    if (livephoto::file_size(path_.c_str(), &new_size) != FileStatus::Ok
        || new_size < static_cast<uint64_t>(result.reverse_offset)) {
        return fail(LiveStatus::IoError, "cannot stat repaired file");
    }

    (void)clear_motion_photo_tags(staged);
    result.tag_status = store.replace_snapshot(staged);
    if (result.tag_status != TagStatus::Ok) {
        return fail(LiveStatus::TagError, "cannot stage tags");
    }
    store_         = std::move(store);
    file_size_     = new_size;
    video_offset_  = static_cast<int64_t>(new_size) - result.reverse_offset;
    offset_source_ = OffsetSource::Tag;

    result.video_offset = video_offset_;
    return result;
}


FrameSource
LivePhoto::frame_source() const
{
    FrameSource source;
    source.path         = path_;
    source.video_offset = static_cast<uint64_t>(video_offset_);
    source.file_size    = file_size_;
    return source;
}


SplitFramesResult
LivePhoto::split_frames(const FrameExportOptions& options,
                        std::string_view format,
                        std::string_view dest_dir) const
{
    SplitFramesResult result;
    const std::string fmt(format.empty() ? std::string_view(parts_.extension)
                                         : format);
    const std::string dir(dest_dir.empty() ? std::string_view(dest_dir_)
                                           : dest_dir);

    const std::string pattern = join_path(dir,
                                          frame_name_pattern(parts_, fmt));

    // Files present before the decoder runs; a frame name whose stamp is
    // unchanged afterwards was not written by this run.
    const std::map<std::string, FileStamp> previous = directory_stamps(dir);

    result.exporter = ::livephoto::split_frames(frame_source(), pattern, fmt,
                                                options);
    if (result.exporter.status != FrameExportStatus::Ok) {
        result.status  = LiveStatus::DecodeError;
        result.message = describe_command_failure(result.exporter);
        return result;
    }

    const bool attach_tags = export_metadata_ && is_jpeg_format(fmt);
    for (uint64_t i = 1;; ++i) {
        const std::string frame = join_path(dir, frame_name(parts_, i, fmt));
        FileStamp stamp;
        if (file_stamp(frame.c_str(), &stamp) != FileStatus::Ok) {
            break;
        }
        const auto it = previous.find(frame);
        if (it != previous.end() && it->second == stamp) {
            break;
        }
        result.frames += 1;
        if (attach_tags && store_.save(frame.c_str(), copy_) != TagStatus::Ok) {
            result.tag_failures += 1;
        }
    }
    return result;
}


const char*
live_status_name(LiveStatus status) noexcept
{
    switch (status) {
    case LiveStatus::Ok: return "ok";
    case LiveStatus::NotLiveLikeFile: return "not_live_like_file";
    case LiveStatus::OffsetNotFound: return "offset_not_found";
    case LiveStatus::StreamError: return "stream_error";
    case LiveStatus::TagError: return "tag_error";
    case LiveStatus::DecodeError: return "decode_error";
    case LiveStatus::IoError: return "io_error";
    }
    return "unknown";
}


const char*
repair_state_name(RepairState state) noexcept
{
    switch (state) {
    case RepairState::TrustExisting: return "trust_existing";
    case RepairState::Validate: return "validate";
    case RepairState::Scan: return "scan";
    case RepairState::Persist: return "persist";
    case RepairState::Failed: return "failed";
    }
    return "unknown";
}

}  // namespace livephoto
