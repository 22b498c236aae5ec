#include "livephoto/naming.h"

namespace livephoto {
namespace {

    static constexpr std::string_view kMotionPrefix = "MVIMG";
    static constexpr std::string_view kImagePrefix  = "IMG";
    static constexpr std::string_view kVideoPrefix  = "VID";

    static bool has_prefix(std::string_view s, std::string_view prefix) noexcept
    {
        return s.substr(0, prefix.size()) == prefix;
    }


    static std::string frame_name_with(const PathParts& parts,
                                       std::string_view index,
                                       std::string_view format)
    {
        std::string name;
        if (has_prefix(parts.basename, kMotionPrefix)) {
            name.assign(kImagePrefix);
            name.append(std::string_view(parts.basename_no_ext)
                            .substr(kMotionPrefix.size()));
        } else {
            name.assign(parts.basename_no_ext);
        }
        name.push_back('_');
        name.append(index);
        name.push_back('.');
        name.append(format.empty() ? std::string_view(parts.extension)
                                   : format);
        return name;
    }

}  // namespace

PathParts
split_path(std::string_view path)
{
    PathParts parts;

    const size_t slash = path.find_last_of('/');
    if (slash == std::string_view::npos) {
        parts.directory = ".";
        parts.basename.assign(path);
    } else {
        parts.directory.assign(path.substr(0, slash == 0 ? 1 : slash));
        parts.basename.assign(path.substr(slash + 1));
    }

    const size_t dot = parts.basename.find_last_of('.');
    if (dot == std::string::npos) {
        parts.basename_no_ext = parts.basename;
        parts.extension.assign(kDefaultExtension);
    } else {
        parts.basename_no_ext = parts.basename.substr(0, dot);
        if (dot + 1 < parts.basename.size()) {
            parts.extension = parts.basename.substr(dot + 1);
        } else {
            parts.extension.assign(kDefaultExtension);
        }
    }
    return parts;
}


std::string
join_path(std::string_view dir, std::string_view name)
{
    if (dir.empty()) {
        return std::string(name);
    }
    std::string out(dir);
    if (out.back() != '/') {
        out.push_back('/');
    }
    out.append(name);
    return out;
}


std::string
main_image_name(const PathParts& parts)
{
    std::string name;
    if (has_prefix(parts.basename, kMotionPrefix)) {
        name.assign(kImagePrefix);
        name.append(std::string_view(parts.basename).substr(kMotionPrefix.size()));
        return name;
    }
    name.assign(parts.basename_no_ext);
    name.append("_0.");
    name.append(parts.extension);
    return name;
}


std::string
video_name(const PathParts& parts)
{
    const std::string_view stem(parts.basename_no_ext);
    std::string name(kVideoPrefix);
    if (has_prefix(parts.basename, kMotionPrefix)) {
        name.append(stem.substr(kMotionPrefix.size()));
    } else if (has_prefix(parts.basename, kImagePrefix)) {
        name.append(stem.substr(kImagePrefix.size()));
    } else {
        name.push_back('_');
        name.append(stem);
    }
    name.append(".mp4");
    return name;
}


std::string
frame_name(const PathParts& parts, uint64_t index, std::string_view format)
{
    return frame_name_with(parts, std::to_string(index), format);
}


std::string
frame_name_pattern(const PathParts& parts, std::string_view format)
{
    return frame_name_with(parts, "%d", format);
}


std::string
maker_dest_path(std::string_view image_path, std::string_view video_path)
{
    if (!image_path.empty()) {
        const PathParts image = split_path(image_path);
        if (has_prefix(image.basename, kImagePrefix)) {
            std::string name(kMotionPrefix);
            name.append(std::string_view(image.basename)
                            .substr(kImagePrefix.size()));
            return join_path(image.directory, name);
        }
    }

    const PathParts video = split_path(video_path);
    std::string name(kMotionPrefix);
    if (has_prefix(video.basename, kVideoPrefix)) {
        name.append(std::string_view(video.basename)
                        .substr(kVideoPrefix.size()));
    } else {
        name.append(video.basename);
    }
    const size_t dot = name.find_last_of('.');
    if (dot != std::string::npos) {
        name.resize(dot);
    }
    name.append(".jpg");
    return join_path(video.directory, name);
}

}  // namespace livephoto
