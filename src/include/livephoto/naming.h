#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file naming.h
 * \brief Default names for files split from or merged into a motion photo.
 *
 * Vendor prefixes drive the names: `MVIMG_x.jpg` splits into `IMG_x.jpg`
 * and `VID_x.mp4`, `IMG_x.jpg` pairs with `VID_x.mp4`, and anything else
 * uses an `_0` / `VID_` suffix scheme.
 */

namespace livephoto {

/// Extension used when a file name has none.
inline constexpr std::string_view kDefaultExtension = "jpg";

struct PathParts final {
    /// Directory part of the path ("." when the path has none).
    std::string directory;
    std::string basename;
    std::string basename_no_ext;
    /// Extension without the dot; \ref kDefaultExtension when missing.
    std::string extension;
};

PathParts
split_path(std::string_view path);

/// Joins \p dir and \p name with exactly one separator.
std::string
join_path(std::string_view dir, std::string_view name);

/// `MVIMG_x.jpg` -> `IMG_x.jpg`; `x.jpg` -> `x_0.jpg`.
std::string
main_image_name(const PathParts& parts);

/// `MVIMG_x.jpg` -> `VID_x.mp4`; `IMG_x.jpg` -> `VID_x.mp4`; `x.jpg` -> `VID_x.mp4`.
std::string
video_name(const PathParts& parts);

/**
 * \brief Name of frame \p index (1-based) in \p format.
 *
 * `MVIMG_x` -> `IMG_x_<index>.<format>`, otherwise `x_<index>.<format>`.
 */
std::string
frame_name(const PathParts& parts, uint64_t index, std::string_view format);

/// Same as \ref frame_name with a printf-style `%d` in place of the index.
std::string
frame_name_pattern(const PathParts& parts, std::string_view format);

/**
 * \brief Default output path of the maker.
 *
 * An `IMG*` image yields `MVIMG*` beside it. Otherwise the name derives from
 * the video (`VID*` -> `MVIMG*`, else `MVIMG` + name) with a `.jpg`
 * extension, in the video's directory. \p image_path may be empty.
 */
std::string
maker_dest_path(std::string_view image_path, std::string_view video_path);

}  // namespace livephoto
