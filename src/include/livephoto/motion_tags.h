#pragma once

#include "livephoto/tag_snapshot.h"

#include <array>
#include <cstdint>
#include <string_view>

/**
 * \file motion_tags.h
 * \brief Motion photo tag dialects and the Google container directory.
 *
 * Two tag dialects describe the same layout: the legacy `MicroVideo*`
 * keys and the newer `MotionPhoto*` keys. Readers differ in which one they
 * look at, so every write sets both.
 */

namespace livephoto {

enum class MotionTagKind : uint8_t {
    /// "This file is a motion photo" flag (`"1"`).
    Flag,
    Version,
    /// Reverse offset: bytes from the video start to the end of the file.
    Offset,
    /// Presentation timestamp of the still frame, in microseconds.
    PresentationTimestamp,
};

struct MotionTagRow final {
    MotionTagKind kind;
    std::string_view legacy_key;
    std::string_view modern_key;
};

inline constexpr std::array<MotionTagRow, 4> kMotionTagTable = { {
    { MotionTagKind::Flag, "Xmp.GCamera.MicroVideo",
      "Xmp.GCamera.MotionPhoto" },
    { MotionTagKind::Version, "Xmp.GCamera.MicroVideoVersion",
      "Xmp.GCamera.MotionPhotoVersion" },
    { MotionTagKind::Offset, "Xmp.GCamera.MicroVideoOffset",
      "Xmp.GCamera.MotionPhotoOffset" },
    { MotionTagKind::PresentationTimestamp,
      "Xmp.GCamera.MicroVideoPresentationTimestampUs",
      "Xmp.GCamera.MotionPhotoPresentationTimestampUs" },
} };

/// Root of the `Container:Directory` sequence.
inline constexpr std::string_view kContainerDirectoryKey
    = "Xmp.Container.Directory";

/// Row of \p kind in \ref kMotionTagTable.
const MotionTagRow&
motion_tag_row(MotionTagKind kind) noexcept;

/// MIME type of the primary image item for a file extension (no dot).
std::string_view
image_mime_for_extension(std::string_view extension) noexcept;

/**
 * \brief Timestamp to carry forward: the modern value when non-empty,
 * otherwise the legacy value (possibly empty).
 */
std::string_view
preserved_timestamp(const TagSnapshot& tags) noexcept;

/**
 * \brief Removes every key that marks a file as a motion photo.
 *
 * Covers both dialects of \ref kMotionTagTable and the whole container
 * directory. Returns the number of keys removed.
 */
uint32_t
clear_motion_photo_tags(TagSnapshot& tags) noexcept;

/**
 * \brief Writes a consistent motion photo tag set into \p tags.
 *
 * Both dialects receive the flag, version and \p reverse_offset. An existing
 * presentation timestamp (see \ref preserved_timestamp) is written to both
 * keys; none is invented when absent. Any previous container directory is
 * replaced by a primary image item of \p image_mime and a `video/mp4`
 * motion photo item of length \p reverse_offset.
 */
void
stage_motion_photo_tags(TagSnapshot& tags, uint64_t reverse_offset,
                        std::string_view image_mime);

}  // namespace livephoto
