#pragma once

#include "livephoto/file_io.h"
#include "livephoto/stream_copy.h"
#include "livephoto/tag_snapshot.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

/**
 * \file offset_resolver.h
 * \brief Locates the start of the video appended to a still image.
 */

namespace livephoto {

/// Box type of the first ISO-BMFF box of an MP4 stream.
inline constexpr std::array<std::byte, 4> kMp4Marker = {
    std::byte { 'f' }, std::byte { 't' }, std::byte { 'y' }, std::byte { 'p' },
};
/// The marker follows the 4-byte box size field.
inline constexpr uint64_t kMp4MarkerLead = 4;

/**
 * \brief Streaming exact matcher (Knuth-Morris-Pratt) for a 4-byte marker.
 *
 * Partial-match state is carried between \ref feed calls, so a marker that
 * straddles two chunks is found without keeping previous bytes around.
 */
class MarkerMatcher final {
public:
    explicit MarkerMatcher(std::span<const std::byte, 4> pattern) noexcept;

    /**
     * \brief Consumes \p chunk.
     *
     * Returns the index within \p chunk of the last byte of the first full
     * match, or `std::nullopt` when the chunk completes no match.
     */
    std::optional<size_t> feed(std::span<const std::byte> chunk) noexcept;

    void reset() noexcept { matched_ = 0; }

private:
    std::array<std::byte, 4> pattern_ {};
    std::array<uint8_t, 4> failure_ {};
    uint8_t matched_ = 0;
};

enum class ResolveStatus : uint8_t {
    Ok,
    /// No usable tag and no marker in the file (or a negative offset).
    NotFound,
    IoError,
};

enum class OffsetSource : uint8_t {
    None,
    Tag,
    Scan,
};

struct ResolveResult final {
    ResolveStatus status = ResolveStatus::Ok;
    OffsetSource source  = OffsetSource::None;
    int64_t video_offset = -1;
    uint64_t file_size   = 0;
};

/**
 * \brief Reverse offset recorded in \p tags, or 0 when absent.
 *
 * `MotionPhotoOffset` is preferred over `MicroVideoOffset`; the first
 * non-empty value that parses as a positive decimal integer wins.
 */
int64_t
tag_reverse_offset(const TagSnapshot& tags) noexcept;

/// Strict positive decimal parse; returns 0 for anything else.
int64_t
parse_reverse_offset(std::string_view text) noexcept;

/// True when the 4 bytes at `video_offset + 4` are the MP4 marker.
bool
probe_marker(FileHandle& file, int64_t video_offset) noexcept;

/**
 * \brief Finds the first marker in \p file and returns `match - 4`.
 *
 * Reads the whole file once from the start in `options.chunk_bytes`
 * chunks. A marker in the first 4 bytes yields `NotFound`.
 */
ResolveResult
scan_video_offset(FileHandle& file,
                  const StreamCopyOptions& options
                  = StreamCopyOptions {}) noexcept;

/**
 * \brief Tag-trusting resolution: the tag when present, else the scan.
 *
 * A tag-derived offset is not probed; \ref probe_marker is the repair
 * path's job.
 */
ResolveResult
resolve_video_offset(FileHandle& file, const TagSnapshot& tags,
                     const StreamCopyOptions& options
                     = StreamCopyOptions {}) noexcept;

const char*
resolve_status_name(ResolveStatus status) noexcept;

}  // namespace livephoto
