#include "livephoto/offset_resolver.h"

#include "livephoto/motion_tags.h"

#include <cstring>
#include <initializer_list>
#include <limits>
#include <vector>

namespace livephoto {

MarkerMatcher::MarkerMatcher(std::span<const std::byte, 4> pattern) noexcept
{
    for (size_t i = 0; i < pattern_.size(); ++i) {
        pattern_[i] = pattern[i];
    }

    // failure_[i]: length of the longest proper prefix of pattern[0..i]
    // that is also a suffix of it.
    failure_[0] = 0;
    uint8_t len = 0;
    for (size_t i = 1; i < pattern_.size(); ++i) {
        while (len > 0 && pattern_[i] != pattern_[len]) {
            len = failure_[len - 1];
        }
        if (pattern_[i] == pattern_[len]) {
            len += 1;
        }
        failure_[i] = len;
    }
}


std::optional<size_t>
MarkerMatcher::feed(std::span<const std::byte> chunk) noexcept
{
    for (size_t i = 0; i < chunk.size(); ++i) {
        const std::byte b = chunk[i];
        while (matched_ > 0 && b != pattern_[matched_]) {
            matched_ = failure_[matched_ - 1];
        }
        if (b == pattern_[matched_]) {
            matched_ += 1;
        }
        if (matched_ == pattern_.size()) {
            matched_ = failure_[matched_ - 1];
            return i;
        }
    }
    return std::nullopt;
}


int64_t
parse_reverse_offset(std::string_view text) noexcept
{
    if (text.empty()) {
        return 0;
    }
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t value          = 0;
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return 0;
        }
        const int64_t digit = static_cast<int64_t>(c - '0');
        if (value > (kMax - digit) / 10) {
            return 0;
        }
        value = value * 10 + digit;
    }
    return value;
}


int64_t
tag_reverse_offset(const TagSnapshot& tags) noexcept
{
    const MotionTagRow& row = motion_tag_row(MotionTagKind::Offset);
    for (const std::string_view key : { row.modern_key, row.legacy_key }) {
        const std::string_view value = tags.get(key);
        if (value.empty()) {
            continue;
        }
        const int64_t parsed = parse_reverse_offset(value);
        if (parsed > 0) {
            return parsed;
        }
    }
    return 0;
}


bool
probe_marker(FileHandle& file, int64_t video_offset) noexcept
{
    if (video_offset < 0) {
        return false;
    }
    if (file.seek(static_cast<uint64_t>(video_offset) + kMp4MarkerLead)
        != FileStatus::Ok) {
        return false;
    }
    std::array<std::byte, 4> probe {};
    size_t n = 0;
    if (file.read_full(std::span<std::byte>(probe), &n) != FileStatus::Ok
        || n != probe.size()) {
        return false;
    }
    return std::memcmp(probe.data(), kMp4Marker.data(), probe.size()) == 0;
}


ResolveResult
scan_video_offset(FileHandle& file, const StreamCopyOptions& options) noexcept
{
    ResolveResult result;
    result.source = OffsetSource::Scan;

    if (file.size(&result.file_size) != FileStatus::Ok
        || file.seek(0) != FileStatus::Ok) {
        result.status = ResolveStatus::IoError;
        return result;
    }

    const size_t chunk = options.chunk_bytes == 0U ? kDefaultChunkBytes
                                                   : options.chunk_bytes;
    std::vector<std::byte> buffer(chunk);
    MarkerMatcher matcher(kMp4Marker);

    uint64_t global_pos = 0;
    for (;;) {
        size_t n = 0;
        if (file.read(std::span<std::byte>(buffer.data(), buffer.size()), &n)
            != FileStatus::Ok) {
            result.status = ResolveStatus::IoError;
            return result;
        }
        if (n == 0) {
            break;
        }

        const std::optional<size_t> last = matcher.feed(
            std::span<const std::byte>(buffer.data(), n));
        if (last) {
            const uint64_t match_pos = global_pos + *last + 1U
                                       - kMp4Marker.size();
            if (match_pos < kMp4MarkerLead) {
                result.status = ResolveStatus::NotFound;
                return result;
            }
            result.video_offset = static_cast<int64_t>(match_pos
                                                       - kMp4MarkerLead);
            return result;
        }
        global_pos += static_cast<uint64_t>(n);
    }

    result.status = ResolveStatus::NotFound;
    return result;
}


ResolveResult
resolve_video_offset(FileHandle& file, const TagSnapshot& tags,
                     const StreamCopyOptions& options) noexcept
{
    const int64_t reverse = tag_reverse_offset(tags);
    if (reverse <= 0) {
        return scan_video_offset(file, options);
    }

    ResolveResult result;
    result.source = OffsetSource::Tag;
    if (file.size(&result.file_size) != FileStatus::Ok) {
        result.status = ResolveStatus::IoError;
        return result;
    }
    if (static_cast<uint64_t>(reverse) > result.file_size) {
        result.status = ResolveStatus::NotFound;
        return result;
    }
    result.video_offset = static_cast<int64_t>(result.file_size)
                          - reverse;
    return result;
}


const char*
resolve_status_name(ResolveStatus status) noexcept
{
    switch (status) {
    case ResolveStatus::Ok: return "ok";
    case ResolveStatus::NotFound: return "not_found";
    case ResolveStatus::IoError: return "io_error";
    }
    return "unknown";
}

}  // namespace livephoto
