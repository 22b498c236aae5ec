#pragma once

#include "livephoto/file_io.h"
#include "livephoto/stream_copy.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

/**
 * \file jpeg_segments.h
 * \brief Streaming JPEG header walk (SOI .. SOS) and XMP APP1 rewrite.
 *
 * Only the marker segments in front of the compressed scan are visited;
 * scan data and anything appended after the JPEG stream (for example an
 * embedded MP4) are never read by the walk.
 */

namespace livephoto {

/// APP1 signature of a standard XMP packet (includes the trailing NUL).
inline constexpr std::string_view kJpegXmpSignature
    = std::string_view("http://ns.adobe.com/xap/1.0/\0", 29);
/// APP1 signature of an extended XMP chunk (includes the trailing NUL).
inline constexpr std::string_view kJpegXmpExtSignature
    = std::string_view("http://ns.adobe.com/xmp/extension/\0", 35);

/// Largest payload a single marker segment can carry (length field - 2).
inline constexpr uint32_t kJpegMaxSegmentPayload = 65533;

enum class JpegStatus : uint8_t {
    Ok,
    ReadFailed,
    WriteFailed,
    /// Not a JPEG stream (no SOI).
    Unsupported,
    Malformed,
    /// Segment count or packet size limit hit.
    LimitExceeded,
};

enum class JpegSegmentKind : uint8_t {
    Other,
    Jfif,
    Exif,
    Xmp,
    XmpExtended,
};

/// One marker segment of the JPEG header, in file order.
struct JpegSegmentRef final {
    JpegSegmentKind kind = JpegSegmentKind::Other;
    uint8_t marker       = 0;
    /// Offset of the `0xFF` that starts the marker.
    uint64_t offset = 0;
    /// Marker + length field + payload.
    uint64_t size = 0;
    /// Payload after the signature for XMP, after the length field otherwise.
    uint64_t data_offset = 0;
    uint64_t data_size   = 0;
};

struct JpegScanLimits final {
    uint32_t max_segments = 4096;
};

struct JpegScanResult final {
    JpegStatus status = JpegStatus::Ok;
    std::vector<JpegSegmentRef> segments;
    /// First byte that is not part of a header segment (SOS/EOI marker, or
    /// the end of the file when neither was reached).
    uint64_t header_end = 0;
    uint64_t file_size  = 0;
};

/// Walks the marker segments of \p file from SOI up to SOS or EOI.
JpegScanResult
scan_jpeg_header(FileHandle& file,
                 const JpegScanLimits& limits = JpegScanLimits {}) noexcept;

/// Index of the first standard XMP segment, or -1.
int32_t
find_xmp_segment(const JpegScanResult& scan) noexcept;

/// Reads the data range of \p segment into \p out.
JpegStatus
read_segment_data(FileHandle& file, const JpegSegmentRef& segment,
                  std::vector<std::byte>* out) noexcept;

/**
 * \brief Writes \p src to \p dst with its XMP replaced by \p xmp_packet.
 *
 * Existing standard and extended XMP segments are dropped. The new APP1 is
 * placed after the leading JFIF/Exif segments; an empty packet writes no
 * XMP segment at all. Bytes from `scan.header_end` to the end of \p src are
 * copied unchanged.
 */
JpegStatus
rewrite_jpeg_xmp(FileHandle& src, const JpegScanResult& scan,
                 std::string_view xmp_packet, FileHandle& dst,
                 const StreamCopyOptions& options
                 = StreamCopyOptions {}) noexcept;

const char*
jpeg_status_name(JpegStatus status) noexcept;

}  // namespace livephoto
