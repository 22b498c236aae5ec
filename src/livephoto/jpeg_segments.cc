#include "livephoto/jpeg_segments.h"

#include <array>
#include <cstring>

namespace livephoto {
namespace {

    static uint8_t u8(std::byte b) noexcept { return static_cast<uint8_t>(b); }


    static JpegStatus read_at(FileHandle& file, uint64_t offset,
                              std::span<std::byte> out) noexcept
    {
        if (file.seek(offset) != FileStatus::Ok) {
            return JpegStatus::ReadFailed;
        }
        size_t n = 0;
        if (file.read_full(out, &n) != FileStatus::Ok) {
            return JpegStatus::ReadFailed;
        }
        return n == out.size() ? JpegStatus::Ok : JpegStatus::Malformed;
    }


    static bool starts_with(std::span<const std::byte> bytes, size_t avail,
                            std::string_view sig) noexcept
    {
        if (avail < sig.size()) {
            return false;
        }
        return std::memcmp(bytes.data(), sig.data(), sig.size()) == 0;
    }


    static JpegSegmentKind classify_app1(FileHandle& file,
                                         uint64_t payload_off,
                                         uint64_t payload_size,
                                         JpegStatus* status) noexcept
    {
        std::array<std::byte, 35> head {};
        const size_t want = payload_size < head.size()
                                ? static_cast<size_t>(payload_size)
                                : head.size();
        *status = read_at(file, payload_off,
                          std::span<std::byte>(head.data(), want));
        if (*status != JpegStatus::Ok) {
            return JpegSegmentKind::Other;
        }

        const std::span<const std::byte> bytes(head.data(), want);
        if (want >= 6 && u8(head[0]) == 'E' && u8(head[1]) == 'x'
            && u8(head[2]) == 'i' && u8(head[3]) == 'f' && u8(head[4]) == 0) {
            return JpegSegmentKind::Exif;
        }
        if (starts_with(bytes, want, kJpegXmpSignature)) {
            return JpegSegmentKind::Xmp;
        }
        if (starts_with(bytes, want, kJpegXmpExtSignature)) {
            return JpegSegmentKind::XmpExtended;
        }
        return JpegSegmentKind::Other;
    }


    static JpegStatus write_bytes(FileHandle& dst, const void* data,
                                  size_t size) noexcept
    {
        const std::span<const std::byte> bytes(
            static_cast<const std::byte*>(data), size);
        return dst.write(bytes) == FileStatus::Ok ? JpegStatus::Ok
                                                  : JpegStatus::WriteFailed;
    }


    static JpegStatus write_xmp_app1(FileHandle& dst,
                                     std::string_view packet) noexcept
    {
        if (packet.empty()) {
            return JpegStatus::Ok;
        }
        const uint32_t seg_len = static_cast<uint32_t>(
            2U + kJpegXmpSignature.size() + packet.size());
        const std::array<uint8_t, 4> head = {
            0xFF,
            0xE1,
            static_cast<uint8_t>((seg_len >> 8) & 0xFFU),
            static_cast<uint8_t>(seg_len & 0xFFU),
        };
        JpegStatus st = write_bytes(dst, head.data(), head.size());
        if (st != JpegStatus::Ok) {
            return st;
        }
        st = write_bytes(dst, kJpegXmpSignature.data(),
                         kJpegXmpSignature.size());
        if (st != JpegStatus::Ok) {
            return st;
        }
        return write_bytes(dst, packet.data(), packet.size());
    }


    static JpegStatus copy_range(FileHandle& src, FileHandle& dst,
                                 uint64_t offset, uint64_t size,
                                 const StreamCopyOptions& options) noexcept
    {
        if (src.seek(offset) != FileStatus::Ok) {
            return JpegStatus::ReadFailed;
        }
        const StreamCopyResult r = copy_n(src, dst, size, options);
        switch (r.status) {
        case StreamStatus::Ok: return JpegStatus::Ok;
        case StreamStatus::WriteFailed: return JpegStatus::WriteFailed;
        case StreamStatus::ShortRead: return JpegStatus::Malformed;
        default: return JpegStatus::ReadFailed;
        }
    }

}  // namespace

JpegScanResult
scan_jpeg_header(FileHandle& file, const JpegScanLimits& limits) noexcept
{
    JpegScanResult result;

    if (file.size(&result.file_size) != FileStatus::Ok) {
        result.status = JpegStatus::ReadFailed;
        return result;
    }
    const uint64_t size = result.file_size;
    if (size < 2) {
        result.status = JpegStatus::Malformed;
        return result;
    }

    std::array<std::byte, 2> two {};
    result.status = read_at(file, 0, std::span<std::byte>(two));
    if (result.status != JpegStatus::Ok) {
        return result;
    }
    if (u8(two[0]) != 0xFF || u8(two[1]) != 0xD8) {
        result.status = JpegStatus::Unsupported;
        return result;
    }

    uint64_t offset = 2;
    std::array<std::byte, 1> one {};
    while (offset + 2 <= size) {
        result.status = read_at(file, offset, std::span<std::byte>(one));
        if (result.status != JpegStatus::Ok) {
            return result;
        }
        if (u8(one[0]) != 0xFF) {
            result.status = JpegStatus::Malformed;
            return result;
        }

        // Skip fill bytes; the last 0xFF belongs to the marker.
        while (offset < size && u8(one[0]) == 0xFF) {
            offset += 1;
            if (offset >= size) {
                break;
            }
            result.status = read_at(file, offset, std::span<std::byte>(one));
            if (result.status != JpegStatus::Ok) {
                return result;
            }
        }
        if (offset >= size) {
            break;
        }

        const uint64_t marker_off = offset - 1;
        const uint8_t marker      = u8(one[0]);
        offset += 1;

        if (marker == 0xD9 || marker == 0xDA) {
            result.header_end = marker_off;
            return result;
        }

        if (result.segments.size() >= limits.max_segments) {
            result.status = JpegStatus::LimitExceeded;
            return result;
        }

        JpegSegmentRef seg;
        seg.marker = marker;
        seg.offset = marker_off;

        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) {
            seg.size        = 2;
            seg.data_offset = offset;
            result.segments.push_back(seg);
            continue;
        }

        result.status = read_at(file, offset, std::span<std::byte>(two));
        if (result.status != JpegStatus::Ok) {
            return result;
        }
        const uint16_t seg_len = static_cast<uint16_t>(
            (static_cast<uint16_t>(u8(two[0])) << 8) | u8(two[1]));
        if (seg_len < 2) {
            result.status = JpegStatus::Malformed;
            return result;
        }
        seg.size        = 2U + static_cast<uint64_t>(seg_len);
        seg.data_offset = offset + 2;
        seg.data_size   = static_cast<uint64_t>(seg_len - 2);
        if (seg.offset + seg.size > size) {
            result.status = JpegStatus::Malformed;
            return result;
        }

        if (marker == 0xE0) {
            seg.kind = JpegSegmentKind::Jfif;
        } else if (marker == 0xE1) {
            seg.kind = classify_app1(file, seg.data_offset, seg.data_size,
                                     &result.status);
            if (result.status != JpegStatus::Ok) {
                return result;
            }
            if (seg.kind == JpegSegmentKind::Xmp) {
                seg.data_offset += kJpegXmpSignature.size();
                seg.data_size -= kJpegXmpSignature.size();
            }
        }
        result.segments.push_back(seg);
        offset = seg.offset + seg.size;
    }

    result.header_end = offset < size ? offset : size;
    return result;
}


int32_t
find_xmp_segment(const JpegScanResult& scan) noexcept
{
    for (size_t i = 0; i < scan.segments.size(); ++i) {
        if (scan.segments[i].kind == JpegSegmentKind::Xmp) {
            return static_cast<int32_t>(i);
        }
    }
    return -1;
}


JpegStatus
read_segment_data(FileHandle& file, const JpegSegmentRef& segment,
                  std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return JpegStatus::ReadFailed;
    }
    out->assign(static_cast<size_t>(segment.data_size), std::byte { 0 });
    if (out->empty()) {
        return JpegStatus::Ok;
    }
    return read_at(file, segment.data_offset,
                   std::span<std::byte>(out->data(), out->size()));
}


JpegStatus
rewrite_jpeg_xmp(FileHandle& src, const JpegScanResult& scan,
                 std::string_view xmp_packet, FileHandle& dst,
                 const StreamCopyOptions& options) noexcept
{
    if (scan.status != JpegStatus::Ok) {
        return scan.status;
    }
    if (kJpegXmpSignature.size() + xmp_packet.size()
        > kJpegMaxSegmentPayload) {
        return JpegStatus::LimitExceeded;
    }

    const std::array<uint8_t, 2> soi = { 0xFF, 0xD8 };
    JpegStatus st = write_bytes(dst, soi.data(), soi.size());
    if (st != JpegStatus::Ok) {
        return st;
    }

    bool inserted = false;
    for (const JpegSegmentRef& seg : scan.segments) {
        if (seg.kind == JpegSegmentKind::Xmp
            || seg.kind == JpegSegmentKind::XmpExtended) {
            continue;
        }
        if (!inserted && seg.kind != JpegSegmentKind::Jfif
            && seg.kind != JpegSegmentKind::Exif) {
            st = write_xmp_app1(dst, xmp_packet);
            if (st != JpegStatus::Ok) {
                return st;
            }
            inserted = true;
        }
        st = copy_range(src, dst, seg.offset, seg.size, options);
        if (st != JpegStatus::Ok) {
            return st;
        }
    }
    if (!inserted) {
        st = write_xmp_app1(dst, xmp_packet);
        if (st != JpegStatus::Ok) {
            return st;
        }
    }

    if (src.seek(scan.header_end) != FileStatus::Ok) {
        return JpegStatus::ReadFailed;
    }
    const StreamCopyResult tail = copy_all(src, dst, options);
    if (tail.status == StreamStatus::WriteFailed) {
        return JpegStatus::WriteFailed;
    }
    return tail.status == StreamStatus::Ok ? JpegStatus::Ok
                                           : JpegStatus::ReadFailed;
}


const char*
jpeg_status_name(JpegStatus status) noexcept
{
    switch (status) {
    case JpegStatus::Ok: return "ok";
    case JpegStatus::ReadFailed: return "read_failed";
    case JpegStatus::WriteFailed: return "write_failed";
    case JpegStatus::Unsupported: return "unsupported";
    case JpegStatus::Malformed: return "malformed";
    case JpegStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace livephoto
