#include "livephoto/stream_copy.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace livephoto {
namespace {

    static size_t effective_chunk(const StreamCopyOptions& options) noexcept
    {
        return options.chunk_bytes == 0U ? kDefaultChunkBytes
                                         : options.chunk_bytes;
    }


    static StreamStatus from_file_status(FileStatus status) noexcept
    {
        switch (status) {
        case FileStatus::Ok: return StreamStatus::Ok;
        case FileStatus::OpenFailed: return StreamStatus::OpenFailed;
        case FileStatus::StatFailed:
        case FileStatus::ReadFailed: return StreamStatus::ReadFailed;
        case FileStatus::ModeFailed:
        case FileStatus::WriteFailed: return StreamStatus::WriteFailed;
        case FileStatus::SeekFailed: return StreamStatus::SeekFailed;
        }
        return StreamStatus::ReadFailed;
    }


    // Copies until EOF or until `limit` bytes (when `bounded`).
    static StreamCopyResult copy_loop(FileHandle& src, FileHandle& dst,
                                      bool bounded, uint64_t limit,
                                      const StreamCopyOptions& options) noexcept
    {
        StreamCopyResult result;

        std::vector<std::byte> buffer(effective_chunk(options));

        while (!bounded || result.copied < limit) {
            std::span<std::byte> window(buffer.data(), buffer.size());
            if (bounded) {
                const uint64_t left = limit - result.copied;
                if (left < static_cast<uint64_t>(window.size())) {
                    window = window.first(static_cast<size_t>(left));
                }
            }

            size_t n            = 0;
            const FileStatus rs = src.read(window, &n);
            if (rs != FileStatus::Ok) {
                result.status = from_file_status(rs);
                return result;
            }
            if (n == 0) {
                if (bounded) {
                    result.status = StreamStatus::ShortRead;
                }
                return result;
            }

            const FileStatus ws = dst.write(
                std::span<const std::byte>(buffer.data(), n));
            if (ws != FileStatus::Ok) {
                result.status = StreamStatus::WriteFailed;
                return result;
            }
            result.copied += static_cast<uint64_t>(n);
        }
        return result;
    }

}  // namespace

StreamCopyResult
copy_all(FileHandle& src, FileHandle& dst,
         const StreamCopyOptions& options) noexcept
{
    return copy_loop(src, dst, false, 0, options);
}


StreamCopyResult
copy_n(FileHandle& src, FileHandle& dst, uint64_t n,
       const StreamCopyOptions& options) noexcept
{
    return copy_loop(src, dst, true, n, options);
}


StreamCopyResult
copy_from_offset(FileHandle& src, FileHandle& dst, uint64_t offset,
                 const StreamCopyOptions& options) noexcept
{
    const FileStatus st = src.seek(offset);
    if (st != FileStatus::Ok) {
        StreamCopyResult result;
        result.status = StreamStatus::SeekFailed;
        return result;
    }
    return copy_all(src, dst, options);
}


const char*
stream_status_name(StreamStatus status) noexcept
{
    switch (status) {
    case StreamStatus::Ok: return "ok";
    case StreamStatus::OpenFailed: return "open_failed";
    case StreamStatus::ReadFailed: return "read_failed";
    case StreamStatus::WriteFailed: return "write_failed";
    case StreamStatus::SeekFailed: return "seek_failed";
    case StreamStatus::ShortRead: return "short_read";
    }
    return "unknown";
}

}  // namespace livephoto
