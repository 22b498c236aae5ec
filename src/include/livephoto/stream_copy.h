#pragma once

#include "livephoto/file_io.h"

#include <cstddef>
#include <cstdint>

/**
 * \file stream_copy.h
 * \brief Chunked copy primitives shared by every export path.
 */

namespace livephoto {

/// Default chunk size for copy and scan loops (16 KiB).
static constexpr size_t kDefaultChunkBytes = 16U * 1024U;

/// Copy result status.
enum class StreamStatus : uint8_t {
    Ok,
    OpenFailed,
    ReadFailed,
    WriteFailed,
    SeekFailed,
    /// \ref copy_n reached end of file before `n` bytes were copied.
    ShortRead,
};

struct StreamCopyOptions final {
    /// Bytes per read/write round trip (0 selects \ref kDefaultChunkBytes).
    size_t chunk_bytes = kDefaultChunkBytes;
};

struct StreamCopyResult final {
    StreamStatus status = StreamStatus::Ok;
    /// Bytes written to the destination before the call returned.
    uint64_t copied = 0;
};

/**
 * \brief Copies from the current read position of \p src to end of file.
 *
 * Output already written when a failure occurs is left in place.
 */
StreamCopyResult
copy_all(FileHandle& src, FileHandle& dst,
         const StreamCopyOptions& options = StreamCopyOptions {}) noexcept;

/**
 * \brief Copies exactly \p n bytes.
 *
 * Never reads past the `n`-byte boundary, so \p src is positioned exactly
 * after the copied range on success.
 */
StreamCopyResult
copy_n(FileHandle& src, FileHandle& dst, uint64_t n,
       const StreamCopyOptions& options = StreamCopyOptions {}) noexcept;

/// Seeks \p src to the absolute \p offset, then \ref copy_all.
StreamCopyResult
copy_from_offset(FileHandle& src, FileHandle& dst, uint64_t offset,
                 const StreamCopyOptions& options
                 = StreamCopyOptions {}) noexcept;

/// Short lowercase name for logs/tool output.
const char*
stream_status_name(StreamStatus status) noexcept;

}  // namespace livephoto
