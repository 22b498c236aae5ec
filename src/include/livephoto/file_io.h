#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

/**
 * \file file_io.h
 * \brief Owned POSIX file descriptor used by every copy/scan path.
 */

namespace livephoto {

/// Status code for \ref FileHandle operations.
enum class FileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    ReadFailed,
    WriteFailed,
    SeekFailed,
    ModeFailed,
};

/// How \ref FileHandle::open treats the target path.
enum class FileMode : uint8_t {
    /// Existing file, read-only.
    Read,
    /// Created or truncated, write-only.
    Create,
    /// Created if missing, writes go to the end.
    Append,
};

/**
 * \brief Move-only owner of a file descriptor.
 *
 * The descriptor is closed on destruction, so a copy that fails midway
 * still releases its handles.
 */
class FileHandle final {
public:
    FileHandle() noexcept;
    ~FileHandle() noexcept;

    FileHandle(const FileHandle&)            = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    /// Opens \p path in \p mode (closes any previously owned descriptor).
    FileStatus open(const char* path, FileMode mode) noexcept;

    /**
     * \brief Creates a unique sibling of \p target for writing.
     *
     * The name is `<target>.XXXXXX` expanded by `mkstemp`; the chosen path
     * is stored in \p path_out.
     */
    FileStatus open_temp(const char* target, std::string* path_out) noexcept;

    /// Applies the permission bits of \p source (`st_mode & 07777`).
    FileStatus copy_mode_from(const FileHandle& source) noexcept;

    /// Closes the descriptor (idempotent). Returns false if close reported an error.
    bool close() noexcept;

    bool is_open() const noexcept;

    /// Current size of the file in bytes.
    FileStatus size(uint64_t* out) const noexcept;

    /// Absolute seek from the start of the file.
    FileStatus seek(uint64_t offset) noexcept;

    /// Reads up to `out.size()` bytes; `*read` is 0 at end of file.
    FileStatus read(std::span<std::byte> out, size_t* read) noexcept;

    /// Reads until \p out is full or EOF; `*read` < `out.size()` only at EOF.
    FileStatus read_full(std::span<std::byte> out, size_t* read) noexcept;

    /// Writes all of \p bytes (retries short writes).
    FileStatus write(std::span<const std::byte> bytes) noexcept;

private:
    int fd_ = -1;
};

/// Size of the file at \p path without keeping it open.
FileStatus
file_size(const char* path, uint64_t* out) noexcept;

/// Size and modification time (nanoseconds since the epoch) of \p path.
struct FileStamp final {
    uint64_t size     = 0;
    int64_t mtime_ns = 0;

    bool operator==(const FileStamp&) const = default;
};

FileStatus
file_stamp(const char* path, FileStamp* out) noexcept;

}  // namespace livephoto
