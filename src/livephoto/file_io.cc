#include "livephoto/file_io.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace livephoto {

FileHandle::FileHandle() noexcept = default;


FileHandle::~FileHandle() noexcept
{
    (void)close();
}


FileHandle::FileHandle(FileHandle&& other) noexcept
{
    *this = std::move(other);
}


FileHandle&
FileHandle::operator=(FileHandle&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    (void)close();

    fd_       = other.fd_;
    other.fd_ = -1;
    return *this;
}


FileStatus
FileHandle::open(const char* path, FileMode mode) noexcept
{
    (void)close();

    if (!path || !*path) {
        return FileStatus::OpenFailed;
    }

    int flags = O_RDONLY;
    switch (mode) {
    case FileMode::Read: flags = O_RDONLY; break;
    case FileMode::Create: flags = O_WRONLY | O_CREAT | O_TRUNC; break;
    case FileMode::Append: flags = O_WRONLY | O_CREAT | O_APPEND; break;
    }
#if defined(O_CLOEXEC)
    flags |= O_CLOEXEC;
#endif

    int fd = -1;
    do {
        fd = ::open(path, flags, 0644);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return FileStatus::OpenFailed;
    }

    fd_ = fd;
    return FileStatus::Ok;
}


FileStatus
FileHandle::open_temp(const char* target, std::string* path_out) noexcept
{
    (void)close();

    if (!target || !*target || !path_out) {
        return FileStatus::OpenFailed;
    }

    std::string name(target);
    name.append(".XXXXXX");
    int fd = -1;
    do {
        fd = ::mkstemp(name.data());
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        return FileStatus::OpenFailed;
    }
#if defined(FD_CLOEXEC)
    (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
#endif

    fd_       = fd;
    *path_out = std::move(name);
    return FileStatus::Ok;
}


FileStatus
FileHandle::copy_mode_from(const FileHandle& source) noexcept
{
    if (fd_ < 0 || source.fd_ < 0) {
        return FileStatus::ModeFailed;
    }
    struct stat st {};
    if (::fstat(source.fd_, &st) != 0) {
        return FileStatus::StatFailed;
    }
    if (::fchmod(fd_, st.st_mode & 07777) != 0) {
        return FileStatus::ModeFailed;
    }
    return FileStatus::Ok;
}


bool
FileHandle::close() noexcept
{
    if (fd_ < 0) {
        return true;
    }
    const int rc = ::close(fd_);
    fd_          = -1;
    return rc == 0;
}


bool
FileHandle::is_open() const noexcept
{
    return fd_ >= 0;
}


FileStatus
FileHandle::size(uint64_t* out) const noexcept
{
    if (fd_ < 0 || !out) {
        return FileStatus::StatFailed;
    }
    struct stat st {};
    if (::fstat(fd_, &st) != 0 || st.st_size < 0) {
        return FileStatus::StatFailed;
    }
    *out = static_cast<uint64_t>(st.st_size);
    return FileStatus::Ok;
}


FileStatus
FileHandle::seek(uint64_t offset) noexcept
{
    if (fd_ < 0) {
        return FileStatus::SeekFailed;
    }
    if (offset > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
        return FileStatus::SeekFailed;
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        return FileStatus::SeekFailed;
    }
    return FileStatus::Ok;
}


FileStatus
FileHandle::read(std::span<std::byte> out, size_t* read) noexcept
{
    if (read) {
        *read = 0;
    }
    if (fd_ < 0 || !read) {
        return FileStatus::ReadFailed;
    }
    if (out.empty()) {
        return FileStatus::Ok;
    }

    ssize_t n = -1;
    do {
        n = ::read(fd_, out.data(), out.size());
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        return FileStatus::ReadFailed;
    }
    *read = static_cast<size_t>(n);
    return FileStatus::Ok;
}


FileStatus
FileHandle::read_full(std::span<std::byte> out, size_t* read) noexcept
{
    if (read) {
        *read = 0;
    }
    if (!read) {
        return FileStatus::ReadFailed;
    }

    size_t total = 0;
    while (total < out.size()) {
        size_t n            = 0;
        const FileStatus st = this->read(out.subspan(total), &n);
        if (st != FileStatus::Ok) {
            *read = total;
            return st;
        }
        if (n == 0) {
            break;
        }
        total += n;
    }
    *read = total;
    return FileStatus::Ok;
}


FileStatus
FileHandle::write(std::span<const std::byte> bytes) noexcept
{
    if (fd_ < 0) {
        return FileStatus::WriteFailed;
    }

    size_t done = 0;
    while (done < bytes.size()) {
        const ssize_t n = ::write(fd_, bytes.data() + done,
                                  bytes.size() - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return FileStatus::WriteFailed;
        }
        if (n == 0) {
            return FileStatus::WriteFailed;
        }
        done += static_cast<size_t>(n);
    }
    return FileStatus::Ok;
}


FileStatus
file_size(const char* path, uint64_t* out) noexcept
{
    if (!path || !*path || !out) {
        return FileStatus::StatFailed;
    }
    struct stat st {};
    if (::stat(path, &st) != 0 || st.st_size < 0) {
        return FileStatus::StatFailed;
    }
    *out = static_cast<uint64_t>(st.st_size);
    return FileStatus::Ok;
}


FileStatus
file_stamp(const char* path, FileStamp* out) noexcept
{
    if (!path || !*path || !out) {
        return FileStatus::StatFailed;
    }
    struct stat st {};
    if (::stat(path, &st) != 0 || st.st_size < 0) {
        return FileStatus::StatFailed;
    }
    out->size     = static_cast<uint64_t>(st.st_size);
    out->mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000
                    + static_cast<int64_t>(st.st_mtim.tv_nsec);
    return FileStatus::Ok;
}

}  // namespace livephoto
