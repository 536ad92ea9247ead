#include "pngshot/file_io.h"

#include <cerrno>
#include <limits>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pngshot {
namespace {

    static bool write_all(int fd, const std::byte* data, size_t size) noexcept
    {
        while (size != 0U) {
            const ssize_t n = ::write(fd, data, size);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            data += n;
            size -= static_cast<size_t>(n);
        }
        return true;
    }

}  // namespace

const char*
file_io_status_name(FileIoStatus status) noexcept
{
    switch (status) {
    case FileIoStatus::Ok: return "ok";
    case FileIoStatus::OpenFailed: return "open_failed";
    case FileIoStatus::StatFailed: return "stat_failed";
    case FileIoStatus::TooLarge: return "too_large";
    case FileIoStatus::ReadFailed: return "read_failed";
    case FileIoStatus::WriteFailed: return "write_failed";
    }
    return "unknown";
}


FileIoStatus
read_file_bytes(const char* path, uint64_t max_file_bytes,
                std::vector<std::byte>* out)
{
    out->clear();
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }

    const int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return FileIoStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        ::close(fd);
        return FileIoStatus::StatFailed;
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return FileIoStatus::OpenFailed;
    }

    const uint64_t size_u64 = static_cast<uint64_t>(st.st_size);
    if ((max_file_bytes != 0U && size_u64 > max_file_bytes)
        || size_u64 > static_cast<uint64_t>(
               std::numeric_limits<size_t>::max())) {
        ::close(fd);
        return FileIoStatus::TooLarge;
    }

    out->resize(static_cast<size_t>(size_u64));
    size_t done = 0;
    while (done < out->size()) {
        const ssize_t n = ::read(fd, out->data() + done, out->size() - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            out->clear();
            return FileIoStatus::ReadFailed;
        }
        if (n == 0) {
            // File shrank underneath us.
            break;
        }
        done += static_cast<size_t>(n);
    }
    out->resize(done);
    ::close(fd);
    return FileIoStatus::Ok;
}


FileIoStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept
{
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }
    const int fd = ::open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                          0644);
    if (fd < 0) {
        return FileIoStatus::OpenFailed;
    }

    bool ok = write_all(fd, bytes.data(), bytes.size());
    if (ok && ::fsync(fd) != 0) {
        ok = false;
    }
    if (::close(fd) != 0) {
        ok = false;
    }
    if (!ok) {
        (void)::unlink(path);
        return FileIoStatus::WriteFailed;
    }
    return FileIoStatus::Ok;
}


bool
remove_file(const char* path) noexcept
{
    if (!path || !*path) {
        return true;
    }
    if (::unlink(path) == 0) {
        return true;
    }
    return errno == ENOENT;
}


bool
file_exists(const char* path) noexcept
{
    if (!path || !*path) {
        return false;
    }
    struct stat st {};
    return ::stat(path, &st) == 0;
}


FileIoStatus
read_file_mtime(const char* path, FileTime* out) noexcept
{
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }
    struct stat st {};
    if (::stat(path, &st) != 0) {
        return FileIoStatus::StatFailed;
    }
    out->seconds     = static_cast<int64_t>(st.st_mtim.tv_sec);
    out->nanoseconds = static_cast<int64_t>(st.st_mtim.tv_nsec);
    return FileIoStatus::Ok;
}


FileIoStatus
set_file_mtime(const char* path, const FileTime& mtime) noexcept
{
    if (!path || !*path) {
        return FileIoStatus::OpenFailed;
    }
    struct timespec times[2];
    times[0].tv_sec  = static_cast<time_t>(mtime.seconds);
    times[0].tv_nsec = static_cast<long>(mtime.nanoseconds);
    times[1]         = times[0];
    if (::utimensat(AT_FDCWD, path, times, 0) != 0) {
        return FileIoStatus::WriteFailed;
    }
    return FileIoStatus::Ok;
}


ScopedTempFile::ScopedTempFile(std::string path) noexcept
    : path_(std::move(path))
{
}


ScopedTempFile::~ScopedTempFile() noexcept
{
    (void)remove();
}


ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : path_(std::move(other.path_))
{
    other.path_.clear();
}


ScopedTempFile&
ScopedTempFile::operator=(ScopedTempFile&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    (void)remove();
    path_ = std::move(other.path_);
    other.path_.clear();
    return *this;
}


bool
ScopedTempFile::remove() noexcept
{
    if (path_.empty()) {
        return true;
    }
    const bool gone = remove_file(path_.c_str());
    if (gone) {
        path_.clear();
    }
    return gone;
}


std::string
ScopedTempFile::release() noexcept
{
    std::string out = std::move(path_);
    path_.clear();
    return out;
}

}  // namespace pngshot
