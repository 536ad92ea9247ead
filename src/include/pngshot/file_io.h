#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file file_io.h
 * \brief Whole-file read/write, modification times and scoped temporaries.
 */

namespace pngshot {

/// Status code for file helpers.
enum class FileIoStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    TooLarge,
    ReadFailed,
    WriteFailed,
};

const char*
file_io_status_name(FileIoStatus status) noexcept;

/// Seconds/nanoseconds since the epoch.
struct FileTime final {
    int64_t seconds     = 0;
    int64_t nanoseconds = 0;
};

/// Reads all of \p path into \p out. \p max_file_bytes is a hard cap (0 = unlimited).
FileIoStatus
read_file_bytes(const char* path, uint64_t max_file_bytes,
                std::vector<std::byte>* out);

/**
 * \brief Creates/truncates \p path and writes \p bytes, then fsyncs.
 *
 * On failure the partially written file is removed.
 */
FileIoStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept;

/// Removes \p path. Returns true if it is gone afterwards.
bool
remove_file(const char* path) noexcept;

bool
file_exists(const char* path) noexcept;

FileIoStatus
read_file_mtime(const char* path, FileTime* out) noexcept;

/// Sets both access and modification time of \p path to \p mtime.
FileIoStatus
set_file_mtime(const char* path, const FileTime& mtime) noexcept;

/**
 * \brief Owns a temporary file path; removes the file when destroyed.
 *
 * Holding the path does not create the file. Call \ref release to keep it.
 */
class ScopedTempFile final {
public:
    ScopedTempFile() noexcept = default;
    explicit ScopedTempFile(std::string path) noexcept;
    ~ScopedTempFile() noexcept;

    ScopedTempFile(const ScopedTempFile&)            = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    ScopedTempFile(ScopedTempFile&& other) noexcept;
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

    const std::string& path() const noexcept { return path_; }
    bool empty() const noexcept { return path_.empty(); }

    /// Removes the file now (idempotent). Returns true if it is gone.
    bool remove() noexcept;

    /// Stops tracking the file without removing it.
    std::string release() noexcept;

private:
    std::string path_;
};

}  // namespace pngshot
