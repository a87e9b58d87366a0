#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file file_io.h
 * \brief Whole-file reads and scoped replacement files.
 */

namespace photoclean {

/// Status code for \ref read_file_bytes.
enum class ReadFileStatus : uint8_t {
    Ok,
    OpenFailed,
    IoFailed,
    TooLarge,
};

const char*
read_file_status_name(ReadFileStatus status) noexcept;

/**
 * \brief Reads all of \p path into \p out.
 *
 * \p max_file_bytes is a hard cap (0 = unlimited). \p out_size (optional)
 * receives the on-disk size even when the read is refused as too large.
 */
ReadFileStatus
read_file_bytes(const char* path, std::vector<std::byte>* out,
                uint64_t max_file_bytes, uint64_t* out_size);


/// Status code for \ref TempFile operations.
enum class TempFileStatus : uint8_t {
    Ok,
    NotOpen,
    CreateFailed,
    WriteFailed,
    StatFailed,
    ChmodFailed,
    SyncFailed,
    RenameFailed,
};

const char*
temp_file_status_name(TempFileStatus status) noexcept;

/**
 * \brief A temporary file created beside the file it will replace.
 *
 * The file lives in the target's directory so the final rename never crosses
 * a filesystem. Unless \ref commit_replace succeeds, the file is removed when
 * the object is destroyed or \ref discard is called.
 */
class TempFile final {
public:
    TempFile() noexcept;
    ~TempFile() noexcept;

    TempFile(const TempFile&)            = delete;
    TempFile& operator=(const TempFile&) = delete;

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;

    /// Creates `<dir of target>/.photoclean-XXXXXX` (mode 0600).
    TempFileStatus create_beside(const char* target_path);

    /// Appends \p bytes, retrying short writes.
    TempFileStatus write_all(std::span<const std::byte> bytes) noexcept;

    /// Copies the permission bits of \p path onto the temp file.
    TempFileStatus copy_mode_from(const char* path) noexcept;

    /**
     * \brief Flushes, closes and renames the temp file over \p target_path.
     *
     * On failure the temp file is removed and the target is left as it was.
     */
    TempFileStatus commit_replace(const char* target_path) noexcept;

    /// Closes and removes the temp file (idempotent).
    void discard() noexcept;

    bool is_open() const noexcept;
    const std::string& path() const noexcept;

private:
    int fd_ = -1;
    std::string path_;
};

}  // namespace photoclean
