#include "photoclean/file_io.h"

#include <cerrno>
#include <cstdio>
#include <limits>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace photoclean {

const char*
read_file_status_name(ReadFileStatus status) noexcept
{
    switch (status) {
    case ReadFileStatus::Ok: return "ok";
    case ReadFileStatus::OpenFailed: return "open_failed";
    case ReadFileStatus::IoFailed: return "io_failed";
    case ReadFileStatus::TooLarge: return "too_large";
    }
    return "unknown";
}


ReadFileStatus
read_file_bytes(const char* path, std::vector<std::byte>* out,
                uint64_t max_file_bytes, uint64_t* out_size)
{
    out->clear();
    if (out_size) {
        *out_size = 0;
    }
    if (!path || !*path) {
        return ReadFileStatus::OpenFailed;
    }
    std::FILE* f = std::fopen(path, "rb");
    if (!f) {
        return ReadFileStatus::OpenFailed;
    }

    if (std::fseek(f, 0, SEEK_END) != 0) {
        std::fclose(f);
        return ReadFileStatus::IoFailed;
    }
    const long end = std::ftell(f);
    if (end < 0) {
        std::fclose(f);
        return ReadFileStatus::IoFailed;
    }
    if (std::fseek(f, 0, SEEK_SET) != 0) {
        std::fclose(f);
        return ReadFileStatus::IoFailed;
    }

    const uint64_t size_u64 = static_cast<uint64_t>(end);
    if (out_size) {
        *out_size = size_u64;
    }
    if ((max_file_bytes != 0U && size_u64 > max_file_bytes)
        || size_u64 > static_cast<uint64_t>(
               std::numeric_limits<size_t>::max())) {
        std::fclose(f);
        return ReadFileStatus::TooLarge;
    }

    const size_t size = static_cast<size_t>(size_u64);
    out->resize(size);
    if (size != 0) {
        const size_t read = std::fread(out->data(), 1, size, f);
        if (read != size) {
            std::fclose(f);
            out->clear();
            return ReadFileStatus::IoFailed;
        }
    }
    std::fclose(f);
    return ReadFileStatus::Ok;
}


const char*
temp_file_status_name(TempFileStatus status) noexcept
{
    switch (status) {
    case TempFileStatus::Ok: return "ok";
    case TempFileStatus::NotOpen: return "not_open";
    case TempFileStatus::CreateFailed: return "create_failed";
    case TempFileStatus::WriteFailed: return "write_failed";
    case TempFileStatus::StatFailed: return "stat_failed";
    case TempFileStatus::ChmodFailed: return "chmod_failed";
    case TempFileStatus::SyncFailed: return "sync_failed";
    case TempFileStatus::RenameFailed: return "rename_failed";
    }
    return "unknown";
}


TempFile::TempFile() noexcept = default;


TempFile::~TempFile() noexcept
{
    discard();
}


TempFile::TempFile(TempFile&& other) noexcept
{
    *this = std::move(other);
}


TempFile&
TempFile::operator=(TempFile&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    discard();

    fd_         = other.fd_;
    path_       = std::move(other.path_);
    other.fd_   = -1;
    other.path_.clear();
    return *this;
}


TempFileStatus
TempFile::create_beside(const char* target_path)
{
    discard();
    if (!target_path || !*target_path) {
        return TempFileStatus::CreateFailed;
    }

    const std::string target(target_path);
    const size_t sep = target.find_last_of('/');
    std::string templ;
    if (sep != std::string::npos) {
        templ.assign(target, 0, sep + 1);
    }
    templ.append(".photoclean-XXXXXX");

    const int fd = ::mkstemp(templ.data());
    if (fd < 0) {
        return TempFileStatus::CreateFailed;
    }
    fd_   = fd;
    path_ = std::move(templ);
    return TempFileStatus::Ok;
}


TempFileStatus
TempFile::write_all(std::span<const std::byte> bytes) noexcept
{
    if (fd_ < 0) {
        return TempFileStatus::NotOpen;
    }
    size_t offset = 0;
    while (offset < bytes.size()) {
        const ssize_t n = ::write(fd_, bytes.data() + offset,
                                  bytes.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return TempFileStatus::WriteFailed;
        }
        if (n == 0) {
            return TempFileStatus::WriteFailed;
        }
        offset += static_cast<size_t>(n);
    }
    return TempFileStatus::Ok;
}


TempFileStatus
TempFile::copy_mode_from(const char* path) noexcept
{
    if (fd_ < 0) {
        return TempFileStatus::NotOpen;
    }
    struct stat st {};
    if (!path || ::stat(path, &st) != 0) {
        return TempFileStatus::StatFailed;
    }
    if (::fchmod(fd_, st.st_mode & 07777) != 0) {
        return TempFileStatus::ChmodFailed;
    }
    return TempFileStatus::Ok;
}


TempFileStatus
TempFile::commit_replace(const char* target_path) noexcept
{
    if (fd_ < 0) {
        return TempFileStatus::NotOpen;
    }
    if (::fsync(fd_) != 0) {
        discard();
        return TempFileStatus::SyncFailed;
    }
    const int fd = fd_;
    fd_          = -1;
    if (::close(fd) != 0) {
        discard();
        return TempFileStatus::SyncFailed;
    }
    if (!target_path || ::rename(path_.c_str(), target_path) != 0) {
        discard();
        return TempFileStatus::RenameFailed;
    }
    path_.clear();
    return TempFileStatus::Ok;
}


void
TempFile::discard() noexcept
{
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
    if (!path_.empty()) {
        (void)::unlink(path_.c_str());
        path_.clear();
    }
}


bool
TempFile::is_open() const noexcept
{
    return fd_ >= 0;
}


const std::string&
TempFile::path() const noexcept
{
    return path_;
}

}  // namespace photoclean
