#pragma once

#include "photoclean/file_cleaner.h"
#include "photoclean/image_codec.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * \file batch_clean.h
 * \brief Directory walk and per-file cleaning for a whole folder.
 */

namespace photoclean {

struct BatchOptions final {
    /// Descend into subdirectories.
    bool recursive = true;
    /// Report candidates only; no file is read or modified.
    bool dry_run = false;
    CleanOptions clean;
};

enum class BatchStatus : uint8_t {
    Ok,
    /// The root is missing, not a directory, or cannot be listed.
    NotADirectory,
};

const char*
batch_status_name(BatchStatus status) noexcept;

struct BatchResult final {
    BatchStatus status  = BatchStatus::Ok;
    uint32_t candidates = 0;
    uint32_t cleaned    = 0;
    uint32_t skipped    = 0;
    uint32_t failed     = 0;
};

/// Receives progress from \ref clean_directory.
class BatchObserver {
public:
    virtual ~BatchObserver() = default;

    /// Called once with the sorted candidate list before any file is touched.
    virtual void on_candidates(const std::vector<std::string>& paths) = 0;
    /// Called before file \p index (0-based) of \p total is processed.
    virtual void on_file(const std::string& path, uint32_t index,
                         uint32_t total)
        = 0;
    /// Called after a file was processed. Never called in dry-run mode.
    virtual void on_outcome(const std::string& path,
                            const CleanOutcome& outcome)
        = 0;
};

/**
 * \brief Collects candidate image files below \p root.
 *
 * Only regular files with a processed extension are returned; symlinks are
 * neither followed nor returned. Unreadable subdirectories are skipped. The
 * result is sorted.
 *
 * \return false when \p root is not a listable directory.
 */
bool
find_image_files(const std::string& root, bool recursive,
                 std::vector<std::string>* out);

/// Cleans every candidate file below \p root. \p observer may be null.
BatchResult
clean_directory(const std::string& root, const ImageCodec& codec,
                const BatchOptions& options, BatchObserver* observer);

}  // namespace photoclean
