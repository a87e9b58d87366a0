#include "photoclean/batch_clean.h"

#include "photoclean/image_format.h"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace photoclean {
namespace {

    namespace fs = std::filesystem;

    // Shared by the recursive and flat walks; neither throws.
    template<typename Iterator>
    static void collect_entries(Iterator it, std::vector<std::string>* out)
    {
        std::error_code ec;
        while (it != Iterator()) {
            const fs::directory_entry& entry = *it;
            std::error_code st_ec;
            if (!entry.is_symlink(st_ec) && !st_ec
                && entry.is_regular_file(st_ec) && !st_ec) {
                std::string p = entry.path().string();
                if (is_candidate_path(p)) {
                    out->push_back(std::move(p));
                }
            }
            it.increment(ec);
            if (ec) {
                // The iterator is unusable after a failed increment.
                break;
            }
        }
    }

}  // namespace

const char*
batch_status_name(BatchStatus status) noexcept
{
    switch (status) {
    case BatchStatus::Ok: return "ok";
    case BatchStatus::NotADirectory: return "not_a_directory";
    }
    return "unknown";
}


bool
find_image_files(const std::string& root, bool recursive,
                 std::vector<std::string>* out)
{
    out->clear();
    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec) || ec) {
        return false;
    }

    const fs::directory_options opts
        = fs::directory_options::skip_permission_denied;
    if (recursive) {
        fs::recursive_directory_iterator it(root, opts, ec);
        if (ec) {
            return false;
        }
        collect_entries(std::move(it), out);
    } else {
        fs::directory_iterator it(root, opts, ec);
        if (ec) {
            return false;
        }
        collect_entries(std::move(it), out);
    }
    std::sort(out->begin(), out->end());
    return true;
}


BatchResult
clean_directory(const std::string& root, const ImageCodec& codec,
                const BatchOptions& options, BatchObserver* observer)
{
    BatchResult res;
    std::vector<std::string> files;
    if (!find_image_files(root, options.recursive, &files)) {
        res.status = BatchStatus::NotADirectory;
        return res;
    }
    res.candidates = static_cast<uint32_t>(files.size());
    if (observer) {
        observer->on_candidates(files);
    }

    for (uint32_t i = 0; i < res.candidates; ++i) {
        const std::string& path = files[i];
        if (observer) {
            observer->on_file(path, i, res.candidates);
        }
        if (options.dry_run) {
            continue;
        }
        const CleanOutcome outcome = clean_image_file(path.c_str(), codec,
                                                      options.clean);
        switch (outcome.status) {
        case CleanStatus::Cleaned: res.cleaned += 1; break;
        case CleanStatus::Skipped: res.skipped += 1; break;
        case CleanStatus::Failed: res.failed += 1; break;
        }
        if (observer) {
            observer->on_outcome(path, outcome);
        }
    }
    return res;
}

}  // namespace photoclean
