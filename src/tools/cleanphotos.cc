#include "photoclean/batch_clean.h"
#include "photoclean/build_info.h"
#include "photoclean/console_format.h"
#include "photoclean/file_cleaner.h"
#include "photoclean/image_codec.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace photoclean {
namespace {

    static constexpr uint32_t kMaxPathChars = 4096;

    static std::string console_path(std::string_view path)
    {
        std::string s;
        (void)append_console_escaped_ascii(path, kMaxPathChars, &s);
        return s;
    }

    class ToolObserver final : public BatchObserver {
    public:
        ToolObserver(std::string folder, bool verbose, bool dry_run,
                     bool progress) noexcept
            : folder_(std::move(folder))
            , verbose_(verbose)
            , dry_run_(dry_run)
            , progress_(progress)
        {
        }

        void on_candidates(const std::vector<std::string>& paths) override
        {
            if (paths.empty()) {
                std::printf("no image files found in %s\n", folder_.c_str());
            } else {
                std::printf("found %zu image file(s) under %s\n",
                            paths.size(), folder_.c_str());
            }
            std::fflush(stdout);
        }

        void on_file(const std::string& path, uint32_t index,
                     uint32_t total) override
        {
            if (dry_run_) {
                std::printf("[dry-run] would clean: %s\n",
                            console_path(path).c_str());
                return;
            }
            if (verbose_) {
                std::printf("processing: %s\n", console_path(path).c_str());
            }
            if (progress_) {
                std::fprintf(stderr, "\rcleaning %u/%u", index + 1U, total);
                std::fflush(stderr);
                progress_line_ = true;
            }
        }

        void on_outcome(const std::string& path,
                        const CleanOutcome& outcome) override
        {
            if (outcome.status == CleanStatus::Cleaned) {
                if (verbose_) {
                    print_cleaned(path, outcome);
                }
                return;
            }
            end_progress_line();
            const char* what = (outcome.status == CleanStatus::Skipped)
                                   ? "skipping"
                                   : "failed to clean";
            std::fprintf(stderr, "cleanphotos: %s `%s` (%s): %s\n", what,
                         console_path(path).c_str(),
                         clean_error_name(outcome.error),
                         outcome.detail.c_str());
        }

        void end_progress_line() noexcept
        {
            if (progress_line_) {
                std::fputc('\n', stderr);
                progress_line_ = false;
            }
        }

    private:
        static void print_cleaned(const std::string& path,
                                  const CleanOutcome& outcome)
        {
            std::string before;
            std::string after;
            std::string trimmed;
            append_byte_size(outcome.input_size, &before);
            append_byte_size(outcome.output_size, &after);
            append_byte_size(outcome.trimmed_bytes, &trimmed);
            std::printf("cleaned: %s [%s] %s -> %s, %u metadata block(s), "
                        "%s trailing data removed\n",
                        console_path(path).c_str(),
                        image_format_name(outcome.output_format),
                        before.c_str(), after.c_str(),
                        outcome.metadata_blocks, trimmed.c_str());
        }

        std::string folder_;
        bool verbose_       = false;
        bool dry_run_       = false;
        bool progress_      = false;
        bool progress_line_ = false;
    };


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || *s == '-') {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static void trim_whitespace(std::string* s)
    {
        const char* ws   = " \t\r\n";
        const size_t beg = s->find_first_not_of(ws);
        if (beg == std::string::npos) {
            s->clear();
            return;
        }
        const size_t end = s->find_last_not_of(ws);
        *s               = s->substr(beg, end - beg + 1);
    }

    static bool prompt_folder(std::string* out)
    {
        out->clear();
        std::printf("Enter the full path to the folder containing your "
                    "photos: ");
        std::fflush(stdout);
        for (;;) {
            const int c = std::fgetc(stdin);
            if (c == EOF) {
                if (out->empty()) {
                    return false;
                }
                break;
            }
            if (c == '\n') {
                break;
            }
            out->push_back(static_cast<char>(c));
        }
        trim_whitespace(out);
        return !out->empty();
    }

    // `~` and `~/rest` expand to $HOME; `~user` forms are left as-is.
    static std::string expand_home(const std::string& path)
    {
        if (path.empty() || path[0] != '~') {
            return path;
        }
        if (path.size() > 1 && path[1] != '/') {
            return path;
        }
        const char* home = std::getenv("HOME");
        if (!home || !*home) {
            return path;
        }
        std::string out(home);
        out.append(path, 1, std::string::npos);
        return out;
    }

    static std::string resolve_folder(const std::string& path)
    {
        std::error_code ec;
        const std::filesystem::path p = std::filesystem::weakly_canonical(
            std::filesystem::path(path), ec);
        if (ec || p.empty()) {
            return path;
        }
        return p.string();
    }

    static void usage(const char* argv0)
    {
        const BuildInfo& bi = build_info();
        std::string formats;
        format_supported_formats(bi, &formats);
        std::printf("usage: %s [options] [folder]\n", argv0);
        std::printf("Removes metadata and trailing data from %s images in "
                    "place.\n",
                    formats.c_str());
        if (!bi.has_gif || !bi.has_tiff || !bi.has_webp) {
            std::printf("Images in other formats are reported as skipped.\n");
        }
        std::printf("options:\n");
        std::printf("  -r, --recursive       search subfolders (default)\n");
        std::printf("  --no-recursive        only the top-level folder\n");
        std::printf("  -n, --dry-run         list files that would be cleaned; modify nothing\n");
        std::printf("  -v, --verbose         print each file and its result\n");
        std::printf(
            "  --max-file-bytes N    refuse to read files larger than N bytes (default: 536870912; 0=unlimited)\n");
        std::printf("  --version             print build info and exit\n");
        std::printf("  --no-build-info       hide build info header\n");
        std::printf("  --help                show this help\n");
        std::printf("If no folder is given, it is read from standard input.\n");
    }

    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }

}  // namespace
}  // namespace photoclean

int
main(int argc, char** argv)
{
    using namespace photoclean;

    bool show_build_info = true;
    bool verbose         = false;
    BatchOptions options;
    const char* folder_arg = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            continue;
        }
        if (std::strcmp(arg, "-r") == 0
            || std::strcmp(arg, "--recursive") == 0) {
            options.recursive = true;
            continue;
        }
        if (std::strcmp(arg, "--no-recursive") == 0) {
            options.recursive = false;
            continue;
        }
        if (std::strcmp(arg, "-n") == 0 || std::strcmp(arg, "--dry-run") == 0) {
            options.dry_run = true;
            continue;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0) {
            uint64_t v = 0;
            if (i + 1 >= argc || !parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr,
                             "cleanphotos: invalid --max-file-bytes value\n");
                return 2;
            }
            options.clean.max_file_bytes = v;
            i += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "cleanphotos: unknown option `%s`\n", arg);
            usage(argv[0]);
            return 2;
        }
        if (folder_arg) {
            std::fprintf(stderr, "cleanphotos: more than one folder given\n");
            usage(argv[0]);
            return 2;
        }
        folder_arg = arg;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    std::string folder;
    if (folder_arg) {
        folder = folder_arg;
    } else if (!prompt_folder(&folder)) {
        std::fprintf(stderr, "cleanphotos: no folder given\n");
        return 2;
    }
    folder = resolve_folder(expand_home(folder));
    const std::string shown = console_path(folder);

    const bool progress = !verbose && !options.dry_run
                          && ::isatty(STDERR_FILENO) == 1;
    ToolObserver observer(shown, verbose, options.dry_run, progress);
    const BatchResult res = clean_directory(folder, default_image_codec(),
                                            options, &observer);
    observer.end_progress_line();
    if (res.status != BatchStatus::Ok) {
        std::fprintf(stderr,
                     "cleanphotos: `%s` is not a readable directory\n",
                     shown.c_str());
        return 1;
    }
    if (res.candidates == 0U) {
        return 0;
    }

    std::printf("\nsummary\n");
    if (options.dry_run) {
        std::printf("  candidates: %u\n", res.candidates);
        std::printf("\nthis was a dry run; no files were modified.\n");
        return 0;
    }
    std::printf("  cleaned: %u\n", res.cleaned);
    std::printf("  skipped: %u\n", res.skipped);
    if (res.failed != 0U) {
        std::printf("  failed:  %u\n", res.failed);
    } else {
        std::printf("  no errors encountered.\n");
    }
    return 0;
}
