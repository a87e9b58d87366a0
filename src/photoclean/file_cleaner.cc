#include "photoclean/file_cleaner.h"

#include "photoclean/file_io.h"
#include "photoclean/metadata_scan.h"

#include <string_view>
#include <vector>

namespace photoclean {
namespace {

    static constexpr size_t kMaxScannedBlocks = 64;

    static void set_failure(CleanOutcome* out, CleanStatus status,
                            CleanError error, std::string_view what,
                            std::string_view why)
    {
        out->status = status;
        out->error  = error;
        out->detail.assign(what.data(), what.size());
        if (!why.empty()) {
            out->detail.append(": ");
            out->detail.append(why.data(), why.size());
        }
    }

}  // namespace

const char*
clean_status_name(CleanStatus status) noexcept
{
    switch (status) {
    case CleanStatus::Cleaned: return "cleaned";
    case CleanStatus::Skipped: return "skipped";
    case CleanStatus::Failed: return "failed";
    }
    return "unknown";
}


const char*
clean_error_name(CleanError error) noexcept
{
    switch (error) {
    case CleanError::None: return "none";
    case CleanError::Read: return "read";
    case CleanError::Unidentifiable: return "unidentifiable";
    case CleanError::Unsupported: return "unsupported";
    case CleanError::Decode: return "decode";
    case CleanError::Encode: return "encode";
    case CleanError::Replace: return "replace";
    }
    return "unknown";
}


CleanOutcome
clean_image_file(const char* path, const ImageCodec& codec,
                 const CleanOptions& options)
{
    CleanOutcome out;

    std::vector<std::byte> raw;
    const ReadFileStatus rs = read_file_bytes(path, &raw,
                                              options.max_file_bytes,
                                              &out.input_size);
    if (rs != ReadFileStatus::Ok) {
        set_failure(&out, CleanStatus::Failed, CleanError::Read,
                    rs == ReadFileStatus::TooLarge ? "file exceeds size limit"
                                                   : "cannot read file",
                    read_file_status_name(rs));
        return out;
    }
    const std::span<const std::byte> raw_bytes(raw.data(), raw.size());

    std::vector<MetadataBlock> blocks(kMaxScannedBlocks);
    const ScanResult scan = scan_metadata(raw_bytes, blocks);
    out.metadata_blocks   = scan.needed;

    const std::string_view ext = path_extension(path ? path : "");
    const TrimResult trim      = trim_trailing_data(raw_bytes, ext);
    out.trim_status            = trim.status;
    out.trimmed_bytes          = trim.removed;

    PixelImage image;
    const DecodeResult dec = codec.decode(trim.bytes, options.limits, &image);
    out.input_format       = dec.format;
    switch (dec.status) {
    case DecodeStatus::Ok: break;
    case DecodeStatus::Unidentifiable:
        set_failure(&out, CleanStatus::Skipped, CleanError::Unidentifiable,
                    "not a recognized image", dec.message);
        return out;
    case DecodeStatus::Unsupported:
        set_failure(&out, CleanStatus::Skipped, CleanError::Unsupported,
                    "no decoder for format", dec.message);
        return out;
    case DecodeStatus::Malformed:
    case DecodeStatus::LimitExceeded:
        set_failure(&out, CleanStatus::Failed, CleanError::Decode,
                    decode_status_name(dec.status), dec.message);
        return out;
    }

    out.output_format = (dec.format != ImageFormat::Unknown)
                            ? dec.format
                            : fallback_output_format(ext);

    TempFile temp;
    const TempFileStatus cs = temp.create_beside(path);
    if (cs != TempFileStatus::Ok) {
        set_failure(&out, CleanStatus::Failed, CleanError::Encode,
                    "cannot create temporary file", temp_file_status_name(cs));
        return out;
    }

    std::vector<std::byte> encoded;
    const EncodeResult enc = codec.encode(image, out.output_format,
                                          options.encode, &encoded);
    if (enc.status != EncodeStatus::Ok) {
        set_failure(&out, CleanStatus::Failed, CleanError::Encode,
                    encode_status_name(enc.status), enc.message);
        return out;
    }
    if (encoded.empty()) {
        set_failure(&out, CleanStatus::Failed, CleanError::Encode,
                    "encoder produced no data", {});
        return out;
    }

    const TempFileStatus ws = temp.write_all(
        std::span<const std::byte>(encoded.data(), encoded.size()));
    if (ws != TempFileStatus::Ok) {
        set_failure(&out, CleanStatus::Failed, CleanError::Encode,
                    "cannot write temporary file", temp_file_status_name(ws));
        return out;
    }

    const TempFileStatus ms = temp.copy_mode_from(path);
    if (ms != TempFileStatus::Ok) {
        set_failure(&out, CleanStatus::Failed, CleanError::Replace,
                    "cannot copy permissions", temp_file_status_name(ms));
        return out;
    }
    const TempFileStatus rps = temp.commit_replace(path);
    if (rps != TempFileStatus::Ok) {
        set_failure(&out, CleanStatus::Failed, CleanError::Replace,
                    "cannot replace original", temp_file_status_name(rps));
        return out;
    }

    out.status      = CleanStatus::Cleaned;
    out.error       = CleanError::None;
    out.output_size = static_cast<uint64_t>(encoded.size());
    return out;
}

}  // namespace photoclean
