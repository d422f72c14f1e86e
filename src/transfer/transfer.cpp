#include "transfer.hpp"
#include <core/checksum.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <vector>

TransferOptions TransferOptions::from_config(const TransferConfig& cfg) {
    TransferOptions opts;
    opts.chunk_bytes = static_cast<uint64_t>(cfg.chunk_mb) * MB;
    opts.verify = cfg.verify;
    opts.retry.max_attempts = cfg.max_attempts;
    opts.retry.base_delay = std::chrono::milliseconds(cfg.backoff_ms);
    opts.retry.backoff = Backoff::LINEAR;
    return opts;
}

std::string upload_temp_path(const std::string& remote_path) {
    return remote_path + UPLOAD_TEMP_SUFFIX;
}

fs::path download_temp_path(const fs::path& local) {
    fs::path p = local;
    p += DOWNLOAD_TEMP_SUFFIX;
    return p;
}

// ── Upload ──────────────────────────────────────────────────

// Offset to resume from: the checkpoint size if its bytes match the local
// prefix, otherwise 0 after discarding the checkpoint.
static Result<uint64_t> verified_checkpoint(RemoteChannel& channel, const fs::path& local,
                                            uint64_t local_size, const std::string& temp) {
    auto temp_size = channel.stat_size(temp);
    if (temp_size.is_err()) return Result<uint64_t>::Err(temp_size.error);
    if (!temp_size.value || *temp_size.value == 0) return Result<uint64_t>::Ok(0);

    uint64_t have = *temp_size.value;
    bool keep = false;
    if (have <= local_size) {
        auto local_md5 = compute_file_md5(local, have);
        if (local_md5.is_err()) return Result<uint64_t>::Err(local_md5.error);
        auto remote_md5 = channel.md5(temp, have);
        if (remote_md5.is_err()) return Result<uint64_t>::Err(remote_md5.error);
        keep = local_md5.value == remote_md5.value;
    }

    if (keep) {
        ferry_log(fmt::format("[upload] resuming {} at {} ({} verified)", temp, have, format_size(have)));
        return Result<uint64_t>::Ok(have);
    }

    ferry_log(fmt::format("[upload] checkpoint {} ({} bytes) does not match local prefix, restarting",
                          temp, have));
    auto rm = channel.remove_file(temp);
    if (rm.is_err()) return Result<uint64_t>::Err(rm.error);
    return Result<uint64_t>::Ok(0);
}

static TransferResult upload_attempt(RemoteChannel& channel, const fs::path& local,
                                     const std::string& remote_path, const TransferOptions& opts,
                                     const ProgressCallback& progress) {
    std::error_code ec;
    uint64_t total = fs::file_size(local, ec);
    if (ec) {
        return TransferResult::Err(TransferErrorKind::FATAL,
                                   "cannot read " + local.string() + ": " + ec.message());
    }

    // A reset on the previous attempt may have taken the session with it
    auto conn = channel.ensure_connected();
    if (conn.is_err()) return TransferResult::Err(TransferErrorKind::TRANSIENT, conn.error);

    const std::string temp = upload_temp_path(remote_path);
    auto checkpoint = verified_checkpoint(channel, local, total, temp);
    if (checkpoint.is_err()) {
        return TransferResult::Err(TransferErrorKind::TRANSIENT, checkpoint.error);
    }
    uint64_t offset = checkpoint.value;
    const uint64_t resumed_from = offset;

    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return TransferResult::Err(TransferErrorKind::FATAL, "cannot open " + local.string());
    }
    in.seekg(static_cast<std::streamoff>(offset));

    // First write of a fresh transfer truncates; zero-length files still get created
    if (offset == 0) {
        auto w = channel.write_chunk(temp, nullptr, 0, false);
        if (w.is_err()) return TransferResult::Err(TransferErrorKind::TRANSIENT, w.error);
    }

    uint64_t chunk = opts.chunk_bytes > 0 ? opts.chunk_bytes : 32 * MB;
    std::vector<char> buf(static_cast<size_t>(std::min<uint64_t>(chunk, total - offset)));
    if (progress) progress(offset, total);
    while (offset < total) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), total - offset));
        in.read(buf.data(), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(in.gcount()) != want) {
            return TransferResult::Err(TransferErrorKind::FATAL,
                                       fmt::format("{} shrank while uploading (read {} of {} at {})",
                                                   local.string(), in.gcount(), want, offset));
        }
        auto w = channel.write_chunk(temp, buf.data(), want, true);
        if (w.is_err()) {
            return TransferResult::Err(TransferErrorKind::TRANSIENT, w.error);
        }
        offset += want;
        if (progress) progress(offset, total);
    }

    // (1) size: a short file is resumable as is
    auto final_size = channel.stat_size(temp);
    if (final_size.is_err()) {
        return TransferResult::Err(TransferErrorKind::TRANSIENT, final_size.error);
    }
    uint64_t got = final_size.value.value_or(0);
    if (!final_size.value || got != total) {
        return TransferResult::Err(TransferErrorKind::SIZE_MISMATCH,
                                   fmt::format("remote size {} != local size {}", got, total));
    }

    // (2) content: a mismatch means the checkpoint is corrupt
    if (opts.verify) {
        auto local_md5 = compute_file_md5(local);
        if (local_md5.is_err()) {
            return TransferResult::Err(TransferErrorKind::FATAL, local_md5.error);
        }
        auto remote_md5 = channel.md5(temp);
        if (remote_md5.is_err()) {
            return TransferResult::Err(TransferErrorKind::TRANSIENT, remote_md5.error);
        }
        if (local_md5.value != remote_md5.value) {
            auto rm = channel.remove_file(temp);
            if (rm.is_err()) ferry_log("[upload] could not discard corrupt checkpoint: " + rm.error);
            return TransferResult::Err(TransferErrorKind::INTEGRITY_MISMATCH,
                                       fmt::format("checksum mismatch (local {}, remote {})",
                                                   local_md5.value, remote_md5.value));
        }
    }

    // Last writer wins
    auto rm = channel.remove_file(remote_path);
    if (rm.is_err()) return TransferResult::Err(TransferErrorKind::TRANSIENT, rm.error);
    auto mv = channel.rename(temp, remote_path);
    if (mv.is_err()) return TransferResult::Err(TransferErrorKind::TRANSIENT, mv.error);

    return TransferResult::Ok(total, resumed_from);
}

TransferResult upload_file(RemoteChannel& channel, const fs::path& local,
                           const std::string& remote_path, const TransferOptions& opts,
                           ProgressCallback progress) {
    auto result = retry_with_backoff(
        opts.retry, "upload " + local.filename().string(),
        [&](int) { return upload_attempt(channel, local, remote_path, opts, progress); },
        [](const TransferResult& r) { return r.retryable(); });
    if (result.is_ok()) {
        ferry_log(fmt::format("[upload] {} -> {} ({}, resumed at {})", local.string(), remote_path,
                              format_size(result.bytes_total), result.resumed_from));
    } else {
        result.error = fmt::format("{}: {}", transfer_error_name(result.kind), result.error);
    }
    return result;
}

// ── Download ────────────────────────────────────────────────

static TransferResult download_attempt(ByteSource& source, const fs::path& local,
                                       const ProgressCallback& progress) {
    const fs::path part = download_temp_path(local);
    std::error_code ec;
    fs::create_directories(local.parent_path(), ec);

    uint64_t offset = 0;
    if (fs::exists(part, ec)) offset = fs::file_size(part, ec);
    if (ec) offset = 0;

    std::ofstream out;
    uint64_t written = 0;
    std::optional<uint64_t> total;
    bool write_failed = false;

    auto on_start = [&](const StreamInfo& info) {
        total = info.total_size;
        if (info.range_honored && offset > 0) {
            out.open(part, std::ios::binary | std::ios::app);
        } else {
            if (offset > 0) {
                ferry_log(fmt::format("[download] {} ignored range, restarting {}", source.describe(),
                                      part.string()));
            }
            offset = 0;
            out.open(part, std::ios::binary | std::ios::trunc);
        }
        return static_cast<bool>(out);
    };
    auto sink = [&](const char* data, size_t len) {
        out.write(data, static_cast<std::streamsize>(len));
        if (!out) {
            write_failed = true;
            return false;
        }
        written += len;
        if (progress) progress(offset + written, total.value_or(0));
        return true;
    };

    auto r = source.stream(offset, on_start, sink);
    out.close();

    if (write_failed) {
        return TransferResult::Err(TransferErrorKind::FATAL, "local write failed: " + part.string());
    }
    if (r.is_err()) {
        if (r.kind == TransferErrorKind::INTEGRITY_MISMATCH) fs::remove(part, ec);
        return r;
    }

    uint64_t got = fs::file_size(part, ec);
    if (ec) {
        return TransferResult::Err(TransferErrorKind::TRANSIENT, "cannot stat " + part.string());
    }
    if (!total) {
        // Nothing to check the bytes against; keep them for a later resume
        return TransferResult::Err(TransferErrorKind::SIZE_MISMATCH,
                                   fmt::format("{} stated no total size, {} bytes kept unpromoted",
                                               source.describe(), got));
    }
    if (got != *total) {
        // Longer than declared can never be completed by appending
        if (got > *total) fs::remove(part, ec);
        return TransferResult::Err(TransferErrorKind::SIZE_MISMATCH,
                                   fmt::format("downloaded {} bytes, expected {}", got, *total));
    }

    fs::rename(part, local, ec);
    if (ec) {
        return TransferResult::Err(TransferErrorKind::FATAL,
                                   "cannot promote " + part.string() + ": " + ec.message());
    }
    return TransferResult::Ok(got, r.resumed_from);
}

TransferResult download_file(ByteSource& source, const fs::path& local,
                             const TransferOptions& opts, ProgressCallback progress) {
    auto result = retry_with_backoff(
        opts.retry, "download " + local.filename().string(),
        [&](int) { return download_attempt(source, local, progress); },
        [](const TransferResult& r) { return r.retryable(); });
    if (result.is_ok()) {
        ferry_log(fmt::format("[download] {} -> {} ({}, resumed at {})", source.describe(),
                              local.string(), format_size(result.bytes_total), result.resumed_from));
    } else {
        result.error = fmt::format("{}: {}", transfer_error_name(result.kind), result.error);
    }
    return result;
}
