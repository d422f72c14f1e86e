#pragma once

#include <filesystem>
#include <string>
#include <core/retry.hpp>
#include <core/types.hpp>
#include <ssh/remote_channel.hpp>
#include "byte_source.hpp"
#include "transfer_result.hpp"

namespace fs = std::filesystem;

struct TransferOptions {
    uint64_t chunk_bytes = 32ULL * 1024 * 1024;
    bool verify = true;         // whole-file checksum before the final rename
    RetryPolicy retry;

    static TransferOptions from_config(const TransferConfig& cfg);
};

// Resumable, checksummed copy of a local file to remote_path.
//
// Bytes go to remote_path + ".uploading"; the size of that file is the
// only checkpoint. An existing checkpoint is resumed only if its bytes
// match the same-length prefix of the local file. After the last chunk
// the sizes must agree (else the checkpoint is kept for the next attempt)
// and the whole-file checksums must agree (else the checkpoint is deleted).
// remote_path appears only by rename, replacing any previous file.
TransferResult upload_file(RemoteChannel& channel, const fs::path& local,
                           const std::string& remote_path, const TransferOptions& opts,
                           ProgressCallback progress = nullptr);

// Resumable copy from a byte source to local. Bytes go to local + ".part",
// continuing from its current size when the source honors the range.
// The part file is promoted only when its size matches the declared total.
TransferResult download_file(ByteSource& source, const fs::path& local,
                             const TransferOptions& opts, ProgressCallback progress = nullptr);

std::string upload_temp_path(const std::string& remote_path);
fs::path download_temp_path(const fs::path& local);
