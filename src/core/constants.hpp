#pragma once

#include <cstddef>
#include <cstdint>

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single SSH command
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Max time to open an exec/SFTP channel
constexpr int CHECKSUM_TIMEOUT_SECS      = 7200;  // md5sum of a 40GB archive is slow
constexpr int EXTRACT_TIMEOUT_SECS       = 3600;
constexpr int CHECK_TIMEOUT_SECS         = 1800;
constexpr int HTTP_CONNECT_TIMEOUT_SECS  = 15;
constexpr int HTTP_LOW_SPEED_SECS        = 60;    // abort a download stalled for this long

// ── Retry counts ────────────────────────────────────────────
constexpr int SSH_CONNECT_MAX_RETRIES    = 3;     // Retries for transient SSH connect failures
constexpr int SSH_RETRY_DELAY_MS         = 2000;
constexpr int TOKEN_LOGIN_MAX_RETRIES    = 3;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SFTP_IO_BUF_SIZE           = 256 * 1024;
constexpr int CHECKSUM_BUF_SIZE          = 1024 * 1024;
constexpr uint64_t MB                    = 1024ULL * 1024ULL;

// ── Naming ──────────────────────────────────────────────────
constexpr const char* UPLOAD_TEMP_SUFFIX   = ".uploading";
constexpr const char* DOWNLOAD_TEMP_SUFFIX = ".part";
constexpr const char* ARCHIVE_EXTENSION    = ".zip";
constexpr const char* MANIFEST_EXTENSION   = ".json";
constexpr const char* ARCHIVE_DONE_SUBDIR  = "done";
constexpr const char* STATUS_MARKER_DIR    = ".ferry";
constexpr const char* REMOTE_LOG_FILE      = "pipeline.log";
constexpr const char* STATE_FILE_NAME      = "pipeline_state.yaml";

// ── Error text ──────────────────────────────────────────────
constexpr std::size_t SUMMARY_ERROR_WIDTH  = 60;   // summary table truncation
constexpr std::size_t STDERR_KEEP_CHARS    = 200;  // collaborator stderr kept in errors

constexpr const char* FERRY_VERSION = "0.4.0";
