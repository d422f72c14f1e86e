#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Receives streamed bytes; return false to stop the stream.
using ByteSink = std::function<bool(const char* data, size_t len)>;

enum class EntryType { FILE, DIRECTORY };

// A remote shell plus file access on one worker machine.
//
// Implementations provide command execution and raw byte I/O; the
// filesystem queries below are built on run() so every implementation
// answers them the same way. Probes return Ok(false)/Ok(nullopt) for a
// missing path and Err only when the channel itself failed.
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;

    // Run a shell command; exit_code -1 means the channel failed.
    virtual SSHResult run(const std::string& command, int timeout_secs = 0) = 0;

    virtual bool is_active() const = 0;

    // Liveness with a round trip where the transport supports one, so a
    // peer that vanished without a socket error is noticed too.
    virtual bool alive() { return is_active(); }

    // Replace a lost transport in place; the object stays usable by its holders.
    virtual Result<void> reconnect() { return Result<void>::Err("reconnect not supported"); }

    // reconnect() when alive() says the transport is gone.
    Result<void> ensure_connected();

    // Size of a regular file, nullopt when it does not exist.
    virtual Result<std::optional<uint64_t>> stat_size(const std::string& path) = 0;

    // Write bytes to path: appended when append is set, otherwise the file
    // is created or truncated first.
    virtual Result<void> write_chunk(const std::string& path, const char* data,
                                     size_t len, bool append) = 0;

    // Stream path from offset to EOF. Returns the number of bytes delivered.
    virtual Result<uint64_t> read_from(const std::string& path, uint64_t offset,
                                       const ByteSink& sink) = 0;

    // ── Queries and mutations over run() ─────────────────────

    Result<bool> file_exists(const std::string& path);
    Result<bool> dir_exists(const std::string& path);

    // Names under dir matching a shell glob, relative to dir, sorted.
    // A missing dir yields an empty list.
    Result<std::vector<std::string>> list(const std::string& dir, const std::string& glob,
                                          EntryType type, bool recursive = false);

    Result<void> mkdir_p(const std::string& path);
    Result<void> remove_file(const std::string& path);
    Result<void> remove_tree(const std::string& path);
    Result<void> rename(const std::string& from, const std::string& to);

    // md5sum of the whole file, or of its first prefix_bytes bytes.
    Result<std::string> md5(const std::string& path,
                            std::optional<uint64_t> prefix_bytes = std::nullopt);

    // Replace path with content (small files: scripts, markers).
    Result<void> write_text(const std::string& path, const std::string& content);

    // Whole small file as a string.
    Result<std::string> read_text(const std::string& path);

    // Append one line to a file, creating it if needed.
    Result<void> append_line(const std::string& path, const std::string& line);

protected:
    Result<void> run_checked(const std::string& command, const std::string& what,
                             int timeout_secs = 0);
};
