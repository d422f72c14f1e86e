#pragma once

#include <memory>
#include <core/types.hpp>
#include "remote_channel.hpp"
#include "session.hpp"

// RemoteChannel over libssh2: each command runs on its own exec channel
// (no PTY, binary-clean, real exit status); byte I/O goes through SFTP.
class SSHConnection : public RemoteChannel {
public:
    explicit SSHConnection(std::unique_ptr<SessionManager> session);
    ~SSHConnection() override;

    SSHResult run(const std::string& command, int timeout_secs = 0) override;
    bool is_active() const override;
    bool alive() override;
    Result<void> reconnect() override;

    Result<std::optional<uint64_t>> stat_size(const std::string& path) override;
    Result<void> write_chunk(const std::string& path, const char* data,
                             size_t len, bool append) override;
    Result<uint64_t> read_from(const std::string& path, uint64_t offset,
                               const ByteSink& sink) override;

    const std::string& target() const { return session_->get_target(); }

private:
    std::unique_ptr<SessionManager> session_;
};

// Connect and authenticate, retrying transient failures.
Result<std::unique_ptr<SSHConnection>> connect_remote(const RemoteConfig& cfg,
                                                      StatusCallback callback = nullptr);
