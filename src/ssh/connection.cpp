#include "connection.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/retry.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;

void poll_pause() {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
}

// Errors after which the transport is unusable
bool is_transport_error(long rc) {
    return rc == LIBSSH2_ERROR_SOCKET_SEND || rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_TIMEOUT ||
           rc == LIBSSH2_ERROR_TIMEOUT || rc == LIBSSH2_ERROR_CHANNEL_CLOSED;
}

// Repeat a libssh2 call under the session lock until it stops returning EAGAIN.
template <typename Fn>
long call_rc(std::mutex& m, Fn&& fn, int timeout_secs = SSH_CHANNEL_OPEN_SECS) {
    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);
    while (true) {
        long rc;
        {
            std::lock_guard<std::mutex> lock(m);
            rc = static_cast<long>(fn());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (Clock::now() > deadline) return LIBSSH2_ERROR_TIMEOUT;
        poll_pause();
    }
}

// Open an SFTP handle, waiting out EAGAIN.
LIBSSH2_SFTP_HANDLE* open_handle(SessionManager& s, const std::string& path,
                                 unsigned long flags, long mode) {
    auto deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (Clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(s.io_mutex());
            LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(
                s.get_sftp(), path.c_str(), static_cast<unsigned int>(path.size()),
                flags, mode, LIBSSH2_SFTP_OPENFILE);
            if (h) return h;
            if (libssh2_session_last_errno(s.get_raw_session()) != LIBSSH2_ERROR_EAGAIN) {
                return nullptr;
            }
        }
        poll_pause();
    }
    return nullptr;
}

void close_handle(SessionManager& s, LIBSSH2_SFTP_HANDLE* h) {
    call_rc(s.io_mutex(), [&] { return libssh2_sftp_close(h); });
}

} // namespace

SSHConnection::SSHConnection(std::unique_ptr<SessionManager> session)
    : session_(std::move(session)) {
}

SSHConnection::~SSHConnection() {
    if (session_) session_->close();
}

bool SSHConnection::is_active() const {
    return session_ && session_->is_active();
}

// Sends a keepalive and polls the socket, so a peer that went away
// without a transport error on our side still reads as dead.
bool SSHConnection::alive() {
    return session_ && session_->check_alive();
}

Result<void> SSHConnection::reconnect() {
    if (!session_) return Result<void>::Err("No session to reconnect");
    SessionTarget target = session_->session_target();
    session_->close();

    auto fresh = std::make_unique<SessionManager>(target);
    auto r = fresh->establish();
    if (r.failed()) {
        return Result<void>::Err(fmt::format("reconnect to {} failed: {}",
                                             session_->get_target(), r.stderr_data));
    }
    session_ = std::move(fresh);
    ferry_log("[ssh] reconnected to " + session_->get_target());
    return Result<void>::Ok();
}

SSHResult SSHConnection::run(const std::string& command, int timeout_secs) {
    if (!is_active()) {
        return SSHResult{-1, "", "No session available"};
    }
    std::mutex& io = session_->io_mutex();
    LIBSSH2_SESSION* raw = session_->get_raw_session();

    // Open a new exec channel
    LIBSSH2_CHANNEL* exec_ch = nullptr;
    auto open_deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);
    while (Clock::now() < open_deadline) {
        {
            std::lock_guard<std::mutex> lock(io);
            exec_ch = libssh2_channel_open_session(raw);
            if (!exec_ch) {
                int err = libssh2_session_last_errno(raw);
                if (err != LIBSSH2_ERROR_EAGAIN) {
                    if (is_transport_error(err)) session_->mark_dead();
                    return SSHResult{-1, "", "Failed to open exec channel"};
                }
            }
        }
        if (exec_ch) break;
        poll_pause();
    }
    if (!exec_ch) {
        return SSHResult{-1, "", "Timed out opening exec channel"};
    }

    long rc = call_rc(io, [&] { return libssh2_channel_exec(exec_ch, command.c_str()); });
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(io);
        libssh2_channel_free(exec_ch);
        if (is_transport_error(rc)) session_->mark_dead();
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }

    // Drain stdout and stderr together so neither window fills up
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : SSH_CMD_TIMEOUT_SECS;
    auto deadline = Clock::now() + std::chrono::seconds(effective_timeout);
    bool timed_out = true;
    bool read_error = false;

    while (Clock::now() < deadline) {
        ssize_t n_out, n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(io);
            n_out = libssh2_channel_read(exec_ch, buf, sizeof(buf));
            if (n_out > 0) output.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(exec_ch, buf, sizeof(buf));
            if (n_err > 0) stderr_data.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(exec_ch);
        }
        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            long bad = n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN ? n_out : n_err;
            if (is_transport_error(bad)) session_->mark_dead();
            read_error = true;
            timed_out = false;
            break;
        }
        if (eof && n_out <= 0 && n_err <= 0) {
            timed_out = false;
            break;
        }
        if (n_out <= 0 && n_err <= 0) poll_pause();
    }

    int exit_status = -1;
    if (!timed_out && !read_error) {
        rc = call_rc(io, [&] { return libssh2_channel_close(exec_ch); });
        if (rc == 0) {
            std::lock_guard<std::mutex> lock(io);
            exit_status = libssh2_channel_get_exit_status(exec_ch);
        }
    }

    {
        std::lock_guard<std::mutex> lock(io);
        libssh2_channel_free(exec_ch);
    }

    if (timed_out) {
        return SSHResult{-1, output, "Command timed out after " + std::to_string(effective_timeout) + "s"};
    }
    if (read_error) {
        return SSHResult{-1, output, "SSH channel read error"};
    }
    return SSHResult{exit_status, output, stderr_data};
}

Result<std::optional<uint64_t>> SSHConnection::stat_size(const std::string& path) {
    using R = Result<std::optional<uint64_t>>;
    if (!is_active()) return R::Err("No session available");

    LIBSSH2_SFTP_ATTRIBUTES st{};
    LIBSSH2_SFTP* sftp = session_->get_sftp();
    long rc = call_rc(session_->io_mutex(), [&] {
        return libssh2_sftp_stat_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                                    LIBSSH2_SFTP_STAT, &st);
    });
    if (rc == 0) {
        if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS &&
            (st.permissions & LIBSSH2_SFTP_S_IFMT) != LIBSSH2_SFTP_S_IFREG) {
            return R::Err(path + " is not a regular file");
        }
        uint64_t size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? static_cast<uint64_t>(st.filesize) : 0;
        return R::Ok(size);
    }

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long sftp_err;
        {
            std::lock_guard<std::mutex> lock(session_->io_mutex());
            sftp_err = libssh2_sftp_last_error(sftp);
        }
        if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_NO_SUCH_PATH) {
            return R::Ok(std::nullopt);
        }
        return R::Err(fmt::format("stat {} failed (sftp error {})", path, sftp_err));
    }

    if (is_transport_error(rc)) session_->mark_dead();
    return R::Err(fmt::format("stat {} failed (rc {})", path, rc));
}

Result<void> SSHConnection::write_chunk(const std::string& path, const char* data,
                                        size_t len, bool append) {
    if (!is_active()) return Result<void>::Err("No session available");

    uint64_t start = 0;
    if (append) {
        auto size = stat_size(path);
        if (size.is_err()) return Result<void>::Err(size.error);
        start = size.value.value_or(0);
    }

    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | (append ? 0 : LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE* wh = open_handle(*session_, path, flags, 0644);
    if (!wh) return Result<void>::Err("Cannot open remote file for writing: " + path);

    if (start > 0) {
        std::lock_guard<std::mutex> lock(session_->io_mutex());
        libssh2_sftp_seek64(wh, static_cast<libssh2_uint64_t>(start));
    }

    size_t done = 0;
    while (done < len) {
        size_t piece = std::min(len - done, static_cast<size_t>(SFTP_IO_BUF_SIZE));
        long w = call_rc(session_->io_mutex(), [&] {
            return libssh2_sftp_write(wh, data + done, piece);
        }, SSH_CMD_TIMEOUT_SECS);
        if (w < 0) {
            close_handle(*session_, wh);
            if (is_transport_error(w)) session_->mark_dead();
            return Result<void>::Err(fmt::format("Remote write to {} failed at +{} (rc {})",
                                                 path, start + done, w));
        }
        done += static_cast<size_t>(w);
    }

    close_handle(*session_, wh);
    return Result<void>::Ok();
}

Result<uint64_t> SSHConnection::read_from(const std::string& path, uint64_t offset,
                                          const ByteSink& sink) {
    if (!is_active()) return Result<uint64_t>::Err("No session available");

    LIBSSH2_SFTP_HANDLE* rh = open_handle(*session_, path, LIBSSH2_FXF_READ, 0);
    if (!rh) return Result<uint64_t>::Err("Cannot open remote file for reading: " + path);

    if (offset > 0) {
        std::lock_guard<std::mutex> lock(session_->io_mutex());
        libssh2_sftp_seek64(rh, static_cast<libssh2_uint64_t>(offset));
    }

    std::vector<char> buf(SFTP_IO_BUF_SIZE);
    uint64_t delivered = 0;
    while (true) {
        long n = call_rc(session_->io_mutex(), [&] {
            return libssh2_sftp_read(rh, buf.data(), buf.size());
        }, SSH_CMD_TIMEOUT_SECS);
        if (n == 0) break;  // EOF
        if (n < 0) {
            close_handle(*session_, rh);
            if (is_transport_error(n)) session_->mark_dead();
            return Result<uint64_t>::Err(fmt::format("Remote read of {} failed at +{} (rc {})",
                                                     path, offset + delivered, n));
        }
        delivered += static_cast<uint64_t>(n);
        if (!sink(buf.data(), static_cast<size_t>(n))) {
            close_handle(*session_, rh);
            return Result<uint64_t>::Err("Read of " + path + " aborted by receiver");
        }
    }

    close_handle(*session_, rh);
    return Result<uint64_t>::Ok(delivered);
}

Result<std::unique_ptr<SSHConnection>> connect_remote(const RemoteConfig& cfg,
                                                      StatusCallback callback) {
    using R = Result<std::unique_ptr<SSHConnection>>;

    SessionTarget target;
    target.host = cfg.host;
    target.port = cfg.port;
    target.user = cfg.user;
    target.timeout = cfg.timeout;
    target.ssh_key_path = cfg.ssh_key_path;
    if (!cfg.password_env.empty()) {
        const char* pw = std::getenv(cfg.password_env.c_str());
        if (pw) target.password = pw;
    }

    RetryPolicy policy;
    policy.max_attempts = SSH_CONNECT_MAX_RETRIES;
    policy.base_delay = std::chrono::milliseconds(SSH_RETRY_DELAY_MS);

    auto attempt = [&](int) -> R {
        auto session = std::make_unique<SessionManager>(target);
        auto r = session->establish(callback);
        if (r.failed()) return R::Err(r.stderr_data);
        return R::Ok(std::make_unique<SSHConnection>(std::move(session)));
    };
    // Bad credentials will not fix themselves
    auto retryable = [](const R& r) {
        return r.error.find("Authentication failed") == std::string::npos;
    };
    return retry_with_backoff(policy, "ssh connect " + cfg.host, attempt, retryable);
}
