#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
};

// One authenticated SSH transport with an SFTP subsystem on top.
// Every libssh2 call on the session must hold io_mutex().
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;
    bool check_alive();
    void mark_dead() { active_ = false; }

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    LIBSSH2_SFTP* get_sftp() { return sftp_; }
    const SessionTarget& session_target() const { return target_; }
    const std::string& get_target() const { return target_str_; }
    std::mutex& io_mutex() { return *io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP* sftp_;
    int sock_;
    bool active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult establish_connection(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
    SSHResult open_sftp();
    void teardown(const char* reason);
};

// libssh2_init / libssh2_exit. Call once from main before any session.
void init_ssh_library();
void shutdown_ssh_library();
