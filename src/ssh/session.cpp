#include "session.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <cstring>
#include <chrono>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
};

// Answer every keyboard-interactive prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sftp_(nullptr), sock_(-1), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    auto r = establish_connection(callback);
    ferry_log(fmt::format("[session] {}@{}:{} -> {}", target_.user, target_.host, target_.port,
                          r.success() ? "connected" : r.stderr_data));
    return r;
}

void SessionManager::teardown(const char* reason) {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

SSHResult SessionManager::establish_connection(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    auto tcp = platform::connect_tcp(target_.host, target_.port, target_.timeout);
    if (tcp.is_err()) {
        return SSHResult{-1, "", tcp.error};
    }
    sock_ = tcp.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("init failed");
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() > deadline) break;
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        teardown("Handshake failed");
        return SSHResult{-1, "", "SSH handshake failed"};
    }

    // SSH-level keepalive on top of TCP keepalive
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    auto sftp_result = open_sftp();
    if (sftp_result.failed()) {
        teardown("SFTP init failed");
        return sftp_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;

    if (callback) {
        callback("Connected to " + target_.host);
    }

    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(50);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    if (target_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using key " + *target_.ssh_key_path + "...");
        const char* passphrase = target_.password.empty() ? nullptr : target_.password.c_str();
        while ((ret = libssh2_userauth_publickey_fromfile_ex(
                    session_, target_.user.c_str(), static_cast<unsigned int>(target_.user.length()),
                    nullptr, target_.ssh_key_path->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        if (ret == 0) return SSHResult{0, "", ""};
        if (callback) callback("Key authentication failed, trying password...");
    }

    if (target_.password.empty()) {
        return SSHResult{-1, "", "Authentication failed (no usable key and no password)"};
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        if (ret == 0) return SSHResult{0, "", ""};
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{target_.password};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return SSHResult{0, "", ""};
    }

    return SSHResult{-1, "", "Authentication failed (check user/password/key)"};
}

SSHResult SessionManager::open_sftp() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((sftp_ = libssh2_sftp_init(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            std::chrono::steady_clock::now() > deadline) {
            return SSHResult{-1, "", "Failed to start SFTP subsystem"};
        }
        platform::sleep_ms(50);
    }
    return SSHResult{0, "", ""};
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    teardown("Normal disconnection");
}

bool SessionManager::is_active() const {
    return active_;
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    return true;
}

void init_ssh_library() {
    libssh2_init(0);
}

void shutdown_ssh_library() {
    libssh2_exit();
}
