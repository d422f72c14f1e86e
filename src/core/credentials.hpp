#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "types.hpp"

// Bearer token for the archive source, shared by every download worker.
//
// Constructed once per run and handed to the components that need it.
// The token is cached for max_age; when it expires (or a caller reports it
// stale) exactly one thread runs the fetch function while the others wait
// for and reuse its result.
class CredentialManager {
public:
    using FetchFn = std::function<Result<std::string>()>;

    CredentialManager(FetchFn fetch, std::chrono::seconds max_age);

    // Static token from source.token_env, or login via source.login_url
    // falling back to the static token when login fails.
    static std::unique_ptr<CredentialManager> from_config(const SourceConfig& cfg);

    // Cached token, refreshing if missing or older than max_age.
    Result<std::string> get_token();

    // Called after the server rejected `stale`. Refreshes unless another
    // thread already replaced that token, in which case the new one is returned.
    Result<std::string> refresh(const std::string& stale);

    // Number of fetches performed so far.
    int fetch_count() const;

private:
    Result<std::string> refresh_locked(std::unique_lock<std::mutex>& lock);
    bool fresh_locked() const;

    FetchFn fetch_;
    std::chrono::seconds max_age_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool refreshing_ = false;
    std::string token_;
    std::string last_error_;
    std::chrono::steady_clock::time_point fetched_at_{};
    int fetch_count_ = 0;
};

// JSON body for the source login endpoint: {"email": ..., "password": ...}.
std::string login_request_body(const std::string& user, const std::string& password);

// access_token from a login reply {"code": 0, "data": {"token": {"access_token": ...}}}.
Result<std::string> parse_login_reply(const std::string& body);
