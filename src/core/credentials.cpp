#include "credentials.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "retry.hpp"
#include <platform/http.hpp>
#include <json/json.h>
#include <fmt/format.h>
#include <cstdlib>

CredentialManager::CredentialManager(FetchFn fetch, std::chrono::seconds max_age)
    : fetch_(std::move(fetch)), max_age_(max_age) {}

bool CredentialManager::fresh_locked() const {
    if (token_.empty()) return false;
    return std::chrono::steady_clock::now() - fetched_at_ < max_age_;
}

Result<std::string> CredentialManager::get_token() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (fresh_locked()) {
        return Result<std::string>::Ok(token_);
    }
    return refresh_locked(lock);
}

Result<std::string> CredentialManager::refresh(const std::string& stale) {
    std::unique_lock<std::mutex> lock(mutex_);
    // Wait out an in-flight refresh first; it may already have replaced `stale`.
    cv_.wait(lock, [this] { return !refreshing_; });
    if (!token_.empty() && token_ != stale) {
        return Result<std::string>::Ok(token_);
    }
    fetched_at_ = {};
    token_.clear();
    return refresh_locked(lock);
}

Result<std::string> CredentialManager::refresh_locked(std::unique_lock<std::mutex>& lock) {
    if (refreshing_) {
        cv_.wait(lock, [this] { return !refreshing_; });
        if (!token_.empty()) return Result<std::string>::Ok(token_);
        return Result<std::string>::Err(last_error_.empty() ? "token refresh failed" : last_error_);
    }

    refreshing_ = true;
    lock.unlock();
    Result<std::string> fetched = Result<std::string>::Err("token fetch not attempted");
    try {
        fetched = fetch_();
    } catch (const std::exception& e) {
        fetched = Result<std::string>::Err(std::string("token fetch threw: ") + e.what());
    }
    lock.lock();

    ++fetch_count_;
    refreshing_ = false;
    if (fetched.is_ok() && !fetched.value.empty()) {
        token_ = fetched.value;
        fetched_at_ = std::chrono::steady_clock::now();
        last_error_.clear();
    } else {
        token_.clear();
        last_error_ = fetched.is_ok() ? "empty token" : fetched.error;
    }
    cv_.notify_all();

    if (token_.empty()) return Result<std::string>::Err(last_error_);
    return Result<std::string>::Ok(token_);
}

int CredentialManager::fetch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

// ── Fetchers ──────────────────────────────────────────────

static std::string env_or_empty(const std::string& name) {
    if (name.empty()) return "";
    const char* v = std::getenv(name.c_str());
    return v ? std::string(v) : "";
}

std::string login_request_body(const std::string& user, const std::string& password) {
    Json::Value body(Json::objectValue);
    body["email"] = user;
    body["password"] = password;
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, body);
}

Result<std::string> parse_login_reply(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value reply;
    std::string errs;
    if (!reader->parse(body.data(), body.data() + body.size(), &reply, &errs) || !reply.isObject()) {
        return Result<std::string>::Err("unparseable login reply: " + errs);
    }

    const Json::Value& code = reply["code"];
    if (!code.isInt() || code.asInt() != 0) {
        return Result<std::string>::Err("login rejected: " + reply.get("msg", "").asString());
    }
    const Json::Value& token = reply["data"]["token"]["access_token"];
    if (!token.isString() || token.asString().empty()) {
        return Result<std::string>::Err("login reply has no access_token");
    }
    return Result<std::string>::Ok(token.asString());
}

static Result<std::string> login_once(const std::string& url, const std::string& user,
                                      const std::string& password) {
    auto resp = platform::http_post_json(url, login_request_body(user, password), {},
                                         HTTP_CONNECT_TIMEOUT_SECS);
    if (resp.is_err()) return Result<std::string>::Err(resp.error);
    if (resp.value.status != 200) {
        return Result<std::string>::Err(fmt::format("login returned HTTP {}", resp.value.status));
    }
    return parse_login_reply(resp.value.body);
}

std::unique_ptr<CredentialManager> CredentialManager::from_config(const SourceConfig& cfg) {
    std::string static_token = env_or_empty(cfg.token_env);
    std::string user = env_or_empty(cfg.login_user_env);
    std::string password = env_or_empty(cfg.login_password_env);
    std::string login_url = cfg.login_url;

    FetchFn fetch;
    if (login_url.empty() || user.empty() || password.empty()) {
        fetch = [static_token, env = cfg.token_env]() {
            if (static_token.empty()) {
                return Result<std::string>::Err("no source token: set " +
                                                (env.empty() ? std::string("source.token_env") : env));
            }
            return Result<std::string>::Ok(static_token);
        };
    } else {
        fetch = [login_url, user, password, static_token]() {
            RetryPolicy policy;
            policy.max_attempts = TOKEN_LOGIN_MAX_RETRIES;
            policy.base_delay = std::chrono::milliseconds(1000);
            auto r = retry_with_backoff(policy, "source login", [&](int) {
                return login_once(login_url, user, password);
            });
            if (r.is_ok()) {
                ferry_log("[credentials] login token acquired");
                return r;
            }
            if (!static_token.empty()) {
                ferry_log("[credentials] login failed, using static token: " + r.error);
                return Result<std::string>::Ok(static_token);
            }
            return r;
        };
    }

    return std::make_unique<CredentialManager>(std::move(fetch),
                                               std::chrono::seconds(cfg.token_max_age));
}
