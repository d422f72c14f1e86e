#include <gtest/gtest.h>
#include <core/credentials.hpp>
#include <json/json.h>
#include <atomic>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

TEST(Credentials, CachesToken) {
    std::atomic<int> calls{0};
    CredentialManager creds([&]() {
        ++calls;
        return Result<std::string>::Ok("tok-" + std::to_string(calls.load()));
    }, std::chrono::seconds(60));

    EXPECT_EQ(creds.get_token().value, "tok-1");
    EXPECT_EQ(creds.get_token().value, "tok-1");
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(creds.fetch_count(), 1);
}

TEST(Credentials, ExpiredTokenIsFetchedAgain) {
    int calls = 0;
    CredentialManager creds([&]() {
        ++calls;
        return Result<std::string>::Ok("tok-" + std::to_string(calls));
    }, std::chrono::seconds(0));

    EXPECT_EQ(creds.get_token().value, "tok-1");
    EXPECT_EQ(creds.get_token().value, "tok-2");
}

TEST(Credentials, ConcurrentCallersShareOneFetch) {
    std::atomic<int> calls{0};
    CredentialManager creds([&]() {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return Result<std::string>::Ok("shared");
    }, std::chrono::seconds(60));

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto t = creds.get_token();
            if (t.is_ok() && t.value == "shared") ++ok;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), 8);
    EXPECT_EQ(calls.load(), 1);
}

TEST(Credentials, StaleReportsCollapseIntoOneRefresh) {
    std::atomic<int> calls{0};
    CredentialManager creds([&]() {
        int n = ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return Result<std::string>::Ok("tok-" + std::to_string(n));
    }, std::chrono::seconds(60));
    ASSERT_EQ(creds.get_token().value, "tok-1");

    // Every worker saw tok-1 rejected at about the same time
    std::vector<std::thread> threads;
    std::vector<std::string> seen(6);
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&, i]() { seen[i] = creds.refresh("tok-1").value; });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(calls.load(), 2);
    for (const auto& s : seen) EXPECT_EQ(s, "tok-2");
}

TEST(Credentials, RefreshWithCurrentTokenFetches) {
    int calls = 0;
    CredentialManager creds([&]() {
        ++calls;
        return Result<std::string>::Ok("tok-" + std::to_string(calls));
    }, std::chrono::seconds(60));

    ASSERT_EQ(creds.get_token().value, "tok-1");
    EXPECT_EQ(creds.refresh("tok-1").value, "tok-2");
    // An older token no longer triggers a fetch
    EXPECT_EQ(creds.refresh("tok-1").value, "tok-2");
    EXPECT_EQ(calls, 2);
}

TEST(Credentials, FetchErrorIsReported) {
    CredentialManager creds([]() { return Result<std::string>::Err("login rejected"); },
                            std::chrono::seconds(60));
    auto t = creds.get_token();
    ASSERT_TRUE(t.is_err());
    EXPECT_EQ(t.error, "login rejected");
}

TEST(Credentials, ThrowingFetchBecomesError) {
    CredentialManager creds([]() -> Result<std::string> { throw std::runtime_error("boom"); },
                            std::chrono::seconds(60));
    auto t = creds.get_token();
    ASSERT_TRUE(t.is_err());
    EXPECT_NE(t.error.find("boom"), std::string::npos);

    // Not stuck in the refreshing state
    EXPECT_TRUE(creds.get_token().is_err());
    EXPECT_EQ(creds.fetch_count(), 2);
}

TEST(Credentials, EmptyTokenIsAnError) {
    CredentialManager creds([]() { return Result<std::string>::Ok(""); }, std::chrono::seconds(60));
    auto t = creds.get_token();
    ASSERT_TRUE(t.is_err());
    EXPECT_EQ(t.error, "empty token");
}

TEST(Credentials, StaticTokenFromEnvironment) {
    ::setenv("FERRY_TEST_TOKEN", "env-token", 1);
    SourceConfig cfg;
    cfg.token_env = "FERRY_TEST_TOKEN";

    auto creds = CredentialManager::from_config(cfg);
    auto t = creds->get_token();
    ASSERT_TRUE(t.is_ok()) << t.error;
    EXPECT_EQ(t.value, "env-token");
    ::unsetenv("FERRY_TEST_TOKEN");
}

TEST(Credentials, MissingStaticTokenNamesVariable) {
    ::unsetenv("FERRY_TEST_TOKEN_UNSET");
    SourceConfig cfg;
    cfg.token_env = "FERRY_TEST_TOKEN_UNSET";

    auto t = CredentialManager::from_config(cfg)->get_token();
    ASSERT_TRUE(t.is_err());
    EXPECT_NE(t.error.find("FERRY_TEST_TOKEN_UNSET"), std::string::npos);
}

// ── Login wire format ───────────────────────────────────────

TEST(LoginFormat, RequestBodyEscapesControlCharacters) {
    std::string body = login_request_body("a@b.org", "tab\there \"quoted\" \x1b[0m");
    EXPECT_EQ(body.find('\x1b'), std::string::npos);
    EXPECT_EQ(body.find('\n'), std::string::npos);

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value parsed;
    std::string errs;
    ASSERT_TRUE(reader->parse(body.data(), body.data() + body.size(), &parsed, &errs)) << errs;
    EXPECT_EQ(parsed["email"].asString(), "a@b.org");
    EXPECT_EQ(parsed["password"].asString(), "tab\there \"quoted\" \x1b[0m");
}

TEST(LoginFormat, ReplyYieldsAccessToken) {
    auto t = parse_login_reply(R"({"code":0,"data":{"token":{"access_token":"tok-9","expires_in":3600}}})");
    ASSERT_TRUE(t.is_ok()) << t.error;
    EXPECT_EQ(t.value, "tok-9");
}

TEST(LoginFormat, RejectedReplyCarriesMessage) {
    auto t = parse_login_reply(R"({"code":1001,"msg":"bad password"})");
    ASSERT_TRUE(t.is_err());
    EXPECT_EQ(t.error, "login rejected: bad password");
}

TEST(LoginFormat, ReplyWithoutTokenIsAnError) {
    auto t = parse_login_reply(R"({"code":0,"data":{}})");
    ASSERT_TRUE(t.is_err());
    EXPECT_EQ(t.error, "login reply has no access_token");
}

TEST(LoginFormat, GarbageReplyIsAnError) {
    auto t = parse_login_reply("<html>gateway timeout</html>");
    ASSERT_TRUE(t.is_err());
    EXPECT_EQ(t.error.rfind("unparseable login reply", 0), 0u);
}
