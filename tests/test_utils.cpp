#include <gtest/gtest.h>
#include "fake_remote.hpp"
#include <core/checksum.hpp>
#include <core/retry.hpp>
#include <core/utils.hpp>

// ── String helpers ──────────────────────────────────────────

TEST(Utils, NormalizeArchiveName) {
    EXPECT_EQ(normalize_archive_name("20251227_173931-174100_rere_0"), "20251227_173931-174100");
    EXPECT_EQ(normalize_archive_name("scene_rere_12"), "scene");
    EXPECT_EQ(normalize_archive_name("scene_rere_x"), "scene_rere_x");
    EXPECT_EQ(normalize_archive_name("rere_1_scene"), "rere_1_scene");
    EXPECT_EQ(normalize_archive_name("plain"), "plain");
}

TEST(Utils, ShellQuote) {
    EXPECT_EQ(shell_quote("abc"), "'abc'");
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, ReplacePlaceholder) {
    EXPECT_EQ(replace_placeholder("{a} and {a}", "a", "x"), "x and x");
    EXPECT_EQ(replace_placeholder("{a}", "b", "x"), "{a}");
    // A value containing its own token is not expanded again
    EXPECT_EQ(replace_placeholder("{a}", "a", "{a}{a}"), "{a}{a}");
}

TEST(Utils, TruncateText) {
    EXPECT_EQ(truncate_text("short", 10), "short");
    EXPECT_EQ(truncate_text("0123456789abc", 10), "0123456789...");
}

TEST(Utils, FormatSize) {
    EXPECT_EQ(format_size(1536), "1.50KB");
    EXPECT_EQ(format_size(10485760), "10.00MB");
    EXPECT_EQ(format_size(3ULL * 1024 * 1024 * 1024), "3.00GB");
}

TEST(Utils, ParseMd5FromOutput) {
    EXPECT_EQ(parse_md5_from_output("d41d8cd98f00b204e9800998ecf8427e  -\n"),
              "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(parse_md5_from_output("motd banner\nD41D8CD98F00B204E9800998ECF8427E  /x\n"),
              "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(parse_md5_from_output("no hash here"), "");
    // 33 hex digits is not an md5
    EXPECT_EQ(parse_md5_from_output("d41d8cd98f00b204e9800998ecf8427ee"), "");
}

TEST(Utils, SafeParsing) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope", -1), -1);
    EXPECT_EQ(safe_stoull("  123\n"), 123u);
    EXPECT_EQ(safe_stoull("", 7), 7u);
}

TEST(Utils, IsoTimestampRoundTrip) {
    std::string now = now_iso();
    ASSERT_EQ(now.size(), 19u);
    EXPECT_EQ(now[10], 'T');
    EXPECT_GT(parse_iso_time(now), 0);
    EXPECT_EQ(parse_iso_time("garbage"), 0);
}

// ── Checksums ───────────────────────────────────────────────

TEST(Checksum, MatchesKnownDigest) {
    TempDir tmp;
    write_text_file(tmp / "empty", "");
    write_text_file(tmp / "abc", "abc");

    auto empty = compute_file_md5(tmp / "empty");
    ASSERT_TRUE(empty.is_ok()) << empty.error;
    EXPECT_EQ(empty.value, "d41d8cd98f00b204e9800998ecf8427e");

    auto abc = compute_file_md5(tmp / "abc");
    ASSERT_TRUE(abc.is_ok());
    EXPECT_EQ(abc.value, "900150983cd24fb0d6963f7d28e17f72");
}

TEST(Checksum, PrefixDigest) {
    TempDir tmp;
    write_text_file(tmp / "abcdef", "abcdef");
    auto prefix = compute_file_md5(tmp / "abcdef", 3);
    ASSERT_TRUE(prefix.is_ok()) << prefix.error;
    EXPECT_EQ(prefix.value, "900150983cd24fb0d6963f7d28e17f72");

    EXPECT_TRUE(compute_file_md5(tmp / "abcdef", 100).is_err());
    EXPECT_TRUE(compute_file_md5(tmp / "missing").is_err());
}

TEST(Checksum, AgreesWithRemoteMd5sum) {
    TempDir tmp;
    FakeRemote remote(tmp / "scratch");
    write_random_file(tmp / "blob", 3 * 1024 * 1024 + 17, 5);

    auto local = compute_file_md5(tmp / "blob");
    auto remote_sum = remote.md5((tmp / "blob").string());
    ASSERT_TRUE(local.is_ok());
    ASSERT_TRUE(remote_sum.is_ok()) << remote_sum.error;
    EXPECT_EQ(local.value, remote_sum.value);

    auto local_prefix = compute_file_md5(tmp / "blob", 1000000);
    auto remote_prefix = remote.md5((tmp / "blob").string(), 1000000);
    ASSERT_TRUE(remote_prefix.is_ok()) << remote_prefix.error;
    EXPECT_EQ(local_prefix.value, remote_prefix.value);
}

// ── Retry ───────────────────────────────────────────────────

namespace {

RetryPolicy instant(int attempts) {
    RetryPolicy p;
    p.max_attempts = attempts;
    p.base_delay = std::chrono::milliseconds(0);
    return p;
}

} // namespace

TEST(Retry, StopsAtFirstSuccess) {
    int calls = 0;
    auto r = retry_with_backoff(instant(5), "test", [&](int attempt) {
        ++calls;
        return attempt < 3 ? Result<int>::Err("not yet") : Result<int>::Ok(attempt);
    });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, 3);
    EXPECT_EQ(calls, 3);
}

TEST(Retry, GivesUpAfterMaxAttempts) {
    int calls = 0;
    auto r = retry_with_backoff(instant(3), "test", [&](int) {
        ++calls;
        return Result<void>::Err("always");
    });
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "always");
    EXPECT_EQ(calls, 3);
}

TEST(Retry, NonRetryableStopsImmediately) {
    int calls = 0;
    auto r = retry_with_backoff(
        instant(5), "test",
        [&](int) {
            ++calls;
            return Result<void>::Err("fatal: 404");
        },
        [](const Result<void>& res) { return res.error.rfind("fatal", 0) != 0; });
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(calls, 1);
}

TEST(Retry, ZeroAttemptsStillRunsOnce) {
    int calls = 0;
    retry_with_backoff(instant(0), "test", [&](int) {
        ++calls;
        return Result<void>::Err("x");
    });
    EXPECT_EQ(calls, 1);
}

TEST(Retry, DelaySchedules) {
    RetryPolicy linear;
    linear.base_delay = std::chrono::milliseconds(100);
    EXPECT_EQ(linear.delay_for(1).count(), 100);
    EXPECT_EQ(linear.delay_for(3).count(), 300);

    RetryPolicy expo = linear;
    expo.backoff = Backoff::EXPONENTIAL;
    EXPECT_EQ(expo.delay_for(1).count(), 100);
    EXPECT_EQ(expo.delay_for(4).count(), 800);
}
