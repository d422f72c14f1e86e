#include "pipeline_runner.hpp"
#include "connection_pool.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <map>
#include <thread>

// ── RunResult ────────────────────────────────────────────────

void RunResult::add(const ItemOutcome& o) {
    outcomes.push_back(o);

    if (o.already_complete) {
        skipped.push_back(o.stem);
        return;
    }
    if (o.did("download")) downloaded.push_back(o.stem);
    if (o.failed() && o.failed_stage == "download") download_failed.push_back(o.stem);
    if (o.did("upload")) uploaded.push_back(o.stem);
    if (o.did("extract") && !(o.failed() && o.failed_stage == "extract")) processed.push_back(o.stem);
    if (o.did("check")) {
        if (o.check_failed()) {
            check_failed.push_back(o.stem);
        } else if (!(o.failed() && o.failed_stage == "check")) {
            check_passed.push_back(o.stem);
        }
    }
    if (o.stage == Stage::COMPLETED) finalized.push_back(o.stem);

    if (o.failed()) {
        failed.push_back(o.stem);
        errors.push_back({o.stem, o.failed_stage, o.error});
    } else if (o.check_failed()) {
        errors.push_back({o.stem, "check", o.error});
    }
}

int RunResult::completed() const {
    return static_cast<int>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const ItemOutcome& o) { return o.stage == Stage::COMPLETED; }));
}

int RunResult::exit_code() const {
    return completed() == static_cast<int>(outcomes.size()) ? 0 : 2;
}

// ── Runner ───────────────────────────────────────────────────

PipelineRunner::PipelineRunner(ConcurrencyConfig concurrency, ChannelFactory factory,
                               ItemPipeline& pipeline, RemoteProcessor& processor,
                               StatusCallback status)
    : concurrency_(concurrency), factory_(std::move(factory)), pipeline_(pipeline),
      processor_(processor), status_(std::move(status)) {}

void PipelineRunner::status(const std::string& msg) const {
    ferry_log("[runner] " + msg);
    if (status_) status_(msg);
}

void PipelineRunner::record(RunResult& result, Progress& progress, const ItemOutcome& outcome) {
    std::lock_guard<std::mutex> lock(result_mutex_);
    result.add(outcome);
    auto counts = progress.record(outcome.stage == Stage::COMPLETED);
    status(fmt::format("{} {} {}", Progress::format(counts), outcome.stem, stage_name(outcome.stage)));
}

// Reconnect a shared channel that dropped between items.
Result<void> PipelineRunner::ensure_channel(std::unique_ptr<RemoteChannel>& ch) {
    if (ch && ch->alive()) return Result<void>::Ok();
    if (ch) status("connection lost, reconnecting");
    auto made = factory_();
    if (made.is_err()) return Result<void>::Err(made.error);
    ch = std::move(made.value);
    return Result<void>::Ok();
}

Result<RunResult> PipelineRunner::run(const std::vector<Item>& items) {
    status(fmt::format("{} item(s), mode {}", items.size(), run_mode_name(concurrency_.mode)));
    Result<RunResult> result = Result<RunResult>::Err("unknown mode");
    switch (concurrency_.mode) {
        case RunMode::STREAMING: result = run_streaming(items); break;
        case RunMode::OPTIMIZED: result = run_optimized(items); break;
        case RunMode::PARALLEL:  result = run_parallel(items); break;
    }
    if (result.is_ok()) {
        auto& outcomes = result.value.outcomes;
        std::sort(outcomes.begin(), outcomes.end(),
                  [](const ItemOutcome& a, const ItemOutcome& b) { return a.stem < b.stem; });
    }
    return result;
}

Result<RunResult> PipelineRunner::run_streaming(const std::vector<Item>& items) {
    std::unique_ptr<RemoteChannel> ch;
    auto connected = ensure_channel(ch);
    if (connected.is_err()) return Result<RunResult>::Err(connected.error);

    auto snap = processor_.snapshot(*ch);
    if (snap.is_err()) return Result<RunResult>::Err("remote snapshot failed: " + snap.error);

    RunResult result;
    result.total = static_cast<int>(items.size());
    Progress progress(result.total);
    for (const auto& item : items) {
        auto ok = ensure_channel(ch);
        if (ok.is_err()) {
            record(result, progress, pipeline_.abort(item, "connect", ok.error));
            continue;
        }
        record(result, progress, pipeline_.run(*ch, item, snap.value));
    }
    return Result<RunResult>::Ok(result);
}

Result<RunResult> PipelineRunner::run_optimized(const std::vector<Item>& items) {
    std::unique_ptr<RemoteChannel> ch;
    auto connected = ensure_channel(ch);
    if (connected.is_err()) return Result<RunResult>::Err(connected.error);

    auto snap = processor_.snapshot(*ch);
    if (snap.is_err()) return Result<RunResult>::Err("remote snapshot failed: " + snap.error);

    // Phase 1: downloads need no worker connection
    std::vector<const Item*> wanted;
    for (const auto& item : items) {
        if (pipeline_.needs_local_archive(item, snap.value)) wanted.push_back(&item);
    }

    std::map<std::string, ItemOutcome> prefetched;
    std::mutex prefetched_mutex;
    if (!wanted.empty()) {
        int workers = std::min<int>(concurrency_.download_workers, static_cast<int>(wanted.size()));
        status(fmt::format("downloading {} archive(s) with {} worker(s)", wanted.size(), workers));
        std::atomic<size_t> next{0};
        std::vector<std::thread> threads;
        for (int w = 0; w < workers; ++w) {
            threads.emplace_back([&]() {
                for (size_t i = next++; i < wanted.size(); i = next++) {
                    ItemOutcome outcome;
                    auto r = pipeline_.prefetch(*wanted[i], outcome);
                    if (r.is_err()) ferry_log("[runner] prefetch " + wanted[i]->stem + ": " + r.error);
                    std::lock_guard<std::mutex> lock(prefetched_mutex);
                    prefetched[wanted[i]->stem] = outcome;
                }
            });
        }
        for (auto& t : threads) t.join();
    }

    // Phase 2: remote stages one item at a time
    RunResult result;
    result.total = static_cast<int>(items.size());
    Progress progress(result.total);
    for (const auto& item : items) {
        auto pre = prefetched.find(item.stem);
        if (pre != prefetched.end() && pre->second.failed()) {
            record(result, progress, pre->second);
            continue;
        }

        auto ok = ensure_channel(ch);
        if (ok.is_err()) {
            record(result, progress, pipeline_.abort(item, "connect", ok.error));
            continue;
        }
        ItemOutcome outcome = pipeline_.run(*ch, item, snap.value);
        if (pre != prefetched.end() && pre->second.did("download") && !outcome.did("download")) {
            outcome.steps.insert(outcome.steps.begin(), "download");
        }
        record(result, progress, outcome);
    }
    return Result<RunResult>::Ok(result);
}

Result<RunResult> PipelineRunner::run_parallel(const std::vector<Item>& items) {
    int workers = std::max(1, std::min<int>(concurrency_.max_workers, static_cast<int>(items.size())));
    ConnectionPool pool(factory_, workers, std::chrono::seconds(concurrency_.pool_timeout));

    RemoteSnapshot snap;
    {
        auto conn = pool.acquire();
        if (conn.is_err()) return Result<RunResult>::Err(conn.error);
        PooledChannel lease(pool, std::move(conn.value));
        auto s = processor_.snapshot(*lease);
        if (s.is_err()) return Result<RunResult>::Err("remote snapshot failed: " + s.error);
        snap = s.value;
    }

    RunResult result;
    result.total = static_cast<int>(items.size());
    Progress progress(result.total);

    status(fmt::format("running {} worker(s)", workers));
    std::atomic<size_t> next{0};
    std::vector<std::thread> threads;
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back([&]() {
            for (size_t i = next++; i < items.size(); i = next++) {
                const Item& item = items[i];
                auto conn = pool.acquire();
                if (conn.is_err()) {
                    record(result, progress, pipeline_.abort(item, "connect", conn.error));
                    continue;
                }
                ItemOutcome outcome;
                {
                    PooledChannel lease(pool, std::move(conn.value));
                    outcome = pipeline_.run(*lease, item, snap);
                }
                record(result, progress, outcome);
            }
        });
    }
    for (auto& t : threads) t.join();

    pool.shutdown();
    return Result<RunResult>::Ok(result);
}
