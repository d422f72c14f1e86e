#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_channel.hpp>
#include "item_pipeline.hpp"
#include "progress.hpp"
#include "remote_processor.hpp"

struct ItemError {
    std::string stem;
    std::string stage;
    std::string message;
};

// Everything one run did, grouped by outcome.
struct RunResult {
    int total = 0;
    std::vector<std::string> skipped;          // complete before this run
    std::vector<std::string> downloaded;
    std::vector<std::string> download_failed;
    std::vector<std::string> uploaded;
    std::vector<std::string> processed;
    std::vector<std::string> check_passed;
    std::vector<std::string> check_failed;
    std::vector<std::string> finalized;
    std::vector<std::string> failed;
    std::vector<ItemError> errors;
    std::vector<ItemOutcome> outcomes;

    void add(const ItemOutcome& outcome);

    // Items now COMPLETED, skipped ones included
    int completed() const;

    // 0 when every item is complete, 2 otherwise
    int exit_code() const;
};

// Schedules items over the per-item pipeline in one of three modes:
//   streaming  one channel, one item at a time end to end
//   optimized  concurrent downloads, then remote stages serially on one channel
//   parallel   a worker pool, each worker borrowing from a connection pool
class PipelineRunner {
public:
    using ChannelFactory = std::function<Result<std::unique_ptr<RemoteChannel>>()>;

    PipelineRunner(ConcurrencyConfig concurrency, ChannelFactory factory, ItemPipeline& pipeline,
                   RemoteProcessor& processor, StatusCallback status = nullptr);

    // Err only when the worker cannot be reached at all; item failures
    // are reported in the result.
    Result<RunResult> run(const std::vector<Item>& items);

private:
    Result<RunResult> run_streaming(const std::vector<Item>& items);
    Result<RunResult> run_optimized(const std::vector<Item>& items);
    Result<RunResult> run_parallel(const std::vector<Item>& items);

    Result<void> ensure_channel(std::unique_ptr<RemoteChannel>& ch);
    void record(RunResult& result, Progress& progress, const ItemOutcome& outcome);
    void status(const std::string& msg) const;

    ConcurrencyConfig concurrency_;
    ChannelFactory factory_;
    ItemPipeline& pipeline_;
    RemoteProcessor& processor_;
    StatusCallback status_;
    std::mutex result_mutex_;
};
