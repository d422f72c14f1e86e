#pragma once

#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_channel.hpp>
#include <transfer/byte_source.hpp>
#include <transfer/transfer.hpp>
#include "remote_processor.hpp"
#include "state_store.hpp"

namespace fs = std::filesystem;

// One data package, named by its manifest file.
struct Item {
    std::string stem;
    std::string archive_name;     // normalized stem + ".zip"
    fs::path manifest;            // local <stem>.json
    fs::path local_archive;       // <temp_dir>/<archive_name>

    static Item from_manifest(const fs::path& manifest, const fs::path& temp_dir);
};

// Every *.json in manifest_dir, sorted by name.
Result<std::vector<Item>> discover_items(const fs::path& manifest_dir, const fs::path& temp_dir);

// What happened to one item in this run.
struct ItemOutcome {
    std::string stem;
    Stage stage = Stage::PENDING;
    bool already_complete = false;   // finalized before this run
    std::string failed_stage;        // download, upload, extract, check, finalize
    std::string error;
    int count = 0;                   // sanity probe entry count
    int issues = 0;
    fs::path report;                 // local copy of the validation report
    std::vector<std::string> steps;  // stages actually executed
    double duration_seconds = 0;

    bool did(const std::string& step) const;
    bool failed() const { return stage == Stage::FAILED; }
    bool check_failed() const { return stage == Stage::CHECKED && issues > 0; }
};

// Drives one item through download, upload, extract, check and finalize.
//
// Entry decisions combine the remote snapshot with the state store:
//   - a finalized directory that passes the sanity probe is complete;
//     one that fails it is removed and the item starts over
//   - an uploaded archive skips download and upload
//   - a work directory with an extraction marker that passes the sanity
//     probe skips extraction; any other work directory is removed
// A failed stage records FAILED with its message and ends the item only.
class ItemPipeline {
public:
    ItemPipeline(StateStore& store, RemoteProcessor& processor, ArchiveSource& source,
                 TransferOptions transfer, fs::path report_dir, StatusCallback status = nullptr);

    ItemOutcome run(RemoteChannel& ch, const Item& item, const RemoteSnapshot& snap);

    // True when, judging by the snapshot alone, the item will need its local archive.
    bool needs_local_archive(const Item& item, const RemoteSnapshot& snap) const;

    // Make the local archive available without touching the worker.
    // Records DOWNLOADED, or FAILED on error.
    Result<void> prefetch(const Item& item, ItemOutcome& outcome);

    // Record a failure that happened outside the pipeline (no connection).
    ItemOutcome abort(const Item& item, const std::string& step, const std::string& error);

private:
    Result<void> ensure_local_archive(const Item& item, ItemOutcome& outcome);
    bool local_archive_ready(const Item& item) const;
    void advance(const std::string& stem, Stage stage);
    ItemOutcome& fail(ItemOutcome& outcome, const std::string& step, const std::string& error);
    void status(const std::string& msg) const;
    void drive(RemoteChannel& ch, const Item& item, const RemoteSnapshot& snap,
               ItemOutcome& outcome);

    StateStore& store_;
    RemoteProcessor& processor_;
    ArchiveSource& source_;
    TransferOptions transfer_;
    fs::path report_dir_;
    StatusCallback status_;

    // Archives downloaded by this process; trusted without re-reading them
    mutable std::mutex fetched_mutex_;
    std::set<std::string> fetched_;
};
