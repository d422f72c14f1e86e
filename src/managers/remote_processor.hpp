#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_channel.hpp>
#include "state_store.hpp"

namespace fs = std::filesystem;

// What the worker holds at the start of a run. Taken once, never refreshed.
struct RemoteSnapshot {
    std::set<std::string> archives;       // archive file names in archive_dir
    std::set<std::string> finalized;      // item directories in final_dir
    std::set<std::string> work_dirs;      // item directories in work_dir
    std::set<std::string> markers;        // stems with a status marker

    bool has_archive(const std::string& name) const { return archives.count(name) > 0; }
    bool has_final(const std::string& stem) const { return finalized.count(stem) > 0; }
    bool has_work(const std::string& stem) const { return work_dirs.count(stem) > 0; }
    bool has_marker(const std::string& stem) const { return markers.count(stem) > 0; }
};

struct CheckOutcome {
    int issues = 0;
    std::string remote_report;
};

// Status marker kept beside the work directory: <work_dir>/.ferry/<stem>.status
struct StatusMarker {
    std::string stage;
    std::string updated_at;
};

// One line of the worker-side pipeline.log
struct OutcomeRecord {
    std::string item;
    std::string status;
    int count = 0;
    std::string error;
    double duration_seconds = 0;
    std::vector<std::string> steps;
};

// Remote-side stages of an item: extraction, validation, finalize and the
// bookkeeping around them. Shared by every worker; each call runs on the
// channel the caller passes in.
class RemoteProcessor {
public:
    RemoteProcessor(RemoteConfig remote, ProcessingConfig processing,
                    std::chrono::milliseconds retry_delay = std::chrono::milliseconds(2000));

    Result<RemoteSnapshot> snapshot(RemoteChannel& ch) const;

    // Copy the collaborator scripts to script_dir. Runs at most once per
    // processor; concurrent callers wait for the first one.
    Result<void> deploy_scripts(RemoteChannel& ch);
    int deploy_count() const;

    // Run the extraction collaborator into work_dir. A failed attempt
    // removes the partial item directory before the next one.
    Result<void> extract(RemoteChannel& ch, const std::string& stem,
                         const std::string& archive_name);

    // Run the validation collaborator and count issue markers in its report.
    Result<CheckOutcome> check(RemoteChannel& ch, const std::string& stem);

    // Copy a remote report into local_dir.
    Result<fs::path> fetch_report(RemoteChannel& ch, const std::string& remote_report,
                                  const fs::path& local_dir);

    // Entry count of the item's sample.json; 0 when there is none.
    Result<int> sanity_probe(RemoteChannel& ch, const std::string& data_dir) const;

    // Move the work directory to final_dir, replacing any previous copy.
    // Calling it again after success is a no-op.
    Result<void> finalize(RemoteChannel& ch, const std::string& stem);

    // Rename into done/, delete or keep the uploaded archive and manifest.
    Result<void> dispose_archive(RemoteChannel& ch, const std::string& stem,
                                 const std::string& archive_name);

    Result<void> write_marker(RemoteChannel& ch, const std::string& stem, Stage stage);
    Result<std::optional<StatusMarker>> read_marker(RemoteChannel& ch, const std::string& stem) const;

    // Best effort: failures are logged locally only.
    void log_outcome(RemoteChannel& ch, const OutcomeRecord& rec) const;

    // ── Paths ────────────────────────────────────────────────
    std::string archive_path(const std::string& archive_name) const;
    std::string manifest_path(const std::string& stem) const;
    std::string work_path(const std::string& stem) const;
    std::string final_path(const std::string& stem) const;
    std::string marker_path(const std::string& stem) const;
    std::string report_path(const std::string& stem) const;

    const RemoteConfig& remote() const { return remote_; }
    const ProcessingConfig& processing() const { return processing_; }

private:
    Result<void> deploy_file(RemoteChannel& ch, const std::string& local) const;
    std::string remote_script(const std::string& local) const;

    RemoteConfig remote_;
    ProcessingConfig processing_;
    std::chrono::milliseconds retry_delay_;

    mutable std::mutex deploy_mutex_;
    bool deployed_ = false;
    int deploy_count_ = 0;
};
