#include "remote_processor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/retry.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <transfer/transfer.hpp>
#include <json/json.h>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

RemoteProcessor::RemoteProcessor(RemoteConfig remote, ProcessingConfig processing,
                                 std::chrono::milliseconds retry_delay)
    : remote_(std::move(remote)), processing_(std::move(processing)), retry_delay_(retry_delay) {}

// ── Paths ────────────────────────────────────────────────────

std::string RemoteProcessor::archive_path(const std::string& archive_name) const {
    return remote_.archive_dir + "/" + archive_name;
}

std::string RemoteProcessor::manifest_path(const std::string& stem) const {
    return remote_.archive_dir + "/" + stem + MANIFEST_EXTENSION;
}

std::string RemoteProcessor::work_path(const std::string& stem) const {
    return remote_.work_dir + "/" + stem;
}

std::string RemoteProcessor::final_path(const std::string& stem) const {
    return remote_.final_dir + "/" + stem;
}

std::string RemoteProcessor::marker_path(const std::string& stem) const {
    return fmt::format("{}/{}/{}.status", remote_.work_dir, STATUS_MARKER_DIR, stem);
}

std::string RemoteProcessor::report_path(const std::string& stem) const {
    return fmt::format("{}/{}/reports/report_{}.txt", remote_.work_dir, STATUS_MARKER_DIR, stem);
}

std::string RemoteProcessor::remote_script(const std::string& local) const {
    return remote_.script_dir + "/" + fs::path(local).filename().string();
}

static std::string stderr_tail(const SSHResult& r) {
    std::string err = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
    trim(err);
    return truncate_text(err, STDERR_KEEP_CHARS);
}

// ── Snapshot ─────────────────────────────────────────────────

Result<RemoteSnapshot> RemoteProcessor::snapshot(RemoteChannel& ch) const {
    RemoteSnapshot snap;

    auto archives = ch.list(remote_.archive_dir, std::string("*") + ARCHIVE_EXTENSION, EntryType::FILE);
    if (archives.is_err()) return Result<RemoteSnapshot>::Err(archives.error);
    snap.archives.insert(archives.value.begin(), archives.value.end());

    auto finals = ch.list(remote_.final_dir, "*", EntryType::DIRECTORY);
    if (finals.is_err()) return Result<RemoteSnapshot>::Err(finals.error);
    snap.finalized.insert(finals.value.begin(), finals.value.end());

    auto work = ch.list(remote_.work_dir, "*", EntryType::DIRECTORY);
    if (work.is_err()) return Result<RemoteSnapshot>::Err(work.error);
    for (const auto& name : work.value) {
        if (!name.empty() && name[0] != '.') snap.work_dirs.insert(name);
    }

    auto markers = ch.list(remote_.work_dir + "/" + STATUS_MARKER_DIR, "*.status", EntryType::FILE);
    if (markers.is_err()) return Result<RemoteSnapshot>::Err(markers.error);
    for (const auto& name : markers.value) {
        snap.markers.insert(name.substr(0, name.size() - std::string(".status").size()));
    }

    ferry_log(fmt::format("[snapshot] {} archive(s), {} finalized, {} in work, {} marker(s)",
                          snap.archives.size(), snap.finalized.size(), snap.work_dirs.size(),
                          snap.markers.size()));
    return Result<RemoteSnapshot>::Ok(snap);
}

// ── Script deployment ────────────────────────────────────────

Result<void> RemoteProcessor::deploy_file(RemoteChannel& ch, const std::string& local) const {
    if (local.empty()) return Result<void>::Ok();

    std::ifstream in(local, std::ios::binary);
    if (!in) return Result<void>::Err("cannot read " + local);
    std::stringstream buf;
    buf << in.rdbuf();

    auto w = ch.write_text(remote_script(local), buf.str());
    if (w.is_err()) return Result<void>::Err("deploying " + local + ": " + w.error);
    return Result<void>::Ok();
}

Result<void> RemoteProcessor::deploy_scripts(RemoteChannel& ch) {
    std::lock_guard<std::mutex> lock(deploy_mutex_);
    if (deployed_) return Result<void>::Ok();

    auto mk = ch.mkdir_p(remote_.script_dir);
    if (mk.is_err()) return mk;
    for (const auto& local : {processing_.extract_script, processing_.check_script,
                              processing_.check_config}) {
        auto r = deploy_file(ch, local);
        if (r.is_err()) return r;
    }

    deployed_ = true;
    ++deploy_count_;
    ferry_log("[deploy] collaborator scripts copied to " + remote_.script_dir);
    return Result<void>::Ok();
}

int RemoteProcessor::deploy_count() const {
    std::lock_guard<std::mutex> lock(deploy_mutex_);
    return deploy_count_;
}

// ── Extract ──────────────────────────────────────────────────

Result<void> RemoteProcessor::extract(RemoteChannel& ch, const std::string& stem,
                                      const std::string& archive_name) {
    std::string cmd = processing_.extract_command;
    cmd = replace_placeholder(cmd, "script", shell_quote(remote_script(processing_.extract_script)));
    cmd = replace_placeholder(cmd, "archive", shell_quote(archive_path(archive_name)));
    cmd = replace_placeholder(cmd, "manifest", shell_quote(manifest_path(stem)));
    cmd = replace_placeholder(cmd, "out", shell_quote(remote_.work_dir));
    cmd = replace_placeholder(cmd, "stem", shell_quote(stem));

    auto mk = ch.mkdir_p(remote_.work_dir);
    if (mk.is_err()) return mk;

    const std::string item_dir = work_path(stem);
    RetryPolicy policy;
    policy.max_attempts = processing_.extract_attempts;
    policy.base_delay = retry_delay_;

    auto attempt = [&](int n) -> Result<void> {
        auto conn = ch.ensure_connected();
        if (conn.is_err()) return conn;
        auto r = ch.run(cmd, EXTRACT_TIMEOUT_SECS);
        Result<void> outcome = Result<void>::Ok();
        if (r.failed()) {
            ferry_log_ssh(fmt::format("[extract] {} attempt {}", stem, n), cmd, r);
            outcome = Result<void>::Err(fmt::format("extraction failed (exit {}): {}",
                                                    r.exit_code, stderr_tail(r)));
        } else {
            auto present = ch.dir_exists(item_dir);
            if (present.is_err()) {
                outcome = Result<void>::Err(present.error);
            } else if (!present.value) {
                outcome = Result<void>::Err("extraction produced no " + item_dir);
            }
        }
        if (outcome.is_err()) {
            auto rm = ch.remove_tree(item_dir);
            if (rm.is_err()) ferry_log("[extract] cleanup failed: " + rm.error);
        }
        return outcome;
    };

    auto result = retry_with_backoff(policy, "extract " + stem, attempt);
    if (result.is_ok()) {
        auto m = write_marker(ch, stem, Stage::PROCESSED);
        if (m.is_err()) ferry_log("[extract] marker not written: " + m.error);
    }
    return result;
}

// ── Check ────────────────────────────────────────────────────

Result<CheckOutcome> RemoteProcessor::check(RemoteChannel& ch, const std::string& stem) {
    const std::string report = report_path(stem);
    auto mk = ch.mkdir_p(fs::path(report).parent_path().string());
    if (mk.is_err()) return Result<CheckOutcome>::Err(mk.error);
    auto rm = ch.remove_file(report);
    if (rm.is_err()) return Result<CheckOutcome>::Err(rm.error);

    std::string cmd = processing_.check_command;
    cmd = replace_placeholder(cmd, "script", shell_quote(remote_script(processing_.check_script)));
    cmd = replace_placeholder(cmd, "data", shell_quote(work_path(stem)));
    cmd = replace_placeholder(cmd, "config", shell_quote(remote_script(processing_.check_config)));
    cmd = replace_placeholder(cmd, "report", shell_quote(report));
    cmd = replace_placeholder(cmd, "stem", shell_quote(stem));

    auto r = ch.run(cmd, CHECK_TIMEOUT_SECS);
    if (r.failed()) {
        ferry_log_ssh("[check] " + stem, cmd, r);
        return Result<CheckOutcome>::Err(fmt::format("check script failed (exit {}): {}",
                                                     r.exit_code, stderr_tail(r)));
    }

    auto text = ch.read_text(report);
    if (text.is_err()) {
        return Result<CheckOutcome>::Err("cannot read report " + report + ": " + text.error);
    }

    CheckOutcome outcome;
    outcome.remote_report = report;
    const std::string& marker = processing_.issue_marker;
    if (!marker.empty()) {
        for (size_t pos = text.value.find(marker); pos != std::string::npos;
             pos = text.value.find(marker, pos + marker.size())) {
            ++outcome.issues;
        }
    }
    ferry_log(fmt::format("[check] {}: {} issue(s)", stem, outcome.issues));
    return Result<CheckOutcome>::Ok(outcome);
}

Result<fs::path> RemoteProcessor::fetch_report(RemoteChannel& ch, const std::string& remote_report,
                                               const fs::path& local_dir) {
    fs::path local = local_dir / fs::path(remote_report).filename();
    // A stale report from an earlier run is never resumed
    std::error_code ec;
    fs::remove(download_temp_path(local), ec);

    TransferOptions opts;
    opts.retry.max_attempts = 2;
    opts.retry.base_delay = retry_delay_;
    RemoteFileSource source(ch, remote_report);
    auto r = download_file(source, local, opts);
    if (r.is_err()) return Result<fs::path>::Err(r.error);
    return Result<fs::path>::Ok(local);
}

// ── Sanity probe ─────────────────────────────────────────────

Result<int> RemoteProcessor::sanity_probe(RemoteChannel& ch, const std::string& data_dir) const {
    for (const auto& candidate : {data_dir + "/sample.json", data_dir + "/undistorted/sample.json"}) {
        auto exists = ch.file_exists(candidate);
        if (exists.is_err()) return Result<int>::Err(exists.error);
        if (!exists.value) continue;

        std::string cmd = replace_placeholder(processing_.count_command, "file", shell_quote(candidate));
        auto r = ch.run(cmd);
        if (r.failed()) {
            ferry_log_ssh("[probe] count", cmd, r);
            return Result<int>::Ok(0);
        }
        std::string out = r.stdout_data;
        trim(out);
        int count = safe_stoi(out, 0);
        ferry_log(fmt::format("[probe] {}: {} entries", candidate, count));
        return Result<int>::Ok(count > 0 ? count : 0);
    }
    return Result<int>::Ok(0);
}

// ── Finalize ─────────────────────────────────────────────────

Result<void> RemoteProcessor::finalize(RemoteChannel& ch, const std::string& stem) {
    const std::string src = work_path(stem);
    const std::string dst = final_path(stem);

    auto have_src = ch.dir_exists(src);
    if (have_src.is_err()) return Result<void>::Err(have_src.error);
    if (!have_src.value) {
        auto have_dst = ch.dir_exists(dst);
        if (have_dst.is_err()) return Result<void>::Err(have_dst.error);
        if (have_dst.value) {
            ferry_log("[finalize] " + stem + " already in place");
            return Result<void>::Ok();
        }
        return Result<void>::Err("nothing to finalize: " + src + " does not exist");
    }

    auto mk = ch.mkdir_p(remote_.final_dir);
    if (mk.is_err()) return mk;
    auto rm = ch.remove_tree(dst);
    if (rm.is_err()) return rm;
    auto mv = ch.rename(src, dst);
    if (mv.is_err()) return mv;

    auto m = write_marker(ch, stem, Stage::COMPLETED);
    if (m.is_err()) ferry_log("[finalize] marker not written: " + m.error);
    ferry_log("[finalize] " + src + " -> " + dst);
    return Result<void>::Ok();
}

Result<void> RemoteProcessor::dispose_archive(RemoteChannel& ch, const std::string& stem,
                                              const std::string& archive_name) {
    auto rm = ch.remove_file(manifest_path(stem));
    if (rm.is_err()) return rm;

    const std::string path = archive_path(archive_name);
    switch (processing_.archive_after_process) {
        case ArchiveDisposition::KEEP:
            return Result<void>::Ok();
        case ArchiveDisposition::DELETE:
            return ch.remove_file(path);
        case ArchiveDisposition::RENAME: {
            auto present = ch.file_exists(path);
            if (present.is_err()) return Result<void>::Err(present.error);
            if (!present.value) return Result<void>::Ok();
            std::string done = remote_.archive_dir + "/" + ARCHIVE_DONE_SUBDIR;
            auto mk = ch.mkdir_p(done);
            if (mk.is_err()) return mk;
            return ch.rename(path, done + "/" + archive_name);
        }
    }
    return Result<void>::Ok();
}

// ── Status markers ───────────────────────────────────────────

Result<void> RemoteProcessor::write_marker(RemoteChannel& ch, const std::string& stem, Stage stage) {
    auto mk = ch.mkdir_p(remote_.work_dir + "/" + STATUS_MARKER_DIR);
    if (mk.is_err()) return mk;

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "stage" << YAML::Value << stage_name(stage);
    out << YAML::Key << "updated_at" << YAML::Value << now_iso();
    out << YAML::EndMap;
    return ch.write_text(marker_path(stem), std::string(out.c_str()) + "\n");
}

Result<std::optional<StatusMarker>> RemoteProcessor::read_marker(RemoteChannel& ch,
                                                                 const std::string& stem) const {
    using R = Result<std::optional<StatusMarker>>;
    const std::string path = marker_path(stem);
    auto exists = ch.file_exists(path);
    if (exists.is_err()) return R::Err(exists.error);
    if (!exists.value) return R::Ok(std::nullopt);

    auto text = ch.read_text(path);
    if (text.is_err()) return R::Err(text.error);
    try {
        YAML::Node node = YAML::Load(text.value);
        StatusMarker marker;
        marker.stage = node["stage"].as<std::string>("");
        marker.updated_at = node["updated_at"].as<std::string>("");
        return R::Ok(marker);
    } catch (const YAML::Exception& e) {
        ferry_log("[marker] unreadable " + path + ": " + e.what());
        return R::Ok(std::nullopt);
    }
}

// ── Remote processing log ────────────────────────────────────

void RemoteProcessor::log_outcome(RemoteChannel& ch, const OutcomeRecord& rec) const {
    if (remote_.log_dir.empty()) return;

    Json::Value entry(Json::objectValue);
    entry["timestamp"] = now_iso();
    entry["item"] = rec.item;
    entry["status"] = rec.status;
    entry["count"] = rec.count;
    entry["error"] = rec.error;
    entry["source_host"] = platform::hostname();
    entry["duration_seconds"] = rec.duration_seconds;
    entry["steps"] = Json::Value(Json::arrayValue);
    for (const auto& s : rec.steps) entry["steps"].append(s);

    // One record per line
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["precision"] = 6;
    const std::string line = Json::writeString(writer, entry);

    auto mk = ch.mkdir_p(remote_.log_dir);
    auto r = mk.is_ok() ? ch.append_line(remote_.log_dir + "/" + REMOTE_LOG_FILE, line) : mk;
    if (r.is_err()) {
        ferry_log("[remote-log] " + rec.item + " not recorded: " + r.error);
    }
}
