#include "item_pipeline.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/archive.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <exception>

Item Item::from_manifest(const fs::path& manifest, const fs::path& temp_dir) {
    Item item;
    item.stem = manifest.stem().string();
    item.archive_name = normalize_archive_name(item.stem) + ARCHIVE_EXTENSION;
    item.manifest = manifest;
    item.local_archive = temp_dir / item.archive_name;
    return item;
}

Result<std::vector<Item>> discover_items(const fs::path& manifest_dir, const fs::path& temp_dir) {
    std::error_code ec;
    if (!fs::is_directory(manifest_dir, ec)) {
        return Result<std::vector<Item>>::Err("not a directory: " + manifest_dir.string());
    }

    std::vector<fs::path> manifests;
    for (const auto& entry : fs::directory_iterator(manifest_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == MANIFEST_EXTENSION) {
            manifests.push_back(entry.path());
        }
    }
    if (ec) {
        return Result<std::vector<Item>>::Err("cannot list " + manifest_dir.string() + ": " + ec.message());
    }
    std::sort(manifests.begin(), manifests.end());

    std::vector<Item> items;
    items.reserve(manifests.size());
    for (const auto& m : manifests) items.push_back(Item::from_manifest(m, temp_dir));
    return Result<std::vector<Item>>::Ok(items);
}

bool ItemOutcome::did(const std::string& step) const {
    return std::find(steps.begin(), steps.end(), step) != steps.end();
}

ItemPipeline::ItemPipeline(StateStore& store, RemoteProcessor& processor, ArchiveSource& source,
                           TransferOptions transfer, fs::path report_dir, StatusCallback status)
    : store_(store), processor_(processor), source_(source), transfer_(std::move(transfer)),
      report_dir_(std::move(report_dir)), status_(std::move(status)) {}

void ItemPipeline::status(const std::string& msg) const {
    ferry_log("[item] " + msg);
    if (status_) status_(msg);
}

// Record a stage only if it moves the item forward.
void ItemPipeline::advance(const std::string& stem, Stage stage) {
    auto current = store_.get(stem);
    if (current && current->stage != Stage::FAILED && !stage_after(stage, current->stage)) {
        return;
    }
    auto r = store_.update(stem, stage);
    if (r.is_err()) ferry_log("[item] " + stem + ": state not saved: " + r.error);
}

ItemOutcome& ItemPipeline::fail(ItemOutcome& outcome, const std::string& step,
                                const std::string& error) {
    outcome.stage = Stage::FAILED;
    outcome.failed_stage = step;
    outcome.error = fmt::format("{} failed: {}", step, error);
    auto r = store_.update(outcome.stem, Stage::FAILED, outcome.error);
    if (r.is_err()) ferry_log("[item] " + outcome.stem + ": state not saved: " + r.error);
    status(outcome.stem + ": " + outcome.error);
    return outcome;
}

// ── Local archive ────────────────────────────────────────────

bool ItemPipeline::local_archive_ready(const Item& item) const {
    std::error_code ec;
    if (!fs::is_regular_file(item.local_archive, ec)) return false;
    {
        std::lock_guard<std::mutex> lock(fetched_mutex_);
        if (fetched_.count(item.stem)) return true;
    }
    if (store_.reached(item.stem, Stage::DOWNLOADED)) return true;

    auto v = platform::verify_archive(item.local_archive);
    if (v.is_err()) {
        ferry_log(fmt::format("[item] {}: local archive unusable ({})", item.stem, v.error));
        return false;
    }
    return true;
}

Result<void> ItemPipeline::ensure_local_archive(const Item& item, ItemOutcome& outcome) {
    if (local_archive_ready(item)) {
        advance(item.stem, Stage::DOWNLOADED);
        return Result<void>::Ok();
    }

    status(fmt::format("{}: downloading {}", item.stem, item.archive_name));
    auto source = source_.open(item.archive_name);
    if (!source) {
        fail(outcome, "download", "no source for " + item.archive_name);
        return Result<void>::Err(outcome.error);
    }
    auto r = download_file(*source, item.local_archive, transfer_);
    if (r.is_err()) {
        fail(outcome, "download", r.error);
        return Result<void>::Err(outcome.error);
    }

    outcome.steps.push_back("download");
    {
        std::lock_guard<std::mutex> lock(fetched_mutex_);
        fetched_.insert(item.stem);
    }
    advance(item.stem, Stage::DOWNLOADED);
    return Result<void>::Ok();
}

bool ItemPipeline::needs_local_archive(const Item& item, const RemoteSnapshot& snap) const {
    if (snap.has_final(item.stem)) return false;
    if (snap.has_archive(item.archive_name)) return false;
    if (snap.has_work(item.stem) &&
        (snap.has_marker(item.stem) || store_.can_skip_upload(item.stem))) {
        return false;
    }
    return true;
}

Result<void> ItemPipeline::prefetch(const Item& item, ItemOutcome& outcome) {
    outcome.stem = item.stem;
    try {
        return ensure_local_archive(item, outcome);
    } catch (const std::exception& e) {
        fail(outcome, "download", e.what());
        return Result<void>::Err(outcome.error);
    }
}

ItemOutcome ItemPipeline::abort(const Item& item, const std::string& step, const std::string& error) {
    ItemOutcome outcome;
    outcome.stem = item.stem;
    fail(outcome, step, error);
    return outcome;
}

// ── State machine ────────────────────────────────────────────

ItemOutcome ItemPipeline::run(RemoteChannel& ch, const Item& item, const RemoteSnapshot& snap) {
    ItemOutcome outcome;
    outcome.stem = item.stem;
    auto started = std::chrono::steady_clock::now();

    try {
        drive(ch, item, snap, outcome);
    } catch (const std::exception& e) {
        fail(outcome, outcome.steps.empty() ? "classify" : outcome.steps.back(), e.what());
    }

    outcome.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();

    if (!outcome.already_complete) {
        OutcomeRecord rec;
        rec.item = outcome.stem;
        rec.status = stage_name(outcome.stage);
        rec.count = outcome.count;
        rec.error = outcome.error;
        rec.duration_seconds = outcome.duration_seconds;
        rec.steps = outcome.steps;
        processor_.log_outcome(ch, rec);
    }
    return outcome;
}

void ItemPipeline::drive(RemoteChannel& ch, const Item& item, const RemoteSnapshot& snap,
                         ItemOutcome& outcome) {
    const std::string& stem = item.stem;
    const std::string work = processor_.work_path(stem);

    // Finalized earlier: done if the probe agrees, otherwise start over
    if (snap.has_final(stem)) {
        const std::string final_dir = processor_.final_path(stem);
        auto count = processor_.sanity_probe(ch, final_dir);
        if (count.is_err()) {
            fail(outcome, "classify", count.error);
            return;
        }
        if (count.value > 0) {
            outcome.already_complete = true;
            outcome.count = count.value;
            outcome.stage = Stage::COMPLETED;
            advance(stem, Stage::COMPLETED);
            status(fmt::format("{}: already complete ({} entries)", stem, count.value));
            return;
        }
        status(stem + ": finalized directory failed the sanity probe, reprocessing");
        auto rm = ch.remove_tree(final_dir);
        if (rm.is_err()) {
            fail(outcome, "classify", rm.error);
            return;
        }
        auto r = store_.update(stem, Stage::PENDING, "finalized directory failed sanity probe");
        if (r.is_err()) ferry_log("[item] " + stem + ": state not saved: " + r.error);
    }

    // Extracted earlier: keep only a complete work directory
    bool extracted = false;
    if (snap.has_work(stem)) {
        bool marked = store_.can_skip_upload(stem);
        auto marker = processor_.read_marker(ch, stem);
        if (marker.is_err()) {
            fail(outcome, "classify", marker.error);
            return;
        }
        if (marker.value) {
            auto st = parse_stage(marker.value->stage);
            marked = marked || (st && (*st == Stage::PROCESSED || stage_after(*st, Stage::PROCESSED)));
        }
        if (marked) {
            auto count = processor_.sanity_probe(ch, work);
            if (count.is_err()) {
                fail(outcome, "classify", count.error);
                return;
            }
            if (count.value > 0) {
                extracted = true;
                outcome.count = count.value;
            }
        }
        if (!extracted) {
            status(stem + ": discarding partial work directory");
            auto rm = ch.remove_tree(work);
            if (rm.is_err()) {
                fail(outcome, "classify", rm.error);
                return;
            }
        }
    }

    if (!extracted) {
        // The uploaded archive outranks anything recorded locally
        if (!snap.has_archive(item.archive_name)) {
            if (ensure_local_archive(item, outcome).is_err()) return;

            status(fmt::format("{}: uploading {}", stem, item.archive_name));
            auto up = upload_file(ch, item.local_archive, processor_.archive_path(item.archive_name),
                                  transfer_);
            if (up.is_err()) {
                fail(outcome, "upload", up.error);
                return;
            }
            outcome.steps.push_back("upload");
        }
        advance(stem, Stage::UPLOADED);

        auto manifest_present = ch.file_exists(processor_.manifest_path(stem));
        if (manifest_present.is_err()) {
            fail(outcome, "upload", manifest_present.error);
            return;
        }
        if (!manifest_present.value) {
            auto up = upload_file(ch, item.manifest, processor_.manifest_path(stem), transfer_);
            if (up.is_err()) {
                fail(outcome, "upload", "manifest: " + up.error);
                return;
            }
        }

        auto deployed = processor_.deploy_scripts(ch);
        if (deployed.is_err()) {
            fail(outcome, "extract", deployed.error);
            return;
        }

        status(stem + ": extracting");
        outcome.steps.push_back("extract");
        auto ex = processor_.extract(ch, stem, item.archive_name);
        if (ex.is_err()) {
            fail(outcome, "extract", ex.error);
            return;
        }
        auto count = processor_.sanity_probe(ch, work);
        if (count.is_err()) {
            fail(outcome, "extract", count.error);
            return;
        }
        if (count.value == 0) {
            auto rm = ch.remove_tree(work);
            if (rm.is_err()) ferry_log("[item] " + stem + ": cleanup failed: " + rm.error);
            fail(outcome, "extract", "output has no sample entries");
            return;
        }
        outcome.count = count.value;
    }
    advance(stem, Stage::PROCESSED);

    auto deployed = processor_.deploy_scripts(ch);
    if (deployed.is_err()) {
        fail(outcome, "check", deployed.error);
        return;
    }

    status(stem + ": checking");
    outcome.steps.push_back("check");
    auto checked = processor_.check(ch, stem);
    if (checked.is_err()) {
        fail(outcome, "check", checked.error);
        return;
    }
    if (checked.value.issues > 0) {
        outcome.issues = checked.value.issues;
        outcome.stage = Stage::CHECKED;
        outcome.error = fmt::format("{} problem frames", checked.value.issues);
        auto report = processor_.fetch_report(ch, checked.value.remote_report, report_dir_);
        if (report.is_ok()) {
            outcome.report = report.value;
        } else {
            ferry_log("[item] " + stem + ": report not downloaded: " + report.error);
        }
        auto r = store_.update(stem, Stage::CHECKED, outcome.error);
        if (r.is_err()) ferry_log("[item] " + stem + ": state not saved: " + r.error);
        status(stem + ": " + outcome.error);
        return;
    }
    advance(stem, Stage::CHECKED);

    status(stem + ": finalizing");
    outcome.steps.push_back("finalize");
    auto fin = processor_.finalize(ch, stem);
    if (fin.is_err()) {
        fail(outcome, "finalize", fin.error);
        return;
    }
    outcome.stage = Stage::COMPLETED;
    advance(stem, Stage::COMPLETED);

    // Only now are the archive copies expendable
    std::error_code ec;
    fs::remove(item.local_archive, ec);
    fs::remove(download_temp_path(item.local_archive), ec);
    auto disposed = processor_.dispose_archive(ch, stem, item.archive_name);
    if (disposed.is_err()) {
        ferry_log("[item] " + stem + ": archive left in place: " + disposed.error);
    }
    status(fmt::format("{}: completed ({} entries)", stem, outcome.count));
}
