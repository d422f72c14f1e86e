#include <gtest/gtest.h>
#include "fake_remote.hpp"
#include <managers/item_pipeline.hpp>
#include <managers/remote_processor.hpp>
#include <managers/state_store.hpp>
#include <json/json.h>
#include <sstream>
#include <memory>

namespace {

// Every line of pipeline.log parsed as one JSON object
std::vector<Json::Value> read_log_records(const fs::path& path) {
    std::vector<Json::Value> records;
    std::istringstream in(read_file(path));
    std::string line;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    while (std::getline(in, line)) {
        Json::Value v;
        std::string errs;
        EXPECT_TRUE(reader->parse(line.data(), line.data() + line.size(), &v, &errs))
            << errs << " in: " << line;
        records.push_back(v);
    }
    return records;
}

const char* kExtract = "mkdir -p {out}/{stem} && printf 'a\\nb\\nc\\n' > {out}/{stem}/sample.json";
const char* kCheckPass = ": > {report}";
const char* kCheckThreeFrames = "printf 'frame: 1\\nframe: 2\\nframe: 3\\n' > {report}";

class ItemPipelineTest : public ::testing::Test {
protected:
    TempDir tmp;
    FakeRemote remote{tmp / "scratch"};
    RemoteConfig rcfg;
    ProcessingConfig pcfg;
    TransferOptions topts;
    std::unique_ptr<StateStore> store;
    std::unique_ptr<FakeArchiveSource> source;
    std::unique_ptr<RemoteProcessor> processor;
    std::unique_ptr<ItemPipeline> pipeline;
    std::vector<Stage> transitions;

    void SetUp() override {
        rcfg.archive_dir = (tmp / "remote/archives").string();
        rcfg.work_dir = (tmp / "remote/work").string();
        rcfg.final_dir = (tmp / "remote/final").string();
        rcfg.log_dir = (tmp / "remote/logs").string();
        rcfg.script_dir = (tmp / "remote/scripts").string();
        fs::create_directories(rcfg.archive_dir);

        pcfg.extract_command = kExtract;
        pcfg.check_command = kCheckPass;
        pcfg.count_command = "wc -l < {file}";
        pcfg.extract_attempts = 2;

        topts.chunk_bytes = 256 * 1024;
        topts.retry.max_attempts = 3;
        topts.retry.base_delay = std::chrono::milliseconds(0);

        build();
    }

    // (Re)create everything above the filesystem, as a restarted process would
    void build() {
        pipeline.reset();
        processor.reset();
        store = std::make_unique<StateStore>(tmp / "state/pipeline_state.yaml");
        store->set_listener([this](const ItemRecord& rec) { transitions.push_back(rec.stage); });
        source = std::make_unique<FakeArchiveSource>(tmp / "origin");
        processor = std::make_unique<RemoteProcessor>(rcfg, pcfg, std::chrono::milliseconds(0));
        pipeline = std::make_unique<ItemPipeline>(*store, *processor, *source, topts,
                                                  tmp / "reports");
    }

    Item make_item(const std::string& stem, size_t archive_bytes = 64 * 1024) {
        fs::path manifest = tmp / "manifests" / (stem + ".json");
        write_text_file(manifest, "{\"frames\": 3}\n");
        Item item = Item::from_manifest(manifest, tmp / "temp");
        write_random_file(tmp / "origin" / item.archive_name, archive_bytes, 17);
        return item;
    }

    RemoteSnapshot snap() {
        auto s = processor->snapshot(remote);
        EXPECT_TRUE(s.is_ok()) << s.error;
        return s.value;
    }

    ItemOutcome run(const Item& item) { return pipeline->run(remote, item, snap()); }

    fs::path final_dir(const std::string& stem) { return tmp / "remote/final" / stem; }
    fs::path work_dir(const std::string& stem) { return tmp / "remote/work" / stem; }
    fs::path remote_archive(const Item& item) { return tmp / "remote/archives" / item.archive_name; }
};

} // namespace

// ── Discovery ───────────────────────────────────────────────

TEST(Discovery, ManifestsSortedAndNormalized) {
    TempDir tmp;
    write_text_file(tmp / "m/zeta.json", "{}");
    write_text_file(tmp / "m/alpha_rere_2.json", "{}");
    write_text_file(tmp / "m/notes.txt", "x");
    fs::create_directories(tmp / "m/nested.json");

    auto items = discover_items(tmp / "m", tmp / "t");
    ASSERT_TRUE(items.is_ok()) << items.error;
    ASSERT_EQ(items.value.size(), 2u);
    EXPECT_EQ(items.value[0].stem, "alpha_rere_2");
    EXPECT_EQ(items.value[0].archive_name, "alpha.zip");
    EXPECT_EQ(items.value[0].local_archive, tmp / "t/alpha.zip");
    EXPECT_EQ(items.value[1].stem, "zeta");
    EXPECT_EQ(items.value[1].archive_name, "zeta.zip");
}

TEST(Discovery, MissingDirectoryIsAnError) {
    TempDir tmp;
    EXPECT_TRUE(discover_items(tmp / "nope", tmp / "t").is_err());
}

// ── Fresh items ─────────────────────────────────────────────

TEST_F(ItemPipelineTest, FreshItemRunsEveryStage) {
    Item item = make_item("scene_a");

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_FALSE(out.already_complete);
    EXPECT_EQ(out.count, 3);
    EXPECT_EQ(out.steps,
              (std::vector<std::string>{"download", "upload", "extract", "check", "finalize"}));

    EXPECT_TRUE(fs::exists(final_dir("scene_a") / "sample.json"));
    EXPECT_FALSE(fs::exists(work_dir("scene_a")));
    EXPECT_TRUE(fs::exists(tmp / "remote/archives/done" / item.archive_name));
    EXPECT_FALSE(fs::exists(remote_archive(item)));
    EXPECT_FALSE(fs::exists(tmp / "remote/archives/scene_a.json"));
    EXPECT_FALSE(fs::exists(item.local_archive));

    auto rec = store->get("scene_a");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->stage, Stage::COMPLETED);
    EXPECT_EQ(transitions, (std::vector<Stage>{Stage::DOWNLOADED, Stage::UPLOADED, Stage::PROCESSED,
                                               Stage::CHECKED, Stage::COMPLETED}));

    std::string log = read_file(tmp / "remote/logs/pipeline.log");
    EXPECT_NE(log.find("scene_a"), std::string::npos);
    EXPECT_NE(log.find("completed"), std::string::npos);
    EXPECT_NE(log.find("finalize"), std::string::npos);
}

TEST_F(ItemPipelineTest, DeleteDispositionRemovesArchive) {
    pcfg.archive_after_process = ArchiveDisposition::DELETE;
    build();
    Item item = make_item("scene_a");

    ASSERT_EQ(run(item).stage, Stage::COMPLETED);
    EXPECT_FALSE(fs::exists(remote_archive(item)));
    EXPECT_FALSE(fs::exists(tmp / "remote/archives/done" / item.archive_name));
}

TEST_F(ItemPipelineTest, InterruptedUploadResumesFromCheckpoint) {
    const size_t total = 10 * 1024 * 1024;
    pcfg.archive_after_process = ArchiveDisposition::KEEP;
    topts.chunk_bytes = 1024 * 1024;
    build();
    Item item = make_item("big", total);
    remote.fail_after_bytes = 4194304;

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;

    // Only the bytes after the checkpoint were sent again
    EXPECT_LT(remote.bytes_written.load(), total + 1024 * 1024);
    EXPECT_EQ(md5_of(remote_archive(item)), md5_of(tmp / "origin" / item.archive_name));
    EXPECT_EQ(transitions, (std::vector<Stage>{Stage::DOWNLOADED, Stage::UPLOADED, Stage::PROCESSED,
                                               Stage::CHECKED, Stage::COMPLETED}));
}

TEST_F(ItemPipelineTest, UploadResumesAfterRestart) {
    const size_t total = 2 * 1024 * 1024;
    topts.retry.max_attempts = 1;
    build();
    Item item = make_item("big", total);

    remote.fail_after_bytes = 1024 * 1024;
    remote.drop_on_fault = true;
    auto first = run(item);
    ASSERT_EQ(first.stage, Stage::FAILED);
    EXPECT_EQ(first.failed_stage, "upload");
    EXPECT_TRUE(fs::exists(item.local_archive));

    // A failed record vouches for nothing, so the local archive may be
    // fetched again; the worker-side checkpoint still holds
    remote.reconnect();
    build();
    auto second = run(item);
    ASSERT_EQ(second.stage, Stage::COMPLETED) << second.error;
    EXPECT_TRUE(second.did("upload"));
    EXPECT_LT(remote.bytes_written.load(), total + 512 * 1024);
}

TEST_F(ItemPipelineTest, ConnectionResetDuringUploadIsReopened) {
    const size_t total = 2 * 1024 * 1024;
    Item item = make_item("big", total);
    remote.fail_after_bytes = 1024 * 1024;
    remote.drop_on_fault = true;

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_EQ(remote.reconnects.load(), 1);
    EXPECT_LT(remote.bytes_written.load(), total + 512 * 1024);
    EXPECT_EQ(md5_of(remote_archive(item)), md5_of(tmp / "origin" / item.archive_name));
}

// ── Validation ──────────────────────────────────────────────

TEST_F(ItemPipelineTest, ProblemFramesStopBeforeFinalize) {
    pcfg.check_command = kCheckThreeFrames;
    build();
    Item item = make_item("scene_b");

    auto out = run(item);
    EXPECT_EQ(out.stage, Stage::CHECKED);
    EXPECT_TRUE(out.check_failed());
    EXPECT_EQ(out.issues, 3);
    EXPECT_EQ(out.error, "3 problem frames");
    EXPECT_FALSE(out.did("finalize"));

    EXPECT_EQ(out.report, tmp / "reports/report_scene_b.txt");
    ASSERT_TRUE(fs::exists(out.report));
    EXPECT_NE(read_file(out.report).find("frame: 2"), std::string::npos);

    EXPECT_FALSE(fs::exists(final_dir("scene_b")));
    EXPECT_TRUE(fs::exists(work_dir("scene_b") / "sample.json"));
    EXPECT_TRUE(fs::exists(remote_archive(item)));

    auto rec = store->get("scene_b");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->stage, Stage::CHECKED);
    EXPECT_EQ(rec->last_error, "3 problem frames");
}

TEST_F(ItemPipelineTest, ExtractedWorkIsReusedOnRerun) {
    pcfg.check_command = kCheckThreeFrames;
    build();
    Item item = make_item("scene_b");
    ASSERT_EQ(run(item).stage, Stage::CHECKED);

    pcfg.check_command = kCheckPass;
    build();
    int extracts_before = remote.count_commands("printf 'a");

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_EQ(out.steps, (std::vector<std::string>{"check", "finalize"}));
    EXPECT_EQ(remote.count_commands("printf 'a"), extracts_before);
    EXPECT_TRUE(fs::exists(final_dir("scene_b") / "sample.json"));
}

// ── Skips and recovery ──────────────────────────────────────

TEST_F(ItemPipelineTest, CompletedItemDoesNoWork) {
    Item item = make_item("scene_c");
    ASSERT_EQ(run(item).stage, Stage::COMPLETED);

    int opens = source->total_opens();
    uint64_t written = remote.bytes_written;
    int extracts = remote.count_commands("printf 'a");
    std::string log_before = read_file(tmp / "remote/logs/pipeline.log");

    build();
    auto out = run(item);
    EXPECT_EQ(out.stage, Stage::COMPLETED);
    EXPECT_TRUE(out.already_complete);
    EXPECT_TRUE(out.steps.empty());
    EXPECT_EQ(out.count, 3);
    EXPECT_EQ(source->total_opens(), 0);
    EXPECT_EQ(opens, 1);
    EXPECT_EQ(remote.bytes_written.load(), written);
    EXPECT_EQ(remote.count_commands("printf 'a"), extracts);
    EXPECT_EQ(read_file(tmp / "remote/logs/pipeline.log"), log_before);
}

TEST_F(ItemPipelineTest, FinalizedDirectoryFailingProbeIsReprocessed) {
    Item item = make_item("scene_d");
    fs::create_directories(final_dir("scene_d"));
    write_text_file(final_dir("scene_d") / "stale.txt", "x");

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_FALSE(out.already_complete);
    EXPECT_TRUE(out.did("extract"));
    EXPECT_TRUE(fs::exists(final_dir("scene_d") / "sample.json"));
    EXPECT_FALSE(fs::exists(final_dir("scene_d") / "stale.txt"));
}

TEST_F(ItemPipelineTest, UploadedArchiveSkipsTransfers) {
    Item item = make_item("scene_e");
    fs::copy_file(tmp / "origin" / item.archive_name, remote_archive(item));

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_FALSE(out.did("download"));
    EXPECT_FALSE(out.did("upload"));
    EXPECT_EQ(source->total_opens(), 0);
}

TEST_F(ItemPipelineTest, PartialWorkDirectoryIsDiscarded) {
    Item item = make_item("scene_f");
    write_text_file(work_dir("scene_f") / "half_written.bin", "xx");

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_TRUE(out.did("extract"));
    EXPECT_FALSE(fs::exists(final_dir("scene_f") / "half_written.bin"));
}

TEST_F(ItemPipelineTest, RecordedStageWithoutEvidenceDoesNotSkip) {
    Item item = make_item("scene_g");
    ASSERT_TRUE(store->update("scene_g", Stage::COMPLETED).is_ok());
    transitions.clear();

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_TRUE(out.did("upload"));
    EXPECT_TRUE(out.did("extract"));
    // Never recorded a stage behind the one already stored
    for (Stage s : transitions) EXPECT_EQ(s, Stage::COMPLETED);
}

TEST_F(ItemPipelineTest, StagesNeverMoveBackward) {
    Item item = make_item("scene_h");
    ASSERT_TRUE(store->update("scene_h", Stage::PROCESSED).is_ok());
    transitions.clear();

    pcfg.check_command = kCheckThreeFrames;
    build();
    run(item);

    Stage last = Stage::PROCESSED;
    for (Stage s : transitions) {
        EXPECT_TRUE(s == last || stage_after(s, last)) << stage_name(s) << " after " << stage_name(last);
        last = s;
    }
}

// ── Failures ────────────────────────────────────────────────

TEST_F(ItemPipelineTest, MissingSourceArchiveFailsDownload) {
    Item item = make_item("scene_i");
    fs::remove(tmp / "origin" / item.archive_name);

    auto out = run(item);
    EXPECT_EQ(out.stage, Stage::FAILED);
    EXPECT_EQ(out.failed_stage, "download");
    auto rec = store->get("scene_i");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->stage, Stage::FAILED);
    EXPECT_EQ(rec->last_error.rfind("download failed", 0), 0u);
    EXPECT_FALSE(fs::exists(remote_archive(item)));
}

TEST_F(ItemPipelineTest, ExtractionRetriesAfterCleaningUp) {
    // Fails once leaving junk behind, then succeeds
    pcfg.extract_command =
        "if [ -f {out}/tried ]; then " + std::string(kExtract) +
        "; else mkdir -p {out}/{stem} && touch {out}/{stem}/junk {out}/tried && exit 3; fi";
    build();
    Item item = make_item("scene_j");

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_FALSE(fs::exists(final_dir("scene_j") / "junk"));
}

TEST_F(ItemPipelineTest, ExtractionFailureRemovesPartialOutput) {
    pcfg.extract_command = "mkdir -p {out}/{stem} && echo 'bad zip' >&2 && exit 3";
    build();
    Item item = make_item("scene_k");

    auto out = run(item);
    EXPECT_EQ(out.stage, Stage::FAILED);
    EXPECT_EQ(out.failed_stage, "extract");
    EXPECT_NE(out.error.find("bad zip"), std::string::npos);
    EXPECT_FALSE(fs::exists(work_dir("scene_k")));
    EXPECT_EQ(remote.count_commands("bad zip"), 2);
    EXPECT_TRUE(fs::exists(remote_archive(item)));
}

TEST_F(ItemPipelineTest, OutcomeRecordWithControlCharactersIsValidJson) {
    pcfg.extract_command = "printf '\\033[31mERROR\\033[0m \"bad\" zip\\n' >&2; exit 3";
    build();
    Item item = make_item("scene_m");

    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::FAILED);

    auto records = read_log_records(tmp / "remote/logs/pipeline.log");
    ASSERT_EQ(records.size(), 1u);
    const Json::Value& rec = records[0];
    EXPECT_EQ(rec["item"].asString(), "scene_m");
    EXPECT_EQ(rec["status"].asString(), "failed");
    EXPECT_NE(rec["error"].asString().find("\x1b[31mERROR\x1b[0m \"bad\" zip"), std::string::npos);
    EXPECT_FALSE(rec["source_host"].asString().empty());
    EXPECT_TRUE(rec["duration_seconds"].isNumeric());
    ASSERT_TRUE(rec["steps"].isArray());
    EXPECT_EQ(rec["steps"][0u].asString(), "download");
}

TEST_F(ItemPipelineTest, EmptyExtractionOutputFails) {
    pcfg.extract_command = "mkdir -p {out}/{stem} && : > {out}/{stem}/sample.json";
    build();
    Item item = make_item("scene_l");

    auto out = run(item);
    EXPECT_EQ(out.stage, Stage::FAILED);
    EXPECT_EQ(out.error, "extract failed: output has no sample entries");
    EXPECT_FALSE(fs::exists(final_dir("scene_l")));
}

TEST_F(ItemPipelineTest, FailedCheckScriptFailsItem) {
    pcfg.check_command = "exit 2";
    build();
    Item item = make_item("scene_m");

    auto out = run(item);
    EXPECT_EQ(out.stage, Stage::FAILED);
    EXPECT_EQ(out.failed_stage, "check");
    EXPECT_FALSE(fs::exists(final_dir("scene_m")));
}

TEST_F(ItemPipelineTest, PrefetchRecordsDownloaded) {
    Item item = make_item("scene_n");
    ItemOutcome outcome;

    ASSERT_TRUE(pipeline->prefetch(item, outcome).is_ok());
    EXPECT_TRUE(fs::exists(item.local_archive));
    EXPECT_TRUE(outcome.did("download"));
    EXPECT_EQ(store->get("scene_n")->stage, Stage::DOWNLOADED);

    // The run itself finds the archive ready
    auto out = run(item);
    ASSERT_EQ(out.stage, Stage::COMPLETED) << out.error;
    EXPECT_FALSE(out.did("download"));
    EXPECT_EQ(source->total_opens(), 1);
}

TEST_F(ItemPipelineTest, NeedsLocalArchiveFollowsSnapshot) {
    Item item = make_item("scene_o");
    EXPECT_TRUE(pipeline->needs_local_archive(item, snap()));

    fs::copy_file(tmp / "origin" / item.archive_name, remote_archive(item));
    EXPECT_FALSE(pipeline->needs_local_archive(item, snap()));

    fs::remove(remote_archive(item));
    fs::create_directories(final_dir("scene_o"));
    EXPECT_FALSE(pipeline->needs_local_archive(item, snap()));
}

// ── Remote processor pieces ─────────────────────────────────

TEST_F(ItemPipelineTest, FinalizeIsIdempotent) {
    write_text_file(work_dir("scene_p") / "sample.json", "a\n");

    ASSERT_TRUE(processor->finalize(remote, "scene_p").is_ok());
    ASSERT_TRUE(processor->finalize(remote, "scene_p").is_ok());
    EXPECT_TRUE(fs::exists(final_dir("scene_p") / "sample.json"));
    EXPECT_TRUE(processor->finalize(remote, "never_extracted").is_err());
}

TEST_F(ItemPipelineTest, FinalizeReplacesPreviousCopy) {
    write_text_file(final_dir("scene_q") / "old.txt", "old");
    write_text_file(work_dir("scene_q") / "sample.json", "a\n");

    ASSERT_TRUE(processor->finalize(remote, "scene_q").is_ok());
    EXPECT_FALSE(fs::exists(final_dir("scene_q") / "old.txt"));
    EXPECT_TRUE(fs::exists(final_dir("scene_q") / "sample.json"));
}

TEST_F(ItemPipelineTest, SanityProbeFindsNestedSample) {
    write_text_file(work_dir("scene_r") / "undistorted/sample.json", "a\nb\n");
    auto r = processor->sanity_probe(remote, work_dir("scene_r").string());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 2);

    auto none = processor->sanity_probe(remote, work_dir("missing").string());
    ASSERT_TRUE(none.is_ok());
    EXPECT_EQ(none.value, 0);
}

TEST_F(ItemPipelineTest, SnapshotSeparatesMarkersFromWork) {
    write_text_file(work_dir("scene_s") / "sample.json", "a\n");
    ASSERT_TRUE(processor->write_marker(remote, "scene_s", Stage::PROCESSED).is_ok());
    write_text_file(tmp / "remote/archives/scene_s.zip", "zip");
    write_text_file(tmp / "remote/archives/scene_s.json", "{}");

    RemoteSnapshot s = snap();
    EXPECT_TRUE(s.has_work("scene_s"));
    EXPECT_FALSE(s.has_work(".ferry"));
    EXPECT_TRUE(s.has_marker("scene_s"));
    EXPECT_TRUE(s.has_archive("scene_s.zip"));
    EXPECT_EQ(s.archives.size(), 1u);

    auto marker = processor->read_marker(remote, "scene_s");
    ASSERT_TRUE(marker.is_ok());
    ASSERT_TRUE(marker.value.has_value());
    EXPECT_EQ(marker.value->stage, "processed");
}

TEST_F(ItemPipelineTest, ScriptsDeployedOnce) {
    write_text_file(tmp / "local_scripts/extract.py", "print('x')\n");
    pcfg.extract_script = (tmp / "local_scripts/extract.py").string();
    build();

    ASSERT_TRUE(processor->deploy_scripts(remote).is_ok());
    ASSERT_TRUE(processor->deploy_scripts(remote).is_ok());
    EXPECT_EQ(processor->deploy_count(), 1);
    EXPECT_EQ(read_file(tmp / "remote/scripts/extract.py"), "print('x')\n");
}

TEST_F(ItemPipelineTest, MissingScriptFailsDeploy) {
    pcfg.check_script = (tmp / "nowhere/check.py").string();
    build();
    EXPECT_TRUE(processor->deploy_scripts(remote).is_err());
    EXPECT_EQ(processor->deploy_count(), 0);
}
