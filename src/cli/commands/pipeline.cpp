#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/credentials.hpp>
#include <core/utils.hpp>
#include <managers/item_pipeline.hpp>
#include <managers/pipeline_runner.hpp>
#include <managers/remote_processor.hpp>
#include <ssh/connection.hpp>
#include <transfer/http_source.hpp>
#include <fmt/format.h>
#include <iostream>
#include <mutex>

static void print_summary(const RunResult& r) {
    std::cout << theme::section("Summary");
    std::cout << theme::kv("Items", std::to_string(r.total));
    std::cout << theme::kv("Already complete", std::to_string(r.skipped.size()));
    std::cout << theme::kv("Downloaded", std::to_string(r.downloaded.size()));
    std::cout << theme::kv("Download failed", std::to_string(r.download_failed.size()));
    std::cout << theme::kv("Uploaded", std::to_string(r.uploaded.size()));
    std::cout << theme::kv("Processed", std::to_string(r.processed.size()));
    std::cout << theme::kv("Check passed", std::to_string(r.check_passed.size()));
    std::cout << theme::kv("Check failed", std::to_string(r.check_failed.size()));
    std::cout << theme::kv("Finalized", std::to_string(r.finalized.size()));
    std::cout << theme::kv("Failed", std::to_string(r.failed.size()));

    if (!r.errors.empty()) {
        std::cout << theme::section("Needs attention");
        for (const auto& e : r.errors) {
            std::cout << theme::fail(fmt::format("{:<34} {:<9} {}", e.stem, e.stage,
                                                 truncate_text(e.message, SUMMARY_ERROR_WIDTH)));
        }
        for (const auto& o : r.outcomes) {
            if (o.check_failed() && !o.report.empty()) {
                std::cout << theme::step(o.stem + " report: " + o.report.string());
            }
        }
    }
    std::cout << "\n";
}

static int do_run(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Missing manifest directory.");
        std::cout << theme::step("Usage: ferry run <manifest_dir> [--mode MODE] [--workers N]");
        return 1;
    }
    if (!cli.require_config()) return 1;
    const Config& cfg = cli.config.value();

    auto items = discover_items(args[0], cfg.local().temp_dir);
    if (items.is_err()) {
        std::cout << theme::fail(items.error);
        return 1;
    }
    if (items.value.empty()) {
        std::cout << theme::info("No manifests in " + args[0]);
        return 0;
    }
    if (cfg.source().url_template.empty()) {
        std::cout << theme::fail("source.url_template is not set");
        return 1;
    }

    std::error_code ec;
    fs::create_directories(cfg.local().temp_dir, ec);
    fs::create_directories(cfg.local().report_dir, ec);

    std::mutex out_mutex;
    StatusCallback print = [&out_mutex](const std::string& msg) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << theme::log(msg) << std::flush;
    };

    auto credentials = CredentialManager::from_config(cfg.source());
    UrlTemplateSource source(cfg.source().url_template, credentials.get());
    RemoteProcessor processor(cfg.remote(), cfg.processing(),
                              std::chrono::milliseconds(cfg.transfer().backoff_ms));
    ItemPipeline pipeline(*cli.state_store, processor, source,
                          TransferOptions::from_config(cfg.transfer()), cfg.local().report_dir, print);

    PipelineRunner::ChannelFactory factory = [&cfg, &print]()
        -> Result<std::unique_ptr<RemoteChannel>> {
        auto conn = connect_remote(cfg.remote(), print);
        if (conn.is_err()) return Result<std::unique_ptr<RemoteChannel>>::Err(conn.error);
        return Result<std::unique_ptr<RemoteChannel>>::Ok(std::move(conn.value));
    };

    std::cout << theme::section("Run");
    std::cout << theme::kv("Manifests", args[0]);
    std::cout << theme::kv("Items", std::to_string(items.value.size()));
    std::cout << theme::kv("Worker", cfg.remote().user + "@" + cfg.remote().host);
    std::cout << theme::kv("Mode", run_mode_name(cfg.concurrency().mode));
    std::cout << "\n";

    PipelineRunner runner(cfg.concurrency(), factory, pipeline, processor, print);
    auto result = runner.run(items.value);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    print_summary(result.value);
    int code = result.value.exit_code();
    if (code == 0) {
        std::cout << theme::ok(fmt::format("All {} item(s) complete", result.value.total));
    } else {
        std::cout << theme::warn(fmt::format("{} of {} item(s) complete",
                                             result.value.completed(), result.value.total));
    }
    return code;
}

void register_pipeline_commands(BaseCLI& cli) {
    cli.add_command("run", do_run, "Move every item in a manifest directory through the pipeline");
}
