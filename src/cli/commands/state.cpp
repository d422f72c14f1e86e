#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iostream>
#include <map>

static std::string colored_stage(Stage s) {
    switch (s) {
        case Stage::COMPLETED: return theme::green(stage_name(s));
        case Stage::FAILED:    return theme::red(stage_name(s));
        case Stage::CHECKED:   return theme::yellow(stage_name(s));
        default:               return stage_name(s);
    }
}

static int do_status(BaseCLI& cli, const std::vector<std::string>&) {
    if (!cli.require_config()) return 1;

    auto records = cli.state_store->all();
    std::cout << theme::section("State");
    std::cout << theme::kv("File", cli.state_store->path().string());
    std::cout << theme::kv("Records", std::to_string(records.size()));
    std::cout << "\n";
    if (records.empty()) {
        std::cout << theme::info("No items recorded yet");
        return 0;
    }

    std::map<Stage, int> per_stage;
    for (const auto& rec : records) {
        ++per_stage[rec.stage];
        // Pad before coloring so the columns line up
        std::string stage = colored_stage(rec.stage) +
            std::string(11 - std::min<size_t>(11, std::string(stage_name(rec.stage)).size()), ' ');
        std::cout << fmt::format("    {:<34} {}{:<12}{:>7}  {}\n", rec.item_id, stage,
                                 format_timestamp(rec.updated_at), format_duration(rec.updated_at),
                                 theme::dim(truncate_text(rec.last_error, SUMMARY_ERROR_WIDTH)));
    }

    std::cout << "\n";
    for (const auto& [stage, n] : per_stage) {
        std::cout << theme::kv(stage_name(stage), std::to_string(n));
    }
    std::cout << "\n";
    return 0;
}

static int do_reset_failed(BaseCLI& cli, const std::vector<std::string>&) {
    if (!cli.require_config()) return 1;

    auto removed = cli.state_store->clear_failed();
    if (removed.is_err()) {
        std::cout << theme::fail(removed.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Removed {} failed record(s)", removed.value));
    return 0;
}

static int do_reset(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Missing item name.");
        std::cout << theme::step("Usage: ferry reset <stem>");
        return 1;
    }
    if (!cli.require_config()) return 1;

    auto removed = cli.state_store->remove(args[0]);
    if (removed.is_err()) {
        std::cout << theme::fail(removed.error);
        return 1;
    }
    if (!removed.value) {
        std::cout << theme::info("No record for " + args[0]);
        return 0;
    }
    std::cout << theme::ok("Removed record for " + args[0]);
    return 0;
}

static int do_init(BaseCLI&, const std::vector<std::string>&) {
    if (global_config_exists()) {
        std::cout << theme::info("Config already exists at " + get_global_config_path().string());
        return 0;
    }
    auto r = create_default_global_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + get_global_config_path().string());
    std::cout << theme::step("Fill in remote.host, remote.user and the remote directories");
    return 0;
}

void register_state_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show the recorded stage of every item");
    cli.add_command("reset-failed", do_reset_failed, "Forget failed items so the next run retries them");
    cli.add_command("reset", do_reset, "Forget one item");
    cli.add_command("init", do_init, "Write a default ~/.ferry/config.yaml");
}
