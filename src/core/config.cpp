#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

// "~/x" -> "$HOME/x"; other paths are returned unchanged
static std::string expand_home(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return (platform::home_dir() / p.substr(2)).string();
    }
    if (p == "~") return platform::home_dir().string();
    return p;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".ferry";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

std::optional<RunMode> parse_run_mode(const std::string& s) {
    if (s == "streaming") return RunMode::STREAMING;
    if (s == "optimized") return RunMode::OPTIMIZED;
    if (s == "parallel") return RunMode::PARALLEL;
    return std::nullopt;
}

std::string run_mode_name(RunMode mode) {
    switch (mode) {
        case RunMode::STREAMING: return "streaming";
        case RunMode::OPTIMIZED: return "optimized";
        case RunMode::PARALLEL:  return "parallel";
    }
    return "optimized";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# ferry configuration
# Secrets are never stored here: name the environment variables that hold them.

remote:
  host: ""
  port: 22
  user: ""
  # ssh_key_path: "~/.ssh/id_ed25519"
  password_env: "FERRY_SSH_PASSWORD"
  timeout: 30
  archive_dir: "/data/archives"       # uploaded source archives
  work_dir: "/data/work"              # extraction output
  final_dir: "/data/final"            # finalized items
  log_dir: "/data/logs"               # remote pipeline.log (empty = off)
  script_dir: "/tmp/ferry"

source:
  url_template: "https://example.invalid/files/{name}"
  token_env: "FERRY_SOURCE_TOKEN"
  # login_url: "https://example.invalid/login"
  # login_user_env: "FERRY_SOURCE_USER"
  # login_password_env: "FERRY_SOURCE_PASSWORD"
  token_max_age: 3000

local:
  temp_dir: "/tmp/ferry"
  state_dir: "~/.ferry/state"
  # report_dir: "/tmp/ferry/check_data"

transfer:
  chunk_mb: 32
  max_attempts: 3
  backoff_ms: 2000
  verify: true

processing:
  extract_script: ""
  check_script: ""
  check_config: ""
  # extract_command: "python3 {script} --zip {archive} --json {manifest} --out {out}"
  # check_command: "python3 {script} --data_dir {data} --config {config} --report {report}"
  # count_command: "jq length {file}"  # entry count of sample.json (sanity probe)
  archive_after_process: rename       # rename | delete | keep
  extract_attempts: 3
  issue_marker: "frame:"

concurrency:
  mode: optimized                     # streaming | optimized | parallel
  max_workers: 3
  download_workers: 5
  pool_timeout: 60

# logging:
#   file: "/tmp/ferry_debug.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static RemoteConfig parse_remote_config(const YAML::Node& node) {
    RemoteConfig remote;
    remote.host = node["host"].as<std::string>("");
    remote.port = node["port"].as<int>(22);
    remote.user = node["user"].as<std::string>("");
    remote.password_env = node["password_env"].as<std::string>("");
    remote.timeout = node["timeout"].as<int>(30);
    remote.archive_dir = node["archive_dir"].as<std::string>("");
    remote.work_dir = node["work_dir"].as<std::string>("");
    remote.final_dir = node["final_dir"].as<std::string>("");
    remote.log_dir = node["log_dir"].as<std::string>("");
    remote.script_dir = node["script_dir"].as<std::string>("/tmp/ferry");

    if (node["ssh_key_path"]) {
        remote.ssh_key_path = expand_home(node["ssh_key_path"].as<std::string>());
    }

    return remote;
}

static SourceConfig parse_source_config(const YAML::Node& node) {
    SourceConfig source;
    source.url_template = node["url_template"].as<std::string>("");
    source.token_env = node["token_env"].as<std::string>("");
    source.login_url = node["login_url"].as<std::string>("");
    source.login_user_env = node["login_user_env"].as<std::string>("");
    source.login_password_env = node["login_password_env"].as<std::string>("");
    source.token_max_age = node["token_max_age"].as<int>(3000);
    return source;
}

static LocalConfig parse_local_config(const YAML::Node& node) {
    LocalConfig local;
    local.temp_dir = expand_home(node["temp_dir"].as<std::string>("/tmp/ferry"));
    local.state_dir = expand_home(node["state_dir"].as<std::string>(
        (get_global_config_dir() / "state").string()));
    local.report_dir = expand_home(node["report_dir"].as<std::string>(
        (fs::path(local.temp_dir) / "check_data").string()));
    return local;
}

static TransferConfig parse_transfer_config(const YAML::Node& node) {
    TransferConfig transfer;
    transfer.chunk_mb = node["chunk_mb"].as<int>(32);
    transfer.max_attempts = node["max_attempts"].as<int>(3);
    transfer.backoff_ms = node["backoff_ms"].as<int>(2000);
    transfer.verify = node["verify"].as<bool>(true);
    if (transfer.chunk_mb <= 0) transfer.chunk_mb = 32;
    if (transfer.max_attempts <= 0) transfer.max_attempts = 1;
    return transfer;
}

static ProcessingConfig parse_processing_config(const YAML::Node& node) {
    ProcessingConfig proc;
    proc.extract_script = expand_home(node["extract_script"].as<std::string>(""));
    proc.check_script = expand_home(node["check_script"].as<std::string>(""));
    proc.check_config = expand_home(node["check_config"].as<std::string>(""));
    proc.extract_command = node["extract_command"].as<std::string>(proc.extract_command);
    proc.check_command = node["check_command"].as<std::string>(proc.check_command);
    proc.count_command = node["count_command"].as<std::string>(proc.count_command);
    proc.extract_attempts = node["extract_attempts"].as<int>(3);
    proc.issue_marker = node["issue_marker"].as<std::string>("frame:");

    std::string disp = node["archive_after_process"].as<std::string>("rename");
    if (disp == "delete") {
        proc.archive_after_process = ArchiveDisposition::DELETE;
    } else if (disp == "keep") {
        proc.archive_after_process = ArchiveDisposition::KEEP;
    } else if (disp == "rename") {
        proc.archive_after_process = ArchiveDisposition::RENAME;
    } else {
        throw std::runtime_error("processing.archive_after_process must be rename, delete or keep (got '" +
                                 disp + "')");
    }
    if (proc.extract_attempts <= 0) proc.extract_attempts = 1;
    return proc;
}

static ConcurrencyConfig parse_concurrency_config(const YAML::Node& node) {
    ConcurrencyConfig conc;
    std::string mode = node["mode"].as<std::string>("optimized");
    auto parsed = parse_run_mode(mode);
    if (!parsed) {
        throw std::runtime_error("concurrency.mode must be streaming, optimized or parallel (got '" +
                                 mode + "')");
    }
    conc.mode = *parsed;
    conc.max_workers = node["max_workers"].as<int>(3);
    conc.download_workers = node["download_workers"].as<int>(5);
    conc.pool_timeout = node["pool_timeout"].as<int>(60);
    if (conc.max_workers <= 0) conc.max_workers = 1;
    if (conc.download_workers <= 0) conc.download_workers = 1;
    return conc;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.remote_ = parse_remote_config(root["remote"] ? root["remote"] : YAML::Node());
        config.source_ = parse_source_config(root["source"] ? root["source"] : YAML::Node());
        config.local_ = parse_local_config(root["local"] ? root["local"] : YAML::Node());
        config.transfer_ = parse_transfer_config(root["transfer"] ? root["transfer"] : YAML::Node());
        config.processing_ = parse_processing_config(
            root["processing"] ? root["processing"] : YAML::Node());
        config.concurrency_ = parse_concurrency_config(
            root["concurrency"] ? root["concurrency"] : YAML::Node());

        if (root["logging"] && root["logging"]["file"]) {
            config.log_file_ = expand_home(root["logging"]["file"].as<std::string>());
        }

        std::vector<std::string> missing;
        if (config.remote_.host.empty()) missing.push_back("remote.host");
        if (config.remote_.user.empty()) missing.push_back("remote.user");
        if (config.remote_.archive_dir.empty()) missing.push_back("remote.archive_dir");
        if (config.remote_.work_dir.empty()) missing.push_back("remote.work_dir");
        if (config.remote_.final_dir.empty()) missing.push_back("remote.final_dir");
        if (!missing.empty()) {
            return Result<Config>::Err(fmt::format("Missing required config key(s): {}",
                                                   fmt::join(missing, ", ")));
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string() +
                                   " (run 'ferry init' to create one)");
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text);
}

Result<Config> Config::load_global() {
    return load(get_global_config_path());
}

fs::path Config::state_file() const {
    return fs::path(local_.state_dir) / STATE_FILE_NAME;
}
