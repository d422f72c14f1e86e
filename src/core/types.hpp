#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Configuration structures

// Worker machine reached over SSH. Directories are absolute remote paths.
struct RemoteConfig {
    std::string host;
    int port = 22;
    std::string user;
    std::optional<std::string> ssh_key_path;
    std::string password_env;        // env var holding the SSH password, if any
    int timeout = 30;
    std::string archive_dir;         // uploaded source archives
    std::string work_dir;            // extraction output (in-progress)
    std::string final_dir;           // durable, finalized item directories
    std::string log_dir;             // remote processing log (empty = disabled)
    std::string script_dir = "/tmp/ferry";
};

// Archive source: where the original archives are fetched from.
struct SourceConfig {
    std::string url_template;        // "{name}" is replaced by the archive file name
    std::string token_env;           // env var holding a static bearer token
    std::string login_url;           // optional: POST {user,password} -> token
    std::string login_user_env;
    std::string login_password_env;
    int token_max_age = 3000;        // seconds
};

struct LocalConfig {
    std::string temp_dir = "/tmp/ferry";
    std::string state_dir;           // default: ~/.ferry/state
    std::string report_dir;          // default: <temp_dir>/check_data
};

struct TransferConfig {
    int chunk_mb = 32;
    int max_attempts = 3;
    int backoff_ms = 2000;
    bool verify = true;
};

enum class ArchiveDisposition { RENAME, DELETE, KEEP };

struct ProcessingConfig {
    std::string extract_script;      // local path, deployed to remote script_dir
    std::string check_script;        // local path, deployed to remote script_dir
    std::string check_config;        // local path, deployed to remote script_dir
    std::string extract_command = "python3 {script} --zip {archive} --json {manifest} --out {out}";
    std::string check_command = "python3 {script} --data_dir {data} --config {config} --report {report}";
    // Prints the number of entries in the JSON file {file}
    std::string count_command = "python3 -c 'import json,sys; print(len(json.load(open(sys.argv[1]))))' {file}";
    ArchiveDisposition archive_after_process = ArchiveDisposition::RENAME;
    int extract_attempts = 3;
    std::string issue_marker = "frame:";
};

enum class RunMode { STREAMING, OPTIMIZED, PARALLEL };

struct ConcurrencyConfig {
    RunMode mode = RunMode::OPTIMIZED;
    int max_workers = 3;
    int download_workers = 5;
    int pool_timeout = 60;           // seconds to wait for a pooled connection
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Transfer progress: (bytes done, bytes total)
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;
