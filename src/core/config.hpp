#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from ~/.ferry/config.yaml
    static Result<Config> load_global();

    // Load from an explicit path (--config)
    static Result<Config> load(const fs::path& path);

    // Parse YAML text directly; used by load() and by tests
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const RemoteConfig& remote() const { return remote_; }
    const SourceConfig& source() const { return source_; }
    const LocalConfig& local() const { return local_; }
    const TransferConfig& transfer() const { return transfer_; }
    const ProcessingConfig& processing() const { return processing_; }
    const ConcurrencyConfig& concurrency() const { return concurrency_; }
    const std::string& log_file() const { return log_file_; }

    // CLI overrides
    void set_mode(RunMode mode) { concurrency_.mode = mode; }
    void set_max_workers(int n) { if (n > 0) concurrency_.max_workers = n; }

    fs::path state_file() const;

public:
    Config() = default;

private:
    RemoteConfig remote_;
    SourceConfig source_;
    LocalConfig local_;
    TransferConfig transfer_;
    ProcessingConfig processing_;
    ConcurrencyConfig concurrency_;
    std::string log_file_;
};

bool global_config_exists();

fs::path get_global_config_dir();
fs::path get_global_config_path();

// Write a commented default config. Never overwrites an existing file.
Result<void> create_default_global_config();

std::optional<RunMode> parse_run_mode(const std::string& s);
std::string run_mode_name(RunMode mode);
