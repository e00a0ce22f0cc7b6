#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load and validate a backup configuration file.
    static Result<Config> load(const fs::path& path);

    // Accessors
    const std::string& log_file() const { return log_file_; }
    const CopierConfig& copier() const { return copier_; }
    const FlagPaths& flags() const { return flags_; }
    const std::vector<BackupTask>& backups() const { return backups_; }
    int max_parallel() const { return max_parallel_; }
    int poll_interval_ms() const { return poll_interval_ms_; }
    const std::string& state_file() const { return state_file_; }
    const fs::path& path() const { return path_; }

public:
    Config() = default;

private:
    std::string log_file_;
    CopierConfig copier_;
    FlagPaths flags_;
    std::vector<BackupTask> backups_;
    int max_parallel_ = 1;
    int poll_interval_ms_ = 0;
    std::string state_file_;
    fs::path path_;
};

// Default config location: backup_config.yaml next to the running executable.
fs::path get_default_config_path();

// Write a commented starter config. Never overwrites an existing file.
Result<void> create_default_config(const fs::path& path);
